#include "verify/verification_oracle.hpp"
#include "core/utils.hpp"
#include "docx/ooxml_package.hpp"

#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <tinyxml2.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <format>
#include <map>
#include <set>

namespace docredact {

namespace {

// Inflated output beyond this is truncated
constexpr size_t kMaxInflatedSize = 256 * 1024 * 1024;

// ============================================================================
// PDF string decoding (byte strings, independent of font encodings)
// ============================================================================

std::string utf16be_to_utf8(const std::string& bytes) {
    std::string out;
    for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
        uint32_t cp = (static_cast<unsigned char>(bytes[i]) << 8) |
                      static_cast<unsigned char>(bytes[i + 1]);
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 3 < bytes.size()) {
            const uint32_t lo = (static_cast<unsigned char>(bytes[i + 2]) << 8) |
                                static_cast<unsigned char>(bytes[i + 3]);
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                i += 2;
            }
        }
        utils::append_utf8(out, cp);
    }
    return out;
}

std::string decode_pdf_string(const std::string& bytes) {
    if (bytes.size() >= 2 && static_cast<unsigned char>(bytes[0]) == 0xFE &&
        static_cast<unsigned char>(bytes[1]) == 0xFF) {
        return utf16be_to_utf8(bytes.substr(2));
    }
    std::string out;
    for (const char c : bytes) {
        utils::append_utf8(out, static_cast<unsigned char>(c));
    }
    return out;
}

// ============================================================================
// Font-aware decoding (own ToUnicode reader, not shared with the indexer)
// ============================================================================

/**
 * @brief Maps shown string bytes to Unicode for one font
 *
 * Codes come from the ToUnicode CMap when the font has one. Type0 fonts
 * use the CMap's code width (two bytes by default); simple fonts fall back
 * to Latin-1 for codes the CMap does not cover.
 */
class GlyphDecoder {
public:
    static GlyphDecoder from_font(QPDFObjectHandle font) {
        GlyphDecoder decoder;
        if (!font.isDictionary()) return decoder;

        const auto subtype = font.getKey("/Subtype");
        decoder.composite_ = subtype.isName() && subtype.getName() == "/Type0";
        decoder.code_bytes_ = decoder.composite_ ? 2 : 1;

        const auto to_unicode = font.getKey("/ToUnicode");
        if (to_unicode.isStream()) {
            try {
                const auto data = to_unicode.getStreamData(qpdf_dl_generalized);
                decoder.parse_cmap(std::string(reinterpret_cast<const char*>(data->getBuffer()),
                                               data->getSize()));
            } catch (const std::exception& e) {
                utils::log::debug(std::format("Verification skipped a ToUnicode map: {}", e.what()));
            }
        }
        return decoder;
    }

    [[nodiscard]] std::string decode(const std::string& bytes) const {
        std::string out;
        for (size_t i = 0; i + code_bytes_ <= bytes.size(); i += code_bytes_) {
            uint32_t code = 0;
            for (size_t b = 0; b < code_bytes_; ++b) {
                code = (code << 8) | static_cast<unsigned char>(bytes[i + b]);
            }
            if (const auto it = map_.find(code); it != map_.end()) {
                out += it->second;
            } else if (!composite_) {
                utils::append_utf8(out, code);
            }
        }
        return out;
    }

private:
    // Ranges wider than this are truncated
    static constexpr uint64_t kMaxRange = 0x10000;

    struct Token {
        enum class Kind { HEX, WORD, OPEN, CLOSE } kind;
        std::string value;  // decoded bytes for HEX
    };

    static std::vector<Token> tokenize(const std::string& text) {
        std::vector<Token> tokens;
        size_t i = 0;
        while (i < text.size()) {
            const char c = text[i];
            if (c == '<' && i + 1 < text.size() && text[i + 1] != '<') {
                const size_t close = text.find('>', i + 1);
                if (close == std::string::npos) break;
                std::string digits;
                for (size_t k = i + 1; k < close; ++k) {
                    if (std::isxdigit(static_cast<unsigned char>(text[k]))) digits += text[k];
                }
                if (digits.size() % 2) digits += '0';
                std::string bytes;
                for (size_t k = 0; k < digits.size(); k += 2) {
                    bytes += static_cast<char>(utils::parse_int<int>(digits.substr(k, 2), 16));
                }
                tokens.push_back({Token::Kind::HEX, std::move(bytes)});
                i = close + 1;
            } else if (c == '[') {
                tokens.push_back({Token::Kind::OPEN, {}});
                ++i;
            } else if (c == ']') {
                tokens.push_back({Token::Kind::CLOSE, {}});
                ++i;
            } else if (c == '%') {
                while (i < text.size() && text[i] != '\n' && text[i] != '\r') ++i;
            } else if (std::isspace(static_cast<unsigned char>(c)) || c == '<' || c == '>') {
                ++i;
            } else {
                size_t j = i;
                while (j < text.size() && !std::isspace(static_cast<unsigned char>(text[j])) &&
                       text[j] != '<' && text[j] != '[' && text[j] != ']' && text[j] != '%') {
                    ++j;
                }
                tokens.push_back({Token::Kind::WORD, text.substr(i, j - i)});
                i = j;
            }
        }
        return tokens;
    }

    static uint32_t code_of(const std::string& bytes) {
        uint32_t code = 0;
        for (const char b : bytes) code = (code << 8) | static_cast<unsigned char>(b);
        return code;
    }

    void parse_cmap(const std::string& text) {
        const auto tokens = tokenize(text);
        auto is_hex = [&](size_t k) { return k < tokens.size() && tokens[k].kind == Token::Kind::HEX; };

        size_t i = 0;
        while (i < tokens.size()) {
            const auto& word = tokens[i].value;
            if (tokens[i].kind != Token::Kind::WORD) {
                ++i;
            } else if (word == "begincodespacerange") {
                ++i;
                if (is_hex(i) && !tokens[i].value.empty()) code_bytes_ = tokens[i].value.size();
                while (i < tokens.size() && tokens[i].value != "endcodespacerange") ++i;
            } else if (word == "beginbfchar") {
                ++i;
                while (is_hex(i) && is_hex(i + 1)) {
                    map_[code_of(tokens[i].value)] = utf16be_to_utf8(tokens[i + 1].value);
                    i += 2;
                }
            } else if (word == "beginbfrange") {
                ++i;
                while (is_hex(i) && is_hex(i + 1)) {
                    const uint64_t lo = code_of(tokens[i].value);
                    const uint64_t hi = std::min<uint64_t>(code_of(tokens[i + 1].value), lo + kMaxRange);
                    i += 2;
                    if (is_hex(i)) {
                        std::string dest = tokens[i].value;
                        for (uint64_t code = lo; code <= hi && !dest.empty(); ++code) {
                            map_[static_cast<uint32_t>(code)] = utf16be_to_utf8(dest);
                            // Consecutive codes increment the last destination byte
                            dest.back() = static_cast<char>(static_cast<unsigned char>(dest.back()) + 1);
                        }
                        ++i;
                    } else if (i < tokens.size() && tokens[i].kind == Token::Kind::OPEN) {
                        ++i;
                        for (uint64_t code = lo; is_hex(i); ++code, ++i) {
                            if (code <= hi) map_[static_cast<uint32_t>(code)] = utf16be_to_utf8(tokens[i].value);
                        }
                        if (i < tokens.size() && tokens[i].kind == Token::Kind::CLOSE) ++i;
                    }
                }
            } else {
                ++i;
            }
        }
        if (code_bytes_ == 0 || code_bytes_ > 4) code_bytes_ = composite_ ? 2 : 1;
    }

    bool composite_ = false;
    size_t code_bytes_ = 1;
    std::map<uint32_t, std::string> map_;
};

/**
 * @brief Collects shown text of one content stream
 *
 * joined has the decoded strings back to back; spaced puts a space
 * wherever a positioning or text-showing operator intervenes; raw has
 * the string bytes without any font decoding. Form XObjects painted with
 * Do are descended into with their own resources.
 */
class PageTextCollector : public QPDFObjectHandle::ParserCallbacks {
public:
    PageTextCollector(QPDFObjectHandle resources, std::set<QPDFObjGen>& visited, int depth = 0)
        : resources_(std::move(resources)), visited_(visited), depth_(depth) {}

    void handleObject(QPDFObjectHandle obj) override {
        if (!obj.isOperator()) {
            operands_.push_back(obj);
            return;
        }

        const auto op = obj.getOperatorValue();
        if (op == "Tf" && !operands_.empty() && operands_.front().isName()) {
            select_font(operands_.front().getName());
        } else if ((op == "Tj" || op == "'" || op == "\"") && !operands_.empty()) {
            show(operands_.back());
        } else if (op == "TJ" && !operands_.empty() && operands_.back().isArray()) {
            const auto array = operands_.back();
            for (int i = 0; i < array.getArrayNItems(); ++i) show(array.getArrayItem(i));
        } else if (op == "Do" && !operands_.empty() && operands_.back().isName()) {
            paint_form(operands_.back().getName());
        }

        if (op == "Td" || op == "TD" || op == "T*" || op == "Tm" || op == "ET" ||
            op == "'" || op == "\"" || op == "Tj" || op == "TJ") {
            if (!spaced.empty() && spaced.back() != ' ') spaced += ' ';
        }
        operands_.clear();
    }

    void handleEOF() override {}

    std::string joined;
    std::string spaced;
    std::string raw;

private:
    static constexpr int kMaxFormDepth = 8;

    void select_font(const std::string& name) {
        auto it = decoders_.find(name);
        if (it == decoders_.end()) {
            auto font = QPDFObjectHandle::newNull();
            const auto fonts = resources_.isDictionary() ? resources_.getKey("/Font")
                                                         : QPDFObjectHandle::newNull();
            if (fonts.isDictionary()) font = fonts.getKey(name);
            it = decoders_.emplace(name, GlyphDecoder::from_font(font)).first;
        }
        font_ = &it->second;
    }

    void show(const QPDFObjectHandle& operand) {
        if (!operand.isString()) return;
        const auto bytes = operand.getStringValue();
        const auto text = font_ ? font_->decode(bytes) : decode_pdf_string(bytes);
        joined += text;
        spaced += text;
        raw += decode_pdf_string(bytes);
    }

    void paint_form(const std::string& name) {
        if (depth_ >= kMaxFormDepth || !resources_.isDictionary()) return;
        const auto xobjects = resources_.getKey("/XObject");
        if (!xobjects.isDictionary()) return;
        auto form = xobjects.getKey(name);
        if (!form.isStream()) return;
        const auto subtype = form.getDict().getKey("/Subtype");
        if (!subtype.isName() || subtype.getName() != "/Form") return;
        if (form.isIndirect() && !visited_.insert(form.getObjGen()).second) return;

        auto form_resources = form.getDict().getKey("/Resources");
        PageTextCollector nested(form_resources.isDictionary() ? form_resources : resources_,
                                 visited_, depth_ + 1);
        try {
            QPDFObjectHandle::parseContentStream(form, &nested);
        } catch (const std::exception& e) {
            utils::log::debug(std::format("Verification could not parse form {}: {}", name, e.what()));
        }
        joined += nested.joined;
        spaced += nested.spaced;
        raw += nested.raw;
    }

    QPDFObjectHandle resources_;
    std::set<QPDFObjGen>& visited_;
    int depth_;
    std::vector<QPDFObjectHandle> operands_;
    std::map<std::string, GlyphDecoder> decoders_;
    const GlyphDecoder* font_ = nullptr;
};

void collect_strings(QPDFObjectHandle obj, std::string& out, int depth) {
    if (depth > 32) return;
    if (obj.isString()) {
        out += decode_pdf_string(obj.getStringValue());
        out += '\n';
    } else if (obj.isArray()) {
        for (int i = 0; i < obj.getArrayNItems(); ++i) {
            collect_strings(obj.getArrayItem(i), out, depth + 1);
        }
    } else if (obj.isDictionary() || obj.isStream()) {
        auto dict = obj.isStream() ? obj.getDict() : obj;
        for (const auto& key : dict.getKeys()) {
            auto value = dict.getKey(key);
            // Indirect values are visited on their own
            if (!value.isIndirect()) collect_strings(value, out, depth + 1);
        }
    }
}

// Byte ranges between "stream" and "endstream" keywords
std::vector<std::string_view> raw_streams(std::string_view file) {
    std::vector<std::string_view> out;
    size_t pos = 0;
    for (;;) {
        const size_t keyword = file.find("stream", pos);
        if (keyword == std::string_view::npos) break;
        // Skip the "stream" inside "endstream"
        if (keyword >= 3 && file.substr(keyword - 3, 3) == "end") {
            pos = keyword + 6;
            continue;
        }
        size_t start = keyword + 6;
        if (start < file.size() && file[start] == '\r') ++start;
        if (start < file.size() && file[start] == '\n') ++start;

        const size_t end = file.find("endstream", start);
        if (end == std::string_view::npos) break;
        out.push_back(file.substr(start, end - start));
        pos = end + 9;
    }
    return out;
}

// ============================================================================
// DOCX text nodes
// ============================================================================

void collect_text_nodes(const tinyxml2::XMLNode* node, std::string& out) {
    if (const auto* text = node->ToText()) {
        out += text->Value();
        return;
    }
    for (const auto* child = node->FirstChild(); child; child = child->NextSibling()) {
        collect_text_nodes(child, out);
    }
}

// Accepted view of WordprocessingML: w:t text only, so tracked deletions
// and field instructions do not interrupt it
void collect_accepted_text(const tinyxml2::XMLElement* element, std::string& out) {
    const std::string_view name = element->Name();
    if (name == "w:t") {
        if (const char* text = element->GetText()) out += text;
        return;
    }
    for (const auto* child = element->FirstChildElement(); child; child = child->NextSiblingElement()) {
        collect_accepted_text(child, out);
    }
    if (name == "w:p") out += '\n';
}

} // anonymous namespace

// ============================================================================
// Helpers
// ============================================================================

std::string VerificationOracle::squeeze(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (const char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out += ' ';
        pending_space = false;
        out += c;
    }
    return out;
}

std::optional<std::string> VerificationOracle::inflate(std::string_view data) {
    if (data.empty()) return std::nullopt;

    z_stream zs{};
    // windowBits=15+32 detects zlib and gzip headers
    if (inflateInit2(&zs, 15 + 32) != Z_OK) {
        return std::nullopt;
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buffer[16384];
    int ret = Z_OK;
    while (ret == Z_OK && out.size() < kMaxInflatedSize) {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = ::inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) break;
        out.append(buffer, sizeof(buffer) - zs.avail_out);
        if (zs.avail_in == 0 && zs.avail_out != 0) break;
    }
    inflateEnd(&zs);

    if (out.empty()) return std::nullopt;
    return out;
}

std::vector<std::string> VerificationOracle::sensitive_texts(const std::vector<DetectedEntity>& entities,
                                                             const PositionIndex& positions) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    auto add = [&](std::string text) {
        if (text.empty()) return;
        if (seen.insert(utils::to_lower(squeeze(text))).second) out.push_back(std::move(text));
    };

    for (const auto& entity : entities) {
        add(entity.text);

        std::vector<std::string> pieces;
        for (const auto& fragment : positions.fragments) {
            if (fragment.char_offset >= entity.char_end) break;
            if (fragment.end() <= entity.char_start || !fragment.has_geometry) continue;
            const size_t from = std::max(entity.char_start, fragment.char_offset) - fragment.char_offset;
            const size_t to = std::min(entity.char_end, fragment.end()) - fragment.char_offset;
            pieces.push_back(fragment.text.substr(from, to - from));
        }
        if (pieces.size() > 1) {
            for (auto& piece : pieces) add(std::move(piece));
        }
    }
    return out;
}

// ============================================================================
// Extraction
// ============================================================================

std::vector<ExtractedText> VerificationOracle::extract(std::string_view bytes, DocumentFormat format) {
    switch (format) {
        case DocumentFormat::PDF:  return extract_pdf(bytes);
        case DocumentFormat::DOCX: return extract_docx(bytes);
        case DocumentFormat::UNKNOWN: break;
    }
    throw UnsupportedFormatError("Cannot verify a document of unknown format");
}

std::vector<ExtractedText> VerificationOracle::extract_pdf(std::string_view bytes) {
    std::vector<ExtractedText> out;
    const std::string owned(bytes);

    // Page text through qpdf's own content parser
    try {
        QPDF pdf;
        pdf.setSuppressWarnings(true);
        pdf.processMemoryFile("verify.pdf", owned.data(), owned.size());

        auto pages = QPDFPageDocumentHelper(pdf).getAllPages();
        for (size_t i = 0; i < pages.size(); ++i) {
            const int page_number = static_cast<int>(i) + 1;
            std::set<QPDFObjGen> visited;
            PageTextCollector collector(pages[i].getAttribute("/Resources", false), visited);
            try {
                QPDFObjectHandle::parseContentStream(pages[i].getObjectHandle().getKey("/Contents"), &collector);
            } catch (const std::exception& e) {
                utils::log::warn(std::format("Verification could not parse page {}: {}", page_number, e.what()));
            }
            const auto location = std::format("page {}", page_number);
            out.push_back({std::move(collector.joined), page_number, location});
            out.push_back({std::move(collector.spaced), page_number, location});
            out.push_back({std::move(collector.raw), page_number, location});
        }

        std::string strings;
        collect_strings(pdf.getTrailer(), strings, 0);
        for (auto& obj : pdf.getAllObjects()) {
            collect_strings(obj, strings, 0);
        }
        out.push_back({std::move(strings), std::nullopt, "string objects"});
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Verification could not open PDF structure: {}", e.what()));
    }

    // Every stream, inflated here rather than through qpdf's filters
    const auto streams = raw_streams(owned);
    for (size_t i = 0; i < streams.size(); ++i) {
        auto inflated = inflate(streams[i]);
        out.push_back({inflated ? std::move(*inflated) : std::string(streams[i]), std::nullopt,
                       std::format("stream #{}", i + 1)});
    }
    out.push_back({owned, std::nullopt, "raw file"});
    return out;
}

std::vector<ExtractedText> VerificationOracle::extract_docx(std::string_view bytes) {
    std::vector<ExtractedText> out;

    auto package = docx::OoxmlPackage::open(bytes);
    if (package.is_error()) {
        throw RedactionError(ErrorCategory::PARSE_ERROR,
            std::format("Verification could not open DOCX: {}", package.error_message()));
    }

    for (const auto& entry : package.value().entries()) {
        if (!docx::is_xml_part(entry.name)) continue;

        tinyxml2::XMLDocument dom(true, tinyxml2::PRESERVE_WHITESPACE);
        if (dom.Parse(entry.data.c_str(), entry.data.size()) == tinyxml2::XML_SUCCESS) {
            std::string text;
            collect_text_nodes(&dom, text);
            out.push_back({std::move(text), std::nullopt, entry.name});

            if (docx::is_wordprocessing_part(entry.name) && dom.RootElement()) {
                std::string accepted;
                collect_accepted_text(dom.RootElement(), accepted);
                out.push_back({std::move(accepted), std::nullopt, entry.name});
            }
        }
        out.push_back({entry.data, std::nullopt, entry.name});
    }
    return out;
}

// ============================================================================
// Verification
// ============================================================================

VerificationResult VerificationOracle::verify(std::string_view bytes,
                                              DocumentFormat format,
                                              const std::vector<std::string>& sensitive_texts) const {
    VerificationResult result;
    const auto extracted = extract(bytes, format);

    std::vector<std::string> haystacks;
    haystacks.reserve(extracted.size());
    for (const auto& item : extracted) haystacks.push_back(squeeze(item.text));

    for (const auto& sensitive : sensitive_texts) {
        const auto needle = squeeze(sensitive);
        if (utils::utf8_length(needle) < min_length_) continue;

        for (size_t i = 0; i < extracted.size(); ++i) {
            if (utils::contains_icase(haystacks[i], needle)) {
                result.remaining.push_back({sensitive, extracted[i].page, extracted[i].location});
                break;
            }
        }
    }

    result.success = result.remaining.empty();
    if (!result.success) {
        utils::log::warn(std::format("Verification found {} of {} sensitive texts remaining",
            result.remaining.size(), sensitive_texts.size()));
    }
    return result;
}

} // namespace docredact
