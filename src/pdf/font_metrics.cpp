#include "pdf/font_metrics.hpp"
#include "core/utils.hpp"

#include <qpdf/Buffer.hh>

#include <cctype>
#include <format>
#include <string_view>

namespace docredact::pdf {

namespace {

// ---- ToUnicode CMap lexing --------------------------------------------------

struct CMapToken {
    enum class Kind { HEX, OPEN, CLOSE, WORD } kind;
    std::string text;
};

std::vector<CMapToken> lex_cmap(std::string_view s) {
    std::vector<CMapToken> tokens;
    size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        if (c == '%') {
            while (i < s.size() && s[i] != '\n' && s[i] != '\r') ++i;
        } else if (c == '<' && i + 1 < s.size() && s[i + 1] != '<') {
            const size_t close = s.find('>', i + 1);
            if (close == std::string_view::npos) break;
            std::string hex;
            for (size_t j = i + 1; j < close; ++j) {
                if (std::isxdigit(static_cast<unsigned char>(s[j]))) hex += s[j];
            }
            tokens.push_back({CMapToken::Kind::HEX, std::move(hex)});
            i = close + 1;
        } else if (c == '[') {
            tokens.push_back({CMapToken::Kind::OPEN, "["});
            ++i;
        } else if (c == ']') {
            tokens.push_back({CMapToken::Kind::CLOSE, "]"});
            ++i;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else {
            const size_t start = i;
            while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])) &&
                   s[i] != '<' && s[i] != '[' && s[i] != ']') {
                ++i;
            }
            tokens.push_back({CMapToken::Kind::WORD, std::string(s.substr(start, i - start))});
        }
    }
    return tokens;
}

uint32_t hex_to_code(const std::string& hex) {
    return utils::parse_int<uint32_t>(hex, 16, 0u);
}

// Destination strings are UTF-16BE code units
std::vector<uint16_t> hex_to_units(const std::string& hex) {
    std::vector<uint16_t> units;
    for (size_t i = 0; i + 4 <= hex.size(); i += 4) {
        units.push_back(utils::parse_int<uint16_t>(std::string_view(hex).substr(i, 4), 16, uint16_t{0}));
    }
    // Odd-length destinations (single byte) are treated as one code unit
    if (hex.size() % 4 == 2) {
        units.push_back(utils::parse_int<uint16_t>(std::string_view(hex).substr(hex.size() - 2), 16, uint16_t{0}));
    }
    return units;
}

std::string units_to_utf8(const std::vector<uint16_t>& units) {
    std::string out;
    for (size_t i = 0; i < units.size(); ++i) {
        uint32_t cp = units[i];
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < units.size()) {
            const uint32_t lo = units[i + 1];
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                ++i;
            }
        }
        utils::append_utf8(out, cp);
    }
    return out;
}

std::string stream_text(QPDFObjectHandle stream) {
    if (!stream.isStream()) return {};
    const auto data = stream.getStreamData(qpdf_dl_generalized);
    return std::string(reinterpret_cast<const char*>(data->getBuffer()), data->getSize());
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

FontMetrics::FontMetrics(double fallback_factor)
    : fallback_width_(fallback_factor * 1000.0) {}

FontMetrics FontMetrics::from_dictionary(QPDFObjectHandle font, double fallback_factor) {
    FontMetrics metrics(fallback_factor);
    if (!font.isDictionary()) return metrics;

    const auto subtype = font.getKey("/Subtype");
    if (subtype.isName() && subtype.getName() == "/Type0") {
        metrics.two_byte_ = true;
        const auto descendants = font.getKey("/DescendantFonts");
        if (descendants.isArray() && descendants.getArrayNItems() > 0) {
            metrics.load_cid_widths(descendants.getArrayItem(0));
        }
    } else {
        metrics.load_simple_widths(font);
    }

    const auto to_unicode = font.getKey("/ToUnicode");
    if (to_unicode.isStream()) {
        try {
            metrics.to_unicode_ = parse_to_unicode(stream_text(to_unicode));
        } catch (const std::exception& e) {
            utils::log::warn(std::format("Ignoring unreadable ToUnicode CMap: {}", e.what()));
        }
    }
    return metrics;
}

void FontMetrics::load_simple_widths(QPDFObjectHandle font) {
    const auto widths = font.getKey("/Widths");
    const auto first_char = font.getKey("/FirstChar");
    if (!widths.isArray() || !first_char.isNumber()) return;

    const auto first = static_cast<uint32_t>(first_char.getNumericValue());
    const int n = widths.getArrayNItems();
    for (int i = 0; i < n; ++i) {
        const auto w = widths.getArrayItem(i);
        if (w.isNumber()) {
            widths_[first + static_cast<uint32_t>(i)] = w.getNumericValue();
        }
    }
}

void FontMetrics::load_cid_widths(QPDFObjectHandle descendant) {
    if (!descendant.isDictionary()) return;

    const auto dw = descendant.getKey("/DW");
    default_width_ = dw.isNumber() ? dw.getNumericValue() : 1000.0;

    // /W entries: c [w1 w2 ...]  or  c_first c_last w
    const auto w = descendant.getKey("/W");
    if (!w.isArray()) return;
    const int n = w.getArrayNItems();
    int i = 0;
    while (i < n) {
        const auto first = w.getArrayItem(i);
        if (!first.isNumber() || i + 1 >= n) break;
        const auto start = static_cast<uint32_t>(first.getNumericValue());
        const auto next = w.getArrayItem(i + 1);
        if (next.isArray()) {
            const int count = next.getArrayNItems();
            for (int k = 0; k < count; ++k) {
                const auto item = next.getArrayItem(k);
                if (item.isNumber()) {
                    widths_[start + static_cast<uint32_t>(k)] = item.getNumericValue();
                }
            }
            i += 2;
        } else if (next.isNumber() && i + 2 < n && w.getArrayItem(i + 2).isNumber()) {
            const auto last = static_cast<uint32_t>(next.getNumericValue());
            const double width = w.getArrayItem(i + 2).getNumericValue();
            for (uint32_t c = start; c <= last && c - start < 65536; ++c) {
                widths_[c] = width;
            }
            i += 3;
        } else {
            break;
        }
    }
}

// ============================================================================
// Widths and decoding
// ============================================================================

std::vector<uint32_t> FontMetrics::codes(const std::string& bytes) const {
    std::vector<uint32_t> out;
    if (two_byte_) {
        out.reserve(bytes.size() / 2);
        for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
            out.push_back((static_cast<uint32_t>(static_cast<unsigned char>(bytes[i])) << 8) |
                          static_cast<unsigned char>(bytes[i + 1]));
        }
    } else {
        out.reserve(bytes.size());
        for (const char c : bytes) {
            out.push_back(static_cast<unsigned char>(c));
        }
    }
    return out;
}

double FontMetrics::glyph_width(uint32_t code) const {
    const auto it = widths_.find(code);
    if (it != widths_.end() && it->second > 0.0) return it->second;
    if (two_byte_ && default_width_ > 0.0) return default_width_;
    return fallback_width_;
}

std::string FontMetrics::decode_code(uint32_t code) const {
    const auto it = to_unicode_.find(code);
    if (it != to_unicode_.end()) return it->second;

    // Unmapped control codes carry no text
    std::string out;
    if (code >= 0x20) {
        utils::append_utf8(out, code);
    }
    return out;
}

std::string FontMetrics::decode(const std::string& bytes) const {
    std::string out;
    out.reserve(bytes.size());
    for (const auto code : codes(bytes)) {
        out += decode_code(code);
    }
    return out;
}

std::unordered_map<uint32_t, std::string> FontMetrics::parse_to_unicode(const std::string& cmap) {
    std::unordered_map<uint32_t, std::string> map;
    const auto tokens = lex_cmap(cmap);

    enum class Section { NONE, BFCHAR, BFRANGE } section = Section::NONE;
    size_t i = 0;
    while (i < tokens.size()) {
        const auto& t = tokens[i];
        if (t.kind == CMapToken::Kind::WORD) {
            if (t.text == "beginbfchar") section = Section::BFCHAR;
            else if (t.text == "beginbfrange") section = Section::BFRANGE;
            else if (t.text == "endbfchar" || t.text == "endbfrange") section = Section::NONE;
            ++i;
            continue;
        }

        if (section == Section::BFCHAR && t.kind == CMapToken::Kind::HEX &&
            i + 1 < tokens.size() && tokens[i + 1].kind == CMapToken::Kind::HEX) {
            map[hex_to_code(t.text)] = units_to_utf8(hex_to_units(tokens[i + 1].text));
            i += 2;
            continue;
        }

        if (section == Section::BFRANGE && t.kind == CMapToken::Kind::HEX &&
            i + 2 < tokens.size() && tokens[i + 1].kind == CMapToken::Kind::HEX) {
            const uint32_t lo = hex_to_code(t.text);
            const uint32_t hi = hex_to_code(tokens[i + 1].text);
            const auto& dst = tokens[i + 2];

            if (dst.kind == CMapToken::Kind::HEX) {
                auto units = hex_to_units(dst.text);
                for (uint32_t c = lo; c <= hi && c - lo < 65536 && !units.empty(); ++c) {
                    auto shifted = units;
                    shifted.back() = static_cast<uint16_t>(shifted.back() + (c - lo));
                    map[c] = units_to_utf8(shifted);
                }
                i += 3;
                continue;
            }

            if (dst.kind == CMapToken::Kind::OPEN) {
                size_t j = i + 3;
                uint32_t c = lo;
                while (j < tokens.size() && tokens[j].kind == CMapToken::Kind::HEX && c <= hi) {
                    map[c++] = units_to_utf8(hex_to_units(tokens[j].text));
                    ++j;
                }
                while (j < tokens.size() && tokens[j].kind != CMapToken::Kind::CLOSE) ++j;
                i = j + 1;
                continue;
            }
        }
        ++i;
    }
    return map;
}

// ============================================================================
// Resource font table
// ============================================================================

FontTable load_fonts(QPDFObjectHandle resources, double fallback_factor) {
    FontTable table;
    if (!resources.isDictionary()) return table;

    const auto fonts = resources.getKey("/Font");
    if (!fonts.isDictionary()) return table;

    for (const auto& key : fonts.getKeys()) {
        table.emplace(key, FontMetrics::from_dictionary(fonts.getKey(key), fallback_factor));
    }
    return table;
}

} // namespace docredact::pdf
