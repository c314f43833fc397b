#include "sanitize/metadata_sanitizer.hpp"
#include "core/utils.hpp"
#include "docx/ooxml_package.hpp"
#include "docx/run_map.hpp"
#include "pdf/pdf_document.hpp"

#include <tinyxml2.h>

#include <format>

namespace docredact {

using tinyxml2::XMLDocument;
using tinyxml2::XMLElement;

namespace {

constexpr const char* kRedactedInfoKeys[] = {"/Author", "/Title", "/Subject", "/Keywords"};

// Core properties cleared to the placeholder, by local name
constexpr std::string_view kRedactedCoreProps[] = {
    "creator", "lastModifiedBy", "description", "subject", "title", "keywords",
};

// Extended properties emptied
constexpr std::string_view kClearedAppProps[] = {"Company", "Manager", "Template"};

std::string_view local_name(const XMLElement* element) {
    std::string_view name = element->Name();
    const auto colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

template<typename Edit>
bool edit_part(docx::OoxmlPackage& package, std::string_view name, Edit&& edit) {
    const auto* data = package.find(name);
    if (!data) return false;

    XMLDocument dom(true, tinyxml2::PRESERVE_WHITESPACE);
    if (dom.Parse(data->c_str(), data->size()) != tinyxml2::XML_SUCCESS || !dom.RootElement()) {
        utils::log::warn(std::format("Metadata part {} is not well-formed, left unchanged", name));
        return false;
    }
    edit(dom.RootElement());
    package.put(name, docx::print_xml(dom));
    return true;
}

void sanitize_core(XMLElement* root, const std::string& modified) {
    for (auto* el = root->FirstChildElement(); el; el = el->NextSiblingElement()) {
        const auto name = local_name(el);
        for (const auto redacted : kRedactedCoreProps) {
            if (name == redacted) {
                el->SetText(std::string(MetadataSanitizer::kRedactedValue).c_str());
            }
        }
        if (name == "modified") {
            el->SetText(modified.c_str());
        } else if (name == "revision") {
            const char* text = el->GetText();
            const int revision = text ? utils::parse_int<int>(utils::trim(text), 0) : 0;
            el->SetText(revision + 1);
        }
    }
}

void sanitize_app(XMLElement* root) {
    for (auto* el = root->FirstChildElement(); el; el = el->NextSiblingElement()) {
        const auto name = local_name(el);
        for (const auto cleared : kClearedAppProps) {
            if (name == cleared) el->SetText("");
        }
    }
}

// Every property value becomes a string so the placeholder stays schema-valid
void sanitize_custom(XMLElement* root) {
    for (auto* prop = root->FirstChildElement(); prop; prop = prop->NextSiblingElement()) {
        for (auto* value = prop->FirstChildElement(); value; value = value->NextSiblingElement()) {
            value->SetName("vt:lpwstr");
            value->DeleteChildren();
            value->SetText(std::string(MetadataSanitizer::kRedactedValue).c_str());
        }
    }
}

} // anonymous namespace

std::chrono::system_clock::time_point MetadataSanitizer::now() const {
    return fixed_now_ ? *fixed_now_ : utils::now();
}

std::string MetadataSanitizer::sanitize(std::string_view bytes, DocumentFormat format) const {
    switch (format) {
        case DocumentFormat::PDF: {
            try {
                pdf::PdfDocument pdf{std::string(bytes)};
                sanitize_pdf(pdf);
                return pdf.write();
            } catch (const std::exception& e) {
                throw RedactionError(ErrorCategory::PARSE_ERROR,
                    std::format("Cannot sanitize PDF metadata: {}", e.what()));
            }
        }
        case DocumentFormat::DOCX: {
            auto package = docx::OoxmlPackage::open(bytes);
            if (package.is_error()) {
                throw RedactionError(ErrorCategory::PARSE_ERROR, package.error_message());
            }
            sanitize_docx(package.value());
            auto out = package.value().to_bytes();
            if (out.is_error()) {
                throw RedactionError(ErrorCategory::IO_ERROR, out.error_message());
            }
            return std::move(out.value());
        }
        case DocumentFormat::UNKNOWN:
            break;
    }
    throw UnsupportedFormatError("Metadata sanitization needs a PDF or DOCX document");
}

void MetadataSanitizer::sanitize_pdf(pdf::PdfDocument& pdf) const {
    auto& qpdf = pdf.qpdf();
    auto trailer = qpdf.getTrailer();
    auto info = trailer.getKey("/Info");
    if (!info.isDictionary()) {
        info = qpdf.makeIndirectObject(QPDFObjectHandle::newDictionary());
        trailer.replaceKey("/Info", info);
    }

    const auto stamp = utils::format_pdf_date(now());
    info.replaceKey("/Producer", QPDFObjectHandle::newString(std::string(kNeutralProducer)));
    info.replaceKey("/Creator", QPDFObjectHandle::newString(std::string(kNeutralCreator)));
    for (const char* key : kRedactedInfoKeys) {
        info.replaceKey(key, QPDFObjectHandle::newString(std::string(kRedactedValue)));
    }
    info.replaceKey("/CreationDate", QPDFObjectHandle::newString(stamp));
    info.replaceKey("/ModDate", QPDFObjectHandle::newString(stamp));

    auto catalog = pdf.catalog();
    if (catalog.hasKey("/Metadata")) {
        catalog.removeKey("/Metadata");
        utils::log::debug("Removed catalog XMP metadata");
    }
}

size_t MetadataSanitizer::sanitize_docx(docx::OoxmlPackage& package) const {
    const auto modified = utils::format_w3c_date(now());
    size_t rewritten = 0;

    if (edit_part(package, docx::kCorePropsPart,
                  [&modified](XMLElement* root) { sanitize_core(root, modified); })) {
        ++rewritten;
    }
    if (edit_part(package, docx::kAppPropsPart, sanitize_app)) ++rewritten;
    if (edit_part(package, docx::kCustomPropsPart, sanitize_custom)) ++rewritten;

    utils::log::debug(std::format("Sanitized {} document property parts", rewritten));
    return rewritten;
}

} // namespace docredact
