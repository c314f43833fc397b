#include "verify/thoroughness_auditor.hpp"
#include "core/utils.hpp"
#include "docx/ooxml_package.hpp"
#include "pdf/pdf_document.hpp"

#include <algorithm>
#include <format>
#include <set>

namespace docredact {

namespace {

struct PdfShape {
    std::vector<size_t> page_sizes;
};

PdfShape pdf_shape(std::string_view bytes) {
    PdfShape shape;
    pdf::PdfDocument pdf{std::string(bytes)};
    for (auto& page : pdf.pages()) {
        try {
            shape.page_sizes.push_back(pdf::page_content(page).size());
        } catch (const std::exception& e) {
            utils::log::debug(std::format("Audit could not decode a page: {}", e.what()));
            shape.page_sizes.push_back(0);
        }
    }
    return shape;
}

} // anonymous namespace

ThoroughnessReport ThoroughnessAuditor::audit(std::string_view original,
                                              std::string_view redacted,
                                              DocumentFormat format) const {
    ThoroughnessReport report;
    try {
        if (format == DocumentFormat::PDF) {
            audit_pdf(original, redacted, report);
        } else if (format == DocumentFormat::DOCX) {
            audit_docx(original, redacted, report);
        }
    } catch (const std::exception& e) {
        report.findings.push_back(std::format("Audit incomplete: {}", e.what()));
    }

    for (const auto& finding : report.findings) {
        utils::log::info(std::format("Audit: {}", finding));
    }
    return report;
}

void ThoroughnessAuditor::audit_pdf(std::string_view original, std::string_view redacted,
                                    ThoroughnessReport& report) {
    const auto before = pdf_shape(original);
    const auto after = pdf_shape(redacted);

    report.original_units = before.page_sizes.size();
    report.redacted_units = after.page_sizes.size();
    for (const auto size : before.page_sizes) report.original_size += size;
    for (const auto size : after.page_sizes) report.redacted_size += size;

    if (report.redacted_units < report.original_units) {
        report.findings.push_back(std::format("{} pages lost during redaction ({} -> {})",
            report.original_units - report.redacted_units, report.original_units, report.redacted_units));
    }

    const size_t common = std::min(before.page_sizes.size(), after.page_sizes.size());
    for (size_t i = 0; i < common; ++i) {
        if (before.page_sizes[i] > 0 && after.page_sizes[i] == 0) {
            report.findings.push_back(std::format("Page {} lost all content", i + 1));
        }
    }
}

void ThoroughnessAuditor::audit_docx(std::string_view original, std::string_view redacted,
                                     ThoroughnessReport& report) {
    auto before = docx::OoxmlPackage::open(original);
    auto after = docx::OoxmlPackage::open(redacted);
    if (before.is_error() || after.is_error()) {
        report.findings.push_back("Package could not be reopened for audit");
        return;
    }

    report.original_units = before.value().size();
    report.redacted_units = after.value().size();
    for (const auto& entry : before.value().entries()) report.original_size += entry.data.size();
    for (const auto& entry : after.value().entries()) report.redacted_size += entry.data.size();

    const auto kept_names = after.value().names();
    const std::set<std::string> kept(kept_names.begin(), kept_names.end());
    for (const auto& name : before.value().names()) {
        if (!kept.contains(name)) {
            report.findings.push_back(std::format("Part removed: {}", name));
        }
    }
}

} // namespace docredact
