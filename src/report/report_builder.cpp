#include "report/report_builder.hpp"
#include "core/utils.hpp"

#include <format>

namespace docredact {

namespace {

const char* source_to_string(EntitySource source) {
    return source == EntitySource::SUGGESTION ? "suggestion" : "rule";
}

std::string json_string(std::string_view s) {
    return std::format("\"{}\"", utils::escape_json(s));
}

std::string counts_to_json(const std::map<std::string, size_t>& counts) {
    std::string json = "{";
    bool first = true;
    for (const auto& [key, count] : counts) {
        if (!first) json += ',';
        first = false;
        json += std::format("{}:{}", json_string(key), count);
    }
    json += '}';
    return json;
}

std::string strings_to_json(const std::vector<std::string>& values) {
    std::string json = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) json += ',';
        json += json_string(values[i]);
    }
    json += ']';
    return json;
}

} // anonymous namespace

std::string ReportBuilder::page_key(const std::optional<int>& page) {
    return page ? std::to_string(*page) : std::string("unknown");
}

RedactionReport ReportBuilder::build(const std::vector<DetectedEntity>& entities,
                                     const std::vector<ResolvedEntity>& resolved,
                                     const std::string& document_id,
                                     const std::string& template_id,
                                     DocumentFormat format) {
    RedactionReport report;
    report.report_id = utils::generate_uuid();
    report.timestamp = utils::now();
    report.document_id = document_id;
    report.template_id = template_id;
    report.format = format;
    report.total_entities = entities.size();
    report.entities.reserve(entities.size());

    std::vector<bool> found(entities.size(), resolved.empty());
    for (const auto& r : resolved) {
        if (r.entity_index < found.size()) found[r.entity_index] = r.position_found;
    }

    for (size_t i = 0; i < entities.size(); ++i) {
        const auto& entity = entities[i];

        ReportEntity row;
        row.rule_id = entity.rule_id;
        row.rule_name = entity.rule_name;
        row.rule_version = entity.rule_version;
        row.category = entity.category;
        row.entity_hash = entity.content_hash.empty()
            ? utils::sha256_hex(entity.text) : entity.content_hash;
        row.page = entity.page;
        row.position_start = entity.char_start;
        row.position_end = entity.char_end;
        row.position_found = found[i];
        row.source = entity.source;

        ++report.counts_by_rule[entity.rule_id];
        ++report.counts_by_page[page_key(entity.page)];
        if (!row.position_found) {
            report.unresolved_entities.push_back(row.entity_hash);
        }
        report.entities.push_back(std::move(row));
    }

    return report;
}

std::string ReportBuilder::to_json(const RedactionReport& report) {
    std::string json;
    json.reserve(1024 + report.entities.size() * 256);
    json += '{';
    json += std::format("\"report_id\":{},", json_string(report.report_id));
    json += std::format("\"timestamp\":\"{}\",", utils::format_timestamp(report.timestamp));
    json += std::format("\"user_id\":{},", json_string(report.user_id));
    json += std::format("\"document_id\":{},", json_string(report.document_id));
    json += std::format("\"template_id\":{},", json_string(report.template_id));
    json += std::format("\"format\":\"{}\",", format_to_string(report.format));
    json += std::format("\"total_entities\":{},", report.total_entities);

    json += "\"entities\":[";
    for (size_t i = 0; i < report.entities.size(); ++i) {
        const auto& e = report.entities[i];
        if (i > 0) json += ',';
        json += std::format(
            "{{\"rule_id\":{},\"rule_name\":{},\"rule_version\":{},\"category\":{},"
            "\"entity_hash\":\"{}\",\"page\":{},\"position\":{{\"start\":{},\"end\":{}}},"
            "\"position_found\":{},\"source\":\"{}\"}}",
            json_string(e.rule_id), json_string(e.rule_name), json_string(e.rule_version),
            json_string(e.category), e.entity_hash,
            e.page ? std::to_string(*e.page) : std::string("null"),
            e.position_start, e.position_end,
            utils::booltostr(e.position_found), source_to_string(e.source));
    }
    json += "],";

    json += std::format("\"counts_by_rule\":{},", counts_to_json(report.counts_by_rule));
    json += std::format("\"counts_by_page\":{},", counts_to_json(report.counts_by_page));
    json += std::format("\"unresolved_entities\":{},", strings_to_json(report.unresolved_entities));

    json += "\"stream_failures\":[";
    for (size_t i = 0; i < report.failures.size(); ++i) {
        const auto& f = report.failures[i];
        if (i > 0) json += ',';
        json += std::format("{{\"location\":{},\"category\":\"{}\",\"message\":{}}}",
            json_string(f.location), error_category_to_string(f.category), json_string(f.message));
    }
    json += "],";

    json += std::format("\"attempts\":{},", report.attempts);
    json += std::format("\"verification_passed\":{},", utils::booltostr(report.verification_passed));
    json += std::format("\"requires_manual_review\":{},", utils::booltostr(report.requires_manual_review));
    json += std::format("\"manual_review_reason\":{},", json_string(report.manual_review_reason));
    json += std::format("\"content_hash\":{},", json_string(report.content_hash));
    json += std::format("\"audit_findings\":{}", strings_to_json(report.audit_findings));
    json += '}';
    return json;
}

} // namespace docredact
