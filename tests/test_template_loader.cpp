#include <catch2/catch_test_macros.hpp>
#include "rules/template_loader.hpp"

using namespace docredact;

namespace {

const char* kValidToml = R"(
[template]
id = "pii"
name = "PII"

[[rules]]
id = "ssn"
name = "US SSN"
category = "SSN"
pattern = '\d{3}-\d{2}-\d{4}'
version = "1.0"

[[rules]]
id = "names"
name = "Person names"
category = "PERSON"
ai_prompt = "Full names of people"
version = 2
)";

std::string first_rule_toml(const std::string& body) {
    return "[template]\nid = \"t\"\nname = \"T\"\n\n[[rules]]\n" + body;
}

} // anonymous namespace

TEST_CASE("TemplateLoader TOML parsing", "[template]") {

    SECTION("Valid template loads") {
        auto result = TemplateLoader::load_from_string(kValidToml, TemplateSyntax::TOML);
        REQUIRE(result.success);
        REQUIRE(result.template_.id == "pii");
        REQUIRE(result.template_.rules.size() == 2);

        const auto& ssn = result.template_.rules[0];
        REQUIRE(ssn.is_pattern_rule());
        REQUIRE(*ssn.pattern == R"(\d{3}-\d{2}-\d{4})");
        REQUIRE(ssn.category == "SSN");
        REQUIRE(ssn.severity == "medium");

        const auto& names = result.template_.rules[1];
        REQUIRE_FALSE(names.is_pattern_rule());
        REQUIRE(names.ai_prompt.has_value());
        REQUIRE(*names.version == "2");
    }

    SECTION("Missing category defaults to UNKNOWN") {
        auto result = TemplateLoader::load_from_string(first_rule_toml(
            "id = \"r\"\nname = \"R\"\npattern = \"abc\"\nversion = \"1\"\n"), TemplateSyntax::TOML);
        REQUIRE(result.success);
        REQUIRE(result.template_.rules[0].category == "UNKNOWN");
    }

    SECTION("Malformed TOML is an error") {
        auto result = TemplateLoader::load_from_string("[[rules]\nid = ", TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("TOML") != std::string::npos);
    }
}

TEST_CASE("TemplateLoader validation order", "[template]") {

    SECTION("Empty content") {
        auto result = TemplateLoader::load_from_string("   ", TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message == "Template is required");
    }

    SECTION("No rules") {
        auto result = TemplateLoader::load_from_string("[template]\nid = \"t\"\n", TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("at least one rule") != std::string::npos);
    }

    SECTION("Missing id") {
        auto result = TemplateLoader::load_from_string(first_rule_toml(
            "name = \"R\"\npattern = \"abc\"\nversion = \"1\"\n"), TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("id") != std::string::npos);
    }

    SECTION("Missing name") {
        auto result = TemplateLoader::load_from_string(first_rule_toml(
            "id = \"r\"\npattern = \"abc\"\nversion = \"1\"\n"), TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("name") != std::string::npos);
    }

    SECTION("Neither pattern nor ai_prompt") {
        auto result = TemplateLoader::load_from_string(first_rule_toml(
            "id = \"r\"\nname = \"R\"\nversion = \"1\"\n"), TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("either pattern or ai_prompt") != std::string::npos);
    }

    SECTION("Both pattern and ai_prompt") {
        auto result = TemplateLoader::load_from_string(first_rule_toml(
            "id = \"r\"\nname = \"R\"\npattern = \"a\"\nai_prompt = \"b\"\nversion = \"1\"\n"),
            TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("both") != std::string::npos);
    }

    SECTION("Invalid regex") {
        auto result = TemplateLoader::load_from_string(first_rule_toml(
            "id = \"r\"\nname = \"R\"\npattern = \"([a-z\"\nversion = \"1\"\n"), TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("invalid pattern") != std::string::npos);
    }

    SECTION("No version and no checksum") {
        auto result = TemplateLoader::load_from_string(first_rule_toml(
            "id = \"r\"\nname = \"R\"\npattern = \"abc\"\n"), TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error_message.find("version or checksum") != std::string::npos);
    }

    SECTION("Checksum alone is enough") {
        auto result = TemplateLoader::load_from_string(first_rule_toml(
            "id = \"r\"\nname = \"R\"\npattern = \"abc\"\nchecksum = \"deadbeef\"\n"), TemplateSyntax::TOML);
        REQUIRE(result.success);
        REQUIRE(result.template_.rules[0].version_label() == "deadbeef");
    }

    SECTION("Empty version string counts as missing") {
        auto result = TemplateLoader::load_from_string(first_rule_toml(
            "id = \"r\"\nname = \"R\"\npattern = \"abc\"\nversion = \"  \"\n"), TemplateSyntax::TOML);
        REQUIRE_FALSE(result.success);
    }

    SECTION("load_or_throw raises TemplateValidationError") {
        REQUIRE_THROWS_AS(TemplateLoader::load_or_throw("/nonexistent/template.toml"),
                          TemplateValidationError);
    }
}

TEST_CASE("TemplateLoader JSON parsing", "[template]") {

    SECTION("Valid JSON template") {
        auto result = TemplateLoader::load_from_string(R"({
            "id": "pii", "name": "PII",
            "rules": [
                {"id": "email", "name": "Email", "category": "EMAIL",
                 "pattern": "[a-z]+@[a-z]+\\.com", "version": "1"},
                {"id": "org", "name": "Organizations", "aiPrompt": "Company names", "checksum": "abc"}
            ]
        })", TemplateSyntax::JSON);
        REQUIRE(result.success);
        REQUIRE(result.template_.rules.size() == 2);
        REQUIRE(result.template_.rules[0].category == "EMAIL");
        REQUIRE(result.template_.rules[1].ai_prompt.has_value());
    }

    SECTION("Rules must be an array") {
        auto result = TemplateLoader::load_from_string(R"({"id":"t","rules":{}})", TemplateSyntax::JSON);
        REQUIRE_FALSE(result.success);
    }

    SECTION("Invalid JSON") {
        auto result = TemplateLoader::load_from_string("{not json", TemplateSyntax::JSON);
        REQUIRE_FALSE(result.success);
    }
}

TEST_CASE("TemplateLoader checksums", "[template]") {

    RedactionRule rule;
    rule.id = "ssn";
    rule.name = "SSN";
    rule.category = "SSN";
    rule.pattern = "\\d{3}";

    SECTION("Checksum is stable and content-sensitive") {
        const auto a = TemplateLoader::compute_rule_checksum(rule);
        REQUIRE(a.size() == 64);
        REQUIRE(a == TemplateLoader::compute_rule_checksum(rule));

        auto changed = rule;
        changed.pattern = "\\d{4}";
        REQUIRE(a != TemplateLoader::compute_rule_checksum(changed));
    }

    SECTION("Enrichment fills only missing checksums") {
        RedactionTemplate tmpl;
        tmpl.id = "t";
        tmpl.rules = {rule, rule};
        tmpl.rules[1].checksum = "existing";

        REQUIRE(TemplateLoader::enrich_checksums(tmpl) == 1);
        REQUIRE(tmpl.rules[0].checksum == TemplateLoader::compute_rule_checksum(rule));
        REQUIRE(*tmpl.rules[1].checksum == "existing");
        REQUIRE(TemplateLoader::enrich_checksums(tmpl) == 0);
    }

    SECTION("Enriched template serializes to loadable TOML") {
        RedactionTemplate tmpl;
        tmpl.id = "t";
        tmpl.name = "T";
        tmpl.rules = {rule};
        TemplateLoader::enrich_checksums(tmpl);

        auto result = TemplateLoader::load_from_string(TemplateLoader::to_toml(tmpl), TemplateSyntax::TOML);
        REQUIRE(result.success);
        REQUIRE(result.template_.rules[0].checksum == tmpl.rules[0].checksum);
        REQUIRE(*result.template_.rules[0].pattern == "\\d{3}");
    }
}
