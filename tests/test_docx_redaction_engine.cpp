#include <catch2/catch_test_macros.hpp>
#include "detect/entity_detector.hpp"
#include "docx/docx_redaction_engine.hpp"
#include "docx/ooxml_package.hpp"
#include "fixtures/docx_builder.hpp"
#include "verify/verification_oracle.hpp"

using namespace docredact;
using namespace docredact::testing;

namespace {

DetectedEntity entity(std::string text) {
    RedactionRule rule;
    rule.id = "phone";
    rule.name = "Phone";
    rule.version = "3";
    return EntityDetector::make_entity(rule, text, 0, text.size());
}

std::string part(const std::string& bytes, const std::string& name) {
    auto pkg = docx::OoxmlPackage::open(bytes);
    REQUIRE(pkg.is_ok());
    const auto* data = pkg.value().find(name);
    return data ? *data : std::string();
}

const char* kPart =
    R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body>)"
    R"(<w:p><w:r><w:rPr><w:i/></w:rPr><w:t xml:space="preserve">Call 555-12</w:t></w:r>)"
    R"(<w:r><w:rPr><w:b/></w:rPr><w:t xml:space="preserve">34 today</w:t></w:r></w:p>)"
    R"(</w:body></w:document>)";

} // anonymous namespace

TEST_CASE("DocxRedactionEngine part rewriting", "[docx][redact]") {

    SECTION("Span across runs becomes one marker; edge text survives with its formatting") {
        const auto result = DocxRedactionEngine::redact_wordprocessing_part(kPart, {entity("555-1234")}, 1);
        REQUIRE_FALSE(result.error);
        REQUIRE(result.markers == 1);
        REQUIRE(result.replaced_runs == 2);

        const auto& xml = result.xml;
        REQUIRE(xml.find("555") == std::string::npos);
        REQUIRE(xml.find("[REDACTED]") != std::string::npos);
        REQUIRE(xml.find(R"(<w:tag w:val="Redacted"/>)") != std::string::npos);
        REQUIRE(xml.find("Redacted:Rule-phone@3") != std::string::npos);
        REQUIRE(xml.find(R"(<w:highlight w:val="black"/>)") != std::string::npos);
        REQUIRE(xml.find(R"(<w:i/></w:rPr><w:t xml:space="preserve">Call </w:t>)") != std::string::npos);
        REQUIRE(xml.find(R"(<w:b/></w:rPr><w:t xml:space="preserve"> today</w:t>)") != std::string::npos);
    }

    SECTION("Every occurrence is replaced, case-insensitively") {
        const auto result = DocxRedactionEngine::redact_wordprocessing_part(
            R"(<w:document xmlns:w="x"><w:body><w:p><w:r><w:t>ACME and acme</w:t></w:r></w:p></w:body></w:document>)",
            {entity("Acme")}, 1);
        REQUIRE(result.markers == 2);
        REQUIRE(result.xml.find("cme") == std::string::npos);
    }

    SECTION("Rewriting an already redacted part is a no-op") {
        const auto first = DocxRedactionEngine::redact_wordprocessing_part(kPart, {entity("555-1234")}, 1);
        const auto second = DocxRedactionEngine::redact_wordprocessing_part(first.xml, {entity("redacted")}, 1);
        REQUIRE(second.markers == 0);
    }

    SECTION("Field instructions are redacted") {
        const auto result = DocxRedactionEngine::redact_wordprocessing_part(
            R"(<w:document xmlns:w="x"><w:body><w:p><w:fldSimple w:instr="MERGEFIELD 555-1234"/>)"
            R"(<w:r><w:instrText> HYPERLINK "tel:555-1234" </w:instrText></w:r></w:p></w:body></w:document>)",
            {entity("555-1234")}, 1);
        REQUIRE(result.markers == 2);
        REQUIRE(result.xml.find("555-1234") == std::string::npos);
    }

    SECTION("Entity found inside the placeholder word still terminates in field instructions") {
        const auto result = DocxRedactionEngine::redact_wordprocessing_part(
            R"(<w:document xmlns:w="x"><w:body><w:p>)"
            R"(<w:r><w:instrText xml:space="preserve"> MERGEFIELD Ted </w:instrText></w:r>)"
            R"(</w:p></w:body></w:document>)",
            {entity("Ted")}, 1);
        REQUIRE_FALSE(result.error);
        REQUIRE(result.markers == 1);
        REQUIRE(result.xml.find(" MERGEFIELD </w:instrText>") != std::string::npos);
        REQUIRE(result.xml.find(">[REDACTED]</w:instrText>") != std::string::npos);
        REQUIRE(result.xml.find("Ted") == std::string::npos);
    }

    SECTION("Entity found inside the placeholder word still terminates in deleted text") {
        const auto result = DocxRedactionEngine::redact_wordprocessing_part(
            R"(<w:document xmlns:w="x"><w:body><w:p>)"
            R"(<w:del><w:r><w:delText xml:space="preserve">Signed by Ted</w:delText></w:r></w:del>)"
            R"(</w:p></w:body></w:document>)",
            {entity("Ted")}, 1);
        REQUIRE_FALSE(result.error);
        REQUIRE(result.markers == 1);
        REQUIRE(result.xml.find(">[REDACTED]</w:delText>") != std::string::npos);
        REQUIRE(result.xml.find("Ted") == std::string::npos);
    }

    SECTION("Placeholders left by a longer entity are not rewritten by a shorter one") {
        const auto result = DocxRedactionEngine::redact_wordprocessing_part(
            R"(<w:document xmlns:w="x"><w:body><w:p>)"
            R"(<w:r><w:instrText xml:space="preserve"> HYPERLINK "tel:555-1234" </w:instrText></w:r>)"
            R"(</w:p></w:body></w:document>)",
            {entity("555-1234"), entity("Ted")}, 1);
        REQUIRE(result.markers == 1);
        REQUIRE(result.xml.find("[REDACTED]") != std::string::npos);
        REQUIRE(result.xml.find("[REDAC[") == std::string::npos);
    }

    SECTION("A tracked deletion inside an entity does not hide it") {
        const auto result = DocxRedactionEngine::redact_wordprocessing_part(
            R"(<w:document xmlns:w="x"><w:body><w:p>)"
            R"(<w:r><w:t>555-</w:t></w:r><w:del><w:r><w:delText>X</w:delText></w:r></w:del><w:r><w:t>1234</w:t></w:r>)"
            R"(</w:p></w:body></w:document>)",
            {entity("555-1234")}, 1);
        REQUIRE(result.markers == 1);
        REQUIRE(result.replaced_runs == 2);
        REQUIRE(result.xml.find("555-") == std::string::npos);
        REQUIRE(result.xml.find("1234") == std::string::npos);
        REQUIRE(result.xml.find("<w:delText>X</w:delText>") != std::string::npos);
    }

    SECTION("Literal parts replace text and attributes") {
        const auto result = DocxRedactionEngine::redact_literal_part(
            R"(<data owner="555-1234"><v>call 555-1234</v></data>)", {entity("555-1234")});
        REQUIRE(result.markers == 2);
        REQUIRE(result.xml.find("555-1234") == std::string::npos);
    }

    SECTION("Malformed XML is reported") {
        const auto result = DocxRedactionEngine::redact_wordprocessing_part("<w:document>", {entity("x")}, 1);
        REQUIRE(result.error.has_value());
    }
}

TEST_CASE("DocxRedactionEngine package", "[docx][redact]") {

    DocxRedactionEngine engine;

    SECTION("Body and header are redacted and verify clean") {
        const auto docx = DocxBuilder()
            .paragraph({"Call ", "555-12", "34", " now"})
            .header({"Hotline 555-1234"})
            .build();
        const auto outcome = engine.redact(docx, {entity("555-1234")}, RedactionParams{});
        REQUIRE(outcome.failures.empty());
        REQUIRE(outcome.markers == 2);
        REQUIRE(VerificationOracle().verify(outcome.bytes, DocumentFormat::DOCX, {"555-1234"}).success);
    }

    SECTION("Custom XML parts are redacted on every attempt") {
        const auto docx = DocxBuilder().paragraph({"x 555-1234"})
            .custom_xml("<data><phone>555-1234</phone></data>").build();
        const auto outcome = engine.redact(docx, {entity("555-1234")}, RedactionParams{});
        REQUIRE(part(outcome.bytes, "customXml/item1.xml").find("555-1234") == std::string::npos);
    }

    SECTION("Macros are stripped and the content type downgraded") {
        const auto docx = DocxBuilder().paragraph({"555-1234"}).macros().build();
        const auto outcome = engine.redact(docx, {entity("555-1234")}, RedactionParams{});
        REQUIRE(outcome.removed_parts == std::vector<std::string>{"word/vbaProject.bin"});

        const auto types = part(outcome.bytes, "[Content_Types].xml");
        REQUIRE(types.find("macroEnabled") == std::string::npos);
        REQUIRE(types.find("vbaProject") == std::string::npos);
        REQUIRE(part(outcome.bytes, "word/_rels/document.xml.rels").find("vbaProject") == std::string::npos);
    }

    SECTION("External hyperlinks are neutralized") {
        const auto docx = DocxBuilder().paragraph({"555-1234"}).external_link("https://example.com/u/555-1234").build();
        const auto outcome = engine.redact(docx, {entity("555-1234")}, RedactionParams{});
        const auto rels = part(outcome.bytes, "word/_rels/document.xml.rels");
        REQUIRE(rels.find("example.com") == std::string::npos);
        REQUIRE(rels.find(R"(Target="#")") != std::string::npos);
    }

    SECTION("Options can keep macros") {
        DocxRedactionOptions options;
        options.strip_macros = false;
        const auto docx = DocxBuilder().paragraph({"555-1234"}).macros().build();
        const auto outcome = DocxRedactionEngine(options).redact(docx, {entity("555-1234")}, RedactionParams{});
        REQUIRE(outcome.removed_parts.empty());
        REQUIRE_FALSE(part(outcome.bytes, "word/vbaProject.bin").empty());
    }

    SECTION("Broken archive is a parse error") {
        REQUIRE_THROWS_AS(engine.redact("PK\x03\x04", {entity("x")}, RedactionParams{}), RedactionError);
    }
}
