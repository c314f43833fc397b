#include <catch2/catch_test_macros.hpp>
#include "detect/entity_detector.hpp"
#include "extract/position_indexer.hpp"
#include "fixtures/pdf_builder.hpp"
#include "pdf/content_stream.hpp"
#include "pdf/pdf_document.hpp"
#include "pdf/pdf_redaction_engine.hpp"
#include "redact/box_resolver.hpp"
#include "verify/verification_oracle.hpp"

using namespace docredact;
using namespace docredact::testing;

namespace {

RedactionRule rule(std::string pattern) {
    RedactionRule r;
    r.id = "r1";
    r.name = "Rule";
    r.pattern = std::move(pattern);
    r.version = "1";
    return r;
}

struct Prepared {
    std::vector<DetectedEntity> entities;
    std::vector<ResolvedEntity> resolved;
};

Prepared prepare(const std::string& pdf, const std::string& pattern) {
    const auto doc = PositionIndexer().index(pdf, DocumentFormat::PDF);
    Prepared p;
    p.entities = EntityDetector::detect(doc.text, {rule(pattern)});
    p.resolved = RedactionBoxResolver().resolve_all(p.entities, doc.positions);
    return p;
}

std::string first_page_content(const std::string& bytes) {
    pdf::PdfDocument doc(bytes);
    auto pages = doc.pages();
    return pdf::page_content(pages.at(0));
}

} // anonymous namespace

TEST_CASE("PdfRedactionEngine filter_content", "[pdf][redact]") {

    const pdf::FontTable fonts;

    SECTION("Operation under a box is removed, others kept") {
        const std::string content =
            "BT /F1 10 Tf 0 100 Td (keep) Tj 0 -50 Td (secret) Tj ET";
        // "secret" sits at y 50: box [0,48]-[36,60]
        const auto result = PdfRedactionEngine::filter_content(content, fonts,
            {Rect{0, 48, 36, 60}}, false, 0.6);
        REQUIRE(result.usable());
        REQUIRE(result.removed == 1);
        REQUIRE(result.content.find("(keep)") != std::string::npos);
        REQUIRE(result.content.find("(secret)") == std::string::npos);
    }

    SECTION("Removed glyphs leave an equivalent advance") {
        const std::string content = "BT /F1 10 Tf 0 0 Td (abc) Tj (tail) Tj ET";
        const auto result = PdfRedactionEngine::filter_content(content, fonts,
            {Rect{0, 0, 17, 5}}, false, 0.6);
        REQUIRE(result.usable());
        REQUIRE(result.content.find("-1800.000") != std::string::npos);

        // The surviving text keeps its position
        auto ops = pdf::tokenize(result.content);
        REQUIRE(ops.is_ok());
        const auto shown = pdf::ContentInterpreter(fonts, 0.6).collect(ops.value());
        bool found_tail = false;
        for (const auto& s : shown) {
            if (s.text == "tail") {
                found_tail = true;
                REQUIRE(s.bounds.x1 > 17.9);
                REQUIRE(s.bounds.x1 < 18.1);
            }
        }
        REQUIRE(found_tail);
    }

    SECTION("Strict mode clears the whole text block") {
        const std::string content =
            "BT /F1 10 Tf 0 0 Td (hit) Tj 200 0 Td (neighbour) Tj ET BT /F1 10 Tf 0 300 Td (other) Tj ET";
        const auto result = PdfRedactionEngine::filter_content(content, fonts,
            {Rect{0, 0, 10, 10}}, true, 0.6);
        REQUIRE(result.usable());
        REQUIRE(result.removed == 2);
        REQUIRE(result.content.find("(neighbour)") == std::string::npos);
        REQUIRE(result.content.find("(other)") != std::string::npos);
    }

    SECTION("Named XObjects are dropped") {
        const auto result = PdfRedactionEngine::filter_content("q /Fm0 Do Q /Fm1 Do", fonts,
            {}, true, 0.6, {"/Fm0"});
        REQUIRE(result.usable());
        REQUIRE(result.content.find("/Fm0") == std::string::npos);
        REQUIRE(result.content.find("/Fm1") != std::string::npos);
    }

    SECTION("Unbalanced BT/ET is reported, not fixed") {
        const auto result = PdfRedactionEngine::filter_content("BT /F1 10 Tf (x) Tj", fonts,
            {}, false, 0.6);
        REQUIRE_FALSE(result.usable());
        REQUIRE_FALSE(result.balanced);
        REQUIRE(result.content.empty());
    }

    SECTION("Tokenizer errors are reported") {
        const auto result = PdfRedactionEngine::filter_content("BT (oops", fonts, {}, false, 0.6);
        REQUIRE(result.error.has_value());
    }

    SECTION("Overlay paints one black rectangle per box") {
        const auto out = PdfRedactionEngine::overlay({Rect{1, 2, 11, 22}});
        REQUIRE(out == "q 0 0 0 rg 1.00 2.00 10.00 20.00 re f Q\n");
    }
}

TEST_CASE("PdfRedactionEngine redact", "[pdf][redact]") {

    PdfRedactionEngine engine;

    SECTION("Text is removed, covered and unrecoverable") {
        const auto pdf = PdfBuilder().page(
            "BT /F1 12 Tf 72 700 Td (SSN: 123-45-6789) Tj ET "
            "BT /F1 12 Tf 72 600 Td (Public line) Tj ET").build();
        const auto p = prepare(pdf, R"(\d{3}-\d{2}-\d{4})");
        REQUIRE(p.entities.size() == 1);

        const auto outcome = engine.redact(pdf, p.entities, p.resolved, RedactionParams{});
        REQUIRE(outcome.failures.empty());
        REQUIRE(outcome.pages_rewritten == 1);
        REQUIRE(outcome.removed_operations >= 1);

        const auto content = first_page_content(outcome.bytes);
        REQUIRE(content.find("re f") != std::string::npos);
        REQUIRE(content.find("Public line") != std::string::npos);

        const auto verdict = VerificationOracle().verify(outcome.bytes, DocumentFormat::PDF, {"123-45-6789"});
        REQUIRE(verdict.success);
    }

    SECTION("Hidden structures are stripped and accessibility added") {
        const auto pdf = PdfBuilder().page(text_line("Account 12345678")).annotate("Account 12345678")
                                     .outline().build();
        const auto p = prepare(pdf, R"(\d{8})");
        const auto outcome = engine.redact(pdf, p.entities, p.resolved, RedactionParams{});

        pdf::PdfDocument out(outcome.bytes);
        auto root = out.catalog();
        REQUIRE_FALSE(root.hasKey("/Outlines"));
        REQUIRE(root.getKey("/MarkInfo").isDictionary());
        REQUIRE(root.getKey("/StructTreeRoot").isDictionary());
        REQUIRE(root.getKey("/Lang").isString());
        REQUIRE_FALSE(out.pages().at(0).getObjectHandle().hasKey("/Annots"));
    }

    SECTION("Attempt 1 leaves form text; strict attempt prunes the form") {
        const auto pdf = PdfBuilder().page("q /Fm0 Do Q", {
            {"Fm0", "BT /F1 12 Tf 72 700 Td (Card 4111222233334444) Tj ET", ""},
        }).build();
        const auto p = prepare(pdf, R"(\d{16})");
        REQUIRE(p.entities.size() == 1);
        REQUIRE(p.resolved[0].position_found);

        const auto first = engine.redact(pdf, p.entities, p.resolved, RedactionParams{});
        REQUIRE_FALSE(VerificationOracle().verify(first.bytes, DocumentFormat::PDF,
                                                  {"4111222233334444"}).success);

        RedactionParams strict;
        strict.attempt = 2;
        strict.strict = true;
        strict.padding = Padding{20, 8};
        const auto second = engine.redact(pdf, p.entities, p.resolved, strict);
        REQUIRE(second.pruned_forms == 1);
        REQUIRE(VerificationOracle().verify(second.bytes, DocumentFormat::PDF,
                                            {"4111222233334444"}).success);
    }

    SECTION("Unbalanced page content keeps the original stream plus overlay") {
        const auto pdf = PdfBuilder().page("BT /F1 12 Tf 72 700 Td (Secret 99887766) Tj").build();
        const auto p = prepare(pdf, R"(\d{8})");
        REQUIRE(p.entities.size() == 1);

        const auto outcome = engine.redact(pdf, p.entities, p.resolved, RedactionParams{});
        REQUIRE(outcome.failures.size() == 1);
        REQUIRE(outcome.failures[0].location == "page 1");
        REQUIRE(outcome.failures[0].category == ErrorCategory::STREAM_INTEGRITY_ERROR);
    }

    SECTION("Entities without geometry change nothing on the page") {
        const auto pdf = PdfBuilder().page(text_line("nothing to see")).build();
        ResolvedEntity unresolved;
        const auto outcome = engine.redact(pdf, {}, {unresolved}, RedactionParams{});
        REQUIRE(outcome.pages_rewritten == 0);
    }

    SECTION("Garbage input is a parse error") {
        REQUIRE_THROWS_AS(engine.redact("not a pdf", {}, {}, RedactionParams{}), RedactionError);
    }
}
