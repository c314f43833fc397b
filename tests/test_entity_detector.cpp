#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"
#include "detect/entity_detector.hpp"

using namespace docredact;

namespace {

RedactionRule pattern_rule(std::string id, std::string pattern, std::string category = "PII") {
    RedactionRule rule;
    rule.id = id;
    rule.name = id + " rule";
    rule.category = std::move(category);
    rule.pattern = std::move(pattern);
    rule.version = "1";
    return rule;
}

} // anonymous namespace

TEST_CASE("EntityDetector", "[detect]") {

    SECTION("Finds every match with offsets and rule metadata") {
        const std::string text = "SSN: 123-45-6789 and 987-65-4321.";
        const auto entities = EntityDetector::detect(text, {pattern_rule("ssn", R"(\d{3}-\d{2}-\d{4})", "SSN")});
        REQUIRE(entities.size() == 2);
        REQUIRE(entities[0].text == "123-45-6789");
        REQUIRE(entities[0].char_start == 5);
        REQUIRE(entities[0].char_end == 16);
        REQUIRE(entities[0].rule_id == "ssn");
        REQUIRE(entities[0].rule_version == "1");
        REQUIRE(entities[0].category == "SSN");
        REQUIRE(entities[0].content_hash == utils::sha256_hex("123-45-6789"));
        REQUIRE(entities[0].source == EntitySource::RULE);
        REQUIRE(entities[1].char_start == 21);
    }

    SECTION("Matching is case-insensitive") {
        const auto entities = EntityDetector::detect("Contact ACME Corp today",
                                                     {pattern_rule("org", "acme corp")});
        REQUIRE(entities.size() == 1);
        REQUIRE(entities[0].text == "ACME Corp");
    }

    SECTION("Anchors are stripped so patterns match anywhere") {
        REQUIRE(EntityDetector::strip_anchors("^abc$") == "abc");
        REQUIRE(EntityDetector::strip_anchors(R"(price\$)") == R"(price\$)");
        REQUIRE(EntityDetector::strip_anchors(R"(a\\$)") == R"(a\\)");

        const auto entities = EntityDetector::detect("id 42 and id 43", {pattern_rule("id", R"(^id \d+$)")});
        REQUIRE(entities.size() == 2);
    }

    SECTION("Matches span line breaks in the full text") {
        const std::string text = "Card 4111 2222\n3333 4444 end";
        const auto entities = EntityDetector::detect(text,
            {pattern_rule("card", R"(\d{4} \d{4}\s\d{4} \d{4})")});
        REQUIRE(entities.size() == 1);
        REQUIRE(entities[0].text == "4111 2222\n3333 4444");
    }

    SECTION("AI prompt rules are ignored by the detector") {
        RedactionRule ai;
        ai.id = "names";
        ai.name = "Names";
        ai.ai_prompt = "Person names";
        ai.version = "1";
        REQUIRE(EntityDetector::detect("John Smith", {ai}).empty());
    }

    SECTION("Detection is idempotent") {
        const std::string text = "Jane Roe, SSN 123-45-6789, phone 555-1234; jane roe again";
        const std::vector<RedactionRule> rules = {
            pattern_rule("ssn", R"(\d{3}-\d{2}-\d{4})"),
            pattern_rule("phone", R"(\d{3}-\d{4})"),
            pattern_rule("name", "jane roe"),
        };
        const auto first = EntityDetector::detect(text, rules);
        const auto second = EntityDetector::detect(text, rules);

        REQUIRE(first.size() == 4);
        REQUIRE(first.size() == second.size());
        for (size_t i = 0; i < first.size(); ++i) {
            REQUIRE(first[i].text == second[i].text);
            REQUIRE(first[i].char_start == second[i].char_start);
            REQUIRE(first[i].char_end == second[i].char_end);
            REQUIRE(first[i].rule_id == second[i].rule_id);
        }
    }

    SECTION("No match yields an empty list") {
        REQUIRE(EntityDetector::detect("nothing here", {pattern_rule("ssn", R"(\d{3}-\d{2}-\d{4})")}).empty());
    }

    SECTION("Overlapping matches keep the longer span") {
        const auto entities = EntityDetector::detect("call 555-123-4567 now", {
            pattern_rule("short", R"(\d{3}-\d{4})"),
            pattern_rule("long", R"(\d{3}-\d{3}-\d{4})"),
        });
        REQUIRE(entities.size() == 1);
        REQUIRE(entities[0].rule_id == "long");
        REQUIRE(entities[0].text == "555-123-4567");
    }

    SECTION("Invalid patterns throw on construction") {
        REQUIRE_THROWS_AS(EntityDetector({pattern_rule("bad", "([")}), std::regex_error);
    }
}

TEST_CASE("EntityDetector overlap resolution", "[detect]") {

    const auto rule = pattern_rule("r", "x");

    SECTION("Equal lengths keep the earlier span") {
        std::vector<DetectedEntity> in = {
            EntityDetector::make_entity(rule, "bcd", 1, 4),
            EntityDetector::make_entity(rule, "abc", 0, 3),
        };
        const auto out = EntityDetector::resolve_overlaps(in);
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].char_start == 0);
    }

    SECTION("Adjacent spans both survive, sorted") {
        std::vector<DetectedEntity> in = {
            EntityDetector::make_entity(rule, "def", 3, 6),
            EntityDetector::make_entity(rule, "abc", 0, 3),
        };
        const auto out = EntityDetector::resolve_overlaps(in);
        REQUIRE(out.size() == 2);
        REQUIRE(out[0].char_start == 0);
        REQUIRE(out[1].char_start == 3);
    }
}

TEST_CASE("EntityDetector merge", "[detect]") {

    const auto rule = pattern_rule("r", "x");

    SECTION("Supplemental duplicates by text are dropped") {
        std::vector<DetectedEntity> base = {EntityDetector::make_entity(rule, "John Smith", 0, 10)};
        std::vector<DetectedEntity> extra = {
            EntityDetector::make_entity(rule, "john smith", 20, 30, EntitySource::SUGGESTION),
            EntityDetector::make_entity(rule, "Acme", 40, 44, EntitySource::SUGGESTION),
        };
        const auto merged = EntityDetector::merge(base, extra);
        REQUIRE(merged.size() == 2);
        REQUIRE(merged[1].text == "Acme");
        REQUIRE(merged[1].source == EntitySource::SUGGESTION);
    }

    SECTION("Overlapping supplemental entities are resolved") {
        std::vector<DetectedEntity> base = {EntityDetector::make_entity(rule, "Smith", 5, 10)};
        std::vector<DetectedEntity> extra = {
            EntityDetector::make_entity(rule, "John Smith", 0, 10, EntitySource::SUGGESTION),
        };
        const auto merged = EntityDetector::merge(base, extra);
        REQUIRE(merged.size() == 1);
        REQUIRE(merged[0].text == "John Smith");
    }

    SECTION("Empty spans are ignored") {
        std::vector<DetectedEntity> extra = {EntityDetector::make_entity(rule, "", 3, 3)};
        REQUIRE(EntityDetector::merge({}, extra).empty());
    }
}
