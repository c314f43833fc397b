#include <catch2/catch_test_macros.hpp>
#include "docx/run_map.hpp"

using namespace docredact::docx;

namespace {

const char* kXml =
    R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body>)"
    R"(<w:p><w:r><w:t>Call </w:t></w:r><w:r><w:rPr><w:b/></w:rPr><w:t>555-12</w:t></w:r><w:r><w:t>34</w:t></w:r></w:p>)"
    R"(<w:p><w:r><w:delText>old</w:delText></w:r><w:r><w:instrText> HYPERLINK </w:instrText></w:r></w:p>)"
    R"(<w:p><w:sdt><w:sdtPr><w:tag w:val="Redacted"/></w:sdtPr><w:sdtContent><w:r><w:t>[REDACTED]</w:t></w:r></w:sdtContent></w:sdt></w:p>)"
    R"(</w:body></w:document>)";

} // anonymous namespace

TEST_CASE("Run map", "[docx][run_map]") {

    tinyxml2::XMLDocument dom(true, tinyxml2::PRESERVE_WHITESPACE);
    REQUIRE(dom.Parse(kXml) == tinyxml2::XML_SUCCESS);
    auto* root = dom.RootElement();

    SECTION("Text leaves with paragraph separators; markers are skipped") {
        const auto map = build_run_map(root);
        REQUIRE(map.text == "Call 555-1234");
        REQUIRE(map.segments.size() == 3);
        REQUIRE(map.segments[1].start == 5);
        REQUIRE(map.segments[1].end == 11);
        REQUIRE(map.segments[2].paragraph == 0);
    }

    SECTION("Deleted and instruction leaves have their own maps") {
        const auto deleted = build_run_map(root, LeafKind::DELETED);
        REQUIRE(deleted.text == "old");
        REQUIRE(deleted.segments.size() == 1);
        REQUIRE(deleted.segments[0].paragraph == 1);

        const auto instructions = build_run_map(root, LeafKind::INSTRUCTION);
        REQUIRE(instructions.text == " HYPERLINK ");
    }

    SECTION("A tracked deletion does not split accepted text") {
        const char* xml =
            R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main"><w:body><w:p>)"
            R"(<w:r><w:t>555-</w:t></w:r><w:del><w:r><w:delText>X</w:delText></w:r></w:del><w:r><w:t>1234</w:t></w:r>)"
            R"(</w:p></w:body></w:document>)";
        tinyxml2::XMLDocument tracked(true, tinyxml2::PRESERVE_WHITESPACE);
        REQUIRE(tracked.Parse(xml) == tinyxml2::XML_SUCCESS);

        const auto map = build_run_map(tracked.RootElement());
        REQUIRE(map.text == "555-1234");
        REQUIRE(find_text(map, "555-1234").has_value());
    }

    SECTION("Text spanning runs resolves to every run involved") {
        const auto map = build_run_map(root);
        const auto match = find_text(map, "555-1234");
        REQUIRE(match.has_value());
        REQUIRE(match->first == 5);
        REQUIRE(match->second == 13);

        const auto runs = find_runs_with_text(map, match->first, match->second);
        REQUIRE(runs.size() == 2);
        REQUIRE(run_text(runs[0].run) == "555-12");
        REQUIRE(run_text(runs[1].run) == "34");
    }

    SECTION("Search is case-insensitive and honours the start offset") {
        const auto map = build_run_map(root);
        REQUIRE(find_text(map, "CALL").has_value());
        REQUIRE_FALSE(find_text(map, "call", 1).has_value());
        REQUIRE_FALSE(find_text(map, "absent").has_value());
    }

    SECTION("Marker detection") {
        const auto texts = elements_named(root, kText);
        REQUIRE(texts.size() == 4);
        REQUIRE_FALSE(inside_redaction_marker(texts[0]));
        REQUIRE(inside_redaction_marker(texts[3]));
        REQUIRE(nearest_ancestor(texts[0], kParagraph) != nullptr);
    }

    SECTION("Leaf text edits mark edge spaces") {
        auto* leaf = elements_named(root, kText).front();
        set_leaf_text(leaf, " padded ");
        REQUIRE(leaf_text(leaf) == " padded ");
        REQUIRE(leaf->Attribute("xml:space") != nullptr);
        REQUIRE(print_xml(dom).find("> padded </w:t>") != std::string::npos);
    }
}
