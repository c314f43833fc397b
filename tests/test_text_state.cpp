#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "pdf/text_state.hpp"

using namespace docredact;
using namespace docredact::pdf;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<ShownText> shown(const std::string& content, const Matrix& base = Matrix::identity()) {
    auto ops = tokenize(content);
    REQUIRE(ops.is_ok());
    static const FontTable empty;
    return ContentInterpreter(empty, 0.6).collect(ops.value(), base);
}

} // anonymous namespace

TEST_CASE("Text state machine", "[pdf][text_state]") {

    SECTION("Tj bounds from Td, font size and fallback widths") {
        const auto out = shown("BT /F1 10 Tf 100 200 Td (abcd) Tj ET");
        REQUIRE(out.size() == 1);
        const auto& t = out[0];
        REQUIRE(t.text == "abcd");
        // 4 glyphs * 0.6 * 10
        REQUIRE_THAT(t.advance, WithinAbs(24, 1e-9));
        REQUIRE_THAT(t.bounds.x1, WithinAbs(100, 1e-9));
        REQUIRE_THAT(t.bounds.x2, WithinAbs(124, 1e-9));
        REQUIRE_THAT(t.bounds.y1, WithinAbs(198, 1e-9));
        REQUIRE_THAT(t.bounds.y2, WithinAbs(210, 1e-9));
        REQUIRE_THAT(t.start_x, WithinAbs(100, 1e-9));
        REQUIRE_THAT(t.end_x, WithinAbs(124, 1e-9));
        REQUIRE_THAT(t.font_size, WithinAbs(10, 1e-9));
    }

    SECTION("Consecutive Tj operations advance the text matrix") {
        const auto out = shown("BT /F1 10 Tf 0 0 Td (ab) Tj (cd) Tj ET");
        REQUIRE(out.size() == 2);
        REQUIRE_THAT(out[1].bounds.x1, WithinAbs(12, 1e-9));
    }

    SECTION("Leading and T* move down a line") {
        const auto out = shown("BT /F1 10 Tf 14 TL 50 500 Td (one) Tj T* (two) Tj ET");
        REQUIRE(out.size() == 2);
        REQUIRE_THAT(out[1].start_x, WithinAbs(50, 1e-9));
        REQUIRE_THAT(out[1].start_y, WithinAbs(486, 1e-9));
    }

    SECTION("TD sets leading for the quote operator") {
        const auto out = shown("BT /F1 10 Tf 0 100 Td 0 -20 TD (a) Tj (b) ' ET");
        REQUIRE(out.size() == 2);
        REQUIRE_THAT(out[1].start_y, WithinAbs(60, 1e-9));
    }

    SECTION("CTM scaling applies to bounds and size") {
        const auto out = shown("q 2 0 0 2 0 0 cm BT /F1 10 Tf 10 10 Td (ab) Tj ET Q");
        REQUIRE(out.size() == 1);
        REQUIRE_THAT(out[0].bounds.x1, WithinAbs(20, 1e-9));
        REQUIRE_THAT(out[0].bounds.x2, WithinAbs(44, 1e-9));
        REQUIRE_THAT(out[0].font_size, WithinAbs(20, 1e-9));
    }

    SECTION("q/Q restores the CTM") {
        const auto out = shown("q 1 0 0 1 300 0 cm Q BT /F1 10 Tf 0 0 Td (a) Tj ET");
        REQUIRE_THAT(out[0].bounds.x1, WithinAbs(0, 1e-9));
    }

    SECTION("Base matrix places form content on the page") {
        const auto out = shown("BT /F1 10 Tf 0 0 Td (a) Tj ET", Matrix::translate(100, 100));
        REQUIRE_THAT(out[0].bounds.x1, WithinAbs(100, 1e-9));
    }

    SECTION("TJ numbers shift glyphs and large gaps read as spaces") {
        const auto out = shown("BT /F1 10 Tf 0 0 Td [(ab) -1000 (cd)] TJ ET");
        REQUIRE(out.size() == 1);
        REQUIRE(out[0].text == "ab cd");
        // 4 glyphs * 6 + 1000/1000 * 10
        REQUIRE_THAT(out[0].advance, WithinAbs(34, 1e-9));
    }

    SECTION("Char and word spacing widen the advance") {
        const auto out = shown("BT /F1 10 Tf 1 Tc 5 Tw 0 0 Td (a b) Tj ET");
        // 3 glyphs * 6 + 3 * 1 + 5 for the space
        REQUIRE_THAT(out[0].advance, WithinAbs(26, 1e-9));
    }

    SECTION("Horizontal scaling") {
        const auto out = shown("BT /F1 10 Tf 50 Tz 0 0 Td (ab) Tj ET");
        REQUIRE_THAT(out[0].advance, WithinAbs(6, 1e-9));
    }

    SECTION("Rise lifts the box") {
        const auto out = shown("BT /F1 10 Tf 5 Ts 0 0 Td (a) Tj ET");
        REQUIRE_THAT(out[0].bounds.y1, WithinAbs(3, 1e-9));
        REQUIRE_THAT(out[0].bounds.y2, WithinAbs(15, 1e-9));
    }

    SECTION("tj_adjustment reproduces the advance with no glyphs") {
        const auto out = shown("BT /F1 10 Tf 0 0 Td (abc) Tj ET");
        // advance 18 at size 10: -1800 thousandths
        REQUIRE_THAT(out[0].tj_adjustment, WithinAbs(-1800, 1e-9));
    }

    SECTION("Do reports the XObject name with the current CTM") {
        auto ops = tokenize("q 1 0 0 1 50 60 cm /Fm0 Do Q");
        REQUIRE(ops.is_ok());
        const FontTable fonts;
        std::string name;
        Matrix ctm;
        ContentInterpreter(fonts, 0.6).run(ops.value(), Matrix::identity(),
            [](const ShownText&) {},
            [&](const std::string& n, const Matrix& m) { name = n; ctm = m; });
        REQUIRE(name == "/Fm0");
        REQUIRE(ctm.e == 50.0);
        REQUIRE(ctm.f == 60.0);
    }
}
