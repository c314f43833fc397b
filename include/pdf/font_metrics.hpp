#pragma once

#include <qpdf/QPDFObjectHandle.hh>

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace docredact::pdf {

/**
 * @brief Glyph widths and text decoding for one PDF font
 *
 * Widths come from /Widths + /FirstChar (simple fonts) or /DW + /W of the
 * descendant font (Type0, two-byte codes). Codes without a known width use
 * the fallback width (width factor x 1000 glyph units). Text is decoded
 * through /ToUnicode when present, else byte-to-Latin-1.
 */
class FontMetrics {
public:
    FontMetrics() = default;

    /// Metrics with no font data: every glyph is fallback_factor em wide
    explicit FontMetrics(double fallback_factor);

    [[nodiscard]] static FontMetrics from_dictionary(QPDFObjectHandle font, double fallback_factor);

    [[nodiscard]] bool two_byte() const { return two_byte_; }
    [[nodiscard]] bool has_widths() const { return !widths_.empty(); }
    [[nodiscard]] bool has_unicode_map() const { return !to_unicode_.empty(); }

    /// Split a string operand into character codes
    [[nodiscard]] std::vector<uint32_t> codes(const std::string& bytes) const;

    /// Width in glyph space (1/1000 em)
    [[nodiscard]] double glyph_width(uint32_t code) const;

    /// UTF-8 text for one character code
    [[nodiscard]] std::string decode_code(uint32_t code) const;

    /// UTF-8 text for a whole string operand
    [[nodiscard]] std::string decode(const std::string& bytes) const;

    /**
     * @brief Parse bfchar/bfrange sections of a ToUnicode CMap
     */
    [[nodiscard]] static std::unordered_map<uint32_t, std::string> parse_to_unicode(const std::string& cmap);

private:
    void load_simple_widths(QPDFObjectHandle font);
    void load_cid_widths(QPDFObjectHandle descendant);

    bool two_byte_ = false;
    double fallback_width_ = 600.0;
    double default_width_ = -1.0;   // /DW for CID fonts; < 0 means use fallback
    std::unordered_map<uint32_t, double> widths_;
    std::unordered_map<uint32_t, std::string> to_unicode_;
};

/// Fonts of one resource dictionary, keyed by resource name ("/F1")
using FontTable = std::map<std::string, FontMetrics>;

/**
 * @brief Build the font table for a /Resources dictionary
 */
[[nodiscard]] FontTable load_fonts(QPDFObjectHandle resources, double fallback_factor);

} // namespace docredact::pdf
