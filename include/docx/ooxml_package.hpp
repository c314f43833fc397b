#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace docredact::docx {

// Part names used across the engine
inline constexpr std::string_view kContentTypesPart = "[Content_Types].xml";
inline constexpr std::string_view kDocumentPart = "word/document.xml";
inline constexpr std::string_view kDocumentRelsPart = "word/_rels/document.xml.rels";
inline constexpr std::string_view kCorePropsPart = "docProps/core.xml";
inline constexpr std::string_view kAppPropsPart = "docProps/app.xml";
inline constexpr std::string_view kCustomPropsPart = "docProps/custom.xml";

/**
 * @brief An OOXML (ZIP) package held entirely in memory
 *
 * Entries keep their archive order so a rewritten package lists
 * [Content_Types].xml where the original did. Directory entries are
 * dropped; names are normalized to forward slashes.
 */
class OoxmlPackage {
public:
    struct Entry {
        std::string name;
        std::string data;
    };

    // Entries larger than this are rejected on open
    static constexpr int64_t kMaxEntrySize = 256LL * 1024 * 1024;

    OoxmlPackage() = default;

    /**
     * @brief Read every entry of a ZIP archive
     * @return PARSE_ERROR when the archive cannot be read or an entry is
     *         unsafe (absolute path, "..") or oversized
     */
    [[nodiscard]] static Result<OoxmlPackage> open(std::string_view bytes);

    /**
     * @brief Write the package as a deflate-compressed ZIP archive
     */
    [[nodiscard]] Result<std::string> to_bytes() const;

    [[nodiscard]] bool contains(std::string_view name) const;

    /// Entry data or nullptr
    [[nodiscard]] const std::string* find(std::string_view name) const;

    /// Insert or replace an entry; new entries are appended
    void put(std::string_view name, std::string data);

    /// @return true if an entry was removed
    bool remove(std::string_view name);

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<Entry> entries_;
};

/// Rejects absolute paths, drive letters and ".." segments
[[nodiscard]] bool is_safe_entry_name(std::string_view name);

/// True for body, header*, footer*, footnotes, endnotes and comments parts
[[nodiscard]] bool is_wordprocessing_part(std::string_view name);

/// True for customXml/item*.xml (not the itemProps parts)
[[nodiscard]] bool is_custom_xml_part(std::string_view name);

/// Every entry ending in .xml or .rels
[[nodiscard]] bool is_xml_part(std::string_view name);

/// Word parts in archive order, document.xml first
[[nodiscard]] std::vector<std::string> wordprocessing_parts(const OoxmlPackage& package);

} // namespace docredact::docx
