#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace docredact {

// ============================================================================
// Config Sections (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct RedactionConfig {
    Padding padding;
    double strict_padding_factor = 2.0;
    int max_attempts = 2;
    size_t min_verification_length = 3;
    double default_fragment_width = 6.0;     // per character
    double default_fragment_height = 14.0;
    size_t parallel_threshold = 4;
    uint32_t deadline_ms = 0;                // 0 = no deadline
};

struct PdfConfig {
    double width_factor = 0.6;               // glyph width / font size without metrics
    bool strip_annotations = true;
    bool ensure_accessibility = true;
};

struct DocxConfig {
    bool strip_macros = true;
    bool neutralize_external_links = true;
};

struct SuggestionConfig {
    bool enabled = false;
    std::string provider = "anthropic";
    std::string endpoint;
    std::string api_key;
    std::string model;
    uint32_t timeout_ms = 30000;
    uint32_t max_retries = 1;
};

struct StorageConfig {
    std::string root = ".";
};

struct EngineConfig {
    LoggingConfig logging;
    RedactionConfig redaction;
    PdfConfig pdf;
    DocxConfig docx;
    SuggestionConfig suggestions;
    StorageConfig storage;
};

/**
 * @brief Engine configuration loader (TOML)
 *
 * String values may reference environment variables as ${VAR_NAME}.
 * Every section is optional; missing keys keep the struct defaults.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        EngineConfig config;

        static LoadResult ok(EngineConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    static LoadResult load_from_file(const std::string& config_path);
    static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Range checks across all sections
     * @return One message per violation (empty when valid)
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const EngineConfig& config);

private:
    static LoadResult validate_and_return(EngineConfig config);
};

} // namespace docredact
