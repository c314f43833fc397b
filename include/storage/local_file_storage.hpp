#pragma once

#include "storage/istorage.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace docredact {

/**
 * @brief IStorage over a root directory
 *
 * Paths are relative to the root (a leading "file://" is accepted); paths
 * that resolve outside the root are rejected. store() creates missing
 * parent directories and returns a file:// URL.
 */
class LocalFileStorage : public IStorage {
public:
    explicit LocalFileStorage(std::filesystem::path root);

    [[nodiscard]] Result<std::string> fetch(const std::string& path) override;
    [[nodiscard]] Result<std::string> store(const std::string& path, std::string_view bytes) override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    /// Absolute path for @p path, or nullopt when it escapes the root
    [[nodiscard]] std::optional<std::filesystem::path> resolve(const std::string& path) const;

private:
    std::filesystem::path root_;
};

} // namespace docredact
