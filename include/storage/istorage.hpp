#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

namespace docredact {

/**
 * @brief Abstract document store
 *
 * Enables pluggable storage backends: local filesystem (LocalFileStorage),
 * object stores, or in-memory for testing.
 */
class IStorage {
public:
    virtual ~IStorage() = default;

    /// Raw bytes of the object at @p path
    [[nodiscard]] virtual Result<std::string> fetch(const std::string& path) = 0;

    /// Write @p bytes to @p path, returning the stored object's URL
    [[nodiscard]] virtual Result<std::string> store(const std::string& path, std::string_view bytes) = 0;
};

} // namespace docredact
