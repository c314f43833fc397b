#include "storage/local_file_storage.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace docredact {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kFileScheme = "file://";

} // anonymous namespace

LocalFileStorage::LocalFileStorage(fs::path root)
    : root_(fs::weakly_canonical(fs::absolute(std::move(root)))) {}

std::optional<fs::path> LocalFileStorage::resolve(const std::string& path) const {
    std::string_view view = path;
    if (view.starts_with(kFileScheme)) view.remove_prefix(kFileScheme.size());
    if (view.empty()) return std::nullopt;

    fs::path candidate(view);
    if (candidate.is_relative()) candidate = root_ / candidate;
    candidate = fs::weakly_canonical(candidate);

    // Component-wise prefix check so "/data2" is not inside "/data"
    auto r = root_.begin();
    auto c = candidate.begin();
    for (; r != root_.end(); ++r, ++c) {
        if (r->empty()) continue;
        if (c == candidate.end() || *r != *c) return std::nullopt;
    }
    return candidate;
}

Result<std::string> LocalFileStorage::fetch(const std::string& path) {
    const auto resolved = resolve(path);
    if (!resolved) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Path outside storage root: {}", path));
    }

    std::ifstream file(*resolved, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open {}", resolved->string()));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Read failed for {}", resolved->string()));
    }

    utils::log::debug(std::format("Fetched {}", resolved->string()));
    return Result<std::string>::ok(buffer.str());
}

Result<std::string> LocalFileStorage::store(const std::string& path, std::string_view bytes) {
    const auto resolved = resolve(path);
    if (!resolved) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Path outside storage root: {}", path));
    }

    std::error_code ec;
    if (resolved->has_parent_path()) {
        fs::create_directories(resolved->parent_path(), ec);
        if (ec) {
            return Result<std::string>::error(ErrorCategory::IO_ERROR,
                std::format("Cannot create {}: {}", resolved->parent_path().string(), ec.message()));
        }
    }

    std::ofstream file(*resolved, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot write {}", resolved->string()));
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Write failed for {}", resolved->string()));
    }

    utils::log::debug(std::format("Stored {} bytes at {}", bytes.size(), resolved->string()));
    return Result<std::string>::ok(std::format("{}{}", kFileScheme, resolved->string()));
}

} // namespace docredact
