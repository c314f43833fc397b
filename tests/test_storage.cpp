#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"
#include "storage/local_file_storage.hpp"

#include <filesystem>

using namespace docredact;
namespace fs = std::filesystem;

namespace {

fs::path fresh_dir() {
    const auto dir = fs::temp_directory_path() / ("docredact_test_" + utils::generate_uuid());
    fs::create_directories(dir);
    return dir;
}

} // anonymous namespace

TEST_CASE("LocalFileStorage", "[storage]") {

    const auto dir = fresh_dir();
    LocalFileStorage storage(dir);

    SECTION("Store creates directories and returns a file URL") {
        const auto url = storage.store("out/nested/a.bin", std::string("a\0b", 3));
        REQUIRE(url.is_ok());
        REQUIRE(url.value().starts_with("file://"));
        REQUIRE(fs::exists(dir / "out/nested/a.bin"));

        const auto bytes = storage.fetch("out/nested/a.bin");
        REQUIRE(bytes.is_ok());
        REQUIRE(bytes.value() == std::string("a\0b", 3));
    }

    SECTION("file:// URLs resolve like paths") {
        REQUIRE(storage.store("doc.txt", "hello").is_ok());
        const auto bytes = storage.fetch("file://" + (storage.root() / "doc.txt").string());
        REQUIRE(bytes.is_ok());
        REQUIRE(bytes.value() == "hello");
    }

    SECTION("Paths escaping the root are rejected") {
        REQUIRE_FALSE(storage.resolve("../outside.txt").has_value());
        REQUIRE_FALSE(storage.resolve("/etc/passwd").has_value());
        REQUIRE_FALSE(storage.resolve("").has_value());

        const auto sibling = storage.root().string() + "2/x";
        REQUIRE_FALSE(storage.resolve(sibling).has_value());

        const auto stored = storage.store("../escape.txt", "x");
        REQUIRE(stored.is_error());
        REQUIRE(stored.error_category() == ErrorCategory::IO_ERROR);
    }

    SECTION("Missing object is an IO error") {
        const auto bytes = storage.fetch("missing.pdf");
        REQUIRE(bytes.is_error());
        REQUIRE(bytes.error_category() == ErrorCategory::IO_ERROR);
    }

    fs::remove_all(dir);
}
