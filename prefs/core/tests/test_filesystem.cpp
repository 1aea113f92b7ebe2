#include <catch2/catch_test_macros.hpp>
#include <prefs/core/filesystem.hpp>
#include <filesystem>

using namespace prefs::core;
namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / "prefs_core_fs_test";
        fs::remove_all(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("FileSystem text helpers", "[core][filesystem]") {
    TempDir dir;

    SECTION("Missing file reads as nullopt") {
        REQUIRE_FALSE(FileSystem::read_text((dir.path / "missing.json").string()).has_value());
        REQUIRE_FALSE(FileSystem::exists((dir.path / "missing.json").string()));
    }

    SECTION("Atomic write creates directories and replaces content") {
        std::string target = (dir.path / "nested" / "file.json").string();
        std::string error;

        REQUIRE(FileSystem::write_text_atomic(target, "first", error));
        REQUIRE(FileSystem::read_text(target).value() == "first");

        REQUIRE(FileSystem::write_text_atomic(target, "second", error));
        REQUIRE(FileSystem::read_text(target).value() == "second");
        REQUIRE_FALSE(FileSystem::exists(target + ".tmp"));
    }

    SECTION("Atomic write into a file path used as directory fails") {
        fs::create_directories(dir.path);
        std::string blocker = (dir.path / "blocker").string();
        REQUIRE(FileSystem::write_text(blocker, "x"));

        std::string error;
        REQUIRE_FALSE(FileSystem::write_text_atomic(blocker + "/child.json", "data", error));
        REQUIRE_FALSE(error.empty());
    }
}
