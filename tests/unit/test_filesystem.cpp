// Rotor Filesystem Helper Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <filesystem>

#include "../../src/core/filesystem.hpp"
#include "test_helpers.hpp"

using namespace rotor::core;
using rotor::testing::TempDir;

namespace fs = std::filesystem;

TEST_CASE("find_executable resolves names on PATH", "[core][filesystem]") {
    auto sh = find_executable("sh");
    REQUIRE(sh.has_value());
    REQUIRE(fs::path(*sh).is_absolute());

    REQUIRE_FALSE(find_executable("rotor-no-such-program").has_value());
    REQUIRE_FALSE(find_executable("").has_value());
}

TEST_CASE("find_executable checks paths directly", "[core][filesystem]") {
    TempDir dir;
    auto script = rotor::testing::write_script(dir.path(), "fake-tor", "exit 0");

    auto found = find_executable(script);
    REQUIRE(found.has_value());
    REQUIRE(*found == script);

    SECTION("non-executable file is rejected") {
        fs::permissions(script, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace);
        REQUIRE_FALSE(find_executable(script).has_value());
    }

    SECTION("directory is rejected") {
        REQUIRE_FALSE(find_executable(dir.path().string()).has_value());
    }
}

TEST_CASE("Work directories are created and removed", "[core][filesystem]") {
    TempDir root;
    auto dir = root / "nested/tor-30000";

    REQUIRE_FALSE(make_work_dir(dir, fs::perms::owner_all));
    REQUIRE(fs::is_directory(dir));
    REQUIRE((fs::status(dir).permissions() & fs::perms::all) == fs::perms::owner_all);

    rotor::testing::write_script(dir, "tor.pid", "");
    REQUIRE_FALSE(remove_work_dir(dir));
    REQUIRE_FALSE(fs::exists(dir));

    // Removing again is not an error
    REQUIRE_FALSE(remove_work_dir(dir));
}

TEST_CASE("Existing work directory keeps its permissions", "[core][filesystem]") {
    TempDir root;
    auto dir = root / "shared";
    fs::create_directories(dir);
    constexpr auto original = fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec;
    fs::permissions(dir, original, fs::perm_options::replace);

    REQUIRE_FALSE(make_work_dir(dir, fs::perms::owner_all));
    REQUIRE((fs::status(dir).permissions() & fs::perms::all) == original);
}

TEST_CASE("write_file_atomic replaces content", "[core][filesystem]") {
    TempDir dir;
    auto path = dir / "haproxy.cfg";

    REQUIRE_FALSE(write_file_atomic(path, "first\n"));
    REQUIRE(rotor::testing::read_file(path) == "first\n");

    REQUIRE_FALSE(write_file_atomic(path, "second version\n"));
    REQUIRE(rotor::testing::read_file(path) == "second version\n");

    SECTION("no temporary files are left behind") {
        size_t entries = 0;
        for ([[maybe_unused]] const auto& entry : fs::directory_iterator(dir.path())) {
            ++entries;
        }
        REQUIRE(entries == 1);
    }

    SECTION("file is world readable") {
        auto perms = fs::status(path).permissions();
        REQUIRE((perms & fs::perms::others_read) != fs::perms::none);
    }
}

TEST_CASE("write_file_atomic into missing directory fails", "[core][filesystem]") {
    auto ec = write_file_atomic("/nonexistent-rotor-dir/haproxy.cfg", "content");
    REQUIRE(ec);
}
