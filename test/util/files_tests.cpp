#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/time.hpp"
#include <filesystem>
#include <sys/stat.h>

using namespace whisperlink::util;

TEST_CASE("File utilities", "[util][files]") {
    auto test_dir = std::filesystem::temp_directory_path() / "whisperlink_files_test";
    std::filesystem::remove_all(test_dir);

    SECTION("ensure_directory creates nested directories") {
        auto subdir = test_dir / "sub" / "nested";
        REQUIRE(ensure_directory(subdir));
        REQUIRE(std::filesystem::is_directory(subdir));
        REQUIRE(ensure_directory(subdir)); // already there
    }

    SECTION("atomic_write_file then read_file_string") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "data.json";
        REQUIRE(atomic_write_file(file_path, std::string("{\"a\":1}")));
        auto read = read_file_string(file_path);
        REQUIRE(read.has_value());
        REQUIRE(*read == "{\"a\":1}");
        REQUIRE_FALSE(std::filesystem::exists(test_dir / "data.json.tmp"));
    }

    SECTION("atomic_write_file overwrites and honors mode") {
        REQUIRE(ensure_directory(test_dir));
        auto file_path = test_dir / "secret.json";
        REQUIRE(atomic_write_file(file_path, std::string("old"), 0600));
        REQUIRE(atomic_write_file(file_path, std::string("new"), 0600));
        REQUIRE(*read_file_string(file_path) == "new");

        struct stat st {};
        REQUIRE(::stat(file_path.c_str(), &st) == 0);
        REQUIRE((st.st_mode & 0777) == 0600);
    }

    SECTION("read_file_string on a missing file") {
        REQUIRE_FALSE(read_file_string(test_dir / "missing").has_value());
    }

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("DirectoryLock excludes a second holder", "[util][files][lock]") {
    auto test_dir = std::filesystem::temp_directory_path() / "whisperlink_lock_test";
    std::filesystem::remove_all(test_dir);
    REQUIRE(ensure_directory(test_dir));

    DirectoryLock first;
    REQUIRE(first.Acquire(test_dir) == LockResult::SUCCESS);
    REQUIRE(first.held());
    REQUIRE(first.Acquire(test_dir) == LockResult::SUCCESS); // re-entrant on the same object

    DirectoryLock second;
    REQUIRE(second.Acquire(test_dir) == LockResult::ERROR_LOCK);
    REQUIRE_FALSE(second.held());
    REQUIRE_FALSE(second.reason().empty());

    first.Release();
    REQUIRE_FALSE(first.held());
    REQUIRE(second.Acquire(test_dir) == LockResult::SUCCESS);
    second.Release();

    DirectoryLock missing;
    REQUIRE(missing.Acquire(test_dir / "does" / "not" / "exist") == LockResult::ERROR_WRITE);

    std::filesystem::remove_all(test_dir);
}

TEST_CASE("Mockable time", "[util][time]") {
    {
        MockTimeScope mock(1729857600);
        REQUIRE(GetTime() == 1729857600);
        REQUIRE(GetTimeISO8601() == "2024-10-25T12:00:00Z");
        REQUIRE(FormatISO8601(0) == "1970-01-01T00:00:00Z");
    }
    REQUIRE(GetMockTime() == 0);
    REQUIRE(GetTime() > 1729857600);
}
