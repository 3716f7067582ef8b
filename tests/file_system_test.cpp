#include <changeset-cpp/error.hpp>
#include <changeset-cpp/file_system.hpp>

#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <string>
#include <system_error>

using namespace changeset_cpp;
using changeset_test::TempDir;
using changeset_test::read_file;
using changeset_test::write_file;
namespace fs = std::filesystem;

// -- ensure_directory_exists --------------------------------------------------

TEST(EnsureDirectoryExists, creates_all_ancestors) {
    const auto dir = TempDir{};
    ensure_directory_exists(dir / "a/b/c/file.txt");

    EXPECT_TRUE(fs::is_directory(dir / "a/b/c"));
    EXPECT_FALSE(fs::exists(dir / "a/b/c/file.txt"));
}

TEST(EnsureDirectoryExists, existing_directory_is_fine) {
    const auto dir = TempDir{};
    fs::create_directories(dir / "a");
    EXPECT_NO_THROW(ensure_directory_exists(dir / "a/file.txt"));
}

TEST(EnsureDirectoryExists, fails_when_an_ancestor_is_a_file) {
    const auto dir = TempDir{};
    write_file(dir / "blocker", "x");
    try {
        ensure_directory_exists(dir / "blocker/sub/file.txt");
        FAIL() << "expected FileEngineError";
    } catch (const FileEngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::file_system_operation);
        EXPECT_TRUE(e.error().cause);
    }
}

// -- write_file_safe ----------------------------------------------------------

TEST(WriteFileSafe, writes_new_file) {
    const auto dir = TempDir{};
    write_file_safe(dir / "hello.txt", "Hello, World!");
    EXPECT_EQ(read_file(dir / "hello.txt"), "Hello, World!");
}

TEST(WriteFileSafe, creates_parent_directories) {
    const auto dir = TempDir{};
    write_file_safe(dir / "src/components/Button.tsx", "export const Button = () => null;");
    EXPECT_EQ(read_file(dir / "src/components/Button.tsx"), "export const Button = () => null;");
}

TEST(WriteFileSafe, overwrites_and_truncates) {
    const auto dir = TempDir{};
    write_file(dir / "f.txt", "a much longer original body");
    write_file_safe(dir / "f.txt", "short");
    EXPECT_EQ(read_file(dir / "f.txt"), "short");
}

TEST(WriteFileSafe, empty_content_creates_empty_file) {
    const auto dir = TempDir{};
    write_file_safe(dir / "empty.txt", "");
    EXPECT_TRUE(fs::exists(dir / "empty.txt"));
    EXPECT_EQ(fs::file_size(dir / "empty.txt"), 0u);
}

TEST(WriteFileSafe, bytes_are_written_verbatim) {
    const auto dir = TempDir{};
    const auto body = std::string{"line1\r\nline2\n\0tail", 18};
    write_file_safe(dir / "raw.bin", body);
    EXPECT_EQ(read_file(dir / "raw.bin"), body);
}

TEST(WriteFileSafe, utf8_content) {
    const auto dir = TempDir{};
    write_file_safe(dir / "utf8.txt", "héllo wörld ✓");
    EXPECT_EQ(read_file(dir / "utf8.txt"), "héllo wörld ✓");
}

TEST(WriteFileSafe, fails_when_target_is_a_directory) {
    const auto dir = TempDir{};
    fs::create_directories(dir / "taken");
    try {
        write_file_safe(dir / "taken", "x");
        FAIL() << "expected FileEngineError";
    } catch (const FileEngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::file_system_operation);
        EXPECT_EQ(e.error().path, (dir / "taken").string());
        EXPECT_NE(std::string{e.what()}.find("Failed to write file"), std::string::npos);
    }
}

TEST(WriteFileSafe, fails_when_parent_is_a_file) {
    const auto dir = TempDir{};
    write_file(dir / "blocker", "x");
    EXPECT_THROW(write_file_safe(dir / "blocker/child.txt", "y"), FileEngineError);
}

// -- delete_file_safe ---------------------------------------------------------

TEST(DeleteFileSafe, removes_existing_file) {
    const auto dir = TempDir{};
    write_file(dir / "gone.txt", "bye");
    delete_file_safe(dir / "gone.txt");
    EXPECT_FALSE(fs::exists(dir / "gone.txt"));
}

TEST(DeleteFileSafe, missing_file_is_success) {
    const auto dir = TempDir{};
    EXPECT_NO_THROW(delete_file_safe(dir / "never-existed.txt"));
}

TEST(DeleteFileSafe, missing_parent_is_success) {
    const auto dir = TempDir{};
    EXPECT_NO_THROW(delete_file_safe(dir / "no/such/dir/file.txt"));
}

TEST(DeleteFileSafe, parent_that_is_a_file_is_an_error) {
    const auto dir = TempDir{};
    write_file(dir / "f", "regular file");
    try {
        delete_file_safe(dir / "f/g");
        FAIL() << "expected FileEngineError";
    } catch (const FileEngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::file_system_operation);
        EXPECT_EQ(e.error().cause, std::make_error_code(std::errc::not_a_directory));
        EXPECT_NE(std::string{e.what()}.find("Failed to delete file"), std::string::npos);
    }
    EXPECT_EQ(read_file(dir / "f"), "regular file");
}

TEST(DeleteFileSafe, twice_in_a_row_is_success) {
    const auto dir = TempDir{};
    write_file(dir / "f.txt", "x");
    delete_file_safe(dir / "f.txt");
    EXPECT_NO_THROW(delete_file_safe(dir / "f.txt"));
}

TEST(DeleteFileSafe, leaves_parent_directory) {
    const auto dir = TempDir{};
    write_file(dir / "sub/f.txt", "x");
    delete_file_safe(dir / "sub/f.txt");
    EXPECT_TRUE(fs::is_directory(dir / "sub"));
}

TEST(DeleteFileSafe, refuses_directories) {
    const auto dir = TempDir{};
    fs::create_directories(dir / "folder");
    try {
        delete_file_safe(dir / "folder");
        FAIL() << "expected FileEngineError";
    } catch (const FileEngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::file_system_operation);
        EXPECT_EQ(e.error().cause, std::make_error_code(std::errc::is_a_directory));
    }
    EXPECT_TRUE(fs::is_directory(dir / "folder"));
}

TEST(DeleteFileSafe, removes_symlink_not_target) {
    const auto dir = TempDir{};
    write_file(dir / "target.txt", "keep");
    fs::create_symlink(dir / "target.txt", dir / "link.txt");

    delete_file_safe(dir / "link.txt");

    EXPECT_FALSE(fs::exists(fs::symlink_status(dir / "link.txt")));
    EXPECT_EQ(read_file(dir / "target.txt"), "keep");
}
