#include <changeset-cpp/error.hpp>
#include <changeset-cpp/sandbox.hpp>

#include "temp_dir.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace changeset_cpp;
using changeset_test::TempDir;
namespace fs = std::filesystem;

namespace {

auto expect_invalid_path(const fs::path& root, const std::string& relative) -> void {
    try {
        (void)resolve_project_path(root, relative);
        ADD_FAILURE() << "expected invalid_path for '" << relative << "'";
    } catch (const FileEngineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_path) << relative;
        EXPECT_EQ(e.error().path, relative);
    }
}

}  // namespace

// -- to_posix_path ------------------------------------------------------------

TEST(ToPosixPath, converts_backslashes) {
    EXPECT_EQ(to_posix_path("src\\app\\main.cpp"), "src/app/main.cpp");
}

TEST(ToPosixPath, leaves_forward_slashes_alone) {
    EXPECT_EQ(to_posix_path("src/app/main.cpp"), "src/app/main.cpp");
    EXPECT_EQ(to_posix_path(""), "");
}

TEST(ToPosixPath, handles_mixed_separators) {
    EXPECT_EQ(to_posix_path("a\\b/c\\d"), "a/b/c/d");
}

// -- is_within_root -----------------------------------------------------------

TEST(IsWithinRoot, equal_paths) {
    EXPECT_TRUE(is_within_root("/srv/project", "/srv/project"));
}

TEST(IsWithinRoot, nested_paths) {
    EXPECT_TRUE(is_within_root("/srv/project", "/srv/project/a"));
    EXPECT_TRUE(is_within_root("/srv/project", "/srv/project/a/b/c.txt"));
}

TEST(IsWithinRoot, sibling_with_common_prefix_is_outside) {
    EXPECT_FALSE(is_within_root("/srv/project", "/srv/project-evil/x"));
    EXPECT_FALSE(is_within_root("/srv/project", "/srv/projectx"));
}

TEST(IsWithinRoot, parent_is_outside) {
    EXPECT_FALSE(is_within_root("/srv/project", "/srv"));
    EXPECT_FALSE(is_within_root("/srv/project", "/"));
}

TEST(IsWithinRoot, filesystem_root_contains_everything) {
    EXPECT_TRUE(is_within_root("/", "/"));
    EXPECT_TRUE(is_within_root("/", "/etc/passwd"));
}

// -- normalize_root -----------------------------------------------------------

TEST(NormalizeRoot, drops_trailing_separator) {
    EXPECT_EQ(normalize_root("/srv/project/"), fs::path{"/srv/project"});
}

TEST(NormalizeRoot, collapses_dot_segments) {
    EXPECT_EQ(normalize_root("/srv/./project/../project"), fs::path{"/srv/project"});
}

TEST(NormalizeRoot, relative_root_uses_current_directory) {
    const auto expected = (fs::current_path() / "sub").lexically_normal();
    EXPECT_EQ(normalize_root("sub"), expected);
}

TEST(NormalizeRoot, empty_root_is_current_directory) {
    EXPECT_EQ(normalize_root(""), fs::current_path().lexically_normal());
}

TEST(NormalizeRoot, filesystem_root_is_kept) {
    EXPECT_EQ(normalize_root("/"), fs::path{"/"});
}

// -- resolve_project_path: accepted -------------------------------------------

TEST(ResolveProjectPath, simple_file) {
    const auto dir = TempDir{};
    EXPECT_EQ(resolve_project_path(dir.path(), "a.txt"), dir.path() / "a.txt");
}

TEST(ResolveProjectPath, nested_file) {
    const auto dir = TempDir{};
    EXPECT_EQ(resolve_project_path(dir.path(), "src/components/Button.tsx"),
              dir.path() / "src" / "components" / "Button.tsx");
}

TEST(ResolveProjectPath, windows_separators) {
    const auto dir = TempDir{};
    EXPECT_EQ(resolve_project_path(dir.path(), "src\\components\\Button.tsx"),
              dir.path() / "src" / "components" / "Button.tsx");
}

TEST(ResolveProjectPath, dot_dot_that_stays_inside) {
    const auto dir = TempDir{};
    EXPECT_EQ(resolve_project_path(dir.path(), "a/../b.txt"), dir.path() / "b.txt");
    EXPECT_EQ(resolve_project_path(dir.path(), "a/b/../../c/./d.txt"), dir.path() / "c" / "d.txt");
}

TEST(ResolveProjectPath, root_itself_is_accepted) {
    const auto dir = TempDir{};
    EXPECT_EQ(resolve_project_path(dir.path(), ""), dir.path());
    EXPECT_EQ(resolve_project_path(dir.path(), "."), dir.path());
    EXPECT_EQ(resolve_project_path(dir.path(), "a/.."), dir.path());
}

TEST(ResolveProjectPath, names_starting_with_dots_are_files) {
    const auto dir = TempDir{};
    EXPECT_EQ(resolve_project_path(dir.path(), "..file.txt"), dir.path() / "..file.txt");
    EXPECT_EQ(resolve_project_path(dir.path(), "dir/...hidden"), dir.path() / "dir" / "...hidden");
    EXPECT_EQ(resolve_project_path(dir.path(), ".env"), dir.path() / ".env");
}

TEST(ResolveProjectPath, absolute_path_inside_root_is_accepted) {
    const auto dir = TempDir{};
    const auto inside = (dir.path() / "x.txt").string();
    EXPECT_EQ(resolve_project_path(dir.path(), inside), dir.path() / "x.txt");
}

TEST(ResolveProjectPath, trailing_separator_on_root_or_path) {
    const auto dir = TempDir{};
    const auto root_with_slash = fs::path{dir.path().string() + "/"};
    EXPECT_EQ(resolve_project_path(root_with_slash, "a/b/"), dir.path() / "a" / "b");
}

TEST(ResolveProjectPath, does_not_touch_the_filesystem) {
    const auto dir = TempDir{};
    (void)resolve_project_path(dir.path(), "deep/nested/file.txt");
    EXPECT_TRUE(changeset_test::is_empty_dir(dir.path()));
}

TEST(ResolveProjectPath, every_safe_path_is_nested_under_root) {
    const auto dir = TempDir{};
    const auto root = normalize_root(dir.path());
    const auto safe = std::vector<std::string>{
        "a", "a/b", "a\\b\\c", "./a", "a/./b", "a/b/..", "x/../y/../z", "..a", "a..", "a/..b/c",
    };
    for (const auto& p : safe) {
        const auto resolved = resolve_project_path(dir.path(), p);
        EXPECT_TRUE(resolved.is_absolute()) << p;
        EXPECT_TRUE(is_within_root(root, resolved)) << p;
    }
}

// -- resolve_project_path: rejected -------------------------------------------

TEST(ResolveProjectPath, rejects_parent_traversal) {
    const auto dir = TempDir{};
    expect_invalid_path(dir.path(), "../x");
    expect_invalid_path(dir.path(), "../../x");
    expect_invalid_path(dir.path(), "..");
}

TEST(ResolveProjectPath, rejects_traversal_after_descent) {
    const auto dir = TempDir{};
    expect_invalid_path(dir.path(), "a/../../b");
    expect_invalid_path(dir.path(), "a/b/../../../c");
}

TEST(ResolveProjectPath, rejects_windows_style_traversal) {
    const auto dir = TempDir{};
    expect_invalid_path(dir.path(), "..\\outside.txt");
    expect_invalid_path(dir.path(), "a\\..\\..\\b");
}

TEST(ResolveProjectPath, rejects_absolute_path_outside_root) {
    const auto dir = TempDir{};
    expect_invalid_path(dir.path(), "/etc/passwd");
    expect_invalid_path(dir.path(), "\\etc\\passwd");
}

TEST(ResolveProjectPath, rejects_sibling_directory_with_common_prefix) {
    const auto dir = TempDir{};
    const auto sibling = "../" + dir.path().filename().string() + "-evil/x.txt";
    expect_invalid_path(dir.path(), sibling);
}

TEST(ResolveProjectPath, error_message_names_the_path) {
    const auto dir = TempDir{};
    try {
        (void)resolve_project_path(dir.path(), "../outside.txt");
        FAIL() << "expected FileEngineError";
    } catch (const FileEngineError& e) {
        EXPECT_NE(std::string{e.what()}.find("out of project root"), std::string::npos);
        EXPECT_NE(std::string{e.what()}.find("../outside.txt"), std::string::npos);
    }
}
