/// @file sandbox.hpp
/// @brief Path sandbox resolver: maps project-relative paths to absolute
/// paths that are guaranteed to lie inside the project root.

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace changeset_cpp {

/// Replace every backslash with a forward slash.
///
/// Callers may hand us Windows-style paths on any host; resolution
/// always treats '/' as the only separator.
auto to_posix_path(std::string_view path) -> std::string;

/// The absolute, lexically normalized form of a root directory.
///
/// Relative roots are made absolute against the current working
/// directory, and an empty root is the current working directory. A
/// trailing separator is dropped.
auto normalize_root(const std::filesystem::path& root_dir) -> std::filesystem::path;

/// True if `candidate` equals `root` or is nested under it.
///
/// Both arguments must already be absolute and normalized. The test is
/// component-wise: "/a/bc" is not inside "/a/b".
auto is_within_root(const std::filesystem::path& root,
                    const std::filesystem::path& candidate) -> bool;

/// Resolve a project-relative path against a root directory.
///
/// The path is joined onto the root and collapsed ("." and ".." removed)
/// without touching the filesystem. Absolute inputs replace the root, so
/// they only pass when they already point inside it.
///
/// @param root_dir The sandbox root.
/// @param relative_path Project-relative path, '/' or '\\' separated.
/// @return The absolute path of the target.
/// @throws FileEngineError with ErrorKind::invalid_path if the result
///   would lie outside `root_dir`.
auto resolve_project_path(const std::filesystem::path& root_dir,
                          std::string_view relative_path) -> std::filesystem::path;

}  // namespace changeset_cpp
