/// @file file_system.hpp
/// @brief Filesystem primitives used by the engine.
///
/// Every failure is reported as a FileEngineError of kind
/// ErrorKind::file_system_operation carrying the path and the OS error.

#pragma once

#include <filesystem>
#include <string_view>

namespace changeset_cpp {

/// Create every missing ancestor directory of `file_path`.
void ensure_directory_exists(const std::filesystem::path& file_path);

/// Write `content` to `file_path`, replacing any existing file.
///
/// Parent directories are created as needed. Bytes are written exactly
/// as given.
void write_file_safe(const std::filesystem::path& file_path, std::string_view content);

/// Remove the file at `file_path`.
///
/// A missing file is not an error. Directories are never removed.
void delete_file_safe(const std::filesystem::path& file_path);

}  // namespace changeset_cpp
