/// @file loader.hpp
/// @brief Loading task files and change lists from JSON or YAML files.
///
/// The format is chosen by extension: `.json` is read with nlohmann/json,
/// `.yaml` and `.yml` with yaml-cpp and converted to the same JSON model.

#pragma once

#include <changeset-cpp/change.hpp>
#include <changeset-cpp/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace changeset_cpp {

/// A task description handed to the upstream planner.
struct TaskFile {
    std::string id;                          ///< Required, non-empty.
    std::string objective;                   ///< Required, non-empty.
    std::vector<std::string> context_files;  ///< Required ("contextFiles").
    std::optional<std::string> model;
    std::optional<std::int64_t> max_tokens;  ///< "maxTokens"
    std::optional<double> temperature;
    nlohmann::json extra = nlohmann::json::object();  ///< Every other field.
};

/// A task together with the absolute path it was read from.
struct LoadedTask {
    TaskFile task;
    std::filesystem::path file_path;
};

/// Validate and decode a task document.
/// @throws FileEngineError with ErrorKind::invalid_task.
auto parse_task(const nlohmann::json& j) -> TaskFile;

/// Read a task file.
/// @throws FileEngineError with ErrorKind::invalid_task if the file is
///   missing, unreadable, of an unsupported format, malformed, or lacks a
///   required field.
auto load_task(const std::filesystem::path& path) -> LoadedTask;

/// Read an agent result (or bare change array) from a file.
/// @throws FileEngineError with ErrorKind::invalid_change.
auto load_changes(const std::filesystem::path& path) -> std::vector<FileChange>;

/// Parse YAML text into the JSON model.
///
/// Plain scalars become booleans, nulls and numbers where they spell
/// one; quoted scalars always stay strings.
/// @throws FileEngineError of the given kind on a YAML syntax error.
auto parse_yaml_document(std::string_view yaml_text,
                         ErrorKind error_kind = ErrorKind::invalid_change) -> nlohmann::json;

}  // namespace changeset_cpp
