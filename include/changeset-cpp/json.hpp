/// @file json.hpp
/// @brief nlohmann/json interoperability for changeset-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the change and
/// result types, and decoding of agent results into change lists.
///
/// Wire format of a change:
/// @code{.json}
/// {"path": "src/x.ts", "action": "create", "content": "body", "reason": "..."}
/// @endcode
/// and of a summary:
/// @code{.json}
/// {"operations": [{"change": {...}, "status": "created", "message": "..."}],
///  "dryRun": true,
///  "counts": {"created": 1, "updated": 0, "deleted": 0, "skipped": 0}}
/// @endcode

#pragma once

#include <changeset-cpp/change.hpp>
#include <changeset-cpp/error.hpp>
#include <changeset-cpp/result.hpp>

#include <nlohmann/json.hpp>

#include <string_view>
#include <vector>

namespace changeset_cpp {

// -- Enumerations -------------------------------------------------------------

void to_json(nlohmann::json& j, FileAction action);
void from_json(const nlohmann::json& j, FileAction& action);

void to_json(nlohmann::json& j, FileStatus status);
void from_json(const nlohmann::json& j, FileStatus& status);

void to_json(nlohmann::json& j, ErrorKind kind);

// -- Changes and results ------------------------------------------------------

/// Fields other than path/action/content are restored from metadata.
void to_json(nlohmann::json& j, const FileChange& change);

/// A non-string "content" leaves the change without content and is kept
/// in metadata.
/// @throws FileEngineError with ErrorKind::invalid_change if the object
///   has no string "path" or "action".
void from_json(const nlohmann::json& j, FileChange& change);

void to_json(nlohmann::json& j, const FileOperationResult& result);
void from_json(const nlohmann::json& j, FileOperationResult& result);

void to_json(nlohmann::json& j, const StatusCounts& counts);
void from_json(const nlohmann::json& j, StatusCounts& counts);

void to_json(nlohmann::json& j, const ApplySummary& summary);
void from_json(const nlohmann::json& j, ApplySummary& summary);

void to_json(nlohmann::json& j, const Error& error);

// -- Change lists -------------------------------------------------------------

/// Decode the changes of an agent result.
///
/// Accepts either `{"files": [...]}` or a bare array of changes.
/// @throws FileEngineError with ErrorKind::invalid_change.
auto parse_changes(const nlohmann::json& j) -> std::vector<FileChange>;

/// Parse JSON text and decode its changes.
/// @throws FileEngineError with ErrorKind::invalid_change.
auto import_changes(std::string_view json_text) -> std::vector<FileChange>;

}  // namespace changeset_cpp
