/// @file change.hpp
/// @brief FileChange: a single declarative instruction against one path.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace changeset_cpp {

/// The requested operation of a FileChange.
enum class FileAction : std::uint8_t {
    create,   ///< Write a new file.
    update,   ///< Overwrite an existing file.
    remove,   ///< Delete the file (wire name "delete").
    noop,     ///< Leave the file alone.
    unknown,  ///< Any action name the engine does not recognize.
};

/// Convert a FileAction to its wire name.
constexpr auto to_string_view(FileAction action) noexcept -> std::string_view {
    switch (action) {
        case FileAction::create:  return "create";
        case FileAction::update:  return "update";
        case FileAction::remove:  return "delete";
        case FileAction::noop:    return "noop";
        case FileAction::unknown: return "unknown";
    }
    return "unknown";
}

/// Parse a wire name. Anything unrecognized maps to FileAction::unknown.
constexpr auto parse_action(std::string_view name) noexcept -> FileAction {
    if (name == "create") return FileAction::create;
    if (name == "update") return FileAction::update;
    if (name == "delete") return FileAction::remove;
    if (name == "noop") return FileAction::noop;
    return FileAction::unknown;
}

/// Fields of a change that the engine does not interpret.
///
/// Keys are field names, values are the field's serialized JSON text.
/// They are carried through to the output record untouched.
using Metadata = std::map<std::string, std::string>;

/// A single requested change to one project-relative path.
///
/// Produced by an upstream planner and owned by the caller. The engine
/// never modifies a FileChange; each FileOperationResult holds a copy.
struct FileChange {
    std::string path;                    ///< Project-relative, either separator style.
    FileAction action{FileAction::noop}; ///< What to do with the path.
    std::optional<std::string> content;  ///< Full file body for create/update.
    Metadata metadata;                   ///< Uninterpreted extra fields.

    auto operator==(const FileChange&) const -> bool = default;
};

}  // namespace changeset_cpp
