/// @file engine.hpp
/// @brief The change application engine -- the primary API of changeset-cpp.

#pragma once

#include <changeset-cpp/change.hpp>
#include <changeset-cpp/error.hpp>
#include <changeset-cpp/result.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace changeset_cpp {

/// Synchronous sink for per-change event lines such as "CREATE: a.txt".
using Observer = std::function<void(std::string_view)>;

/// Options for one apply invocation.
struct ApplyOptions {
    std::filesystem::path root_dir;  ///< Sandbox root; made absolute if relative, empty is the cwd.
    bool dry_run{false};             ///< Report what would happen, touch nothing.
    Observer on_event;               ///< Called once per change, in input order.
};

/// The filesystem effect a change has outside dry-run mode.
enum class Effect : std::uint8_t {
    none,    ///< Nothing is touched.
    write,   ///< The content is written to the target.
    remove,  ///< The target is deleted.
};

/// One row of the engine's decision table.
///
/// Maps a (action, precondition) pair to the reported status, the
/// effect, the observer event label, and the message for each mode.
struct Decision {
    FileStatus status;
    Effect effect;
    std::string_view event_label;      ///< Prefix of the observer event, e.g. "CREATE".
    std::string_view write_message;    ///< Message when changes are applied.
    std::string_view dry_run_message;  ///< Message when only simulating.

    /// The message for the given mode.
    constexpr auto message(bool dry_run) const noexcept -> std::string_view {
        return dry_run ? dry_run_message : write_message;
    }

    auto operator==(const Decision&) const -> bool = default;
};

/// Look up the decision for a change.
///
/// The outcome depends only on the requested action and on whether
/// content is present, never on the state of the filesystem, so a
/// dry run reports exactly what a real run would.
auto decide(const FileChange& change) -> Decision;

/// Apply (or simulate) a batch of changes under a sandbox root.
///
/// Changes are processed strictly in order. Each path is resolved
/// through the sandbox before anything else happens to it.
///
/// @code
/// auto summary = apply_changes(changes, {.root_dir = "/srv/project", .dry_run = true});
/// std::printf("%zu created\n", summary.counts.created);
/// @endcode
///
/// @throws FileEngineError with ErrorKind::invalid_path if a path escapes
///   the root, or ErrorKind::file_system_operation if a write or delete
///   fails. No partial summary is returned in either case.
auto apply_changes(std::span<const FileChange> changes,
                   const ApplyOptions& options) -> ApplySummary;

/// Either a complete summary or the error that aborted the batch.
using ApplyOutcome = std::variant<ApplySummary, Error>;

/// Non-throwing form of apply_changes().
auto try_apply_changes(std::span<const FileChange> changes,
                       const ApplyOptions& options) -> ApplyOutcome;

}  // namespace changeset_cpp
