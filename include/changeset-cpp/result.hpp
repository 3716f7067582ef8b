/// @file result.hpp
/// @brief Result types produced by the engine: per-change results and
/// the aggregate ApplySummary.

#pragma once

#include <changeset-cpp/change.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace changeset_cpp {

/// The engine's determination of what happened to a change.
///
/// Not always equal to the requested action: a create without content
/// is reported as skipped.
enum class FileStatus : std::uint8_t {
    created,
    updated,
    deleted,
    skipped,
};

/// Convert a FileStatus to its string representation.
constexpr auto to_string_view(FileStatus status) noexcept -> std::string_view {
    switch (status) {
        case FileStatus::created: return "created";
        case FileStatus::updated: return "updated";
        case FileStatus::deleted: return "deleted";
        case FileStatus::skipped: return "skipped";
    }
    return "unknown";
}

/// Parse a status name, or nullopt if it is not one of the four.
constexpr auto parse_status(std::string_view name) noexcept -> std::optional<FileStatus> {
    if (name == "created") return FileStatus::created;
    if (name == "updated") return FileStatus::updated;
    if (name == "deleted") return FileStatus::deleted;
    if (name == "skipped") return FileStatus::skipped;
    return std::nullopt;
}

/// The outcome of one change.
struct FileOperationResult {
    FileChange change;   ///< The requested change, echoed unchanged.
    FileStatus status;   ///< What the engine did (or would do).
    std::string message; ///< Human-readable explanation.

    auto operator==(const FileOperationResult&) const -> bool = default;
};

/// Number of results per status.
struct StatusCounts {
    std::size_t created{0};
    std::size_t updated{0};
    std::size_t deleted{0};
    std::size_t skipped{0};

    /// Sum over all statuses.
    constexpr auto total() const noexcept -> std::size_t {
        return created + updated + deleted + skipped;
    }

    /// Count for one status.
    constexpr auto operator[](FileStatus status) const noexcept -> std::size_t {
        switch (status) {
            case FileStatus::created: return created;
            case FileStatus::updated: return updated;
            case FileStatus::deleted: return deleted;
            case FileStatus::skipped: return skipped;
        }
        return 0;
    }

    /// Increment the count for one status.
    constexpr void record(FileStatus status) noexcept {
        switch (status) {
            case FileStatus::created: ++created; break;
            case FileStatus::updated: ++updated; break;
            case FileStatus::deleted: ++deleted; break;
            case FileStatus::skipped: ++skipped; break;
        }
    }

    auto operator==(const StatusCounts&) const -> bool = default;
};

/// The aggregate result of one apply invocation.
///
/// `operations` holds exactly one entry per input change, in input order,
/// and `counts.total() == operations.size()`.
struct ApplySummary {
    std::vector<FileOperationResult> operations;  ///< One per input change.
    bool dry_run{false};                          ///< Echo of the invocation mode.
    StatusCounts counts;                          ///< Tally of operations by status.

    auto operator==(const ApplySummary&) const -> bool = default;
};

}  // namespace changeset_cpp
