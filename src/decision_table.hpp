#pragma once

// Internal header: the table that drives decide().

#include <changeset-cpp/engine.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace changeset_cpp::detail {

/// Which content state a table row applies to.
enum class ContentRule : std::uint8_t {
    any,
    present,
    absent,
};

struct DecisionRow {
    FileAction action;
    ContentRule rule;
    Decision decision;
};

inline constexpr auto written_message = std::string_view{"File written successfully."};
inline constexpr auto would_write_message = std::string_view{"Dry-run: file would be written."};
inline constexpr auto missing_content_message =
    std::string_view{"Missing content for create/update action."};
inline constexpr auto deleted_message = std::string_view{"File deleted (or already absent)."};
inline constexpr auto would_delete_message = std::string_view{"Dry-run: file would be deleted."};
inline constexpr auto noop_message = std::string_view{"No action (noop)."};

inline constexpr auto noop_decision = Decision{
    FileStatus::skipped, Effect::none, "SKIP (noop)", noop_message, noop_message};

// Reported to the observer like any other skip, so each change yields
// exactly one event.
inline constexpr auto missing_content_decision = Decision{
    FileStatus::skipped, Effect::none, "SKIP (missing content)",
    missing_content_message, missing_content_message};

// Rows are matched top to bottom; the first match wins. Every
// (action, content) pair is covered.
inline constexpr auto decision_table = std::array{
    DecisionRow{FileAction::create, ContentRule::present,
        {FileStatus::created, Effect::write, "CREATE", written_message, would_write_message}},
    DecisionRow{FileAction::create, ContentRule::absent, missing_content_decision},
    DecisionRow{FileAction::update, ContentRule::present,
        {FileStatus::updated, Effect::write, "UPDATE", written_message, would_write_message}},
    DecisionRow{FileAction::update, ContentRule::absent, missing_content_decision},
    DecisionRow{FileAction::remove, ContentRule::any,
        {FileStatus::deleted, Effect::remove, "DELETE", deleted_message, would_delete_message}},
    DecisionRow{FileAction::noop, ContentRule::any, noop_decision},
    DecisionRow{FileAction::unknown, ContentRule::any, noop_decision},
};

constexpr auto rule_matches(ContentRule rule, bool has_content) noexcept -> bool {
    switch (rule) {
        case ContentRule::any:     return true;
        case ContentRule::present: return has_content;
        case ContentRule::absent:  return !has_content;
    }
    return false;
}

constexpr auto lookup(FileAction action, bool has_content) noexcept -> Decision {
    for (const auto& row : decision_table) {
        if (row.action == action && rule_matches(row.rule, has_content)) {
            return row.decision;
        }
    }
    return noop_decision;
}

}  // namespace changeset_cpp::detail
