#include <changeset-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace changeset_cpp {

namespace {

[[noreturn]] void invalid_change(std::string message) {
    throw FileEngineError{ErrorKind::invalid_change, std::move(message)};
}

auto is_core_field(const std::string& key) -> bool {
    return key == "path" || key == "action" || key == "content";
}

auto count_field(const nlohmann::json& j, const char* key) -> std::size_t {
    const auto it = j.find(key);
    if (it == j.end()) return 0;
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
        invalid_change(std::string{"count \""} + key + "\" must be a non-negative integer");
    }
    return it->get<std::size_t>();
}

}  // anonymous namespace

// =============================================================================
// Enumerations
// =============================================================================

void to_json(nlohmann::json& j, FileAction action) {
    j = std::string{to_string_view(action)};
}

void from_json(const nlohmann::json& j, FileAction& action) {
    if (!j.is_string()) invalid_change("action must be a string");
    action = parse_action(j.get_ref<const std::string&>());
}

void to_json(nlohmann::json& j, FileStatus status) {
    j = std::string{to_string_view(status)};
}

void from_json(const nlohmann::json& j, FileStatus& status) {
    if (!j.is_string()) invalid_change("status must be a string");
    const auto& name = j.get_ref<const std::string&>();
    const auto parsed = parse_status(name);
    if (!parsed) invalid_change("unknown status: " + name);
    status = *parsed;
}

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

// =============================================================================
// FileChange
// =============================================================================

void to_json(nlohmann::json& j, const FileChange& change) {
    j = nlohmann::json::object();
    for (const auto& [key, text] : change.metadata) {
        auto value = nlohmann::json::parse(text, nullptr, false);
        j[key] = value.is_discarded() ? nlohmann::json(text) : std::move(value);
    }
    j["path"] = change.path;
    // An unrecognized action keeps its original spelling from metadata.
    if (change.action != FileAction::unknown || !j.contains("action")) {
        j["action"] = change.action;
    }
    if (change.content) {
        j["content"] = *change.content;
    }
}

void from_json(const nlohmann::json& j, FileChange& change) {
    if (!j.is_object()) invalid_change("change must be a JSON object");

    const auto path = j.find("path");
    if (path == j.end() || !path->is_string()) {
        invalid_change("change is missing a string \"path\"");
    }
    const auto action = j.find("action");
    if (action == j.end() || !action->is_string()) {
        invalid_change("change '" + path->get<std::string>() + "' is missing a string \"action\"");
    }

    auto result = FileChange{};
    result.path = path->get<std::string>();
    result.action = action->get<FileAction>();

    // Content that is not text counts as missing; the raw value is kept.
    if (const auto content = j.find("content"); content != j.end() && !content->is_null()) {
        if (content->is_string()) {
            result.content = content->get<std::string>();
        } else {
            result.metadata.emplace("content", content->dump());
        }
    }

    for (const auto& item : j.items()) {
        if (!is_core_field(item.key())) {
            result.metadata.emplace(item.key(), item.value().dump());
        }
    }
    if (result.action == FileAction::unknown) {
        result.metadata.emplace("action", action->dump());
    }

    change = std::move(result);
}

// =============================================================================
// Results and summaries
// =============================================================================

void to_json(nlohmann::json& j, const FileOperationResult& result) {
    j = nlohmann::json{
        {"change", result.change},
        {"status", result.status},
        {"message", result.message},
    };
}

void from_json(const nlohmann::json& j, FileOperationResult& result) {
    if (!j.is_object() || !j.contains("change") || !j.contains("status")) {
        invalid_change("operation result needs \"change\" and \"status\"");
    }
    result.change = j.at("change").get<FileChange>();
    result.status = j.at("status").get<FileStatus>();
    result.message = j.value("message", std::string{});
}

void to_json(nlohmann::json& j, const StatusCounts& counts) {
    j = nlohmann::json{
        {"created", counts.created},
        {"updated", counts.updated},
        {"deleted", counts.deleted},
        {"skipped", counts.skipped},
    };
}

void from_json(const nlohmann::json& j, StatusCounts& counts) {
    if (!j.is_object()) invalid_change("counts must be a JSON object");
    counts.created = count_field(j, "created");
    counts.updated = count_field(j, "updated");
    counts.deleted = count_field(j, "deleted");
    counts.skipped = count_field(j, "skipped");
}

void to_json(nlohmann::json& j, const ApplySummary& summary) {
    j = nlohmann::json{
        {"operations", summary.operations},
        {"dryRun", summary.dry_run},
        {"counts", summary.counts},
    };
}

void from_json(const nlohmann::json& j, ApplySummary& summary) {
    if (!j.is_object()) invalid_change("summary must be a JSON object");
    const auto ops = j.find("operations");
    if (ops == j.end() || !ops->is_array()) invalid_change("summary needs an \"operations\" array");

    summary.operations.clear();
    for (const auto& op : *ops) {
        summary.operations.push_back(op.get<FileOperationResult>());
    }
    summary.dry_run = j.value("dryRun", false);
    if (const auto counts = j.find("counts"); counts != j.end()) {
        summary.counts = counts->get<StatusCounts>();
    } else {
        summary.counts = StatusCounts{};
        for (const auto& op : summary.operations) summary.counts.record(op.status);
    }
}

void to_json(nlohmann::json& j, const Error& error) {
    j = nlohmann::json{
        {"kind", error.kind},
        {"message", error.message},
    };
    if (!error.path.empty()) {
        j["path"] = error.path;
    }
    if (error.cause) {
        j["cause"] = nlohmann::json{
            {"category", error.cause.category().name()},
            {"value", error.cause.value()},
            {"message", error.cause.message()},
        };
    }
}

// =============================================================================
// Change lists
// =============================================================================

auto parse_changes(const nlohmann::json& j) -> std::vector<FileChange> {
    const nlohmann::json* files = nullptr;
    if (j.is_array()) {
        files = &j;
    } else if (j.is_object() && j.contains("files")) {
        files = &j.at("files");
        if (!files->is_array()) invalid_change("\"files\" must be an array");
    } else {
        invalid_change("expected an object with a \"files\" array or an array of changes");
    }

    auto changes = std::vector<FileChange>{};
    changes.reserve(files->size());
    try {
        for (const auto& entry : *files) {
            changes.push_back(entry.get<FileChange>());
        }
    } catch (const nlohmann::json::exception& e) {
        invalid_change(std::string{"malformed change: "} + e.what());
    }
    return changes;
}

auto import_changes(std::string_view json_text) -> std::vector<FileChange> {
    const auto j = nlohmann::json::parse(json_text, nullptr, false);
    if (j.is_discarded()) invalid_change("change list is not valid JSON");
    return parse_changes(j);
}

}  // namespace changeset_cpp
