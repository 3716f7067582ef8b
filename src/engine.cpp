#include <changeset-cpp/engine.hpp>

#include <changeset-cpp/file_system.hpp>
#include <changeset-cpp/log.hpp>
#include <changeset-cpp/sandbox.hpp>

#include "decision_table.hpp"

#include <string>
#include <utility>

namespace changeset_cpp {

namespace {

auto apply_single_change(const FileChange& change,
                         const std::filesystem::path& root,
                         const ApplyOptions& options,
                         spdlog::logger& logger) -> FileOperationResult {
    const auto target = resolve_project_path(root, change.path);
    const auto decision = decide(change);

    if (!options.dry_run) {
        switch (decision.effect) {
            case Effect::write:
                write_file_safe(target, *change.content);
                break;
            case Effect::remove:
                delete_file_safe(target);
                break;
            case Effect::none:
                break;
        }
    }

    const auto event = std::string{decision.event_label} + ": " + change.path;
    logger.debug("{} -> {}", event, to_string_view(decision.status));
    if (options.on_event) {
        options.on_event(event);
    }

    return FileOperationResult{change, decision.status,
                               std::string{decision.message(options.dry_run)}};
}

}  // anonymous namespace

auto decide(const FileChange& change) -> Decision {
    return detail::lookup(change.action, change.content.has_value());
}

auto apply_changes(std::span<const FileChange> changes,
                   const ApplyOptions& options) -> ApplySummary {
    const auto logger = log::Registry::engine();
    const auto root = normalize_root(options.root_dir);

    logger->debug("applying {} change(s) under {} ({})", changes.size(), root.string(),
                  options.dry_run ? "dry-run" : "write");

    auto summary = ApplySummary{};
    summary.dry_run = options.dry_run;
    summary.operations.reserve(changes.size());

    try {
        for (const auto& change : changes) {
            summary.operations.push_back(apply_single_change(change, root, options, *logger));
        }
    } catch (const FileEngineError& e) {
        logger->error("batch aborted after {} of {} change(s): {}: {}",
                      summary.operations.size(), changes.size(),
                      to_string_view(e.kind()), e.what());
        throw;
    }

    for (const auto& op : summary.operations) {
        summary.counts.record(op.status);
    }

    logger->info("{}: created {}, updated {}, deleted {}, skipped {}",
                 options.dry_run ? "dry-run" : "applied",
                 summary.counts.created, summary.counts.updated,
                 summary.counts.deleted, summary.counts.skipped);
    return summary;
}

auto try_apply_changes(std::span<const FileChange> changes,
                       const ApplyOptions& options) -> ApplyOutcome {
    try {
        return apply_changes(changes, options);
    } catch (const FileEngineError& e) {
        return e.error();
    }
}

}  // namespace changeset_cpp
