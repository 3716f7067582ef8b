// apply_changes: apply an agent's change list to a project directory
//
// Reads a change list (an agent result {"files": [...]} or a bare array)
// from a JSON or YAML file and applies it under a sandbox root. Runs in
// dry-run mode unless --write is given.
//
// Usage: apply_changes <changes.json|.yaml> [--root DIR] [--write]
//                      [--no-trace] [--config FILE] [--json]
//
// Build: cmake --build build -DCHANGESET_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/apply_changes result.json --root ./project

#include <changeset-cpp/changeset.hpp>
#include <changeset-cpp/config.hpp>
#include <changeset-cpp/json.hpp>
#include <changeset-cpp/loader.hpp>
#include <changeset-cpp/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace cs = changeset_cpp;

namespace {

struct Arguments {
    std::string changes_file;
    std::optional<std::string> root;
    std::optional<std::string> config_file;
    bool write{false};
    bool no_trace{false};
    bool json_output{false};
};

void print_usage(const char* program) {
    std::fprintf(stderr,
                 "Usage: %s <changes.json|.yaml> [--root DIR] [--write] [--no-trace] "
                 "[--config FILE] [--json]\n",
                 program);
}

auto parse_arguments(int argc, char** argv) -> std::optional<Arguments> {
    auto args = Arguments{};
    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (arg == "--write") {
            args.write = true;
        } else if (arg == "--no-trace") {
            args.no_trace = true;
        } else if (arg == "--json") {
            args.json_output = true;
        } else if (arg == "--root" && i + 1 < argc) {
            args.root = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_file = argv[++i];
        } else if (!arg.starts_with("--") && args.changes_file.empty()) {
            args.changes_file = arg;
        } else {
            return std::nullopt;
        }
    }
    if (args.changes_file.empty()) return std::nullopt;
    return args;
}

void print_summary(const cs::ApplySummary& summary) {
    std::printf("\n");
    std::printf("Mode: %s\n", summary.dry_run ? "DRY-RUN (no files written)"
                                              : "WRITE MODE (changes applied)");
    std::printf("File operations - created: %zu, updated: %zu, deleted: %zu, skipped: %zu\n",
                summary.counts.created, summary.counts.updated,
                summary.counts.deleted, summary.counts.skipped);

    if (summary.operations.empty()) {
        std::printf("No file operations returned by the agent.\n");
    } else if (summary.dry_run) {
        std::printf("Re-run with --write to apply these changes.\n");
    }
}

}  // namespace

int main(int argc, char** argv) {
    const auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage(argv[0]);
        return 2;
    }

    try {
        auto config = args->config_file ? cs::load_config(*args->config_file) : cs::Config{};
        if (args->root) config.apply.root = *args->root;
        if (args->write) config.apply.write = true;
        if (args->no_trace || args->json_output) config.apply.trace = false;

        cs::log::Registry::init(config.logging);
        const auto cli = cs::log::Registry::cli();

        const auto changes = cs::load_changes(args->changes_file);
        const auto options = cs::to_apply_options(config, cs::log::make_observer(cli));

        if (!args->json_output) {
            std::printf("Root directory: %s\n", options.root_dir.c_str());
            std::printf("Write mode: %s\n", options.dry_run ? "disabled (dry-run)" : "enabled");
            std::printf("Trace output: %s\n", options.on_event ? "enabled" : "disabled");
            std::printf("\n");
        }

        const auto summary = cs::apply_changes(changes, options);

        if (args->json_output) {
            std::printf("%s\n", nlohmann::json(summary).dump(2).c_str());
        } else {
            print_summary(summary);
        }
        cs::log::Registry::shutdown();
        return 0;
    } catch (const cs::FileEngineError& e) {
        std::fprintf(stderr, "Error: %s: %s\n",
                     std::string{cs::to_string_view(e.kind())}.c_str(), e.what());
        cs::log::Registry::shutdown();
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        cs::log::Registry::shutdown();
        return 1;
    }
}
