// changeset-cpp benchmarks: measures path resolution and dry-run throughput.

#include <changeset-cpp/changeset.hpp>
#include <changeset-cpp/json.hpp>
#include <changeset-cpp/log.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

using namespace changeset_cpp;

static const auto bench_root = std::filesystem::path{"/srv/bench-root"};

static auto make_changes(std::size_t n) -> std::vector<FileChange> {
    auto changes = std::vector<FileChange>{};
    changes.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const auto path = "src/module" + std::to_string(i % 16) + "/file" + std::to_string(i) + ".cpp";
        switch (i % 4) {
            case 0: changes.push_back({.path = path, .action = FileAction::create, .content = "x"}); break;
            case 1: changes.push_back({.path = path, .action = FileAction::update, .content = "y"}); break;
            case 2: changes.push_back({.path = path, .action = FileAction::remove}); break;
            default: changes.push_back({.path = path, .action = FileAction::noop}); break;
        }
    }
    return changes;
}

// =============================================================================
// Sandbox
// =============================================================================

static void bm_resolve_simple(benchmark::State& state) {
    for (auto _ : state) {
        auto resolved = resolve_project_path(bench_root, "src/components/Button.tsx");
        benchmark::DoNotOptimize(resolved);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve_simple);

static void bm_resolve_dot_segments(benchmark::State& state) {
    for (auto _ : state) {
        auto resolved = resolve_project_path(bench_root, "a/./b/../c\\d/../../e/f/g/../h.txt");
        benchmark::DoNotOptimize(resolved);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve_dot_segments);

static void bm_resolve_rejected(benchmark::State& state) {
    // Every rejection is logged at warn.
    log::Registry::sandbox()->set_level(spdlog::level::off);
    for (auto _ : state) {
        try {
            auto resolved = resolve_project_path(bench_root, "../../etc/passwd");
            benchmark::DoNotOptimize(resolved);
        } catch (const FileEngineError& e) {
            auto kind = e.kind();
            benchmark::DoNotOptimize(kind);
        }
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve_rejected);

// =============================================================================
// Engine
// =============================================================================

static void bm_dry_run_batch(benchmark::State& state) {
    const auto changes = make_changes(static_cast<std::size_t>(state.range(0)));
    const auto options = ApplyOptions{.root_dir = bench_root, .dry_run = true};
    for (auto _ : state) {
        auto summary = apply_changes(changes, options);
        auto total = summary.counts.total();
        benchmark::DoNotOptimize(total);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(bm_dry_run_batch)->Range(8, 4096);

static void bm_decide(benchmark::State& state) {
    const auto change = FileChange{.path = "a", .action = FileAction::update, .content = "b"};
    for (auto _ : state) {
        auto decision = decide(change);
        benchmark::DoNotOptimize(decision);
    }
}
BENCHMARK(bm_decide);

// =============================================================================
// JSON
// =============================================================================

static void bm_import_changes(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto text = nlohmann::json{{"files", make_changes(n)}}.dump();
    for (auto _ : state) {
        auto changes = import_changes(text);
        benchmark::DoNotOptimize(changes);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_import_changes)->Range(8, 1024);
