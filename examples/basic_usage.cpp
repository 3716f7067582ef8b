// basic_usage: demonstrates the core changeset-cpp API
//
// Builds a change list in code, previews it with a dry run, applies it,
// then shows how the sandbox rejects a path that escapes the root.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <changeset-cpp/changeset.hpp>
#include <changeset-cpp/json.hpp>

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cs = changeset_cpp;
namespace fs = std::filesystem;

int main() {
    const auto root = fs::temp_directory_path() / "changeset-cpp-basic-usage";
    fs::remove_all(root);
    fs::create_directories(root);

    auto changes = std::vector<cs::FileChange>{
        {.path = "src/main.cpp", .action = cs::FileAction::create,
         .content = "int main() { return 0; }\n"},
        {.path = "README.md", .action = cs::FileAction::update, .content = "# Demo\n"},
        {.path = "obsolete.txt", .action = cs::FileAction::remove},
        {.path = "notes.txt", .action = cs::FileAction::noop},
    };
    changes[0].metadata["reason"] = "\"entry point\"";

    auto print_event = [](std::string_view line) {
        std::printf("  %.*s\n", static_cast<int>(line.size()), line.data());
    };

    // -- Dry run: report only ---------------------------------------------------
    std::printf("Dry run:\n");
    const auto preview = cs::apply_changes(changes, {.root_dir = root, .dry_run = true,
                                                     .on_event = print_event});
    std::printf("  would create %zu, update %zu, delete %zu, skip %zu\n",
                preview.counts.created, preview.counts.updated,
                preview.counts.deleted, preview.counts.skipped);
    std::printf("  src/ exists after dry run: %s\n", fs::exists(root / "src") ? "yes" : "no");

    // -- Real run -------------------------------------------------------------
    std::printf("Write:\n");
    const auto applied = cs::apply_changes(changes, {.root_dir = root, .dry_run = false,
                                                     .on_event = print_event});
    for (const auto& op : applied.operations) {
        std::printf("  %-14s %-8s %s\n", op.change.path.c_str(),
                    std::string{cs::to_string_view(op.status)}.c_str(), op.message.c_str());
    }

    // -- Summary as JSON ------------------------------------------------------
    std::printf("Summary JSON:\n%s\n", nlohmann::json(applied).dump(2).c_str());

    // -- Sandbox violation ----------------------------------------------------
    const auto escaping = std::vector<cs::FileChange>{
        {.path = "../outside.txt", .action = cs::FileAction::create, .content = "nope"}};
    const auto outcome = cs::try_apply_changes(escaping, {.root_dir = root});
    if (const auto* err = std::get_if<cs::Error>(&outcome)) {
        std::printf("Rejected: %s (%s)\n", err->message.c_str(),
                    std::string{cs::to_string_view(err->kind)}.c_str());
    }

    fs::remove_all(root);
    return 0;
}
