// Fuzz target for import_changes(): exercises the JSON change decoder.
// Decoded changes are serialized again and applied in dry-run mode.

#include <changeset-cpp/changeset.hpp>
#include <changeset-cpp/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    try {
        const auto changes = changeset_cpp::import_changes(text);
        for (const auto& change : changes) {
            (void)nlohmann::json(change).dump();
        }
        (void)changeset_cpp::apply_changes(
            changes, {.root_dir = "/srv/fuzz-root", .dry_run = true});
    } catch (const changeset_cpp::FileEngineError&) {
        // Malformed input and escaping paths are expected.
    }
    return 0;
}
