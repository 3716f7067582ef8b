// Fuzz target for resolve_project_path(): any accepted path must stay
// under the root.

#include <changeset-cpp/error.hpp>
#include <changeset-cpp/sandbox.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto relative = std::string_view{reinterpret_cast<const char*>(data), size};
    if (relative.find('\0') != std::string_view::npos) return 0;

    static const auto root = changeset_cpp::normalize_root("/srv/fuzz-root");
    try {
        const auto resolved = changeset_cpp::resolve_project_path(root, relative);
        if (!changeset_cpp::is_within_root(root, resolved)) std::abort();
    } catch (const changeset_cpp::FileEngineError&) {
        // Rejected paths are expected.
    }
    return 0;
}
