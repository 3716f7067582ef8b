#include <changeset-cpp/sandbox.hpp>

#include <changeset-cpp/error.hpp>
#include <changeset-cpp/log.hpp>

#include <algorithm>
#include <string>
#include <system_error>

namespace changeset_cpp {

namespace {

// "/a/b/" and "/a/b" name the same directory; keep the second form.
auto strip_trailing_separator(std::filesystem::path p) -> std::filesystem::path {
    if (!p.has_filename() && p.has_relative_path()) {
        return p.parent_path();
    }
    return p;
}

}  // anonymous namespace

auto to_posix_path(std::string_view path) -> std::string {
    auto result = std::string{path};
    std::ranges::replace(result, '\\', '/');
    return result;
}

auto normalize_root(const std::filesystem::path& root_dir) -> std::filesystem::path {
    auto ec = std::error_code{};
    const auto absolute = root_dir.empty() ? std::filesystem::current_path(ec)
                                           : std::filesystem::absolute(root_dir, ec);
    if (ec) {
        throw FileEngineError{Error{ErrorKind::file_system_operation,
            "Failed to resolve root directory: " + root_dir.string(),
            root_dir.string(), ec}};
    }
    return strip_trailing_separator(absolute.lexically_normal());
}

auto is_within_root(const std::filesystem::path& root,
                    const std::filesystem::path& candidate) -> bool {
    const auto diverge = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
    return diverge.first == root.end();
}

auto resolve_project_path(const std::filesystem::path& root_dir,
                          std::string_view relative_path) -> std::filesystem::path {
    const auto root = normalize_root(root_dir);
    const auto joined = root / std::filesystem::path{to_posix_path(relative_path)};
    const auto resolved = strip_trailing_separator(joined.lexically_normal());

    if (!is_within_root(root, resolved)) {
        log::Registry::sandbox()->warn("rejected '{}': resolves to {} outside {}",
                                       relative_path, resolved.string(), root.string());
        throw FileEngineError{Error{ErrorKind::invalid_path,
            "File path is invalid or out of project root: " + std::string{relative_path},
            std::string{relative_path}}};
    }
    return resolved;
}

}  // namespace changeset_cpp
