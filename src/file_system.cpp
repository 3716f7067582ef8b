#include <changeset-cpp/file_system.hpp>

#include <changeset-cpp/error.hpp>

#include <cerrno>
#include <fstream>
#include <ios>
#include <string>
#include <system_error>

namespace changeset_cpp {

namespace {

// Stream failures leave the reason in errno; fall back to a generic
// I/O error when it has been cleared.
auto last_os_error() -> std::error_code {
    const auto err = errno;
    if (err == 0) return std::make_error_code(std::errc::io_error);
    return std::error_code{err, std::generic_category()};
}

auto create_parent_directories(const std::filesystem::path& file_path) -> std::error_code {
    auto ec = std::error_code{};
    const auto dir = file_path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
    }
    return ec;
}

[[noreturn]] void throw_fs_error(std::string_view what, const std::filesystem::path& p,
                                 std::error_code ec) {
    throw FileEngineError{Error{ErrorKind::file_system_operation,
        std::string{what} + ": " + p.string(), p.string(), ec}};
}

}  // anonymous namespace

void ensure_directory_exists(const std::filesystem::path& file_path) {
    if (const auto ec = create_parent_directories(file_path)) {
        throw_fs_error("Failed to create directory", file_path.parent_path(), ec);
    }
}

void write_file_safe(const std::filesystem::path& file_path, std::string_view content) {
    if (const auto ec = create_parent_directories(file_path)) {
        throw_fs_error("Failed to write file", file_path, ec);
    }

    errno = 0;
    auto out = std::ofstream{file_path, std::ios::binary | std::ios::trunc};
    if (!out) {
        throw_fs_error("Failed to write file", file_path, last_os_error());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        throw_fs_error("Failed to write file", file_path, last_os_error());
    }
}

void delete_file_safe(const std::filesystem::path& file_path) {
    auto ec = std::error_code{};
    const auto st = std::filesystem::symlink_status(file_path, ec);
    // A parent that is not a directory also reads as not_found; only a
    // missing entry counts as already deleted.
    if (st.type() == std::filesystem::file_type::not_found &&
        ec != std::errc::not_a_directory) {
        return;
    }
    if (ec) {
        throw_fs_error("Failed to delete file", file_path, ec);
    }
    if (std::filesystem::is_directory(st)) {
        throw_fs_error("Failed to delete file", file_path,
                       std::make_error_code(std::errc::is_a_directory));
    }

    std::filesystem::remove(file_path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw_fs_error("Failed to delete file", file_path, ec);
    }
}

}  // namespace changeset_cpp
