// temp_dir.hpp: scratch directories for filesystem tests.

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace changeset_test {

namespace fs = std::filesystem;

/// A fresh, empty directory under the system temp dir, removed on
/// destruction.
class TempDir {
public:
    TempDir() {
        static auto counter = std::atomic<unsigned>{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = (fs::temp_directory_path() /
                 ("changeset-cpp-test-" + std::to_string(stamp) + "-" + std::to_string(counter++)))
                    .lexically_normal();
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        auto ec = std::error_code{};
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    auto operator=(const TempDir&) -> TempDir& = delete;

    auto path() const -> const fs::path& { return path_; }

    auto operator/(std::string_view relative) const -> fs::path { return path_ / relative; }

private:
    fs::path path_;
};

inline void write_file(const fs::path& path, std::string_view content) {
    fs::create_directories(path.parent_path());
    auto out = std::ofstream{path, std::ios::binary};
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline auto read_file(const fs::path& path) -> std::string {
    auto in = std::ifstream{path, std::ios::binary};
    return std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
}

inline auto is_empty_dir(const fs::path& path) -> bool {
    return fs::is_directory(path) && fs::directory_iterator{path} == fs::directory_iterator{};
}

}  // namespace changeset_test
