/// @file config.hpp
/// @brief YAML configuration for tools built on the engine.
///
/// @code{.yaml}
/// apply:
///   root: ./project
///   write: false
///   trace: true
/// logging:
///   console_level: info
///   file: ""
///   file_level: debug
///   levels: { engine: info, sandbox: warn, loader: info, cli: info }
/// @endcode

#pragma once

#include <changeset-cpp/engine.hpp>

#include <spdlog/common.h>

#include <filesystem>
#include <string_view>

namespace changeset_cpp {

/// Where and how to apply changes.
struct ApplyConfig {
    std::filesystem::path root;  ///< Empty means the current working directory.
    bool write{false};           ///< False runs in dry-run mode.
    bool trace{true};            ///< Forward engine events to the console.
};

/// Per-subsystem log levels.
struct SubsystemLogLevels {
    spdlog::level::level_enum engine{spdlog::level::info};
    spdlog::level::level_enum sandbox{spdlog::level::warn};
    spdlog::level::level_enum loader{spdlog::level::info};
    spdlog::level::level_enum cli{spdlog::level::info};
};

/// Sinks and levels for the log registry.
struct LoggingConfig {
    spdlog::level::level_enum console_level{spdlog::level::info};
    std::filesystem::path file;  ///< Empty means no file sink.
    spdlog::level::level_enum file_level{spdlog::level::debug};
    SubsystemLogLevels levels;
};

/// The complete configuration file.
struct Config {
    ApplyConfig apply;
    LoggingConfig logging;
};

/// Load a configuration file. Absent sections and keys keep their defaults.
/// @throws FileEngineError with ErrorKind::invalid_config.
auto load_config(const std::filesystem::path& path) -> Config;

/// Decode configuration from YAML text.
/// @throws FileEngineError with ErrorKind::invalid_config.
auto parse_config(std::string_view yaml_text) -> Config;

/// Build engine options from a configuration.
///
/// The root is made absolute, `dry_run` is the negation of `write`, and
/// `on_event` is installed only when tracing is enabled.
auto to_apply_options(const Config& config, Observer on_event = {}) -> ApplyOptions;

}  // namespace changeset_cpp
