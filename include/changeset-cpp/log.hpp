/// @file log.hpp
/// @brief Named spdlog loggers shared by the library and its tools.

#pragma once

#include <changeset-cpp/config.hpp>
#include <changeset-cpp/engine.hpp>

#include <spdlog/logger.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

namespace changeset_cpp::log {

/// Registry of the subsystem loggers: engine, sandbox, loader and cli.
///
/// The library logs through Registry::get() whether or not init() was
/// called. Before init() a logger is created on demand with a console
/// sink at warn level.
class Registry {
public:
    /// Create the sinks and register every subsystem logger.
    static void init(const LoggingConfig& config);

    /// Flush and drop every registered logger.
    static void shutdown();

    /// Get a logger by name, creating it if necessary.
    static auto get(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    static auto engine() -> std::shared_ptr<spdlog::logger> { return get("engine"); }
    static auto sandbox() -> std::shared_ptr<spdlog::logger> { return get("sandbox"); }
    static auto loader() -> std::shared_ptr<spdlog::logger> { return get("loader"); }
    static auto cli() -> std::shared_ptr<spdlog::logger> { return get("cli"); }

    [[nodiscard]] static auto is_initialized() -> bool;

private:
    static constexpr const auto* log_format = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static void make_logger(const std::string& name, spdlog::level::level_enum level);

    static inline std::mutex mutex_;
    static inline bool initialized_ = false;
    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file_sink_;
};

/// Adapt a logger to the engine's observer signature.
auto make_observer(std::shared_ptr<spdlog::logger> logger,
                   spdlog::level::level_enum level = spdlog::level::info) -> Observer;

}  // namespace changeset_cpp::log
