#include <changeset-cpp/log.hpp>

#include <array>
#include <string_view>
#include <utility>
#include <vector>

namespace changeset_cpp::log {

namespace {

constexpr auto subsystems = std::array<std::string_view, 4>{"engine", "sandbox", "loader", "cli"};

void drop_subsystem_loggers() {
    for (const auto name : subsystems) spdlog::drop(std::string{name});
}

}  // anonymous namespace

void Registry::init(const LoggingConfig& config) {
    auto lock = std::unique_lock{mutex_};
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    // Loggers created on demand are replaced by configured ones.
    drop_subsystem_loggers();

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(config.console_level);
    console_sink_->set_pattern(log_format);

    if (!config.file.empty()) {
        try {
            file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.file.string(), /*truncate=*/false);
        } catch (const spdlog::spdlog_ex& e) {
            throw FileEngineError{Error{ErrorKind::invalid_config,
                std::string{"Failed to open log file: "} + e.what(), config.file.string()}};
        }
        file_sink_->set_level(config.file_level);
        file_sink_->set_pattern(log_format);
    }

    make_logger("engine", config.levels.engine);
    make_logger("sandbox", config.levels.sandbox);
    make_logger("loader", config.levels.loader);
    make_logger("cli", config.levels.cli);

    initialized_ = true;
}

void Registry::shutdown() {
    auto lock = std::unique_lock{mutex_};
    for (const auto name : subsystems) {
        if (auto logger = spdlog::get(std::string{name})) logger->flush();
    }
    drop_subsystem_loggers();
    console_sink_.reset();
    file_sink_.reset();
    initialized_ = false;
}

auto Registry::get(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    if (auto logger = spdlog::get(name)) return logger;

    auto lock = std::unique_lock{mutex_};
    if (auto logger = spdlog::get(name)) return logger;

    if (!console_sink_) {
        console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink_->set_pattern(log_format);
    }
    make_logger(name, initialized_ ? spdlog::level::info : spdlog::level::warn);
    return spdlog::get(name);
}

auto Registry::is_initialized() -> bool {
    auto lock = std::unique_lock{mutex_};
    return initialized_;
}

void Registry::make_logger(const std::string& name, spdlog::level::level_enum level) {
    auto sinks = std::vector<spdlog::sink_ptr>{console_sink_};
    if (file_sink_) sinks.push_back(file_sink_);

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

auto make_observer(std::shared_ptr<spdlog::logger> logger,
                   spdlog::level::level_enum level) -> Observer {
    return [logger = std::move(logger), level](std::string_view event) {
        logger->log(level, "{}", event);
    };
}

}  // namespace changeset_cpp::log
