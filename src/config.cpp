#include <changeset-cpp/config.hpp>

#include "config_yaml.hpp"

#include <string>
#include <system_error>
#include <utility>

namespace changeset_cpp {

namespace {

[[noreturn]] void invalid_config(std::string message) {
    throw FileEngineError{ErrorKind::invalid_config, std::move(message)};
}

auto decode_config(const YAML::Node& root) -> Config {
    auto cfg = Config{};
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) invalid_config("configuration must be a YAML mapping");

    if (const auto node = root["apply"]) {
        if (!YAML::convert<ApplyConfig>::decode(node, cfg.apply)) {
            invalid_config("\"apply\" must be a mapping");
        }
    }
    if (const auto node = root["logging"]) {
        if (!YAML::convert<LoggingConfig>::decode(node, cfg.logging)) {
            invalid_config("\"logging\" must be a mapping");
        }
    }
    return cfg;
}

}  // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    try {
        return decode_config(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile&) {
        throw FileEngineError{Error{ErrorKind::invalid_config,
            "Failed to open config file: " + path.string(), path.string(),
            std::make_error_code(std::errc::no_such_file_or_directory)}};
    } catch (const YAML::Exception& e) {
        throw FileEngineError{Error{ErrorKind::invalid_config,
            "Failed to parse config file " + path.string() + ": " + e.what(), path.string()}};
    }
}

auto parse_config(std::string_view yaml_text) -> Config {
    try {
        return decode_config(YAML::Load(std::string{yaml_text}));
    } catch (const YAML::Exception& e) {
        invalid_config(std::string{"Failed to parse config: "} + e.what());
    }
}

auto to_apply_options(const Config& config, Observer on_event) -> ApplyOptions {
    auto options = ApplyOptions{};
    options.root_dir = config.apply.root.empty() ? std::filesystem::current_path()
                                                 : std::filesystem::absolute(config.apply.root);
    options.dry_run = !config.apply.write;
    if (config.apply.trace) {
        options.on_event = std::move(on_event);
    }
    return options;
}

}  // namespace changeset_cpp
