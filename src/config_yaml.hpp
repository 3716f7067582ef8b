#pragma once

// Internal header: yaml-cpp conversions for the configuration types.

#include <changeset-cpp/config.hpp>
#include <changeset-cpp/error.hpp>

#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>

#include <string>

namespace changeset_cpp::detail {

/// Read a level by name, keeping `fallback` when the key is absent.
///
/// spdlog maps unknown names to "off"; that is reported instead.
inline auto level_from_yaml(const YAML::Node& node, const char* key,
                            spdlog::level::level_enum fallback) -> spdlog::level::level_enum {
    const auto value = node[key];
    if (!value || value.IsNull()) return fallback;

    const auto name = value.as<std::string>();
    const auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw FileEngineError{ErrorKind::invalid_config,
            std::string{"unknown log level for \""} + key + "\": " + name};
    }
    return level;
}

}  // namespace changeset_cpp::detail

namespace YAML {

template <>
struct convert<changeset_cpp::ApplyConfig> {
    static bool decode(const Node& node, changeset_cpp::ApplyConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.root = node["root"].as<std::string>("");
        rhs.write = node["write"].as<bool>(false);
        rhs.trace = node["trace"].as<bool>(true);
        return true;
    }
};

template <>
struct convert<changeset_cpp::SubsystemLogLevels> {
    static bool decode(const Node& node, changeset_cpp::SubsystemLogLevels& rhs) {
        using changeset_cpp::detail::level_from_yaml;
        if (!node.IsMap()) return false;
        const auto defaults = changeset_cpp::SubsystemLogLevels{};
        rhs.engine = level_from_yaml(node, "engine", defaults.engine);
        rhs.sandbox = level_from_yaml(node, "sandbox", defaults.sandbox);
        rhs.loader = level_from_yaml(node, "loader", defaults.loader);
        rhs.cli = level_from_yaml(node, "cli", defaults.cli);
        return true;
    }
};

template <>
struct convert<changeset_cpp::LoggingConfig> {
    static bool decode(const Node& node, changeset_cpp::LoggingConfig& rhs) {
        using changeset_cpp::detail::level_from_yaml;
        if (!node.IsMap()) return false;
        const auto defaults = changeset_cpp::LoggingConfig{};
        rhs.console_level = level_from_yaml(node, "console_level", defaults.console_level);
        rhs.file = node["file"].as<std::string>("");
        rhs.file_level = level_from_yaml(node, "file_level", defaults.file_level);
        if (const auto levels = node["levels"]) {
            if (!convert<changeset_cpp::SubsystemLogLevels>::decode(levels, rhs.levels)) return false;
        }
        return true;
    }
};

}  // namespace YAML
