#include <changeset-cpp/loader.hpp>

#include <changeset-cpp/json.hpp>
#include <changeset-cpp/log.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace changeset_cpp {

namespace {

[[noreturn]] void invalid_task(std::string message) {
    throw FileEngineError{ErrorKind::invalid_task, std::move(message)};
}

// -- YAML to JSON -------------------------------------------------------------

auto is_null_scalar(const std::string& s) -> bool {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

auto scalar_to_json(const YAML::Node& node) -> nlohmann::json {
    const auto& text = node.Scalar();
    // Quoted scalars carry the non-specific "!" tag and are always strings.
    if (node.Tag() == "!") return text;

    if (is_null_scalar(text)) return nullptr;
    if (text == "true" || text == "True" || text == "TRUE") return true;
    if (text == "false" || text == "False" || text == "FALSE") return false;

    const auto* first = text.data();
    const auto* last = text.data() + text.size();

    auto integer = std::int64_t{0};
    if (auto [ptr, ec] = std::from_chars(first, last, integer); ec == std::errc{} && ptr == last) {
        return integer;
    }
    auto real = 0.0;
    if (auto [ptr, ec] = std::from_chars(first, last, real); ec == std::errc{} && ptr == last) {
        return real;
    }
    return text;
}

auto yaml_to_json(const YAML::Node& node) -> nlohmann::json {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            auto array = nlohmann::json::array();
            for (const auto& child : node) {
                array.push_back(yaml_to_json(child));
            }
            return array;
        }
        case YAML::NodeType::Map: {
            auto object = nlohmann::json::object();
            for (const auto& entry : node) {
                object[entry.first.as<std::string>()] = yaml_to_json(entry.second);
            }
            return object;
        }
    }
    return nullptr;
}

// -- Files --------------------------------------------------------------------

auto lowercase_extension(const std::filesystem::path& path) -> std::string {
    auto ext = path.extension().string();
    std::ranges::transform(ext, ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

auto read_text_file(const std::filesystem::path& path, ErrorKind kind) -> std::string {
    errno = 0;
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        const auto ec = errno != 0 ? std::error_code{errno, std::generic_category()}
                                   : std::make_error_code(std::errc::io_error);
        throw FileEngineError{Error{kind, "Failed to read file: " + path.string(), path.string(), ec}};
    }
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    return buffer.str();
}

auto decode_document(const std::string& text, const std::string& ext,
                     ErrorKind kind) -> nlohmann::json {
    if (ext == ".json") {
        try {
            return nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            throw FileEngineError{kind, "Failed to parse " + ext + " file: " + e.what()};
        }
    }
    if (ext == ".yaml" || ext == ".yml") {
        try {
            return yaml_to_json(YAML::Load(text));
        } catch (const YAML::Exception& e) {
            throw FileEngineError{kind, "Failed to parse " + ext + " file: " + e.what()};
        }
    }
    throw FileEngineError{kind,
        "Unsupported file format: " + ext + ". Supported formats: .json, .yaml, .yml"};
}

auto absolute_path(const std::filesystem::path& path) -> std::filesystem::path {
    auto ec = std::error_code{};
    const auto absolute = std::filesystem::absolute(path, ec);
    return ec ? path : absolute.lexically_normal();
}

// -- Task fields --------------------------------------------------------------

auto required_text(const nlohmann::json& j, const char* key) -> std::optional<std::string> {
    const auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
        return it->get<std::string>();
    }
    if (it->is_number_integer()) return it->dump();
    return std::nullopt;
}

template <typename T, typename IsType>
auto optional_field(const nlohmann::json& j, const char* key, IsType is_type,
                    const char* type_name) -> std::optional<T> {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (!is_type(*it)) {
        invalid_task(std::string{"Task field \""} + key + "\" must be " + type_name);
    }
    return it->get<T>();
}

}  // anonymous namespace

auto parse_yaml_document(std::string_view yaml_text, ErrorKind error_kind) -> nlohmann::json {
    try {
        return yaml_to_json(YAML::Load(std::string{yaml_text}));
    } catch (const YAML::Exception& e) {
        throw FileEngineError{error_kind, std::string{"Failed to parse YAML: "} + e.what()};
    }
}

auto parse_task(const nlohmann::json& j) -> TaskFile {
    if (!j.is_object()) invalid_task("Task file must contain an object");

    auto task = TaskFile{};

    auto id = required_text(j, "id");
    if (!id) invalid_task("Task file must contain an \"id\" field");
    task.id = std::move(*id);

    const auto objective = j.find("objective");
    if (objective == j.end() || !objective->is_string() ||
        objective->get_ref<const std::string&>().empty()) {
        invalid_task("Task file must contain an \"objective\" field");
    }
    task.objective = objective->get<std::string>();

    const auto context = j.find("contextFiles");
    if (context == j.end() || !context->is_array()) {
        invalid_task("Task file must contain a \"contextFiles\" array");
    }
    for (const auto& entry : *context) {
        if (!entry.is_string()) invalid_task("Task field \"contextFiles\" must contain only strings");
        task.context_files.push_back(entry.get<std::string>());
    }

    task.model = optional_field<std::string>(
        j, "model", [](const nlohmann::json& v) { return v.is_string(); }, "a string");
    task.max_tokens = optional_field<std::int64_t>(
        j, "maxTokens", [](const nlohmann::json& v) { return v.is_number_integer(); }, "an integer");
    task.temperature = optional_field<double>(
        j, "temperature", [](const nlohmann::json& v) { return v.is_number(); }, "a number");

    for (const auto& item : j.items()) {
        const auto& key = item.key();
        if (key != "id" && key != "objective" && key != "contextFiles" && key != "model" &&
            key != "maxTokens" && key != "temperature") {
            task.extra[key] = item.value();
        }
    }
    return task;
}

auto load_task(const std::filesystem::path& path) -> LoadedTask {
    const auto absolute = absolute_path(path);

    auto ec = std::error_code{};
    if (!std::filesystem::is_regular_file(absolute, ec)) {
        invalid_task("Task file not found: " + absolute.string());
    }

    const auto text = read_text_file(absolute, ErrorKind::invalid_task);
    const auto doc = decode_document(text, lowercase_extension(absolute), ErrorKind::invalid_task);
    auto task = parse_task(doc);

    log::Registry::loader()->info("loaded task '{}' from {}", task.id, absolute.string());
    return LoadedTask{std::move(task), absolute};
}

auto load_changes(const std::filesystem::path& path) -> std::vector<FileChange> {
    const auto absolute = absolute_path(path);

    auto ec = std::error_code{};
    if (!std::filesystem::is_regular_file(absolute, ec)) {
        throw FileEngineError{Error{ErrorKind::invalid_change,
            "Change file not found: " + absolute.string(), absolute.string()}};
    }

    const auto text = read_text_file(absolute, ErrorKind::invalid_change);
    const auto doc = decode_document(text, lowercase_extension(absolute), ErrorKind::invalid_change);
    auto changes = parse_changes(doc);

    log::Registry::loader()->info("loaded {} change(s) from {}", changes.size(), absolute.string());
    return changes;
}

}  // namespace changeset_cpp
