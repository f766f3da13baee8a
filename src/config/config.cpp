#include "config/config.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <limits>

namespace fs = std::filesystem;

namespace docforge::config {

namespace {

enum class SettingType : uint8_t { String, Integer, Number, Bool, StringList };

struct SettingInfo {
    std::string_view key;
    SettingType type;
};

constexpr SettingInfo SETTINGS[] = {
    {"style", SettingType::String},
    {"max_iterations", SettingType::Integer},
    {"threshold", SettingType::Number},
    {"overwrite", SettingType::Bool},
    {"skip_existing", SettingType::Bool},
    {"backend.command", SettingType::String},
    {"backend.args", SettingType::StringList},
    {"backend.timeout_seconds", SettingType::Integer},
    {"backend.evaluate", SettingType::Bool},
    {"batch.jobs", SettingType::Integer},
    {"batch.element_jobs", SettingType::Integer},
    {"batch.recursive", SettingType::Bool},
    {"batch.extensions", SettingType::StringList},
    {"batch.dry_run", SettingType::Bool},
    {"report.json_path", SettingType::String},
};

struct EnvBinding {
    const char* variable;
    const char* key;
};

constexpr EnvBinding ENV_BINDINGS[] = {
    {"DOCFORGE_STYLE", "style"},
    {"DOCFORGE_MAX_ITERATIONS", "max_iterations"},
    {"DOCFORGE_THRESHOLD", "threshold"},
    {"DOCFORGE_OVERWRITE", "overwrite"},
    {"DOCFORGE_BACKEND_COMMAND", "backend.command"},
    {"DOCFORGE_JOBS", "batch.jobs"},
};

auto find_setting(std::string_view key) -> const SettingInfo* {
    for (const auto& info : SETTINGS) {
        if (info.key == key) {
            return &info;
        }
    }
    return nullptr;
}

auto type_name(SettingType type) -> const char* {
    switch (type) {
    case SettingType::String:
        return "a string";
    case SettingType::Integer:
        return "an integer";
    case SettingType::Number:
        return "a number";
    case SettingType::Bool:
        return "a boolean";
    case SettingType::StringList:
        return "an array of strings";
    }
    return "a value";
}

auto expect_string(const RcValue& value) -> const std::string* {
    return std::get_if<std::string>(&value);
}

auto expect_integer(const RcValue& value) -> std::optional<int64_t> {
    const auto* number = std::get_if<double>(&value);
    if (number == nullptr || std::floor(*number) != *number ||
        std::abs(*number) > static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return std::nullopt;
    }
    return static_cast<int64_t>(*number);
}

auto split_list(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        auto end = comma == std::string_view::npos ? text.size() : comma;
        auto item = text.substr(start, end - start);
        auto first = item.find_first_not_of(" \t");
        if (first != std::string_view::npos) {
            auto last = item.find_last_not_of(" \t");
            items.emplace_back(item.substr(first, last - first + 1));
        }
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return items;
}

} // namespace

// ============================================================================
// Errors and Serialization
// ============================================================================

auto ConfigError::to_string() const -> std::string {
    std::string out = origin;
    if (line > 0) {
        out += ":" + std::to_string(line);
    }
    if (!out.empty()) {
        out += ": ";
    }
    return out + message;
}

auto Config::to_json() const -> json::JsonValue {
    auto backend_obj = json::json_object();
    backend_obj.set("command", json::JsonValue(backend.command));
    backend_obj.set("args", json::json_string_array(backend.args));
    backend_obj.set("timeout_seconds", json::JsonValue(backend.timeout_seconds));
    backend_obj.set("evaluate", json::JsonValue(backend.evaluate));

    auto batch_obj = json::json_object();
    batch_obj.set("jobs", json::JsonValue(batch.jobs));
    batch_obj.set("element_jobs", json::JsonValue(batch.element_jobs));
    batch_obj.set("recursive", json::JsonValue(batch.recursive));
    batch_obj.set("extensions", json::json_string_array(batch.extensions));
    batch_obj.set("dry_run", json::JsonValue(batch.dry_run));

    auto obj = json::json_object();
    obj.set("style", json::JsonValue(doc::style_name(style)));
    obj.set("max_iterations", json::JsonValue(static_cast<int64_t>(max_iterations)));
    obj.set("threshold", json::JsonValue(threshold));
    obj.set("overwrite", json::JsonValue(overwrite));
    obj.set("skip_existing", json::JsonValue(skip_existing));
    obj.set("backend", std::move(backend_obj));
    obj.set("batch", std::move(batch_obj));
    return obj;
}

// ============================================================================
// Settings
// ============================================================================

auto apply_setting(Config& config, const std::string& key, const RcValue& value)
    -> std::optional<std::string> {
    const auto* info = find_setting(key);
    if (info == nullptr) {
        return "unknown key '" + key + "'";
    }
    auto mismatch = [&]() -> std::optional<std::string> {
        return "'" + key + "' must be " + type_name(info->type);
    };

    switch (info->type) {
    case SettingType::String: {
        const auto* text = expect_string(value);
        if (text == nullptr) {
            return mismatch();
        }
        if (key == "style") {
            auto style = doc::parse_style(*text);
            if (!style) {
                return "unknown style '" + *text + "' (expected google, numpy or rst)";
            }
            config.style = *style;
        } else if (key == "backend.command") {
            config.backend.command = *text;
        } else if (key == "report.json_path") {
            config.report.json_path = *text;
        }
        return std::nullopt;
    }

    case SettingType::Integer: {
        auto number = expect_integer(value);
        if (!number) {
            return mismatch();
        }
        if (key == "max_iterations") {
            if (*number < 1) {
                return "max_iterations must be at least 1";
            }
            config.max_iterations = static_cast<uint32_t>(*number);
        } else if (key == "backend.timeout_seconds") {
            if (*number < 1) {
                return "backend.timeout_seconds must be at least 1";
            }
            config.backend.timeout_seconds = static_cast<int>(*number);
        } else if (key == "batch.jobs") {
            if (*number < 0) {
                return "batch.jobs must not be negative";
            }
            config.batch.jobs = static_cast<size_t>(*number);
        } else if (key == "batch.element_jobs") {
            if (*number < 1) {
                return "batch.element_jobs must be at least 1";
            }
            config.batch.element_jobs = static_cast<size_t>(*number);
        }
        return std::nullopt;
    }

    case SettingType::Number: {
        const auto* number = std::get_if<double>(&value);
        if (number == nullptr) {
            return mismatch();
        }
        if (!(*number >= 0.0 && *number <= MAX_THRESHOLD)) {
            return "threshold must be between 0 and 2";
        }
        config.threshold = *number;
        return std::nullopt;
    }

    case SettingType::Bool: {
        const auto* flag = std::get_if<bool>(&value);
        if (flag == nullptr) {
            return mismatch();
        }
        if (key == "overwrite") {
            config.overwrite = *flag;
        } else if (key == "skip_existing") {
            config.skip_existing = *flag;
        } else if (key == "backend.evaluate") {
            config.backend.evaluate = *flag;
        } else if (key == "batch.recursive") {
            config.batch.recursive = *flag;
        } else if (key == "batch.dry_run") {
            config.batch.dry_run = *flag;
        }
        return std::nullopt;
    }

    case SettingType::StringList: {
        const auto* items = std::get_if<std::vector<std::string>>(&value);
        if (items == nullptr) {
            return mismatch();
        }
        if (key == "backend.args") {
            config.backend.args = *items;
        } else if (key == "batch.extensions") {
            config.batch.extensions = *items;
        }
        return std::nullopt;
    }
    }
    return mismatch();
}

auto apply_setting_text(Config& config, const std::string& key, std::string_view text)
    -> std::optional<std::string> {
    const auto* info = find_setting(key);
    if (info == nullptr) {
        return "unknown key '" + key + "'";
    }

    switch (info->type) {
    case SettingType::String:
        return apply_setting(config, key, RcValue(std::string(text)));
    case SettingType::Integer:
    case SettingType::Number: {
        std::string digits(text);
        char* end = nullptr;
        double number = std::strtod(digits.c_str(), &end);
        if (digits.empty() || end != digits.c_str() + digits.size()) {
            return "'" + key + "' must be " + type_name(info->type) + ", got '" + digits + "'";
        }
        return apply_setting(config, key, RcValue(number));
    }
    case SettingType::Bool: {
        if (text == "true" || text == "1" || text == "yes" || text == "on") {
            return apply_setting(config, key, RcValue(true));
        }
        if (text == "false" || text == "0" || text == "no" || text == "off") {
            return apply_setting(config, key, RcValue(false));
        }
        return "'" + key + "' must be a boolean, got '" + std::string(text) + "'";
    }
    case SettingType::StringList:
        return apply_setting(config, key, RcValue(split_list(text)));
    }
    return "unsupported key '" + key + "'";
}

// ============================================================================
// Layers
// ============================================================================

auto process_env() -> EnvLookup {
    return [](const char* name) -> std::optional<std::string> {
        const char* value = std::getenv(name);
        if (value == nullptr || *value == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

auto apply_rc(Config config, const RcDocument& document) -> Result<Config, ConfigError> {
    for (const auto& entry : document.entries) {
        if (find_setting(entry.key) == nullptr) {
            DOCFORGE_LOG_WARN("config", document.path << ":" << entry.line << ": unknown key '"
                                                      << entry.key << "' ignored");
            continue;
        }
        if (auto error = apply_setting(config, entry.key, entry.value)) {
            return ConfigError{.message = *error, .origin = document.path, .line = entry.line};
        }
    }
    return config;
}

auto apply_env(Config config, const EnvLookup& env) -> Result<Config, ConfigError> {
    if (!env) {
        return config;
    }
    for (const auto& binding : ENV_BINDINGS) {
        auto value = env(binding.variable);
        if (!value) {
            continue;
        }
        DOCFORGE_LOG_DEBUG("config", binding.variable << " sets " << binding.key);
        if (auto error = apply_setting_text(config, binding.key, *value)) {
            return ConfigError{.message = std::string(binding.variable) + ": " + *error,
                               .origin = "environment",
                               .line = 0};
        }
    }
    return config;
}

auto validate(const Config& config) -> std::optional<ConfigError> {
    auto error = [](std::string message) {
        return ConfigError{.message = std::move(message), .origin = "", .line = 0};
    };
    if (config.max_iterations < 1) {
        return error("max_iterations must be at least 1");
    }
    if (!(config.threshold >= 0.0 && config.threshold <= MAX_THRESHOLD)) {
        return error("threshold must be between 0 and 2");
    }
    if (config.backend.timeout_seconds < 1) {
        return error("backend.timeout_seconds must be at least 1");
    }
    if (config.batch.element_jobs < 1) {
        return error("batch.element_jobs must be at least 1");
    }
    if (config.batch.extensions.empty()) {
        return error("batch.extensions must not be empty");
    }
    return std::nullopt;
}

auto load_config(const LoadOptions& options) -> Result<Config, ConfigError> {
    Config config;

    std::optional<std::string> rc_path = options.config_path;
    if (!rc_path) {
        auto candidate = fs::path(options.working_dir) / RC_FILENAME;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            rc_path = candidate.string();
        }
    }
    if (rc_path) {
        DOCFORGE_LOG_INFO("config", "Loading " << *rc_path);
        auto document = load_rc_file(*rc_path);
        if (is_err(document)) {
            return unwrap_err(document);
        }
        auto layered = apply_rc(std::move(config), unwrap(document));
        if (is_err(layered)) {
            return unwrap_err(layered);
        }
        config = std::move(unwrap(layered));
    }

    auto with_env = apply_env(std::move(config), options.env);
    if (is_err(with_env)) {
        return unwrap_err(with_env);
    }
    config = std::move(unwrap(with_env));

    for (const auto& [key, text] : options.overrides) {
        if (auto error = apply_setting_text(config, key, text)) {
            return ConfigError{.message = *error, .origin = "command line", .line = 0};
        }
    }

    if (auto error = validate(config)) {
        return *error;
    }
    return config;
}

} // namespace docforge::config
