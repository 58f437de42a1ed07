#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <pairdays/config/app_config.h>
#include <pairdays/config/config_helpers.h>

namespace pairdays::config {

namespace {

constexpr std::array<const char*, 10> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off", "none"};

bool oneOf(const std::string& value, std::initializer_list<const char*> options) {
    for (const char* option : options) {
        if (value == option)
            return true;
    }
    return false;
}

Error invalidValue(const std::string& key, const std::string& value, const char* expected) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value '" + value + "' for " + key + " (expected " + expected + ")"};
}

} // namespace

Result<AppConfig> load_app_config(const std::filesystem::path& path) {
    AppConfig cfg;
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        return cfg;
    }

    const auto values = parse_simple_toml(path);
    cfg.source = path;

    if (auto it = values.find("input.delimiter"); it != values.end()) {
        auto delim = parse_delimiter(it->second);
        if (!delim) {
            return Error{delim.error().code, "input.delimiter: " + delim.error().message};
        }
        cfg.delimiter = delim.value();
    }

    if (auto it = values.find("input.skip_header"); it != values.end()) {
        auto flag = parse_bool(it->second);
        if (!flag) {
            return invalidValue("input.skip_header", it->second, "true|false");
        }
        cfg.skipHeader = *flag;
    }

    if (auto it = values.find("report.view"); it != values.end()) {
        const std::string view = to_lower(it->second);
        if (!oneOf(view, {"top", "all"})) {
            return invalidValue("report.view", it->second, "top|all");
        }
        cfg.view = view;
    }

    if (auto it = values.find("output.json"); it != values.end()) {
        auto flag = parse_bool(it->second);
        if (!flag) {
            return invalidValue("output.json", it->second, "true|false");
        }
        cfg.json = *flag;
    }

    if (auto it = values.find("output.color"); it != values.end()) {
        const std::string color = to_lower(it->second);
        if (!oneOf(color, {"auto", "always", "never"})) {
            return invalidValue("output.color", it->second, "auto|always|never");
        }
        cfg.color = color;
    }

    if (auto it = values.find("logging.level"); it != values.end()) {
        const std::string level = to_lower(it->second);
        if (std::find(kLogLevels.begin(), kLogLevels.end(), level) == kLogLevels.end()) {
            return invalidValue("logging.level", it->second,
                                "trace|debug|info|warn|error|critical|off");
        }
        cfg.logLevel = level;
    }

    spdlog::debug("Loaded config from '{}' ({} keys)", path.string(), values.size());
    return cfg;
}

} // namespace pairdays::config
