#include <fstream>
#include <pairdays/config/config_helpers.h>

namespace pairdays::config {

namespace {

// Drop a trailing "# comment" that is not inside quotes
std::string strip_inline_comment(const std::string& value) {
    char quote = '\0';
    for (size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (quote != '\0') {
            if (c == quote)
                quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return value.substr(0, i);
        }
    }
    return value;
}

} // namespace

std::optional<bool> parse_bool(std::string_view value) {
    const std::string lower = to_lower(trimmed(std::string(value)));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on")
        return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off")
        return false;
    return std::nullopt;
}

Result<char> parse_delimiter(std::string_view value) {
    std::string v(value);
    if (v == "\\t" || to_lower(v) == "tab") {
        return '\t';
    }
    if (v.size() != 1) {
        return Error{ErrorCode::InvalidArgument,
                     "Delimiter must be a single character (got '" + v + "')"};
    }
    if (v[0] == '\n' || v[0] == '\r') {
        return Error{ErrorCode::InvalidArgument, "Delimiter cannot be a line break"};
    }
    return v[0];
}

std::map<std::string, std::string> parse_simple_toml(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file) {
        return config;
    }

    std::string line;
    std::string currentSection;

    while (std::getline(file, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#')
            continue;

        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        std::string key = line.substr(0, eq);
        trim(key);
        std::string value = unquote(strip_inline_comment(line.substr(eq + 1)));

        config[currentSection.empty() ? key : currentSection + "." + key] = value;
    }

    return config;
}

std::filesystem::path get_config_dir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "pairdays";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".config" / "pairdays";
    }
    return std::filesystem::path(".pairdays");
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }
    if (const char* env = std::getenv("PAIRDAYS_CONFIG"); env && *env) {
        return expand_tilde(env);
    }
    return get_config_dir() / "config.toml";
}

} // namespace pairdays::config
