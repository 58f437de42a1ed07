#pragma once

#include <pairdays/core/types.h>

#include <filesystem>
#include <string>

namespace pairdays::config {

/**
 * Effective settings for a run. Defaults apply for anything the config file
 * does not set; command-line flags are layered on top by the CLI.
 */
struct AppConfig {
    // [input]
    char delimiter = ',';
    bool skipHeader = false;

    // [report]
    std::string view = "top";

    // [output]
    bool json = false;
    std::string color = "auto"; // auto | always | never

    // [logging]
    std::string logLevel = "warn";

    // File the values were read from; empty when defaults were used
    std::filesystem::path source;
};

/**
 * @brief Load settings from a TOML-subset file
 *
 * A missing file is not an error and yields defaults. Present but invalid
 * values (unknown view, multi-character delimiter, ...) fail with
 * ErrorCode::InvalidArgument naming the offending key.
 */
Result<AppConfig> load_app_config(const std::filesystem::path& path);

} // namespace pairdays::config
