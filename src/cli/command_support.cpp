#include <spdlog/spdlog.h>
#include <iostream>
#include <pairdays/cli/command_support.h>
#include <pairdays/config/config_helpers.h>

namespace pairdays::cli {

void InputOptions::addTo(CLI::App* cmd) {
    cmd->add_option("input", path, "Assignments file (EmpID, ProjectID, DateFrom, DateTo); '-' for stdin")
        ->required();
    delimiterOpt =
        cmd->add_option("-d,--delimiter", delimiter, "Field delimiter (default ',' or input.delimiter)");
    skipHeaderOpt = cmd->add_flag("--skip-header", skipHeader, "Ignore the first non-blank line");
    cmd->add_option("--today", today,
                    "Date used for empty/NULL date fields, e.g. 2024-01-31 (default: system date)");
}

Result<ingest::ReadOptions> InputOptions::readOptions(const config::AppConfig& cfg) const {
    ingest::ReadOptions options;
    options.delimiter = cfg.delimiter;
    options.skipHeader = cfg.skipHeader;

    if (delimiterOpt && delimiterOpt->count() > 0) {
        auto delim = config::parse_delimiter(delimiter);
        if (!delim) {
            return delim.error();
        }
        options.delimiter = delim.value();
    }
    if (skipHeaderOpt && skipHeaderOpt->count() > 0) {
        options.skipHeader = skipHeader;
    }
    return options;
}

Result<engine::TodayProvider> InputOptions::todayProvider() const {
    if (today.empty()) {
        return engine::TodayProvider{};
    }
    const std::string value = config::trimmed(today);
    auto date = engine::DateNormalizer::parseKnownFormats(value);
    if (!date) {
        date = engine::DateNormalizer::parseFreeForm(value);
    }
    if (!date) {
        return Error{ErrorCode::InvalidArgument, "Invalid --today value '" + today + "'"};
    }
    const Date fixed = *date;
    return engine::TodayProvider{[fixed]() { return fixed; }};
}

Result<std::vector<Row>> InputOptions::readRows(const config::AppConfig& cfg) const {
    auto options = readOptions(cfg);
    if (!options) {
        return options.error();
    }

    ingest::DelimitedReader reader{options.value()};
    if (path == "-") {
        spdlog::debug("Reading assignments from stdin");
        return reader.readStream(std::cin);
    }
    spdlog::debug("Reading assignments from '{}'", path);
    return reader.readFile(config::expand_tilde(path));
}

} // namespace pairdays::cli
