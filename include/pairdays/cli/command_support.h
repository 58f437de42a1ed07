#pragma once

#include <CLI/CLI.hpp>
#include <optional>
#include <string>
#include <vector>
#include <pairdays/cli/pairdays_cli.h>
#include <pairdays/core/types.h>
#include <pairdays/engine/date_normalizer.h>
#include <pairdays/ingest/delimited_reader.h>

namespace pairdays::cli {

/**
 * Input options shared by commands that read assignment files.
 * Flags given on the command line override the [input] config section.
 */
struct InputOptions {
    std::string path;
    std::string delimiter;
    bool skipHeader = false;
    std::string today;

    CLI::Option* delimiterOpt = nullptr;
    CLI::Option* skipHeaderOpt = nullptr;

    void addTo(CLI::App* cmd);

    // Merge with config; fails on a bad delimiter
    Result<ingest::ReadOptions> readOptions(const config::AppConfig& cfg) const;

    // Fixed clock from --today, empty provider when unset
    Result<engine::TodayProvider> todayProvider() const;

    // Read `path`, or stdin when it is "-"
    Result<std::vector<Row>> readRows(const config::AppConfig& cfg) const;
};

} // namespace pairdays::cli
