#pragma once

#include <pairdays/core/types.h>

#include <filesystem>
#include <istream>
#include <string_view>
#include <vector>

namespace pairdays::ingest {

struct ReadOptions {
    char delimiter = ',';
    bool skipHeader = false; // drop the first non-blank row
};

/**
 * Splits delimited text into trimmed fields.
 *
 * Lines end at '\n' (a trailing '\r' is dropped), blank lines are skipped and
 * every line is split on the delimiter. Quoting is not supported: a delimiter
 * inside quotes still splits the field.
 */
class DelimitedReader {
public:
    explicit DelimitedReader(ReadOptions options = {}) : options_(options) {}

    std::vector<Row> tokenize(std::string_view text) const;

    Result<std::vector<Row>> readFile(const std::filesystem::path& path) const;

    Result<std::vector<Row>> readStream(std::istream& in) const;

private:
    ReadOptions options_;
};

} // namespace pairdays::ingest
