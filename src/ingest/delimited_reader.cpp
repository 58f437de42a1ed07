#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <pairdays/config/config_helpers.h>
#include <pairdays/ingest/delimited_reader.h>

namespace pairdays::ingest {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

Row splitLine(std::string_view line, char delimiter) {
    Row fields;
    size_t start = 0;
    while (true) {
        const size_t pos = line.find(delimiter, start);
        std::string field(line.substr(start, pos == std::string_view::npos ? std::string_view::npos
                                                                           : pos - start));
        config::trim(field);
        fields.push_back(std::move(field));
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return fields;
}

} // namespace

std::vector<Row> DelimitedReader::tokenize(std::string_view text) const {
    std::vector<Row> rows;
    if (text.starts_with(kUtf8Bom)) {
        text.remove_prefix(kUtf8Bom.size());
    }

    bool headerPending = options_.skipHeader;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        std::string_view line =
            text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (!config::trimmed(std::string(line)).empty()) {
            if (headerPending) {
                headerPending = false;
            } else {
                rows.push_back(splitLine(line, options_.delimiter));
            }
        }

        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return rows;
}

Result<std::vector<Row>> DelimitedReader::readStream(std::istream& in) const {
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::ReadError, "Error reading input"};
    }
    if (content.find('\0') != std::string::npos) {
        return Error{ErrorCode::ReadError, "Failed to read file content (input is not text)"};
    }

    auto rows = tokenize(content);
    spdlog::debug("Tokenized {} bytes into {} rows", content.size(), rows.size());
    return rows;
}

Result<std::vector<Row>> DelimitedReader::readFile(const fs::path& path) const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Error{ErrorCode::FileNotFound, "File not found: " + path.string()};
    }
    if (fs::is_directory(path, ec)) {
        return Error{ErrorCode::ReadError, "Not a regular file: " + path.string()};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        const int err = errno;
        if (err == EACCES) {
            return Error{ErrorCode::PermissionDenied, "Permission denied: " + path.string()};
        }
        return Error{ErrorCode::ReadError,
                     "Error reading file " + path.string() + ": " + std::strerror(err)};
    }

    auto rows = readStream(file);
    if (!rows) {
        return Error{rows.error().code, rows.error().message + " (" + path.string() + ")"};
    }
    return rows;
}

} // namespace pairdays::ingest
