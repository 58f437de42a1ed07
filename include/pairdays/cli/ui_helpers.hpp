#pragma once

// Terminal output helpers for pairdays
// - ANSI color enablement (TTY/NO_COLOR, overridable)
// - Visible-width-safe padding
// - Column-aligned tables
//
// Header-only, no external dependencies.

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#if defined(_WIN32)
#include <io.h>
#define PAIRDAYS_UI_ISATTY _isatty
#define PAIRDAYS_UI_FILENO _fileno
#else
#include <unistd.h>
#define PAIRDAYS_UI_ISATTY isatty
#define PAIRDAYS_UI_FILENO fileno
#endif

namespace pairdays::cli::ui {

struct Ansi {
    static constexpr const char* RESET = "\x1b[0m";
    static constexpr const char* BOLD = "\x1b[1m";
    static constexpr const char* RED = "\x1b[31m";
    static constexpr const char* GREEN = "\x1b[32m";
};

inline bool stdout_is_tty() {
    return PAIRDAYS_UI_ISATTY(PAIRDAYS_UI_FILENO(stdout));
}

enum class ColorMode { Auto, ForceOn, ForceOff };

inline ColorMode& color_mode() {
    static ColorMode m = ColorMode::Auto;
    return m;
}

inline void set_color_mode(ColorMode mode) {
    color_mode() = mode;
}

// Colors enabled if not forced off, NO_COLOR is unset, TERM is not "dumb" and stdout is a TTY
inline bool colors_enabled() {
    ColorMode m = color_mode();
    if (m == ColorMode::ForceOn)
        return true;
    if (m == ColorMode::ForceOff)
        return false;

    if (std::getenv("NO_COLOR"))
        return false;
    const char* term = std::getenv("TERM");
    if (term && std::string_view(term) == "dumb")
        return false;
    return stdout_is_tty();
}

inline std::string colorize(std::string_view s, const char* code) {
    if (!colors_enabled() || code == nullptr || *code == '\0') {
        return std::string(s);
    }
    std::string out;
    out.reserve(s.size() + 16);
    out.append(code);
    out.append(s.data(), s.size());
    out.append(Ansi::RESET);
    return out;
}

inline std::string repeat(char ch, size_t n) {
    return std::string(n, ch);
}

// Visible width treating ANSI CSI sequences as zero-width (ASCII content)
inline size_t visible_width(std::string_view s) {
    size_t w = 0;
    bool in_esc = false;
    for (unsigned char c : s) {
        if (!in_esc) {
            if (c == 0x1B) {
                in_esc = true;
                continue;
            }
            ++w;
        } else if (c >= 0x40 && c <= 0x7E && c != '[') {
            in_esc = false;
        }
    }
    return w;
}

inline std::string pad_right(std::string_view s, size_t width, char fill = ' ') {
    const size_t w = visible_width(s);
    std::string out(s);
    if (w < width)
        out.append(width - w, fill);
    return out;
}

inline std::string pad_left(std::string_view s, size_t width, char fill = ' ') {
    const size_t w = visible_width(s);
    std::string out;
    if (w < width)
        out.append(width - w, fill);
    out.append(s.data(), s.size());
    return out;
}

enum class Align { Left, Right };

struct Table {
    std::vector<std::string> headers;
    std::vector<Align> align; // per column, Left when missing
    std::vector<std::vector<std::string>> rows;

    void add_row(std::vector<std::string> row) { rows.push_back(std::move(row)); }
};

// Render headers, a dashed separator and the rows, columns separated by two spaces
inline void render_table(std::ostream& os, const Table& table) {
    const size_t num_cols = table.headers.size();
    if (num_cols == 0)
        return;

    std::vector<size_t> col_widths(num_cols, 0);
    for (size_t i = 0; i < num_cols; ++i)
        col_widths[i] = visible_width(table.headers[i]);
    for (const auto& row : table.rows) {
        for (size_t i = 0; i < num_cols && i < row.size(); ++i)
            col_widths[i] = std::max(col_widths[i], visible_width(row[i]));
    }

    auto cell = [&](std::string_view text, size_t col) {
        const bool right = col < table.align.size() && table.align[col] == Align::Right;
        return right ? pad_left(text, col_widths[col]) : pad_right(text, col_widths[col]);
    };

    os << "  ";
    for (size_t i = 0; i < num_cols; ++i) {
        if (i > 0)
            os << "  ";
        os << colorize(cell(table.headers[i], i), Ansi::BOLD);
    }
    os << '\n';

    os << "  ";
    for (size_t i = 0; i < num_cols; ++i) {
        if (i > 0)
            os << "  ";
        os << repeat('-', col_widths[i]);
    }
    os << '\n';

    for (const auto& row : table.rows) {
        os << "  ";
        for (size_t i = 0; i < num_cols; ++i) {
            if (i > 0)
                os << "  ";
            os << cell(i < row.size() ? row[i] : std::string_view{}, i);
        }
        os << '\n';
    }
}

} // namespace pairdays::cli::ui
