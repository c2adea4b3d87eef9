#include "html2org/table/ascii_table.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <utility>

namespace html2org::table {
namespace {

constexpr long long kOverflowPenalty = 100000;

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = text.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += parts[i];
    }
    return joined;
}

std::string repeat(const std::string& unit, std::size_t count) {
    std::string out;
    out.reserve(unit.size() * count);
    for (std::size_t i = 0; i < count; ++i) {
        out += unit;
    }
    return out;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_space_or_digit(char c) {
    return c == ' ' || is_digit(c);
}

std::string trim_spaces(const std::string& text) {
    const std::size_t first = text.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return {};
    }
    const std::size_t last = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(first, last - first + 1);
}

// Matches "1", "-1,234.5", ".5" and the same with a trailing '%'.
bool looks_numeric(const std::string& raw) {
    std::string text = trim_spaces(raw);
    if (!text.empty() && text.back() == '%') {
        text.pop_back();
    }
    std::size_t pos = 0;
    if (pos < text.size() && text[pos] == '-') {
        ++pos;
    }
    const std::size_t int_start = pos;
    std::size_t group = 0;
    bool grouped = false;
    while (pos < text.size() && (is_digit(text[pos]) || text[pos] == ',')) {
        if (text[pos] == ',') {
            if (group == 0 || group > 3 || (grouped && group != 3)) {
                return false;
            }
            grouped = true;
            group = 0;
        } else {
            ++group;
        }
        ++pos;
    }
    if (grouped && group != 3) {
        return false;
    }
    const bool has_int = pos > int_start;
    bool has_fraction = false;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        const std::size_t fraction_start = pos;
        while (pos < text.size() && is_digit(text[pos])) {
            ++pos;
        }
        has_fraction = pos > fraction_start;
        if (!has_fraction) {
            return false;
        }
    }
    return pos == text.size() && (has_int || has_fraction);
}

std::string format_header(const std::string& text) {
    std::string name = text;
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (name[i] == '_') {
            name[i] = ' ';
        } else if (name[i] == '.') {
            // "0.0" keeps its dot.
            const bool prev_ok = i == 0 || is_space_or_digit(name[i - 1]);
            const bool next_ok = i + 1 == name.size() || is_space_or_digit(name[i + 1]);
            if (!prev_ok || !next_ok) {
                name[i] = ' ';
            }
        }
    }
    std::string trimmed = trim_spaces(name);
    if (trimmed.empty() && !text.empty()) {
        trimmed = " ";
    }
    for (char& c : trimmed) {
        if (static_cast<unsigned char>(c) < 0x80) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return trimmed;
}

std::string pad_text(const std::string& text, std::size_t width, Alignment alignment,
                     bool body_row) {
    const std::size_t used = display_width(text);
    const std::size_t gap = width > used ? width - used : 0;

    if (alignment == Alignment::Default) {
        if (!body_row) {
            alignment = Alignment::Center;
        } else {
            alignment = looks_numeric(text) ? Alignment::Right : Alignment::Left;
        }
    }

    switch (alignment) {
        case Alignment::Right:
            return std::string(gap, ' ') + text;
        case Alignment::Left:
            return text + std::string(gap, ' ');
        case Alignment::Center:
        case Alignment::Default:
            break;
    }
    const std::size_t left = gap / 2;
    return std::string(left, ' ') + text + std::string(gap - left, ' ');
}

}  // namespace

std::size_t display_width(const std::string& text) {
    std::size_t width = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::vector<std::string> wrap_text(const std::string& text, std::size_t limit) {
    std::string flat = text;
    std::replace(flat.begin(), flat.end(), '\n', ' ');
    const std::vector<std::string> words = split(flat, ' ');

    for (const auto& word : words) {
        limit = std::max(limit, display_width(word));
    }

    const std::size_t n = words.size();
    // length[i][j]: width of words i..j joined by single spaces.
    std::vector<std::vector<long long>> length(n, std::vector<long long>(n, 0));
    for (std::size_t i = 0; i < n; ++i) {
        length[i][i] = static_cast<long long>(display_width(words[i]));
        for (std::size_t j = i + 1; j < n; ++j) {
            length[i][j] = length[i][j - 1] + 1 + static_cast<long long>(display_width(words[j]));
        }
    }

    const long long lim = static_cast<long long>(limit);
    std::vector<std::size_t> next_break(n, n);
    std::vector<long long> cost(n, std::numeric_limits<long long>::max());
    for (std::size_t k = n; k > 0; --k) {
        const std::size_t i = k - 1;
        if (length[i][n - 1] <= lim) {
            cost[i] = 0;
            next_break[i] = n;
            continue;
        }
        for (std::size_t j = i + 1; j < n; ++j) {
            const long long slack = lim - length[i][j - 1];
            long long candidate = slack * slack + cost[j];
            if (length[i][j - 1] > lim) {
                candidate += kOverflowPenalty;
            }
            if (candidate < cost[i]) {
                cost[i] = candidate;
                next_break[i] = j;
            }
        }
    }

    std::vector<std::string> lines;
    for (std::size_t i = 0; i < n; i = next_break[i]) {
        std::vector<std::string> line(words.begin() + static_cast<std::ptrdiff_t>(i),
                                      words.begin() + static_cast<std::ptrdiff_t>(next_break[i]));
        lines.push_back(join(line, " "));
    }
    return lines;
}

AsciiTable::AsciiTable(TableStyle style) : style_(std::move(style)) {}

AsciiTable::Cell AsciiTable::measure_cell(const std::string& text, std::size_t column) {
    Cell lines = split(text, '\n');
    std::size_t width = 0;
    for (const auto& line : lines) {
        width = std::max(width, display_width(line));
    }

    if (style_.auto_wrap_text) {
        width = std::min(width, style_.column_width);
        std::size_t wrapped_width = width;
        if (style_.reflow_during_auto_wrap) {
            lines = {join(lines, " ")};
        }
        Cell wrapped;
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) {
                wrapped.emplace_back();
            }
            for (auto& line : wrap_text(lines[i], width)) {
                wrapped_width = std::max(wrapped_width, display_width(line));
                wrapped.push_back(std::move(line));
            }
        }
        lines = std::move(wrapped);
        width = wrapped_width;
    }

    if (widths_.size() <= column) {
        widths_.resize(column + 1, 0);
    }
    widths_[column] = std::max(widths_[column], width);
    return lines;
}

void AsciiTable::set_header(const std::vector<std::string>& header) {
    header_.clear();
    for (std::size_t i = 0; i < header.size(); ++i) {
        header_.push_back(measure_cell(header[i], i));
    }
}

void AsciiTable::set_footer(const std::vector<std::string>& footer) {
    footer_.clear();
    for (std::size_t i = 0; i < footer.size(); ++i) {
        footer_.push_back(measure_cell(footer[i], i));
    }
}

void AsciiTable::append(const std::vector<std::string>& row) {
    std::vector<Cell> cells;
    for (std::size_t i = 0; i < row.size(); ++i) {
        cells.push_back(measure_cell(row[i], i));
    }
    rows_.push_back(std::move(cells));
    raw_rows_.push_back(row);
}

void AsciiTable::append_bulk(const std::vector<std::vector<std::string>>& rows) {
    for (const auto& row : rows) {
        append(row);
    }
}

void AsciiTable::render_line(std::string& out, const std::vector<bool>& blank_columns) const {
    if (style_.borders.left) {
        out += style_.center_separator;
    }
    for (std::size_t i = 0; i < widths_.size(); ++i) {
        const std::string& fill = blank_columns[i] ? std::string(" ") : style_.row_separator;
        out += repeat(fill, widths_[i] + 2);
        if (i + 1 < widths_.size() || style_.borders.right) {
            out += style_.center_separator;
        }
    }
    out += style_.new_line;
}

void AsciiTable::render_cells(std::string& out, const std::vector<Cell>& cells,
                              Alignment alignment, bool format_headers, bool body_row) const {
    std::size_t height = 0;
    for (const auto& cell : cells) {
        height = std::max(height, cell.size());
    }

    for (std::size_t line = 0; line < height; ++line) {
        if (style_.borders.left) {
            out += style_.column_separator;
        }
        for (std::size_t col = 0; col < widths_.size(); ++col) {
            std::string text;
            if (col < cells.size() && line < cells[col].size()) {
                text = cells[col][line];
            }
            if (format_headers) {
                text = format_header(text);
            }
            Alignment column_alignment = alignment;
            if (body_row && col < style_.column_alignment.size()) {
                column_alignment = style_.column_alignment[col];
            }
            out += " " + pad_text(text, widths_[col], column_alignment, body_row) + " ";
            if (col + 1 < widths_.size() || style_.borders.right) {
                out += style_.column_separator;
            }
        }
        out += style_.new_line;
    }
}

std::string AsciiTable::render() const {
    std::string out;
    if (widths_.empty()) {
        return out;
    }

    const std::vector<bool> solid(widths_.size(), false);
    if (style_.borders.top) {
        render_line(out, solid);
    }

    if (!header_.empty()) {
        render_cells(out, header_, style_.header_alignment, style_.auto_format_headers, false);
        if (style_.header_line) {
            render_line(out, solid);
        }
    }

    bool printed_row = false;
    const std::vector<std::string>* previous = nullptr;
    for (std::size_t r = 0; r < rows_.size(); ++r) {
        if (rows_[r].empty()) {
            continue;
        }

        std::vector<Cell> cells = rows_[r];
        std::vector<bool> merged(widths_.size(), false);
        if (style_.auto_merge_cells && previous != nullptr) {
            const std::vector<std::string>& raw = raw_rows_[r];
            for (std::size_t col = 0; col < raw.size() && col < previous->size(); ++col) {
                if (!raw[col].empty() && raw[col] == (*previous)[col]) {
                    merged[col] = true;
                    cells[col] = Cell{};
                }
            }
        }

        if (style_.row_line && printed_row) {
            render_line(out, merged);
        }
        render_cells(out, cells, style_.alignment, false, true);
        printed_row = true;
        previous = &raw_rows_[r];
    }

    if ((style_.row_line && printed_row) || style_.borders.bottom) {
        render_line(out, solid);
    }

    if (!footer_.empty()) {
        render_cells(out, footer_, style_.footer_alignment, style_.auto_format_headers, false);
        if (style_.borders.bottom) {
            render_line(out, solid);
        }
    }
    return out;
}

}  // namespace html2org::table
