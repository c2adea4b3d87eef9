#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "html2org/core/config.h"

namespace html2org::table {

enum class Alignment {
    Default,  // centered for header/footer; numbers right, text left in the body
    Center,
    Right,
    Left,
};

struct Borders {
    bool left = true;
    bool top = true;
    bool right = true;
    bool bottom = true;
};

struct TableStyle {
    bool auto_format_headers = true;
    bool auto_wrap_text = true;
    bool reflow_during_auto_wrap = true;
    std::size_t column_width = core::config::kDefaultTableColumnWidth;
    std::string column_separator = "|";
    std::string row_separator = "-";
    std::string center_separator = "+";
    Alignment header_alignment = Alignment::Default;
    Alignment footer_alignment = Alignment::Default;
    Alignment alignment = Alignment::Default;
    std::vector<Alignment> column_alignment;
    std::string new_line = "\n";
    bool header_line = true;
    bool row_line = false;
    bool auto_merge_cells = false;
    Borders borders;
};

// Lays out header, body and footer cells as a fixed-width text table.
// Cell text may contain newlines; widths are counted in code points.
class AsciiTable {
public:
    explicit AsciiTable(TableStyle style = {});

    void set_header(const std::vector<std::string>& header);
    void set_footer(const std::vector<std::string>& footer);
    void append(const std::vector<std::string>& row);
    void append_bulk(const std::vector<std::vector<std::string>>& rows);

    std::size_t column_count() const { return widths_.size(); }
    std::string render() const;

private:
    using Cell = std::vector<std::string>;

    Cell measure_cell(const std::string& text, std::size_t column);
    void render_line(std::string& out, const std::vector<bool>& blank_columns) const;
    void render_cells(std::string& out, const std::vector<Cell>& cells, Alignment alignment,
                      bool format_headers, bool body_row) const;

    TableStyle style_;
    std::vector<std::size_t> widths_;
    std::vector<Cell> header_;
    std::vector<Cell> footer_;
    std::vector<std::vector<Cell>> rows_;
    std::vector<std::vector<std::string>> raw_rows_;
};

std::size_t display_width(const std::string& text);

// Minimum-raggedness word wrap; a single word wider than `limit` widens it.
std::vector<std::string> wrap_text(const std::string& text, std::size_t limit);

}  // namespace html2org::table
