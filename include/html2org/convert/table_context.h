#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "html2org/convert/options.h"

namespace html2org::convert {

// Cell text captured while rendering one table element.
class TableContext {
public:
    void begin_row();
    void end_row();

    void add_header_cell(std::string text);
    // Appends to the footer while in a footer section, else to the current row.
    void add_data_cell(std::string text);

    void set_in_footer(bool in_footer) { in_footer_ = in_footer; }
    bool in_footer() const { return in_footer_; }

    const std::vector<std::string>& header() const { return header_; }
    const std::vector<std::vector<std::string>>& body() const { return body_; }
    const std::vector<std::string>& footer() const { return footer_; }

private:
    std::vector<std::string> header_;
    std::vector<std::vector<std::string>> body_;
    std::vector<std::string> footer_;
    std::size_t current_row_ = 0;
    bool in_footer_ = false;
};

// Lays the captured cells out as a text table. With org_format on, the outer
// border lines are dropped and border corners become column separators.
std::string format_table(const TableContext& table, const Options& options);

}  // namespace html2org::convert
