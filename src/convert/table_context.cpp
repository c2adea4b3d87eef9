#include "html2org/convert/table_context.h"

#include <utility>

#include "html2org/table/ascii_table.h"

namespace html2org::convert {
namespace {

bool starts_with(const std::string& text, const std::string& prefix) {
    return !prefix.empty() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return !suffix.empty() && text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Turns "+---+---+" rows into "|---+---|".
std::string replace_border_corners(const std::string& text, const table::TableStyle& style) {
    const std::string& corner = style.center_separator;
    std::string out;
    std::size_t start = 0;
    while (start <= text.size()) {
        const std::size_t end = text.find('\n', start);
        std::string line = text.substr(start, end == std::string::npos ? std::string::npos
                                                                       : end - start);
        if (starts_with(line, corner) && line.size() >= 2 * corner.size()) {
            line.replace(0, corner.size(), style.column_separator);
            if (ends_with(line, corner)) {
                line.replace(line.size() - corner.size(), corner.size(), style.column_separator);
            }
        }
        out += line;
        if (end == std::string::npos) {
            break;
        }
        out.push_back('\n');
        start = end + 1;
    }
    return out;
}

std::string to_org_table(std::string text, const table::TableStyle& style) {
    while (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }

    const std::string& corner = style.center_separator;
    const std::size_t last_break = text.rfind('\n');
    if (last_break != std::string::npos &&
        text.find(corner, last_break) != std::string::npos) {
        text.erase(last_break);
    }

    const std::size_t first_break = text.find('\n');
    if (first_break != std::string::npos &&
        text.substr(0, first_break).find(corner) != std::string::npos) {
        text.erase(0, first_break);
    }

    return replace_border_corners(text, style);
}

}  // namespace

void TableContext::begin_row() {
    body_.emplace_back();
}

void TableContext::end_row() {
    ++current_row_;
}

void TableContext::add_header_cell(std::string text) {
    header_.push_back(std::move(text));
}

void TableContext::add_data_cell(std::string text) {
    if (in_footer_) {
        footer_.push_back(std::move(text));
        return;
    }
    // A cell outside any row starts one.
    if (current_row_ >= body_.size()) {
        body_.resize(current_row_ + 1);
    }
    body_[current_row_].push_back(std::move(text));
}

std::string format_table(const TableContext& table, const Options& options) {
    const PrettyTableOptions pretty =
        options.pretty_table_options ? *options.pretty_table_options : PrettyTableOptions{};

    table::AsciiTable layout(pretty.style);
    layout.set_header(table.header());
    layout.append_bulk(table.body());
    layout.set_footer(table.footer());

    std::string text = layout.render();
    if (pretty.org_format) {
        text = to_org_table(std::move(text), pretty.style);
    }
    return text;
}

}  // namespace html2org::convert
