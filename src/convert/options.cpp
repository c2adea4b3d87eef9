#include "html2org/convert/options.h"

namespace html2org::convert {

PrettyTableOptions make_default_pretty_table_options() {
    PrettyTableOptions options;
    options.style.auto_format_headers = true;
    options.style.auto_wrap_text = false;
    options.style.reflow_during_auto_wrap = true;
    options.style.column_width = core::config::kDefaultTableColumnWidth;
    options.style.column_separator = "|";
    options.style.row_separator = "-";
    options.style.center_separator = "+";
    options.style.header_alignment = table::Alignment::Default;
    options.style.footer_alignment = table::Alignment::Default;
    options.style.alignment = table::Alignment::Default;
    options.style.header_line = true;
    options.style.row_line = false;
    options.style.auto_merge_cells = false;
    options.style.borders = table::Borders{};
    options.org_format = true;
    return options;
}

}  // namespace html2org::convert
