#pragma once

#include <optional>
#include <string>

#include "html2org/table/ascii_table.h"

namespace html2org::convert {

struct PrettyTableOptions {
    table::TableStyle style;
    // Strip the outer border lines so the result reads as an Org table.
    bool org_format = true;
};

// Style used by callers that want wide tables without wrapping.
PrettyTableOptions make_default_pretty_table_options();

struct Options {
    bool pretty_tables = false;
    // When unset, pretty tables use the default TableStyle.
    std::optional<PrettyTableOptions> pretty_table_options;
    bool omit_links = false;
    bool break_long_lines = false;
    std::string base_url;
    bool show_noscripts = false;
    bool show_internal_anchors = false;
    bool show_full_data_urls = false;
};

}  // namespace html2org::convert
