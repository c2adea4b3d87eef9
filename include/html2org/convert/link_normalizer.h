#pragma once

#include <string>

#include "html2org/convert/options.h"

namespace html2org::convert {

// Turns a raw href/src into the URL shown in the output: trimmed, fragment
// references reduced to their name, long data: URLs shortened, and resolved
// against options.base_url when one is set. Fails only when a base URL is
// set and either URL cannot be parsed.
bool normalize_link(const std::string& raw, const Options& options, std::string& out,
                    std::string& err);

bool is_data_url(const std::string& link);

}  // namespace html2org::convert
