#pragma once

#include <string>
#include <unordered_set>

#include "html2org/html/dom.h"

namespace html2org::convert {

using FragmentSet = std::unordered_set<std::string>;

// Names referenced by in-page links (href="#name") anywhere under root,
// including subtrees the renderer skips.
FragmentSet collect_fragment_names(const html::Node& root);

}  // namespace html2org::convert
