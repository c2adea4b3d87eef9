#include "html2org/convert/anchors.h"

#include "html2org/convert/text_normalizer.h"

namespace html2org::convert {
namespace {

void collect(const html::Node& node, FragmentSet& names) {
    if (node.is_element("a")) {
        const std::string href = trim_whitespace(html::attribute_value(node, "href"));
        if (href.size() > 1 && href[0] == '#') {
            names.insert(href.substr(1));
        }
    }
    for (const auto& child : node.children) {
        collect(*child, names);
    }
}

}  // namespace

FragmentSet collect_fragment_names(const html::Node& root) {
    FragmentSet names;
    collect(root, names);
    return names;
}

}  // namespace html2org::convert
