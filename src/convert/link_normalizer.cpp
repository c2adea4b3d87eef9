#include "html2org/convert/link_normalizer.h"

#include <cctype>

#include "html2org/convert/text_normalizer.h"
#include "html2org/core/config.h"
#include "html2org/net/url.h"

namespace html2org::convert {
namespace {

constexpr char kDataScheme[] = "data:";
constexpr char kOmittedMarker[] = "(omitted)";

std::string remove_line_breaks(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != '\n' && c != '\r') {
            out.push_back(c);
        }
    }
    return out;
}

std::string shorten_data_url(const std::string& link) {
    const std::size_t semicolon = link.find(';');
    if (semicolon == std::string::npos) {
        return std::string(kDataScheme) + kOmittedMarker;
    }
    return link.substr(0, semicolon) + ";" + kOmittedMarker;
}

}  // namespace

bool is_data_url(const std::string& link) {
    const std::size_t prefix_length = sizeof(kDataScheme) - 1;
    if (link.size() < prefix_length) {
        return false;
    }
    for (std::size_t i = 0; i < prefix_length; ++i) {
        if (std::tolower(static_cast<unsigned char>(link[i])) != kDataScheme[i]) {
            return false;
        }
    }
    return true;
}

bool normalize_link(const std::string& raw, const Options& options, std::string& out,
                    std::string& err) {
    const std::string link = remove_line_breaks(trim_whitespace(raw));
    if (link.empty()) {
        out.clear();
        return true;
    }

    if (link[0] == '#') {
        out = link.substr(1);
        return true;
    }

    if (is_data_url(link)) {
        if (!options.show_full_data_urls &&
            link.size() > core::config::kDataUrlDisplayLimit) {
            out = shorten_data_url(link);
        } else {
            out = link;
        }
        return true;
    }

    if (options.base_url.empty()) {
        out = link;
        return true;
    }

    net::Url reference;
    net::UrlError reference_err;
    if (!net::parse_url(link, reference, reference_err)) {
        if (reference_err.code != net::UrlErrorCode::InvalidEscape) {
            err = reference_err.message;
            return false;
        }
        // Keep whatever precedes the broken escape.
        if (!net::parse_url(link.substr(0, reference_err.offset), reference, reference_err)) {
            err = reference_err.message;
            return false;
        }
    }

    net::Url base;
    if (!net::parse_url(options.base_url, base, err)) {
        return false;
    }

    out = net::resolve_reference(base, reference).to_string();
    return true;
}

}  // namespace html2org::convert
