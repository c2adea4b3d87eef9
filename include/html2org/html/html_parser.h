#pragma once

#include <memory>
#include <string>
#include <vector>

#include "html2org/html/dom.h"

namespace html2org::html {

struct ParseWarning {
    std::string message;
    std::string recovery_action;
};

struct ParseResult {
    std::unique_ptr<Node> document;
    std::vector<ParseWarning> warnings;
};

// Parses tag soup into a document tree. A leading UTF-8 byte order mark is
// dropped and CR/CRLF line endings become LF before tokenizing.
std::unique_ptr<Node> parse_html(const std::string& html);
ParseResult parse_html_with_diagnostics(const std::string& html);

std::string decode_html_entities(const std::string& text);
bool has_byte_order_mark(const std::string& text);

std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& tag);
const Node* query_first_by_tag(const Node& root, const std::string& tag);

std::string inner_text(const Node& root);

}  // namespace html2org::html
