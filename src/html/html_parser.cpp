#include "html2org/html/html_parser.h"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <unordered_set>
#include <utility>

#include "html2org/core/config.h"

namespace html2org::html {
namespace {

constexpr char kDocumentTag[] = "#document";
constexpr char kByteOrderMark[] = "\xEF\xBB\xBF";

const std::unordered_set<std::string> kVoidElements = {
    "area", "base", "br",   "col",  "embed", "hr",    "img",
    "input","link", "meta", "param","source","track", "wbr",
};

// Elements whose content is not tokenized as markup.
const std::unordered_set<std::string> kRawTextElements = {
    "script", "style", "noscript", "title", "textarea",
    "xmp",    "iframe", "noembed", "noframes",
};

// Raw text elements whose content still has character references decoded.
const std::unordered_set<std::string> kEscapableRawTextElements = {
    "title", "textarea",
};

const std::unordered_set<std::string> kClosesParagraph = {
    "address", "article", "aside",  "blockquote", "center",  "details",
    "dialog",  "dir",     "div",    "dl",         "dd",      "dt",
    "fieldset","figcaption","figure","footer",    "form",    "h1",
    "h2",      "h3",      "h4",     "h5",         "h6",      "header",
    "hgroup",  "hr",      "li",     "listing",    "main",    "menu",
    "nav",     "ol",      "p",      "plaintext",  "pre",     "section",
    "summary", "ul",      "xmp",
};

const std::unordered_set<std::string> kParagraphScope = {
    "applet", "button", "caption", "html", "marquee",
    "object", "table",  "td",      "th",   "template",
};

const std::unordered_set<std::string> kListItemScope = {
    "ul", "ol", "menu", "table", "td", "th", "caption", "body", "html",
};

const std::unordered_set<std::string> kDefinitionScope = {
    "dl", "table", "td", "th", "caption", "body", "html",
};

const std::unordered_set<std::string> kCellScope = {"tr", "table"};
const std::unordered_set<std::string> kTableScope = {"table"};

struct NamedEntity {
    const char* name;
    std::uint32_t code_point;
};

const NamedEntity kNamedEntities[] = {
    {"amp", '&'},       {"lt", '<'},        {"gt", '>'},        {"quot", '"'},
    {"apos", '\''},     {"nbsp", 0xA0},     {"iexcl", 0xA1},    {"cent", 0xA2},
    {"pound", 0xA3},    {"curren", 0xA4},   {"yen", 0xA5},      {"brvbar", 0xA6},
    {"sect", 0xA7},     {"uml", 0xA8},      {"copy", 0xA9},     {"ordf", 0xAA},
    {"laquo", 0xAB},    {"not", 0xAC},      {"shy", 0xAD},      {"reg", 0xAE},
    {"macr", 0xAF},     {"deg", 0xB0},      {"plusmn", 0xB1},   {"sup2", 0xB2},
    {"sup3", 0xB3},     {"acute", 0xB4},    {"micro", 0xB5},    {"para", 0xB6},
    {"middot", 0xB7},   {"cedil", 0xB8},    {"sup1", 0xB9},     {"ordm", 0xBA},
    {"raquo", 0xBB},    {"frac14", 0xBC},   {"frac12", 0xBD},   {"frac34", 0xBE},
    {"iquest", 0xBF},   {"Agrave", 0xC0},   {"Aacute", 0xC1},   {"Auml", 0xC4},
    {"Ccedil", 0xC7},   {"Egrave", 0xC8},   {"Eacute", 0xC9},   {"Ntilde", 0xD1},
    {"Ouml", 0xD6},     {"times", 0xD7},    {"Uuml", 0xDC},     {"szlig", 0xDF},
    {"agrave", 0xE0},   {"aacute", 0xE1},   {"acirc", 0xE2},    {"auml", 0xE4},
    {"ccedil", 0xE7},   {"egrave", 0xE8},   {"eacute", 0xE9},   {"ecirc", 0xEA},
    {"iacute", 0xED},   {"ntilde", 0xF1},   {"oacute", 0xF3},   {"ouml", 0xF6},
    {"divide", 0xF7},   {"uacute", 0xFA},   {"uuml", 0xFC},     {"ndash", 0x2013},
    {"mdash", 0x2014},  {"lsquo", 0x2018},  {"rsquo", 0x2019},  {"sbquo", 0x201A},
    {"ldquo", 0x201C},  {"rdquo", 0x201D},  {"bdquo", 0x201E},  {"dagger", 0x2020},
    {"Dagger", 0x2021}, {"bull", 0x2022},   {"hellip", 0x2026}, {"permil", 0x2030},
    {"prime", 0x2032},  {"Prime", 0x2033},  {"lsaquo", 0x2039}, {"rsaquo", 0x203A},
    {"euro", 0x20AC},   {"trade", 0x2122},  {"larr", 0x2190},   {"uarr", 0x2191},
    {"rarr", 0x2192},   {"darr", 0x2193},   {"harr", 0x2194},   {"minus", 0x2212},
    {"le", 0x2264},     {"ge", 0x2265},     {"ne", 0x2260},     {"hearts", 0x2665},
    {"ensp", 0x2002},   {"emsp", 0x2003},   {"thinsp", 0x2009}, {"zwnj", 0x200C},
    {"zwj", 0x200D},
};

unsigned char uchar(char c) {
    return static_cast<unsigned char>(c);
}

bool is_space(char c) {
    return std::isspace(uchar(c)) != 0;
}

bool is_name_char(char c) {
    return std::isalnum(uchar(c)) != 0 || c == '-' || c == '_' || c == ':' || c == '.';
}

std::string to_lower_ascii(const std::string& text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(uchar(c))));
    }
    return lowered;
}

bool contains(const std::unordered_set<std::string>& set, const std::string& tag) {
    return set.find(tag) != set.end();
}

int decode_decimal_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    return -1;
}

int decode_hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

bool append_utf8_code_point(std::uint32_t code_point, std::string& decoded) {
    if (code_point == 0 || code_point > 0x10FFFFu ||
        (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
        return false;
    }

    if (code_point <= 0x7Fu) {
        decoded.push_back(static_cast<char>(code_point));
        return true;
    }

    if (code_point <= 0x7FFu) {
        decoded.push_back(static_cast<char>(0xC0u | (code_point >> 6)));
        decoded.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
        return true;
    }

    if (code_point <= 0xFFFFu) {
        decoded.push_back(static_cast<char>(0xE0u | (code_point >> 12)));
        decoded.push_back(static_cast<char>(0x80u | ((code_point >> 6) & 0x3Fu)));
        decoded.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
        return true;
    }

    decoded.push_back(static_cast<char>(0xF0u | (code_point >> 18)));
    decoded.push_back(static_cast<char>(0x80u | ((code_point >> 12) & 0x3Fu)));
    decoded.push_back(static_cast<char>(0x80u | ((code_point >> 6) & 0x3Fu)));
    decoded.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
    return true;
}

bool decode_numeric_entity(const std::string& text,
                           std::size_t entity_start,
                           std::size_t semicolon,
                           std::string& decoded) {
    if (entity_start + 3 > semicolon ||
        text[entity_start] != '&' ||
        text[entity_start + 1] != '#') {
        return false;
    }

    std::size_t pos = entity_start + 2;
    std::uint32_t base = 10;

    if (text[pos] == 'x' || text[pos] == 'X') {
        base = 16;
        ++pos;
    }

    if (pos >= semicolon) {
        return false;
    }

    std::uint32_t value = 0;
    for (; pos < semicolon; ++pos) {
        const int digit = (base == 10) ? decode_decimal_digit(text[pos])
                                       : decode_hex_digit(text[pos]);
        if (digit < 0) {
            return false;
        }

        if (value > (0x10FFFFu - static_cast<std::uint32_t>(digit)) / base) {
            return false;
        }
        value = value * base + static_cast<std::uint32_t>(digit);
    }

    return append_utf8_code_point(value, decoded);
}

bool decode_named_entity(const std::string& text,
                         std::size_t entity_start,
                         std::size_t semicolon,
                         std::string& decoded) {
    const std::size_t name_length = semicolon - entity_start - 1;
    for (const auto& entity : kNamedEntities) {
        if (std::strlen(entity.name) == name_length &&
            text.compare(entity_start + 1, name_length, entity.name) == 0) {
            return append_utf8_code_point(entity.code_point, decoded);
        }
    }
    return false;
}

// Normalizes line endings the way an HTML input stream does.
std::string preprocess_input(const std::string& html) {
    std::size_t start = has_byte_order_mark(html) ? 3 : 0;
    std::string normalized;
    normalized.reserve(html.size() - start);
    for (std::size_t i = start; i < html.size(); ++i) {
        if (html[i] == '\r') {
            normalized.push_back('\n');
            if (i + 1 < html.size() && html[i + 1] == '\n') {
                ++i;
            }
            continue;
        }
        normalized.push_back(html[i]);
    }
    return normalized;
}

class Parser {
  public:
    explicit Parser(const std::string& html, bool collect_warnings = false)
        : html_(preprocess_input(html)), collect_warnings_(collect_warnings) {}

    std::unique_ptr<Node> parse() {
        auto document = std::make_unique<Node>(NodeType::Document, kDocumentTag);
        stack_.push_back(document.get());

        while (position_ < html_.size()) {
            if (html_[position_] != '<') {
                parse_text(document.get());
                continue;
            }

            if (starts_with("<!--")) {
                parse_comment(document.get(), 4, "-->");
                continue;
            }

            if (starts_with("</")) {
                parse_end_tag(document.get());
                continue;
            }

            if (starts_with("<!")) {
                skip_declaration();
                continue;
            }

            if (starts_with("<?")) {
                parse_comment(document.get(), 1, ">");
                continue;
            }

            if (parse_start_tag(document.get())) {
                continue;
            }

            if (collect_warnings_) {
                add_warning("Bare '<' treated as text",
                            "Inserted literal '<' into text content");
            }
            append_text(current_parent(document.get()), "<");
            ++position_;
        }

        if (collect_warnings_ && stack_.size() > 1) {
            for (std::size_t i = stack_.size() - 1; i >= 1; --i) {
                add_warning("Unclosed element <" + stack_[i]->tag_name + ">",
                            "Implicitly closed at end of document");
            }
        }

        return document;
    }

    std::vector<ParseWarning> take_warnings() { return std::move(warnings_); }

  private:
    std::string html_;
    std::size_t position_ = 0;
    std::vector<Node*> stack_;
    bool collect_warnings_ = false;
    std::vector<ParseWarning> warnings_;
    bool depth_capped_ = false;

    void add_warning(std::string message, std::string recovery) {
        ParseWarning w;
        w.message = std::move(message);
        w.recovery_action = std::move(recovery);
        warnings_.push_back(std::move(w));
    }

    Node* current_parent(Node* document) const {
        if (!stack_.empty()) {
            return stack_.back();
        }
        return document;
    }

    bool starts_with(const std::string& token) const {
        if (position_ + token.size() > html_.size()) {
            return false;
        }
        return html_.compare(position_, token.size(), token) == 0;
    }

    void skip_spaces(std::size_t& pos) const {
        while (pos < html_.size() && is_space(html_[pos])) {
            ++pos;
        }
    }

    std::string parse_name(std::size_t& pos) const {
        const std::size_t start = pos;
        while (pos < html_.size() && is_name_char(html_[pos])) {
            ++pos;
        }
        return html_.substr(start, pos - start);
    }

    std::string parse_attr_name(std::size_t& pos) const {
        const std::size_t start = pos;
        while (pos < html_.size() &&
               !is_space(html_[pos]) &&
               html_[pos] != '=' &&
               html_[pos] != '>' &&
               html_[pos] != '/') {
            ++pos;
        }
        return html_.substr(start, pos - start);
    }

    void append_text(Node* parent, std::string text) {
        if (text.empty()) {
            return;
        }
        if (!parent->children.empty() &&
            parent->children.back()->type == NodeType::Text) {
            parent->children.back()->text_content += text;
            return;
        }

        auto text_node = std::make_unique<Node>(NodeType::Text);
        text_node->text_content = std::move(text);
        text_node->parent = parent;
        parent->children.push_back(std::move(text_node));
    }

    void parse_text(Node* document) {
        const std::size_t next_tag = html_.find('<', position_);
        const std::size_t end = (next_tag == std::string::npos) ? html_.size() : next_tag;

        append_text(current_parent(document),
                    decode_html_entities(html_.substr(position_, end - position_)));
        position_ = end;
    }

    void parse_comment(Node* document, std::size_t opener_length, const char* terminator) {
        const std::size_t body_start = position_ + opener_length;
        const std::size_t comment_end = html_.find(terminator, body_start);
        std::size_t body_end = comment_end;
        if (comment_end == std::string::npos) {
            if (collect_warnings_) {
                add_warning("Unclosed HTML comment",
                            "Consumed remaining input as comment");
            }
            body_end = html_.size();
            position_ = html_.size();
        } else {
            position_ = comment_end + std::strlen(terminator);
        }

        Node* parent = current_parent(document);
        auto comment = std::make_unique<Node>(NodeType::Comment);
        comment->text_content = html_.substr(body_start, body_end - body_start);
        comment->parent = parent;
        parent->children.push_back(std::move(comment));
    }

    void skip_declaration() {
        const std::size_t declaration_end = html_.find('>', position_ + 2);
        if (declaration_end == std::string::npos) {
            if (collect_warnings_) {
                add_warning("Unclosed declaration/DOCTYPE",
                            "Consumed remaining input as declaration");
            }
            position_ = html_.size();
            return;
        }
        position_ = declaration_end + 1;
    }

    // Pops the nearest open element named in `targets`, searching down the
    // stack until an element named in `scope` is met.
    void close_in_scope(const std::unordered_set<std::string>& targets,
                        const std::unordered_set<std::string>& scope,
                        const std::string& opener) {
        for (std::size_t i = stack_.size(); i > 1; --i) {
            const std::string& open_tag = stack_[i - 1]->tag_name;
            if (contains(targets, open_tag)) {
                if (collect_warnings_) {
                    for (std::size_t j = stack_.size(); j > i - 1; --j) {
                        add_warning("Element <" + stack_[j - 1]->tag_name +
                                        "> implicitly closed by <" + opener + ">",
                                    "Closed element before opening a new one");
                    }
                }
                stack_.resize(i - 1);
                return;
            }
            if (contains(scope, open_tag)) {
                return;
            }
        }
    }

    void apply_implied_end_tags(const std::string& tag) {
        if (contains(kClosesParagraph, tag)) {
            close_in_scope({"p"}, kParagraphScope, tag);
        }

        if (tag == "li") {
            close_in_scope({"li"}, kListItemScope, tag);
        } else if (tag == "dt" || tag == "dd") {
            close_in_scope({"dt", "dd"}, kDefinitionScope, tag);
        } else if (tag == "td" || tag == "th") {
            close_in_scope({"td", "th"}, kCellScope, tag);
        } else if (tag == "tr") {
            close_in_scope({"tr"}, kTableScope, tag);
        } else if (tag == "thead" || tag == "tbody" || tag == "tfoot") {
            close_in_scope({"thead", "tbody", "tfoot"}, kTableScope, tag);
        } else if (tag == "option" || tag == "optgroup") {
            if (stack_.size() > 1 && stack_.back()->tag_name == "option") {
                stack_.pop_back();
            }
        }
    }

    void parse_end_tag(Node* document) {
        std::size_t pos = position_ + 2;
        skip_spaces(pos);

        std::string tag = to_lower_ascii(parse_name(pos));
        const std::size_t tag_end = html_.find('>', pos);
        position_ = (tag_end == std::string::npos) ? html_.size() : tag_end + 1;

        // </br> is parsed as <br>.
        if (tag == "br") {
            Node* parent = current_parent(document);
            auto element = std::make_unique<Node>(NodeType::Element, "br");
            element->parent = parent;
            parent->children.push_back(std::move(element));
            return;
        }

        if (tag.empty() || stack_.size() <= 1) {
            if (collect_warnings_ && !tag.empty()) {
                add_warning("Orphan end tag </" + tag + "> with no matching open tag",
                            "Ignored orphan end tag");
            }
            return;
        }

        bool found = false;
        std::size_t match_index = 0;
        for (std::size_t i = stack_.size(); i > 1; --i) {
            if (stack_[i - 1]->tag_name == tag) {
                found = true;
                match_index = i - 1;
                break;
            }
        }

        if (!found) {
            if (collect_warnings_) {
                add_warning("Unmatched end tag </" + tag + ">",
                            "Ignored unmatched end tag");
            }
            return;
        }

        if (collect_warnings_ && match_index < stack_.size() - 1) {
            for (std::size_t i = stack_.size() - 1; i > match_index; --i) {
                add_warning("Element <" + stack_[i]->tag_name +
                            "> implicitly closed by </" + tag + ">",
                            "Implicitly closed intervening element");
            }
        }

        stack_.resize(match_index);
    }

    // Consumes everything up to the matching end tag of a raw text element.
    std::string consume_raw_text(const std::string& tag) {
        if (tag == "plaintext") {
            std::string rest = html_.substr(position_);
            position_ = html_.size();
            return rest;
        }

        const std::string closing = "</" + tag;
        std::size_t search = position_;
        while (search < html_.size()) {
            const std::size_t candidate = html_.find("</", search);
            if (candidate == std::string::npos) {
                break;
            }
            if (candidate + closing.size() <= html_.size() &&
                to_lower_ascii(html_.substr(candidate, closing.size())) == closing) {
                const std::size_t after = candidate + closing.size();
                if (after >= html_.size() || !is_name_char(html_[after])) {
                    std::string content = html_.substr(position_, candidate - position_);
                    const std::size_t tag_end = html_.find('>', after);
                    position_ = (tag_end == std::string::npos) ? html_.size() : tag_end + 1;
                    return content;
                }
            }
            search = candidate + 2;
        }

        if (collect_warnings_) {
            add_warning("Unclosed raw text element <" + tag + ">",
                        "Consumed remaining input as element content");
        }
        std::string rest = html_.substr(position_);
        position_ = html_.size();
        return rest;
    }

    void skip_leading_newline() {
        if (position_ < html_.size() && html_[position_] == '\n') {
            ++position_;
        }
    }

    bool parse_start_tag(Node* document) {
        std::size_t pos = position_ + 1;

        std::string tag = parse_name(pos);
        if (tag.empty()) {
            return false;
        }
        tag = to_lower_ascii(tag);

        std::map<std::string, std::string> attributes;
        bool self_closing = false;

        while (pos < html_.size()) {
            skip_spaces(pos);

            if (pos >= html_.size()) {
                break;
            }
            if (html_[pos] == '>') {
                ++pos;
                break;
            }
            if (html_[pos] == '/' && (pos + 1) < html_.size() && html_[pos + 1] == '>') {
                self_closing = true;
                pos += 2;
                break;
            }

            std::string attr_name = parse_attr_name(pos);
            if (attr_name.empty()) {
                ++pos;
                continue;
            }
            attr_name = to_lower_ascii(attr_name);

            skip_spaces(pos);
            std::string attr_value;

            if (pos < html_.size() && html_[pos] == '=') {
                ++pos;
                skip_spaces(pos);

                if (pos < html_.size() && (html_[pos] == '"' || html_[pos] == '\'')) {
                    const char quote = html_[pos++];
                    const std::size_t value_start = pos;
                    while (pos < html_.size() && html_[pos] != quote) {
                        ++pos;
                    }
                    attr_value = html_.substr(value_start, pos - value_start);
                    if (pos < html_.size() && html_[pos] == quote) {
                        ++pos;
                    }
                } else {
                    const std::size_t value_start = pos;
                    while (pos < html_.size() &&
                           !is_space(html_[pos]) &&
                           html_[pos] != '>') {
                        ++pos;
                    }
                    attr_value = html_.substr(value_start, pos - value_start);
                }
            }

            // The first occurrence of a duplicated attribute wins.
            if (!attributes.emplace(attr_name, decode_html_entities(attr_value)).second &&
                collect_warnings_) {
                add_warning("Duplicate attribute '" + attr_name + "' on <" + tag + ">",
                            "Kept the first value");
            }
        }
        position_ = pos;

        apply_implied_end_tags(tag);

        const bool is_void = kVoidElements.find(tag) != kVoidElements.end();
        auto element = std::make_unique<Node>(NodeType::Element, tag);
        element->attributes = std::move(attributes);
        Node* parent = current_parent(document);
        element->parent = parent;
        Node* element_ptr = element.get();
        parent->children.push_back(std::move(element));

        if (is_void || self_closing) {
            return true;
        }

        if (contains(kRawTextElements, tag) || tag == "plaintext") {
            if (tag == "textarea") {
                skip_leading_newline();
            }
            std::string content = consume_raw_text(tag);
            if (contains(kEscapableRawTextElements, tag)) {
                content = decode_html_entities(content);
            }
            append_text(element_ptr, std::move(content));
            return true;
        }

        if (stack_.size() > core::config::kMaxOpenElements) {
            if (collect_warnings_ && !depth_capped_) {
                add_warning("Nesting deeper than " +
                                std::to_string(core::config::kMaxOpenElements) + " elements",
                            "Attached deeper content as siblings");
            }
            depth_capped_ = true;
        } else {
            stack_.push_back(element_ptr);
        }
        if (tag == "pre" || tag == "listing") {
            skip_leading_newline();
        }
        return true;
    }
};

void collect_by_tag(const Node& node, const std::string& tag, std::vector<const Node*>& result) {
    if (node.type == NodeType::Element && node.tag_name == tag) {
        result.push_back(&node);
    }
    for (const auto& child : node.children) {
        collect_by_tag(*child, tag, result);
    }
}

const Node* find_first_by_tag(const Node& node, const std::string& tag) {
    if (node.type == NodeType::Element && node.tag_name == tag) {
        return &node;
    }
    for (const auto& child : node.children) {
        if (const Node* match = find_first_by_tag(*child, tag)) {
            return match;
        }
    }
    return nullptr;
}

void collect_text(const Node& node, std::string& output) {
    if (node.type == NodeType::Text) {
        output += node.text_content;
    }
    for (const auto& child : node.children) {
        collect_text(*child, output);
    }
}

}  // namespace

bool has_byte_order_mark(const std::string& text) {
    return text.compare(0, 3, kByteOrderMark) == 0;
}

std::string decode_html_entities(const std::string& text) {
    if (text.find('&') == std::string::npos) {
        return text;
    }

    std::string decoded;
    decoded.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '&') {
            decoded.push_back(text[pos]);
            ++pos;
            continue;
        }

        const std::size_t semicolon = text.find(';', pos + 1);
        if (semicolon == std::string::npos) {
            decoded.push_back(text[pos]);
            ++pos;
            continue;
        }

        const std::size_t entity_length = semicolon - pos + 1;
        if (!decode_numeric_entity(text, pos, semicolon, decoded) &&
            !decode_named_entity(text, pos, semicolon, decoded)) {
            decoded.push_back('&');
            ++pos;
            continue;
        }

        pos += entity_length;
    }

    return decoded;
}

std::unique_ptr<Node> parse_html(const std::string& html) {
    return Parser(html).parse();
}

ParseResult parse_html_with_diagnostics(const std::string& html) {
    Parser parser(html, true);
    ParseResult result;
    result.document = parser.parse();
    result.warnings = parser.take_warnings();
    return result;
}

std::vector<const Node*> query_all_by_tag(const Node& root, const std::string& tag) {
    std::vector<const Node*> result;
    if (tag.empty()) {
        return result;
    }
    collect_by_tag(root, to_lower_ascii(tag), result);
    return result;
}

const Node* query_first_by_tag(const Node& root, const std::string& tag) {
    if (tag.empty()) {
        return nullptr;
    }
    return find_first_by_tag(root, to_lower_ascii(tag));
}

std::string inner_text(const Node& root) {
    std::string text;
    collect_text(root, text);
    return text;
}

std::string attribute_value(const Node& node, const std::string& name) {
    const auto it = node.attributes.find(name);
    if (it == node.attributes.end()) {
        return {};
    }
    return it->second;
}

std::string serialize_dom(const Node& node) {
    std::string output;

    switch (node.type) {
        case NodeType::Document:
            output += "#document";
            break;
        case NodeType::Text:
            output += "TEXT(\"" + node.text_content + "\")";
            return output;
        case NodeType::Comment:
            output += "COMMENT(\"" + node.text_content + "\")";
            return output;
        case NodeType::Element:
            output += "<" + node.tag_name;
            for (const auto& [key, value] : node.attributes) {
                output += " " + key + "=\"" + value + "\"";
            }
            output += ">";
            break;
    }

    for (const auto& child : node.children) {
        if (child) {
            output += "[" + serialize_dom(*child) + "]";
        }
    }

    if (node.type == NodeType::Element) {
        output += "</" + node.tag_name + ">";
    }

    return output;
}

}  // namespace html2org::html
