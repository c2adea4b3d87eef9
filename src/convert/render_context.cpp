#include "html2org/convert/render_context.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "html2org/convert/link_normalizer.h"
#include "html2org/convert/text_normalizer.h"
#include "html2org/core/config.h"
#include "html2org/html/html_parser.h"

namespace html2org::convert {
namespace {

enum class ElementKind {
    Other,
    Ignored,
    LineBreak,
    Rule,
    Heading,
    Blockquote,
    BlockContainer,
    Paragraph,
    ListItem,
    DefinitionTerm,
    Definition,
    Emphasis,
    Anchor,
    Image,
    Preformatted,
    InlineCode,
    Title,
    Noscript,
    Input,
    Textarea,
    Select,
    Form,
    Table,
    TableRow,
    TableHeaderCell,
    TableDataCell,
    TableFooter,
};

const std::unordered_map<std::string, ElementKind> kElementKinds = {
    {"br", ElementKind::LineBreak},
    {"hr", ElementKind::Rule},
    {"h1", ElementKind::Heading},
    {"h2", ElementKind::Heading},
    {"h3", ElementKind::Heading},
    {"h4", ElementKind::Heading},
    {"h5", ElementKind::Heading},
    {"h6", ElementKind::Heading},
    {"blockquote", ElementKind::Blockquote},
    {"div", ElementKind::BlockContainer},
    {"section", ElementKind::BlockContainer},
    {"article", ElementKind::BlockContainer},
    {"header", ElementKind::BlockContainer},
    {"footer", ElementKind::BlockContainer},
    {"nav", ElementKind::BlockContainer},
    {"aside", ElementKind::BlockContainer},
    {"main", ElementKind::BlockContainer},
    {"figure", ElementKind::BlockContainer},
    {"address", ElementKind::BlockContainer},
    {"fieldset", ElementKind::BlockContainer},
    {"details", ElementKind::BlockContainer},
    {"center", ElementKind::BlockContainer},
    {"p", ElementKind::Paragraph},
    {"ul", ElementKind::Paragraph},
    {"ol", ElementKind::Paragraph},
    {"dl", ElementKind::Paragraph},
    {"li", ElementKind::ListItem},
    {"dt", ElementKind::DefinitionTerm},
    {"dd", ElementKind::Definition},
    {"b", ElementKind::Emphasis},
    {"strong", ElementKind::Emphasis},
    {"i", ElementKind::Emphasis},
    {"em", ElementKind::Emphasis},
    {"u", ElementKind::Emphasis},
    {"ins", ElementKind::Emphasis},
    {"s", ElementKind::Emphasis},
    {"strike", ElementKind::Emphasis},
    {"del", ElementKind::Emphasis},
    {"a", ElementKind::Anchor},
    {"img", ElementKind::Image},
    {"pre", ElementKind::Preformatted},
    {"listing", ElementKind::Preformatted},
    {"xmp", ElementKind::Preformatted},
    {"plaintext", ElementKind::Preformatted},
    {"code", ElementKind::InlineCode},
    {"tt", ElementKind::InlineCode},
    {"kbd", ElementKind::InlineCode},
    {"var", ElementKind::InlineCode},
    {"samp", ElementKind::InlineCode},
    {"title", ElementKind::Title},
    {"noscript", ElementKind::Noscript},
    {"input", ElementKind::Input},
    {"textarea", ElementKind::Textarea},
    {"select", ElementKind::Select},
    {"form", ElementKind::Form},
    {"table", ElementKind::Table},
    {"tr", ElementKind::TableRow},
    {"th", ElementKind::TableHeaderCell},
    {"td", ElementKind::TableDataCell},
    {"tfoot", ElementKind::TableFooter},
    {"style", ElementKind::Ignored},
    {"script", ElementKind::Ignored},
    {"template", ElementKind::Ignored},
    {"meta", ElementKind::Ignored},
    {"link", ElementKind::Ignored},
    {"base", ElementKind::Ignored},
};

const std::unordered_map<std::string, const char*> kEmphasisDelimiters = {
    {"b", "*"}, {"strong", "*"}, {"i", "/"},   {"em", "/"},     {"u", "_"},
    {"ins", "_"}, {"s", "+"},    {"del", "+"}, {"strike", "+"},
};

const std::unordered_set<std::string> kBlockLevelTags = {
    "address", "article", "aside",   "blockquote", "center", "details", "dd",
    "div",     "dl",      "dt",      "fieldset",   "figure", "footer",  "form",
    "h1",      "h2",      "h3",      "h4",         "h5",     "h6",      "header",
    "hr",      "li",      "listing", "main",       "nav",    "ol",      "p",
    "plaintext","pre",    "section", "table",      "ul",     "xmp",
};

const std::unordered_set<std::string> kSupportedInputTypes = {"text", "number", "password"};

ElementKind classify(const std::string& tag) {
    const auto it = kElementKinds.find(tag);
    return it == kElementKinds.end() ? ElementKind::Other : it->second;
}

std::string to_lower_ascii(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

bool has_block_descendant(const html::Node& node) {
    for (const auto& child : node.children) {
        if (child->type != html::NodeType::Element) {
            continue;
        }
        if (is_block_level(child->tag_name) || has_block_descendant(*child)) {
            return true;
        }
    }
    return false;
}

std::string format_link(const std::string& href, const std::string& text) {
    if (href.empty() && text.empty()) {
        return {};
    }
    if (href.empty()) {
        return text;
    }
    if (text.empty() || text == href) {
        return "[[" + href + "]]";
    }
    return "[[" + href + "][" + text + "]]";
}

bool ends_with_whitespace(const std::string& text) {
    return !text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0;
}

}  // namespace

bool is_block_level(const std::string& tag) {
    return kBlockLevelTags.find(tag) != kBlockLevelTags.end();
}

RenderContext::RenderContext(const RenderShared& shared) : shared_(shared) {}

std::string RenderContext::take_output() {
    std::string out = std::move(buffer_);
    buffer_.clear();
    line_length_ = 0;
    ends_with_newline_ = false;
    return out;
}

RenderContext RenderContext::isolated() const {
    RenderContext sub(shared_);
    sub.blockquote_level_ = blockquote_level_;
    sub.is_preformatted_ = is_preformatted_;
    sub.is_in_form_ = is_in_form_;
    sub.form_id_ = form_id_;
    return sub;
}

bool RenderContext::render_isolated(const html::Node& node, std::string& out,
                                    std::string& err) const {
    RenderContext sub = isolated();
    if (!sub.render_children(node, err)) {
        return false;
    }
    out = sub.take_output();
    return true;
}

void RenderContext::emit(const std::string& data) {
    if (data.empty()) {
        return;
    }

    std::string text = data;
    if (!is_preformatted_ && line_length_ == 0) {
        const std::size_t first = text.find_first_not_of(' ');
        if (first == std::string::npos) {
            return;
        }
        text.erase(0, first);
    }

    if (shared_.options.break_long_lines && blockquote_level_ > 0) {
        for (const auto& piece :
             break_long_lines(text, line_length_, core::config::kLongLineLimit)) {
            append(piece);
        }
    } else {
        append(text);
    }
    ends_with_newline_ = text.back() == '\n';
}

void RenderContext::append(const std::string& data) {
    for (char c : data) {
        buffer_.push_back(c);
        if (c == '\n') {
            line_length_ = 0;
            if (!line_prefix_.empty()) {
                buffer_ += line_prefix_;
                line_length_ = count_code_points(line_prefix_);
            }
        } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++line_length_;
        }
    }
}

void RenderContext::ensure_line_start() {
    if (line_length_ > 0) {
        emit("\n");
    }
}

void RenderContext::warn(const std::string& stage, const std::string& message) {
    if (shared_.diagnostics != nullptr) {
        shared_.diagnostics->report(core::Severity::Warning, "render", stage, message);
    }
}

std::string RenderContext::next_form_id() {
    ++shared_.form_counter;
    return core::config::kFormIdPrefix + std::to_string(shared_.form_counter);
}

bool RenderContext::render(const html::Node& node, std::string& err) {
    switch (node.type) {
        case html::NodeType::Document:
            return render_children(node, err);
        case html::NodeType::Text:
            emit(is_preformatted_ ? node.text_content : collapse_whitespace(node.text_content));
            return true;
        case html::NodeType::Comment:
            return true;
        case html::NodeType::Element:
            return render_element(node, err);
    }
    return true;
}

bool RenderContext::render_children(const html::Node& node, std::string& err) {
    for (const auto& child : node.children) {
        if (!render(*child, err)) {
            return false;
        }
    }
    return true;
}

bool RenderContext::render_element(const html::Node& node, std::string& err) {
    just_closed_block_ = false;
    const std::size_t mark = buffer_.size();
    if (!dispatch(node, err)) {
        return false;
    }
    if (shared_.options.show_internal_anchors) {
        place_internal_anchor(node, mark);
    }
    return true;
}

void RenderContext::place_internal_anchor(const html::Node& node, std::size_t mark) {
    std::string name;
    for (const char* attribute : {"id", "name"}) {
        const std::string value = html::attribute_value(node, attribute);
        if (!value.empty() && shared_.fragments.count(value) != 0) {
            name = value;
            break;
        }
    }
    if (name.empty()) {
        return;
    }

    const std::string marker = "<<" + name + ">>";
    if (buffer_.size() > mark && buffer_.back() == '\n') {
        std::size_t position = buffer_.find_last_not_of('\n') + 1;
        if (position < mark) {
            position = mark;
        }
        buffer_.insert(position, marker);
        return;
    }
    emit(marker);
}

bool RenderContext::dispatch(const html::Node& node, std::string& err) {
    switch (classify(node.tag_name)) {
        case ElementKind::Ignored:
            return true;
        case ElementKind::LineBreak:
            emit("\n");
            return true;
        case ElementKind::Rule:
            ensure_line_start();
            emit("-----\n");
            return true;
        case ElementKind::Heading:
            return render_heading(node, node.tag_name[1] - '0', err);
        case ElementKind::Blockquote:
            return render_blockquote(node, err);
        case ElementKind::BlockContainer:
            return render_block_container(node, err);
        case ElementKind::Paragraph:
            return render_paragraph(node, err);
        case ElementKind::ListItem:
            return render_list_item(node, err);
        case ElementKind::DefinitionTerm:
            return render_definition_term(node, err);
        case ElementKind::Definition:
            return render_definition(node, err);
        case ElementKind::Emphasis:
            return render_emphasis(node, kEmphasisDelimiters.at(node.tag_name), err);
        case ElementKind::Anchor:
            return render_anchor(node, err);
        case ElementKind::Image:
            return render_image(node, err);
        case ElementKind::Preformatted:
            return render_preformatted(node, err);
        case ElementKind::InlineCode:
            return render_inline_code(node, err);
        case ElementKind::Title:
            return render_title(node, err);
        case ElementKind::Noscript:
            return render_noscript(node, err);
        case ElementKind::Input:
            return render_input(node);
        case ElementKind::Textarea:
            return render_textarea(node, err);
        case ElementKind::Select:
            return render_select(node);
        case ElementKind::Form:
            return render_form(node, err);
        case ElementKind::Table:
            return render_table(node, err);
        case ElementKind::TableRow:
            return render_table_row(node, err);
        case ElementKind::TableHeaderCell:
            return render_table_cell(node, true, err);
        case ElementKind::TableDataCell:
            return render_table_cell(node, false, err);
        case ElementKind::TableFooter:
            return render_table_footer(node, err);
        case ElementKind::Other:
            break;
    }
    return render_children(node, err);
}

bool RenderContext::render_heading(const html::Node& node, int level, std::string& err) {
    std::string content;
    if (!render_isolated(node, content, err)) {
        return false;
    }
    content = trim_whitespace(collapse_whitespace(content));
    emit("\n" + std::string(static_cast<std::size_t>(level), '*') + " " + content + "\n");
    return true;
}

bool RenderContext::render_blockquote(const html::Node& node, std::string& err) {
    ++blockquote_level_;
    emit("\n");
    if (blockquote_level_ == 1) {
        emit("\n#+begin_quote\n");
    }

    const bool ok = render_children(node, err);
    if (ok && blockquote_level_ == 1) {
        emit("\n#+end_quote\n");
    }
    --blockquote_level_;
    if (!ok) {
        return false;
    }

    emit("\n\n");
    return true;
}

bool RenderContext::render_block_container(const html::Node& node, std::string& err) {
    if (line_length_ > 0) {
        emit("\n");
    }
    if (!render_children(node, err)) {
        return false;
    }
    if (!just_closed_block_) {
        emit("\n");
    }
    just_closed_block_ = true;
    return true;
}

bool RenderContext::render_paragraph(const html::Node& node, std::string& err) {
    const int saved_item = ordered_item_;
    if (node.tag_name == "ol") {
        ordered_item_ = 1;
        const std::string start = trim_whitespace(html::attribute_value(node, "start"));
        if (!start.empty() && start.find_first_not_of("0123456789") == std::string::npos &&
            start.size() < 9) {
            ordered_item_ = std::max(1, std::stoi(start));
        }
    } else if (node.tag_name == "ul") {
        ordered_item_ = 0;
    }

    emit("\n\n");
    const bool ok = render_children(node, err);
    ordered_item_ = saved_item;
    if (!ok) {
        return false;
    }
    emit("\n\n");
    return true;
}

bool RenderContext::render_list_item(const html::Node& node, std::string& err) {
    std::string content;
    if (!render_isolated(node, content, err)) {
        return false;
    }
    content = trim_whitespace(content);
    if (content.empty()) {
        return true;
    }

    ensure_line_start();
    std::string bullet = "- ";
    if (ordered_item_ > 0) {
        bullet = std::to_string(ordered_item_++) + ". ";
    }
    emit(bullet);

    const std::string saved_prefix = line_prefix_;
    line_prefix_ = saved_prefix + std::string(bullet.size(), ' ');
    emit(content);
    line_prefix_ = saved_prefix;
    emit("\n");
    return true;
}

bool RenderContext::render_definition_term(const html::Node& node, std::string& err) {
    std::string term;
    if (!render_isolated(node, term, err)) {
        return false;
    }
    term = trim_whitespace(collapse_whitespace(term));
    ensure_line_start();
    if (!term.empty()) {
        emit("*" + term + "*");
    }
    emit("\n");
    return true;
}

bool RenderContext::render_definition(const html::Node& node, std::string& err) {
    ensure_line_start();
    if (!render_children(node, err)) {
        return false;
    }
    emit("\n");
    return true;
}

bool RenderContext::render_emphasis(const html::Node& node, const char* delimiter,
                                    std::string& err) {
    std::string content;
    if (!render_isolated(node, content, err)) {
        return false;
    }
    const bool trailing_space = ends_with_whitespace(content);
    content = trim_whitespace(content);
    if (content.empty()) {
        return true;
    }
    emit(delimiter + content + delimiter + (trailing_space ? " " : ""));
    return true;
}

bool RenderContext::render_anchor(const html::Node& node, std::string& err) {
    const html::Node* only =
        node.children.size() == 1 ? node.children.front().get() : nullptr;

    std::string text;
    std::string block_content;
    bool block_link = false;
    if (only != nullptr && only->type == html::NodeType::Text) {
        text = trim_whitespace(only->text_content);
    } else if (only != nullptr && only->is_element("img") &&
               !html::attribute_value(*only, "alt").empty()) {
        text = html::attribute_value(*only, "alt");
        if (!render(*only, err)) {
            return false;
        }
    } else if (has_block_descendant(node)) {
        if (!render_isolated(node, block_content, err)) {
            return false;
        }
        block_content = trim_trailing_whitespace(collapse_blank_lines(block_content));
        text = core::config::kBlockLinkLabel;
        block_link = true;
    } else {
        if (!render_isolated(node, text, err)) {
            return false;
        }
        text = trim_whitespace(text);
    }

    std::string href;
    if (!shared_.options.omit_links &&
        !normalize_link(html::attribute_value(node, "href"), shared_.options, href, err)) {
        return false;
    }

    if (block_link) {
        if (href.empty()) {
            emit(block_content);
            return true;
        }
        if (!block_content.empty()) {
            emit(block_content + " ");
        }
    }
    emit(format_link(href, text));
    return true;
}

bool RenderContext::render_image(const html::Node& node, std::string& err) {
    std::string src;
    if (!normalize_link(html::attribute_value(node, "src"), shared_.options, src, err)) {
        return false;
    }
    if (src.empty()) {
        return true;
    }

    const std::string alt = trim_whitespace(collapse_whitespace(html::attribute_value(node, "alt")));
    if (alt.empty()) {
        emit("[[" + src + "]]");
        return true;
    }
    emit("\n#+CAPTION: " + alt + "\n[[" + src + "]]\n");
    return true;
}

bool RenderContext::render_preformatted(const html::Node& node, std::string& err) {
    if (is_preformatted_) {
        return render_children(node, err);
    }

    is_preformatted_ = true;
    emit("\n#+begin_src\n");
    const bool ok = render_children(node, err);
    if (ok) {
        if (!ends_with_newline_) {
            emit("\n");
        }
        emit("#+end_src\n");
    }
    is_preformatted_ = false;
    return ok;
}

bool RenderContext::render_inline_code(const html::Node& node, std::string& err) {
    if (is_preformatted_) {
        return render_children(node, err);
    }

    std::string content;
    if (!render_isolated(node, content, err)) {
        return false;
    }
    content = trim_whitespace(content);
    if (content.empty()) {
        return true;
    }
    if (content.find('\n') != std::string::npos) {
        emit("\n#+begin_src\n" + content + "\n#+end_src\n");
    } else {
        emit("~" + content + "~");
    }
    return true;
}

bool RenderContext::render_title(const html::Node& node, std::string& err) {
    std::string title;
    if (!render_isolated(node, title, err)) {
        return false;
    }
    ensure_line_start();
    emit("#+TITLE: " + trim_whitespace(collapse_whitespace(title)) + "\n\n\n");
    return true;
}

bool RenderContext::render_noscript(const html::Node& node, std::string& err) {
    if (!shared_.options.show_noscripts || node.children.empty() ||
        node.children.front()->type != html::NodeType::Text) {
        return true;
    }

    const auto fragment = html::parse_html(node.children.front()->text_content);
    std::string rendered;
    if (!render_document(*fragment, shared_.options, shared_.form_counter,
                         shared_.diagnostics, rendered, err)) {
        return false;
    }
    emit(rendered);
    return true;
}

void RenderContext::emit_form_field(const std::string& kind, const std::string& type,
                                    const html::Node& node, const std::string& content) {
    std::string header = "#+begin_" + kind;
    if (!type.empty()) {
        header += " :type " + type;
    }
    if (is_in_form_) {
        header += " :form " + form_id_ + " :id " + next_form_id();
        const std::string name = trim_whitespace(html::attribute_value(node, "name"));
        if (!name.empty()) {
            header += " :name " + name;
        }
    }

    std::string body = content;
    if (body.empty() || body.back() != '\n') {
        body.push_back('\n');
    }
    emit("\n" + header + "\n" + body + "#+end_" + kind + "\n");
}

bool RenderContext::render_input(const html::Node& node) {
    std::string type = to_lower_ascii(trim_whitespace(html::attribute_value(node, "type")));
    if (type.empty()) {
        type = "unknown";
    } else if (kSupportedInputTypes.find(type) == kSupportedInputTypes.end()) {
        warn("form", "Dropped input field of unsupported type '" + type + "'");
        return true;
    }

    std::string content = html::attribute_value(node, "value");
    if (content.empty()) {
        content = html::attribute_value(node, "placeholder");
    }
    emit_form_field("input", type, node, content);
    return true;
}

bool RenderContext::render_textarea(const html::Node& node, std::string& err) {
    RenderContext sub = isolated();
    sub.is_preformatted_ = true;
    if (!sub.render_children(node, err)) {
        return false;
    }

    std::string content = sub.take_output();
    if (content.empty()) {
        content = html::attribute_value(node, "placeholder");
    }
    emit_form_field("textarea", "", node, content);
    return true;
}

bool RenderContext::render_select(const html::Node& node) {
    const std::vector<const html::Node*> choices = html::query_all_by_tag(node, "option");
    const html::Node* chosen = nullptr;
    for (const html::Node* choice : choices) {
        if (choice->attributes.count("selected") != 0) {
            chosen = choice;
            break;
        }
    }
    if (chosen == nullptr && !choices.empty()) {
        chosen = choices.front();
    }

    std::string content;
    if (chosen != nullptr) {
        content = trim_whitespace(collapse_whitespace(html::inner_text(*chosen)));
    }
    emit_form_field("input", "select", node, content);
    return true;
}

bool RenderContext::render_form(const html::Node& node, std::string& err) {
    std::string method = to_lower_ascii(trim_whitespace(html::attribute_value(node, "method")));
    if (method.empty()) {
        method = "get";
    }

    std::string raw_action = html::attribute_value(node, "action");
    if (trim_whitespace(raw_action).empty()) {
        raw_action = shared_.options.base_url;
    }
    std::string action;
    if (!normalize_link(raw_action, shared_.options, action, err)) {
        return false;
    }

    const std::string form_id = next_form_id();
    const bool saved_in_form = is_in_form_;
    const std::string saved_form_id = form_id_;
    is_in_form_ = true;
    form_id_ = form_id;

    const bool ok = render_children(node, err);
    is_in_form_ = saved_in_form;
    form_id_ = saved_form_id;
    if (!ok) {
        return false;
    }

    ensure_line_start();
    emit("\n[[org-form:" + form_id + ":" + method + ":" + action + "][" +
         core::config::kSubmitLinkLabel + "]]\n");
    return true;
}

bool RenderContext::render_table(const html::Node& node, std::string& err) {
    if (!shared_.options.pretty_tables) {
        return render_paragraph(node, err);
    }

    emit("\n\n");
    TableContext table;
    TableContext* saved_table = table_;
    table_ = &table;
    const bool ok = render_children(node, err);
    table_ = saved_table;
    if (!ok) {
        return false;
    }

    emit(format_table(table, shared_.options));
    emit("\n\n");
    return true;
}

bool RenderContext::render_table_row(const html::Node& node, std::string& err) {
    if (table_ == nullptr) {
        if (!render_children(node, err)) {
            return false;
        }
        emit("\n");
        return true;
    }

    table_->begin_row();
    if (!render_children(node, err)) {
        return false;
    }
    table_->end_row();
    return true;
}

bool RenderContext::render_table_cell(const html::Node& node, bool header, std::string& err) {
    if (table_ == nullptr) {
        if (!render_children(node, err)) {
            return false;
        }
        emit(" ");
        return true;
    }

    std::string text;
    if (!render_cell_text(node, text, err)) {
        return false;
    }
    if (header) {
        table_->add_header_cell(std::move(text));
    } else {
        table_->add_data_cell(std::move(text));
    }
    return true;
}

bool RenderContext::render_table_footer(const html::Node& node, std::string& err) {
    if (table_ == nullptr) {
        return render_children(node, err);
    }

    table_->set_in_footer(true);
    const bool ok = render_children(node, err);
    table_->set_in_footer(false);
    return ok;
}

bool RenderContext::render_cell_text(const html::Node& node, std::string& out,
                                     std::string& err) const {
    out.clear();
    for (std::size_t i = 0; i < node.children.size(); ++i) {
        const html::Node& child = *node.children[i];
        RenderContext sub = isolated();
        if (!sub.render(child, err)) {
            return false;
        }
        out += normalize_output(sub.take_output());
        if (i + 1 < node.children.size() && child.type == html::NodeType::Element &&
            is_block_level(child.tag_name)) {
            out.push_back('\n');
        }
    }
    return true;
}

bool render_document(const html::Node& root, const Options& options, int& form_counter,
                     core::DiagnosticLog* diagnostics, std::string& out, std::string& err) {
    const FragmentSet fragments = collect_fragment_names(root);
    RenderContext context(RenderShared{options, fragments, form_counter, diagnostics});
    if (!context.render(root, err)) {
        return false;
    }
    out = normalize_output(context.take_output());
    return true;
}

}  // namespace html2org::convert
