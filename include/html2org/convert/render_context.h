#pragma once

#include <cstddef>
#include <string>

#include "html2org/convert/anchors.h"
#include "html2org/convert/options.h"
#include "html2org/convert/table_context.h"
#include "html2org/core/diagnostics.h"
#include "html2org/html/dom.h"

namespace html2org::convert {

// Read-only inputs plus the form id source shared by every context that
// renders part of one document.
struct RenderShared {
    const Options& options;
    const FragmentSet& fragments;
    int& form_counter;
    core::DiagnosticLog* diagnostics = nullptr;
};

// Mutable state of one depth-first rendering pass. Subtrees that have to be
// measured or post-processed before they are emitted are rendered by a
// child context whose finished text is folded back into this one.
class RenderContext {
public:
    explicit RenderContext(const RenderShared& shared);

    bool render(const html::Node& node, std::string& err);
    bool render_children(const html::Node& node, std::string& err);

    const std::string& output() const { return buffer_; }
    std::string take_output();

    int blockquote_level() const { return blockquote_level_; }
    std::size_t line_length() const { return line_length_; }

private:
    RenderContext isolated() const;
    bool render_isolated(const html::Node& node, std::string& out, std::string& err) const;

    void emit(const std::string& data);
    void append(const std::string& data);
    void ensure_line_start();

    bool render_element(const html::Node& node, std::string& err);
    bool dispatch(const html::Node& node, std::string& err);
    void place_internal_anchor(const html::Node& node, std::size_t mark);

    bool render_heading(const html::Node& node, int level, std::string& err);
    bool render_blockquote(const html::Node& node, std::string& err);
    bool render_block_container(const html::Node& node, std::string& err);
    bool render_paragraph(const html::Node& node, std::string& err);
    bool render_list_item(const html::Node& node, std::string& err);
    bool render_definition_term(const html::Node& node, std::string& err);
    bool render_definition(const html::Node& node, std::string& err);
    bool render_emphasis(const html::Node& node, const char* delimiter, std::string& err);
    bool render_anchor(const html::Node& node, std::string& err);
    bool render_image(const html::Node& node, std::string& err);
    bool render_preformatted(const html::Node& node, std::string& err);
    bool render_inline_code(const html::Node& node, std::string& err);
    bool render_title(const html::Node& node, std::string& err);
    bool render_noscript(const html::Node& node, std::string& err);
    bool render_input(const html::Node& node);
    bool render_textarea(const html::Node& node, std::string& err);
    bool render_select(const html::Node& node);
    bool render_form(const html::Node& node, std::string& err);
    bool render_table(const html::Node& node, std::string& err);
    bool render_table_row(const html::Node& node, std::string& err);
    bool render_table_cell(const html::Node& node, bool header, std::string& err);
    bool render_table_footer(const html::Node& node, std::string& err);
    bool render_cell_text(const html::Node& node, std::string& out, std::string& err) const;

    void emit_form_field(const std::string& kind, const std::string& type,
                         const html::Node& node, const std::string& content);
    std::string next_form_id();
    void warn(const std::string& stage, const std::string& message);

    RenderShared shared_;
    std::string buffer_;
    std::string line_prefix_;
    TableContext* table_ = nullptr;
    bool ends_with_newline_ = false;
    bool just_closed_block_ = false;
    int blockquote_level_ = 0;
    std::size_t line_length_ = 0;
    bool is_preformatted_ = false;
    bool is_in_form_ = false;
    std::string form_id_;
    int ordered_item_ = 0;  // next number inside <ol>, 0 elsewhere
};

// Renders a whole document and applies the final output cleanup.
bool render_document(const html::Node& root, const Options& options, int& form_counter,
                     core::DiagnosticLog* diagnostics, std::string& out, std::string& err);

// Element names whose content starts on a line of its own.
bool is_block_level(const std::string& tag);

}  // namespace html2org::convert
