#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace html2org::convert {

std::string trim_whitespace(const std::string& text);
std::string trim_trailing_whitespace(const std::string& text);

// Replaces each run of space, tab, CR, LF and FF with a single space.
std::string collapse_whitespace(const std::string& text);

// Replaces each run of newlines (and the blank lines between them) with a
// single newline.
std::string collapse_blank_lines(const std::string& text);

// Final cleanup of a rendered document, in order: U+00A0 becomes a plain
// space, spaces before newlines are stripped, three or more newlines become
// one blank line and the result is trimmed.
std::string normalize_output(const std::string& text);

// Breaks `text` at whitespace so no line grows past `limit` code points,
// given that `line_length` code points are already on the current line. A
// word longer than the limit is kept whole. Each piece but the last ends in
// a newline.
std::vector<std::string> break_long_lines(const std::string& text, std::size_t line_length,
                                          std::size_t limit);

std::size_t count_code_points(const std::string& text);

}  // namespace html2org::convert
