#include "html2org/convert/text_normalizer.h"

namespace html2org::convert {
namespace {

constexpr char kAsciiWhitespace[] = " \t\n\r\f\v";
constexpr char kNoBreakSpace[] = "\xC2\xA0";

bool is_collapsible_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string strip_spaces_before_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n') {
            while (!out.empty() && out.back() == ' ') {
                out.pop_back();
            }
        }
        out.push_back(c);
    }
    return out;
}

}  // namespace

std::string trim_whitespace(const std::string& text) {
    const std::size_t first = text.find_first_not_of(kAsciiWhitespace);
    if (first == std::string::npos) {
        return {};
    }
    const std::size_t last = text.find_last_not_of(kAsciiWhitespace);
    return text.substr(first, last - first + 1);
}

std::string trim_trailing_whitespace(const std::string& text) {
    const std::size_t last = text.find_last_not_of(kAsciiWhitespace);
    if (last == std::string::npos) {
        return {};
    }
    return text.substr(0, last + 1);
}

std::string collapse_whitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_run = false;
    for (char c : text) {
        if (is_collapsible_space(c)) {
            if (!in_run) {
                out.push_back(' ');
                in_run = true;
            }
            continue;
        }
        in_run = false;
        out.push_back(c);
    }
    return out;
}

std::string collapse_blank_lines(const std::string& text) {
    const std::string stripped = strip_spaces_before_newlines(text);
    std::string out;
    out.reserve(stripped.size());
    for (char c : stripped) {
        if (c == '\n' && !out.empty() && out.back() == '\n') {
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string normalize_output(const std::string& text) {
    std::string spaced;
    spaced.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text.compare(i, 2, kNoBreakSpace) == 0) {
            spaced.push_back(' ');
            ++i;
            continue;
        }
        spaced.push_back(text[i]);
    }

    std::string collapsed;
    collapsed.reserve(spaced.size());
    std::size_t newline_run = 0;
    for (char c : strip_spaces_before_newlines(spaced)) {
        if (c == '\n') {
            ++newline_run;
            if (newline_run > 2) {
                continue;
            }
        } else {
            newline_run = 0;
        }
        collapsed.push_back(c);
    }

    return trim_whitespace(collapsed);
}

std::size_t count_code_points(const std::string& text) {
    std::size_t count = 0;
    for (char c : text) {
        if (!is_continuation_byte(c)) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> break_long_lines(const std::string& text, std::size_t line_length,
                                          std::size_t limit) {
    std::vector<std::size_t> starts;
    starts.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!is_continuation_byte(text[i])) {
            starts.push_back(i);
        }
    }
    const std::size_t count = starts.size();
    const auto byte_at = [&](std::size_t index) {
        return index < count ? starts[index] : text.size();
    };
    const auto is_space_at = [&](std::size_t index) {
        const char c = text[starts[index]];
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };

    std::vector<std::string> lines;
    if (line_length >= limit) {
        lines.emplace_back("\n");
        line_length = 0;
    }

    std::size_t begin = 0;
    while (count - begin + line_length > limit) {
        const std::size_t cut = begin + (limit - line_length);
        std::size_t split = cut + 1;
        for (std::size_t i = cut + 1; i > begin; --i) {
            if (is_space_at(i - 1)) {
                split = i - 1;
                break;
            }
        }
        if (split == cut + 1) {
            split = cut;
            while (split < count && !is_space_at(split)) {
                ++split;
            }
        }

        lines.push_back(text.substr(byte_at(begin), byte_at(split) - byte_at(begin)) + "\n");
        while (split < count && is_space_at(split)) {
            ++split;
        }
        begin = split;
        line_length = 0;
    }

    if (begin < count) {
        lines.push_back(text.substr(byte_at(begin)));
    }
    return lines;
}

}  // namespace html2org::convert
