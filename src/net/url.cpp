#include "html2org/net/url.h"

#include <cctype>
#include <cstring>
#include <string>
#include <vector>

namespace html2org::net {
namespace {

std::string to_lower_ascii(std::string value) {
  for (char& ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

bool starts_with(const std::string& value, const std::string& prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool is_ascii_alpha(char ch) {
  const unsigned char uch = static_cast<unsigned char>(ch);
  return std::isalpha(uch) != 0;
}

bool is_ascii_digit(char ch) {
  return ch >= '0' && ch <= '9';
}

bool is_hex_digit(char ch) {
  return std::isxdigit(static_cast<unsigned char>(ch)) != 0;
}

bool is_control_char(char ch) {
  const unsigned char uch = static_cast<unsigned char>(ch);
  return uch < 0x20 || uch == 0x7f;
}

// Characters allowed unescaped in a host name.
bool is_host_char(char ch) {
  if (is_ascii_alpha(ch) || is_ascii_digit(ch)) {
    return true;
  }
  return ch != '\0' && std::strchr("-_.~!$&'()*+,;=:[]<>\"", ch) != nullptr;
}

std::string quoted(const std::string& value) {
  return "\"" + value + "\"";
}

bool fail(UrlError& err, UrlErrorCode code, const std::string& input,
          const std::string& reason, std::size_t offset) {
  err.code = code;
  err.message = "parse " + quoted(input) + ": " + reason;
  err.offset = offset;
  return false;
}

// Checks that every '%' in input[begin, end) starts a two-digit hex escape.
bool validate_escapes(const std::string& input, std::size_t begin, std::size_t end,
                      UrlError& err) {
  for (std::size_t i = begin; i < end; ++i) {
    if (input[i] != '%') {
      continue;
    }
    if (i + 2 >= end || !is_hex_digit(input[i + 1]) || !is_hex_digit(input[i + 2])) {
      const std::size_t shown = (end - i < 3) ? end - i : 3;
      return fail(err, UrlErrorCode::InvalidEscape, input,
                  "invalid URL escape " + quoted(input.substr(i, shown)), i);
    }
    i += 2;
  }
  return true;
}

// Splits off the scheme. Returns false only for a reference that starts
// with ':'; `rest_begin` is 0 when there is no scheme.
bool extract_scheme(const std::string& input, std::size_t end, std::string& scheme,
                    std::size_t& rest_begin, UrlError& err) {
  scheme.clear();
  rest_begin = 0;
  for (std::size_t i = 0; i < end; ++i) {
    const char ch = input[i];
    if (is_ascii_alpha(ch)) {
      continue;
    }
    if (is_ascii_digit(ch) || ch == '+' || ch == '-' || ch == '.') {
      if (i == 0) {
        return true;
      }
      continue;
    }
    if (ch == ':') {
      if (i == 0) {
        return fail(err, UrlErrorCode::MissingScheme, input, "missing protocol scheme", 0);
      }
      scheme = to_lower_ascii(input.substr(0, i));
      rest_begin = i + 1;
    }
    return true;
  }
  return true;
}

bool parse_authority(const std::string& input, std::size_t begin, std::size_t end,
                     UrlError& err) {
  std::size_t host_begin = begin;
  std::size_t at = std::string::npos;
  for (std::size_t i = begin; i < end; ++i) {
    if (input[i] == '@') {
      at = i;
    }
  }
  if (at != std::string::npos) {
    if (!validate_escapes(input, begin, at, err)) {
      return false;
    }
    host_begin = at + 1;
  }

  std::size_t port_colon = std::string::npos;
  if (host_begin < end && input[host_begin] == '[') {
    const std::size_t close = input.find(']', host_begin);
    if (close == std::string::npos || close >= end) {
      return fail(err, UrlErrorCode::InvalidHost, input, "missing ']' in host", host_begin);
    }
    if (close + 1 < end) {
      if (input[close + 1] != ':') {
        return fail(err, UrlErrorCode::InvalidPort, input,
                    "invalid port " + quoted(input.substr(close + 1, end - close - 1)) +
                        " after host",
                    close + 1);
      }
      port_colon = close + 1;
    }
  } else {
    for (std::size_t i = end; i > host_begin; --i) {
      if (input[i - 1] == ':') {
        port_colon = i - 1;
        break;
      }
    }
    const std::size_t host_end = (port_colon == std::string::npos) ? end : port_colon;
    if (!validate_escapes(input, host_begin, host_end, err)) {
      return false;
    }
    for (std::size_t i = host_begin; i < host_end; ++i) {
      const char ch = input[i];
      if (ch != '%' && static_cast<unsigned char>(ch) < 0x80 && !is_host_char(ch)) {
        return fail(err, UrlErrorCode::InvalidHost, input,
                    "invalid character " + quoted(std::string(1, ch)) + " in host name", i);
      }
    }
  }

  if (port_colon != std::string::npos) {
    for (std::size_t i = port_colon + 1; i < end; ++i) {
      if (!is_ascii_digit(input[i])) {
        return fail(err, UrlErrorCode::InvalidPort, input,
                    "invalid port " + quoted(input.substr(port_colon, end - port_colon)) +
                        " after host",
                    port_colon);
      }
    }
  }
  return true;
}

bool should_escape(char ch) {
  const unsigned char uch = static_cast<unsigned char>(ch);
  if (uch <= 0x20 || uch >= 0x7f) {
    return true;
  }
  switch (ch) {
    case '"':
    case '<':
    case '>':
    case '\\':
    case '^':
    case '`':
    case '{':
    case '|':
    case '}':
      return true;
    default:
      return false;
  }
}

std::string escape_component(const std::string& value) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string escaped;
  escaped.reserve(value.size());
  for (char ch : value) {
    if (!should_escape(ch)) {
      escaped.push_back(ch);
      continue;
    }
    const unsigned char uch = static_cast<unsigned char>(ch);
    escaped.push_back('%');
    escaped.push_back(kHex[uch >> 4]);
    escaped.push_back(kHex[uch & 0x0F]);
  }
  return escaped;
}

std::string merge_paths(const std::string& base, const std::string& ref) {
  if (ref.empty()) {
    return base;
  }
  if (ref[0] == '/') {
    return ref;
  }
  const std::size_t slash = base.rfind('/');
  if (slash == std::string::npos) {
    return ref;
  }
  return base.substr(0, slash + 1) + ref;
}

}  // namespace

std::string remove_dot_segments(const std::string& path) {
  if (path.empty()) {
    return {};
  }

  std::vector<std::string> segments;
  std::string last;
  std::size_t start = 0;
  while (true) {
    const std::size_t slash = path.find('/', start);
    last = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    if (last == "..") {
      if (!segments.empty()) {
        segments.pop_back();
      }
    } else if (last != ".") {
      segments.push_back(last);
    }
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }

  std::string result = "/";
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (i > 0) {
      result.push_back('/');
    }
    result += segments[i];
  }
  if (last == "." || last == "..") {
    result.push_back('/');
  }
  if (starts_with(result, "//")) {
    result.erase(0, 1);
  }
  return result;
}

std::string Url::to_string() const {
  std::string result;
  if (!scheme.empty()) {
    result += scheme + ":";
  }
  if (!opaque.empty()) {
    result += opaque;
  } else {
    const bool rooted_without_host = omit_host && authority.empty();
    if ((!scheme.empty() || has_authority) && !rooted_without_host &&
        (!authority.empty() || !path.empty())) {
      result += "//" + authority;
    }
    const std::string escaped_path = escape_component(path);
    if (!escaped_path.empty() && escaped_path[0] != '/' && !authority.empty()) {
      result.push_back('/');
    }
    result += escaped_path;
  }
  if (force_query || !query.empty()) {
    result += "?" + query;
  }
  if (!fragment.empty()) {
    result += "#" + escape_component(fragment);
  }
  return result;
}

bool parse_url(const std::string& input, Url& out, UrlError& err) {
  out = Url{};
  err = UrlError{};

  for (std::size_t i = 0; i < input.size(); ++i) {
    if (is_control_char(input[i])) {
      return fail(err, UrlErrorCode::ControlCharacter, input,
                  "invalid control character in URL", i);
    }
  }

  std::size_t end = input.size();
  const std::size_t hash = input.find('#');
  if (hash != std::string::npos) {
    if (!validate_escapes(input, hash + 1, input.size(), err)) {
      return false;
    }
    out.fragment = input.substr(hash + 1);
    end = hash;
  }

  std::size_t begin = 0;
  if (!extract_scheme(input, end, out.scheme, begin, err)) {
    return false;
  }

  std::size_t query_mark = std::string::npos;
  for (std::size_t i = begin; i < end; ++i) {
    if (input[i] == '?') {
      query_mark = i;
      break;
    }
  }
  if (query_mark != std::string::npos) {
    if (query_mark == end - 1) {
      out.force_query = true;
    } else {
      out.query = input.substr(query_mark + 1, end - query_mark - 1);
    }
    end = query_mark;
  }

  const std::string rest = input.substr(begin, end - begin);
  if (!starts_with(rest, "/")) {
    if (!out.scheme.empty()) {
      out.opaque = rest;
      return true;
    }
    const std::size_t slash = rest.find('/');
    if (rest.substr(0, slash).find(':') != std::string::npos) {
      return fail(err, UrlErrorCode::ColonInFirstSegment, input,
                  "first path segment in URL cannot contain colon", begin);
    }
  }

  if (starts_with(rest, "//") && (!out.scheme.empty() || !starts_with(rest, "///"))) {
    const std::size_t authority_begin = begin + 2;
    std::size_t authority_end = input.find('/', authority_begin);
    if (authority_end == std::string::npos || authority_end > end) {
      authority_end = end;
    }
    if (!parse_authority(input, authority_begin, authority_end, err)) {
      return false;
    }
    out.has_authority = true;
    out.authority = input.substr(authority_begin, authority_end - authority_begin);
    begin = authority_end;
  } else if (!out.scheme.empty() && starts_with(rest, "/")) {
    out.omit_host = true;
  }

  if (!validate_escapes(input, begin, end, err)) {
    return false;
  }
  out.path = input.substr(begin, end - begin);
  return true;
}

bool parse_url(const std::string& input, Url& out, std::string& err) {
  UrlError detail;
  if (!parse_url(input, out, detail)) {
    err = detail.message;
    return false;
  }
  return true;
}

Url resolve_reference(const Url& base, const Url& ref) {
  Url url = ref;
  if (ref.scheme.empty()) {
    url.scheme = base.scheme;
  }
  if (!ref.scheme.empty() || ref.has_authority) {
    url.path = remove_dot_segments(ref.path);
    return url;
  }

  if (ref.path.empty() && !ref.force_query && ref.query.empty()) {
    url.query = base.query;
    url.force_query = base.force_query;
    if (ref.fragment.empty()) {
      url.fragment = base.fragment;
    }
  }
  url.has_authority = base.has_authority;
  url.authority = base.authority;
  url.path = remove_dot_segments(merge_paths(base.path, ref.path));
  return url;
}

}  // namespace html2org::net
