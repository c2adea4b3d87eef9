#pragma once

#include <cstddef>
#include <string>

namespace html2org::net {

// An RFC 3986 URI reference. Components keep their escaped form.
struct Url {
  std::string scheme;  // lower-cased, empty for relative references
  std::string opaque;  // "mailto:user@host" keeps "user@host" here
  bool has_authority = false;
  // "http:/x" has a scheme and a rooted path but no "//" authority.
  bool omit_host = false;
  std::string authority;
  std::string path;
  bool force_query = false;  // reference ended with a bare '?'
  std::string query;
  std::string fragment;

  bool is_absolute() const { return !scheme.empty(); }
  std::string to_string() const;
};

enum class UrlErrorCode {
  None,
  ControlCharacter,
  MissingScheme,
  ColonInFirstSegment,
  InvalidEscape,
  InvalidHost,
  InvalidPort,
};

struct UrlError {
  UrlErrorCode code = UrlErrorCode::None;
  std::string message;
  // Byte offset into the parsed input where the problem starts.
  std::size_t offset = 0;
};

bool parse_url(const std::string& input, Url& out, UrlError& err);
bool parse_url(const std::string& input, Url& out, std::string& err);

// Resolves `ref` against `base` (RFC 3986 section 5.2): merges paths and
// removes dot segments.
Url resolve_reference(const Url& base, const Url& ref);

std::string remove_dot_segments(const std::string& path);

}  // namespace html2org::net
