#ifndef HTML2ORG_CORE_CONFIG_H
#define HTML2ORG_CORE_CONFIG_H

#include <cstddef>

namespace html2org::core::config {

inline constexpr const char kProgramName[] = "html2org";
inline constexpr const char kVersionString[] = "html2org 0.1.0";

// Longest line emitted inside a quote when long-line wrapping is enabled.
inline constexpr std::size_t kLongLineLimit = 74;
// data: URLs longer than this are shortened unless full display is requested.
inline constexpr std::size_t kDataUrlDisplayLimit = 100;
inline constexpr std::size_t kDefaultTableColumnWidth = 30;
// Open elements past this depth are attached as siblings instead of children.
inline constexpr std::size_t kMaxOpenElements = 512;

inline constexpr const char kFormIdPrefix[] = "org-form-id--";
inline constexpr const char kBlockLinkLabel[] = "Link";
inline constexpr const char kSubmitLinkLabel[] = "Submit";

}  // namespace html2org::core::config

#endif  // HTML2ORG_CORE_CONFIG_H
