#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "html2org/convert/options.h"

namespace html2org::cli {

struct CommandLine {
  std::string input_path;
  std::string output_path;
  bool verbose = false;
  bool show_help = false;
  bool show_version = false;
  convert::Options options;
};

void print_usage(std::ostream& stream);

// Parses the arguments after the program name. -h and -v may appear
// anywhere; once seen, the remaining arguments are not checked.
bool parse_command_line(const std::vector<std::string>& args, CommandLine& command,
                        std::string& err);

// True when the first non-blank character after an optional BOM is '<'.
bool looks_like_markup(const std::string& text);

}  // namespace html2org::cli
