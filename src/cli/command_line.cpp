#include "html2org/cli/command_line.h"

#include <cstddef>

#include "html2org/core/config.h"

namespace html2org::cli {
namespace {

bool is_help_flag(const std::string& text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(const std::string& text) {
  return text == "-v" || text == "--version";
}

bool take_value(const std::vector<std::string>& args, std::size_t& index, std::string& value,
                std::string& err) {
  if (index + 1 >= args.size()) {
    err = "Missing value for " + args[index];
    return false;
  }
  value = args[++index];
  return true;
}

}  // namespace

void print_usage(std::ostream& stream) {
  stream << "usage: " << core::config::kProgramName
         << " [-i input.html] [-o output.org] [-u base_url] [-t] [-l] [-w] [-n] [-a] [-d]"
            " [--verbose]\n"
         << "  -i <path>   input file (default stdin)\n"
         << "  -o <path>   output file (default stdout)\n"
         << "  -u <url>    base URL for relative links\n"
         << "  -t          render tables as aligned Org tables\n"
         << "  -l          omit link targets\n"
         << "  -w          break long lines inside quotes\n"
         << "  -n          render <noscript> content\n"
         << "  -a          mark in-page link targets with <<anchors>>\n"
         << "  -d          keep data URLs in full\n"
         << "  --verbose   print diagnostics to stderr\n"
         << "  -v, --version\n"
         << "  -h, --help\n";
}

bool parse_command_line(const std::vector<std::string>& args, CommandLine& command,
                        std::string& err) {
  for (std::size_t index = 0; index < args.size(); ++index) {
    const std::string& argument = args[index];
    if (is_help_flag(argument)) {
      command.show_help = true;
      return true;
    }
    if (is_version_flag(argument)) {
      command.show_version = true;
      return true;
    }

    if (argument == "-i") {
      if (!take_value(args, index, command.input_path, err)) {
        return false;
      }
    } else if (argument == "-o") {
      if (!take_value(args, index, command.output_path, err)) {
        return false;
      }
    } else if (argument == "-u") {
      if (!take_value(args, index, command.options.base_url, err)) {
        return false;
      }
    } else if (argument == "-t") {
      command.options.pretty_tables = true;
      command.options.pretty_table_options = convert::make_default_pretty_table_options();
    } else if (argument == "-l") {
      command.options.omit_links = true;
    } else if (argument == "-w") {
      command.options.break_long_lines = true;
    } else if (argument == "-n") {
      command.options.show_noscripts = true;
    } else if (argument == "-a") {
      command.options.show_internal_anchors = true;
    } else if (argument == "-d") {
      command.options.show_full_data_urls = true;
    } else if (argument == "--verbose") {
      command.verbose = true;
    } else {
      err = "Unknown argument: '" + argument + "'";
      return false;
    }
  }
  return true;
}

bool looks_like_markup(const std::string& text) {
  std::size_t pos = 0;
  if (text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    pos = 3;
  }
  pos = text.find_first_not_of(" \t\r\n\f", pos);
  return pos != std::string::npos && text[pos] == '<';
}

}  // namespace html2org::cli
