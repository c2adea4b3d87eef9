#include "html2org/cli/command_line.h"
#include "html2org/convert/converter.h"
#include "html2org/core/config.h"
#include "html2org/core/diagnostics.h"

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

using html2org::core::config::kProgramName;
using html2org::core::config::kVersionString;
using html2org::core::Severity;

bool read_text_file(const std::string& path, std::string& out_text, std::string& err) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    err = "Unable to open file: " + path;
    return false;
  }

  std::ostringstream stream;
  stream << file.rdbuf();
  if (!file.good() && !file.eof()) {
    err = "Failed to read file: " + path;
    return false;
  }

  out_text = stream.str();
  return true;
}

bool read_standard_input(std::string& out_text, std::string& err) {
  std::ostringstream stream;
  stream << std::cin.rdbuf();
  if (std::cin.bad()) {
    err = "Failed to read standard input";
    return false;
  }

  out_text = stream.str();
  return true;
}

bool write_text_file(const std::string& path, const std::string& text, std::string& err) {
  std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    err = "Unable to open file for writing: " + path;
    return false;
  }

  file << text;
  file.flush();
  if (!file.good()) {
    err = "Failed to write file: " + path;
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args;
  for (int index = 1; index < argc; ++index) {
    args.emplace_back(argv[index] != nullptr ? argv[index] : "");
  }

  html2org::cli::CommandLine command;
  std::string err;
  if (!html2org::cli::parse_command_line(args, command, err)) {
    std::cerr << err << "\n";
    html2org::cli::print_usage(std::cerr);
    return 1;
  }
  if (command.show_help) {
    html2org::cli::print_usage(std::cout);
    return 0;
  }
  if (command.show_version) {
    std::cout << kVersionString << "\n";
    return 0;
  }

  std::string input;
  const bool read_ok = command.input_path.empty()
                           ? read_standard_input(input, err)
                           : read_text_file(command.input_path, input, err);
  if (!read_ok) {
    std::cerr << err << "\n";
    return 1;
  }

  html2org::convert::Converter converter(command.options);
  if (command.verbose) {
    converter.diagnostics().add_sink([](const html2org::core::DiagnosticEvent& event) {
      std::cerr << html2org::core::format_diagnostic(event) << "\n";
    });
    if (!html2org::cli::looks_like_markup(input)) {
      std::cerr << "[warning] " << kProgramName
                << ": input does not look like HTML; converting it anyway\n";
    }
  } else {
    converter.diagnostics().set_threshold(Severity::Error);
  }

  const html2org::convert::ConvertResult result = converter.convert(input);
  if (!result.ok) {
    const html2org::core::ConversionFailure* failure = converter.last_failure();
    if (command.verbose && failure != nullptr) {
      std::cerr << failure->describe();
    } else {
      std::cerr << result.message << "\n";
    }
    return 1;
  }

  if (command.verbose) {
    const std::uint64_t call = converter.diagnostics().current_call();
    std::cerr << "[info] " << kProgramName << ": "
              << converter.diagnostics().count(Severity::Warning, call) << " warning(s)\n";
  }

  const std::string text = result.text + "\n";
  if (command.output_path.empty()) {
    std::cout << text;
    std::cout.flush();
    if (!std::cout.good()) {
      std::cerr << "Failed to write standard output\n";
      return 1;
    }
    return 0;
  }

  if (!write_text_file(command.output_path, text, err)) {
    std::cerr << err << "\n";
    return 1;
  }
  return 0;
}
