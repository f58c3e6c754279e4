#include "minicss/core/config.h"
#include "minicss/core/diagnostics.h"
#include "minicss/css/css_parser.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

using namespace minicss::core::config;

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName << " [-q|--quiet] [-v|--verbose] <file.css>\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool is_quiet_flag(std::string_view text) {
  return text == "-q" || text == "--quiet";
}

bool is_verbose_flag(std::string_view text) {
  return text == "-v" || text == "--verbose";
}

bool read_file(const std::string& path, std::string& contents) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return false;
  }

  contents = buffer.str();
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return kExitSuccess;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << kVersionString << "\n";
    return kExitSuccess;
  }

  bool quiet = false;
  bool verbose = false;
  std::vector<std::string> positional_args;
  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (is_quiet_flag(argument)) {
      quiet = true;
      continue;
    }
    if (is_verbose_flag(argument)) {
      verbose = true;
      continue;
    }
    if (argument.size() > 1 && argument.front() == '-') {
      std::cerr << "Unknown option: '" << argument << "'\n";
      print_usage(std::cerr);
      return kExitUsage;
    }
    positional_args.emplace_back(argument);
  }

  if (positional_args.size() != 1) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  const std::string& path = positional_args[0];

  minicss::core::DiagnosticEmitter diagnostics;
  diagnostics.set_min_severity(verbose ? minicss::core::Severity::Info
                                       : minicss::core::Severity::Warning);
  if (!quiet) {
    diagnostics.add_observer([](const minicss::core::DiagnosticEvent& event) {
      // Parse errors already carry the rendered source snippet.
      if (event.line != 0) {
        std::cerr << event.message;
      } else {
        std::cerr << minicss::core::format_diagnostic(event) << "\n";
      }
    });
  }

  // Owns the text every parsed view points into.
  std::string css;
  if (!read_file(path, css)) {
    diagnostics.emit(minicss::core::Severity::Error, kProgramName, "read",
                     "cannot read '" + path + "'");
    return kExitUnreadableInput;
  }

  const minicss::css::ParseSheetResult result = minicss::css::parse_sheet(css, diagnostics);
  if (!result.ok()) {
    diagnostics.emit(minicss::core::Severity::Info, kProgramName, "parse",
                     std::string("aborted: ") + minicss::css::parse_error_name(result.error));
    return kExitParseFailure;
  }

  diagnostics.emit(minicss::core::Severity::Info, kProgramName, "parse",
                   "parsed " + std::to_string(result.sheet.rules.size()) + " rule(s) from '" +
                       path + "'");
  std::cout << minicss::css::format_sheet(result.sheet);
  return kExitSuccess;
}
