#include "minicss/css/scanner.h"

#include <cctype>

#include "minicss/core/config.h"

namespace minicss::css {
namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_identifier_char(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

const char* parse_error_name(ParseError error) {
  switch (error) {
    case ParseError::None:              return "none";
    case ParseError::NoSuchSyntax:      return "no such syntax";
    case ParseError::InvalidIdentifier: return "invalid identifier";
    case ParseError::UnknownProperty:   return "unknown property";
  }
  return "unknown";
}

void report_parse_error(std::string_view source, size_t offset, const std::string& stage,
                        const std::string& message, core::DiagnosticEmitter& diagnostics) {
  const core::SourceLocation location = core::locate_offset(source, offset);
  diagnostics.emit(core::Severity::Error, core::config::kParserModule, stage,
                   core::format_source_diagnostic(source, offset, message),
                   location.line, location.column);
}

size_t skip_whitespace(std::string_view source, size_t cursor) {
  while (cursor < source.size() && is_space(source[cursor])) {
    ++cursor;
  }
  return cursor;
}

ParseError expect_char(std::string_view source, size_t* cursor, char syntax,
                       core::DiagnosticEmitter& diagnostics) {
  if (*cursor < source.size() && source[*cursor] == syntax) {
    ++(*cursor);
    return ParseError::None;
  }

  report_parse_error(source, *cursor, "syntax",
                     std::string("Expected syntax: '") + syntax + "'.", diagnostics);
  return ParseError::NoSuchSyntax;
}

ParseError parse_identifier(std::string_view source, size_t* cursor,
                            std::string_view* identifier,
                            core::DiagnosticEmitter& diagnostics) {
  size_t end = *cursor;
  while (end < source.size() && is_identifier_char(source[end])) {
    ++end;
  }

  if (end == *cursor) {
    report_parse_error(source, *cursor, "identifier", "Expected valid identifier.",
                       diagnostics);
    return ParseError::InvalidIdentifier;
  }

  *identifier = source.substr(*cursor, end - *cursor);
  *cursor = end;
  return ParseError::None;
}

}  // namespace minicss::css
