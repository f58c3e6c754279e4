#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "minicss/core/diagnostics.h"

namespace minicss::css {

enum class ParseError {
  None,
  NoSuchSyntax,
  InvalidIdentifier,
  UnknownProperty,
};

const char* parse_error_name(ParseError error);

// Emits one error diagnostic anchored at `offset`, with the source line and
// caret rendered into the message.
void report_parse_error(std::string_view source, size_t offset, const std::string& stage,
                        const std::string& message, core::DiagnosticEmitter& diagnostics);

// Returns the first non-whitespace position at or after `cursor`, or
// source.size().
size_t skip_whitespace(std::string_view source, size_t cursor);

// Consumes `syntax` at *cursor. On failure *cursor is left unchanged.
ParseError expect_char(std::string_view source, size_t* cursor, char syntax,
                       core::DiagnosticEmitter& diagnostics);

// Consumes the longest run of alphabetic characters at *cursor into
// *identifier. An empty run is an error.
ParseError parse_identifier(std::string_view source, size_t* cursor,
                            std::string_view* identifier,
                            core::DiagnosticEmitter& diagnostics);

}  // namespace minicss::css
