#pragma once

#include <cstddef>
#include <string_view>

#include "minicss/core/diagnostics.h"
#include "minicss/css/scanner.h"
#include "minicss/css/stylesheet.h"

namespace minicss::css {

// Each production starts at *cursor and, on success, stores its result and
// moves *cursor just past the consumed text. On failure it has emitted one
// diagnostic, leaves *cursor and the output untouched and returns the error.
ParseError parse_property(std::string_view source, size_t* cursor, Property* property,
                          core::DiagnosticEmitter& diagnostics);

ParseError parse_rule(std::string_view source, size_t* cursor, Rule* rule,
                      core::DiagnosticEmitter& diagnostics);

struct ParseSheetResult {
  Sheet sheet;
  ParseError error = ParseError::None;

  bool ok() const { return error == ParseError::None; }
};

// Parses the whole buffer. A failed parse carries an empty sheet.
ParseSheetResult parse_sheet(std::string_view source, core::DiagnosticEmitter& diagnostics);
ParseSheetResult parse_sheet(std::string_view source);

}  // namespace minicss::css
