#include "minicss/css/css_parser.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace minicss::css {

ParseError parse_property(std::string_view source, size_t* cursor, Property* property,
                          core::DiagnosticEmitter& diagnostics) {
  const size_t start = *cursor;
  size_t pos = skip_whitespace(source, start);

  std::string_view name;
  ParseError error = parse_identifier(source, &pos, &name, diagnostics);
  if (error != ParseError::None) {
    return error;
  }

  pos = skip_whitespace(source, pos);
  error = expect_char(source, &pos, ':', diagnostics);
  if (error != ParseError::None) {
    return error;
  }

  // Checked before the value so that e.g. "margin: 1px;" reports the name.
  const std::optional<PropertyKind> kind = lookup_property_kind(name);
  if (!kind) {
    report_parse_error(source, start, "property",
                       "Unknown property: '" + std::string(name) + "'.", diagnostics);
    return ParseError::UnknownProperty;
  }

  pos = skip_whitespace(source, pos);
  std::string_view value;
  error = parse_identifier(source, &pos, &value, diagnostics);
  if (error != ParseError::None) {
    return error;
  }

  pos = skip_whitespace(source, pos);
  error = expect_char(source, &pos, ';', diagnostics);
  if (error != ParseError::None) {
    return error;
  }

  property->kind = *kind;
  property->value = value;
  *cursor = pos;
  return ParseError::None;
}

ParseError parse_rule(std::string_view source, size_t* cursor, Rule* rule,
                      core::DiagnosticEmitter& diagnostics) {
  size_t pos = skip_whitespace(source, *cursor);

  std::string_view selector;
  ParseError error = parse_identifier(source, &pos, &selector, diagnostics);
  if (error != ParseError::None) {
    return error;
  }

  pos = skip_whitespace(source, pos);
  error = expect_char(source, &pos, '{', diagnostics);
  if (error != ParseError::None) {
    return error;
  }

  std::vector<Property> properties;
  while (true) {
    pos = skip_whitespace(source, pos);
    // End of input falls through to the '}' check below.
    if (pos >= source.size() || source[pos] == '}') {
      break;
    }

    Property property;
    error = parse_property(source, &pos, &property, diagnostics);
    if (error != ParseError::None) {
      return error;
    }
    properties.push_back(property);
  }

  error = expect_char(source, &pos, '}', diagnostics);
  if (error != ParseError::None) {
    return error;
  }

  rule->selector = selector;
  rule->properties = std::move(properties);
  *cursor = pos;
  return ParseError::None;
}

ParseSheetResult parse_sheet(std::string_view source, core::DiagnosticEmitter& diagnostics) {
  ParseSheetResult result;
  Sheet sheet;

  size_t cursor = skip_whitespace(source, 0);
  while (cursor < source.size()) {
    Rule rule;
    const ParseError error = parse_rule(source, &cursor, &rule, diagnostics);
    if (error != ParseError::None) {
      result.error = error;
      return result;
    }
    sheet.rules.push_back(std::move(rule));
    cursor = skip_whitespace(source, cursor);
  }

  result.sheet = std::move(sheet);
  return result;
}

ParseSheetResult parse_sheet(std::string_view source) {
  core::DiagnosticEmitter diagnostics;
  return parse_sheet(source, diagnostics);
}

}  // namespace minicss::css
