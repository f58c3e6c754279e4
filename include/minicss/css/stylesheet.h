#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minicss::css {

// Declaration names the parser recognizes. Unknown is the placeholder for an
// unset Property and is never produced by the parser.
enum class PropertyKind {
  Unknown,
  Color,
  Background,
};

const char* property_kind_name(PropertyKind kind);

// Exact, case-sensitive match against the recognized names.
std::optional<PropertyKind> lookup_property_kind(std::string_view name);

// All views below borrow from the buffer handed to the parser, which must
// outlive the Sheet.
struct Property {
  PropertyKind kind = PropertyKind::Unknown;
  std::string_view value;
};

struct Rule {
  std::string_view selector;
  std::vector<Property> properties;
};

struct Sheet {
  std::vector<Rule> rules;
};

// One "selector: <name>" line per rule followed by " <property>: <value>"
// lines in declaration order and a blank line.
std::string format_sheet(const Sheet& sheet);

}  // namespace minicss::css
