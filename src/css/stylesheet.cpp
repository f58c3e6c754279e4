#include "minicss/css/stylesheet.h"

#include <initializer_list>
#include <sstream>

namespace minicss::css {

const char* property_kind_name(PropertyKind kind) {
  switch (kind) {
    case PropertyKind::Unknown:    return "unknown";
    case PropertyKind::Color:      return "color";
    case PropertyKind::Background: return "background";
  }
  return "unknown";
}

std::optional<PropertyKind> lookup_property_kind(std::string_view name) {
  for (PropertyKind kind : {PropertyKind::Color, PropertyKind::Background}) {
    if (name == property_kind_name(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

std::string format_sheet(const Sheet& sheet) {
  std::ostringstream oss;
  for (const auto& rule : sheet.rules) {
    oss << "selector: " << rule.selector << "\n";
    for (const auto& property : rule.properties) {
      if (property.kind == PropertyKind::Unknown) {
        continue;
      }
      oss << " " << property_kind_name(property.kind) << ": " << property.value << "\n";
    }
    oss << "\n";
  }
  return oss.str();
}

}  // namespace minicss::css
