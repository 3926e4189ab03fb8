/**
 * @file component_id.cpp
 * @brief Identifier validation rules
 */

#include "core/component_id.hpp"

namespace setupforge {

static bool is_id_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
}

bool component_id::is_valid(const std::string &raw) {
  if (raw.empty() || raw == "." || raw == "..") {
    return false;
  }
  for (char c : raw) {
    if (!is_id_char(c)) {
      return false;
    }
  }
  return true;
}

result<component_id> component_id::parse(const std::string &raw) {
  if (!is_valid(raw)) {
    return setup_error::invalid_component_id(raw);
  }
  return component_id(raw);
}

} // namespace setupforge
