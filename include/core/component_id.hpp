/**
 * @file component_id.hpp
 * @brief Validated setup component identifier
 */

#pragma once

#include "core/setup_error.hpp"

#include <ostream>
#include <string>

namespace setupforge {

/**
 * @brief A validated setup component identifier
 *
 * Guarantees:
 *   - Non-empty
 *   - Only ASCII alphanumerics, '-', '_' or '.'
 *   - No path separators, and never "." or ".."
 *
 * Ordering is plain byte-wise string ordering, which is what every
 * deterministic tie-break in the resolver relies on.
 */
class component_id {
public:
  /**
   * @brief Validate a raw identifier
   * @return The identifier, or an invalid_component_id error
   */
  static result<component_id> parse(const std::string &raw);

  /**
   * @brief Check the identifier rules without constructing anything
   */
  static bool is_valid(const std::string &raw);

  const std::string &str() const { return value_; }

  bool operator==(const component_id &other) const {
    return value_ == other.value_;
  }
  bool operator!=(const component_id &other) const {
    return value_ != other.value_;
  }
  bool operator<(const component_id &other) const {
    return value_ < other.value_;
  }

private:
  explicit component_id(std::string value) : value_(std::move(value)) {}

  std::string value_;
};

inline std::ostream &operator<<(std::ostream &os, const component_id &id) {
  return os << id.str();
}

} // namespace setupforge
