/**
 * @file setup_error.hpp
 * @brief Structured errors returned by catalog, graph and merge operations
 *
 * Core operations never throw; they return a result<T> holding either the
 * value or a setup_error with enough detail to render a precise diagnostic.
 */

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace setupforge {

/**
 * @brief Error taxonomy
 */
enum class setup_error_kind {
  component_not_found,
  circular_dependency,
  invalid_component_metadata,
  malformed_env_toml,
  invalid_component_id,
  invalid_config
};

/**
 * @brief A terminal, non-retryable logic or data error
 *
 * Only the fields relevant to the kind are populated.
 */
struct setup_error {
  setup_error_kind kind;
  std::string name;                   ///< Offending id (not found, invalid id)
  std::vector<std::string> available; ///< Every catalog id, ascending
  std::vector<std::string> cycle;     ///< Repeated id ... back to itself
  std::string component;              ///< Component whose metadata is invalid
  std::string reason;                 ///< Human-readable cause

  static setup_error component_not_found(std::string name,
                                         std::vector<std::string> available);
  static setup_error circular_dependency(std::vector<std::string> cycle);
  static setup_error invalid_component_metadata(std::string component,
                                                std::string reason);
  static setup_error malformed_env_toml(std::string reason);
  static setup_error invalid_component_id(std::string id);
  static setup_error invalid_config(std::string reason);

  /**
   * @brief Stable identifier of the kind, e.g. "circular_dependency"
   */
  const char *kind_name() const;

  /**
   * @brief One-line diagnostic suitable for logger::print_error
   */
  std::string message() const;
};

/**
 * @brief Value-or-error return type used across the core
 */
template <typename T> class result {
public:
  result(T value) : data_(std::move(value)) {}
  result(setup_error error) : data_(std::move(error)) {}

  bool ok() const { return std::holds_alternative<T>(data_); }
  explicit operator bool() const { return ok(); }

  const T &value() const & { return std::get<T>(data_); }
  T &value() & { return std::get<T>(data_); }
  T &&value() && { return std::get<T>(std::move(data_)); }

  const setup_error &error() const { return std::get<setup_error>(data_); }

private:
  std::variant<T, setup_error> data_;
};

} // namespace setupforge
