/**
 * @file setup_error.cpp
 * @brief Construction and rendering of setup errors
 */

#include "core/setup_error.hpp"

#include <fmt/format.h>

namespace setupforge {

static std::string join(const std::vector<std::string> &items,
                        const char *delimiter) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += delimiter;
    }
    out += items[i];
  }
  return out;
}

setup_error setup_error::component_not_found(std::string name,
                                             std::vector<std::string> available) {
  setup_error err{setup_error_kind::component_not_found};
  err.name = std::move(name);
  err.available = std::move(available);
  return err;
}

setup_error setup_error::circular_dependency(std::vector<std::string> cycle) {
  setup_error err{setup_error_kind::circular_dependency};
  err.cycle = std::move(cycle);
  return err;
}

setup_error setup_error::invalid_component_metadata(std::string component,
                                                    std::string reason) {
  setup_error err{setup_error_kind::invalid_component_metadata};
  err.component = std::move(component);
  err.reason = std::move(reason);
  return err;
}

setup_error setup_error::malformed_env_toml(std::string reason) {
  setup_error err{setup_error_kind::malformed_env_toml};
  err.reason = std::move(reason);
  return err;
}

setup_error setup_error::invalid_component_id(std::string id) {
  setup_error err{setup_error_kind::invalid_component_id};
  err.name = std::move(id);
  return err;
}

setup_error setup_error::invalid_config(std::string reason) {
  setup_error err{setup_error_kind::invalid_config};
  err.reason = std::move(reason);
  return err;
}

const char *setup_error::kind_name() const {
  switch (kind) {
  case setup_error_kind::component_not_found:
    return "component_not_found";
  case setup_error_kind::circular_dependency:
    return "circular_dependency";
  case setup_error_kind::invalid_component_metadata:
    return "invalid_component_metadata";
  case setup_error_kind::malformed_env_toml:
    return "malformed_env_toml";
  case setup_error_kind::invalid_component_id:
    return "invalid_component_id";
  case setup_error_kind::invalid_config:
    return "invalid_config";
  }
  return "unknown";
}

std::string setup_error::message() const {
  switch (kind) {
  case setup_error_kind::component_not_found:
    return fmt::format("Setup component '{}' not found. Available: {}", name,
                       available.empty() ? "(none)" : join(available, ", "));
  case setup_error_kind::circular_dependency:
    return fmt::format("Circular dependency detected: {}", join(cycle, " -> "));
  case setup_error_kind::invalid_component_metadata:
    return fmt::format("Invalid setup component metadata for '{}': {}",
                       component, reason);
  case setup_error_kind::malformed_env_toml:
    return fmt::format("Malformed setup environment TOML: {}", reason);
  case setup_error_kind::invalid_component_id:
    return fmt::format("Invalid setup component identifier '{}': must be "
                       "alphanumeric with hyphens, underscores, or periods",
                       name);
  case setup_error_kind::invalid_config:
    return reason;
  }
  return reason;
}

} // namespace setupforge
