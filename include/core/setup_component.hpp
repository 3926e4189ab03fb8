/**
 * @file setup_component.hpp
 * @brief Setup component definitions and the immutable component catalog
 */

#pragma once

#include "core/setup_error.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace setupforge {

/**
 * @brief Environment variable a component needs at runtime
 */
struct env_spec {
  std::string name;
  bool secret = false; // routed to secrets.toml instead of vars.toml
  std::string description;
  std::optional<std::string> default_value;
};

/**
 * @brief A unit of optional developer tooling
 *
 * Fields hold raw strings as produced by a loader; dependency_graph::build
 * is the single place that validates them.
 */
struct setup_component {
  std::string id;
  std::string display_name;
  std::string description;
  std::set<std::string> dependencies;
  std::vector<std::string> install_steps; // opaque shell text, in order
  std::vector<env_spec> env_specs;
};

/**
 * @brief Mapping from component id to definition
 *
 * Built once per invocation and never mutated afterwards. Lookups and id
 * listings are independent of the order components were supplied in.
 */
class component_catalog {
public:
  component_catalog() = default;

  /**
   * @brief Build a catalog from loader output
   * @param components Component definitions in any order
   * @return The catalog, or invalid_component_metadata on a duplicate id
   */
  static result<component_catalog>
  from_components(std::vector<setup_component> components);

  /**
   * @brief Look up a component by id
   * @return Pointer into the catalog, or nullptr if absent
   */
  const setup_component *find(const std::string &id) const;

  bool contains(const std::string &id) const {
    return components_.count(id) > 0;
  }

  /**
   * @brief All ids in ascending order
   */
  std::vector<std::string> ids() const;

  const std::map<std::string, setup_component> &components() const {
    return components_;
  }

  std::size_t size() const { return components_.size(); }
  bool empty() const { return components_.empty(); }

private:
  std::map<std::string, setup_component> components_;
};

} // namespace setupforge
