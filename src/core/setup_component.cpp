/**
 * @file setup_component.cpp
 * @brief Component catalog construction and lookup
 */

#include "core/setup_component.hpp"

#include <utility>

namespace setupforge {

result<component_catalog>
component_catalog::from_components(std::vector<setup_component> components) {
  component_catalog catalog;
  for (auto &component : components) {
    std::string id = component.id;
    if (!catalog.components_.emplace(id, std::move(component)).second) {
      return setup_error::invalid_component_metadata(
          id, "component id is defined more than once");
    }
  }
  return catalog;
}

const setup_component *component_catalog::find(const std::string &id) const {
  auto it = components_.find(id);
  if (it == components_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::vector<std::string> component_catalog::ids() const {
  std::vector<std::string> result;
  result.reserve(components_.size());
  for (const auto &[id, _] : components_) {
    result.push_back(id);
  }
  return result;
}

} // namespace setupforge
