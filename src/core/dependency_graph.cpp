/**
 * @file dependency_graph.cpp
 * @brief Catalog validation, closure traversal and install-order emission
 */

#include "core/dependency_graph.hpp"

#include <algorithm>
#include <deque>
#include <optional>

#include <fmt/format.h>

namespace setupforge {

namespace {

bool is_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  for (char c : name) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) {
      return false;
    }
  }
  return true;
}

struct env_owner {
  bool secret;
  std::string component;
};

// Metadata checks for one component; cross-component env secrecy is tracked
// in `owners` across calls.
std::optional<setup_error>
check_metadata(const setup_component &component,
               std::map<std::string, env_owner> &owners) {
  if (component.id.empty()) {
    return setup_error::invalid_component_metadata("", "component id is empty");
  }
  if (!component_id::is_valid(component.id)) {
    return setup_error::invalid_component_metadata(
        component.id, fmt::format("invalid component id '{}'", component.id));
  }

  for (const auto &dep : component.dependencies) {
    if (dep == component.id) {
      return setup_error::invalid_component_metadata(
          component.id, "component depends on itself");
    }
    if (!component_id::is_valid(dep)) {
      return setup_error::invalid_component_metadata(
          component.id, fmt::format("invalid dependency id '{}'", dep));
    }
  }

  std::set<std::string> seen;
  for (const auto &spec : component.env_specs) {
    if (!is_env_name(spec.name)) {
      return setup_error::invalid_component_metadata(
          component.id,
          fmt::format("invalid environment variable name '{}'", spec.name));
    }
    if (!seen.insert(spec.name).second) {
      return setup_error::invalid_component_metadata(
          component.id,
          fmt::format("environment variable '{}' is declared more than once",
                      spec.name));
    }

    auto owner = owners.find(spec.name);
    if (owner == owners.end()) {
      owners.emplace(spec.name, env_owner{spec.secret, component.id});
    } else if (owner->second.secret != spec.secret) {
      return setup_error::invalid_component_metadata(
          component.id,
          fmt::format("environment variable '{}' is declared {} here but {} "
                      "in '{}'",
                      spec.name, spec.secret ? "secret" : "plain",
                      owner->second.secret ? "secret" : "plain",
                      owner->second.component));
    }
  }
  return std::nullopt;
}

component_id trusted_id(const std::string &raw) {
  // Only called on ids already checked by check_metadata.
  return component_id::parse(raw).value();
}

} // namespace

result<dependency_graph>
dependency_graph::build(const component_catalog &catalog) {
  dependency_graph graph;
  graph.available_ = catalog.ids();

  std::map<std::string, env_owner> owners;
  for (const auto &[id, component] : catalog.components()) {
    if (auto err = check_metadata(component, owners)) {
      return *err;
    }
    if (component.id != id) {
      return setup_error::invalid_component_metadata(
          id, fmt::format("catalog key does not match component id '{}'",
                          component.id));
    }

    std::vector<component_id> deps;
    for (const auto &dep : component.dependencies) {
      if (!catalog.contains(dep)) {
        return setup_error::component_not_found(dep, graph.available_);
      }
      deps.push_back(trusted_id(dep));
    }
    // std::set iteration already yields ascending order
    graph.edges_.emplace(trusted_id(id), std::move(deps));
  }
  return graph;
}

const std::vector<component_id> &
dependency_graph::dependencies_of(const component_id &id) const {
  static const std::vector<component_id> none;
  auto it = edges_.find(id);
  return it == edges_.end() ? none : it->second;
}

result<traversal>
dependency_graph::traverse(const std::set<component_id> &selected) const {
  traversal state;

  auto state_of = [&state](const component_id &id) {
    auto it = state.states.find(id);
    return it == state.states.end() ? visit_state::unvisited : it->second;
  };

  struct frame {
    component_id id;
    std::size_t next_dep;
  };

  for (const auto &root : selected) {
    if (!contains(root)) {
      return setup_error::component_not_found(root.str(), available_);
    }
    if (state_of(root) == visit_state::done) {
      continue;
    }

    std::vector<frame> stack;
    stack.push_back(frame{root, 0});
    state.states[root] = visit_state::in_progress;

    while (!stack.empty()) {
      const component_id current = stack.back().id;
      const auto &deps = edges_.at(current);

      if (stack.back().next_dep < deps.size()) {
        const component_id &dep = deps[stack.back().next_dep++];
        visit_state dep_state = state_of(dep);
        if (dep_state == visit_state::done) {
          continue;
        }
        if (dep_state == visit_state::in_progress) {
          // The in-progress frames are exactly the current path.
          std::vector<std::string> cycle;
          auto start = std::find_if(stack.begin(), stack.end(),
                                    [&dep](const frame &f) { return f.id == dep; });
          for (auto it = start; it != stack.end(); ++it) {
            cycle.push_back(it->id.str());
          }
          cycle.push_back(dep.str());
          return setup_error::circular_dependency(std::move(cycle));
        }
        state.states[dep] = visit_state::in_progress;
        stack.push_back(frame{dep, 0});
      } else {
        state.states[current] = visit_state::done;
        state.postorder.push_back(current);
        stack.pop_back();
      }
    }
  }
  return state;
}

result<resolved_order>
dependency_graph::resolve(const std::set<component_id> &selected) const {
  auto visited = traverse(selected);
  if (!visited) {
    return visited.error();
  }
  const auto &closure = visited.value().postorder;

  // Edge dep -> dependent; every dependency of a closure member is itself in
  // the closure, so in-degree is simply the dependency count.
  std::map<component_id, std::size_t> in_degree;
  std::map<component_id, std::vector<component_id>> dependents;
  for (const auto &id : closure) {
    const auto &deps = dependencies_of(id);
    in_degree[id] = deps.size();
    for (const auto &dep : deps) {
      dependents[dep].push_back(id);
    }
  }

  std::deque<component_id> queue;
  for (const auto &[id, degree] : in_degree) {
    if (degree == 0) {
      queue.push_back(id); // map order keeps the initial batch ascending
    }
  }

  resolved_order order;
  order.reserve(closure.size());
  while (!queue.empty()) {
    component_id current = queue.front();
    queue.pop_front();
    order.push_back(current);

    std::vector<component_id> next_batch;
    auto it = dependents.find(current);
    if (it != dependents.end()) {
      for (const auto &dependent : it->second) {
        if (--in_degree.at(dependent) == 0) {
          next_batch.push_back(dependent);
        }
      }
    }
    std::sort(next_batch.begin(), next_batch.end());
    for (auto &id : next_batch) {
      queue.push_back(std::move(id));
    }
  }

  if (order.size() != closure.size()) {
    // Unreachable after a successful traversal.
    std::vector<std::string> remaining;
    for (const auto &[id, degree] : in_degree) {
      if (degree > 0) {
        remaining.push_back(id.str());
      }
    }
    return setup_error::circular_dependency(std::move(remaining));
  }
  return order;
}

result<resolved_order>
dependency_graph::resolve(const std::vector<std::string> &selected) const {
  std::set<component_id> ids;
  for (const auto &raw : selected) {
    auto id = component_id::parse(raw);
    if (!id) {
      return id.error();
    }
    ids.insert(id.value());
  }
  return resolve(ids);
}

} // namespace setupforge
