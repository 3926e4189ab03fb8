/**
 * @file dependency_graph.hpp
 * @brief Install-order resolution over the component catalog
 */

#pragma once

#include "core/component_id.hpp"
#include "core/setup_component.hpp"
#include "core/setup_error.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace setupforge {

/**
 * @brief Ids in install order, dependencies before dependents
 */
using resolved_order = std::vector<component_id>;

/**
 * @brief Per-id marker used by the depth-first traversal
 */
enum class visit_state { unvisited, in_progress, done };

/**
 * @brief Visitation state left behind by a completed traversal
 */
struct traversal {
  std::map<component_id, visit_state> states; ///< Absent ids are unvisited
  std::vector<component_id> postorder;        ///< Order nodes became done
};

/**
 * @brief Validated dependency edges of a catalog
 *
 * The graph copies the edges it needs and keeps no reference to the
 * catalog, so several graphs (and resolutions) can coexist freely.
 */
class dependency_graph {
public:
  /**
   * @brief Validate a catalog and build its graph
   *
   * Fails with invalid_component_metadata for a bad id, a self dependency,
   * a bad or duplicated env name, or an env name declared secret by one
   * component and plain by another; fails with component_not_found for a
   * dangling dependency reference.
   */
  static result<dependency_graph> build(const component_catalog &catalog);

  /**
   * @brief Compute the install order for a requested set
   *
   * The closure is collected by an iterative depth-first traversal that
   * reports the exact cycle path. Emission then starts from every closure
   * member without dependencies, in ascending id order; components that
   * become ready together are queued in ascending id order behind those
   * already waiting.
   *
   * @param selected Requested ids
   * @return Each transitively required id exactly once, or an error
   */
  result<resolved_order> resolve(const std::set<component_id> &selected) const;

  /**
   * @brief Same as above for raw, not yet validated ids
   */
  result<resolved_order> resolve(const std::vector<std::string> &selected) const;

  /**
   * @brief Depth-first closure of the selected ids
   *
   * Roots and each node's dependencies are visited in ascending id order.
   * Reaching an in-progress node fails with circular_dependency carrying
   * the path from the repeated id back to itself.
   */
  result<traversal> traverse(const std::set<component_id> &selected) const;

  /**
   * @brief Direct dependencies of an id, ascending
   */
  const std::vector<component_id> &dependencies_of(const component_id &id) const;

  bool contains(const component_id &id) const { return edges_.count(id) > 0; }

private:
  dependency_graph() = default;

  std::map<component_id, std::vector<component_id>> edges_;
  std::vector<std::string> available_;
};

} // namespace setupforge
