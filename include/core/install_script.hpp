/**
 * @file install_script.hpp
 * @brief install.sh generation from a resolved order
 */

#pragma once

#include "core/dependency_graph.hpp"
#include "core/setup_component.hpp"

#include <string>

namespace setupforge {

/**
 * @brief Render the install script for a resolved order
 *
 * Emits a fixed bash preamble followed by one block per component, in
 * order. Each block opens with a comment banner naming the component id and
 * runs the component's install steps verbatim, in declared order, inside a
 * subshell. Performs no I/O; identical inputs always give identical bytes,
 * which drift detection relies on.
 *
 * @param order Output of dependency_graph::resolve
 * @param catalog The catalog the order was resolved against
 * @return The complete script text
 */
std::string generate_install_script(const resolved_order &order,
                                    const component_catalog &catalog);

} // namespace setupforge
