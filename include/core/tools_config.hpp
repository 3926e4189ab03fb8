/**
 * @file tools_config.hpp
 * @brief The user's component selection (.setup/tools.toml)
 *
 *   tools = ["gh", "just"]
 */

#pragma once

#include "core/setup_error.hpp"

#include <string>
#include <vector>

namespace setupforge {

struct tools_config {
  /// Requested component ids in file order (duplicates removed)
  std::vector<std::string> tools;
};

/**
 * @brief Parse tools.toml text
 * @return invalid_config for malformed TOML, a missing or empty list, or a
 * non-string entry; invalid_component_id for an entry that is not a valid id
 */
result<tools_config> parse_tools_config(const std::string &content);

/**
 * @brief Template written by `setupforge init`
 */
std::string default_tools_config();

} // namespace setupforge
