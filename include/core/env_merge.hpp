/**
 * @file env_merge.hpp
 * @brief Merging component env declarations into vars.toml / secrets.toml
 */

#pragma once

#include "core/dependency_graph.hpp"
#include "core/setup_component.hpp"
#include "core/setup_error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace setupforge {

/**
 * @brief A declared key found only in the other document
 *
 * The value is left where the user put it; the caller decides whether to
 * warn about it.
 */
struct misplaced_key {
  std::string name;
  bool declared_secret = false;
};

/**
 * @brief Merged plain and secret documents
 */
struct env_artifacts {
  std::string plain;  ///< vars.toml
  std::string secret; ///< secrets.toml
  std::vector<misplaced_key> misplaced;
};

/**
 * @brief Merge env declarations of a resolved order into existing documents
 *
 * Existing documents must parse as flat TOML tables; anything else fails
 * with malformed_env_toml and nothing is produced. Existing text is kept
 * byte for byte; a blank document that gains keys also gets the file
 * header after its existing bytes. Every declared key missing from its
 * target document is
 * appended, preceded by its description as a comment, with its default or
 * an empty string. Appended keys follow component order, then declaration
 * order; the first declaration of a name wins.
 *
 * @param order Output of dependency_graph::resolve
 * @param catalog The catalog the order was resolved against
 * @param existing_plain Current vars.toml text, if the file exists
 * @param existing_secret Current secrets.toml text, if the file exists
 */
result<env_artifacts>
merge_env_documents(const resolved_order &order,
                    const component_catalog &catalog,
                    const std::optional<std::string> &existing_plain,
                    const std::optional<std::string> &existing_secret);

} // namespace setupforge
