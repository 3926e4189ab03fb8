/**
 * @file catalog_loader.hpp
 * @brief Loading the component catalog from meta.toml / install.sh pairs
 *
 * Catalog layout:
 *
 *   catalog/
 *     gh/
 *       meta.toml
 *       install.sh
 *     just/
 *       meta.toml
 *       install.sh
 *
 * meta.toml:
 *
 *   name = "gh"                  # optional, defaults to the directory name
 *   display_name = "GitHub CLI"  # optional, defaults to name
 *   summary = "..."
 *   dependencies = ["git"]
 *   install = ["..."]            # optional steps run before install.sh
 *
 *   [vars.GH_HOST]
 *   description = "..."
 *   default = "github.com"
 *
 *   [secrets.GH_TOKEN]
 *   description = "..."
 */

#pragma once

#include "core/setup_component.hpp"
#include "core/setup_error.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace setupforge {

/**
 * @brief Build one component from its metadata and optional script
 * @param dir_name Directory name, used when meta.toml has no name
 * @param meta_toml Contents of meta.toml
 * @param install_script Contents of install.sh, if present
 * @return The component, or invalid_component_metadata
 */
result<setup_component>
load_component(const std::string &dir_name, const std::string &meta_toml,
               const std::optional<std::string> &install_script);

/**
 * @brief Load every component directory below a catalog root
 *
 * Subdirectories without a meta.toml are skipped. Directories are read in
 * sorted order so error reporting is deterministic.
 *
 * @return The catalog, invalid_component_metadata for a bad component, or
 * invalid_config when the root is not a readable directory
 */
result<component_catalog> load_catalog_dir(const std::filesystem::path &root);

} // namespace setupforge
