/**
 * @file catalog_loader.cpp
 * @brief Catalog directory loading
 */

#include "core/catalog_loader.hpp"
#include "core/component_id.hpp"
#include "core/constants.h"
#include "core/file_utils.hpp"
#include "core/toml_reader.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

#include <fmt/format.h>

namespace setupforge {

namespace {

// Reads [vars.*] or [secrets.*] in ascending key order.
std::optional<setup_error> read_env_section(const toml_reader &meta,
                                            const std::string &component,
                                            const std::string &section,
                                            bool secret,
                                            std::vector<env_spec> &out) {
  if (!meta.has_key(section)) {
    return std::nullopt;
  }
  if (!meta.is_table(section)) {
    return setup_error::invalid_component_metadata(
        component, fmt::format("[{}] must be a table", section));
  }

  for (const auto &name : meta.get_table_keys(section)) {
    std::string path = section + "." + name;
    if (!meta.is_table(path)) {
      return setup_error::invalid_component_metadata(
          component, fmt::format("'{}' must be a table", path));
    }
    if (meta.has_key(path + ".default") && !meta.is_string(path + ".default")) {
      return setup_error::invalid_component_metadata(
          component, fmt::format("'{}.default' must be a string", path));
    }

    env_spec spec;
    spec.name = name;
    spec.secret = secret;
    spec.description = meta.get_string(path + ".description");
    spec.default_value = meta.get_optional_string(path + ".default");
    out.push_back(std::move(spec));
  }
  return std::nullopt;
}

} // namespace

result<setup_component>
load_component(const std::string &dir_name, const std::string &meta_toml,
               const std::optional<std::string> &install_script) {
  toml_reader meta;
  std::string parse_error;
  if (!meta.parse(meta_toml, dir_name + "/" META_FILE, parse_error)) {
    return setup_error::invalid_component_metadata(dir_name, parse_error);
  }

  for (const char *key : {"dependencies", "install"}) {
    if (meta.has_key(key) && !meta.is_string_array(key)) {
      return setup_error::invalid_component_metadata(
          dir_name, fmt::format("'{}' must be an array of strings", key));
    }
  }

  setup_component component;
  component.id = meta.get_string("name", dir_name);
  if (!component_id::is_valid(component.id)) {
    return setup_error::invalid_component_metadata(
        dir_name, fmt::format("invalid setup component name '{}'", component.id));
  }
  component.display_name = meta.get_string("display_name", component.id);
  component.description = meta.get_string("summary");

  for (const auto &dep : meta.get_string_array("dependencies")) {
    if (!component_id::is_valid(dep)) {
      return setup_error::invalid_component_metadata(
          dir_name, fmt::format("invalid dependency name '{}'", dep));
    }
    component.dependencies.insert(dep);
  }

  component.install_steps = meta.get_string_array("install");
  if (install_script) {
    component.install_steps.push_back(*install_script);
  }

  for (const auto &name : meta.get_table_keys("vars")) {
    if (meta.has_key("secrets." + name)) {
      return setup_error::invalid_component_metadata(
          dir_name,
          fmt::format("Environment key '{}' is declared in both [vars] and "
                      "[secrets]",
                      name));
    }
  }
  if (auto err = read_env_section(meta, component.id, "vars", false,
                                  component.env_specs)) {
    return *err;
  }
  if (auto err = read_env_section(meta, component.id, "secrets", true,
                                  component.env_specs)) {
    return *err;
  }

  return component;
}

result<component_catalog> load_catalog_dir(const std::filesystem::path &root) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return setup_error::invalid_config(
        fmt::format("Component catalog directory not found: {}", root.string()));
  }

  std::vector<std::filesystem::path> dirs;
  for (const auto &entry : std::filesystem::directory_iterator(root, ec)) {
    if (entry.is_directory() &&
        std::filesystem::exists(entry.path() / META_FILE)) {
      dirs.push_back(entry.path());
    }
  }
  if (ec) {
    return setup_error::invalid_config(fmt::format(
        "Cannot read component catalog {}: {}", root.string(), ec.message()));
  }
  std::sort(dirs.begin(), dirs.end());

  std::vector<setup_component> components;
  for (const auto &dir : dirs) {
    std::string dir_name = dir.filename().string();

    auto meta = read_text_file(dir / META_FILE);
    if (!meta || !meta.value()) {
      return setup_error::invalid_component_metadata(
          dir_name, fmt::format("cannot read {}", META_FILE));
    }
    auto script = read_text_file(dir / COMPONENT_SCRIPT_FILE);
    if (!script) {
      return setup_error::invalid_component_metadata(
          dir_name, fmt::format("cannot read {}", COMPONENT_SCRIPT_FILE));
    }

    auto component = load_component(dir_name, *meta.value(), script.value());
    if (!component) {
      return component.error();
    }
    components.push_back(std::move(component).value());
  }

  return component_catalog::from_components(std::move(components));
}

} // namespace setupforge
