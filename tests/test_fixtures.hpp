/**
 * @file test_fixtures.hpp
 * @brief Builders for in-memory components and catalogs used by the tests
 */

#pragma once

#include "core/dependency_graph.hpp"
#include "core/setup_component.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace setupforge_test {

inline setupforge::setup_component
make_component(const std::string &id, std::set<std::string> deps = {},
               std::vector<std::string> steps = {}) {
    setupforge::setup_component component;
    component.id = id;
    component.display_name = id;
    component.dependencies = std::move(deps);
    component.install_steps = std::move(steps);
    return component;
}

inline setupforge::env_spec
make_env(const std::string &name, bool secret, const std::string &description,
         std::optional<std::string> default_value = std::nullopt) {
    setupforge::env_spec spec;
    spec.name = name;
    spec.secret = secret;
    spec.description = description;
    spec.default_value = std::move(default_value);
    return spec;
}

inline setupforge::component_catalog
make_catalog(std::vector<setupforge::setup_component> components) {
    return setupforge::component_catalog::from_components(std::move(components))
        .value();
}

/// Resolves `selected` against `catalog`; the catalog must be valid
inline setupforge::resolved_order
resolve_ok(const setupforge::component_catalog &catalog,
           const std::vector<std::string> &selected) {
    return setupforge::dependency_graph::build(catalog).value()
        .resolve(selected).value();
}

inline std::vector<std::string>
to_strings(const setupforge::resolved_order &order) {
    std::vector<std::string> out;
    for (const auto &id : order) {
        out.push_back(id.str());
    }
    return out;
}

inline std::filesystem::path create_temp_dir() {
    std::random_device rd;
    std::filesystem::path temp = std::filesystem::temp_directory_path() /
        ("setupforge_test_" + std::to_string(rd()));
    std::filesystem::create_directories(temp);
    return temp;
}

inline void cleanup_temp_dir(const std::filesystem::path &dir) {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

inline void write_file(const std::filesystem::path &path,
                       const std::string &content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << content;
}

} // namespace setupforge_test
