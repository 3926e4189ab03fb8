/**
 * @file command_list.cpp
 * @brief Implementation of the 'list' command
 */

#include "core/catalog_loader.hpp"
#include "core/commands.hpp"
#include "core/dependency_graph.hpp"
#include "setupforge/log.hpp"

#include <algorithm>
#include <set>
#include <string>

#include <fmt/format.h>

using namespace setupforge;

namespace {

std::string join(const std::set<std::string> &items) {
  std::string out;
  for (const auto &item : items) {
    if (!out.empty()) {
      out += ", ";
    }
    out += item;
  }
  return out;
}

void print_detail(const setup_component &component) {
  logger::print_header(fmt::format("{} ({})", component.display_name,
                                   component.id));
  if (!component.description.empty()) {
    logger::print_plain(component.description);
  }
  logger::print_plain("");
  logger::print_plain(
      "Dependencies: " +
      (component.dependencies.empty() ? std::string("(none)")
                                      : join(component.dependencies)));

  if (!component.env_specs.empty()) {
    logger::print_plain("");
    logger::print_plain("Environment:");
    for (const auto &spec : component.env_specs) {
      std::string line =
          fmt::format("  {:<24} {}", spec.name, spec.secret ? "secret" : "var");
      if (spec.default_value) {
        line += fmt::format(" (default: \"{}\")", *spec.default_value);
      }
      logger::print_plain(line);
      if (!spec.description.empty()) {
        logger::print_plain("      " + spec.description);
      }
    }
  }

  logger::print_plain("");
  logger::print_plain(
      fmt::format("Install steps: {}", component.install_steps.size()));
  for (std::size_t i = 0; i < component.install_steps.size(); ++i) {
    logger::print_plain(fmt::format("  [{}]", i + 1));
    logger::print_plain(component.install_steps[i]);
  }
}

} // namespace

/**
 * @brief Handle the 'list' command
 *
 * @param ctx Context containing parsed arguments
 * @return setupforge_int_t Exit code (0 for success)
 */
setupforge_int_t setupforge_cmd_list(const setupforge_context_t *ctx) {
  std::filesystem::path catalog_dir = resolve_catalog_dir(ctx);
  logger::print_verbose("Using catalog " + catalog_dir.string());

  auto catalog = load_catalog_dir(catalog_dir);
  if (!catalog) {
    return report_setup_error(catalog.error());
  }
  // Surfaces dangling dependencies and env conflicts in the catalog itself
  auto graph = dependency_graph::build(catalog.value());
  if (!graph) {
    return report_setup_error(graph.error());
  }

  if (ctx->args.detail) {
    const setup_component *component = catalog.value().find(ctx->args.detail);
    if (!component) {
      return report_setup_error(setup_error::component_not_found(
          ctx->args.detail, catalog.value().ids()));
    }
    print_detail(*component);
    return 0;
  }

  if (catalog.value().empty()) {
    logger::print_warning("No components found in " + catalog_dir.string());
    return 0;
  }

  std::size_t id_width = 0;
  for (const auto &[id, component] : catalog.value().components()) {
    id_width = std::max(id_width, id.size());
  }
  for (const auto &[id, component] : catalog.value().components()) {
    std::string line = fmt::format("{:<{}}  {}", id, id_width,
                                   component.display_name);
    if (!component.description.empty()) {
      line += " - " + component.description;
    }
    logger::print_plain(line);
  }
  logger::print_verbose(
      fmt::format("{} component(s) in catalog", catalog.value().size()));
  return 0;
}
