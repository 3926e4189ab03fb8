/**
 * @file command_gen.cpp
 * @brief Implementation of the 'gen' command
 *
 * Everything is computed in memory first; files are only touched once the
 * whole resolution and merge succeeded.
 */

#include "core/artifact_state.hpp"
#include "core/catalog_loader.hpp"
#include "core/commands.hpp"
#include "core/constants.h"
#include "core/dependency_graph.hpp"
#include "core/env_merge.hpp"
#include "core/file_utils.hpp"
#include "core/install_script.hpp"
#include "core/tools_config.hpp"
#include "setupforge/log.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

using namespace setupforge;

namespace {

struct pending_artifact {
  const char *name;
  std::string content;
  std::optional<std::string> on_disk;
  bool executable;
  bool is_env;
};

std::string join_ids(const std::vector<std::string> &ids) {
  std::string out;
  for (const auto &id : ids) {
    if (!out.empty()) {
      out += ", ";
    }
    out += id;
  }
  return out;
}

} // namespace

/**
 * @brief Handle the 'gen' command
 *
 * @param ctx Context containing parsed arguments
 * @return setupforge_int_t Exit code (0 for success)
 */
setupforge_int_t setupforge_cmd_gen(const setupforge_context_t *ctx) {
  std::filesystem::path setup_dir =
      std::filesystem::path(ctx->working_dir) / SETUP_DIR;

  if (!std::filesystem::is_directory(setup_dir)) {
    setupforge_int_t code = report_setup_error(setup_error::invalid_config(
        fmt::format("{} not found in {}", SETUP_DIR, ctx->working_dir)));
    logger::print_help("run 'setupforge init' first");
    return code;
  }

  auto tools_text = read_text_file(setup_dir / TOOLS_FILE);
  if (!tools_text) {
    return report_setup_error(tools_text.error());
  }
  if (!tools_text.value()) {
    return report_setup_error(setup_error::invalid_config(
        fmt::format("{} not found in {}", TOOLS_FILE, setup_dir.string())));
  }
  auto tools = parse_tools_config(*tools_text.value());
  if (!tools) {
    return report_setup_error(tools.error());
  }

  std::filesystem::path catalog_dir = resolve_catalog_dir(ctx);
  auto catalog = load_catalog_dir(catalog_dir);
  if (!catalog) {
    return report_setup_error(catalog.error());
  }
  logger::loaded(fmt::format("{} component(s) from {}", catalog.value().size(),
                             catalog_dir.string()));

  auto graph = dependency_graph::build(catalog.value());
  if (!graph) {
    return report_setup_error(graph.error());
  }

  logger::resolving(join_ids(tools.value().tools));
  auto order = graph.value().resolve(tools.value().tools);
  if (!order) {
    return report_setup_error(order.error());
  }

  std::vector<std::string> order_ids;
  for (const auto &id : order.value()) {
    order_ids.push_back(id.str());
  }
  logger::print_verbose("Install order: " + join_ids(order_ids));

  std::string script =
      generate_install_script(order.value(), catalog.value());

  // Unreadable artifacts abort here, before anything is written
  std::optional<std::string> existing_script;
  std::optional<std::string> existing_vars;
  std::optional<std::string> existing_secrets;
  for (auto &&[name, slot] :
       {std::make_pair(INSTALL_SCRIPT_FILE, &existing_script),
        std::make_pair(VARS_FILE, &existing_vars),
        std::make_pair(SECRETS_FILE, &existing_secrets)}) {
    auto content = read_text_file(setup_dir / name);
    if (!content) {
      return report_setup_error(content.error());
    }
    *slot = std::move(content).value();
  }

  auto env = merge_env_documents(order.value(), catalog.value(), existing_vars,
                                 existing_secrets);
  if (!env) {
    return report_setup_error(env.error());
  }

  artifact_state state;
  if (artifact_state::exists(setup_dir) && !state.load(setup_dir)) {
    logger::print_warning(
        fmt::format("{} is unreadable; hand edits cannot be detected",
                    HASH_STATE_FILE));
  }

  if (existing_script && *existing_script != script &&
      state.is_modified(INSTALL_SCRIPT_FILE, *existing_script)) {
    if (!ctx->args.force) {
      logger::print_error(
          fmt::format("{}/{} was modified since it was last generated",
                      SETUP_DIR, INSTALL_SCRIPT_FILE));
      logger::print_help("move your changes into the component catalog, or "
                         "rerun with --force to overwrite them");
      return 1;
    }
    logger::print_warning(fmt::format("Overwriting hand edits in {}/{}",
                                      SETUP_DIR, INSTALL_SCRIPT_FILE));
  }

  for (const auto &key : env.value().misplaced) {
    logger::print_warning(fmt::format(
        "{} is declared {} but found in {}; leaving it in place", key.name,
        key.declared_secret ? "secret" : "non-secret",
        key.declared_secret ? VARS_FILE : SECRETS_FILE));
  }

  std::vector<pending_artifact> artifacts;
  artifacts.push_back({INSTALL_SCRIPT_FILE, std::move(script),
                       std::move(existing_script), true, false});
  artifacts.push_back({VARS_FILE, env.value().plain, std::move(existing_vars),
                       false, true});
  artifacts.push_back({SECRETS_FILE, env.value().secret,
                       std::move(existing_secrets), false, true});

  for (auto &artifact : artifacts) {
    std::string display = std::string(SETUP_DIR) + "/" + artifact.name;
    state.set_hash(artifact.name, artifact_state::content_hash(artifact.content));

    if (artifact.on_disk && *artifact.on_disk == artifact.content) {
      logger::unchanged(display);
      continue;
    }

    std::string error;
    if (!write_file_atomic(setup_dir / artifact.name, artifact.content,
                           artifact.executable, error)) {
      logger::print_error(error);
      return 1;
    }
    if (artifact.is_env && artifact.on_disk) {
      logger::merged(display);
    } else {
      logger::generated(display);
    }
  }

  std::string error;
  if (!state.save(setup_dir, error)) {
    logger::print_error(error);
    return 1;
  }

  logger::print_success(
      fmt::format("{} component(s) ready in {}", order.value().size(),
                  SETUP_DIR "/" INSTALL_SCRIPT_FILE));
  return 0;
}
