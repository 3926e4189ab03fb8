/**
 * @file command_help.cpp
 * @brief Implementation of the 'help' command to provide usage information
 */

#include "core/commands.hpp"
#include "core/constants.h"
#include "setupforge/log.hpp"

#include <string>

using namespace setupforge;

/**
 * @brief Handle the 'help' command
 *
 * @param ctx Context containing parsed arguments
 * @return setupforge_int_t Exit code (0 for success, 1 for an unknown topic)
 */
setupforge_int_t setupforge_cmd_help(const setupforge_context_t *ctx) {
  std::string specific_command;
  if (ctx->args.path) {
    specific_command = ctx->args.path;
  }

  if (specific_command.empty()) {
    logger::print_plain("setupforge - per-repository developer tool setup");
    logger::print_plain("");
    logger::print_plain("Available commands:");
    logger::print_plain("  init      Create .setup/ in a repository");
    logger::print_plain("  list      List the components in the catalog");
    logger::print_plain("  gen       Regenerate install.sh, vars.toml and "
                        "secrets.toml");
    logger::print_plain("  version   Show version information");
    logger::print_plain("  help      Show help for a specific command");
    logger::print_plain("");
    logger::print_plain("Usage: setupforge [-v|--verbose] [-q|--quiet] "
                        "<command> [options]");
    logger::print_plain("");
    logger::print_plain("For more information on a specific command, run "
                        "'setupforge help <command>'");
  } else if (specific_command == "init") {
    logger::print_plain("setupforge init - Create .setup/ in a repository");
    logger::print_plain("");
    logger::print_plain("Usage: setupforge init [path]");
    logger::print_plain("");
    logger::print_plain("Arguments:");
    logger::print_plain("  path      Repository root (default: current "
                        "directory)");
    logger::print_plain("");
    logger::print_plain("Creates " SETUP_DIR "/" TOOLS_FILE
                        " listing the components to install and a "
                        GITIGNORE_FILE " that keeps " SECRETS_FILE
                        " out of version control.");
  } else if (specific_command == "list") {
    logger::print_plain("setupforge list - List catalog components");
    logger::print_plain("");
    logger::print_plain("Usage: setupforge list [--catalog DIR] [--detail ID]");
    logger::print_plain("");
    logger::print_plain("Options:");
    logger::print_plain("  --catalog DIR   Component catalog directory");
    logger::print_plain("  --detail ID     Show dependencies, environment and "
                        "install steps of one component");
  } else if (specific_command == "gen" || specific_command == "generate") {
    logger::print_plain("setupforge gen - Regenerate setup artifacts");
    logger::print_plain("");
    logger::print_plain("Usage: setupforge gen [--catalog DIR] [--force]");
    logger::print_plain("");
    logger::print_plain("Options:");
    logger::print_plain("  --catalog DIR   Component catalog directory");
    logger::print_plain("  -f, --force     Overwrite an " INSTALL_SCRIPT_FILE
                        " that was edited by hand");
    logger::print_plain("");
    logger::print_plain("Reads " SETUP_DIR "/" TOOLS_FILE
                        ", resolves dependencies and writes:");
    logger::print_plain("  " INSTALL_SCRIPT_FILE
                        "     Install steps in dependency order");
    logger::print_plain("  " VARS_FILE
                        "      Non-secret variables (existing values kept)");
    logger::print_plain("  " SECRETS_FILE
                        "   Secret variables (existing values kept)");
    logger::print_plain("");
    logger::print_plain("Nothing is written if any step fails.");
  } else if (specific_command == "catalog") {
    logger::print_plain("Catalog lookup order:");
    logger::print_plain("  1. --catalog DIR");
    logger::print_plain("  2. $" SETUPFORGE_CATALOG_ENV);
    logger::print_plain("  3. " SETUPFORGE_DEFAULT_CATALOG_DIR);
    logger::print_plain("");
    logger::print_plain("Each component is a directory holding " META_FILE
                        " and an optional " COMPONENT_SCRIPT_FILE ".");
  } else if (specific_command == "version" || specific_command == "help") {
    logger::print_plain("setupforge " + specific_command);
  } else {
    logger::print_error("Unknown help topic: " + specific_command);
    logger::print_help("run 'setupforge help' for the list of commands");
    return 1;
  }

  return 0;
}
