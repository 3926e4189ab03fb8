/**
 * @file command_init.cpp
 * @brief Implementation of the 'init' command
 */

#include "core/commands.hpp"
#include "core/constants.h"
#include "core/file_utils.hpp"
#include "core/tools_config.hpp"
#include "setupforge/log.hpp"

#include <filesystem>
#include <string>
#include <system_error>

using namespace setupforge;

namespace {

const char *const GITIGNORE_CONTENT = "# Managed by setupforge\n" SECRETS_FILE
                                      "\n*.tmp\n";

} // namespace

/**
 * @brief Handle the 'init' command
 *
 * Creates <path>/.setup/ with a tools.toml template and a .gitignore. An
 * existing .setup/ is left untouched.
 *
 * @param ctx Context containing parsed arguments
 * @return setupforge_int_t Exit code (0 for success)
 */
setupforge_int_t setupforge_cmd_init(const setupforge_context_t *ctx) {
  std::filesystem::path root(ctx->working_dir);
  if (ctx->args.path) {
    root = std::filesystem::path(ctx->args.path);
    if (root.is_relative()) {
      root = std::filesystem::path(ctx->working_dir) / root;
    }
  }
  std::filesystem::path setup_dir = root / SETUP_DIR;

  std::error_code ec;
  if (std::filesystem::exists(setup_dir, ec)) {
    logger::print_error(setup_dir.string() + " already exists");
    logger::print_help("edit " SETUP_DIR "/" TOOLS_FILE
                       " and run 'setupforge gen' instead");
    return 1;
  }

  logger::creating(setup_dir.string());
  std::filesystem::create_directories(setup_dir, ec);
  if (ec) {
    logger::print_error("Failed to create " + setup_dir.string() + ": " +
                        ec.message());
    return 1;
  }

  std::string error;
  if (!write_file_atomic(setup_dir / TOOLS_FILE, default_tools_config(), false,
                         error) ||
      !write_file_atomic(setup_dir / GITIGNORE_FILE, GITIGNORE_CONTENT, false,
                         error)) {
    logger::print_error(error);
    return 1;
  }
  logger::print_verbose("Wrote " + (setup_dir / TOOLS_FILE).string());
  logger::print_verbose("Wrote " + (setup_dir / GITIGNORE_FILE).string());

  logger::created(SETUP_DIR "/" TOOLS_FILE);
  logger::print_help("add components to " SETUP_DIR "/" TOOLS_FILE
                     " and run 'setupforge gen'");
  return 0;
}
