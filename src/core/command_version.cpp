/**
 * @file command_version.cpp
 * @brief Implementation of the 'version' command
 */

#include "core/commands.hpp"
#include "core/constants.h"
#include "setupforge/log.hpp"

#include <string>

using namespace setupforge;

/**
 * @brief Display setupforge version information
 *
 * @param ctx Context containing parsed arguments
 * @return setupforge_int_t Exit code (0 for success)
 */
setupforge_int_t setupforge_cmd_version(const setupforge_context_t *ctx) {
  logger::print_action("Version",
                       "setupforge version " + std::string(SETUPFORGE_VERSION));
  logger::print_action("Catalog", resolve_catalog_dir(ctx).string());
  return 0;
}
