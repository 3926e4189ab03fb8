/**
 * @file commands.hpp
 * @brief Declarations for setupforge command handlers
 */

#pragma once

#include "core/command.h"
#include "core/setup_error.hpp"
#include "core/types.h"

#include <filesystem>

/**
 * @brief Dispatch a command based on command line arguments
 *
 * @param ctx Context containing parsed arguments
 * @return setupforge_int_t Exit code (0 for success)
 */
extern "C" setupforge_int_t
setupforge_dispatch_command(const setupforge_context_t *ctx);

/**
 * @brief Handle the 'init' command to create .setup/ in a repository
 */
setupforge_int_t setupforge_cmd_init(const setupforge_context_t *ctx);

/**
 * @brief Handle the 'list' command to show catalog components
 */
setupforge_int_t setupforge_cmd_list(const setupforge_context_t *ctx);

/**
 * @brief Handle the 'gen' command to regenerate .setup/ artifacts
 */
setupforge_int_t setupforge_cmd_gen(const setupforge_context_t *ctx);

/**
 * @brief Handle the 'version' command to display version info
 */
setupforge_int_t setupforge_cmd_version(const setupforge_context_t *ctx);

/**
 * @brief Handle the 'help' command to display help
 */
setupforge_int_t setupforge_cmd_help(const setupforge_context_t *ctx);

namespace setupforge {

/**
 * @brief Catalog directory: --catalog, then $SETUPFORGE_CATALOG, then the
 * compiled-in default
 */
std::filesystem::path resolve_catalog_dir(const setupforge_context_t *ctx);

/**
 * @brief Print a setup_error with a follow-up help line where one helps
 * @return Exit code 1
 */
setupforge_int_t report_setup_error(const setup_error &error);

} // namespace setupforge
