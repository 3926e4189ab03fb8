/**
 * @file command.h
 * @brief Command line argument parsing for setupforge
 */

#ifndef SETUPFORGE_COMMAND_H
#define SETUPFORGE_COMMAND_H

#include <stdbool.h>

#include "core/constants.h"
#include "core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Command line argument structure
 * @details Strings point into argv; nothing is owned.
 */
typedef struct {
  setupforge_cstring_t command;   // Primary command (init, list, gen, ...)
  setupforge_cstring_t path;      // First positional argument, if any
  setupforge_cstring_t catalog;   // --catalog DIR
  setupforge_cstring_t detail;    // --detail ID (list)
  setupforge_cstring_t verbosity; // quiet, normal or verbose
  bool force;                     // --force (gen)
} setupforge_command_args_t;

/**
 * @brief Context structure for command execution
 */
typedef struct {
  setupforge_command_args_t args;
  setupforge_char_t working_dir[4096];
} setupforge_context_t;

/**
 * @brief Parse command line arguments
 * @details Global flags (-v, -q) may appear before or after the command.
 * @return false if an option is missing its value or is unknown
 */
bool setupforge_parse_args(setupforge_int_t argc, setupforge_string_t argv[],
                           setupforge_command_args_t *args);

/**
 * @brief Store the directory commands operate on
 * @return false if dir does not fit in working_dir; ctx is left unchanged
 */
bool setupforge_set_working_dir(setupforge_context_t *ctx,
                                setupforge_cstring_t dir);

/**
 * @brief Set the verbosity level for logging ("quiet", "normal", "verbose")
 */
void setupforge_set_verbosity(setupforge_cstring_t level);

#ifdef __cplusplus
}
#endif

#endif
