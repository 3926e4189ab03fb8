/**
 * @file command.cpp
 * @brief Implementation of command handling utilities
 */

#include <stdlib.h>
#include <string.h>

#include "core/command.h"
#include "core/commands.hpp"
#include "setupforge/log.hpp"

#include <string>

using namespace setupforge;

static bool is_option(setupforge_cstring_t arg, setupforge_cstring_t name) {
  return strcmp(arg, name) == 0;
}

// Matches "--name=value" and returns a pointer to value
static setupforge_cstring_t option_value(setupforge_cstring_t arg,
                                         setupforge_cstring_t name) {
  size_t len = strlen(name);
  if (strncmp(arg, name, len) == 0 && arg[len] == '=') {
    return arg + len + 1;
  }
  return NULL;
}

bool setupforge_parse_args(setupforge_int_t argc, setupforge_string_t argv[],
                           setupforge_command_args_t *args) {
  memset(args, 0, sizeof(setupforge_command_args_t));

  if (argc < 2) {
    return true;
  }

  for (setupforge_int_t i = 1; i < argc; i++) {
    setupforge_cstring_t arg = argv[i];

    if (is_option(arg, "-v") || is_option(arg, "--verbose")) {
      args->verbosity = "verbose";
      continue;
    }
    if (is_option(arg, "-q") || is_option(arg, "--quiet")) {
      args->verbosity = "quiet";
      continue;
    }

    if (args->command == NULL) {
      if (arg[0] == '-' && !is_option(arg, "-h") && !is_option(arg, "--help") &&
          !is_option(arg, "-V") && !is_option(arg, "--version")) {
        logger::print_error("Unknown option: " + std::string(arg));
        return false;
      }
      args->command = arg;
      continue;
    }

    setupforge_cstring_t value = NULL;
    if (is_option(arg, "--catalog") || is_option(arg, "--detail")) {
      if (i + 1 >= argc) {
        logger::print_error("Option " + std::string(arg) + " requires a value");
        return false;
      }
      value = argv[++i];
      if (is_option(arg, "--catalog")) {
        args->catalog = value;
      } else {
        args->detail = value;
      }
    } else if ((value = option_value(arg, "--catalog")) != NULL) {
      args->catalog = value;
    } else if ((value = option_value(arg, "--detail")) != NULL) {
      args->detail = value;
    } else if (is_option(arg, "--force") || is_option(arg, "-f")) {
      args->force = true;
    } else if (arg[0] == '-') {
      logger::print_error("Unknown option: " + std::string(arg));
      return false;
    } else if (args->path == NULL) {
      args->path = arg;
    }
  }

  return true;
}

bool setupforge_set_working_dir(setupforge_context_t *ctx,
                                setupforge_cstring_t dir) {
  size_t len = strlen(dir);
  if (len >= sizeof(ctx->working_dir)) {
    return false;
  }
  memcpy(ctx->working_dir, dir, len + 1);
  return true;
}

void setupforge_set_verbosity(setupforge_cstring_t level) {
  if (!level)
    return;

  if (strcmp(level, "quiet") == 0) {
    setupforge_set_verbosity_impl(SETUPFORGE_VERBOSITY_QUIET);
  } else if (strcmp(level, "verbose") == 0) {
    setupforge_set_verbosity_impl(SETUPFORGE_VERBOSITY_VERBOSE);
  } else {
    setupforge_set_verbosity_impl(SETUPFORGE_VERBOSITY_NORMAL);
  }
}

namespace setupforge {

std::filesystem::path resolve_catalog_dir(const setupforge_context_t *ctx) {
  if (ctx->args.catalog && ctx->args.catalog[0] != '\0') {
    return std::filesystem::path(ctx->args.catalog);
  }
  const char *from_env = getenv(SETUPFORGE_CATALOG_ENV);
  if (from_env && from_env[0] != '\0') {
    return std::filesystem::path(from_env);
  }
  return std::filesystem::path(SETUPFORGE_DEFAULT_CATALOG_DIR);
}

setupforge_int_t report_setup_error(const setup_error &error) {
  logger::print_error(error.message());

  switch (error.kind) {
  case setup_error_kind::component_not_found:
    logger::print_help("run 'setupforge list' to see the catalog");
    break;
  case setup_error_kind::circular_dependency:
    logger::print_help("remove one of the dependencies along the cycle from "
                       "its component's " META_FILE);
    break;
  case setup_error_kind::invalid_component_metadata:
    logger::print_help("fix " + error.component + "/" META_FILE
                       " in the component catalog");
    break;
  case setup_error_kind::malformed_env_toml:
    logger::print_help("fix the file by hand; existing entries are never "
                       "rewritten");
    break;
  case setup_error_kind::invalid_component_id:
    logger::print_help("check the names listed in " SETUP_DIR "/" TOOLS_FILE);
    break;
  case setup_error_kind::invalid_config:
    break;
  }
  return 1;
}

} // namespace setupforge
