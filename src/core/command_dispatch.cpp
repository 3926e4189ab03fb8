#include "core/command.h"
#include "core/commands.hpp"
#include "setupforge/log.hpp"

#include <string.h>

#include <string>

using namespace setupforge;

/**
 * @brief Dispatch command based on command line arguments
 *
 * @param ctx Context containing parsed arguments
 * @return setupforge_int_t Exit code (0 for success)
 */
extern "C" setupforge_int_t
setupforge_dispatch_command(const setupforge_context_t *ctx) {
  if (!ctx->args.command) {
    return setupforge_cmd_help(ctx);
  }

  if (strcmp(ctx->args.command, "init") == 0) {
    return setupforge_cmd_init(ctx);
  } else if (strcmp(ctx->args.command, "list") == 0) {
    return setupforge_cmd_list(ctx);
  } else if (strcmp(ctx->args.command, "gen") == 0 ||
             strcmp(ctx->args.command, "generate") == 0) {
    return setupforge_cmd_gen(ctx);
  } else if (strcmp(ctx->args.command, "version") == 0 ||
             strcmp(ctx->args.command, "--version") == 0 ||
             strcmp(ctx->args.command, "-V") == 0) {
    return setupforge_cmd_version(ctx);
  } else if (strcmp(ctx->args.command, "help") == 0 ||
             strcmp(ctx->args.command, "--help") == 0 ||
             strcmp(ctx->args.command, "-h") == 0) {
    return setupforge_cmd_help(ctx);
  } else {
    logger::print_error("Unknown command: " + std::string(ctx->args.command));
    logger::print_help("run 'setupforge help' for usage information");
    return 1;
  }
}
