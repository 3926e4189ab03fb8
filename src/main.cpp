/**
 * @file main.cpp
 * @brief Main entry point for setupforge
 */

#include "core/command.h"
#include "core/commands.hpp"
#include "setupforge/log.hpp"

#include <string.h>

#include <exception>
#include <filesystem>
#include <string>

using namespace setupforge;

/**
 * @brief Main function
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return int Exit code
 */
int main(int argc, char *argv[]) {
  setupforge_context_t ctx;
  memset(&ctx, 0, sizeof(ctx));

  if (!setupforge_parse_args(argc, argv, &ctx.args)) {
    logger::print_help("run 'setupforge help' for usage information");
    return 1;
  }
  setupforge_set_verbosity(ctx.args.verbosity);

  std::error_code ec;
  std::filesystem::path cwd = std::filesystem::current_path(ec);
  if (ec) {
    logger::print_error("Cannot determine the working directory: " +
                        ec.message());
    return 1;
  }
  if (!setupforge_set_working_dir(&ctx, cwd.string().c_str())) {
    logger::print_error("Working directory path is too long: " + cwd.string());
    return 1;
  }

  setupforge_int_t exit_code = 1;
  try {
    exit_code = setupforge_dispatch_command(&ctx);
  } catch (const std::exception &e) {
    logger::print_error(std::string("Unexpected failure: ") + e.what());
    exit_code = 1;
  }

  return exit_code;
}
