/**
 * @file log.cpp
 * @brief Cargo-style logging implementation
 *
 * Output format:
 *   {status:>12} {message}
 *
 * Examples:
 *      Resolving gh, just
 *      Generated .setup/install.sh
 *      Unchanged .setup/vars.toml
 *        warning: GH_TOKEN is declared secret but lives in vars.toml
 *          error: Circular dependency detected: a -> b -> a
 */


#include "setupforge/log.hpp"
#include "core/types.h"

#ifdef __cplusplus
namespace setupforge {

log_verbosity logger::s_verbosity = log_verbosity::VERBOSITY_NORMAL;

void logger::set_verbosity(log_verbosity level) { s_verbosity = level; }

void logger::print_status_line(const std::string &status,
                               const std::string &message,
                               fmt::color status_color, bool is_bold,
                               FILE *stream) {
  if (is_bold) {
    fmt::print(stream, fg(status_color) | fmt::emphasis::bold, "{:>{}}", status,
               STATUS_WIDTH);
  } else {
    fmt::print(stream, fg(status_color), "{:>{}}", status, STATUS_WIDTH);
  }
  fmt::print(stream, " {}\n", message);
}

void logger::print_action(const std::string &action,
                          const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line(action, message, fmt::color::green);
}

void logger::print_success(const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line("Finished", message, fmt::color::green);
}

void logger::print_warning(const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line("warning", message, fmt::color::yellow, true, stderr);
}

void logger::print_error(const std::string &message) {
  // Errors always show
  print_status_line("error", message, fmt::color::red, true, stderr);
}

void logger::print_help(const std::string &message) {
  print_status_line("help", message, fmt::color::cyan, true, stderr);
}

void logger::print_verbose(const std::string &message) {
  if (s_verbosity != log_verbosity::VERBOSITY_VERBOSE)
    return;
  print_status_line("", message, fmt::color::gray, false);
}

void logger::resolving(const std::string &target) {
  print_action("Resolving", target);
}

void logger::loaded(const std::string &target) {
  print_action("Loaded", target);
}

void logger::generated(const std::string &target) {
  print_action("Generated", target);
}

void logger::merged(const std::string &target) {
  print_action("Merged", target);
}

void logger::unchanged(const std::string &target) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  print_status_line("Unchanged", target, fmt::color::gray);
}

void logger::creating(const std::string &target) {
  print_action("Creating", target);
}

void logger::created(const std::string &target) {
  print_action("Created", target);
}

void logger::print_header(const std::string &message) {
  if (s_verbosity == log_verbosity::VERBOSITY_QUIET)
    return;
  fmt::print(fg(fmt::color::cyan) | fmt::emphasis::bold, "{}\n", message);
}

void logger::print_plain(const std::string &message) {
  fmt::print("{}\n", message);
}

} // namespace setupforge

// C wrapper implementations

extern "C" {

void setupforge_set_verbosity_impl(setupforge_log_verbosity_t level) {
  setupforge::log_verbosity cpp_level;
  switch (level) {
  case SETUPFORGE_VERBOSITY_QUIET:
    cpp_level = setupforge::log_verbosity::VERBOSITY_QUIET;
    break;
  case SETUPFORGE_VERBOSITY_VERBOSE:
    cpp_level = setupforge::log_verbosity::VERBOSITY_VERBOSE;
    break;
  default:
    cpp_level = setupforge::log_verbosity::VERBOSITY_NORMAL;
    break;
  }
  setupforge::logger::set_verbosity(cpp_level);
}

} // extern "C"
#endif // __cplusplus
