/**
 * @file log.hpp
 * @brief Cargo-style logging utilities for setupforge
 *
 * Output format matches Rust's Cargo:
 *   - 12-character right-aligned status word (colored)
 *   - Message follows in default color
 *   - No emojis, no brackets
 */

#ifndef SETUPFORGE_LOG_HPP
#define SETUPFORGE_LOG_HPP

#include "core/types.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @enum setupforge_log_verbosity_t
 * @brief C-compatible enum for logging verbosity levels
 */
typedef enum {
  SETUPFORGE_VERBOSITY_QUIET,  /**< Minimal output, only errors */
  SETUPFORGE_VERBOSITY_NORMAL, /**< Standard output level */
  SETUPFORGE_VERBOSITY_VERBOSE /**< Detailed output for debugging */
} setupforge_log_verbosity_t;

// C wrapper functions
void setupforge_set_verbosity_impl(setupforge_log_verbosity_t level);

#ifdef __cplusplus
} // extern "C"

#include <fmt/color.h>
#include <fmt/core.h>
#include <string>

namespace setupforge {

/**
 * @enum log_verbosity
 * @brief C++ enum class for logging verbosity levels
 */
enum class log_verbosity {
  VERBOSITY_QUIET,  /**< Minimal output, only errors */
  VERBOSITY_NORMAL, /**< Standard output level */
  VERBOSITY_VERBOSE /**< Detailed output for debugging */
};

/**
 * @class logger
 * @brief Static class providing Cargo-style logging functionality
 *
 * All output follows Cargo's format:
 *   {status:>12} {message}
 *
 * Where status is a colored action word like "Resolving", "Generated", etc.
 */
class logger {
public:
  /**
   * @brief Sets the global verbosity level for logging
   * @param level The verbosity level to set
   */
  static void set_verbosity(log_verbosity level);

  /**
   * @brief Print a status message with custom action word
   *
   * Format: "{action:>12} {message}"
   * Color: Green for the action word
   */
  static void print_action(const std::string &action,
                           const std::string &message);

  /**
   * @brief Print a green "Finished" message
   */
  static void print_success(const std::string &message);

  /**
   * @brief Print a yellow warning message
   */
  static void print_warning(const std::string &message);

  /**
   * @brief Print a red error message (always shown, even when quiet)
   */
  static void print_error(const std::string &message);

  /**
   * @brief Print a cyan "help:" line following an error
   */
  static void print_help(const std::string &message);

  /**
   * @brief Print a gray verbose/debug message
   */
  static void print_verbose(const std::string &message);

  /// Print "Resolving {target}"
  static void resolving(const std::string &target);

  /// Print "Loaded {target}"
  static void loaded(const std::string &target);

  /// Print "Generated {target}"
  static void generated(const std::string &target);

  /// Print "Merged {target}"
  static void merged(const std::string &target);

  /// Print "Unchanged {target}"
  static void unchanged(const std::string &target);

  /// Print "Creating {target}"
  static void creating(const std::string &target);

  /// Print "Created {target}"
  static void created(const std::string &target);

  /**
   * @brief Print a header line (bold cyan, no status word)
   */
  static void print_header(const std::string &message);

  /**
   * @brief Print a plain message (no status prefix)
   */
  static void print_plain(const std::string &message);

private:
  static log_verbosity s_verbosity;

  // Status width for right-alignment (Cargo uses 12)
  static constexpr int STATUS_WIDTH = 12;

  static void print_status_line(const std::string &status,
                                const std::string &message,
                                fmt::color status_color, bool is_bold = true,
                                FILE *stream = stdout);
};

} // namespace setupforge
#endif

#endif // SETUPFORGE_LOG_HPP
