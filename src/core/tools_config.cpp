/**
 * @file tools_config.cpp
 * @brief tools.toml parsing
 */

#include "core/tools_config.hpp"
#include "core/component_id.hpp"
#include "core/constants.h"
#include "core/toml_reader.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace setupforge {

result<tools_config> parse_tools_config(const std::string &content) {
  toml_reader reader;
  std::string parse_error;
  if (!reader.parse(content, TOOLS_FILE, parse_error)) {
    return setup_error::invalid_config(
        fmt::format("{}: {}", TOOLS_FILE, parse_error));
  }

  if (!reader.has_key("tools")) {
    return setup_error::invalid_config(
        fmt::format("{}: missing 'tools' list", TOOLS_FILE));
  }
  if (!reader.is_string_array("tools")) {
    return setup_error::invalid_config(
        fmt::format("{}: 'tools' must be an array of strings", TOOLS_FILE));
  }

  tools_config config;
  for (const auto &name : reader.get_string_array("tools")) {
    if (!component_id::is_valid(name)) {
      return setup_error::invalid_component_id(name);
    }
    if (std::find(config.tools.begin(), config.tools.end(), name) ==
        config.tools.end()) {
      config.tools.push_back(name);
    }
  }

  if (config.tools.empty()) {
    return setup_error::invalid_config(
        fmt::format("{}: no tools selected", TOOLS_FILE));
  }
  return config;
}

std::string default_tools_config() {
  return "# Components to set up in this repository.\n"
         "# Run `setupforge list` to see what the catalog offers, then\n"
         "# `setupforge gen` to regenerate .setup/install.sh.\n"
         "tools = [\n"
         "  \"git\",\n"
         "]\n";
}

} // namespace setupforge
