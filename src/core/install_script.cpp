/**
 * @file install_script.cpp
 * @brief install.sh rendering
 */

#include "core/install_script.hpp"

#include <sstream>

namespace setupforge {

static const char *const SCRIPT_PREAMBLE =
    "#!/usr/bin/env bash\n"
    "# Generated by setupforge from the component catalog.\n"
    "# Do not edit by hand; rerun `setupforge gen` instead.\n"
    "set -euo pipefail\n";

static const char *const BANNER_RULE =
    "# ============================================================"
    "==================\n";

std::string generate_install_script(const resolved_order &order,
                                    const component_catalog &catalog) {
  std::ostringstream out;
  out << SCRIPT_PREAMBLE;

  for (const auto &id : order) {
    out << "\n" << BANNER_RULE;
    out << "# component: " << id.str() << "\n";
    out << BANNER_RULE;

    const setup_component *component = catalog.find(id.str());
    if (!component) {
      out << "# (component not present in catalog)\n";
      continue;
    }
    if (component->install_steps.empty()) {
      out << "# (no install steps)\n";
      continue;
    }

    out << "echo \"==> Installing " << id.str() << "\"\n";
    out << "(\n";
    for (const auto &step : component->install_steps) {
      out << step;
      if (step.empty() || step.back() != '\n') {
        out << "\n";
      }
    }
    out << ")\n";
  }

  return out.str();
}

} // namespace setupforge
