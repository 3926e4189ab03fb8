/**
 * @file env_merge.cpp
 * @brief vars.toml / secrets.toml merge
 */

#include "core/env_merge.hpp"
#include "core/constants.h"

#include <set>
#include <sstream>
#include <string_view>

#include <fmt/format.h>
#include <toml++/toml.hpp>

namespace setupforge {

namespace {

const char *const PLAIN_HEADER =
    "# Non-secret environment configuration for setupforge\n"
    "# Edit values as needed before running install.sh\n";

const char *const SECRET_HEADER =
    "# Secret environment configuration for setupforge\n"
    "# Keep this file out of version control\n";

struct pending_entry {
  const env_spec *spec;
  std::string component;
};

bool is_blank(const std::string &text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

/// Keys of an existing document, which must be a flat table
result<std::set<std::string>>
existing_keys(const std::optional<std::string> &text, const char *label) {
  std::set<std::string> keys;
  if (!text || is_blank(*text)) {
    return keys;
  }

  toml::table table;
  try {
    table = toml::parse(*text, std::string_view{label});
  } catch (const toml::parse_error &err) {
    return setup_error::malformed_env_toml(
        fmt::format("{}: {} (line {}, column {})", label, err.description(),
                    err.source().begin.line, err.source().begin.column));
  }

  for (auto &&[key, value] : table) {
    if (value.is_table() || value.is_array_of_tables()) {
      return setup_error::malformed_env_toml(fmt::format(
          "{}: '{}' is a table; expected flat KEY = value entries", label,
          key.str()));
    }
    keys.insert(std::string(key.str()));
  }
  return keys;
}

std::string toml_string(const std::string &value) {
  toml::value<std::string> node(value);
  std::ostringstream ss;
  ss << toml::toml_formatter{node, toml::format_flags::allow_unicode_strings};
  return ss.str();
}

void append_comment(std::string &out, const pending_entry &entry) {
  const std::string &description = entry.spec->description;
  if (is_blank(description)) {
    out += fmt::format("# {} ({})\n", entry.spec->name, entry.component);
    return;
  }
  std::istringstream lines(description);
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    out += line.empty() ? "#\n" : "# " + line + "\n";
  }
}

std::string render_document(const std::optional<std::string> &existing,
                            const char *header,
                            const std::vector<pending_entry> &additions) {
  std::string base = existing ? *existing : std::string();
  if (additions.empty()) {
    return base;
  }

  std::string out = base;
  if (!out.empty() && out.back() != '\n') {
    out += '\n';
  }
  if (is_blank(base)) {
    out += header;
  }

  for (const auto &entry : additions) {
    out += '\n';
    append_comment(out, entry);
    out += entry.spec->name;
    out += " = ";
    out += toml_string(entry.spec->default_value.value_or(""));
    out += '\n';
  }
  return out;
}

} // namespace

result<env_artifacts>
merge_env_documents(const resolved_order &order,
                    const component_catalog &catalog,
                    const std::optional<std::string> &existing_plain,
                    const std::optional<std::string> &existing_secret) {
  auto plain_keys = existing_keys(existing_plain, VARS_FILE);
  if (!plain_keys) {
    return plain_keys.error();
  }
  auto secret_keys = existing_keys(existing_secret, SECRETS_FILE);
  if (!secret_keys) {
    return secret_keys.error();
  }

  env_artifacts artifacts;
  std::vector<pending_entry> plain_additions;
  std::vector<pending_entry> secret_additions;
  std::set<std::string> declared;

  for (const auto &id : order) {
    const setup_component *component = catalog.find(id.str());
    if (!component) {
      continue;
    }
    for (const auto &spec : component->env_specs) {
      if (!declared.insert(spec.name).second) {
        continue; // first declaration wins
      }

      const auto &target = spec.secret ? secret_keys.value() : plain_keys.value();
      const auto &other = spec.secret ? plain_keys.value() : secret_keys.value();
      if (target.count(spec.name)) {
        continue;
      }
      if (other.count(spec.name)) {
        artifacts.misplaced.push_back(misplaced_key{spec.name, spec.secret});
      }
      auto &additions = spec.secret ? secret_additions : plain_additions;
      additions.push_back(pending_entry{&spec, component->id});
    }
  }

  artifacts.plain = render_document(existing_plain, PLAIN_HEADER, plain_additions);
  artifacts.secret =
      render_document(existing_secret, SECRET_HEADER, secret_additions);
  return artifacts;
}

} // namespace setupforge
