/**
 * @file toml_reader.cpp
 * @brief Implementation of TOML document access
 */

#include "core/toml_reader.hpp"

#include <string_view>

#include <fmt/format.h>

namespace setupforge {

toml_reader::toml_reader() = default;

toml_reader::toml_reader(const toml::table &table)
    : toml_data(std::make_unique<toml::table>(table)) {}

toml_reader::toml_reader(const toml_reader &other)
    : toml_data(other.toml_data
                    ? std::make_unique<toml::table>(*other.toml_data)
                    : nullptr) {}

toml_reader &toml_reader::operator=(const toml_reader &other) {
  if (this != &other) {
    toml_data = other.toml_data
                    ? std::make_unique<toml::table>(*other.toml_data)
                    : nullptr;
  }
  return *this;
}

toml_reader::~toml_reader() = default;

bool toml_reader::parse(const std::string &content,
                        const std::string &source_name, std::string &error) {
  try {
    toml_data = std::make_unique<toml::table>(
        toml::parse(content, std::string_view{source_name}));
    return true;
  } catch (const toml::parse_error &err) {
    toml_data.reset();
    error = fmt::format("{} (line {}, column {})", err.description(),
                        err.source().begin.line, err.source().begin.column);
    return false;
  }
}

toml::node_view<const toml::node>
toml_reader::node_at(const std::string &key) const {
  if (!toml_data) {
    return {};
  }
  const toml::table &table = *toml_data;
  return table.at_path(key);
}

std::string toml_reader::get_string(const std::string &key,
                                    const std::string &default_value) const {
  auto value = node_at(key);
  if (!value || !value.is_string()) {
    return default_value;
  }
  return value.as_string()->get();
}

std::optional<std::string>
toml_reader::get_optional_string(const std::string &key) const {
  auto value = node_at(key);
  if (!value || !value.is_string()) {
    return std::nullopt;
  }
  return value.as_string()->get();
}

std::optional<std::string>
toml_reader::get_entry_string(const std::string &key) const {
  if (!toml_data) {
    return std::nullopt;
  }
  const toml::node *node = toml_data->get(key);
  if (!node || !node->is_string()) {
    return std::nullopt;
  }
  return node->as_string()->get();
}

std::vector<std::string>
toml_reader::get_string_array(const std::string &key) const {
  std::vector<std::string> result;
  auto value = node_at(key);
  if (!value || !value.is_array()) {
    return result;
  }

  for (const auto &element : *value.as_array()) {
    if (element.is_string()) {
      result.push_back(element.as_string()->get());
    }
  }
  return result;
}

bool toml_reader::has_key(const std::string &key) const {
  return static_cast<bool>(node_at(key));
}

bool toml_reader::is_string(const std::string &key) const {
  return node_at(key).is_string();
}

bool toml_reader::is_string_array(const std::string &key) const {
  auto value = node_at(key);
  if (!value || !value.is_array()) {
    return false;
  }
  return value.as_array()->is_homogeneous(toml::node_type::string) ||
         value.as_array()->empty();
}

bool toml_reader::is_table(const std::string &key) const {
  return node_at(key).is_table();
}

std::vector<std::string>
toml_reader::get_table_keys(const std::string &table_name) const {
  std::vector<std::string> result;
  if (!toml_data) {
    return result;
  }

  const toml::table *table = toml_data.get();
  if (!table_name.empty()) {
    auto node = node_at(table_name);
    if (!node || !node.is_table()) {
      return result;
    }
    table = node.as_table();
  }

  // toml::table iterates in key order
  for (auto &&[key, _] : *table) {
    result.push_back(std::string(key.str()));
  }
  return result;
}

std::optional<toml_reader> toml_reader::get_table(const std::string &key) const {
  auto node = node_at(key);
  if (!node || !node.is_table()) {
    return std::nullopt;
  }
  return toml_reader(*node.as_table());
}

} // namespace setupforge
