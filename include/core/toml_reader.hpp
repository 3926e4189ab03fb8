/**
 * @file toml_reader.hpp
 * @brief TOML document access using tomlplusplus
 */

#ifndef SETUPFORGE_TOML_READER_H
#define SETUPFORGE_TOML_READER_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <toml++/toml.hpp>

namespace setupforge {

/**
 * @brief Read-only view over a parsed TOML table
 *
 * Keys may be dotted paths ("vars.GH_HOST"). Getters are lenient: a
 * missing key or a value of the wrong type yields the default. Use the
 * is_* checks when a wrong type must be reported instead.
 */
class toml_reader {
public:
  toml_reader();

  /**
   * @brief Wrap a copy of an existing table
   */
  explicit toml_reader(const toml::table &table);

  toml_reader(const toml_reader &other);
  toml_reader &operator=(const toml_reader &other);
  toml_reader(toml_reader &&) noexcept = default;
  toml_reader &operator=(toml_reader &&) noexcept = default;
  ~toml_reader();

  /**
   * @brief Parse TOML text
   * @param content The document text
   * @param source_name Name used in error messages (usually the file path)
   * @param error Receives "description (line N, column M)" on failure
   * @return True if the document parsed
   */
  bool parse(const std::string &content, const std::string &source_name,
             std::string &error);

  /**
   * @brief Get a string value
   * @param key The key to look up (can be dotted for tables)
   * @param default_value Returned if the key is missing or not a string
   */
  std::string get_string(const std::string &key,
                         const std::string &default_value = "") const;

  /**
   * @brief Get a string value, distinguishing absence from ""
   */
  std::optional<std::string> get_optional_string(const std::string &key) const;

  /**
   * @brief Get a string stored directly in the root table under a literal
   * key, which may itself contain dots
   */
  std::optional<std::string> get_entry_string(const std::string &key) const;

  /**
   * @brief Get a string array; non-string elements are skipped
   */
  std::vector<std::string> get_string_array(const std::string &key) const;

  /**
   * @brief Check if a key exists
   */
  bool has_key(const std::string &key) const;

  /// True if the key holds a string
  bool is_string(const std::string &key) const;

  /// True if the key holds an array whose elements are all strings
  bool is_string_array(const std::string &key) const;

  /// True if the key holds a table
  bool is_table(const std::string &key) const;

  /**
   * @brief Get all keys in a table, in ascending order
   * @param table The table name (empty for root table)
   */
  std::vector<std::string> get_table_keys(const std::string &table = "") const;

  /**
   * @brief Get a sub-table as a new toml_reader
   * @param key The table key to look up (can be dotted)
   */
  std::optional<toml_reader> get_table(const std::string &key) const;

private:
  std::unique_ptr<toml::table> toml_data;

  toml::node_view<const toml::node> node_at(const std::string &key) const;
};

} // namespace setupforge

#endif // SETUPFORGE_TOML_READER_H
