#pragma once

#include "types.h"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace setupforge {

/**
 * @brief Hashes of the artifacts written by the last `setupforge gen`
 *
 * Stored in .setup/setupforge.hash (TOML). Comparing an artifact on disk
 * against its recorded hash tells whether it was edited by hand since it
 * was generated.
 */
class artifact_state {
public:
  artifact_state() = default;
  ~artifact_state() = default;

  /**
   * @brief Load recorded hashes from the setup directory
   * @param setup_dir The .setup directory
   * @return true if the file exists and parsed, false otherwise (the state is
   * left empty)
   */
  bool load(const std::filesystem::path &setup_dir);

  /**
   * @brief Parse the hash file text
   * @return true if the text is valid TOML with an [artifacts] table of strings
   */
  bool parse(const std::string &content);

  /**
   * @brief Render the hash file
   */
  std::string serialize() const;

  /**
   * @brief Write the hash file atomically
   * @param setup_dir The .setup directory
   * @param error Receives the failure description
   */
  bool save(const std::filesystem::path &setup_dir, std::string &error) const;

  /**
   * @brief Get the recorded hash for an artifact
   * @return Hash string if found, empty string if not found
   */
  std::string get_hash(const std::string &name) const;

  void set_hash(const std::string &name, const std::string &hash);

  /**
   * @brief True if the artifact has a recorded hash that differs from the
   * hash of its current on-disk content
   */
  bool is_modified(const std::string &name,
                   const std::string &on_disk_content) const;

  /**
   * @brief Hex FNV-1a hash of a file's content
   */
  static std::string content_hash(const std::string &content) {
    return hash_to_string(fnv1a_hash(content.data(), content.size()));
  }

  static bool exists(const std::filesystem::path &setup_dir);

  const std::map<std::string, std::string> &entries() const { return hashes; }

  void clear() { hashes.clear(); }

private:
  std::map<std::string, std::string> hashes;

  // FNV-1a hash constants
  static constexpr uint64_t FNV_PRIME = 1099511628211ULL;
  static constexpr uint64_t FNV_OFFSET_BASIS = 14695981039346656037ULL;

  static uint64_t fnv1a_hash(const void *data, setupforge_size_t size);

  static std::string hash_to_string(uint64_t hash);
};

} // namespace setupforge
