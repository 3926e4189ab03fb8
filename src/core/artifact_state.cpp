/**
 * @file artifact_state.cpp
 * @brief Implementation of generated-artifact hashing
 */

#include "core/artifact_state.hpp"
#include "core/constants.h"
#include "core/file_utils.hpp"
#include "core/toml_reader.hpp"

#include <iomanip>
#include <sstream>

namespace setupforge {

bool artifact_state::load(const std::filesystem::path &setup_dir) {
  hashes.clear();
  auto content = read_text_file(setup_dir / HASH_STATE_FILE);
  if (!content || !content.value()) {
    return false;
  }
  return parse(*content.value());
}

bool artifact_state::parse(const std::string &content) {
  hashes.clear();

  toml_reader reader;
  std::string error;
  if (!reader.parse(content, HASH_STATE_FILE, error)) {
    return false;
  }
  if (!reader.has_key("artifacts")) {
    return true;
  }
  if (!reader.is_table("artifacts")) {
    return false;
  }

  auto artifacts = reader.get_table("artifacts");
  for (const auto &name : artifacts->get_table_keys()) {
    // "install.sh" is a literal key, not a dotted path
    auto hash = artifacts->get_entry_string(name);
    if (!hash) {
      hashes.clear();
      return false;
    }
    hashes[name] = *hash;
  }
  return true;
}

std::string artifact_state::serialize() const {
  toml::table artifacts;
  for (const auto &[name, hash] : hashes) {
    artifacts.insert_or_assign(name, hash);
  }
  toml::table root;
  root.insert_or_assign("artifacts", std::move(artifacts));

  std::ostringstream ss;
  ss << "# setupforge.hash - hashes of generated artifacts\n";
  ss << "# Used to detect hand edits to files in .setup/. Do not edit.\n\n";
  ss << root << "\n";
  return ss.str();
}

bool artifact_state::save(const std::filesystem::path &setup_dir,
                          std::string &error) const {
  return write_file_atomic(setup_dir / HASH_STATE_FILE, serialize(), false,
                           error);
}

std::string artifact_state::get_hash(const std::string &name) const {
  auto it = hashes.find(name);
  return it != hashes.end() ? it->second : "";
}

void artifact_state::set_hash(const std::string &name, const std::string &hash) {
  hashes[name] = hash;
}

bool artifact_state::is_modified(const std::string &name,
                                 const std::string &on_disk_content) const {
  std::string recorded = get_hash(name);
  return !recorded.empty() && recorded != content_hash(on_disk_content);
}

bool artifact_state::exists(const std::filesystem::path &setup_dir) {
  return std::filesystem::exists(setup_dir / HASH_STATE_FILE);
}

uint64_t artifact_state::fnv1a_hash(const void *data, setupforge_size_t size) {
  uint64_t hash = FNV_OFFSET_BASIS;
  const uint8_t *bytes = static_cast<const uint8_t *>(data);

  for (setupforge_size_t i = 0; i < size; ++i) {
    hash ^= bytes[i];
    hash *= FNV_PRIME;
  }

  return hash;
}

std::string artifact_state::hash_to_string(uint64_t hash) {
  std::stringstream ss;
  ss << std::hex << std::setw(16) << std::setfill('0') << hash;
  return ss.str();
}

} // namespace setupforge
