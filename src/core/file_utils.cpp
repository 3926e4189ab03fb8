/**
 * @file file_utils.cpp
 * @brief Implementation of file helpers
 */

#include "core/file_utils.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

#include <fmt/format.h>

namespace setupforge {

result<std::optional<std::string>>
read_text_file(const std::filesystem::path &path) {
  std::error_code ec;
  auto status = std::filesystem::status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return std::optional<std::string>();
  }
  if (ec) {
    return setup_error::invalid_config(
        fmt::format("cannot read {}: {}", path.string(), ec.message()));
  }
  if (std::filesystem::is_directory(status)) {
    return setup_error::invalid_config(
        fmt::format("cannot read {}: is a directory", path.string()));
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return setup_error::invalid_config(
        fmt::format("cannot read {}: open failed", path.string()));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return setup_error::invalid_config(
        fmt::format("cannot read {}: read failed", path.string()));
  }
  return std::optional<std::string>(buffer.str());
}

bool write_file_atomic(const std::filesystem::path &path,
                       const std::string &content, bool executable,
                       std::string &error) {
  std::filesystem::path temp = path;
  temp += ".tmp";

  {
    std::ofstream file(temp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      error = "cannot open " + temp.string() + " for writing";
      return false;
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
      error = "failed writing " + temp.string();
      std::error_code ignored;
      std::filesystem::remove(temp, ignored);
      return false;
    }
  }

  std::error_code ec;
  if (executable) {
    std::filesystem::permissions(temp,
                                 std::filesystem::perms::owner_exec |
                                     std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_exec,
                                 std::filesystem::perm_options::add, ec);
    if (ec) {
      error = "cannot make " + temp.string() + " executable: " + ec.message();
      std::error_code ignored;
      std::filesystem::remove(temp, ignored);
      return false;
    }
  }

  std::filesystem::rename(temp, path, ec);
  if (ec) {
    error = "cannot replace " + path.string() + ": " + ec.message();
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    return false;
  }
  return true;
}

} // namespace setupforge
