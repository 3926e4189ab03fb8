/**
 * @file file_utils.hpp
 * @brief Small file helpers used by the loaders and the gen command
 */

#pragma once

#include "core/setup_error.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace setupforge {

/**
 * @brief Read a whole file in binary mode
 *
 * A missing file is not an error. A path that exists but cannot be read
 * (a directory, no permission, an I/O failure) is reported as
 * invalid_config so callers never mistake it for an absent file.
 *
 * @return The contents, std::nullopt if nothing exists at path, or
 * invalid_config
 */
result<std::optional<std::string>>
read_text_file(const std::filesystem::path &path);

/**
 * @brief Replace a file's contents atomically
 *
 * Writes to "<path>.tmp" in the same directory and renames it over the
 * target, so readers see either the old or the new file.
 *
 * @param path Destination file
 * @param content Bytes to write
 * @param executable Add owner/group/others execute permission
 * @param error Receives a description of the failure
 * @return true on success
 */
bool write_file_atomic(const std::filesystem::path &path,
                       const std::string &content, bool executable,
                       std::string &error);

} // namespace setupforge
