// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace xpto::filectx {

namespace fs = std::filesystem;

inline constexpr std::uintmax_t default_max_file_size{1024 * 1024};
inline constexpr std::size_t default_max_files{1000};

/** @brief Process-wide, read-only server configuration.
 *
 * Built once by @c make_root_context and passed by reference to every
 * component.  @c root_path is absolute and canonical.
 */
struct root_context {
  fs::path root_path;
  std::uintmax_t max_file_size{default_max_file_size};
  std::size_t max_files{default_max_files};
};

/** @brief Build a @c root_context for @p root.
 *
 * Throws @c std::runtime_error if @p root does not name an existing
 * directory.
 */
root_context make_root_context(
    const fs::path& root, std::uintmax_t max_file_size = default_max_file_size,
    std::size_t max_files = default_max_files);

/// Metadata of one exposed file.  @c content is only set by the reader.
struct resource_descriptor {
  fs::path relative_path;
  fs::path absolute_path;
  std::uintmax_t size_bytes{};
  fs::file_time_type modified_time{};
  std::string extension;
  bool is_text{};
  std::optional<std::string> content{};
};

}  // namespace xpto::filectx
