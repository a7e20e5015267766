// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "filectx/path_filter.hpp"
#include "filectx/resource.hpp"

namespace xpto::filectx {

namespace fs = std::filesystem;

/** @brief Lists the eligible files below the root.
 *
 * The walk is depth-first and visits the entries of each directory in
 * byte-wise name order, so the result is sorted by relative path and
 * stable across scans of an unchanged tree.  Ignored directories are not
 * descended into and directory symlinks are not followed.  Entries that
 * can't be examined are logged and skipped.
 */
class directory_scanner {
 public:
  directory_scanner(const root_context& ctx, const path_filter& filter)
      : ctx_{&ctx}, filter_{&filter} {}

  /// At most @c root_context::max_files descriptors.
  [[nodiscard]] std::vector<resource_descriptor> scan() const;

  /// At most @p max_files descriptors.  Truncation is silent.
  [[nodiscard]] std::vector<resource_descriptor> scan(
      std::size_t max_files) const;

 private:
  bool walk(
      const fs::path& dir, std::vector<resource_descriptor>& out,
      std::size_t max_files) const;

  const root_context* ctx_;
  const path_filter* filter_;
};

}  // namespace xpto::filectx
