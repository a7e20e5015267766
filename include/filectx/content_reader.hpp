// SPDX-License-Identifier: MIT
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "filectx/path_filter.hpp"
#include "filectx/resource.hpp"

namespace xpto::filectx {

namespace fs = std::filesystem;

/// Replace every byte that doesn't start a well-formed UTF-8 sequence
/// with U+FFFD.
std::string repair_utf8(std::string_view bytes);

class content_reader {
 public:
  content_reader(const root_context& ctx, const path_filter& filter)
      : ctx_{&ctx}, filter_{&filter} {}

  /** @brief Describe and load the file at @p relative_path.
   *
   * Returns an empty optional when the path leaves the root, doesn't name
   * a regular file, or isn't admitted by the filter.  Never throws.
   * Oversized files and read failures still yield a descriptor whose
   * @c content is a bracketed placeholder.
   */
  [[nodiscard]] std::optional<resource_descriptor> read(
      const fs::path& relative_path) const;

 private:
  const root_context* ctx_;
  const path_filter* filter_;
};

}  // namespace xpto::filectx
