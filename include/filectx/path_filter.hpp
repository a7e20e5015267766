// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file path_filter.hpp
 * @brief Eligibility rules deciding which files are exposed as resources.
 *
 * Two independent predicates are provided: @c should_ignore matches a
 * path against fnmatch-style glob patterns, and @c is_text classifies a
 * path by its extension, either through an allow-list or a MIME table.
 * Neither one looks at file contents.
 */

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace re2 {
class RE2;
}

namespace xpto::filectx {

namespace fs = std::filesystem;

struct filter_rules {
  std::vector<std::string> ignore_patterns;
  std::set<std::string> text_extensions;  // lower-case, leading dot
  std::unordered_map<std::string, std::string> mime_types;  // ".ext" -> type
};

filter_rules default_filter_rules();

/** @brief Merge a @c mime.types file into @p rules.
 *
 * Each non-comment line reads @c "type ext1 ext2 ...".  Later entries
 * override earlier ones.  Returns the number of extensions registered, or
 * an empty optional if @p file could not be opened.
 */
std::optional<std::size_t> load_mime_types(
    const fs::path& file, filter_rules& rules);

/// Translate an fnmatch-style glob into an RE2 pattern for a full match.
std::string glob_to_regex(std::string_view glob);

class path_filter {
 public:
  explicit path_filter(filter_rules rules);
  path_filter(const path_filter&) = delete;
  path_filter(path_filter&&) noexcept;
  path_filter& operator=(const path_filter&) = delete;
  path_filter& operator=(path_filter&&) noexcept;
  ~path_filter();

  /// True if the full path or its base name matches an ignore pattern.
  [[nodiscard]] bool should_ignore(const fs::path& path) const;

  /// True if the extension is allow-listed or maps to a @c text/ type.
  [[nodiscard]] bool is_text(const fs::path& path) const;

  /** @brief The eligibility rule shared by listing and reading.
   *
   * @p relative_path is taken relative to @p root.  The file must be
   * neither ignored nor non-text, and no directory between @p root and the
   * file may be ignored.
   */
  [[nodiscard]] bool admits(
      const fs::path& root, const fs::path& relative_path) const;

  [[nodiscard]] std::optional<std::string> mime_type(
      const fs::path& path) const;

 private:
  bool matches_any(const std::string& text) const;

  filter_rules rules_;
  std::vector<std::unique_ptr<re2::RE2>> ignore_res_;
};

}  // namespace xpto::filectx
