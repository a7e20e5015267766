// SPDX-License-Identifier: MIT
#include "filectx/scanner.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

#include "describe.hpp"
#include "filectx/content_reader.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace xpto::filectx {

namespace fs = std::filesystem;

std::vector<resource_descriptor> directory_scanner::scan() const {
  return scan(ctx_->max_files);
}

std::vector<resource_descriptor> directory_scanner::scan(
    std::size_t max_files) const {
  std::vector<resource_descriptor> files{};
  if (max_files == 0) return files;

  if (!walk(ctx_->root_path, files, max_files))
    LOG_DEBUG("Scan stopped at the {} file cap", max_files);
  LOG_DEBUG("Scanned {}: {} files", ctx_->root_path, files.size());
  return files;
}

// Returns false once `max_files` descriptors were collected.
bool directory_scanner::walk(
    const fs::path& dir, std::vector<resource_descriptor>& out,
    std::size_t max_files) const {
  std::error_code ec{};
  std::vector<fs::directory_entry> entries{};
  for (fs::directory_iterator it{dir, ec}, end{}; !ec && it != end;
       it.increment(ec)) {
    entries.push_back(*it);
  }
  if (ec) LOG_ERROR("Error scanning directory {}: {}", dir, ec.message());

  std::ranges::sort(entries, [](const auto& a, const auto& b) {
    return a.path().filename().native() < b.path().filename().native();
  });

  for (const auto& entry : entries) {
    const auto& path = entry.path();

    std::error_code sec{};
    auto link_status = entry.symlink_status(sec);
    if (sec) {
      LOG_ERROR("Can't stat {}: {}", path, sec.message());
      continue;
    }

    if (fs::is_directory(link_status)) {
      if (filter_->should_ignore(path)) {
        LOG_TRACE("Pruned {}", path);
        continue;
      }
      if (!walk(path, out, max_files)) return false;
      continue;
    }

    // Follows file symlinks; dangling ones and directory links drop out
    if (!entry.is_regular_file(sec)) continue;
    if (filter_->should_ignore(path) || !filter_->is_text(path)) continue;

    // Names end up in JSON strings
    auto relative = path.lexically_relative(ctx_->root_path).string();
    if (repair_utf8(relative) != relative) {
      LOG_WARN("Skipped {}, its name is not valid UTF-8", path);
      continue;
    }

    if (fs::is_symlink(link_status)) {
      auto target = fs::canonical(path, sec);
      if (sec || !utils::is_within(ctx_->root_path, target)) {
        LOG_DEBUG("Skipped {}, it resolves outside the root", path);
        continue;
      }
    }

    auto desc = describe(*ctx_, *filter_, path);
    if (!desc) continue;
    out.push_back(std::move(*desc));
    if (out.size() >= max_files) return false;
  }
  return true;
}

}  // namespace xpto::filectx
