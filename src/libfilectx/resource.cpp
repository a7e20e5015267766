// SPDX-License-Identifier: MIT
#include "filectx/resource.hpp"

#include <fmt/chrono.h>

#include <chrono>
#include <ctime>
#include <system_error>

#include "describe.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace xpto::filectx {

namespace fs = std::filesystem;

root_context make_root_context(
    const fs::path& root, std::uintmax_t max_file_size,
    std::size_t max_files) {
  std::error_code ec{};
  auto canonical = fs::canonical(root, ec);
  if (ec) utils::throwf("Can't resolve root '{}': {}", root.string(), ec.message());
  if (!fs::is_directory(canonical, ec))
    utils::throwf("Root '{}' is not a directory", canonical.string());

  return root_context{
    .root_path = std::move(canonical),
    .max_file_size = max_file_size,
    .max_files = max_files,
  };
}

std::string format_modified_time(fs::file_time_type time) {
  auto sys = std::chrono::file_clock::to_sys(time);
  std::tm tm = fmt::localtime(std::chrono::system_clock::to_time_t(
      std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys)));
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}", tm);
}

std::optional<resource_descriptor> describe(
    const root_context& ctx, const path_filter& filter,
    const fs::path& absolute_path) {
  std::error_code ec{};
  auto size = fs::file_size(absolute_path, ec);
  if (ec) {
    LOG_ERROR("Error getting file info for {}: {}", absolute_path, ec.message());
    return std::nullopt;
  }
  auto mtime = fs::last_write_time(absolute_path, ec);
  if (ec) {
    LOG_ERROR("Error getting file info for {}: {}", absolute_path, ec.message());
    return std::nullopt;
  }

  LOG_TRACE(
      "{}: {} bytes, modified {}", absolute_path, size,
      format_modified_time(mtime));

  return resource_descriptor{
    .relative_path = absolute_path.lexically_relative(ctx.root_path),
    .absolute_path = absolute_path,
    .size_bytes = size,
    .modified_time = mtime,
    .extension = absolute_path.extension().string(),
    .is_text = filter.is_text(absolute_path),
  };
}

}  // namespace xpto::filectx
