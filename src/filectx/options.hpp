#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>

#include "filectx/resource.hpp"

namespace fs = std::filesystem;

namespace xpto::filectx {

inline const fs::path default_mime_types_file{"/etc/mime.types"};

struct server_options {
  std::optional<fs::path> root{};
  std::uintmax_t max_file_size{default_max_file_size};
  std::size_t max_files{default_max_files};
  std::optional<fs::path> mime_types_file{};
  std::optional<fs::path> log_file{};
};

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, server_options& opts);
}  // namespace xpto::filectx
