#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "filectx/path_filter.hpp"
#include "filectx/resource.hpp"

namespace xpto::filectx {

// Stat `absolute_path` (a file below ctx.root_path) into a descriptor.
// Failures are logged and give an empty optional.
std::optional<resource_descriptor> describe(
    const root_context& ctx, const path_filter& filter,
    const std::filesystem::path& absolute_path);

// Contents of `path` as valid UTF-8, or a bracketed placeholder when
// `size` exceeds `max_file_size` or reading fails.  Never throws.
std::string load_text(
    const std::filesystem::path& path, std::uintmax_t size,
    std::uintmax_t max_file_size);

// Local time, "YYYY-MM-DDTHH:MM:SS"
std::string format_modified_time(std::filesystem::file_time_type time);

}  // namespace xpto::filectx
