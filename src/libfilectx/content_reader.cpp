// SPDX-License-Identifier: MIT
#include "filectx/content_reader.hpp"

#include <fmt/format.h>

#include <array>
#include <cerrno>
#include <fstream>
#include <system_error>

#include "describe.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace xpto::filectx {

namespace fs = std::filesystem;

namespace {

// Length of the well-formed UTF-8 sequence starting at s[i], or 0.
std::size_t utf8_sequence_length(std::string_view s, std::size_t i) {
  auto byte = [&](std::size_t k) -> unsigned {
    return static_cast<unsigned char>(s[i + k]);
  };
  auto cont = [&](std::size_t k, unsigned lo = 0x80, unsigned hi = 0xBF) {
    return i + k < s.size() && byte(k) >= lo && byte(k) <= hi;
  };

  const unsigned b0 = byte(0);
  if (b0 < 0x80) return 1;
  if (b0 >= 0xC2 && b0 <= 0xDF) return cont(1) ? 2 : 0;
  if (b0 >= 0xE0 && b0 <= 0xEF) {
    // No overlong forms, no surrogates
    bool ok = b0 == 0xE0   ? cont(1, 0xA0)
              : b0 == 0xED ? cont(1, 0x80, 0x9F)
                           : cont(1);
    return ok && cont(2) ? 3 : 0;
  }
  if (b0 >= 0xF0 && b0 <= 0xF4) {
    // Nothing above U+10FFFF
    bool ok = b0 == 0xF0   ? cont(1, 0x90)
              : b0 == 0xF4 ? cont(1, 0x80, 0x8F)
                           : cont(1);
    return ok && cont(2) && cont(3) ? 4 : 0;
  }
  return 0;
}

constexpr std::string_view replacement_character{"\xEF\xBF\xBD"};

}  // namespace

std::string repair_utf8(std::string_view bytes) {
  std::string res;
  res.reserve(bytes.size());
  for (std::size_t i{0}; i < bytes.size();) {
    if (auto len = utf8_sequence_length(bytes, i); len > 0) {
      res.append(bytes.substr(i, len));
      i += len;
    } else {
      res.append(replacement_character);
      ++i;
    }
  }
  return res;
}

std::optional<resource_descriptor> content_reader::read(
    const fs::path& relative_path) const {
  if (relative_path.empty() || relative_path.is_absolute()) return std::nullopt;

  auto normal = relative_path.lexically_normal();
  if (*normal.begin() == "..") return std::nullopt;

  auto absolute_path = ctx_->root_path / normal;

  std::error_code ec{};
  if (!fs::is_regular_file(absolute_path, ec)) {
    LOG_DEBUG("Not a regular file: {}", absolute_path);
    return std::nullopt;
  }

  auto target = fs::canonical(absolute_path, ec);
  if (ec || !utils::is_within(ctx_->root_path, target)) {
    LOG_WARN("Refusing {}, it resolves outside the root", absolute_path);
    return std::nullopt;
  }

  if (!filter_->admits(ctx_->root_path, normal)) {
    LOG_DEBUG("Filtered out: {}", normal);
    return std::nullopt;
  }

  auto desc = describe(*ctx_, *filter_, absolute_path);
  if (!desc) return std::nullopt;
  desc->content =
      load_text(absolute_path, desc->size_bytes, ctx_->max_file_size);
  return desc;
}

std::string load_text(
    const fs::path& path, std::uintmax_t size, std::uintmax_t max_file_size) {
  if (size > max_file_size)
    return fmt::format("[File too large: {} bytes]", size);

  try {
    std::ifstream in{path, std::ios::binary};
    if (!in) {
      auto reason = std::error_code{errno, std::generic_category()}.message();
      LOG_ERROR("Error reading file {}: {}", path, reason);
      return fmt::format("[Error reading file: {}]", reason);
    }

    std::string bytes{};
    bytes.reserve(size);
    std::array<char, 64 * 1024> buf{};
    while (in.read(buf.data(), static_cast<std::streamsize>(buf.size())) ||
           in.gcount() > 0) {
      bytes.append(buf.data(), static_cast<std::size_t>(in.gcount()));
    }
    if (in.bad() || !in.eof()) {
      LOG_ERROR("Error reading file {}: stream failure", path);
      return "[Error reading file: stream failure]";
    }
    return repair_utf8(bytes);
  } catch (const std::exception& e) {
    LOG_ERROR("Error reading file {}: {}", path, e.what());
    return fmt::format("[Error reading file: {}]", e.what());
  }
}

}  // namespace xpto::filectx
