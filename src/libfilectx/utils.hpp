#pragma once

#include <fmt/format.h>
#include <cxxabi.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xpto::filectx::utils {
template <typename Exception=std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

// Demangle C++ symbols using __cxa_demangle
inline std::string demangle_symbol(std::string_view mangled) {
  int status = 0;
  std::string result{mangled};
  char* demangled =
      abi::__cxa_demangle(result.c_str(), nullptr, nullptr, &status);
  if (status == 0 && demangled) {
    result = demangled;
    std::free(demangled);  // NOLINT
  }
  return result;
}

// Component-wise: is `path` `root` itself or somewhere below it?  Both
// must already be normalized.
inline bool is_within(
    const std::filesystem::path& root, const std::filesystem::path& path) {
  return std::mismatch(root.begin(), root.end(), path.begin(), path.end())
             .first == root.end();
}

inline std::string to_lower(std::string_view s) {
  std::string res{s};
  std::ranges::transform(res, res.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return res;
}

}  // namespace xpto::filectx::utils
