#pragma once

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/std.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace xpto::logger {

enum class level : uint8_t { fatal, error, warning, info, debug, trace };

inline std::string_view level_to_string(level level) {
  // clang-format off
  switch (level) {
  case level::trace:   return "TRACE";
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  case level::fatal:   return "FATAL";
  default: return "UNKNOWN";
  }
  // clang-format on
}

inline level global_level = level::info;  // NOLINT
inline void set_level(level level) { global_level = level; }

using file_ptr = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;
inline file_ptr global_file{nullptr, &std::fclose};  // NOLINT

// Also append to `path`.  stdout is never written to: it carries the
// protocol.
inline bool set_file(const std::filesystem::path& path) {
  file_ptr file{std::fopen(path.c_str(), "a"), &std::fclose};
  if (!file) return false;
  global_file = std::move(file);
  return true;
}

inline std::string get_current_timestamp() {
  using namespace std::chrono;

  auto now = system_clock::now();
  auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
  std::tm tm = fmt::localtime(system_clock::to_time_t(now));

  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}", tm, ms.count());
}

// Core logging function
template <typename... Args>
inline void log(
    level level, const std::source_location& location,
    fmt::format_string<Args...> format_str, Args&&... args) {
  if (level > global_level) return;

  auto line = fmt::format(
      "{} {}:{} {}: {}\n", get_current_timestamp(),
      std::filesystem::path{location.file_name()}.filename().string(),
      location.line(), level_to_string(level),
      fmt::format(format_str, std::forward<Args>(args)...));

  std::fputs(line.c_str(), stderr);
  if (global_file) {
    std::fputs(line.c_str(), global_file.get());
    std::fflush(global_file.get());
  }
}

}  // namespace xpto::logger

// NOLINTBEGIN
#define LOG_TRACE(...)                                                \
  xpto::logger::log(                                                  \
      xpto::logger::level::trace, std::source_location::current(),    \
      __VA_ARGS__)

#define LOG_DEBUG(...)                                                \
  xpto::logger::log(                                                  \
      xpto::logger::level::debug, std::source_location::current(),    \
      __VA_ARGS__)

#define LOG_INFO(...)                                                \
  xpto::logger::log(                                                 \
      xpto::logger::level::info, std::source_location::current(),    \
      __VA_ARGS__)

#define LOG_WARN(...)                                                   \
  xpto::logger::log(                                                    \
      xpto::logger::level::warning, std::source_location::current(),    \
      __VA_ARGS__)

#define LOG_ERROR(...)                                                \
  xpto::logger::log(                                                  \
      xpto::logger::level::error, std::source_location::current(),    \
      __VA_ARGS__)

#define LOG_FATAL(...)                                                \
  xpto::logger::log(                                                  \
      xpto::logger::level::fatal, std::source_location::current(),    \
      __VA_ARGS__)
// NOLINTEND
