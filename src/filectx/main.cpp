// SPDX-License-Identifier: MIT
#include <fmt/std.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <system_error>
#include <utility>

#include "../libfilectx/logger.hpp"
#include "filectx/dispatcher.hpp"
#include "filectx/path_filter.hpp"
#include "filectx/resource.hpp"
#include "filectx/stdio.hpp"
#include "options.hpp"

namespace fs = std::filesystem;
namespace fc = xpto::filectx;

namespace {

fc::filter_rules load_filter_rules(const fc::server_options& opts) {
  auto rules = fc::default_filter_rules();

  std::error_code ec{};
  if (opts.mime_types_file) {
    fc::load_mime_types(*opts.mime_types_file, rules);
  } else if (fs::exists(fc::default_mime_types_file, ec)) {
    fc::load_mime_types(fc::default_mime_types_file, rules);
  }
  return rules;
}

}  // namespace

int main(int argc, char* argv[]) {
  fc::server_options opts{};
  int loglevel{3};

  auto done = fc::parse_options(std::span(argv, argc), loglevel, opts);
  if (done) return done.value();

  xpto::logger::set_level(static_cast<xpto::logger::level>(loglevel));
  if (opts.log_file && !xpto::logger::set_file(*opts.log_file))
    LOG_WARN("Can't open log file {}", *opts.log_file);
  LOG_DEBUG("loglevel={}", loglevel);

  try {
    auto ctx = fc::make_root_context(
        opts.root.value_or(fs::current_path()), opts.max_file_size,
        opts.max_files);
    fc::path_filter filter{load_filter_rules(opts)};
    fc::dispatcher disp{ctx, filter};

    LOG_INFO("Starting MCP server for directory: {}", ctx.root_path);
    LOG_DEBUG(
        "max_file_size={} max_files={}", ctx.max_file_size, ctx.max_files);

    fc::install_stop_handlers();
    auto responses = fc::serve(disp, std::cin, std::cout);
    if (fc::stop_signal() != 0) {
      LOG_INFO("Server stopped by user after {} responses", responses);
    } else {
      LOG_INFO("Input closed after {} responses", responses);
    }
    return 0;
  } catch (const std::exception& e) {
    LOG_FATAL("{}", e.what());
    return 1;
  }
}
