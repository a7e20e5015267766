// SPDX-License-Identifier: MIT
#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <optional>
#include <string_view>

#include "filectx/content_reader.hpp"
#include "filectx/path_filter.hpp"
#include "filectx/resource.hpp"
#include "filectx/scanner.hpp"

namespace xpto::filectx {

namespace fs = std::filesystem;
namespace json = boost::json;

inline constexpr std::string_view protocol_version{"2024-11-05"};
inline constexpr std::string_view server_name{"local-files-mcp-server"};
inline constexpr std::string_view server_version{"1.0.0"};

/** @brief Maps one JSONRPC request to one response envelope.
 *
 * Holds no state between requests.  Protocol errors come back as error
 * envelopes; anything a handler throws is turned into an internal error
 * carrying the request id.
 */
class dispatcher {
 public:
  dispatcher(const root_context& ctx, const path_filter& filter)
      : ctx_{&ctx}, scanner_{ctx, filter}, reader_{ctx, filter} {}

  json::object dispatch(const json::value& request) const;

  /// Handlers

  json::object handle_initialize(const json::value& id) const;
  json::object handle_list(const json::value& id) const;
  json::object handle_read(
      const json::value& id, const json::value* params) const;

  /// Path of a @c file:// URI relative to the root, if it lies below it.
  [[nodiscard]] std::optional<fs::path> resolve_uri(
      std::string_view uri) const;

 private:
  const root_context* ctx_;
  directory_scanner scanner_;
  content_reader reader_;
};

}  // namespace xpto::filectx
