// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSONRPC envelopes and newline-delimited framing.
 *
 * Every message occupies exactly one line of compact JSON text in each
 * direction.  There are no headers, length prefixes or batches.  Responses
 * carry @c "jsonrpc": "2.0", the request id (or @c null) and exactly one
 * of @c result or @c error.
 */

#include <boost/json.hpp>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace xpto::filectx {

namespace json = boost::json;

// JSONRPC error codes
constexpr int METHOD_NOT_FOUND{-32601};
constexpr int INVALID_PARAMS{-32602};
constexpr int INTERNAL_ERROR{-32603};

inline json::object make_result(const json::value& id, json::object result) {
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["result"] = std::move(result);
  return msg;
}

inline json::object make_jsonrpc_error(
    const json::value& id, int code, std::string_view message) {
  json::object err{};
  err["code"] = code;
  err["message"] = message;
  json::object msg{};
  msg["jsonrpc"] = "2.0";
  msg["id"] = id;
  msg["error"] = std::move(err);
  return msg;
}

/** @brief Read one line from @p in.
 *
 * The trailing newline (and a preceding @c '\r') is removed.  Returns an
 * empty optional once @p in reaches EOF with nothing left to read.
 */
std::optional<std::string> read_jsonrpc_line(std::istream& in);

/// Serialise @p msg on one line to @p out and flush.
void write_jsonrpc_line(std::ostream& out, const json::object& msg);

}  // namespace xpto::filectx
