// SPDX-License-Identifier: MIT
#include "filectx/jsonrpc.hpp"

#include <istream>
#include <string>

namespace xpto::filectx {

std::optional<std::string> read_jsonrpc_line(std::istream& in) {
  std::string line;
  if (!std::getline(in, line)) return std::nullopt;  // EOF
  if (!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

void write_jsonrpc_line(std::ostream& out, const json::object& msg) {
  out << json::serialize(msg) << '\n';
  out.flush();
}

}  // namespace xpto::filectx
