// SPDX-License-Identifier: MIT
#include "filectx/dispatcher.hpp"

#include <fmt/format.h>

#include <exception>
#include <string>
#include <typeinfo>

#include "filectx/jsonrpc.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace xpto::filectx {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view file_scheme{"file://"};
constexpr std::string_view text_plain{"text/plain"};

}  // namespace

json::object dispatcher::handle_initialize(const json::value& id) const {
  json::object resources{};
  resources["subscribe"] = false;
  resources["listChanged"] = false;

  json::object capabilities{};
  capabilities["resources"] = std::move(resources);
  capabilities["tools"] = json::object{};
  capabilities["prompts"] = json::object{};

  json::object server_info{};
  server_info["name"] = server_name;
  server_info["version"] = server_version;

  json::object result{};
  result["protocolVersion"] = protocol_version;
  result["capabilities"] = std::move(capabilities);
  result["serverInfo"] = std::move(server_info);
  return make_result(id, std::move(result));
}

json::object dispatcher::handle_list(const json::value& id) const {
  json::array resources{};
  for (const auto& file : scanner_.scan()) {
    auto name = file.relative_path.generic_string();
    json::object entry{};
    entry["uri"] = fmt::format("{}{}", file_scheme, file.absolute_path.string());
    entry["name"] = name;
    entry["description"] =
        fmt::format("Local file: {} ({} bytes)", name, file.size_bytes);
    entry["mimeType"] = text_plain;
    resources.push_back(std::move(entry));
  }

  json::object result{};
  result["resources"] = std::move(resources);
  return make_result(id, std::move(result));
}

json::object dispatcher::handle_read(
    const json::value& id, const json::value* params) const {
  // Malformed params throw here and end up as an internal error
  std::string uri{};
  if (params) {
    if (auto* u = params->as_object().if_contains("uri"))
      uri = std::string{u->as_string()};
  }

  auto not_found = [&] {
    return make_jsonrpc_error(
        id, INVALID_PARAMS, fmt::format("Resource not found: {}", uri));
  };

  auto relative = resolve_uri(uri);
  if (!relative) return not_found();

  auto file = reader_.read(*relative);
  if (!file || !file->content) return not_found();

  json::object content{};
  content["uri"] = uri;
  content["mimeType"] = text_plain;
  content["text"] = *file->content;

  json::array contents{};
  contents.push_back(std::move(content));

  json::object result{};
  result["contents"] = std::move(contents);
  return make_result(id, std::move(result));
}

std::optional<fs::path> dispatcher::resolve_uri(std::string_view uri) const {
  if (!uri.starts_with(file_scheme)) return std::nullopt;

  fs::path path{uri.substr(file_scheme.size())};
  if (!path.is_absolute()) return std::nullopt;

  path = path.lexically_normal();
  if (!utils::is_within(ctx_->root_path, path)) return std::nullopt;

  auto relative = path.lexically_relative(ctx_->root_path);
  if (relative.empty() || relative == ".") return std::nullopt;
  return relative;
}

json::object dispatcher::dispatch(const json::value& request) const {
  json::value id{nullptr};
  std::string method{};

  try {
    auto* msg = request.if_object();
    if (!msg) utils::throwf("request must be a JSON object");

    if (auto* v = msg->if_contains("id")) id = *v;
    if (auto* m = msg->if_contains("method"); m && m->is_string())
      method = std::string{m->as_string()};
    const json::value* params = msg->if_contains("params");

    LOG_INFO("rpc: {}", method);

    if (method == "initialize") {
      return handle_initialize(id);
    } else if (method == "resources/list") {
      return handle_list(id);
    } else if (method == "resources/read") {
      return handle_read(id, params);
    }
    return make_jsonrpc_error(
        id, METHOD_NOT_FOUND, fmt::format("Method not found: {}", method));
  } catch (const std::exception& e) {
    LOG_ERROR(
        "Error handling request '{}': {}: {}", method,
        utils::demangle_symbol(typeid(e).name()), e.what());
    return make_jsonrpc_error(
        id, INTERNAL_ERROR, fmt::format("Internal error: {}", e.what()));
  }
}

}  // namespace xpto::filectx
