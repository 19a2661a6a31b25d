// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/json_rpc_client.hpp"
#include "api/error.hpp"
#include "util/logging.hpp"

namespace ipc {
namespace rpc {

using json = nlohmann::json;

namespace {

// Longest response excerpt carried in transport errors
constexpr size_t MAX_BODY_EXCERPT = 256;

std::string Excerpt(const std::string &body) {
  if (body.size() <= MAX_BODY_EXCERPT) {
    return body;
  }
  return body.substr(0, MAX_BODY_EXCERPT) + "...";
}

} // namespace

JsonRpcClient::JsonRpcClient(std::unique_ptr<HttpTransport> transport)
    : transport_(std::move(transport)) {}

json JsonRpcClient::Request(const std::string &method, const json &params) {
  const uint64_t id = next_id_++;

  json request = {
      {"jsonrpc", "2.0"}, {"method", method}, {"id", id}, {"params", params}};

  LOG_RPC_DEBUG("-> {} id={} ({})", method, id, transport_->Endpoint());
  LOG_RPC_TRACE("request body: {}", request.dump());

  HttpResponse response = transport_->Post(request.dump());

  if (response.status < 200 || response.status >= 300) {
    LOG_RPC_ERROR("{} id={} failed with HTTP status {}", method, id,
                  response.status);
    throw api::TransportError(response.status,
                              method + ": " + Excerpt(response.body));
  }

  json reply;
  try {
    reply = json::parse(response.body);
  } catch (const json::parse_error &e) {
    LOG_RPC_WARN("{} id={} returned malformed JSON: {}", method, id, e.what());
    throw api::ResponseShapeError("$", "is not valid JSON");
  }
  if (!reply.is_object()) {
    throw api::ResponseShapeError("$", "is not an object");
  }

  LOG_RPC_TRACE("response body: {}", response.body);

  auto err = reply.find("error");
  if (err != reply.end() && !err->is_null()) {
    if (!err->is_object()) {
      throw api::ResponseShapeError("error", "is not an object");
    }
    auto code = err->find("code");
    if (code == err->end() || !code->is_number_integer()) {
      throw api::ResponseShapeError("error.code", "is missing or not an integer");
    }
    auto message = err->find("message");
    if (message == err->end() || !message->is_string()) {
      throw api::ResponseShapeError("error.message",
                                    "is missing or not a string");
    }
    std::string data;
    auto data_it = err->find("data");
    if (data_it != err->end() && !data_it->is_null()) {
      data = data_it->is_string() ? data_it->get<std::string>()
                                  : data_it->dump();
    }
    LOG_RPC_WARN("{} id={} rpc error {}: {}", method, id,
                 code->get<int64_t>(), message->get<std::string>());
    throw api::RpcError(code->get<int64_t>(), message->get<std::string>(),
                        data);
  }

  auto result = reply.find("result");
  if (result == reply.end()) {
    throw api::ResponseShapeError("result", "is missing");
  }

  LOG_RPC_DEBUG("<- {} id={} ok", method, id);
  return *result;
}

} // namespace rpc
} // namespace ipc
