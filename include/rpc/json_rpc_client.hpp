// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "rpc/http_transport.hpp"
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace ipc {
namespace rpc {

/**
 * JSON-RPC 2.0 client over an HttpTransport
 *
 * Request body: {"jsonrpc":"2.0","method":M,"id":N,"params":P} with ids
 * increasing per client. One request in flight at a time; the client
 * keeps no locking, so concurrent callers need separate instances.
 * Failures are never retried.
 */
class JsonRpcClient {
public:
  explicit JsonRpcClient(std::unique_ptr<HttpTransport> transport);

  /**
   * Send one request and return its "result" member
   * @throws api::TransportError on transport failure or non-2xx status
   * @throws api::RpcError when the response carries an "error" object
   * @throws api::ResponseShapeError when the body is not a JSON-RPC
   * response or "result" is missing
   */
  nlohmann::json Request(const std::string &method,
                         const nlohmann::json &params);

  /** Id of the most recent request (0 before the first) */
  uint64_t last_id() const { return next_id_ - 1; }

  HttpTransport &transport() { return *transport_; }

private:
  std::unique_ptr<HttpTransport> transport_;
  uint64_t next_id_ = 1;
};

} // namespace rpc
} // namespace ipc
