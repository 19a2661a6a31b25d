// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace ipc {
namespace rpc {

struct HttpResponse {
  int status = 0;
  std::string body;
};

/**
 * HttpTransport - abstract request/response channel to a backend node
 *
 * One JSON-RPC body out, one HTTP response back. Implementations:
 * - BeastHttpTransport: plain HTTP/1.1 over Boost.Beast
 * - MockHttpTransport (tests): canned responses, records requests
 *
 * Connection-level failures (resolve, connect, timeout, read) throw
 * api::TransportError with status 0. A response with any HTTP status is
 * returned; interpreting the status is the caller's job.
 */
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Post(const std::string &body) = 0;

  /** Human-readable target for log lines */
  virtual std::string Endpoint() const = 0;
};

/** Pieces of an http:// URL */
struct HttpUrl {
  std::string host;
  std::string port = "80";
  std::string target = "/";

  /**
   * Parse "http://host[:port][/path]"
   * @throws api::Error(InvalidArgument) for other schemes (https included),
   * an empty host or a bad port
   */
  static HttpUrl Parse(const std::string &url);

  std::string ToString() const;

  /** Host header value: "host", or "host:port" off the default port */
  std::string HostHeader() const;
};

/**
 * Synchronous HTTP POST over Boost.Beast
 *
 * Each Post() opens a fresh connection, so an instance keeps no socket
 * state between calls. The optional timeout applies to each of connect,
 * write and read; without one, calls wait as long as the OS allows.
 */
class BeastHttpTransport : public HttpTransport {
public:
  BeastHttpTransport(const std::string &url,
                     std::optional<std::string> auth_token = std::nullopt,
                     std::optional<std::chrono::milliseconds> timeout =
                         std::nullopt);

  HttpResponse Post(const std::string &body) override;
  std::string Endpoint() const override { return url_.ToString(); }

private:
  HttpUrl url_;
  std::optional<std::string> auth_token_;
  std::optional<std::chrono::milliseconds> timeout_;
};

} // namespace rpc
} // namespace ipc
