// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/http_transport.hpp"
#include "api/error.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace ipc {
namespace rpc {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

HttpUrl HttpUrl::Parse(const std::string &url) {
  constexpr std::string_view kScheme = "http://";

  if (url.rfind("https://", 0) == 0) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "https endpoints are not supported: " + url);
  }
  if (url.rfind(kScheme, 0) != 0) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "expected an http:// URL: " + url);
  }

  HttpUrl out;
  std::string rest = url.substr(kScheme.size());
  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    out.target = rest.substr(slash);
  }

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    auto port = util::SafeParseInt(authority.substr(colon + 1), 1, 65535);
    if (!port) {
      throw api::Error(api::ErrorKind::InvalidArgument,
                       "invalid port in URL: " + url);
    }
    out.port = std::to_string(*port);
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "missing host in URL: " + url);
  }
  out.host = authority;
  return out;
}

std::string HttpUrl::ToString() const {
  return "http://" + host + ":" + port + target;
}

std::string HttpUrl::HostHeader() const {
  return port == "80" ? host : host + ":" + port;
}

BeastHttpTransport::BeastHttpTransport(
    const std::string &url, std::optional<std::string> auth_token,
    std::optional<std::chrono::milliseconds> timeout)
    : url_(HttpUrl::Parse(url)), auth_token_(std::move(auth_token)),
      timeout_(timeout) {}

HttpResponse BeastHttpTransport::Post(const std::string &body) {
  boost::asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);

  beast::error_code ec;
  auto endpoints = resolver.resolve(url_.host, url_.port, ec);
  if (ec) {
    LOG_RPC_ERROR("failed to resolve {}: {}", url_.host, ec.message());
    throw api::TransportError(0, "resolve " + url_.host + ": " + ec.message());
  }

  http::request<http::string_body> req{http::verb::post, url_.target, 11};
  req.set(http::field::host, url_.HostHeader());
  req.set(http::field::user_agent, "ipc-cli");
  req.set(http::field::content_type, "application/json");
  if (auth_token_) {
    req.set(http::field::authorization, "Bearer " + *auth_token_);
  }
  req.body() = body;
  req.prepare_payload();

  beast::flat_buffer buffer;
  http::response<http::string_body> res;
  beast::error_code op_ec;
  std::string stage = "connect";

  auto arm_timer = [&]() {
    if (timeout_) {
      stream.expires_after(*timeout_);
    }
  };

  // tcp_stream only enforces expiry on asynchronous operations, so the
  // exchange is chained asynchronously and driven to completion here.
  arm_timer();
  stream.async_connect(endpoints, [&](beast::error_code cec,
                                      const tcp::endpoint &) {
    if (cec) {
      op_ec = cec;
      return;
    }
    stage = "write";
    arm_timer();
    http::async_write(stream, req, [&](beast::error_code wec, std::size_t) {
      if (wec) {
        op_ec = wec;
        return;
      }
      stage = "read";
      arm_timer();
      http::async_read(stream, buffer, res,
                       [&](beast::error_code rec, std::size_t) { op_ec = rec; });
    });
  });
  ioc.run();

  if (op_ec) {
    LOG_RPC_ERROR("http {} to {} failed: {}", stage, Endpoint(),
                  op_ec.message());
    throw api::TransportError(0, stage + " " + Endpoint() + ": " +
                                     op_ec.message());
  }

  beast::error_code shutdown_ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
  if (shutdown_ec && shutdown_ec != beast::errc::not_connected) {
    LOG_RPC_TRACE("socket shutdown: {}", shutdown_ec.message());
  }

  return HttpResponse{static_cast<int>(res.result_int()), res.body()};
}

} // namespace rpc
} // namespace ipc
