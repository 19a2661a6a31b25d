// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ipc {
namespace api {

enum class ErrorKind {
  MalformedIdentifier,
  UnsupportedConversion,
  UnsupportedOperation,
  InvalidArgument,
  InvalidState,
  TransportFailure,
  ProtocolError,
  ResponseShapeError,
};

std::string ErrorKindToString(ErrorKind kind);

/**
 * Base error for identifier, provider and transport failures
 *
 * Every failure surfaced to callers is an Error (or a subclass carrying
 * extra structured detail). Callers that only need to branch on the
 * category use kind().
 */
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

/** Identifier that does not match its textual grammar */
class InvalidIdError : public Error {
public:
  InvalidIdError(const std::string &raw, const std::string &reason);

  const std::string &raw() const noexcept { return raw_; }
  const std::string &reason() const noexcept { return reason_; }

private:
  std::string raw_;
  std::string reason_;
};

/** Non-success status from the backend transport (0 = no HTTP response) */
class TransportError : public Error {
public:
  TransportError(int status, const std::string &detail);

  int status() const noexcept { return status_; }
  const std::string &detail() const noexcept { return detail_; }

private:
  int status_;
  std::string detail_;
};

/** Structured JSON-RPC error object reported by the backend */
class RpcError : public Error {
public:
  RpcError(int64_t code, const std::string &message, const std::string &data);

  int64_t code() const noexcept { return code_; }
  const std::string &rpc_message() const noexcept { return rpc_message_; }
  /** "data" member: strings verbatim, other values as JSON text, empty when
   * absent */
  const std::string &data() const noexcept { return data_; }

private:
  int64_t code_;
  std::string rpc_message_;
  std::string data_;
};

/** Backend response missing a field or carrying one of the wrong type */
class ResponseShapeError : public Error {
public:
  ResponseShapeError(const std::string &field_path, const std::string &problem);

  const std::string &field_path() const noexcept { return field_path_; }

private:
  std::string field_path_;
};

} // namespace api
} // namespace ipc
