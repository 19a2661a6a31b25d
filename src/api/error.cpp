// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/error.hpp"

namespace ipc {
namespace api {

std::string ErrorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::MalformedIdentifier:
    return "malformed identifier";
  case ErrorKind::UnsupportedConversion:
    return "unsupported conversion";
  case ErrorKind::UnsupportedOperation:
    return "unsupported operation";
  case ErrorKind::InvalidArgument:
    return "invalid argument";
  case ErrorKind::InvalidState:
    return "invalid state";
  case ErrorKind::TransportFailure:
    return "transport failure";
  case ErrorKind::ProtocolError:
    return "protocol error";
  case ErrorKind::ResponseShapeError:
    return "response shape error";
  }
  return "unknown";
}

InvalidIdError::InvalidIdError(const std::string &raw,
                               const std::string &reason)
    : Error(ErrorKind::MalformedIdentifier,
            "invalid id '" + raw + "': " + reason),
      raw_(raw), reason_(reason) {}

TransportError::TransportError(int status, const std::string &detail)
    : Error(ErrorKind::TransportFailure,
            status == 0 ? "transport failure: " + detail
                        : "transport failure (HTTP " + std::to_string(status) +
                              "): " + detail),
      status_(status), detail_(detail) {}

RpcError::RpcError(int64_t code, const std::string &message,
                   const std::string &data)
    : Error(ErrorKind::ProtocolError,
            "rpc error " + std::to_string(code) + ": " + message +
                (data.empty() ? "" : " (" + data + ")")),
      code_(code), rpc_message_(message), data_(data) {}

ResponseShapeError::ResponseShapeError(const std::string &field_path,
                                       const std::string &problem)
    : Error(ErrorKind::ResponseShapeError,
            "unexpected response: field '" + field_path + "' " + problem),
      field_path_(field_path) {}

} // namespace api
} // namespace ipc
