// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/cross.hpp"
#include "api/error.hpp"
#include "util/logging.hpp"

namespace ipc {
namespace api {

std::string IPCAddress::ToString() const {
  return subnet.ToString() + ":" + raw_address.ToString();
}

IPCAddress IPCAddress::FromString(std::string_view str) {
  // Subnet ids never contain ':', so the first one is the separator
  size_t sep = str.find(':');
  if (sep == std::string_view::npos) {
    throw InvalidIdError(std::string(str),
                         "expected <subnet>:<address> IPC address");
  }
  try {
    return IPCAddress{SubnetID::FromString(str.substr(0, sep)),
                      Address::FromString(str.substr(sep + 1))};
  } catch (const InvalidIdError &e) {
    throw InvalidIdError(std::string(str), e.reason());
  }
}

std::string IpcMsgKindToString(IpcMsgKind kind) {
  switch (kind) {
  case IpcMsgKind::Transfer:
    return "transfer";
  case IpcMsgKind::Result:
    return "result";
  case IpcMsgKind::Call:
    return "call";
  }
  return "unknown";
}

IpcEnvelope IpcEnvelope::Create(IpcMsgKind kind, IPCAddress from, IPCAddress to,
                                TokenAmount value, std::vector<uint8_t> message,
                                uint64_t nonce) {
  if (from.subnet.IsUndefined()) {
    throw InvalidIdError(from.ToString(), "undefined source subnet");
  }
  if (to.subnet.IsUndefined()) {
    throw InvalidIdError(to.ToString(), "undefined destination subnet");
  }

  const NetworkType dest_type = to.subnet.GetNetworkType();
  if (!value.FitsIn(dest_type)) {
    throw Error(ErrorKind::InvalidArgument,
                "value " + value.ToString() + " is not representable on " +
                    NetworkTypeToString(dest_type) + " subnet " +
                    to.subnet.ToString());
  }

  LOG_API_DEBUG("envelope {} {} -> {} nonce={}", IpcMsgKindToString(kind),
                from.ToString(), to.ToString(), nonce);

  IpcEnvelope env;
  env.kind = kind;
  env.from = std::move(from);
  env.to = std::move(to);
  env.value = std::move(value);
  env.message = std::move(message);
  env.nonce = nonce;
  return env;
}

IpcMsgType IpcEnvelope::ApplyType(const SubnetID &current) const {
  auto common = current.CommonParent(to.subnet);
  if (!common) {
    throw Error(ErrorKind::InvalidArgument,
                "subnet " + current.ToString() +
                    " has no common root with destination " +
                    to.subnet.ToString());
  }
  if (common->first == current.children().size()) {
    return IpcMsgType::TopDown;
  }
  return IpcMsgType::BottomUp;
}

} // namespace api
} // namespace ipc
