// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/address.hpp"
#include "api/subnet_id.hpp"
#include "api/token_amount.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ipc {
namespace api {

/**
 * Globally routable address: a subnet plus a leaf address inside it
 * Text form "<subnet id>:<address>".
 */
struct IPCAddress {
  SubnetID subnet;
  Address raw_address;

  std::string ToString() const;
  /** @throws InvalidIdError */
  static IPCAddress FromString(std::string_view str);

  bool operator==(const IPCAddress &other) const {
    return subnet == other.subnet && raw_address == other.raw_address;
  }
  bool operator!=(const IPCAddress &other) const { return !(*this == other); }
};

enum class IpcMsgKind : uint8_t {
  Transfer = 0, // value transfer, no payload interpretation
  Result = 1,   // receipt of a previous Call
  Call = 2,     // general message with a payload
};

std::string IpcMsgKindToString(IpcMsgKind kind);

/** Direction in which an envelope moves from the current subnet */
enum class IpcMsgType { TopDown, BottomUp };

/**
 * Cross-subnet message envelope
 *
 * Exchanged in both directions: parent to child (top-down) and child to
 * parent inside a checkpoint (bottom-up). nonce orders envelopes from the
 * same origin; the manager layer never reorders or batches them.
 */
struct IpcEnvelope {
  IpcMsgKind kind = IpcMsgKind::Transfer;
  IPCAddress from;
  IPCAddress to;
  TokenAmount value;
  std::vector<uint8_t> message;
  uint64_t nonce = 0;

  /**
   * Build a validated envelope
   * @throws InvalidIdError if either subnet is the undefined id
   * @throws Error(InvalidArgument) if value is not representable on the
   * destination subnet's chain
   */
  static IpcEnvelope Create(IpcMsgKind kind, IPCAddress from, IPCAddress to,
                            TokenAmount value, std::vector<uint8_t> message,
                            uint64_t nonce);

  /**
   * Direction at the current subnet: top-down while current is an
   * ancestor of (or equal to) the destination, bottom-up otherwise
   * @throws Error(InvalidArgument) if current and the destination do not
   * share a root
   */
  IpcMsgType ApplyType(const SubnetID &current) const;

  bool operator==(const IpcEnvelope &other) const {
    return kind == other.kind && from == other.from && to == other.to &&
           value == other.value && message == other.message &&
           nonce == other.nonce;
  }
};

} // namespace api
} // namespace ipc
