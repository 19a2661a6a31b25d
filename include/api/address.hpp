// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ipc {
namespace api {

enum class AddressProtocol : uint8_t {
  Id = 0,
  Secp256k1 = 1,
  Actor = 2,
  Bls = 3,
  Delegated = 4,
};

/** Network prefix of the textual form: 'f' (main) or 't' (test) */
enum class AddressNetwork { Main, Test };

/**
 * Actor address used for every child segment of a subnet path
 *
 * Text form is <network><protocol><payload>:
 *   ID         f0<decimal id>
 *   Secp256k1  f1<base32(hash20 || checksum)>
 *   Actor      f2<base32(hash20 || checksum)>
 *   BLS        f3<base32(pubkey48 || checksum)>
 *   Delegated  f4<decimal namespace>f<base32(subaddress || checksum)>
 *
 * The checksum is a 4-byte BLAKE2b digest of the binary form
 * (protocol byte followed by the payload). Default-constructed
 * addresses are ID 0, the null actor.
 */
class Address {
public:
  static constexpr size_t PAYLOAD_HASH_LEN = 20;
  static constexpr size_t SECP_PUB_LEN = 65;
  static constexpr size_t BLS_PUB_LEN = 48;
  static constexpr size_t MAX_SUBADDRESS_LEN = 54;
  static constexpr size_t CHECKSUM_LEN = 4;
  static constexpr size_t ETH_ADDRESS_LEN = 20;
  /** Delegated namespace of EVM-style addresses */
  static constexpr uint64_t ETH_NAMESPACE = 10;

  Address() = default;

  static Address NewId(uint64_t id);
  /** From a 65-byte uncompressed public key */
  static Address NewSecp256k1(std::span<const uint8_t> pubkey);
  /** Actor address derived from arbitrary seed bytes */
  static Address NewActor(std::span<const uint8_t> data);
  static Address NewBls(std::span<const uint8_t> pubkey);
  static Address NewDelegated(uint64_t name_space,
                              std::span<const uint8_t> subaddress);
  static Address FromEthAddress(std::span<const uint8_t> eth_address);

  /**
   * Parse the textual form
   * @throws InvalidIdError with the raw string and the failure reason
   */
  static Address FromString(std::string_view str,
                            AddressNetwork network = AddressNetwork::Main);

  /** FromString, additionally accepting "0x" + 40 hex digits (EVM form) */
  static Address ParseAny(std::string_view str,
                          AddressNetwork network = AddressNetwork::Main);

  AddressProtocol protocol() const { return protocol_; }

  /** ID value for ID addresses */
  std::optional<uint64_t> id() const;
  /** Namespace for delegated addresses */
  std::optional<uint64_t> delegated_namespace() const;
  /** Hash, public key or delegated subaddress (empty for ID addresses) */
  const std::vector<uint8_t> &payload() const { return payload_; }

  /** "0x..." form of an EVM-namespace delegated address */
  std::optional<std::string> ToEthHex() const;

  /** Binary form: protocol byte, then payload (LEB128 for numbers) */
  std::vector<uint8_t> Bytes() const;

  std::string ToString(AddressNetwork network = AddressNetwork::Main) const;

  bool operator==(const Address &other) const {
    return protocol_ == other.protocol_ && value_ == other.value_ &&
           payload_ == other.payload_;
  }
  bool operator!=(const Address &other) const { return !(*this == other); }
  bool operator<(const Address &other) const;

private:
  Address(AddressProtocol protocol, uint64_t value,
          std::vector<uint8_t> payload)
      : protocol_(protocol), value_(value), payload_(std::move(payload)) {}

  AddressProtocol protocol_ = AddressProtocol::Id;
  // ID value, or the namespace of a delegated address
  uint64_t value_ = 0;
  std::vector<uint8_t> payload_;
};

} // namespace api
} // namespace ipc
