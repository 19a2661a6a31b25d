// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/address.hpp"
#include "api/error.hpp"
#include "util/base32.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>
#include <blake2.h>
#include <stdexcept>

namespace ipc {
namespace api {

namespace {

// Longest LEB128 encoding of a u64
constexpr size_t MAX_LEB128_LEN = 10;

void WriteLeb128(std::vector<uint8_t> &out, uint64_t value) {
  do {
    uint8_t byte = value & 0x7f;
    value >>= 7;
    if (value != 0) {
      byte |= 0x80;
    }
    out.push_back(byte);
  } while (value != 0);
}

// Unkeyed BLAKE2b with a truncated digest length (4 or 20 bytes here)
std::vector<uint8_t> Blake2bDigest(std::span<const uint8_t> data,
                                   size_t out_len) {
  std::vector<uint8_t> out(out_len);
  if (blake2b(out.data(), out.size(), data.data(), data.size(), nullptr, 0) !=
      0) {
    throw std::runtime_error("blake2b failed for digest length " +
                             std::to_string(out_len));
  }
  return out;
}

std::vector<uint8_t> Checksum(std::span<const uint8_t> bytes) {
  return Blake2bDigest(bytes, Address::CHECKSUM_LEN);
}

char NetworkPrefix(AddressNetwork network) {
  return network == AddressNetwork::Main ? 'f' : 't';
}

// Canonical decimal: digits only, no leading zeros, fits u64
std::optional<uint64_t> ParseCanonicalDecimal(std::string_view str) {
  if (str.size() > 1 && str[0] == '0') {
    return std::nullopt;
  }
  return util::SafeParseUint64(str);
}

} // namespace

Address Address::NewId(uint64_t id) {
  return Address(AddressProtocol::Id, id, {});
}

Address Address::NewSecp256k1(std::span<const uint8_t> pubkey) {
  if (pubkey.size() != SECP_PUB_LEN) {
    throw Error(ErrorKind::InvalidArgument,
                "secp256k1 public key must be 65 bytes (uncompressed), got " +
                    std::to_string(pubkey.size()));
  }
  return Address(AddressProtocol::Secp256k1, 0,
                 Blake2bDigest(pubkey, PAYLOAD_HASH_LEN));
}

Address Address::NewActor(std::span<const uint8_t> data) {
  return Address(AddressProtocol::Actor, 0,
                 Blake2bDigest(data, PAYLOAD_HASH_LEN));
}

Address Address::NewBls(std::span<const uint8_t> pubkey) {
  if (pubkey.size() != BLS_PUB_LEN) {
    throw Error(ErrorKind::InvalidArgument,
                "BLS public key must be 48 bytes, got " +
                    std::to_string(pubkey.size()));
  }
  return Address(AddressProtocol::Bls, 0,
                 std::vector<uint8_t>(pubkey.begin(), pubkey.end()));
}

Address Address::NewDelegated(uint64_t name_space,
                              std::span<const uint8_t> subaddress) {
  if (subaddress.size() > MAX_SUBADDRESS_LEN) {
    throw Error(ErrorKind::InvalidArgument,
                "delegated subaddress exceeds 54 bytes (" +
                    std::to_string(subaddress.size()) + ")");
  }
  return Address(AddressProtocol::Delegated, name_space,
                 std::vector<uint8_t>(subaddress.begin(), subaddress.end()));
}

Address Address::FromEthAddress(std::span<const uint8_t> eth_address) {
  if (eth_address.size() != ETH_ADDRESS_LEN) {
    throw Error(ErrorKind::InvalidArgument,
                "EVM address must be 20 bytes, got " +
                    std::to_string(eth_address.size()));
  }
  return NewDelegated(ETH_NAMESPACE, eth_address);
}

Address Address::FromString(std::string_view str, AddressNetwork network) {
  const std::string raw(str);

  if (str.size() < 3) {
    throw InvalidIdError(raw, "invalid address length");
  }
  if (str[0] != 'f' && str[0] != 't') {
    throw InvalidIdError(raw, "unknown address network");
  }
  if (str[0] != NetworkPrefix(network)) {
    throw InvalidIdError(raw, std::string("address network mismatch: expected '") +
                                  NetworkPrefix(network) + "' prefix");
  }

  const char proto_char = str[1];
  if (proto_char < '0' || proto_char > '4') {
    throw InvalidIdError(raw, "unknown address protocol");
  }
  const auto protocol = static_cast<AddressProtocol>(proto_char - '0');
  std::string_view rest = str.substr(2);

  if (protocol == AddressProtocol::Id) {
    auto id = ParseCanonicalDecimal(rest);
    if (!id) {
      throw InvalidIdError(raw, "invalid ID address payload");
    }
    return NewId(*id);
  }

  uint64_t name_space = 0;
  if (protocol == AddressProtocol::Delegated) {
    size_t sep = rest.find('f');
    if (sep == std::string_view::npos) {
      throw InvalidIdError(raw, "missing delegated namespace separator");
    }
    auto ns = ParseCanonicalDecimal(rest.substr(0, sep));
    if (!ns) {
      throw InvalidIdError(raw, "invalid delegated namespace");
    }
    name_space = *ns;
    rest = rest.substr(sep + 1);
  }

  auto decoded = util::DecodeBase32(rest);
  if (!decoded) {
    throw InvalidIdError(raw, "invalid base32 payload");
  }
  if (decoded->size() < CHECKSUM_LEN) {
    throw InvalidIdError(raw, "invalid address length");
  }

  std::vector<uint8_t> payload(decoded->begin(), decoded->end() - CHECKSUM_LEN);
  std::vector<uint8_t> checksum(decoded->end() - CHECKSUM_LEN, decoded->end());

  switch (protocol) {
  case AddressProtocol::Secp256k1:
  case AddressProtocol::Actor:
    if (payload.size() != PAYLOAD_HASH_LEN) {
      throw InvalidIdError(raw, "invalid payload length");
    }
    break;
  case AddressProtocol::Bls:
    if (payload.size() != BLS_PUB_LEN) {
      throw InvalidIdError(raw, "invalid payload length");
    }
    break;
  case AddressProtocol::Delegated:
    if (payload.size() > MAX_SUBADDRESS_LEN) {
      throw InvalidIdError(raw, "invalid payload length");
    }
    break;
  case AddressProtocol::Id:
    break;
  }

  Address addr(protocol, name_space, std::move(payload));
  if (Checksum(addr.Bytes()) != checksum) {
    throw InvalidIdError(raw, "invalid address checksum");
  }
  return addr;
}

Address Address::ParseAny(std::string_view str, AddressNetwork network) {
  if (str.size() == 2 + 2 * ETH_ADDRESS_LEN && str[0] == '0' &&
      (str[1] == 'x' || str[1] == 'X')) {
    auto bytes = util::ParseHex(str);
    if (!bytes) {
      throw InvalidIdError(std::string(str), "invalid EVM address hex");
    }
    return FromEthAddress(*bytes);
  }
  return FromString(str, network);
}

std::optional<uint64_t> Address::id() const {
  if (protocol_ != AddressProtocol::Id) {
    return std::nullopt;
  }
  return value_;
}

std::optional<uint64_t> Address::delegated_namespace() const {
  if (protocol_ != AddressProtocol::Delegated) {
    return std::nullopt;
  }
  return value_;
}

std::optional<std::string> Address::ToEthHex() const {
  if (protocol_ != AddressProtocol::Delegated || value_ != ETH_NAMESPACE ||
      payload_.size() != ETH_ADDRESS_LEN) {
    return std::nullopt;
  }
  return "0x" + util::HexStr(payload_);
}

std::vector<uint8_t> Address::Bytes() const {
  std::vector<uint8_t> out;
  out.reserve(1 + MAX_LEB128_LEN + payload_.size());
  out.push_back(static_cast<uint8_t>(protocol_));
  if (protocol_ == AddressProtocol::Id ||
      protocol_ == AddressProtocol::Delegated) {
    WriteLeb128(out, value_);
  }
  out.insert(out.end(), payload_.begin(), payload_.end());
  return out;
}

std::string Address::ToString(AddressNetwork network) const {
  std::string out;
  out.push_back(NetworkPrefix(network));
  out.push_back(static_cast<char>('0' + static_cast<uint8_t>(protocol_)));

  if (protocol_ == AddressProtocol::Id) {
    return out + std::to_string(value_);
  }
  if (protocol_ == AddressProtocol::Delegated) {
    out += std::to_string(value_);
    out.push_back('f');
  }

  std::vector<uint8_t> body = payload_;
  auto checksum = Checksum(Bytes());
  body.insert(body.end(), checksum.begin(), checksum.end());
  return out + util::EncodeBase32(body);
}

bool Address::operator<(const Address &other) const {
  auto lhs = Bytes();
  auto rhs = other.Bytes();
  return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(),
                                      rhs.end());
}

} // namespace api
} // namespace ipc
