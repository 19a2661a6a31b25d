// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/subnet_id.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ipc {
namespace api {

/**
 * Non-negative token amount in a chain's base unit
 *
 * Account chains count atto-units (10^-18 of a whole token), UTXO chains
 * count satoshis. No unit conversion ever happens here: the caller
 * stores an amount already normalized for the chain it is sent to.
 */
class TokenAmount {
public:
  using BigInt = boost::multiprecision::cpp_int;

  static constexpr unsigned ATTO_DECIMALS = 18;

  TokenAmount() = default;

  static TokenAmount FromAtto(uint64_t atto) { return TokenAmount(BigInt(atto)); }
  /** Base units from a big integer; throws InvalidArgument if negative */
  static TokenAmount FromBigInt(const BigInt &value);
  /** Whole tokens scaled by 10^18 */
  static TokenAmount FromWhole(uint64_t whole);

  /**
   * Parse a plain decimal integer of base units
   * @return nullopt on empty input, signs, or non-digits
   */
  static std::optional<TokenAmount> FromDecimalString(std::string_view str);

  bool IsZero() const { return value_.is_zero(); }

  /** UTXO chains need a u64 satoshi value; account chains a uint256 */
  bool FitsIn(NetworkType type) const;

  /** @throws Error(InvalidArgument) if the amount exceeds UINT64_MAX */
  uint64_t ToUint64() const;

  const BigInt &value() const { return value_; }

  std::string ToString() const { return value_.str(); }

  TokenAmount operator+(const TokenAmount &other) const {
    return TokenAmount(value_ + other.value_);
  }

  bool operator==(const TokenAmount &other) const {
    return value_ == other.value_;
  }
  bool operator!=(const TokenAmount &other) const { return !(*this == other); }
  bool operator<(const TokenAmount &other) const { return value_ < other.value_; }
  bool operator>(const TokenAmount &other) const { return other < *this; }
  bool operator<=(const TokenAmount &other) const { return !(other < *this); }
  bool operator>=(const TokenAmount &other) const { return !(*this < other); }

private:
  explicit TokenAmount(BigInt value) : value_(std::move(value)) {}

  BigInt value_;
};

} // namespace api
} // namespace ipc
