// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/token_amount.hpp"
#include "api/error.hpp"
#include <limits>

namespace ipc {
namespace api {

namespace {

// Longest decimal accepted before the 256-bit check rejects it anyway
constexpr size_t MAX_DECIMAL_DIGITS = 96;

} // namespace

TokenAmount TokenAmount::FromBigInt(const BigInt &value) {
  if (value < 0) {
    throw Error(ErrorKind::InvalidArgument,
                "token amount cannot be negative: " + value.str());
  }
  return TokenAmount(value);
}

TokenAmount TokenAmount::FromWhole(uint64_t whole) {
  BigInt scale = boost::multiprecision::pow(BigInt(10), ATTO_DECIMALS);
  return TokenAmount(BigInt(whole) * scale);
}

std::optional<TokenAmount> TokenAmount::FromDecimalString(std::string_view str) {
  if (str.empty() || str.size() > MAX_DECIMAL_DIGITS) {
    return std::nullopt;
  }
  BigInt value = 0;
  for (char c : str) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return TokenAmount(std::move(value));
}

bool TokenAmount::FitsIn(NetworkType type) const {
  switch (type) {
  case NetworkType::UtxoChain:
    return value_ <= std::numeric_limits<uint64_t>::max();
  case NetworkType::AccountChain:
    return value_.is_zero() || boost::multiprecision::msb(value_) < 256;
  }
  return false;
}

uint64_t TokenAmount::ToUint64() const {
  if (value_ > std::numeric_limits<uint64_t>::max()) {
    throw Error(ErrorKind::InvalidArgument,
                "token amount " + value_.str() + " does not fit in 64 bits");
  }
  return value_.convert_to<uint64_t>();
}

} // namespace api
} // namespace ipc
