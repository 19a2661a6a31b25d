// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/base32.hpp"

namespace ipc {
namespace util {

static constexpr char BASE32_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";

static int Base32Value(char c) {
  if (c >= 'a' && c <= 'z')
    return c - 'a';
  if (c >= '2' && c <= '7')
    return c - '2' + 26;
  return -1;
}

std::string EncodeBase32(std::span<const uint8_t> data) {
  std::string out;
  out.reserve((data.size() * 8 + 4) / 5);

  uint32_t buffer = 0;
  int bits = 0;
  for (uint8_t b : data) {
    buffer = (buffer << 8) | b;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      out.push_back(BASE32_ALPHABET[(buffer >> bits) & 0x1f]);
    }
  }
  if (bits > 0) {
    out.push_back(BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1f]);
  }
  return out;
}

std::optional<std::vector<uint8_t>> DecodeBase32(std::string_view str) {
  // Symbol counts mod 8 that a whole number of bytes can produce
  switch (str.size() % 8) {
  case 1:
  case 3:
  case 6:
    return std::nullopt;
  default:
    break;
  }

  std::vector<uint8_t> out;
  out.reserve(str.size() * 5 / 8);

  uint32_t buffer = 0;
  int bits = 0;
  for (char c : str) {
    int v = Base32Value(c);
    if (v < 0) {
      return std::nullopt;
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(v);
    bits += 5;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xff));
    }
  }

  // Leftover bits are padding and must be zero
  if (bits > 0 && (buffer & ((1u << bits) - 1)) != 0) {
    return std::nullopt;
  }
  return out;
}

} // namespace util
} // namespace ipc
