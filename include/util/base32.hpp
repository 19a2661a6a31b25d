// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ipc {
namespace util {

/**
 * RFC 4648 base32, lowercase alphabet "abcdefghijklmnopqrstuvwxyz234567",
 * without padding (the textual address encoding)
 */
std::string EncodeBase32(std::span<const uint8_t> data);

/**
 * Decode unpadded lowercase base32
 *
 * Rejects characters outside the alphabet, lengths that cannot come
 * from whole bytes (1, 3 or 6 trailing symbols) and non-zero trailing
 * bits, so every accepted string has exactly one encoding.
 */
std::optional<std::vector<uint8_t>> DecodeBase32(std::string_view str);

} // namespace util
} // namespace ipc
