// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Hex encoding/decoding for identifiers, keys and block hashes
 - Consistent error handling across the codebase

 Security:
 - All functions validate entire input is consumed (no trailing garbage)
 - Bounds checking prevents overflow/underflow
 - Returns std::nullopt on any parsing error (no exceptions thrown)
 - Safe for use with untrusted input (RPC responses, command-line args,
   config files)
*/

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ipc {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 */
std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

/**
 * Parse an unsigned 64-bit decimal string
 *
 * Only plain decimal digits are accepted: no sign, no whitespace, no
 * radix prefix. Values above UINT64_MAX are rejected.
 *
 * Examples:
 *   SafeParseUint64("18446744073709551615") -> UINT64_MAX
 *   SafeParseUint64("18446744073709551616") -> std::nullopt (overflow)
 *   SafeParseUint64("-1") -> std::nullopt
 */
std::optional<uint64_t> SafeParseUint64(std::string_view str);

/**
 * Decode a hex string into bytes
 *
 * Accepts an optional "0x" prefix. Rejects odd lengths and non-hex
 * characters. An empty string (or bare "0x") decodes to an empty vector.
 */
std::optional<std::vector<uint8_t>> ParseHex(std::string_view str);

/**
 * Encode bytes as lowercase hex (no prefix)
 */
std::string HexStr(std::span<const uint8_t> data);

/**
 * Split a string on a single-character separator, keeping empty fields
 *
 * Example:
 *   SplitString("a,,b", ',') -> {"a", "", "b"}
 */
std::vector<std::string> SplitString(std::string_view str, char sep);

} // namespace util
} // namespace ipc
