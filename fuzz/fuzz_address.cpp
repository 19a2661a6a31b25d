// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// Fuzz target for address text decoding (base32 payload + BLAKE2b checksum)

#include "api/address.hpp"
#include "api/error.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace ipc::api;

    std::string_view text(reinterpret_cast<const char *>(data), size);

    try {
        Address addr = Address::ParseAny(text);

        // Re-encoding must round-trip through the strict parser
        Address reparsed = Address::FromString(addr.ToString());
        if (reparsed != addr) {
            __builtin_trap();
        }

        // Testnet form must decode to the same address
        if (Address::FromString(addr.ToString(AddressNetwork::Test), AddressNetwork::Test) != addr) {
            __builtin_trap();
        }

        if (auto eth = addr.ToEthHex()) {
            if (Address::ParseAny(*eth) != addr) {
                __builtin_trap();
            }
        }
    } catch (const Error &) {
    }

    return 0;
}
