// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// Fuzz target for subnet identifier parsing
// Every accepted string must print back to an id that parses to the same value

#include "api/error.hpp"
#include "api/subnet_id.hpp"
#include "api/universal_subnet_id.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace ipc::api;

    std::string_view text(reinterpret_cast<const char *>(data), size);

    try {
        SubnetID id = SubnetID::FromString(text);
        SubnetID reparsed = SubnetID::FromString(id.ToString());
        if (!(reparsed == id)) {
            // Canonical form does not parse back to the same id - BUG!
            __builtin_trap();
        }

        // Navigation must stay on the same root
        if (auto parent = id.Parent()) {
            if (parent->root_id() != id.root_id() || parent->children().size() + 1 != id.children().size()) {
                __builtin_trap();
            }
            if (!(SubnetID::NewFromParent(*parent, id.SubnetActor()) == id)) {
                __builtin_trap();
            }
        }
        if (auto common = id.CommonParent(id)) {
            if (common->first != id.children().size()) {
                __builtin_trap();
            }
        }
        (void)id.ChainId();
    } catch (const Error &) {
        // Rejected input is fine; anything else escaping is a bug
    }

    try {
        UniversalSubnetId id = UniversalSubnetId::FromString(text);
        if (!(UniversalSubnetId::FromString(id.ToString()) == id)) {
            __builtin_trap();
        }
        if (id.root().name_space == EIP155_NAMESPACE) {
            SubnetID converted = id.ToSubnetId();
            if (converted.children().size() != id.children().size()) {
                __builtin_trap();
            }
        }
    } catch (const Error &) {
    }

    return 0;
}
