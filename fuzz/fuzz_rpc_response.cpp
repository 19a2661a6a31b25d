// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

// Fuzz target for JSON-RPC response handling
// Whatever the node sends back, the client either returns a result or
// throws an api::Error; no other exception may escape

#include "api/error.hpp"
#include "rpc/http_transport.hpp"
#include "rpc/json_rpc_client.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace {

class CannedTransport : public ipc::rpc::HttpTransport {
public:
    CannedTransport(int status, std::string body) : status_(status), body_(std::move(body)) {}

    ipc::rpc::HttpResponse Post(const std::string &) override { return {status_, body_}; }
    std::string Endpoint() const override { return "fuzz://node"; }

private:
    int status_;
    std::string body_;
};

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) {
        return 0;
    }

    // First byte picks the HTTP status class, the rest is the body
    const int status = (data[0] % 5 + 1) * 100;
    std::string body(reinterpret_cast<const char *>(data + 1), size - 1);

    ipc::rpc::JsonRpcClient client(std::make_unique<CannedTransport>(status, std::move(body)));
    try {
        client.Request("getgenesisinfo", {{"subnet_id", "00"}});
        if (status != 200) {
            // Non-2xx status accepted as a result - BUG!
            __builtin_trap();
        }
    } catch (const ipc::api::Error &) {
    }

    return 0;
}
