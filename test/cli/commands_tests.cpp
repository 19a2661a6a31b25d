// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/error.hpp"
#include "cli/commands.hpp"
#include "cli/json_format.hpp"
#include "provider/fake_contract_caller.hpp"
#include "rpc/mock_http_transport.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <stdexcept>

using namespace ipc;
using namespace ipc::cli;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

namespace {

const std::string kChildHex(64, 'a');

provider::Config TestConfig() {
    json account = {{"id", "/r314159"},
                    {"default_sender", "f0100"},
                    {"config",
                     {{"network_type", "account"},
                      {"provider_http", "http://127.0.0.1:8545"},
                      {"gateway_addr", "f064"},
                      {"registry_addr", "f065"}}}};
    json utxo = {{"id", "/b1"},
                 {"config", {{"network_type", "utxo"}, {"provider_http", "http://127.0.0.1:3030"}}}};
    return provider::Config::FromJson({{"subnets", {account, utxo}}});
}

struct CliFixture {
    std::shared_ptr<test::FakeCallerState> caller = std::make_shared<test::FakeCallerState>();
    std::shared_ptr<test::MockHttpState> node = std::make_shared<test::MockHttpState>();
    provider::IpcProvider provider{
        TestConfig(),
        [this](const api::SubnetID&, const provider::AccountSubnetConfig&) {
            return std::make_unique<test::FakeContractCaller>(caller);
        },
        [this](const provider::UtxoSubnetConfig&) {
            return std::make_unique<test::MockHttpTransport>(node);
        }};
    CommandRunner runner{[this]() -> provider::IpcProvider& { return provider; }};

    json Run(const std::string& name, const std::vector<std::string>& words) {
        return runner.Execute(name, ParseCommandArgs(words));
    }
};

// Accessor for commands that must not need a configuration
provider::IpcProvider& NoProvider() {
    throw std::logic_error("command asked for a provider");
}

} // namespace

TEST_CASE("ParseCommandArgs - params and options", "[cli][args]") {
    CommandArgs args = ParseCommandArgs({"/r1", "--amount=5", "--to=", "extra"});
    REQUIRE(args.params == std::vector<std::string>{"/r1", "extra"});
    REQUIRE(args.Get("amount") == std::optional<std::string>("5"));
    REQUIRE(args.Get("to") == std::optional<std::string>(""));
    REQUIRE_FALSE(args.Get("from").has_value());
    REQUIRE(args.Require("amount") == "5");

    try {
        args.Require("subnet");
        FAIL("expected a missing option error");
    } catch (const api::Error& e) {
        REQUIRE(e.kind() == api::ErrorKind::InvalidArgument);
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("--subnet"));
    }

    REQUIRE(test::ThrownKind([] { ParseCommandArgs({"--verbose"}); }) ==
            api::ErrorKind::InvalidArgument);
    REQUIRE(test::ThrownKind([] { ParseCommandArgs({"--=x"}); }) ==
            api::ErrorKind::InvalidArgument);
}

TEST_CASE("CommandRunner - registry", "[cli][commands]") {
    CommandRunner runner(NoProvider);
    REQUIRE(runner.HasCommand("subnet parse"));
    REQUIRE(runner.HasCommand("crossmsg topdown-msgs"));
    REQUIRE_FALSE(runner.HasCommand("subnet kill"));
    REQUIRE(runner.CommandNames().size() == 8);

    try {
        runner.Execute("wallet new", {});
        FAIL("expected unknown command");
    } catch (const api::Error& e) {
        REQUIRE(e.kind() == api::ErrorKind::InvalidArgument);
        REQUIRE(std::string(e.what()) == "unknown command: wallet new");
    }
}

TEST_CASE("CommandRunner - subnet parse works offline", "[cli][commands]") {
    CommandRunner runner(NoProvider);

    SECTION("Subnet id") {
        json out = runner.Execute("subnet parse", ParseCommandArgs({"/r123/f01001"}));
        REQUIRE(out["id"] == "/r123/f01001");
        REQUIRE(out["network_type"] == "account");
        REQUIRE(out["root_network_type"] == "account");
        REQUIRE(out["root_id"] == 123);
        REQUIRE(out["children"] == json::array({"f01001"}));
        REQUIRE(out["chain_id"] == 1011873294913613ULL);
        REQUIRE(out["subnet_actor"] == "f01001");
        REQUIRE(out["parent"] == "/r123");
        REQUIRE(out["universal_id"] == "/eip155:123/f01001");
    }

    SECTION("Root has no parent") {
        json out = runner.Execute("subnet parse", ParseCommandArgs({"--id=/r314159"}));
        REQUIRE(out["parent"].is_null());
        REQUIRE(out["chain_id"] == 314159);
        REQUIRE(out["subnet_actor"] == "f00");
    }

    SECTION("Universal eip155 id") {
        json out = runner.Execute("subnet parse", ParseCommandArgs({"/eip155:123/f01001"}));
        REQUIRE(out["chain"] == "eip155:123");
        REQUIRE(out["root_network_type"] == "account");
        REQUIRE(out["parent"] == "/eip155:123");
        REQUIRE(out["subnet"]["id"] == "/r123/f01001");
    }

    SECTION("Universal bip122 id") {
        json out = runner.Execute(
            "subnet parse", ParseCommandArgs({"/bip122:000000000933ea01ad0ee984209779ba/child"}));
        REQUIRE(out["root_network_type"] == "utxo");
        REQUIRE(out["children"] == json::array({"child"}));
        REQUIRE(out["subnet"].is_null());
    }

    SECTION("Malformed ids") {
        REQUIRE(test::ThrownKind([&] {
                    runner.Execute("subnet parse", ParseCommandArgs({"/x1"}));
                }) == api::ErrorKind::MalformedIdentifier);
        REQUIRE(test::ThrownKind([&] { runner.Execute("subnet parse", ParseCommandArgs({})); }) ==
                api::ErrorKind::InvalidArgument);
    }
}

TEST_CASE("CommandRunner - subnet create", "[cli][commands]") {
    CliFixture f;

    SECTION("Account parent") {
        json out = f.Run("subnet create", {"--parent=/r314159", "--min-validators=2",
                                           "--min-validator-stake=1000",
                                           "--bottomup-check-period=30",
                                           "--permission-mode=federated"});
        REQUIRE(out["subnet_actor"] == "f01001");
        REQUIRE(out["subnet_id"] == "/r314159/f01001");
        REQUIRE(f.caller->last_from == api::Address::NewId(100));
    }

    SECTION("Bad option values") {
        std::vector<std::string> base = {"--parent=/r314159", "--min-validators=2",
                                         "--min-validator-stake=1000", "--bottomup-check-period=30"};
        auto with = [&](const std::string& extra) {
            auto words = base;
            words.push_back(extra);
            return words;
        };
        REQUIRE(test::ThrownKind([&] { f.Run("subnet create", with("--permission-mode=open")); }) ==
                api::ErrorKind::InvalidArgument);
        REQUIRE(test::ThrownKind([&] { f.Run("subnet create", with("--majority-percentage=300")); }) ==
                api::ErrorKind::InvalidArgument);
        REQUIRE(test::ThrownKind([&] { f.Run("subnet create", with("--min-validators=-1")); }) ==
                api::ErrorKind::InvalidArgument);
        REQUIRE(f.caller->calls.empty());
    }

    SECTION("Utxo parent") {
        f.node->QueueResult({{"subnet_id", kChildHex}});
        json out = f.Run("subnet create", {"--parent=/b1", "--min-validators=1",
                                           "--min-validator-stake=5000",
                                           "--bottomup-check-period=10",
                                           "--min-cross-msg-fee=3",
                                           "--whitelist=" + std::string(64, '1') + "," +
                                               std::string(64, '2')});
        REQUIRE(out["subnet_id"] == api::SubnetID::NewUtxo(1, kChildHex).ToString());
        const json& sent = f.node->LastParams();
        REQUIRE(sent["min_cross_msg_fee"] == 3);
        REQUIRE(sent["whitelist"].size() == 2);
    }
}

TEST_CASE("CommandRunner - join and funds", "[cli][commands]") {
    CliFixture f;

    SECTION("Join an account subnet") {
        json out = f.Run("subnet join", {"--subnet=/r314159/f01001", "--collateral=10",
                                         "--public-key=0401"});
        REQUIRE(out == json{{"subnet_id", "/r314159/f01001"}, {"epoch", 100}});
        REQUIRE(f.caller->last_public_key == std::vector<uint8_t>{0x04, 0x01});
    }

    SECTION("Join a utxo subnet needs its extra options") {
        const std::string subnet = "--subnet=" + api::SubnetID::NewUtxo(1, kChildHex).ToString();
        REQUIRE(test::ThrownKind([&] {
                    f.Run("subnet join", {subnet, "--collateral=10", "--public-key=02aa"});
                }) == api::ErrorKind::InvalidArgument);

        f.node->QueueResult({{"join_txid", "ab"}, {"block_height", 55}});
        json out = f.Run("subnet join", {subnet, "--collateral=10", "--public-key=02aa",
                                         "--ip=10.0.0.1:3030", "--backup-address=tb1qx"});
        REQUIRE(out["epoch"] == 55);
    }

    SECTION("Fund") {
        json out = f.Run("crossmsg fund", {"--subnet=/r314159/f01001", "--to=f0300",
                                           "--amount=1000000000000000000"});
        REQUIRE(out["epoch"] == 100);
        REQUIRE(f.caller->last_to == api::Address::NewId(300));
        REQUIRE(f.caller->last_amount == api::TokenAmount::FromWhole(1));
    }

    SECTION("Amounts must be integers") {
        REQUIRE(test::ThrownKind([&] {
                    f.Run("crossmsg fund", {"--subnet=/r314159/f01001", "--amount=1.5"});
                }) == api::ErrorKind::InvalidArgument);
    }

    SECTION("Pre-fund") {
        json out = f.Run("crossmsg pre-fund", {"--subnet=/r314159/f01001", "--amount=7"});
        REQUIRE(out["status"] == "ok");
        REQUIRE(f.caller->Called("pre_fund"));
    }
}

TEST_CASE("CommandRunner - queries", "[cli][commands]") {
    CliFixture f;

    SECTION("Genesis info") {
        f.caller->genesis.genesis_epoch = 12;
        f.caller->genesis.validators = {
            {api::Address::NewId(11), {0x02, 0x03}, api::TokenAmount::FromAtto(9)}};
        json out = f.Run("subnet genesis-info", {"/r314159/f01001"});
        REQUIRE(out["genesis_epoch"] == 12);
        REQUIRE(out["permission_mode"] == "collateral");
        REQUIRE(out["supply_source"]["kind"] == "native");
        REQUIRE(out["validators"][0] ==
                json{{"address", "f011"}, {"public_key", "0203"}, {"weight", "9"}});
    }

    SECTION("List children") {
        api::SubnetInfo info;
        info.id = api::SubnetID::FromString("/r314159/f01001");
        info.stake = api::TokenAmount::FromAtto(20);
        f.caller->subnets = {info};
        json out = f.Run("subnet list", {"--parent=/r314159"});
        REQUIRE(out.size() == 1);
        REQUIRE(out[0]["id"] == "/r314159/f01001");
        REQUIRE(out[0]["stake"] == "20");
    }

    SECTION("Top-down messages") {
        const auto child = api::SubnetID::NewUtxo(1, kChildHex);
        const std::string block_hash = std::string(60, '0') + "beef";
        f.node->QueueResult(json::array(
            {{{"block_hash", block_hash},
              {"kind", "fund"},
              {"msg",
               {{"nonce", 4}, {"value", 250}, {"subnet_id", child.ToString()},
                {"recipient", "f0200"}}}}}));
        json out = f.Run("crossmsg topdown-msgs", {"--subnet=" + child.ToString(), "--epoch=88"});
        REQUIRE(out["block_hash"] == block_hash);
        REQUIRE(out["messages"].size() == 1);
        REQUIRE(out["messages"][0]["kind"] == "transfer");
        REQUIRE(out["messages"][0]["value"] == "250");
        REQUIRE(out["messages"][0]["nonce"] == 4);
        REQUIRE(out["messages"][0]["to"] == child.ToString() + ":f0200");
    }

    SECTION("Negative epochs are rejected") {
        REQUIRE(test::ThrownKind([&] {
                    f.Run("crossmsg topdown-msgs", {"--subnet=/r314159/f01001", "--epoch=-4"});
                }) == api::ErrorKind::InvalidArgument);
    }
}
