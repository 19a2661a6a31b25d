// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/error.hpp"
#include "provider/utxo_subnet_manager.hpp"
#include "rpc/mock_http_transport.hpp"
#include "test_helpers.hpp"
#include "util/string_parsing.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <limits>
#include <string>

using namespace ipc;
using namespace ipc::provider;
using Catch::Matchers::ContainsSubstring;
using json = nlohmann::json;

namespace {

const std::string kChildHex(64, 'a');
const std::string kPubkey = "02" + std::string(64, 'b');
const std::string kBlockHash = std::string(62, '0') + "2a";

struct UtxoFixture {
    std::shared_ptr<test::MockHttpState> state = std::make_shared<test::MockHttpState>();
    api::SubnetID root = api::SubnetID::FromString("/b1");
    api::SubnetID child = api::SubnetID::NewUtxo(1, kChildHex);
    UtxoSubnetManager manager{root, std::make_unique<test::MockHttpTransport>(state)};
};

api::UtxoConstructParams CreateParams(const api::SubnetID& parent) {
    api::UtxoConstructParams params;
    params.parent = parent;
    params.min_validators = 3;
    params.min_validator_stake = api::TokenAmount::FromAtto(100000);
    params.bottomup_check_period = 10;
    params.active_validators_limit = 50;
    params.min_cross_msg_fee = api::TokenAmount::FromAtto(10);
    params.validator_whitelist = {std::string(64, 'C')};
    return params;
}

json GenesisResult() {
    return {{"bootstrapped", true},
            {"genesis_block_height", 812},
            {"create_subnet_msg",
             {{"active_validators_limit", 50},
              {"bottomup_check_period", 10},
              {"min_validator_stake", 100000}}},
            {"genesis_validators",
             json::array({{{"address", "f0101"}, {"weight", 5000}, {"pubkey", kPubkey}},
                          {{"address", "f0102"}, {"weight", 7000}, {"pubkey", kPubkey}}})},
            {"genesis_balances", {{"f0103", 250}}}};
}

json FundEntry(uint64_t nonce, const std::string& subnet, const std::string& block_hash) {
    return {{"block_hash", block_hash},
            {"kind", "fund"},
            {"msg",
             {{"nonce", nonce}, {"value", 1000 + nonce}, {"subnet_id", subnet},
              {"recipient", "f0200"}}}};
}

} // namespace

TEST_CASE("UtxoSubnetManager - create subnet", "[provider][utxo]") {
    UtxoFixture f;

    SECTION("Request fields and returned actor") {
        f.state->QueueResult({{"subnet_id", kChildHex}});
        api::Address actor = f.manager.create_subnet(api::Address::NewId(0), CreateParams(f.root));

        REQUIRE(actor == f.child.SubnetActor());
        REQUIRE(f.state->LastMethod() == "createsubnet");
        const json& params = f.state->LastParams();
        REQUIRE(params["min_validator_stake"] == 100000);
        REQUIRE(params["min_validators"] == 3);
        REQUIRE(params["bottomup_check_period"] == 10);
        REQUIRE(params["active_validators_limit"] == 50);
        REQUIRE(params["min_cross_msg_fee"] == 10);
        REQUIRE(params["whitelist"] == json::array({std::string(64, 'c')}));
    }

    SECTION("Account parameters are rejected before sending") {
        api::AccountConstructParams params;
        params.parent = f.root;
        REQUIRE(test::ThrownKind([&] {
                    f.manager.create_subnet(api::Address::NewId(0), params);
                }) == api::ErrorKind::UnsupportedConversion);
        REQUIRE(f.state->requests.empty());
    }

    SECTION("Parent must be the connected subnet") {
        REQUIRE(test::ThrownKind([&] {
                    f.manager.create_subnet(api::Address::NewId(0),
                                            CreateParams(api::SubnetID::FromString("/b2")));
                }) == api::ErrorKind::InvalidArgument);
        REQUIRE(f.state->requests.empty());
    }

    SECTION("Local parameter checks") {
        auto params = CreateParams(f.root);
        params.active_validators_limit = 0;
        REQUIRE(test::ThrownKind([&] { f.manager.create_subnet(api::Address::NewId(0), params); }) ==
                api::ErrorKind::InvalidArgument);

        params = CreateParams(f.root);
        params.validator_whitelist = {"abcd"};
        REQUIRE(test::ThrownKind([&] { f.manager.create_subnet(api::Address::NewId(0), params); }) ==
                api::ErrorKind::InvalidArgument);

        params = CreateParams(f.root);
        params.min_validator_stake = api::TokenAmount();
        REQUIRE(test::ThrownKind([&] { f.manager.create_subnet(api::Address::NewId(0), params); }) ==
                api::ErrorKind::InvalidArgument);

        params = CreateParams(f.root);
        params.min_validator_stake = api::TokenAmount::FromWhole(100);
        REQUIRE(test::ThrownKind([&] { f.manager.create_subnet(api::Address::NewId(0), params); }) ==
                api::ErrorKind::InvalidArgument);

        REQUIRE(f.state->requests.empty());
    }

    SECTION("Non-hex subnet id in the result") {
        f.state->QueueResult({{"subnet_id", "zz"}});
        try {
            f.manager.create_subnet(api::Address::NewId(0), CreateParams(f.root));
            FAIL("expected ResponseShapeError");
        } catch (const api::ResponseShapeError& e) {
            REQUIRE(e.field_path() == "result.subnet_id");
        }
    }

    SECTION("Node errors surface as protocol errors") {
        f.state->QueueError(-1, "insufficient funds");
        REQUIRE(test::ThrownKind([&] {
                    f.manager.create_subnet(api::Address::NewId(0), CreateParams(f.root));
                }) == api::ErrorKind::ProtocolError);
    }
}

TEST_CASE("UtxoSubnetManager - join, pre-fund and fund", "[provider][utxo]") {
    UtxoFixture f;

    SECTION("Join") {
        api::UtxoJoinParams params;
        params.collateral = api::TokenAmount::FromAtto(150000);
        params.ip = "10.0.0.1:3030";
        params.backup_address = "tb1qbackup";
        params.public_key = *util::ParseHex(kPubkey);

        f.state->QueueResult({{"join_txid", "ab"}, {"block_height", 900}});
        REQUIRE(f.manager.join_subnet(f.child, api::Address::NewId(0), params) == 900);

        REQUIRE(f.state->LastMethod() == "joinsubnet");
        const json& sent = f.state->LastParams();
        REQUIRE(sent["subnet_id"] == kChildHex);
        REQUIRE(sent["collateral"] == 150000);
        REQUIRE(sent["ip"] == "10.0.0.1:3030");
        REQUIRE(sent["backup_address"] == "tb1qbackup");
        REQUIRE(sent["pubkey"] == kPubkey);
    }

    SECTION("Join without an ip") {
        api::UtxoJoinParams params;
        params.collateral = api::TokenAmount::FromAtto(1);
        params.public_key = {2, 3};
        REQUIRE(test::ThrownKind([&] {
                    f.manager.join_subnet(f.child, api::Address::NewId(0), params);
                }) == api::ErrorKind::InvalidArgument);
    }

    SECTION("Join with account parameters") {
        api::AccountJoinParams params;
        params.collateral = api::TokenAmount::FromAtto(1);
        REQUIRE(test::ThrownKind([&] {
                    f.manager.join_subnet(f.child, api::Address::NewId(0), params);
                }) == api::ErrorKind::UnsupportedConversion);
    }

    SECTION("Pre-fund") {
        f.state->QueueResult({{"prefund_txid", "cd"}});
        f.manager.pre_fund(f.child, api::Address::NewId(300), api::TokenAmount::FromAtto(42));
        REQUIRE(f.state->LastMethod() == "prefundsubnet");
        REQUIRE(f.state->LastParams() ==
                json{{"subnet_id", kChildHex}, {"address", "f0300"}, {"amount", 42}});
    }

    SECTION("Fund pays the recipient") {
        f.state->QueueResult({{"fund_txid", "ef"}, {"block_height", 77}});
        ChainEpoch epoch = f.manager.fund(f.child, api::Address(), api::Address::NewId(0),
                                          api::Address::NewId(301), api::TokenAmount::FromAtto(5));
        REQUIRE(epoch == 77);
        REQUIRE(f.state->LastMethod() == "fundsubnet");
        REQUIRE(f.state->LastParams()["address"] == "f0301");
    }

    SECTION("Missing txid in the result") {
        f.state->QueueResult({{"block_height", 77}});
        try {
            f.manager.fund(f.child, api::Address(), api::Address::NewId(0),
                           api::Address::NewId(301), api::TokenAmount::FromAtto(5));
            FAIL("expected ResponseShapeError");
        } catch (const api::ResponseShapeError& e) {
            REQUIRE(e.field_path() == "result.fund_txid");
        }
    }

    SECTION("Subnets that are not direct children") {
        auto grandchild = api::SubnetID::NewFromParent(f.child, api::Address::NewId(1001));
        REQUIRE(test::ThrownKind([&] {
                    f.manager.pre_fund(grandchild, api::Address::NewId(1),
                                       api::TokenAmount::FromAtto(1));
                }) == api::ErrorKind::InvalidArgument);
        REQUIRE(test::ThrownKind([&] {
                    f.manager.pre_fund(f.root, api::Address::NewId(1), api::TokenAmount::FromAtto(1));
                }) == api::ErrorKind::InvalidArgument);

        auto not_utxo = api::SubnetID::NewFromParent(f.root, api::Address::NewId(1001));
        REQUIRE(test::ThrownKind([&] {
                    f.manager.pre_fund(not_utxo, api::Address::NewId(1), api::TokenAmount::FromAtto(1));
                }) == api::ErrorKind::InvalidArgument);
        REQUIRE(f.state->requests.empty());
    }
}

TEST_CASE("UtxoSubnetManager - genesis info", "[provider][utxo]") {
    UtxoFixture f;

    SECTION("Complete result") {
        f.state->QueueResult(GenesisResult());
        api::SubnetGenesisInfo info = f.manager.get_genesis_info(f.child);

        REQUIRE(f.state->LastMethod() == "getgenesisinfo");
        REQUIRE(f.state->LastParams() == json{{"subnet_id", kChildHex}});
        REQUIRE(info.active_validators_limit == 50);
        REQUIRE(info.bottom_up_checkpoint_period == 10);
        REQUIRE(info.genesis_epoch == 812);
        REQUIRE(info.majority_percentage == UtxoSubnetManager::MAJORITY_PERCENTAGE);
        REQUIRE(info.min_collateral == api::TokenAmount::FromAtto(100000));
        REQUIRE(info.permission_mode == api::PermissionMode::Collateral);
        REQUIRE(info.supply_source == api::Asset::Native());
        REQUIRE(info.validators.size() == 2);
        REQUIRE(info.validators[0].addr == api::Address::NewId(101));
        REQUIRE(info.validators[0].weight == api::TokenAmount::FromAtto(5000));
        REQUIRE(util::HexStr(info.validators[0].metadata) == kPubkey);
        REQUIRE(info.genesis_balances.size() == 1);
        REQUIRE(info.genesis_balances.at(api::Address::NewId(103)) == api::TokenAmount::FromAtto(250));
    }

    SECTION("Malformed validator entries are dropped") {
        json result = GenesisResult();
        result["genesis_validators"][0]["pubkey"] = "";
        result["genesis_validators"].push_back({{"address", "nope"}, {"weight", 1}, {"pubkey", kPubkey}});
        f.state->QueueResult(result);

        api::SubnetGenesisInfo info = f.manager.get_genesis_info(f.child);
        REQUIRE(info.validators.size() == 1);
        REQUIRE(info.validators[0].addr == api::Address::NewId(102));
    }

    SECTION("Genesis balances are optional") {
        json result = GenesisResult();
        result.erase("genesis_balances");
        f.state->QueueResult(result);
        REQUIRE(f.manager.get_genesis_info(f.child).genesis_balances.empty());
    }

    SECTION("Bad balance entries fail the query") {
        json result = GenesisResult();
        result["genesis_balances"]["f0104"] = -3;
        f.state->QueueResult(result);
        try {
            f.manager.get_genesis_info(f.child);
            FAIL("expected ResponseShapeError");
        } catch (const api::ResponseShapeError& e) {
            REQUIRE(e.field_path() == "result.genesis_balances.f0104");
        }
    }

    SECTION("Validator limit beyond 16 bits") {
        json result = GenesisResult();
        result["create_subnet_msg"]["active_validators_limit"] = 70000;
        f.state->QueueResult(result);
        try {
            f.manager.get_genesis_info(f.child);
            FAIL("expected ResponseShapeError");
        } catch (const api::ResponseShapeError& e) {
            REQUIRE(e.field_path() == "result.create_subnet_msg.active_validators_limit");
        }
    }

    SECTION("Subnet not bootstrapped") {
        f.state->QueueResult({{"bootstrapped", false}});
        try {
            f.manager.get_genesis_info(f.child);
            FAIL("expected InvalidState");
        } catch (const api::Error& e) {
            REQUIRE(e.kind() == api::ErrorKind::InvalidState);
            REQUIRE_THAT(std::string(e.what()), ContainsSubstring("is not bootstrapped"));
        }
    }

    SECTION("Genesis epoch") {
        f.state->QueueResult(GenesisResult());
        REQUIRE(f.manager.genesis_epoch(f.child) == 812);
    }
}

TEST_CASE("UtxoSubnetManager - top-down messages", "[provider][utxo]") {
    UtxoFixture f;
    const std::string dest = f.child.ToString();

    SECTION("One batch from one block") {
        f.state->QueueResult(json::array({FundEntry(0, dest, kBlockHash), FundEntry(1, dest, kBlockHash)}));
        auto payload = f.manager.get_top_down_msgs(f.child, 900);

        REQUIRE(f.state->LastMethod() == "getrootnetmessages");
        REQUIRE(f.state->LastParams() == json{{"subnet_id", kChildHex}, {"block_height", 900}});
        REQUIRE(util::HexStr(payload.block_hash) == kBlockHash);
        REQUIRE(payload.value.size() == 2);

        const api::IpcEnvelope& first = payload.value[0];
        REQUIRE(first.kind == api::IpcMsgKind::Transfer);
        REQUIRE(first.from.subnet == f.root);
        REQUIRE(first.from.raw_address == api::Address::NewId(0));
        REQUIRE(first.to.subnet == f.child);
        REQUIRE(first.to.raw_address == api::Address::NewId(200));
        REQUIRE(first.value == api::TokenAmount::FromAtto(1000));
        REQUIRE(first.message.empty());
        REQUIRE(first.nonce == 0);
        REQUIRE(payload.value[1].nonce == 1);
        REQUIRE(first.ApplyType(f.root) == api::IpcMsgType::TopDown);
    }

    SECTION("Empty batch") {
        f.state->QueueResult(json::array());
        auto payload = f.manager.get_top_down_msgs(f.child, 901);
        REQUIRE(payload.value.empty());
        REQUIRE(payload.block_hash.empty());
    }

    SECTION("Entries from different blocks") {
        std::string other_hash = std::string(62, '0') + "2b";
        f.state->QueueResult(json::array({FundEntry(0, dest, kBlockHash), FundEntry(1, dest, other_hash)}));
        try {
            f.manager.get_top_down_msgs(f.child, 900);
            FAIL("expected ResponseShapeError");
        } catch (const api::ResponseShapeError& e) {
            REQUIRE(e.field_path() == "result[1].block_hash");
        }
    }

    SECTION("Unknown message kind") {
        json entry = FundEntry(0, dest, kBlockHash);
        entry["kind"] = "release";
        f.state->QueueResult(json::array({entry}));
        try {
            f.manager.get_top_down_msgs(f.child, 900);
            FAIL("expected ResponseShapeError");
        } catch (const api::ResponseShapeError& e) {
            REQUIRE(e.field_path() == "result[0].kind");
        }
    }

    SECTION("Entries for another subnet") {
        api::SubnetID sibling = api::SubnetID::NewUtxo(1, std::string(64, 'b'));
        f.state->QueueResult(json::array({FundEntry(0, dest, kBlockHash),
                                          FundEntry(1, sibling.ToString(), kBlockHash)}));
        try {
            f.manager.get_top_down_msgs(f.child, 900);
            FAIL("expected ResponseShapeError");
        } catch (const api::ResponseShapeError& e) {
            REQUIRE(e.field_path() == "result[1].msg.subnet_id");
            REQUIRE_THAT(std::string(e.what()), ContainsSubstring(sibling.ToString()));
        }
    }

    SECTION("Block hash must be 32 bytes") {
        SECTION("Empty") {
            f.state->QueueResult(json::array({FundEntry(0, dest, "")}));
        }
        SECTION("Short") {
            f.state->QueueResult(json::array({FundEntry(0, dest, "00ff")}));
        }
        try {
            f.manager.get_top_down_msgs(f.child, 900);
            FAIL("expected ResponseShapeError");
        } catch (const api::ResponseShapeError& e) {
            REQUIRE(e.field_path() == "result[0].block_hash");
        }
    }

    SECTION("Destination must be below a root") {
        f.state->QueueResult(json::array({FundEntry(0, "/b1", kBlockHash)}));
        REQUIRE(test::ThrownKind([&] { f.manager.get_top_down_msgs(f.child, 900); }) ==
                api::ErrorKind::ResponseShapeError);
    }

    SECTION("Result must be an array") {
        f.state->QueueResult(json::object());
        REQUIRE(test::ThrownKind([&] { f.manager.get_top_down_msgs(f.child, 900); }) ==
                api::ErrorKind::ResponseShapeError);
    }

    SECTION("Negative epoch") {
        REQUIRE(test::ThrownKind([&] { f.manager.get_top_down_msgs(f.child, -1); }) ==
                api::ErrorKind::InvalidArgument);
        REQUIRE(f.state->requests.empty());
    }
}

TEST_CASE("UtxoSubnetManager - operations without a node method", "[provider][utxo]") {
    UtxoFixture f;
    const api::Address from = api::Address::NewId(0);
    const api::TokenAmount one = api::TokenAmount::FromAtto(1);

    REQUIRE(test::ThrownKind([&] { f.manager.stake(f.child, from, one); }) ==
            api::ErrorKind::UnsupportedOperation);
    REQUIRE(test::ThrownKind([&] { f.manager.leave_subnet(f.child, from); }) ==
            api::ErrorKind::UnsupportedOperation);
    REQUIRE(test::ThrownKind([&] { f.manager.list_child_subnets(from); }) ==
            api::ErrorKind::UnsupportedOperation);
    REQUIRE(test::ThrownKind([&] { f.manager.release(from, from, from, one); }) ==
            api::ErrorKind::UnsupportedOperation);
    REQUIRE(test::ThrownKind([&] { f.manager.wallet_balance(from); }) ==
            api::ErrorKind::UnsupportedOperation);
    REQUIRE(test::ThrownKind([&] { f.manager.chain_head_height(); }) ==
            api::ErrorKind::UnsupportedOperation);
    REQUIRE(test::ThrownKind([&] { f.manager.checkpoint_bundle_at(10); }) ==
            api::ErrorKind::UnsupportedOperation);
    REQUIRE(test::ThrownKind([&] { f.manager.query_reward_claims(from, 0, 10); }) ==
            api::ErrorKind::UnsupportedOperation);
    REQUIRE(f.state->requests.empty());

    REQUIRE(f.manager.network_type() == api::NetworkType::UtxoChain);
    REQUIRE(f.manager.get_chain_id() == "1");
    REQUIRE(f.manager.get_subnet_supply_source(f.child) == api::Asset::Native());
    REQUIRE(f.manager.get_subnet_collateral_source(f.child) == api::Asset::Native());
}
