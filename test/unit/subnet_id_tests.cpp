// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/error.hpp"
#include "api/subnet_id.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <map>
#include <string>

using namespace ipc::api;
using Catch::Matchers::ContainsSubstring;

namespace {

SubnetID Id(const std::string& s) { return SubnetID::FromString(s); }

const char* BTC_CHILD_HEX =
    "2e87774fe9e002d7afe7bf83158dbf7ab2797ba4bcab4c6561f8b5d335b8d161";

} // namespace

TEST_CASE("SubnetID - parse and print", "[api][subnet_id]") {
    SECTION("Account roots and paths round trip") {
        for (const std::string s : {"/r123", "/r123/f01", "/r314159/f01001/f02000",
                                    "/r0"}) {
            REQUIRE(Id(s).ToString() == s);
        }
    }

    SECTION("UTXO root") {
        SubnetID b = Id("/b1");
        REQUIRE(b.root_network_type() == NetworkType::UtxoChain);
        REQUIRE(b.root_id() == 1u);
        REQUIRE(b.IsRoot());
        REQUIRE(b.ToString() == "/b1");
    }

    SECTION("Children are parsed as addresses") {
        SubnetID id = Id("/r123/f01/f02");
        REQUIRE(id.children().size() == 2);
        REQUIRE(id.children()[0] == Address::NewId(1));
        REQUIRE(id.children()[1] == Address::NewId(2));
    }

    SECTION("Malformed ids") {
        REQUIRE_THROWS_AS(Id(""), InvalidIdError);
        REQUIRE_THROWS_AS(Id("r123"), InvalidIdError);
        REQUIRE_THROWS_AS(Id("/x123"), InvalidIdError);
        REQUIRE_THROWS_AS(Id("/r"), InvalidIdError);
        REQUIRE_THROWS_AS(Id("/rabc"), InvalidIdError);
        REQUIRE_THROWS_AS(Id("/r123/"), InvalidIdError);
        REQUIRE_THROWS_AS(Id("/r123//f01"), InvalidIdError);
        REQUIRE_THROWS_AS(Id("/b0"), InvalidIdError);
    }

    SECTION("Child address on the wrong network") {
        const std::string text = "/r31415926/t2xwzbdu7z5sam6hc57xxwkctciuaz7oe5omipwbq";
        REQUIRE_THROWS_WITH(Id(text), ContainsSubstring("invalid child") &&
                                          ContainsSubstring("t2xwzbdu7z5sam6hc57xxwkctciuaz7oe5omipwbq") &&
                                          ContainsSubstring("network"));
    }

    SECTION("Error names the raw id") {
        try {
            Id("/r12x");
            FAIL("expected InvalidIdError");
        } catch (const InvalidIdError& e) {
            REQUIRE(e.raw() == "/r12x");
            REQUIRE(e.reason() == "invalid root ID");
        }
    }
}

TEST_CASE("SubnetID - UTXO subnets", "[api][subnet_id]") {
    SubnetID id = SubnetID::NewUtxo(1, BTC_CHILD_HEX);

    REQUIRE(id.root_network_type() == NetworkType::UtxoChain);
    REQUIRE(id.ToString() ==
            "/b1/f420ff2dxot7j4abnpl7hx6brldn7pkzhs65exsvuyzlb7c25gnny2fqtl4mwbe");
    REQUIRE(Id(id.ToString()) == id);
    REQUIRE(id.SubnetActor().delegated_namespace() == UTXO_NAMESPACE);
    REQUIRE(id.ParentNetworkType() == NetworkType::UtxoChain);
    REQUIRE(id.GetNetworkType() == NetworkType::AccountChain);

    REQUIRE_THROWS_AS(SubnetID::NewUtxo(0, BTC_CHILD_HEX), InvalidIdError);
    REQUIRE_THROWS_AS(SubnetID::NewUtxo(1, "xyz"), InvalidIdError);
    REQUIRE_THROWS_AS(SubnetID::NewUtxo(1, ""), InvalidIdError);
    REQUIRE_THROWS_AS(SubnetID::NewUtxo(1, std::string(110, 'a')), InvalidIdError);
}

TEST_CASE("SubnetID - structure queries", "[api][subnet_id]") {
    SECTION("Parent") {
        REQUIRE(Id("/r123/f01/f02").Parent() == Id("/r123/f01"));
        REQUIRE(Id("/r123/f01").Parent() == Id("/r123"));
        REQUIRE_FALSE(Id("/r123").Parent().has_value());
    }

    SECTION("Subnet actor") {
        REQUIRE(Id("/r123/f01/f02").SubnetActor() == Address::NewId(2));
        REQUIRE(Id("/r123").SubnetActor() == Address::NewId(0));
    }

    SECTION("Network types by depth") {
        REQUIRE_FALSE(Id("/b1").ParentNetworkType().has_value());
        REQUIRE(Id("/b1").GetNetworkType() == NetworkType::UtxoChain);
        REQUIRE(Id("/r1/f01").ParentNetworkType() == NetworkType::AccountChain);
        REQUIRE(Id("/r1/f01/f02").ParentNetworkType() == NetworkType::AccountChain);
    }

    SECTION("Undefined sentinel") {
        REQUIRE(SubnetID().IsUndefined());
        REQUIRE(Id("/r0").IsUndefined());
        REQUIRE_FALSE(Id("/r1").IsUndefined());
    }

    SECTION("NewFromParent") {
        SubnetID child = SubnetID::NewFromParent(Id("/b2"), Address::NewId(7));
        REQUIRE(child.ToString() == "/b2/f07");
        REQUIRE(child.Parent() == Id("/b2"));
    }
}

TEST_CASE("SubnetID - chain id", "[api][subnet_id]") {
    REQUIRE(Id("/r123").ChainId() == 123u);
    REQUIRE(Id("/r123/f01001").ChainId() == 1011873294913613ULL);
    REQUIRE(Id("/r123/f01001").ChainId() < MAX_CHAIN_ID);
    REQUIRE(Id("/r123/f01001").ChainId() != Id("/r123/f01002").ChainId());
}

TEST_CASE("SubnetID - common parent", "[api][subnet_id]") {
    auto check = [](const std::string& a, const std::string& b,
                    const std::string& parent, size_t len) {
        auto common = Id(a).CommonParent(Id(b));
        REQUIRE(common.has_value());
        REQUIRE(common->first == len);
        REQUIRE(common->second == Id(parent));
    };

    check("/r123/f01", "/r123/f01/f02", "/r123/f01", 1);
    check("/r123/f01/f02/f03", "/r123/f01/f02", "/r123/f01/f02", 2);
    check("/r123/f01/f03/f04", "/r123/f02/f03/f04", "/r123", 0);
    check("/r123/f01/f03/f04", "/r123/f01/f03/f04/f05", "/r123/f01/f03/f04", 3);
    check("/r123/f01/f03/f04", "/r123/f01/f03/f04", "/r123/f01/f03/f04", 3);

    REQUIRE_FALSE(Id("/r123/f01").CommonParent(Id("/r456/f01")).has_value());
    // Same root value, different ecosystem
    REQUIRE_FALSE(Id("/r1/f01").CommonParent(Id("/b1/f01")).has_value());
}

TEST_CASE("SubnetID - down", "[api][subnet_id]") {
    REQUIRE(Id("/r123/f01/f02/f03").Down(Id("/r123/f01")) == Id("/r123/f01/f02"));
    REQUIRE(Id("/r123/f01/f02/f03").Down(Id("/r123/f01/f02")) == Id("/r123/f01/f02/f03"));
    REQUIRE(Id("/r123/f01/f03/f04").Down(Id("/r123/f01/f03")) == Id("/r123/f01/f03/f04"));

    REQUIRE_FALSE(Id("/r123").Down(Id("/r123/f01")).has_value());
    REQUIRE_FALSE(Id("/r123/f01").Down(Id("/r123/f01")).has_value());
    REQUIRE_FALSE(Id("/r123/f02/f03").Down(Id("/r123/f01/f03/f04")).has_value());
    REQUIRE_FALSE(Id("/r123/f01/f02").Down(Id("/r456")).has_value());
}

TEST_CASE("SubnetID - up", "[api][subnet_id]") {
    REQUIRE(Id("/r123/f01/f02/f03").Up(Id("/r123/f01")) == Id("/r123"));
    REQUIRE(Id("/r123/f01/f02/f03").Up(Id("/r123/f01/f02")) == Id("/r123/f01"));
    REQUIRE(Id("/r123/f01/f02/f03").Up(Id("/r123/f01/f02/f03")) == Id("/r123/f01/f02"));

    REQUIRE_FALSE(Id("/r123").Up(Id("/r123/f01")).has_value());
    REQUIRE_FALSE(Id("/r123/f02/f03").Up(Id("/r123/f01/f03/f04")).has_value());
    REQUIRE_FALSE(Id("/r123/f01").Up(Id("/r456/f01")).has_value());

    SECTION("No step above the root") {
        REQUIRE(ipc::test::ThrownKind([] { Id("/r123/f01").Up(Id("/r123/f02")); }) ==
                ErrorKind::InvalidArgument);
    }
}

TEST_CASE("SubnetID - ordering for map keys", "[api][subnet_id]") {
    std::map<SubnetID, int> m;
    m[Id("/r2")] = 1;
    m[Id("/r1/f02")] = 2;
    m[Id("/r1/f01")] = 3;
    m[Id("/b1")] = 4;
    m[Id("/r1/f01")] = 5;

    REQUIRE(m.size() == 4);
    auto it = m.begin();
    REQUIRE(it->first == Id("/r1/f01"));
    REQUIRE(it->second == 5);
    REQUIRE((++it)->first == Id("/r1/f02"));
    REQUIRE((++it)->first == Id("/r2"));
    REQUIRE((++it)->first == Id("/b1"));
}
