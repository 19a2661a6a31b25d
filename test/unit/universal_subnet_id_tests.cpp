// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/error.hpp"
#include "api/universal_subnet_id.hpp"
#include "test_helpers.hpp"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <string>

using namespace ipc::api;
using Catch::Matchers::ContainsSubstring;

namespace {

const char* BIP122_GENESIS =
    "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f";

} // namespace

TEST_CASE("UniversalSubnetId - parse and print", "[api][universal_subnet_id]") {
    SECTION("eip155 path round trips") {
        auto id = UniversalSubnetId::FromString("/eip155:123/f01001/f02000");
        REQUIRE(id.root().name_space == "eip155");
        REQUIRE(id.root().reference == "123");
        REQUIRE(id.children() == std::vector<std::string>{"f01001", "f02000"});
        REQUIRE(id.ToString() == "/eip155:123/f01001/f02000");
    }

    SECTION("bip122 with a long reference") {
        std::string text = std::string("/bip122:") + BIP122_GENESIS + "/child";
        auto id = UniversalSubnetId::FromString(text);
        REQUIRE(id.root().reference == BIP122_GENESIS);
        REQUIRE(id.ToString() == text);
        REQUIRE(id.RootNetworkType() == NetworkType::UtxoChain);
    }

    SECTION("Malformed ids") {
        for (const std::string bad : {"invalid", "", "invalid:chain:id", "/eip155",
                                      "/", "/:1", "/eip155:", "/eip155:1//x",
                                      "/eip155:1/", "/a:b:c"}) {
            INFO(bad);
            REQUIRE_THROWS_AS(UniversalSubnetId::FromString(bad), InvalidIdError);
        }
    }

    SECTION("Default is the eip155:0 root") {
        REQUIRE(UniversalSubnetId().ToString() == "/eip155:0");
        REQUIRE(UniversalSubnetId().IsRoot());
    }
}

TEST_CASE("UniversalSubnetId - conversion to SubnetID", "[api][universal_subnet_id]") {
    SECTION("eip155 converts both ways") {
        auto id = UniversalSubnetId::FromString("/eip155:123/f01001/f02000");
        SubnetID subnet = id.ToSubnetId();
        REQUIRE(subnet.ToString() == "/r123/f01001/f02000");
        REQUIRE(UniversalSubnetId::FromSubnetId(subnet) == id);
    }

    SECTION("Other namespaces cannot convert") {
        auto id = UniversalSubnetId::FromString(std::string("/bip122:") + BIP122_GENESIS);
        REQUIRE_THROWS_WITH(id.ToSubnetId(),
                            ContainsSubstring("only eip155 namespace can be converted to SubnetID"));
        REQUIRE(ipc::test::ThrownKind([&] { id.ToSubnetId(); }) ==
                ErrorKind::UnsupportedConversion);
    }

    SECTION("Non-numeric reference") {
        auto id = UniversalSubnetId::FromString("/eip155:abc/f01");
        REQUIRE_THROWS_AS(id.ToSubnetId(), InvalidIdError);
    }

    SECTION("Child that is not an address") {
        auto id = UniversalSubnetId::FromString("/eip155:1/child1");
        REQUIRE_THROWS_WITH(id.ToSubnetId(), ContainsSubstring("invalid child address child1"));
    }
}

TEST_CASE("UniversalSubnetId - structure queries", "[api][universal_subnet_id]") {
    SECTION("Unknown namespace has no network type") {
        auto id = UniversalSubnetId::FromString("/unknown:123/child1");
        REQUIRE_FALSE(id.RootNetworkType().has_value());
        REQUIRE_FALSE(id.ParentNetworkType().has_value());
    }

    SECTION("Parent and depth rule") {
        auto id = UniversalSubnetId::FromString("/eip155:1/a/b");
        REQUIRE(id.Parent()->ToString() == "/eip155:1/a");
        REQUIRE(id.ParentNetworkType() == NetworkType::AccountChain);
        REQUIRE_FALSE(UniversalSubnetId::FromString("/eip155:1").Parent().has_value());

        auto btc_child = UniversalSubnetId::FromString("/bip122:abc/x");
        REQUIRE(btc_child.ParentNetworkType() == NetworkType::UtxoChain);
    }

    SECTION("NewFromParent") {
        auto root = UniversalSubnetId::NewRoot(Caip2ChainId{"eip155", "5"});
        REQUIRE(UniversalSubnetId::NewFromParent(root, "f01").ToString() == "/eip155:5/f01");
    }
}

TEST_CASE("UniversalSubnetId - construction keeps the text form parseable",
          "[api][universal_subnet_id]") {
    auto root = UniversalSubnetId::FromString("/eip155:1");

    SECTION("Bad children") {
        REQUIRE(ipc::test::ThrownKind([&] { UniversalSubnetId::NewFromParent(root, "a/b"); }) ==
                ErrorKind::InvalidArgument);
        REQUIRE(ipc::test::ThrownKind([&] { UniversalSubnetId::NewFromParent(root, ""); }) ==
                ErrorKind::InvalidArgument);
        REQUIRE(ipc::test::ThrownKind([&] { UniversalSubnetId(Caip2ChainId{"eip155", "1"}, {"f01", "/x"}); }) ==
                ErrorKind::InvalidArgument);
    }

    SECTION("Bad namespace") {
        REQUIRE(ipc::test::ThrownKind([&] { UniversalSubnetId::NewRoot(Caip2ChainId{"", "1"}); }) ==
                ErrorKind::InvalidArgument);
        REQUIRE(ipc::test::ThrownKind([&] { UniversalSubnetId::NewRoot(Caip2ChainId{"eip:155", "1"}); }) ==
                ErrorKind::InvalidArgument);
        REQUIRE(ipc::test::ThrownKind([&] { UniversalSubnetId::NewRoot(Caip2ChainId{"eip/155", "1"}); }) ==
                ErrorKind::InvalidArgument);
    }

    SECTION("Bad reference") {
        REQUIRE(ipc::test::ThrownKind([&] { UniversalSubnetId::NewRoot(Caip2ChainId{"eip155", ""}); }) ==
                ErrorKind::InvalidArgument);
        REQUIRE(ipc::test::ThrownKind([&] { UniversalSubnetId::NewRoot(Caip2ChainId{"eip155", "1:2"}); }) ==
                ErrorKind::InvalidArgument);
        REQUIRE(ipc::test::ThrownKind([&] { UniversalSubnetId::NewRoot(Caip2ChainId{"eip155", "1/2"}); }) ==
                ErrorKind::InvalidArgument);
    }

    SECTION("Accepted values round-trip") {
        auto id = UniversalSubnetId::NewFromParent(root, "f0100:x");
        REQUIRE(UniversalSubnetId::FromString(id.ToString()) == id);
    }
}
