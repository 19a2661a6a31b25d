// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/error.hpp"
#include "rpc/json_fields.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace ipc::rpc;
using json = nlohmann::json;

namespace {

template <typename Fn>
std::string ShapeErrorPath(Fn&& fn) {
    try {
        fn();
    } catch (const ipc::api::ResponseShapeError& e) {
        return e.field_path();
    }
    return "";
}

} // namespace

TEST_CASE("Field paths", "[rpc][json_fields]") {
    REQUIRE(FieldPath("", "result") == "result");
    REQUIRE(FieldPath("result", "msg") == "result.msg");
    REQUIRE(IndexPath("result.genesis_validators", 2) == "result.genesis_validators[2]");
    REQUIRE(FieldPath(IndexPath("result", 0), "kind") == "result[0].kind");
}

TEST_CASE("Checked field access", "[rpc][json_fields]") {
    json obj = json::parse(R"({
        "name": "x", "flag": true, "count": 5, "neg": -1, "frac": 1.5,
        "inner": {"a": 1}, "list": [1, 2]
    })");

    SECTION("Typed getters") {
        REQUIRE(GetStringField(obj, "name", "result") == "x");
        REQUIRE(GetBoolField(obj, "flag", "result"));
        REQUIRE(GetUint64Field(obj, "count", "result") == 5u);
        REQUIRE(GetObjectField(obj, "inner", "result")["a"] == 1);
        REQUIRE(GetArrayField(obj, "list", "result").size() == 2);
    }

    SECTION("Signed non-negative integers are accepted") {
        json built = {{"height", 42}};
        REQUIRE(GetUint64Field(built, "height", "result") == 42u);
    }

    SECTION("Missing and mistyped fields") {
        REQUIRE(ShapeErrorPath([&] { GetField(obj, "absent", "result"); }) == "result.absent");
        REQUIRE(ShapeErrorPath([&] { GetStringField(obj, "count", "result"); }) == "result.count");
        REQUIRE(ShapeErrorPath([&] { GetBoolField(obj, "name", "result"); }) == "result.name");
        REQUIRE(ShapeErrorPath([&] { GetUint64Field(obj, "neg", "result"); }) == "result.neg");
        REQUIRE(ShapeErrorPath([&] { GetUint64Field(obj, "frac", "result"); }) == "result.frac");
        REQUIRE(ShapeErrorPath([&] { GetUint64Field(obj, "name", "result"); }) == "result.name");
        REQUIRE(ShapeErrorPath([&] { GetObjectField(obj, "list", "result"); }) == "result.list");
        REQUIRE(ShapeErrorPath([&] { GetArrayField(obj, "inner", "result"); }) == "result.inner");
    }

    SECTION("Parent that is not an object") {
        json arr = json::array();
        REQUIRE(ShapeErrorPath([&] { GetStringField(arr, "name", "result"); }) == "result");
        REQUIRE(ShapeErrorPath([&] { RequireArray(obj, "result"); }) == "result");
    }
}
