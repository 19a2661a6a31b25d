// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace ipc {
namespace rpc {

/*
 Checked field extraction from backend responses

 Every accessor takes the path of the enclosing object ("result",
 "result.genesis_validators[2]", ...) and throws api::ResponseShapeError
 naming the full field path when the member is missing or has the wrong
 type.
*/

std::string FieldPath(const std::string &parent, const std::string &key);
std::string IndexPath(const std::string &parent, size_t index);

/** @throws api::ResponseShapeError unless value is an object */
const nlohmann::json &RequireObject(const nlohmann::json &value,
                                    const std::string &path);
/** @throws api::ResponseShapeError unless value is an array */
const nlohmann::json &RequireArray(const nlohmann::json &value,
                                   const std::string &path);

const nlohmann::json &GetField(const nlohmann::json &obj, const std::string &key,
                               const std::string &path);
const nlohmann::json &GetObjectField(const nlohmann::json &obj,
                                     const std::string &key,
                                     const std::string &path);
const nlohmann::json &GetArrayField(const nlohmann::json &obj,
                                    const std::string &key,
                                    const std::string &path);
std::string GetStringField(const nlohmann::json &obj, const std::string &key,
                           const std::string &path);
bool GetBoolField(const nlohmann::json &obj, const std::string &key,
                  const std::string &path);
/** Non-negative JSON integer */
uint64_t GetUint64Field(const nlohmann::json &obj, const std::string &key,
                        const std::string &path);

} // namespace rpc
} // namespace ipc
