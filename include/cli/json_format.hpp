// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/cross.hpp"
#include "api/subnet.hpp"
#include "api/subnet_id.hpp"
#include "api/universal_subnet_id.hpp"
#include "provider/subnet_manager.hpp"
#include <map>
#include <nlohmann/json.hpp>

namespace ipc {
namespace cli {

/*
 JSON renderings of the data model for command output

 Amounts are decimal strings of base units (they may exceed 64 bits),
 byte strings are lowercase hex, addresses use their canonical text.
*/

nlohmann::json SubnetIdToJson(const api::SubnetID &id);
nlohmann::json UniversalSubnetIdToJson(const api::UniversalSubnetId &id);
nlohmann::json EnvelopeToJson(const api::IpcEnvelope &envelope);
nlohmann::json GenesisInfoToJson(const api::SubnetGenesisInfo &info);
nlohmann::json TopDownMsgsToJson(
    const provider::TopDownQueryPayload<std::vector<api::IpcEnvelope>> &payload);
nlohmann::json
SubnetInfosToJson(const std::map<api::SubnetID, api::SubnetInfo> &subnets);

} // namespace cli
} // namespace ipc
