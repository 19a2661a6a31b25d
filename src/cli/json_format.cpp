// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/json_format.hpp"
#include "util/string_parsing.hpp"

namespace ipc {
namespace cli {

using json = nlohmann::json;

namespace {

json AssetToJson(const api::Asset &asset) {
  json out;
  out["kind"] = asset.kind == api::AssetKind::Native ? "native" : "erc20";
  out["token_address"] =
      asset.token_address ? json(asset.token_address->ToString()) : json(nullptr);
  return out;
}

} // namespace

json SubnetIdToJson(const api::SubnetID &id) {
  json children = json::array();
  for (const auto &child : id.children()) {
    children.push_back(child.ToString());
  }

  auto parent = id.Parent();
  json out;
  out["id"] = id.ToString();
  out["network_type"] = api::NetworkTypeToString(id.GetNetworkType());
  out["root_network_type"] = api::NetworkTypeToString(id.root_network_type());
  out["root_id"] = id.root_id();
  out["children"] = std::move(children);
  out["chain_id"] = id.ChainId();
  out["subnet_actor"] = id.SubnetActor().ToString();
  out["parent"] = parent ? json(parent->ToString()) : json(nullptr);
  out["universal_id"] = api::UniversalSubnetId::FromSubnetId(id).ToString();
  return out;
}

json UniversalSubnetIdToJson(const api::UniversalSubnetId &id) {
  auto type = id.RootNetworkType();
  auto parent = id.Parent();
  json out;
  out["universal_id"] = id.ToString();
  out["chain"] = id.root().ToString();
  out["children"] = id.children();
  out["root_network_type"] =
      type ? json(api::NetworkTypeToString(*type)) : json(nullptr);
  out["parent"] = parent ? json(parent->ToString()) : json(nullptr);
  return out;
}

json EnvelopeToJson(const api::IpcEnvelope &envelope) {
  json out;
  out["kind"] = api::IpcMsgKindToString(envelope.kind);
  out["from"] = envelope.from.ToString();
  out["to"] = envelope.to.ToString();
  out["value"] = envelope.value.ToString();
  out["message"] = util::HexStr(envelope.message);
  out["nonce"] = envelope.nonce;
  return out;
}

json GenesisInfoToJson(const api::SubnetGenesisInfo &info) {
  json validators = json::array();
  for (const auto &validator : info.validators) {
    validators.push_back({{"address", validator.addr.ToString()},
                          {"public_key", util::HexStr(validator.metadata)},
                          {"weight", validator.weight.ToString()}});
  }

  json balances = json::object();
  for (const auto &[addr, amount] : info.genesis_balances) {
    balances[addr.ToString()] = amount.ToString();
  }

  json out;
  out["active_validators_limit"] = info.active_validators_limit;
  out["bottom_up_checkpoint_period"] = info.bottom_up_checkpoint_period;
  out["genesis_epoch"] = info.genesis_epoch;
  out["majority_percentage"] = info.majority_percentage;
  out["min_collateral"] = info.min_collateral.ToString();
  out["permission_mode"] = api::PermissionModeToString(info.permission_mode);
  out["supply_source"] = AssetToJson(info.supply_source);
  out["validators"] = std::move(validators);
  out["genesis_balances"] = std::move(balances);
  return out;
}

json TopDownMsgsToJson(
    const provider::TopDownQueryPayload<std::vector<api::IpcEnvelope>> &payload) {
  json msgs = json::array();
  for (const auto &envelope : payload.value) {
    msgs.push_back(EnvelopeToJson(envelope));
  }
  return {{"block_hash", util::HexStr(payload.block_hash)},
          {"messages", std::move(msgs)}};
}

json SubnetInfosToJson(const std::map<api::SubnetID, api::SubnetInfo> &subnets) {
  json out = json::array();
  for (const auto &[id, info] : subnets) {
    out.push_back({{"id", id.ToString()},
                   {"stake", info.stake.ToString()},
                   {"circ_supply", info.circ_supply.ToString()},
                   {"genesis_epoch", info.genesis_epoch}});
  }
  return out;
}

} // namespace cli
} // namespace ipc
