// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/address.hpp"
#include "api/subnet_id.hpp"
#include "api/universal_subnet_id.hpp"
#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ipc {
namespace provider {

/** Connection to an account-model chain (contract calls over JSON-RPC) */
struct AccountSubnetConfig {
  std::string provider_http;
  std::optional<std::string> auth_token;
  std::optional<std::chrono::milliseconds> rpc_timeout;
  api::Address gateway_addr;
  api::Address registry_addr;
};

/** Connection to a UTXO chain's IPC node */
struct UtxoSubnetConfig {
  std::string provider_http;
  std::optional<std::string> auth_token;
  std::optional<std::chrono::milliseconds> rpc_timeout;
};

using SubnetConfig = std::variant<AccountSubnetConfig, UtxoSubnetConfig>;

/** One configured subnet connection */
struct Subnet {
  api::SubnetID id;
  std::optional<api::UniversalSubnetId> universal_id;
  SubnetConfig config;
  std::optional<api::Address> default_sender;

  api::NetworkType network_type() const;
  const std::string &rpc_http() const;
  const std::optional<std::string> &auth_token() const;
  std::optional<std::chrono::milliseconds> rpc_timeout() const;
  /** Gateway of an account-chain subnet, none for UTXO connections */
  std::optional<api::Address> gateway_addr() const;
};

/**
 * Provider configuration: the set of subnets this process can reach
 *
 * JSON shape:
 *   { "subnets": [ { "id": "/r314159",
 *                    "universal_id": "/eip155:314159",        (optional)
 *                    "default_sender": "f410f...",            (optional)
 *                    "config": { "network_type": "account" | "utxo",
 *                                "provider_http": "http://...",
 *                                "auth_token": "...",          (optional)
 *                                "rpc_timeout_ms": 30000,      (optional)
 *                                "gateway_addr": "...",        (account)
 *                                "registry_addr": "..." } } ] (account)
 *
 * Malformed entries are rejected as a whole: loading throws
 * api::Error(InvalidArgument) naming the entry and the field.
 */
class Config {
public:
  Config() = default;

  static Config FromJson(const nlohmann::json &root);
  static Config LoadFromFile(const std::string &path);

  /** @throws api::Error(InvalidArgument) on a duplicate id */
  void AddSubnet(Subnet subnet);

  const Subnet *GetSubnet(const api::SubnetID &id) const;
  /** Subnet whose universal_id matches exactly */
  const Subnet *FindByUniversalId(const api::UniversalSubnetId &id) const;

  const std::map<api::SubnetID, Subnet> &subnets() const { return subnets_; }

  nlohmann::json ToJson() const;

private:
  std::map<api::SubnetID, Subnet> subnets_;
};

} // namespace provider
} // namespace ipc
