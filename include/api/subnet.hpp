// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/address.hpp"
#include "api/checkpoint.hpp"
#include "api/subnet_id.hpp"
#include "api/token_amount.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ipc {
namespace api {

/** How validators gain power in a subnet */
enum class PermissionMode : uint8_t {
  Collateral = 0, // staked collateral
  Federated = 1,  // power assigned by the subnet owner
  Static = 2,     // collateral, frozen after bootstrap
};

std::string PermissionModeToString(PermissionMode mode);

enum class AssetKind : uint8_t {
  Native = 0,
  Erc20 = 1,
};

/** Source of a subnet's circulating supply or collateral */
struct Asset {
  AssetKind kind = AssetKind::Native;
  std::optional<Address> token_address;

  static Asset Native() { return Asset{}; }

  bool operator==(const Asset &other) const {
    return kind == other.kind && token_address == other.token_address;
  }
};

/** Subnet creation on an account-model parent */
struct AccountConstructParams {
  SubnetID parent;
  Address ipc_gateway_addr;
  uint64_t min_validators = 0;
  TokenAmount min_validator_stake;
  ChainEpoch bottomup_check_period = 0;
  uint16_t active_validators_limit = 100;
  uint8_t majority_percentage = 67;
  int8_t power_scale = 3;
  PermissionMode permission_mode = PermissionMode::Collateral;
  Asset supply_source;
  Asset collateral_source;
  std::optional<Address> validator_gater;
  std::optional<Address> validator_rewarder;
};

/** Subnet creation on a UTXO parent. Amounts are satoshis. */
struct UtxoConstructParams {
  SubnetID parent;
  uint64_t min_validators = 0;
  TokenAmount min_validator_stake;
  ChainEpoch bottomup_check_period = 0;
  uint16_t active_validators_limit = 100;
  TokenAmount min_cross_msg_fee;
  /** Hex x-only public keys allowed to join */
  std::vector<std::string> validator_whitelist;
};

using ConstructParams = std::variant<AccountConstructParams, UtxoConstructParams>;

struct AccountJoinParams {
  TokenAmount collateral;
  std::vector<uint8_t> public_key;
};

/** Amounts are satoshis */
struct UtxoJoinParams {
  TokenAmount collateral;
  std::string ip;
  std::string backup_address;
  std::vector<uint8_t> public_key;
};

using JoinParams = std::variant<AccountJoinParams, UtxoJoinParams>;

/** Network type a parameter set is tagged with */
template <typename Params> NetworkType ParamsNetworkType(const Params &params) {
  return params.index() == 0 ? NetworkType::AccountChain
                             : NetworkType::UtxoChain;
}

/** Child subnet as registered in the parent's gateway */
struct SubnetInfo {
  SubnetID id;
  TokenAmount stake;
  TokenAmount circ_supply;
  ChainEpoch genesis_epoch = 0;
};

/** Validator in a subnet's genesis set */
struct Validator {
  Address addr;
  std::vector<uint8_t> metadata; // public key
  TokenAmount weight;

  bool operator==(const Validator &other) const {
    return addr == other.addr && metadata == other.metadata &&
           weight == other.weight;
  }
};

/** Everything a child node needs to build its genesis */
struct SubnetGenesisInfo {
  uint16_t active_validators_limit = 0;
  ChainEpoch bottom_up_checkpoint_period = 0;
  ChainEpoch genesis_epoch = 0;
  uint8_t majority_percentage = 0;
  TokenAmount min_collateral;
  std::vector<Validator> validators;
  std::map<Address, TokenAmount> genesis_balances;
  PermissionMode permission_mode = PermissionMode::Collateral;
  Asset supply_source;
};

} // namespace api
} // namespace ipc
