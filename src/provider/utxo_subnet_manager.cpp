// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "provider/utxo_subnet_manager.hpp"
#include "api/error.hpp"
#include "rpc/json_fields.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <limits>

namespace ipc {
namespace provider {

using json = nlohmann::json;

namespace {

// x-only public keys in the validator whitelist
constexpr size_t XONLY_PUBKEY_LEN = 32;

// Parent block hash anchoring a top-down batch
constexpr size_t BLOCK_HASH_LEN = 32;

[[noreturn]] void Unsupported(const char *operation) {
  throw api::Error(api::ErrorKind::UnsupportedOperation,
                   std::string(operation) + " is not supported by the utxo backend");
}

[[noreturn]] void TagMismatch(const char *operation) {
  throw api::Error(api::ErrorKind::UnsupportedConversion,
                   std::string(operation) +
                       ": account parameters passed to a utxo-chain manager");
}

uint64_t Satoshis(const api::TokenAmount &amount, const char *what) {
  if (!amount.FitsIn(api::NetworkType::UtxoChain)) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     std::string(what) + " " + amount.ToString() +
                         " does not fit in 64-bit satoshis");
  }
  return amount.ToUint64();
}

uint64_t PositiveSatoshis(const api::TokenAmount &amount, const char *what) {
  uint64_t sats = Satoshis(amount, what);
  if (sats == 0) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     std::string(what) + " must be greater than zero");
  }
  return sats;
}

ChainEpoch GetEpochField(const json &obj, const std::string &key,
                         const std::string &path) {
  uint64_t height = rpc::GetUint64Field(obj, key, path);
  if (height > static_cast<uint64_t>(std::numeric_limits<ChainEpoch>::max())) {
    throw api::ResponseShapeError(rpc::FieldPath(path, key),
                                  "is out of epoch range");
  }
  return static_cast<ChainEpoch>(height);
}

std::vector<uint8_t> GetHexField(const json &obj, const std::string &key,
                                 const std::string &path) {
  auto bytes = util::ParseHex(rpc::GetStringField(obj, key, path));
  if (!bytes) {
    throw api::ResponseShapeError(rpc::FieldPath(path, key), "is not hex");
  }
  return *bytes;
}

api::Address GetAddressField(const json &obj, const std::string &key,
                             const std::string &path) {
  std::string text = rpc::GetStringField(obj, key, path);
  try {
    return api::Address::ParseAny(text);
  } catch (const api::Error &e) {
    throw api::ResponseShapeError(rpc::FieldPath(path, key),
                                  std::string("is not a valid address: ") +
                                      e.what());
  }
}

/** Genesis validator entry; throws on any malformed field */
api::Validator ParseGenesisValidator(const json &entry, const std::string &path) {
  api::Validator validator;
  validator.addr = GetAddressField(entry, "address", path);
  validator.weight =
      api::TokenAmount::FromAtto(rpc::GetUint64Field(entry, "weight", path));
  validator.metadata = GetHexField(entry, "pubkey", path);
  if (validator.metadata.empty()) {
    throw api::ResponseShapeError(rpc::FieldPath(path, "pubkey"), "is empty");
  }
  return validator;
}

} // namespace

UtxoSubnetManager::UtxoSubnetManager(api::SubnetID subnet,
                                     std::unique_ptr<rpc::HttpTransport> transport)
    : client_(std::move(transport)), subnet_(std::move(subnet)) {}

std::string UtxoSubnetManager::WireSubnetId(const api::SubnetID &child) const {
  auto parent = child.Parent();
  if (!parent || *parent != subnet_) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "subnet " + child.ToString() +
                         " is not a child of the connected subnet " +
                         subnet_.ToString());
  }
  api::Address actor = child.SubnetActor();
  if (actor.delegated_namespace() != api::UTXO_NAMESPACE) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "subnet " + child.ToString() +
                         " does not carry a utxo subnet identifier");
  }
  return util::HexStr(actor.payload());
}

api::Address UtxoSubnetManager::create_subnet(const api::Address &from,
                                              const api::ConstructParams &params) {
  const auto *utxo = std::get_if<api::UtxoConstructParams>(&params);
  if (!utxo) {
    TagMismatch("create_subnet");
  }
  if (utxo->parent != subnet_) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "parent " + utxo->parent.ToString() +
                         " does not match the connected subnet " +
                         subnet_.ToString());
  }
  if (utxo->active_validators_limit == 0) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "active validators limit must be positive");
  }

  json whitelist = json::array();
  for (const auto &key : utxo->validator_whitelist) {
    auto bytes = util::ParseHex(key);
    if (!bytes || bytes->size() != XONLY_PUBKEY_LEN) {
      throw api::Error(api::ErrorKind::InvalidArgument,
                       "whitelist entry '" + key +
                           "' is not a 32-byte hex x-only public key");
    }
    whitelist.push_back(util::HexStr(*bytes));
  }

  json request = {
      {"min_validator_stake",
       PositiveSatoshis(utxo->min_validator_stake, "min validator stake")},
      {"min_validators", utxo->min_validators},
      {"bottomup_check_period", utxo->bottomup_check_period},
      {"active_validators_limit", utxo->active_validators_limit},
      {"min_cross_msg_fee", Satoshis(utxo->min_cross_msg_fee, "min cross msg fee")},
      {"whitelist", std::move(whitelist)}};

  LOG_PROVIDER_INFO("creating subnet on {} from {}", subnet_.ToString(),
                    from.ToString());
  json result = client_.Request("createsubnet", request);

  std::string hex_id = rpc::GetStringField(result, "subnet_id", "result");
  api::SubnetID created;
  try {
    created = api::SubnetID::NewUtxo(subnet_.root_id(), hex_id);
  } catch (const api::InvalidIdError &e) {
    throw api::ResponseShapeError("result.subnet_id",
                                  "is not a subnet identifier: " + e.reason());
  }
  LOG_PROVIDER_INFO("created subnet {}", created.ToString());
  return created.SubnetActor();
}

ChainEpoch UtxoSubnetManager::join_subnet(const api::SubnetID &subnet,
                                          const api::Address &from,
                                          const api::JoinParams &params) {
  const auto *utxo = std::get_if<api::UtxoJoinParams>(&params);
  if (!utxo) {
    TagMismatch("join_subnet");
  }
  if (utxo->ip.empty()) {
    throw api::Error(api::ErrorKind::InvalidArgument, "join needs a validator ip");
  }
  if (utxo->public_key.empty()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "join needs a validator public key");
  }

  json request = {{"subnet_id", WireSubnetId(subnet)},
                  {"collateral", PositiveSatoshis(utxo->collateral, "collateral")},
                  {"ip", utxo->ip},
                  {"backup_address", utxo->backup_address},
                  {"pubkey", util::HexStr(utxo->public_key)}};

  LOG_PROVIDER_INFO("joining subnet {} from {}", subnet.ToString(),
                    from.ToString());
  json result = client_.Request("joinsubnet", request);

  std::string txid = rpc::GetStringField(result, "join_txid", "result");
  ChainEpoch epoch = GetEpochField(result, "block_height", "result");
  LOG_PROVIDER_INFO("joined {} in tx {} at height {}", subnet.ToString(), txid,
                    epoch);
  return epoch;
}

void UtxoSubnetManager::pre_fund(const api::SubnetID &subnet,
                                 const api::Address &from,
                                 const api::TokenAmount &balance) {
  json request = {{"subnet_id", WireSubnetId(subnet)},
                  {"address", from.ToString()},
                  {"amount", PositiveSatoshis(balance, "pre-fund amount")}};

  LOG_PROVIDER_INFO("pre-funding {} in {}", from.ToString(), subnet.ToString());
  json result = client_.Request("prefundsubnet", request);

  std::string txid = rpc::GetStringField(result, "prefund_txid", "result");
  LOG_PROVIDER_DEBUG("pre-fund tx {}", txid);
}

void UtxoSubnetManager::pre_release(const api::SubnetID &, const api::Address &,
                                    const api::TokenAmount &) {
  Unsupported("pre_release");
}

void UtxoSubnetManager::stake(const api::SubnetID &, const api::Address &,
                              const api::TokenAmount &) {
  Unsupported("stake");
}

void UtxoSubnetManager::unstake(const api::SubnetID &, const api::Address &,
                                const api::TokenAmount &) {
  Unsupported("unstake");
}

void UtxoSubnetManager::leave_subnet(const api::SubnetID &,
                                     const api::Address &) {
  Unsupported("leave_subnet");
}

void UtxoSubnetManager::kill_subnet(const api::SubnetID &,
                                    const api::Address &) {
  Unsupported("kill_subnet");
}

void UtxoSubnetManager::claim_collateral(const api::SubnetID &,
                                         const api::Address &) {
  Unsupported("claim_collateral");
}

std::map<api::SubnetID, api::SubnetInfo>
UtxoSubnetManager::list_child_subnets(const api::Address &) {
  Unsupported("list_child_subnets");
}

ChainEpoch UtxoSubnetManager::fund(const api::SubnetID &subnet,
                                   const api::Address &, const api::Address &from,
                                   const api::Address &to,
                                   const api::TokenAmount &amount) {
  json request = {{"subnet_id", WireSubnetId(subnet)},
                  {"address", to.ToString()},
                  {"amount", PositiveSatoshis(amount, "fund amount")}};

  LOG_PROVIDER_INFO("funding {} in {} from {}", to.ToString(), subnet.ToString(),
                    from.ToString());
  json result = client_.Request("fundsubnet", request);

  std::string txid = rpc::GetStringField(result, "fund_txid", "result");
  ChainEpoch epoch = GetEpochField(result, "block_height", "result");
  LOG_PROVIDER_DEBUG("fund tx {} at height {}", txid, epoch);
  return epoch;
}

ChainEpoch UtxoSubnetManager::approve_token(const api::SubnetID &,
                                            const api::Address &,
                                            const api::TokenAmount &) {
  Unsupported("approve_token");
}

ChainEpoch UtxoSubnetManager::fund_with_token(const api::SubnetID &,
                                              const api::Address &,
                                              const api::Address &,
                                              const api::TokenAmount &) {
  Unsupported("fund_with_token");
}

ChainEpoch UtxoSubnetManager::release(const api::Address &, const api::Address &,
                                      const api::Address &,
                                      const api::TokenAmount &) {
  Unsupported("release");
}

void UtxoSubnetManager::propagate(const api::SubnetID &, const api::Address &,
                                  const api::Address &,
                                  const std::vector<uint8_t> &) {
  Unsupported("propagate");
}

void UtxoSubnetManager::send_value(const api::Address &, const api::Address &,
                                   const api::TokenAmount &) {
  Unsupported("send_value");
}

api::TokenAmount UtxoSubnetManager::wallet_balance(const api::Address &) {
  Unsupported("wallet_balance");
}

std::string UtxoSubnetManager::get_chain_id() {
  return std::to_string(subnet_.root_id());
}

std::array<uint8_t, 32> UtxoSubnetManager::get_commit_sha() {
  Unsupported("get_commit_sha");
}

api::Asset UtxoSubnetManager::get_subnet_supply_source(const api::SubnetID &subnet) {
  LOG_PROVIDER_DEBUG("supply source of {} is native", subnet.ToString());
  return api::Asset::Native();
}

api::Asset
UtxoSubnetManager::get_subnet_collateral_source(const api::SubnetID &subnet) {
  LOG_PROVIDER_DEBUG("collateral source of {} is native", subnet.ToString());
  return api::Asset::Native();
}

json UtxoSubnetManager::FetchGenesis(const api::SubnetID &subnet) {
  json result =
      client_.Request("getgenesisinfo", {{"subnet_id", WireSubnetId(subnet)}});
  rpc::RequireObject(result, "result");

  if (!rpc::GetBoolField(result, "bootstrapped", "result")) {
    throw api::Error(api::ErrorKind::InvalidState,
                     "subnet " + subnet.ToString() + " is not bootstrapped");
  }
  return result;
}

api::SubnetGenesisInfo
UtxoSubnetManager::get_genesis_info(const api::SubnetID &subnet) {
  LOG_PROVIDER_DEBUG("fetching genesis info of {}", subnet.ToString());
  json result = FetchGenesis(subnet);

  const std::string msg_path = "result.create_subnet_msg";
  const json &msg = rpc::GetObjectField(result, "create_subnet_msg", "result");

  uint64_t limit = rpc::GetUint64Field(msg, "active_validators_limit", msg_path);
  if (limit > std::numeric_limits<uint16_t>::max()) {
    throw api::ResponseShapeError(msg_path + ".active_validators_limit",
                                  "does not fit in 16 bits");
  }

  api::SubnetGenesisInfo info;
  info.active_validators_limit = static_cast<uint16_t>(limit);
  info.bottom_up_checkpoint_period =
      GetEpochField(msg, "bottomup_check_period", msg_path);
  info.genesis_epoch = GetEpochField(result, "genesis_block_height", "result");
  info.majority_percentage = MAJORITY_PERCENTAGE;
  info.min_collateral = api::TokenAmount::FromAtto(
      rpc::GetUint64Field(msg, "min_validator_stake", msg_path));
  info.permission_mode = api::PermissionMode::Collateral;
  info.supply_source = api::Asset::Native();

  const json &validators =
      rpc::GetArrayField(result, "genesis_validators", "result");
  for (size_t i = 0; i < validators.size(); ++i) {
    std::string path = rpc::IndexPath("result.genesis_validators", i);
    try {
      info.validators.push_back(ParseGenesisValidator(validators[i], path));
    } catch (const api::ResponseShapeError &e) {
      // Partial tolerance: one bad entry does not fail the genesis query
      LOG_PROVIDER_WARN("dropping genesis validator of {}: {}",
                        subnet.ToString(), e.what());
    }
  }

  auto balances = result.find("genesis_balances");
  if (balances != result.end() && !balances->is_null()) {
    rpc::RequireObject(*balances, "result.genesis_balances");
    for (const auto &[key, value] : balances->items()) {
      std::string path = rpc::FieldPath("result.genesis_balances", key);
      api::Address addr;
      try {
        addr = api::Address::ParseAny(key);
      } catch (const api::Error &e) {
        throw api::ResponseShapeError(path, std::string("is not a valid address: ") +
                                                e.what());
      }
      if (!value.is_number_unsigned()) {
        throw api::ResponseShapeError(path, "is not an unsigned integer");
      }
      info.genesis_balances[addr] =
          api::TokenAmount::FromAtto(value.get<uint64_t>());
    }
  }

  LOG_PROVIDER_DEBUG("genesis of {}: {} validator(s), {} balance(s)",
                     subnet.ToString(), info.validators.size(),
                     info.genesis_balances.size());
  return info;
}

void UtxoSubnetManager::add_bootstrap(const api::SubnetID &, const api::Address &,
                                      const std::string &) {
  Unsupported("add_bootstrap");
}

std::vector<std::string>
UtxoSubnetManager::list_bootstrap_nodes(const api::SubnetID &) {
  Unsupported("list_bootstrap_nodes");
}

api::ValidatorInfo UtxoSubnetManager::get_validator_info(const api::SubnetID &,
                                                         const api::Address &) {
  Unsupported("get_validator_info");
}

std::vector<std::pair<api::Address, api::ValidatorInfo>>
UtxoSubnetManager::list_validators(const api::SubnetID &) {
  Unsupported("list_validators");
}

ChainEpoch UtxoSubnetManager::set_federated_power(
    const api::Address &, const api::SubnetID &,
    const std::vector<api::Address> &, const std::vector<std::vector<uint8_t>> &,
    const std::vector<api::TokenAmount> &) {
  Unsupported("set_federated_power");
}

ChainEpoch UtxoSubnetManager::submit_checkpoint(
    const api::Address &, const api::BottomUpCheckpoint &,
    const std::vector<api::Signature> &, const std::vector<api::Address> &) {
  Unsupported("submit_checkpoint");
}

ChainEpoch
UtxoSubnetManager::last_bottom_up_checkpoint_height(const api::SubnetID &) {
  Unsupported("last_bottom_up_checkpoint_height");
}

ChainEpoch UtxoSubnetManager::checkpoint_period(const api::SubnetID &) {
  Unsupported("checkpoint_period");
}

std::optional<api::BottomUpCheckpointBundle>
UtxoSubnetManager::checkpoint_bundle_at(ChainEpoch) {
  Unsupported("checkpoint_bundle_at");
}

std::vector<api::QuorumReachedEvent>
UtxoSubnetManager::quorum_reached_events(ChainEpoch) {
  Unsupported("quorum_reached_events");
}

ChainEpoch UtxoSubnetManager::current_epoch() { Unsupported("current_epoch"); }

ChainEpoch UtxoSubnetManager::genesis_epoch(const api::SubnetID &subnet) {
  json result = FetchGenesis(subnet);
  return GetEpochField(result, "genesis_block_height", "result");
}

ChainEpoch UtxoSubnetManager::chain_head_height() {
  Unsupported("chain_head_height");
}

TopDownQueryPayload<std::vector<api::IpcEnvelope>>
UtxoSubnetManager::get_top_down_msgs(const api::SubnetID &subnet,
                                     ChainEpoch epoch) {
  if (epoch < 0) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "epoch must not be negative");
  }
  json result = client_.Request(
      "getrootnetmessages",
      {{"subnet_id", WireSubnetId(subnet)}, {"block_height", epoch}});
  rpc::RequireArray(result, "result");

  TopDownQueryPayload<std::vector<api::IpcEnvelope>> payload;
  std::optional<std::vector<uint8_t>> batch_hash;

  for (size_t i = 0; i < result.size(); ++i) {
    const std::string path = rpc::IndexPath("result", i);
    const json &entry = rpc::RequireObject(result[i], path);

    // One query covers exactly one parent block
    std::vector<uint8_t> block_hash = GetHexField(entry, "block_hash", path);
    if (block_hash.size() != BLOCK_HASH_LEN) {
      throw api::ResponseShapeError(
          path + ".block_hash",
          "must be " + std::to_string(BLOCK_HASH_LEN) + " bytes, got " +
              std::to_string(block_hash.size()));
    }
    if (!batch_hash) {
      batch_hash = block_hash;
    } else if (*batch_hash != block_hash) {
      LOG_PROVIDER_ERROR("top-down batch for {} spans blocks {} and {}",
                         subnet.ToString(), util::HexStr(*batch_hash),
                         util::HexStr(block_hash));
      throw api::ResponseShapeError(path + ".block_hash",
                                    "differs from the batch block hash " +
                                        util::HexStr(*batch_hash));
    }

    std::string kind = rpc::GetStringField(entry, "kind", path);
    if (kind != FUND_MSG_KIND) {
      throw api::ResponseShapeError(path + ".kind",
                                    "has unknown message kind '" + kind + "'");
    }

    const std::string msg_path = path + ".msg";
    const json &msg = rpc::GetObjectField(entry, "msg", path);
    uint64_t nonce = rpc::GetUint64Field(msg, "nonce", msg_path);
    uint64_t value = rpc::GetUint64Field(msg, "value", msg_path);

    api::SubnetID to_subnet;
    std::string subnet_text = rpc::GetStringField(msg, "subnet_id", msg_path);
    try {
      to_subnet = api::SubnetID::FromString(subnet_text);
    } catch (const api::InvalidIdError &e) {
      throw api::ResponseShapeError(msg_path + ".subnet_id",
                                    "is not a subnet id: " + e.reason());
    }
    if (to_subnet != subnet) {
      LOG_PROVIDER_ERROR("top-down query for {} returned a message to {}",
                         subnet.ToString(), to_subnet.ToString());
      throw api::ResponseShapeError(msg_path + ".subnet_id",
                                    "names " + to_subnet.ToString() +
                                        ", not the queried subnet " +
                                        subnet.ToString());
    }
    auto from_subnet = to_subnet.Parent();
    if (!from_subnet) {
      throw api::ResponseShapeError(msg_path + ".subnet_id",
                                    "names a root, which cannot be funded");
    }
    api::Address recipient = GetAddressField(msg, "recipient", msg_path);

    payload.value.push_back(api::IpcEnvelope::Create(
        api::IpcMsgKind::Transfer,
        api::IPCAddress{*from_subnet, api::Address::NewId(0)},
        api::IPCAddress{to_subnet, recipient}, api::TokenAmount::FromAtto(value),
        {}, nonce));
  }

  if (batch_hash) {
    payload.block_hash = std::move(*batch_hash);
  }
  LOG_PROVIDER_DEBUG("{} top-down message(s) for {} at height {}",
                     payload.value.size(), subnet.ToString(), epoch);
  return payload;
}

GetBlockHashResult UtxoSubnetManager::get_block_hash(ChainEpoch) {
  Unsupported("get_block_hash");
}

TopDownQueryPayload<std::vector<api::StakingChangeRequest>>
UtxoSubnetManager::get_validator_changeset(const api::SubnetID &, ChainEpoch) {
  Unsupported("get_validator_changeset");
}

ChainEpoch UtxoSubnetManager::latest_parent_finality() {
  Unsupported("latest_parent_finality");
}

RewardClaims UtxoSubnetManager::query_reward_claims(const api::Address &,
                                                    ChainEpoch, ChainEpoch) {
  Unsupported("query_reward_claims");
}

std::vector<std::pair<uint64_t, api::ValidatorData>>
UtxoSubnetManager::query_validator_rewards(const api::Address &, ChainEpoch,
                                           ChainEpoch) {
  Unsupported("query_validator_rewards");
}

void UtxoSubnetManager::batch_subnet_claim(const api::Address &,
                                           const api::SubnetID &,
                                           const api::SubnetID &,
                                           const RewardClaims &) {
  Unsupported("batch_subnet_claim");
}

} // namespace provider
} // namespace ipc
