// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "provider/account_subnet_manager.hpp"
#include "api/error.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace ipc {
namespace provider {

namespace {

void RequirePositive(const api::TokenAmount &amount, const char *what) {
  if (amount.IsZero()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     std::string(what) + " must be greater than zero");
  }
  if (!amount.FitsIn(api::NetworkType::AccountChain)) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     std::string(what) + " " + amount.ToString() +
                         " exceeds 256 bits");
  }
}

[[noreturn]] void TagMismatch(const char *operation) {
  throw api::Error(api::ErrorKind::UnsupportedConversion,
                   std::string(operation) +
                       ": utxo parameters passed to an account-chain manager");
}

} // namespace

AccountSubnetManager::AccountSubnetManager(api::SubnetID subnet,
                                           api::Address gateway_addr,
                                           api::Address registry_addr,
                                           std::unique_ptr<ContractCaller> caller)
    : subnet_(std::move(subnet)), gateway_addr_(std::move(gateway_addr)),
      registry_addr_(std::move(registry_addr)), caller_(std::move(caller)) {
  if (!caller_) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "account manager for " + subnet_.ToString() +
                         " needs a contract caller");
  }
}

api::Address AccountSubnetManager::ChildActor(const api::SubnetID &child) const {
  auto parent = child.Parent();
  if (!parent || *parent != subnet_) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "subnet " + child.ToString() +
                         " is not a child of the connected subnet " +
                         subnet_.ToString());
  }
  return child.SubnetActor();
}

api::Address
AccountSubnetManager::create_subnet(const api::Address &from,
                                    const api::ConstructParams &params) {
  const auto *account = std::get_if<api::AccountConstructParams>(&params);
  if (!account) {
    TagMismatch("create_subnet");
  }
  if (account->parent != subnet_) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "parent " + account->parent.ToString() +
                         " does not match the connected subnet " +
                         subnet_.ToString());
  }
  if (account->bottomup_check_period <= 0) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "bottom-up checkpoint period must be positive");
  }
  if (account->majority_percentage < 51 || account->majority_percentage > 100) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "majority percentage must be within 51..100");
  }

  LOG_PROVIDER_INFO("creating subnet under {} (registry {})", subnet_.ToString(),
                    registry_addr_.ToString());
  api::Address actor = caller_->deploy_subnet_actor(from, *account);
  LOG_PROVIDER_INFO("created subnet actor {}", actor.ToString());
  return actor;
}

ChainEpoch AccountSubnetManager::join_subnet(const api::SubnetID &subnet,
                                             const api::Address &from,
                                             const api::JoinParams &params) {
  const auto *account = std::get_if<api::AccountJoinParams>(&params);
  if (!account) {
    TagMismatch("join_subnet");
  }
  RequirePositive(account->collateral, "collateral");
  api::Address actor = ChildActor(subnet);

  LOG_PROVIDER_INFO("joining subnet {} from {} with collateral {}",
                    subnet.ToString(), from.ToString(),
                    account->collateral.ToString());
  return caller_->join(actor, from, account->collateral, account->public_key);
}

void AccountSubnetManager::pre_fund(const api::SubnetID &subnet,
                                    const api::Address &from,
                                    const api::TokenAmount &balance) {
  RequirePositive(balance, "pre-fund amount");
  api::Address actor = ChildActor(subnet);
  LOG_PROVIDER_DEBUG("pre-funding {} for {} with {}", subnet.ToString(),
                     from.ToString(), balance.ToString());
  caller_->pre_fund(actor, from, balance);
}

void AccountSubnetManager::pre_release(const api::SubnetID &subnet,
                                       const api::Address &from,
                                       const api::TokenAmount &amount) {
  RequirePositive(amount, "pre-release amount");
  api::Address actor = ChildActor(subnet);
  LOG_PROVIDER_DEBUG("pre-releasing {} from {} for {}", amount.ToString(),
                     subnet.ToString(), from.ToString());
  caller_->pre_release(actor, from, amount);
}

void AccountSubnetManager::stake(const api::SubnetID &subnet,
                                 const api::Address &from,
                                 const api::TokenAmount &collateral) {
  RequirePositive(collateral, "collateral");
  api::Address actor = ChildActor(subnet);
  LOG_PROVIDER_DEBUG("staking {} in {} from {}", collateral.ToString(),
                     subnet.ToString(), from.ToString());
  caller_->stake(actor, from, collateral);
}

void AccountSubnetManager::unstake(const api::SubnetID &subnet,
                                   const api::Address &from,
                                   const api::TokenAmount &collateral) {
  RequirePositive(collateral, "collateral");
  api::Address actor = ChildActor(subnet);
  LOG_PROVIDER_DEBUG("unstaking {} from {} for {}", collateral.ToString(),
                     subnet.ToString(), from.ToString());
  caller_->unstake(actor, from, collateral);
}

void AccountSubnetManager::leave_subnet(const api::SubnetID &subnet,
                                        const api::Address &from) {
  api::Address actor = ChildActor(subnet);
  LOG_PROVIDER_INFO("leaving subnet {} as {}", subnet.ToString(),
                    from.ToString());
  caller_->leave(actor, from);
}

void AccountSubnetManager::kill_subnet(const api::SubnetID &subnet,
                                       const api::Address &from) {
  api::Address actor = ChildActor(subnet);
  LOG_PROVIDER_INFO("killing subnet {}", subnet.ToString());
  caller_->kill(actor, from);
}

void AccountSubnetManager::claim_collateral(const api::SubnetID &subnet,
                                            const api::Address &from) {
  api::Address actor = ChildActor(subnet);
  LOG_PROVIDER_DEBUG("claiming collateral in {} for {}", subnet.ToString(),
                     from.ToString());
  caller_->claim_collateral(actor, from);
}

std::map<api::SubnetID, api::SubnetInfo>
AccountSubnetManager::list_child_subnets(const api::Address &gateway) {
  std::map<api::SubnetID, api::SubnetInfo> out;
  for (auto &info : caller_->list_subnets(gateway)) {
    api::SubnetID id = info.id;
    out.emplace(std::move(id), std::move(info));
  }
  LOG_PROVIDER_DEBUG("gateway {} lists {} child subnet(s)", gateway.ToString(),
                     out.size());
  return out;
}

ChainEpoch AccountSubnetManager::fund(const api::SubnetID &subnet,
                                      const api::Address &gateway,
                                      const api::Address &from,
                                      const api::Address &to,
                                      const api::TokenAmount &amount) {
  RequirePositive(amount, "fund amount");
  ChildActor(subnet);
  LOG_PROVIDER_INFO("funding {} in {} with {}", to.ToString(),
                    subnet.ToString(), amount.ToString());
  return caller_->fund(gateway, subnet, from, to, amount);
}

ChainEpoch AccountSubnetManager::approve_token(const api::SubnetID &subnet,
                                               const api::Address &from,
                                               const api::TokenAmount &amount) {
  RequirePositive(amount, "approval amount");
  api::Address actor = ChildActor(subnet);

  api::Asset source = caller_->supply_source(actor);
  if (source.kind != api::AssetKind::Erc20 || !source.token_address) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "subnet " + subnet.ToString() +
                         " does not use a token supply source");
  }
  LOG_PROVIDER_DEBUG("approving {} of token {} for gateway {}",
                     amount.ToString(), source.token_address->ToString(),
                     gateway_addr_.ToString());
  return caller_->approve_token(*source.token_address, from, gateway_addr_,
                                amount);
}

ChainEpoch AccountSubnetManager::fund_with_token(const api::SubnetID &subnet,
                                                 const api::Address &from,
                                                 const api::Address &to,
                                                 const api::TokenAmount &amount) {
  RequirePositive(amount, "fund amount");
  ChildActor(subnet);
  LOG_PROVIDER_INFO("funding {} in {} with {} (token)", to.ToString(),
                    subnet.ToString(), amount.ToString());
  return caller_->fund_with_token(gateway_addr_, subnet, from, to, amount);
}

ChainEpoch AccountSubnetManager::release(const api::Address &gateway,
                                         const api::Address &from,
                                         const api::Address &to,
                                         const api::TokenAmount &amount) {
  RequirePositive(amount, "release amount");
  if (subnet_.IsRoot()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "cannot release from root " + subnet_.ToString());
  }
  LOG_PROVIDER_INFO("releasing {} from {} to {}", amount.ToString(),
                    subnet_.ToString(), to.ToString());
  return caller_->release(gateway, from, to, amount);
}

void AccountSubnetManager::propagate(const api::SubnetID &subnet,
                                     const api::Address &gateway,
                                     const api::Address &from,
                                     const std::vector<uint8_t> &postbox_msg_key) {
  if (postbox_msg_key.empty()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "propagate needs a postbox message key");
  }
  LOG_PROVIDER_DEBUG("propagating postbox message in {}", subnet.ToString());
  caller_->propagate(gateway, from, postbox_msg_key);
}

void AccountSubnetManager::send_value(const api::Address &from,
                                      const api::Address &to,
                                      const api::TokenAmount &amount) {
  RequirePositive(amount, "value");
  LOG_PROVIDER_DEBUG("sending {} from {} to {}", amount.ToString(),
                     from.ToString(), to.ToString());
  caller_->send_value(from, to, amount);
}

api::TokenAmount AccountSubnetManager::wallet_balance(const api::Address &address) {
  return caller_->balance(address);
}

std::string AccountSubnetManager::get_chain_id() {
  return std::to_string(caller_->chain_id());
}

std::array<uint8_t, 32> AccountSubnetManager::get_commit_sha() {
  return caller_->commit_sha(gateway_addr_);
}

api::Asset
AccountSubnetManager::get_subnet_supply_source(const api::SubnetID &subnet) {
  return caller_->supply_source(ChildActor(subnet));
}

api::Asset
AccountSubnetManager::get_subnet_collateral_source(const api::SubnetID &subnet) {
  return caller_->collateral_source(ChildActor(subnet));
}

api::SubnetGenesisInfo
AccountSubnetManager::get_genesis_info(const api::SubnetID &subnet) {
  api::Address actor = ChildActor(subnet);
  LOG_PROVIDER_DEBUG("fetching genesis info of {}", subnet.ToString());
  return caller_->genesis_info(actor);
}

void AccountSubnetManager::add_bootstrap(const api::SubnetID &subnet,
                                         const api::Address &from,
                                         const std::string &endpoint) {
  if (endpoint.empty()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "bootstrap endpoint cannot be empty");
  }
  caller_->add_bootstrap(ChildActor(subnet), from, endpoint);
}

std::vector<std::string>
AccountSubnetManager::list_bootstrap_nodes(const api::SubnetID &subnet) {
  return caller_->bootstrap_nodes(ChildActor(subnet));
}

api::ValidatorInfo
AccountSubnetManager::get_validator_info(const api::SubnetID &subnet,
                                         const api::Address &validator) {
  return caller_->validator_info(ChildActor(subnet), validator);
}

std::vector<std::pair<api::Address, api::ValidatorInfo>>
AccountSubnetManager::list_validators(const api::SubnetID &subnet) {
  api::Address actor = ChildActor(subnet);
  std::vector<std::pair<api::Address, api::ValidatorInfo>> out;
  for (const auto &validator : caller_->validators(actor)) {
    out.emplace_back(validator, caller_->validator_info(actor, validator));
  }
  return out;
}

ChainEpoch AccountSubnetManager::set_federated_power(
    const api::Address &from, const api::SubnetID &subnet,
    const std::vector<api::Address> &validators,
    const std::vector<std::vector<uint8_t>> &public_keys,
    const std::vector<api::TokenAmount> &federated_power) {
  if (validators.size() != public_keys.size() ||
      validators.size() != federated_power.size()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "validators, public keys and power must have equal lengths");
  }
  api::Address actor = ChildActor(subnet);
  LOG_PROVIDER_INFO("setting federated power for {} validator(s) in {}",
                    validators.size(), subnet.ToString());
  return caller_->set_federated_power(actor, from, validators, public_keys,
                                      federated_power);
}

ChainEpoch AccountSubnetManager::submit_checkpoint(
    const api::Address &submitter, const api::BottomUpCheckpoint &checkpoint,
    const std::vector<api::Signature> &signatures,
    const std::vector<api::Address> &signatories) {
  if (signatures.size() != signatories.size()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "checkpoint has " + std::to_string(signatures.size()) +
                         " signature(s) for " +
                         std::to_string(signatories.size()) + " signatory(ies)");
  }
  api::Address actor = ChildActor(checkpoint.subnet_id);

  LOG_PROVIDER_INFO("submitting checkpoint of {} at height {}",
                    checkpoint.subnet_id.ToString(), checkpoint.block_height);
  return caller_->submit_checkpoint(actor, submitter, checkpoint, signatures,
                                    signatories);
}

ChainEpoch
AccountSubnetManager::last_bottom_up_checkpoint_height(const api::SubnetID &subnet) {
  return caller_->last_bottom_up_checkpoint_height(ChildActor(subnet));
}

ChainEpoch AccountSubnetManager::checkpoint_period(const api::SubnetID &subnet) {
  return caller_->checkpoint_period(ChildActor(subnet));
}

std::optional<api::BottomUpCheckpointBundle>
AccountSubnetManager::checkpoint_bundle_at(ChainEpoch height) {
  api::BottomUpCheckpointBundle bundle =
      caller_->checkpoint_bundle(gateway_addr_, height);
  if (bundle.checkpoint.subnet_id.IsUndefined()) {
    LOG_PROVIDER_TRACE("no checkpoint bundle at height {}", height);
    return std::nullopt;
  }
  return bundle;
}

std::vector<api::QuorumReachedEvent>
AccountSubnetManager::quorum_reached_events(ChainEpoch height) {
  auto events = caller_->quorum_reached_events(gateway_addr_, height);
  events.erase(std::remove_if(events.begin(), events.end(),
                              [height](const api::QuorumReachedEvent &e) {
                                return e.height != height;
                              }),
               events.end());
  return events;
}

ChainEpoch AccountSubnetManager::current_epoch() {
  return caller_->block_number();
}

ChainEpoch AccountSubnetManager::genesis_epoch(const api::SubnetID &subnet) {
  return caller_->genesis_epoch(ChildActor(subnet));
}

ChainEpoch AccountSubnetManager::chain_head_height() {
  return caller_->block_number();
}

TopDownQueryPayload<std::vector<api::IpcEnvelope>>
AccountSubnetManager::get_top_down_msgs(const api::SubnetID &subnet,
                                        ChainEpoch epoch) {
  ChildActor(subnet);
  auto msgs = caller_->top_down_msgs(gateway_addr_, subnet, epoch);
  auto hash = caller_->block_hash(epoch);
  LOG_PROVIDER_DEBUG("{} top-down message(s) for {} at epoch {}", msgs.size(),
                     subnet.ToString(), epoch);
  return {std::move(msgs), std::move(hash.block_hash)};
}

GetBlockHashResult AccountSubnetManager::get_block_hash(ChainEpoch height) {
  return caller_->block_hash(height);
}

TopDownQueryPayload<std::vector<api::StakingChangeRequest>>
AccountSubnetManager::get_validator_changeset(const api::SubnetID &subnet,
                                              ChainEpoch epoch) {
  api::Address actor = ChildActor(subnet);
  auto changes = caller_->validator_changes(actor, epoch);
  auto hash = caller_->block_hash(epoch);
  return {std::move(changes), std::move(hash.block_hash)};
}

ChainEpoch AccountSubnetManager::latest_parent_finality() {
  return caller_->latest_parent_finality(gateway_addr_);
}

RewardClaims AccountSubnetManager::query_reward_claims(
    const api::Address &validator, ChainEpoch from_checkpoint,
    ChainEpoch to_checkpoint) {
  if (from_checkpoint > to_checkpoint) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "reward query range is reversed");
  }
  return caller_->reward_claims(validator, from_checkpoint, to_checkpoint);
}

std::vector<std::pair<uint64_t, api::ValidatorData>>
AccountSubnetManager::query_validator_rewards(const api::Address &validator,
                                              ChainEpoch from_checkpoint,
                                              ChainEpoch to_checkpoint) {
  if (from_checkpoint > to_checkpoint) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "reward query range is reversed");
  }
  return caller_->validator_rewards(validator, from_checkpoint, to_checkpoint);
}

void AccountSubnetManager::batch_subnet_claim(
    const api::Address &submitter, const api::SubnetID &reward_claim_subnet,
    const api::SubnetID &reward_origin_subnet, const RewardClaims &claims) {
  api::Address actor = ChildActor(reward_claim_subnet);
  LOG_PROVIDER_INFO("claiming {} reward(s) on {} earned in {}", claims.size(),
                    reward_claim_subnet.ToString(),
                    reward_origin_subnet.ToString());
  caller_->batch_claim(actor, submitter, reward_origin_subnet, claims);
}

} // namespace provider
} // namespace ipc
