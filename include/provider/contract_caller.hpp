// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "provider/subnet_manager.hpp"
#include <array>
#include <functional>
#include <memory>
#include <vector>

namespace ipc {
namespace provider {

struct AccountSubnetConfig;

/**
 * ContractCaller - typed calls into the gateway, registry and subnet
 * actor contracts of an account-model chain
 *
 * This is the seam to ABI bindings and transaction signing, which live
 * outside this library. AccountSubnetManager validates arguments and
 * then forwards here; implementations only encode, send and decode.
 * Failures are reported by throwing api::Error (or a subclass).
 */
class ContractCaller {
public:
  virtual ~ContractCaller() = default;

  // Registry
  virtual api::Address
  deploy_subnet_actor(const api::Address &from,
                      const api::AccountConstructParams &params) = 0;

  // Subnet actor
  virtual ChainEpoch join(const api::Address &subnet_actor,
                          const api::Address &from,
                          const api::TokenAmount &collateral,
                          const std::vector<uint8_t> &public_key) = 0;
  virtual void pre_fund(const api::Address &subnet_actor,
                        const api::Address &from,
                        const api::TokenAmount &amount) = 0;
  virtual void pre_release(const api::Address &subnet_actor,
                           const api::Address &from,
                           const api::TokenAmount &amount) = 0;
  virtual void stake(const api::Address &subnet_actor, const api::Address &from,
                     const api::TokenAmount &amount) = 0;
  virtual void unstake(const api::Address &subnet_actor,
                       const api::Address &from,
                       const api::TokenAmount &amount) = 0;
  virtual void leave(const api::Address &subnet_actor,
                     const api::Address &from) = 0;
  virtual void kill(const api::Address &subnet_actor,
                    const api::Address &from) = 0;
  virtual void claim_collateral(const api::Address &subnet_actor,
                                const api::Address &from) = 0;
  virtual api::SubnetGenesisInfo
  genesis_info(const api::Address &subnet_actor) = 0;
  virtual api::Asset supply_source(const api::Address &subnet_actor) = 0;
  virtual api::Asset collateral_source(const api::Address &subnet_actor) = 0;
  virtual void add_bootstrap(const api::Address &subnet_actor,
                             const api::Address &from,
                             const std::string &endpoint) = 0;
  virtual std::vector<std::string>
  bootstrap_nodes(const api::Address &subnet_actor) = 0;
  virtual api::ValidatorInfo validator_info(const api::Address &subnet_actor,
                                            const api::Address &validator) = 0;
  virtual std::vector<api::Address>
  validators(const api::Address &subnet_actor) = 0;
  virtual ChainEpoch
  set_federated_power(const api::Address &subnet_actor,
                      const api::Address &from,
                      const std::vector<api::Address> &validators,
                      const std::vector<std::vector<uint8_t>> &public_keys,
                      const std::vector<api::TokenAmount> &power) = 0;
  virtual ChainEpoch
  submit_checkpoint(const api::Address &subnet_actor,
                    const api::Address &submitter,
                    const api::BottomUpCheckpoint &checkpoint,
                    const std::vector<api::Signature> &signatures,
                    const std::vector<api::Address> &signatories) = 0;
  virtual ChainEpoch
  last_bottom_up_checkpoint_height(const api::Address &subnet_actor) = 0;
  virtual ChainEpoch checkpoint_period(const api::Address &subnet_actor) = 0;
  virtual ChainEpoch genesis_epoch(const api::Address &subnet_actor) = 0;
  virtual std::vector<std::pair<uint64_t, api::ValidatorClaim>>
  reward_claims(const api::Address &validator, ChainEpoch from_checkpoint,
                ChainEpoch to_checkpoint) = 0;
  virtual std::vector<std::pair<uint64_t, api::ValidatorData>>
  validator_rewards(const api::Address &validator, ChainEpoch from_checkpoint,
                    ChainEpoch to_checkpoint) = 0;
  virtual void batch_claim(const api::Address &subnet_actor,
                           const api::Address &submitter,
                           const api::SubnetID &reward_origin_subnet,
                           const RewardClaims &claims) = 0;

  // Gateway
  virtual std::vector<api::SubnetInfo>
  list_subnets(const api::Address &gateway) = 0;
  virtual ChainEpoch fund(const api::Address &gateway,
                          const api::SubnetID &subnet, const api::Address &from,
                          const api::Address &to,
                          const api::TokenAmount &amount) = 0;
  virtual ChainEpoch approve_token(const api::Address &token,
                                   const api::Address &from,
                                   const api::Address &spender,
                                   const api::TokenAmount &amount) = 0;
  virtual ChainEpoch fund_with_token(const api::Address &gateway,
                                     const api::SubnetID &subnet,
                                     const api::Address &from,
                                     const api::Address &to,
                                     const api::TokenAmount &amount) = 0;
  virtual ChainEpoch release(const api::Address &gateway,
                             const api::Address &from, const api::Address &to,
                             const api::TokenAmount &amount) = 0;
  virtual void propagate(const api::Address &gateway, const api::Address &from,
                         const std::vector<uint8_t> &postbox_msg_key) = 0;
  /**
   * Bundle stored for height. An unassembled height yields a bundle whose
   * checkpoint subnet is the undefined id.
   */
  virtual api::BottomUpCheckpointBundle
  checkpoint_bundle(const api::Address &gateway, ChainEpoch height) = 0;
  /** Quorum events emitted in the block at height */
  virtual std::vector<api::QuorumReachedEvent>
  quorum_reached_events(const api::Address &gateway, ChainEpoch height) = 0;
  virtual std::vector<api::IpcEnvelope>
  top_down_msgs(const api::Address &gateway, const api::SubnetID &subnet,
                ChainEpoch epoch) = 0;
  virtual std::vector<api::StakingChangeRequest>
  validator_changes(const api::Address &subnet_actor, ChainEpoch epoch) = 0;
  virtual ChainEpoch latest_parent_finality(const api::Address &gateway) = 0;
  virtual std::array<uint8_t, 32> commit_sha(const api::Address &gateway) = 0;

  // Chain
  virtual uint64_t chain_id() = 0;
  virtual ChainEpoch block_number() = 0;
  virtual GetBlockHashResult block_hash(ChainEpoch height) = 0;
  virtual api::TokenAmount balance(const api::Address &address) = 0;
  virtual void send_value(const api::Address &from, const api::Address &to,
                          const api::TokenAmount &amount) = 0;
};

/** Builds the contract caller for one configured account-chain subnet */
using ContractCallerFactory = std::function<std::unique_ptr<ContractCaller>(
    const api::SubnetID &subnet, const AccountSubnetConfig &config)>;

} // namespace provider
} // namespace ipc
