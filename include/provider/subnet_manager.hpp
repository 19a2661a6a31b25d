// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/address.hpp"
#include "api/checkpoint.hpp"
#include "api/cross.hpp"
#include "api/staking.hpp"
#include "api/subnet.hpp"
#include "api/subnet_id.hpp"
#include "api/token_amount.hpp"
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ipc {
namespace provider {

using api::ChainEpoch;

/** Query result paired with the parent block it was observed in */
template <typename T> struct TopDownQueryPayload {
  T value;
  std::vector<uint8_t> block_hash;
};

struct GetBlockHashResult {
  std::vector<uint8_t> parent_block_hash;
  std::vector<uint8_t> block_hash;
};

/**
 * Publishing and tracking bottom-up checkpoints on the parent
 */
class BottomUpCheckpointRelayer {
public:
  virtual ~BottomUpCheckpointRelayer() = default;

  /**
   * Submit a quorum-certified checkpoint
   * @return epoch the submission landed in
   */
  virtual ChainEpoch
  submit_checkpoint(const api::Address &submitter,
                    const api::BottomUpCheckpoint &checkpoint,
                    const std::vector<api::Signature> &signatures,
                    const std::vector<api::Address> &signatories) = 0;

  virtual ChainEpoch
  last_bottom_up_checkpoint_height(const api::SubnetID &subnet) = 0;

  virtual ChainEpoch checkpoint_period(const api::SubnetID &subnet) = 0;

  /** None while no bundle has been assembled for height */
  virtual std::optional<api::BottomUpCheckpointBundle>
  checkpoint_bundle_at(ChainEpoch height) = 0;

  virtual std::vector<api::QuorumReachedEvent>
  quorum_reached_events(ChainEpoch height) = 0;

  virtual ChainEpoch current_epoch() = 0;
};

/**
 * Parent-side data a child needs to commit top-down finality
 */
class TopDownFinalityQuery {
public:
  virtual ~TopDownFinalityQuery() = default;

  /** Parent epoch the subnet was created in */
  virtual ChainEpoch genesis_epoch(const api::SubnetID &subnet) = 0;

  virtual ChainEpoch chain_head_height() = 0;

  virtual TopDownQueryPayload<std::vector<api::IpcEnvelope>>
  get_top_down_msgs(const api::SubnetID &subnet, ChainEpoch epoch) = 0;

  virtual GetBlockHashResult get_block_hash(ChainEpoch height) = 0;

  virtual TopDownQueryPayload<std::vector<api::StakingChangeRequest>>
  get_validator_changeset(const api::SubnetID &subnet, ChainEpoch epoch) = 0;

  /** Highest parent height already committed into the child */
  virtual ChainEpoch latest_parent_finality() = 0;
};

using RewardClaims = std::vector<std::pair<uint64_t, api::ValidatorClaim>>;

/**
 * Validator reward claims, indexed by checkpoint height
 */
class ValidatorRewarder {
public:
  virtual ~ValidatorRewarder() = default;

  virtual RewardClaims query_reward_claims(const api::Address &validator,
                                           ChainEpoch from_checkpoint,
                                           ChainEpoch to_checkpoint) = 0;

  virtual std::vector<std::pair<uint64_t, api::ValidatorData>>
  query_validator_rewards(const api::Address &validator,
                          ChainEpoch from_checkpoint,
                          ChainEpoch to_checkpoint) = 0;

  /**
   * Claim on reward_claim_subnet the rewards earned on
   * reward_origin_subnet
   */
  virtual void batch_subnet_claim(const api::Address &submitter,
                                  const api::SubnetID &reward_claim_subnet,
                                  const api::SubnetID &reward_origin_subnet,
                                  const RewardClaims &claims) = 0;
};

/**
 * SubnetManager - subnet lifecycle on one backend connection
 *
 * One implementation per root ecosystem. Parameters that come in
 * ecosystem-tagged variants must carry this manager's own tag; a
 * mismatch fails with ErrorKind::UnsupportedConversion before anything
 * is sent. Operations a backend cannot perform fail with
 * ErrorKind::UnsupportedOperation.
 *
 * Calls block on the transport. An instance serves one call at a time
 * and holds no state beyond its connection, so an abandoned call leaves
 * it usable.
 */
class SubnetManager : public BottomUpCheckpointRelayer,
                      public TopDownFinalityQuery,
                      public ValidatorRewarder {
public:
  ~SubnetManager() override = default;

  /** Ecosystem of the chain this manager talks to */
  virtual api::NetworkType network_type() const = 0;

  /** @return address of the new subnet actor */
  virtual api::Address create_subnet(const api::Address &from,
                                     const api::ConstructParams &params) = 0;

  /** @return epoch the join was registered in */
  virtual ChainEpoch join_subnet(const api::SubnetID &subnet,
                                 const api::Address &from,
                                 const api::JoinParams &params) = 0;

  /** Genesis balance for from, before the subnet bootstraps */
  virtual void pre_fund(const api::SubnetID &subnet, const api::Address &from,
                        const api::TokenAmount &balance) = 0;
  virtual void pre_release(const api::SubnetID &subnet,
                           const api::Address &from,
                           const api::TokenAmount &amount) = 0;

  virtual void stake(const api::SubnetID &subnet, const api::Address &from,
                     const api::TokenAmount &collateral) = 0;
  virtual void unstake(const api::SubnetID &subnet, const api::Address &from,
                       const api::TokenAmount &collateral) = 0;
  virtual void leave_subnet(const api::SubnetID &subnet,
                            const api::Address &from) = 0;
  virtual void kill_subnet(const api::SubnetID &subnet,
                           const api::Address &from) = 0;
  virtual void claim_collateral(const api::SubnetID &subnet,
                                const api::Address &from) = 0;

  virtual std::map<api::SubnetID, api::SubnetInfo>
  list_child_subnets(const api::Address &gateway) = 0;

  /** Top-down transfer into subnet; @return epoch of the deposit */
  virtual ChainEpoch fund(const api::SubnetID &subnet,
                          const api::Address &gateway,
                          const api::Address &from, const api::Address &to,
                          const api::TokenAmount &amount) = 0;
  virtual ChainEpoch approve_token(const api::SubnetID &subnet,
                                   const api::Address &from,
                                   const api::TokenAmount &amount) = 0;
  virtual ChainEpoch fund_with_token(const api::SubnetID &subnet,
                                     const api::Address &from,
                                     const api::Address &to,
                                     const api::TokenAmount &amount) = 0;
  /** Bottom-up transfer out of this subnet */
  virtual ChainEpoch release(const api::Address &gateway,
                             const api::Address &from, const api::Address &to,
                             const api::TokenAmount &amount) = 0;
  virtual void propagate(const api::SubnetID &subnet,
                         const api::Address &gateway, const api::Address &from,
                         const std::vector<uint8_t> &postbox_msg_key) = 0;

  virtual void send_value(const api::Address &from, const api::Address &to,
                          const api::TokenAmount &amount) = 0;
  virtual api::TokenAmount wallet_balance(const api::Address &address) = 0;

  virtual std::string get_chain_id() = 0;
  virtual std::array<uint8_t, 32> get_commit_sha() = 0;

  virtual api::Asset get_subnet_supply_source(const api::SubnetID &subnet) = 0;
  virtual api::Asset
  get_subnet_collateral_source(const api::SubnetID &subnet) = 0;

  virtual api::SubnetGenesisInfo
  get_genesis_info(const api::SubnetID &subnet) = 0;

  virtual void add_bootstrap(const api::SubnetID &subnet,
                             const api::Address &from,
                             const std::string &endpoint) = 0;
  virtual std::vector<std::string>
  list_bootstrap_nodes(const api::SubnetID &subnet) = 0;

  virtual api::ValidatorInfo
  get_validator_info(const api::SubnetID &subnet,
                     const api::Address &validator) = 0;
  virtual std::vector<std::pair<api::Address, api::ValidatorInfo>>
  list_validators(const api::SubnetID &subnet) = 0;

  /**
   * Assign power in a federated subnet. The three vectors are parallel.
   * @return epoch the update landed in
   */
  virtual ChainEpoch
  set_federated_power(const api::Address &from, const api::SubnetID &subnet,
                      const std::vector<api::Address> &validators,
                      const std::vector<std::vector<uint8_t>> &public_keys,
                      const std::vector<api::TokenAmount> &federated_power) = 0;
};

} // namespace provider
} // namespace ipc
