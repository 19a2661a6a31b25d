// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "provider/contract_caller.hpp"
#include "provider/subnet_manager.hpp"
#include <memory>

namespace ipc {
namespace provider {

/**
 * SubnetManager for account-model chains
 *
 * Connected to the chain of `subnet`, it manages that chain's children
 * through the gateway and registry contracts. Arguments are checked
 * locally (parameter tags, positive amounts, parent relationships)
 * before anything reaches the ContractCaller, which this manager owns.
 */
class AccountSubnetManager : public SubnetManager {
public:
  AccountSubnetManager(api::SubnetID subnet, api::Address gateway_addr,
                       api::Address registry_addr,
                       std::unique_ptr<ContractCaller> caller);

  const api::SubnetID &subnet() const { return subnet_; }

  api::NetworkType network_type() const override {
    return api::NetworkType::AccountChain;
  }

  // SubnetManager
  api::Address create_subnet(const api::Address &from,
                             const api::ConstructParams &params) override;
  ChainEpoch join_subnet(const api::SubnetID &subnet, const api::Address &from,
                         const api::JoinParams &params) override;
  void pre_fund(const api::SubnetID &subnet, const api::Address &from,
                const api::TokenAmount &balance) override;
  void pre_release(const api::SubnetID &subnet, const api::Address &from,
                   const api::TokenAmount &amount) override;
  void stake(const api::SubnetID &subnet, const api::Address &from,
             const api::TokenAmount &collateral) override;
  void unstake(const api::SubnetID &subnet, const api::Address &from,
               const api::TokenAmount &collateral) override;
  void leave_subnet(const api::SubnetID &subnet,
                    const api::Address &from) override;
  void kill_subnet(const api::SubnetID &subnet,
                   const api::Address &from) override;
  void claim_collateral(const api::SubnetID &subnet,
                        const api::Address &from) override;
  std::map<api::SubnetID, api::SubnetInfo>
  list_child_subnets(const api::Address &gateway) override;
  ChainEpoch fund(const api::SubnetID &subnet, const api::Address &gateway,
                  const api::Address &from, const api::Address &to,
                  const api::TokenAmount &amount) override;
  ChainEpoch approve_token(const api::SubnetID &subnet,
                           const api::Address &from,
                           const api::TokenAmount &amount) override;
  ChainEpoch fund_with_token(const api::SubnetID &subnet,
                             const api::Address &from, const api::Address &to,
                             const api::TokenAmount &amount) override;
  ChainEpoch release(const api::Address &gateway, const api::Address &from,
                     const api::Address &to,
                     const api::TokenAmount &amount) override;
  void propagate(const api::SubnetID &subnet, const api::Address &gateway,
                 const api::Address &from,
                 const std::vector<uint8_t> &postbox_msg_key) override;
  void send_value(const api::Address &from, const api::Address &to,
                  const api::TokenAmount &amount) override;
  api::TokenAmount wallet_balance(const api::Address &address) override;
  std::string get_chain_id() override;
  std::array<uint8_t, 32> get_commit_sha() override;
  api::Asset get_subnet_supply_source(const api::SubnetID &subnet) override;
  api::Asset get_subnet_collateral_source(const api::SubnetID &subnet) override;
  api::SubnetGenesisInfo get_genesis_info(const api::SubnetID &subnet) override;
  void add_bootstrap(const api::SubnetID &subnet, const api::Address &from,
                     const std::string &endpoint) override;
  std::vector<std::string>
  list_bootstrap_nodes(const api::SubnetID &subnet) override;
  api::ValidatorInfo get_validator_info(const api::SubnetID &subnet,
                                        const api::Address &validator) override;
  std::vector<std::pair<api::Address, api::ValidatorInfo>>
  list_validators(const api::SubnetID &subnet) override;
  ChainEpoch set_federated_power(
      const api::Address &from, const api::SubnetID &subnet,
      const std::vector<api::Address> &validators,
      const std::vector<std::vector<uint8_t>> &public_keys,
      const std::vector<api::TokenAmount> &federated_power) override;

  // BottomUpCheckpointRelayer
  ChainEpoch submit_checkpoint(
      const api::Address &submitter, const api::BottomUpCheckpoint &checkpoint,
      const std::vector<api::Signature> &signatures,
      const std::vector<api::Address> &signatories) override;
  ChainEpoch
  last_bottom_up_checkpoint_height(const api::SubnetID &subnet) override;
  ChainEpoch checkpoint_period(const api::SubnetID &subnet) override;
  std::optional<api::BottomUpCheckpointBundle>
  checkpoint_bundle_at(ChainEpoch height) override;
  std::vector<api::QuorumReachedEvent>
  quorum_reached_events(ChainEpoch height) override;
  ChainEpoch current_epoch() override;

  // TopDownFinalityQuery
  ChainEpoch genesis_epoch(const api::SubnetID &subnet) override;
  ChainEpoch chain_head_height() override;
  TopDownQueryPayload<std::vector<api::IpcEnvelope>>
  get_top_down_msgs(const api::SubnetID &subnet, ChainEpoch epoch) override;
  GetBlockHashResult get_block_hash(ChainEpoch height) override;
  TopDownQueryPayload<std::vector<api::StakingChangeRequest>>
  get_validator_changeset(const api::SubnetID &subnet,
                          ChainEpoch epoch) override;
  ChainEpoch latest_parent_finality() override;

  // ValidatorRewarder
  RewardClaims query_reward_claims(const api::Address &validator,
                                   ChainEpoch from_checkpoint,
                                   ChainEpoch to_checkpoint) override;
  std::vector<std::pair<uint64_t, api::ValidatorData>>
  query_validator_rewards(const api::Address &validator,
                          ChainEpoch from_checkpoint,
                          ChainEpoch to_checkpoint) override;
  void batch_subnet_claim(const api::Address &submitter,
                          const api::SubnetID &reward_claim_subnet,
                          const api::SubnetID &reward_origin_subnet,
                          const RewardClaims &claims) override;

private:
  /**
   * Subnet actor of a direct child of the connected subnet
   * @throws api::Error(InvalidArgument) for any other subnet
   */
  api::Address ChildActor(const api::SubnetID &child) const;

  api::SubnetID subnet_;
  api::Address gateway_addr_;
  api::Address registry_addr_;
  std::unique_ptr<ContractCaller> caller_;
};

} // namespace provider
} // namespace ipc
