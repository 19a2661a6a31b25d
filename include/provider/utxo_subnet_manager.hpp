// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "provider/subnet_manager.hpp"
#include "rpc/json_rpc_client.hpp"
#include <memory>
#include <nlohmann/json.hpp>

namespace ipc {
namespace provider {

/**
 * SubnetManager for UTXO chains, backed by the chain's IPC node
 *
 * Each supported operation is one JSON-RPC call (createsubnet,
 * joinsubnet, prefundsubnet, fundsubnet, getgenesisinfo,
 * getrootnetmessages); the result object is checked field by field and
 * translated into the common data model. Everything the node has no
 * method for fails with ErrorKind::UnsupportedOperation. Amounts are
 * satoshis and must fit in 64 bits.
 */
class UtxoSubnetManager : public SubnetManager {
public:
  /** Labels the node uses for top-down message kinds */
  static constexpr const char *FUND_MSG_KIND = "fund";
  static constexpr uint8_t MAJORITY_PERCENTAGE = 66;

  UtxoSubnetManager(api::SubnetID subnet,
                    std::unique_ptr<rpc::HttpTransport> transport);

  const api::SubnetID &subnet() const { return subnet_; }

  api::NetworkType network_type() const override {
    return api::NetworkType::UtxoChain;
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
  /** Parent block height the subnet bootstrapped at */
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
   * Hex identifier the node knows a direct child by
   * @throws api::Error(InvalidArgument) for other subnets
   */
  std::string WireSubnetId(const api::SubnetID &child) const;
  /** getgenesisinfo result, checked to be bootstrapped */
  nlohmann::json FetchGenesis(const api::SubnetID &subnet);

  rpc::JsonRpcClient client_;
  api::SubnetID subnet_;
};

} // namespace provider
} // namespace ipc
