// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/address.hpp"
#include "api/cross.hpp"
#include "api/subnet_id.hpp"
#include "api/token_amount.hpp"
#include <cstdint>
#include <vector>

namespace ipc {
namespace api {

using ChainEpoch = int64_t;
using Signature = std::vector<uint8_t>;

/**
 * Periodic summary of a child subnet submitted to its parent
 *
 * block_hash commits to the child block at block_height; msgs are the
 * bottom-up envelopes of the interval and next_configuration_number the
 * validator configuration the parent should adopt.
 */
struct BottomUpCheckpoint {
  SubnetID subnet_id;
  ChainEpoch block_height = 0;
  std::vector<uint8_t> block_hash;
  uint64_t next_configuration_number = 0;
  std::vector<IpcEnvelope> msgs;
};

/** Checkpoint with the aggregated validator signatures over it */
struct BottomUpCheckpointBundle {
  BottomUpCheckpoint checkpoint;
  std::vector<Signature> signatures;
  std::vector<Address> signatories;
};

/** Quorum certificate: enough weight signed the checkpoint at height */
struct QuorumReachedEvent {
  ChainEpoch height = 0;
  std::vector<uint8_t> checkpoint;
  TokenAmount quorum_weight;
};

/** Per-validator activity attributed to one checkpoint */
struct ValidatorData {
  Address validator;
  uint64_t blocks_committed = 0;
};

/** Reward claim with its inclusion proof in the checkpoint's activity tree */
struct ValidatorClaim {
  ValidatorData data;
  std::vector<std::vector<uint8_t>> proof;
};

} // namespace api
} // namespace ipc
