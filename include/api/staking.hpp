// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/address.hpp"
#include "api/token_amount.hpp"
#include <cstdint>
#include <vector>

namespace ipc {
namespace api {

struct ValidatorStakingInfo {
  TokenAmount current_power;
  TokenAmount next_power;
  std::vector<uint8_t> metadata;
};

struct ValidatorInfo {
  ValidatorStakingInfo staking;
  bool is_active = false;
  bool is_waiting = false;
};

enum class StakingOperation : uint8_t {
  Deposit = 0,
  Withdraw = 1,
  SetMetadata = 2,
  SetFederatedPower = 3,
};

struct StakingChange {
  StakingOperation op = StakingOperation::Deposit;
  std::vector<uint8_t> payload;
  Address validator;
};

/** Validator set delta recorded on the parent under a configuration number */
struct StakingChangeRequest {
  StakingChange change;
  uint64_t configuration_number = 0;
};

} // namespace api
} // namespace ipc
