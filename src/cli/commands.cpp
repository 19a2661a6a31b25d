// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/commands.hpp"
#include "api/error.hpp"
#include "cli/json_format.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <limits>

namespace ipc {
namespace cli {

using json = nlohmann::json;

namespace {

[[noreturn]] void BadOption(const std::string &key, const std::string &value,
                            const std::string &expected) {
  throw api::Error(api::ErrorKind::InvalidArgument,
                   "invalid --" + key + "=" + value + ": expected " + expected);
}

api::SubnetID SubnetOption(const CommandArgs &args, const std::string &key) {
  return api::SubnetID::FromString(args.Require(key));
}

api::TokenAmount AmountOption(const CommandArgs &args, const std::string &key) {
  std::string value = args.Require(key);
  auto amount = api::TokenAmount::FromDecimalString(value);
  if (!amount) {
    BadOption(key, value, "an integer amount of base units");
  }
  return *amount;
}

std::optional<api::TokenAmount> OptionalAmount(const CommandArgs &args,
                                               const std::string &key) {
  if (!args.Get(key)) {
    return std::nullopt;
  }
  return AmountOption(args, key);
}

std::optional<api::Address> AddressOption(const CommandArgs &args,
                                          const std::string &key) {
  auto value = args.Get(key);
  if (!value) {
    return std::nullopt;
  }
  return api::Address::ParseAny(*value);
}

uint64_t UintOption(const CommandArgs &args, const std::string &key,
                    std::optional<uint64_t> fallback = std::nullopt) {
  auto value = args.Get(key);
  if (!value) {
    if (fallback) {
      return *fallback;
    }
    value = args.Require(key);
  }
  auto parsed = util::SafeParseUint64(*value);
  if (!parsed) {
    BadOption(key, *value, "an unsigned integer");
  }
  return *parsed;
}

template <typename T>
T NarrowOption(const CommandArgs &args, const std::string &key, T fallback) {
  uint64_t value = UintOption(args, key, fallback);
  if (value > std::numeric_limits<T>::max()) {
    BadOption(key, std::to_string(value),
              "at most " + std::to_string(std::numeric_limits<T>::max()));
  }
  return static_cast<T>(value);
}

api::ChainEpoch EpochOption(const CommandArgs &args, const std::string &key) {
  std::string value = args.Require(key);
  auto epoch = util::SafeParseInt64(value, 0, std::numeric_limits<int64_t>::max());
  if (!epoch) {
    BadOption(key, value, "a non-negative block height");
  }
  return *epoch;
}

std::vector<uint8_t> HexOption(const CommandArgs &args, const std::string &key) {
  std::string value = args.Require(key);
  auto bytes = util::ParseHex(value);
  if (!bytes || bytes->empty()) {
    BadOption(key, value, "hex bytes");
  }
  return *bytes;
}

api::PermissionMode PermissionModeOption(const CommandArgs &args) {
  std::string value = args.Get("permission-mode").value_or("collateral");
  if (value == "collateral") {
    return api::PermissionMode::Collateral;
  }
  if (value == "federated") {
    return api::PermissionMode::Federated;
  }
  if (value == "static") {
    return api::PermissionMode::Static;
  }
  BadOption("permission-mode", value, "collateral, federated or static");
}

std::string SubjectParam(const CommandArgs &args, const std::string &key) {
  if (!args.params.empty()) {
    return args.params.front();
  }
  return args.Require(key);
}

} // namespace

std::optional<std::string> CommandArgs::Get(const std::string &key) const {
  auto it = options.find(key);
  if (it == options.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string CommandArgs::Require(const std::string &key) const {
  auto value = Get(key);
  if (!value) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "missing required option --" + key);
  }
  return *value;
}

CommandArgs ParseCommandArgs(const std::vector<std::string> &words) {
  CommandArgs args;
  for (const auto &word : words) {
    if (word.rfind("--", 0) == 0) {
      std::string body = word.substr(2);
      size_t eq = body.find('=');
      if (eq == std::string::npos || eq == 0) {
        throw api::Error(api::ErrorKind::InvalidArgument,
                         "options take the form --key=value, got " + word);
      }
      args.options[body.substr(0, eq)] = body.substr(eq + 1);
    } else {
      args.params.push_back(word);
    }
  }
  return args;
}

CommandRunner::CommandRunner(ProviderAccessor provider)
    : provider_(std::move(provider)) {
  handlers_["subnet parse"] = [this](const auto &a) { return HandleSubnetParse(a); };
  handlers_["subnet create"] = [this](const auto &a) {
    return HandleSubnetCreate(a);
  };
  handlers_["subnet join"] = [this](const auto &a) { return HandleSubnetJoin(a); };
  handlers_["subnet genesis-info"] = [this](const auto &a) {
    return HandleSubnetGenesisInfo(a);
  };
  handlers_["subnet list"] = [this](const auto &a) { return HandleSubnetList(a); };
  handlers_["crossmsg fund"] = [this](const auto &a) {
    return HandleCrossMsgFund(a);
  };
  handlers_["crossmsg pre-fund"] = [this](const auto &a) {
    return HandleCrossMsgPreFund(a);
  };
  handlers_["crossmsg topdown-msgs"] = [this](const auto &a) {
    return HandleCrossMsgTopDownMsgs(a);
  };
}

bool CommandRunner::HasCommand(const std::string &name) const {
  return handlers_.count(name) > 0;
}

std::vector<std::string> CommandRunner::CommandNames() const {
  std::vector<std::string> names;
  for (const auto &[name, handler] : handlers_) {
    names.push_back(name);
  }
  return names;
}

json CommandRunner::Execute(const std::string &name, const CommandArgs &args) {
  auto it = handlers_.find(name);
  if (it == handlers_.end()) {
    throw api::Error(api::ErrorKind::InvalidArgument, "unknown command: " + name);
  }
  LOG_CLI_INFO("running '{}'", name);
  return it->second(args);
}

json CommandRunner::HandleSubnetParse(const CommandArgs &args) {
  std::string text = SubjectParam(args, "id");
  if (text.find(':') == std::string::npos) {
    return SubnetIdToJson(api::SubnetID::FromString(text));
  }

  auto universal = api::UniversalSubnetId::FromString(text);
  json out = UniversalSubnetIdToJson(universal);
  if (universal.root().name_space == api::EIP155_NAMESPACE) {
    out["subnet"] = SubnetIdToJson(universal.ToSubnetId());
  } else {
    out["subnet"] = nullptr;
  }
  return out;
}

json CommandRunner::HandleSubnetCreate(const CommandArgs &args) {
  api::SubnetID parent = SubnetOption(args, "parent");
  auto from = AddressOption(args, "from");

  api::ConstructParams params;
  if (parent.GetNetworkType() == api::NetworkType::AccountChain) {
    const provider::Subnet *configured = provider_().config().GetSubnet(parent);
    if (!configured) {
      throw api::Error(api::ErrorKind::InvalidArgument,
                       "subnet " + parent.ToString() + " is not configured");
    }
    api::AccountConstructParams account;
    account.parent = parent;
    account.ipc_gateway_addr = configured->gateway_addr().value_or(api::Address());
    account.min_validators = UintOption(args, "min-validators");
    account.min_validator_stake = AmountOption(args, "min-validator-stake");
    account.bottomup_check_period = EpochOption(args, "bottomup-check-period");
    account.active_validators_limit =
        NarrowOption<uint16_t>(args, "active-validators-limit", 100);
    account.majority_percentage =
        NarrowOption<uint8_t>(args, "majority-percentage", 67);
    account.permission_mode = PermissionModeOption(args);
    params = std::move(account);
  } else {
    api::UtxoConstructParams utxo;
    utxo.parent = parent;
    utxo.min_validators = UintOption(args, "min-validators");
    utxo.min_validator_stake = AmountOption(args, "min-validator-stake");
    utxo.bottomup_check_period = EpochOption(args, "bottomup-check-period");
    utxo.active_validators_limit =
        NarrowOption<uint16_t>(args, "active-validators-limit", 100);
    utxo.min_cross_msg_fee =
        OptionalAmount(args, "min-cross-msg-fee").value_or(api::TokenAmount());
    if (auto whitelist = args.Get("whitelist")) {
      utxo.validator_whitelist = util::SplitString(*whitelist, ',');
    }
    params = std::move(utxo);
  }

  api::Address actor = provider_().CreateSubnet(from, params);
  return {{"subnet_actor", actor.ToString()},
          {"subnet_id", api::SubnetID::NewFromParent(parent, actor).ToString()}};
}

json CommandRunner::HandleSubnetJoin(const CommandArgs &args) {
  api::SubnetID subnet = SubnetOption(args, "subnet");
  auto from = AddressOption(args, "from");

  api::JoinParams params;
  if (subnet.ParentNetworkType() == api::NetworkType::UtxoChain) {
    api::UtxoJoinParams utxo;
    utxo.collateral = AmountOption(args, "collateral");
    utxo.ip = args.Require("ip");
    utxo.backup_address = args.Require("backup-address");
    utxo.public_key = HexOption(args, "public-key");
    params = std::move(utxo);
  } else {
    api::AccountJoinParams account;
    account.collateral = AmountOption(args, "collateral");
    account.public_key = HexOption(args, "public-key");
    params = std::move(account);
  }

  api::ChainEpoch epoch = provider_().JoinSubnet(subnet, from, params);
  return {{"subnet_id", subnet.ToString()}, {"epoch", epoch}};
}

json CommandRunner::HandleSubnetGenesisInfo(const CommandArgs &args) {
  api::SubnetID subnet = api::SubnetID::FromString(SubjectParam(args, "subnet"));
  return GenesisInfoToJson(provider_().GetGenesisInfo(subnet));
}

json CommandRunner::HandleSubnetList(const CommandArgs &args) {
  api::SubnetID parent = api::SubnetID::FromString(SubjectParam(args, "parent"));
  return SubnetInfosToJson(provider_().ListChildSubnets(parent));
}

json CommandRunner::HandleCrossMsgFund(const CommandArgs &args) {
  api::SubnetID subnet = SubnetOption(args, "subnet");
  api::ChainEpoch epoch =
      provider_().Fund(subnet, AddressOption(args, "from"),
                       AddressOption(args, "to"), AmountOption(args, "amount"));
  return {{"subnet_id", subnet.ToString()}, {"epoch", epoch}};
}

json CommandRunner::HandleCrossMsgPreFund(const CommandArgs &args) {
  api::SubnetID subnet = SubnetOption(args, "subnet");
  provider_().PreFund(subnet, AddressOption(args, "from"),
                      AmountOption(args, "amount"));
  return {{"subnet_id", subnet.ToString()}, {"status", "ok"}};
}

json CommandRunner::HandleCrossMsgTopDownMsgs(const CommandArgs &args) {
  api::SubnetID subnet = SubnetOption(args, "subnet");
  api::ChainEpoch epoch = EpochOption(args, "epoch");
  return TopDownMsgsToJson(provider_().GetTopDownMsgs(subnet, epoch));
}

} // namespace cli
} // namespace ipc
