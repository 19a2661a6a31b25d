// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "provider/config.hpp"
#include "api/error.hpp"
#include "util/logging.hpp"
#include <fstream>

namespace ipc {
namespace provider {

using json = nlohmann::json;

namespace {

[[noreturn]] void ConfigError(const std::string &entry,
                              const std::string &problem) {
  throw api::Error(api::ErrorKind::InvalidArgument,
                   "config " + entry + ": " + problem);
}

std::string RequireString(const json &obj, const char *key,
                          const std::string &entry) {
  if (!obj.contains(key)) {
    ConfigError(entry, std::string("missing field '") + key + "'");
  }
  if (!obj[key].is_string()) {
    ConfigError(entry, std::string("field '") + key + "' must be a string");
  }
  return obj[key].get<std::string>();
}

std::optional<std::string> OptionalString(const json &obj, const char *key,
                                          const std::string &entry) {
  if (!obj.contains(key) || obj[key].is_null()) {
    return std::nullopt;
  }
  if (!obj[key].is_string()) {
    ConfigError(entry, std::string("field '") + key + "' must be a string");
  }
  return obj[key].get<std::string>();
}

std::optional<std::chrono::milliseconds> OptionalTimeout(const json &obj,
                                                         const std::string &entry) {
  if (!obj.contains("rpc_timeout_ms") || obj["rpc_timeout_ms"].is_null()) {
    return std::nullopt;
  }
  const json &value = obj["rpc_timeout_ms"];
  if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
    ConfigError(entry, "field 'rpc_timeout_ms' must be a positive integer");
  }
  return std::chrono::milliseconds(value.get<int64_t>());
}

api::Address RequireAddress(const json &obj, const char *key,
                            const std::string &entry) {
  std::string text = RequireString(obj, key, entry);
  try {
    return api::Address::ParseAny(text);
  } catch (const api::Error &e) {
    ConfigError(entry, std::string("field '") + key + "': " + e.what());
  }
}

Subnet ParseSubnet(const json &item, size_t index) {
  std::string entry = "subnets[" + std::to_string(index) + "]";
  if (!item.is_object()) {
    ConfigError(entry, "must be an object");
  }

  Subnet subnet;
  std::string id_text = RequireString(item, "id", entry);
  try {
    subnet.id = api::SubnetID::FromString(id_text);
  } catch (const api::InvalidIdError &e) {
    ConfigError(entry, std::string("field 'id': ") + e.what());
  }
  entry += " (" + id_text + ")";

  if (auto universal = OptionalString(item, "universal_id", entry)) {
    try {
      subnet.universal_id = api::UniversalSubnetId::FromString(*universal);
    } catch (const api::InvalidIdError &e) {
      ConfigError(entry, std::string("field 'universal_id': ") + e.what());
    }
  }

  if (auto sender = OptionalString(item, "default_sender", entry)) {
    try {
      subnet.default_sender = api::Address::ParseAny(*sender);
    } catch (const api::Error &e) {
      ConfigError(entry, std::string("field 'default_sender': ") + e.what());
    }
  }

  if (!item.contains("config") || !item["config"].is_object()) {
    ConfigError(entry, "missing object field 'config'");
  }
  const json &cfg = item["config"];
  std::string network_type = RequireString(cfg, "network_type", entry);

  if (network_type == "account") {
    AccountSubnetConfig account;
    account.provider_http = RequireString(cfg, "provider_http", entry);
    account.auth_token = OptionalString(cfg, "auth_token", entry);
    account.rpc_timeout = OptionalTimeout(cfg, entry);
    account.gateway_addr = RequireAddress(cfg, "gateway_addr", entry);
    account.registry_addr = RequireAddress(cfg, "registry_addr", entry);
    subnet.config = std::move(account);
  } else if (network_type == "utxo") {
    UtxoSubnetConfig utxo;
    utxo.provider_http = RequireString(cfg, "provider_http", entry);
    utxo.auth_token = OptionalString(cfg, "auth_token", entry);
    utxo.rpc_timeout = OptionalTimeout(cfg, entry);
    subnet.config = std::move(utxo);
  } else {
    ConfigError(entry, "unknown network_type '" + network_type + "'");
  }

  if (subnet.network_type() != subnet.id.GetNetworkType()) {
    ConfigError(entry, "network_type '" + network_type +
                           "' does not match the subnet's chain (" +
                           api::NetworkTypeToString(subnet.id.GetNetworkType()) +
                           ")");
  }

  return subnet;
}

} // namespace

api::NetworkType Subnet::network_type() const {
  return std::holds_alternative<AccountSubnetConfig>(config)
             ? api::NetworkType::AccountChain
             : api::NetworkType::UtxoChain;
}

const std::string &Subnet::rpc_http() const {
  return std::visit(
      [](const auto &cfg) -> const std::string & { return cfg.provider_http; },
      config);
}

const std::optional<std::string> &Subnet::auth_token() const {
  return std::visit(
      [](const auto &cfg) -> const std::optional<std::string> & {
        return cfg.auth_token;
      },
      config);
}

std::optional<std::chrono::milliseconds> Subnet::rpc_timeout() const {
  return std::visit([](const auto &cfg) { return cfg.rpc_timeout; }, config);
}

std::optional<api::Address> Subnet::gateway_addr() const {
  if (const auto *account = std::get_if<AccountSubnetConfig>(&config)) {
    return account->gateway_addr;
  }
  return std::nullopt;
}

Config Config::FromJson(const json &root) {
  if (!root.is_object() || !root.contains("subnets") ||
      !root["subnets"].is_array()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "config: expected an object with a 'subnets' array");
  }

  Config config;
  const json &subnets = root["subnets"];
  for (size_t i = 0; i < subnets.size(); ++i) {
    config.AddSubnet(ParseSubnet(subnets[i], i));
  }
  LOG_PROVIDER_DEBUG("Loaded configuration with {} subnet(s)",
                     config.subnets_.size());
  return config;
}

Config Config::LoadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "cannot open config file " + path);
  }

  json root;
  try {
    file >> root;
  } catch (const json::parse_error &e) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "failed to parse config file " + path + ": " + e.what());
  }
  LOG_PROVIDER_INFO("Reading configuration from {}", path);
  return FromJson(root);
}

void Config::AddSubnet(Subnet subnet) {
  if (subnets_.count(subnet.id) > 0) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "config: duplicate subnet " + subnet.id.ToString());
  }
  api::SubnetID id = subnet.id;
  subnets_.emplace(std::move(id), std::move(subnet));
}

const Subnet *Config::GetSubnet(const api::SubnetID &id) const {
  auto it = subnets_.find(id);
  return it == subnets_.end() ? nullptr : &it->second;
}

const Subnet *Config::FindByUniversalId(const api::UniversalSubnetId &id) const {
  for (const auto &[key, subnet] : subnets_) {
    if (subnet.universal_id && *subnet.universal_id == id) {
      return &subnet;
    }
  }
  return nullptr;
}

json Config::ToJson() const {
  json subnets = json::array();
  for (const auto &[id, subnet] : subnets_) {
    json entry;
    entry["id"] = id.ToString();
    if (subnet.universal_id) {
      entry["universal_id"] = subnet.universal_id->ToString();
    }
    if (subnet.default_sender) {
      entry["default_sender"] = subnet.default_sender->ToString();
    }

    json cfg;
    cfg["network_type"] = api::NetworkTypeToString(subnet.network_type());
    cfg["provider_http"] = subnet.rpc_http();
    if (subnet.auth_token()) {
      cfg["auth_token"] = *subnet.auth_token();
    }
    if (auto timeout = subnet.rpc_timeout()) {
      cfg["rpc_timeout_ms"] = timeout->count();
    }
    if (const auto *account = std::get_if<AccountSubnetConfig>(&subnet.config)) {
      cfg["gateway_addr"] = account->gateway_addr.ToString();
      cfg["registry_addr"] = account->registry_addr.ToString();
    }
    entry["config"] = std::move(cfg);
    subnets.push_back(std::move(entry));
  }
  return json{{"subnets", std::move(subnets)}};
}

} // namespace provider
} // namespace ipc
