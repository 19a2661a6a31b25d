// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "provider/ipc_provider.hpp"
#include "api/error.hpp"
#include "provider/account_subnet_manager.hpp"
#include "provider/utxo_subnet_manager.hpp"
#include "util/logging.hpp"
#include <type_traits>
#include <variant>

namespace ipc {
namespace provider {

IpcProvider::IpcProvider(Config config, ContractCallerFactory caller_factory,
                         HttpTransportFactory transport_factory)
    : config_(std::move(config)), caller_factory_(std::move(caller_factory)),
      transport_factory_(std::move(transport_factory)) {}

const Subnet &IpcProvider::RequireSubnet(const api::SubnetID &id) const {
  const Subnet *subnet = config_.GetSubnet(id);
  if (!subnet) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "subnet " + id.ToString() + " is not configured");
  }
  return *subnet;
}

const Subnet &IpcProvider::ParentSubnet(const api::SubnetID &child) const {
  auto parent = child.Parent();
  if (!parent) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "subnet " + child.ToString() + " is a root and has no parent");
  }
  return RequireSubnet(*parent);
}

api::Address
IpcProvider::ResolveSender(const Subnet &parent,
                           const std::optional<api::Address> &from) const {
  if (from) {
    return *from;
  }
  if (parent.default_sender) {
    return *parent.default_sender;
  }
  if (parent.network_type() == api::NetworkType::UtxoChain) {
    // The UTXO node signs with its own wallet
    return api::Address::NewId(0);
  }
  throw api::Error(api::ErrorKind::InvalidArgument,
                   "no sender given and subnet " + parent.id.ToString() +
                       " has no default_sender");
}

std::unique_ptr<SubnetManager> IpcProvider::Connect(const Subnet &subnet) const {
  return std::visit(
      [&](const auto &cfg) -> std::unique_ptr<SubnetManager> {
        using T = std::decay_t<decltype(cfg)>;
        if constexpr (std::is_same_v<T, AccountSubnetConfig>) {
          if (!caller_factory_) {
            throw api::Error(api::ErrorKind::UnsupportedOperation,
                             "no contract caller registered for account subnet " +
                                 subnet.id.ToString());
          }
          auto caller = caller_factory_(subnet.id, cfg);
          if (!caller) {
            throw api::Error(api::ErrorKind::InvalidState,
                             "contract caller factory returned nothing for " +
                                 subnet.id.ToString());
          }
          LOG_PROVIDER_INFO("connected to account subnet {} at {}",
                            subnet.id.ToString(), cfg.provider_http);
          return std::make_unique<AccountSubnetManager>(
              subnet.id, cfg.gateway_addr, cfg.registry_addr, std::move(caller));
        } else {
          std::unique_ptr<rpc::HttpTransport> transport =
              transport_factory_
                  ? transport_factory_(cfg)
                  : std::make_unique<rpc::BeastHttpTransport>(
                        cfg.provider_http, cfg.auth_token, cfg.rpc_timeout);
          if (!transport) {
            throw api::Error(api::ErrorKind::InvalidState,
                             "transport factory returned nothing for " +
                                 subnet.id.ToString());
          }
          LOG_PROVIDER_INFO("connected to utxo subnet {} at {}",
                            subnet.id.ToString(), transport->Endpoint());
          return std::make_unique<UtxoSubnetManager>(subnet.id,
                                                     std::move(transport));
        }
      },
      subnet.config);
}

SubnetManager &IpcProvider::GetConnection(const api::SubnetID &subnet) {
  auto it = connections_.find(subnet);
  if (it != connections_.end()) {
    return *it->second;
  }
  const Subnet &configured = RequireSubnet(subnet);
  auto inserted = connections_.emplace(subnet, Connect(configured)).first;
  return *inserted->second;
}

SubnetManager &IpcProvider::GetConnection(const api::UniversalSubnetId &subnet) {
  auto type = subnet.RootNetworkType();
  if (!type) {
    throw api::Error(api::ErrorKind::UnsupportedOperation,
                     "cannot dispatch " + subnet.ToString() +
                         ": unknown chain namespace '" +
                         subnet.root().name_space + "'");
  }
  if (subnet.root().name_space == api::EIP155_NAMESPACE) {
    return GetConnection(subnet.ToSubnetId());
  }
  const Subnet *configured = config_.FindByUniversalId(subnet);
  if (!configured) {
    throw api::Error(api::ErrorKind::InvalidArgument,
                     "subnet " + subnet.ToString() + " is not configured");
  }
  return GetConnection(configured->id);
}

api::Address IpcProvider::CreateSubnet(const std::optional<api::Address> &from,
                                       const api::ConstructParams &params) {
  const api::SubnetID &parent =
      std::visit([](const auto &p) -> const api::SubnetID & { return p.parent; },
                 params);
  const Subnet &parent_subnet = RequireSubnet(parent);
  api::Address sender = ResolveSender(parent_subnet, from);

  api::Address actor = GetConnection(parent).create_subnet(sender, params);
  LOG_PROVIDER_INFO("subnet {} created under {}",
                    api::SubnetID::NewFromParent(parent, actor).ToString(),
                    parent.ToString());
  return actor;
}

ChainEpoch IpcProvider::JoinSubnet(const api::SubnetID &subnet,
                                   const std::optional<api::Address> &from,
                                   const api::JoinParams &params) {
  const Subnet &parent = ParentSubnet(subnet);
  api::Address sender = ResolveSender(parent, from);
  return GetConnection(parent.id).join_subnet(subnet, sender, params);
}

void IpcProvider::PreFund(const api::SubnetID &subnet,
                          const std::optional<api::Address> &from,
                          const api::TokenAmount &amount) {
  const Subnet &parent = ParentSubnet(subnet);
  api::Address sender = ResolveSender(parent, from);
  GetConnection(parent.id).pre_fund(subnet, sender, amount);
}

ChainEpoch IpcProvider::Fund(const api::SubnetID &subnet,
                             const std::optional<api::Address> &from,
                             const std::optional<api::Address> &to,
                             const api::TokenAmount &amount) {
  const Subnet &parent = ParentSubnet(subnet);
  api::Address sender = ResolveSender(parent, from);
  api::Address gateway = parent.gateway_addr().value_or(api::Address());
  return GetConnection(parent.id).fund(subnet, gateway, sender,
                                       to.value_or(sender), amount);
}

api::SubnetGenesisInfo IpcProvider::GetGenesisInfo(const api::SubnetID &subnet) {
  const Subnet &parent = ParentSubnet(subnet);
  return GetConnection(parent.id).get_genesis_info(subnet);
}

TopDownQueryPayload<std::vector<api::IpcEnvelope>>
IpcProvider::GetTopDownMsgs(const api::SubnetID &subnet, ChainEpoch epoch) {
  const Subnet &parent = ParentSubnet(subnet);
  return GetConnection(parent.id).get_top_down_msgs(subnet, epoch);
}

std::map<api::SubnetID, api::SubnetInfo>
IpcProvider::ListChildSubnets(const api::SubnetID &parent) {
  const Subnet &configured = RequireSubnet(parent);
  api::Address gateway = configured.gateway_addr().value_or(api::Address());
  return GetConnection(parent).list_child_subnets(gateway);
}

} // namespace provider
} // namespace ipc
