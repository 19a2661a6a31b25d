// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "provider/config.hpp"
#include "provider/contract_caller.hpp"
#include "provider/subnet_manager.hpp"
#include "rpc/http_transport.hpp"
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace ipc {
namespace provider {

/** Builds the HTTP transport for a UTXO connection */
using HttpTransportFactory = std::function<std::unique_ptr<rpc::HttpTransport>(
    const UtxoSubnetConfig &config)>;

/**
 * IpcProvider - entry point for subnet operations across backends
 *
 * Owns the configuration and one SubnetManager per configured subnet,
 * created on first use. The backend is picked from the subnet's config
 * tag: account chains get an AccountSubnetManager over a ContractCaller
 * from the registered factory, UTXO chains a UtxoSubnetManager over
 * HTTP (BeastHttpTransport unless a transport factory is given).
 *
 * Operations on a subnet run against its parent's connection. The
 * sender is the explicit one, else the parent's default_sender, else
 * the null address on UTXO parents.
 *
 * Not thread-safe; callers serialize access.
 */
class IpcProvider {
public:
  explicit IpcProvider(Config config, ContractCallerFactory caller_factory = {},
                       HttpTransportFactory transport_factory = {});

  const Config &config() const { return config_; }

  /** @throws api::Error(InvalidArgument) if the subnet is not configured */
  SubnetManager &GetConnection(const api::SubnetID &subnet);

  /**
   * eip155 ids are converted to SubnetID; bip122 ids are matched against
   * the configured universal_id entries.
   * @throws api::Error(UnsupportedOperation) for an unknown namespace
   */
  SubnetManager &GetConnection(const api::UniversalSubnetId &subnet);

  api::Address CreateSubnet(const std::optional<api::Address> &from,
                            const api::ConstructParams &params);
  ChainEpoch JoinSubnet(const api::SubnetID &subnet,
                        const std::optional<api::Address> &from,
                        const api::JoinParams &params);
  void PreFund(const api::SubnetID &subnet,
               const std::optional<api::Address> &from,
               const api::TokenAmount &amount);
  /** `to` defaults to the sender */
  ChainEpoch Fund(const api::SubnetID &subnet,
                  const std::optional<api::Address> &from,
                  const std::optional<api::Address> &to,
                  const api::TokenAmount &amount);
  api::SubnetGenesisInfo GetGenesisInfo(const api::SubnetID &subnet);
  TopDownQueryPayload<std::vector<api::IpcEnvelope>>
  GetTopDownMsgs(const api::SubnetID &subnet, ChainEpoch epoch);
  std::map<api::SubnetID, api::SubnetInfo>
  ListChildSubnets(const api::SubnetID &parent);

private:
  const Subnet &RequireSubnet(const api::SubnetID &id) const;
  const Subnet &ParentSubnet(const api::SubnetID &child) const;
  api::Address ResolveSender(const Subnet &parent,
                             const std::optional<api::Address> &from) const;
  std::unique_ptr<SubnetManager> Connect(const Subnet &subnet) const;

  Config config_;
  ContractCallerFactory caller_factory_;
  HttpTransportFactory transport_factory_;
  std::map<api::SubnetID, std::unique_ptr<SubnetManager>> connections_;
};

} // namespace provider
} // namespace ipc
