// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/address.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ipc {
namespace api {

/** Root ecosystem of a subnet path */
enum class NetworkType {
  AccountChain, // EIP-155 style chains, root = chain id
  UtxoChain,    // Bitcoin-style chains, root = network discriminant
};

std::string NetworkTypeToString(NetworkType type);

/** Largest chain id accepted by account-model chains */
constexpr uint64_t MAX_CHAIN_ID = 4503599627370476ULL;

/** Delegated-address namespace wrapping raw UTXO subnet identifiers */
constexpr uint64_t UTXO_NAMESPACE = 20;

/**
 * Hierarchical subnet identifier
 *
 * A root ecosystem, a root value and the ordered path of subnet actor
 * addresses from the root down to this subnet. Canonical text form is
 * "/r<chain id>/<addr>/..." for account roots and "/b<network>/<addr>/..."
 * for UTXO roots.
 *
 * Values are immutable; navigation returns new ids. A default-constructed
 * SubnetID is the undefined sentinel (/r0, no children).
 */
class SubnetID {
public:
  SubnetID() = default;
  SubnetID(uint64_t root, std::vector<Address> children)
      : root_(root), children_(std::move(children)) {}

  static SubnetID NewRoot(uint64_t root);

  /**
   * UTXO subnet: root network id plus the hex chain-specific identifier,
   * wrapped as a delegated address in UTXO_NAMESPACE
   * @throws InvalidIdError for a zero network id or invalid hex
   */
  static SubnetID NewUtxo(uint64_t network_id, std::string_view hex_id);

  static SubnetID NewFromParent(const SubnetID &parent, const Address &actor);

  /** @throws InvalidIdError naming the raw string and the reason */
  static SubnetID FromString(std::string_view str);

  NetworkType root_network_type() const { return root_network_type_; }
  uint64_t root_id() const { return root_; }
  const std::vector<Address> &children() const { return children_; }

  bool IsRoot() const { return children_.empty(); }
  bool IsUndefined() const { return *this == SubnetID(); }

  /** Network type of the parent: none at the root */
  std::optional<NetworkType> ParentNetworkType() const;
  /** Root type at the root, account chain for every subnet below it */
  NetworkType GetNetworkType() const;

  /**
   * Chain id: the root value at the root, otherwise FNV-1a 64 of the
   * canonical string reduced modulo MAX_CHAIN_ID
   */
  uint64_t ChainId() const;

  /** Last path element, or the ID 0 address at the root */
  Address SubnetActor() const;

  std::optional<SubnetID> Parent() const;

  /**
   * Longest common path prefix with other
   * @return (common length, prefix id), or none if the roots differ
   */
  std::optional<std::pair<size_t, SubnetID>>
  CommonParent(const SubnetID &other) const;

  /**
   * One step below the common parent with from, towards this id.
   * None unless this path is strictly deeper than from's and the roots
   * match.
   */
  std::optional<SubnetID> Down(const SubnetID &from) const;

  /**
   * One step above the common parent with from. None unless this path is
   * at least as deep as from's and the roots match.
   * @throws Error(InvalidArgument) when the only common ancestor is the
   * root itself, which has nothing above it
   */
  std::optional<SubnetID> Up(const SubnetID &from) const;

  std::string ToString() const;

  bool operator==(const SubnetID &other) const {
    return root_network_type_ == other.root_network_type_ &&
           root_ == other.root_ && children_ == other.children_;
  }
  bool operator!=(const SubnetID &other) const { return !(*this == other); }
  bool operator<(const SubnetID &other) const;

private:
  SubnetID(NetworkType type, uint64_t root, std::vector<Address> children)
      : root_network_type_(type), root_(root), children_(std::move(children)) {}

  SubnetID Truncated(size_t len) const;

  NetworkType root_network_type_ = NetworkType::AccountChain;
  uint64_t root_ = 0;
  std::vector<Address> children_;
};

} // namespace api
} // namespace ipc
