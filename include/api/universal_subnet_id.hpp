// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "api/subnet_id.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ipc {
namespace api {

/** CAIP-2 chain reference, "namespace:reference" */
struct Caip2ChainId {
  std::string name_space;
  std::string reference;

  std::string ToString() const { return name_space + ":" + reference; }

  bool operator==(const Caip2ChainId &other) const {
    return name_space == other.name_space && reference == other.reference;
  }
};

constexpr const char *EIP155_NAMESPACE = "eip155";
constexpr const char *BIP122_NAMESPACE = "bip122";

/**
 * Ecosystem-agnostic subnet identifier: "/<namespace>:<reference>/<child>/..."
 *
 * Children are opaque strings. Only eip155 ids convert to SubnetID;
 * every SubnetID converts to an eip155 id.
 */
class UniversalSubnetId {
public:
  UniversalSubnetId() : root_{EIP155_NAMESPACE, "0"} {}
  /**
   * @throws Error(InvalidArgument) for an empty namespace or reference, one
   * containing ':' or '/', or an empty child or one containing '/'
   */
  UniversalSubnetId(Caip2ChainId root, std::vector<std::string> children);

  static UniversalSubnetId NewRoot(Caip2ChainId root) {
    return UniversalSubnetId(std::move(root), {});
  }
  /** @throws Error(InvalidArgument) for an empty child or one containing '/' */
  static UniversalSubnetId NewFromParent(const UniversalSubnetId &parent,
                                         const std::string &child);

  /** @throws InvalidIdError */
  static UniversalSubnetId FromString(std::string_view str);

  /** Always succeeds; the root becomes eip155:<root id> */
  static UniversalSubnetId FromSubnetId(const SubnetID &id);

  /**
   * @throws Error(UnsupportedConversion) for a namespace other than eip155
   * @throws InvalidIdError for a non-numeric reference or a bad child
   */
  SubnetID ToSubnetId() const;

  const Caip2ChainId &root() const { return root_; }
  const std::vector<std::string> &children() const { return children_; }

  bool IsRoot() const { return children_.empty(); }
  std::optional<UniversalSubnetId> Parent() const;

  /**
   * Classification of the root namespace used for backend dispatch.
   * Unknown namespaces yield none and cannot be dispatched.
   */
  std::optional<NetworkType> RootNetworkType() const;
  std::optional<NetworkType> ParentNetworkType() const;

  std::string ToString() const;

  bool operator==(const UniversalSubnetId &other) const {
    return root_ == other.root_ && children_ == other.children_;
  }
  bool operator!=(const UniversalSubnetId &other) const {
    return !(*this == other);
  }

private:
  Caip2ChainId root_;
  std::vector<std::string> children_;
};

} // namespace api
} // namespace ipc
