// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/subnet_id.hpp"
#include "api/error.hpp"
#include "util/string_parsing.hpp"
#include <algorithm>

namespace ipc {
namespace api {

namespace {

constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

uint64_t Fnv1a64(std::string_view data) {
  uint64_t hash = FNV_OFFSET_BASIS;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= FNV_PRIME;
  }
  return hash;
}

} // namespace

std::string NetworkTypeToString(NetworkType type) {
  switch (type) {
  case NetworkType::AccountChain:
    return "account";
  case NetworkType::UtxoChain:
    return "utxo";
  }
  return "unknown";
}

SubnetID SubnetID::NewRoot(uint64_t root) { return SubnetID(root, {}); }

SubnetID SubnetID::NewUtxo(uint64_t network_id, std::string_view hex_id) {
  if (network_id == 0) {
    throw InvalidIdError(std::string(hex_id), "invalid Bitcoin network ID");
  }
  auto bytes = util::ParseHex(hex_id);
  if (!bytes || bytes->empty()) {
    throw InvalidIdError(std::string(hex_id),
                         "Bitcoin subnet child is not a valid hex");
  }
  if (bytes->size() > Address::MAX_SUBADDRESS_LEN) {
    throw InvalidIdError(std::string(hex_id),
                         "Bitcoin subnet child exceeds delegated address size");
  }
  return SubnetID(NetworkType::UtxoChain, network_id,
                  {Address::NewDelegated(UTXO_NAMESPACE, *bytes)});
}

SubnetID SubnetID::NewFromParent(const SubnetID &parent,
                                 const Address &actor) {
  auto children = parent.children_;
  children.push_back(actor);
  return SubnetID(parent.root_network_type_, parent.root_, std::move(children));
}

SubnetID SubnetID::FromString(std::string_view str) {
  const std::string raw(str);

  if (str.size() < 2 || str[0] != '/' || (str[1] != 'r' && str[1] != 'b')) {
    throw InvalidIdError(raw, "expected to start with '/r' or '/b'");
  }
  const NetworkType type =
      str[1] == 'r' ? NetworkType::AccountChain : NetworkType::UtxoChain;

  auto segments = util::SplitString(str.substr(1), '/');

  auto root = util::SafeParseUint64(std::string_view(segments[0]).substr(1));
  if (!root) {
    throw InvalidIdError(raw, "invalid root ID");
  }
  if (type == NetworkType::UtxoChain && *root == 0) {
    throw InvalidIdError(raw, "invalid Bitcoin network ID");
  }

  std::vector<Address> children;
  children.reserve(segments.size() - 1);
  for (size_t i = 1; i < segments.size(); ++i) {
    try {
      children.push_back(Address::FromString(segments[i]));
    } catch (const InvalidIdError &e) {
      throw InvalidIdError(raw, "invalid child address " + segments[i] + ": " +
                                    e.reason());
    }
  }

  return SubnetID(type, *root, std::move(children));
}

std::optional<NetworkType> SubnetID::ParentNetworkType() const {
  switch (children_.size()) {
  case 0:
    return std::nullopt;
  case 1:
    return root_network_type_;
  default:
    return NetworkType::AccountChain;
  }
}

NetworkType SubnetID::GetNetworkType() const {
  return IsRoot() ? root_network_type_ : NetworkType::AccountChain;
}

uint64_t SubnetID::ChainId() const {
  if (IsRoot()) {
    return root_;
  }
  return Fnv1a64(ToString()) % MAX_CHAIN_ID;
}

Address SubnetID::SubnetActor() const {
  if (children_.empty()) {
    return Address::NewId(0);
  }
  return children_.back();
}

SubnetID SubnetID::Truncated(size_t len) const {
  return SubnetID(root_network_type_, root_,
                  std::vector<Address>(children_.begin(),
                                       children_.begin() + len));
}

std::optional<SubnetID> SubnetID::Parent() const {
  if (children_.empty()) {
    return std::nullopt;
  }
  return Truncated(children_.size() - 1);
}

std::optional<std::pair<size_t, SubnetID>>
SubnetID::CommonParent(const SubnetID &other) const {
  if (root_network_type_ != other.root_network_type_ || root_ != other.root_) {
    return std::nullopt;
  }

  auto mismatch = std::mismatch(children_.begin(), children_.end(),
                                other.children_.begin(), other.children_.end());
  size_t common = static_cast<size_t>(mismatch.first - children_.begin());
  return std::make_pair(common, Truncated(common));
}

std::optional<SubnetID> SubnetID::Down(const SubnetID &from) const {
  if (children_.size() <= from.children_.size()) {
    return std::nullopt;
  }
  auto common = CommonParent(from);
  if (!common) {
    return std::nullopt;
  }
  // common length < children_.size() holds because from is shallower
  return Truncated(common->first + 1);
}

std::optional<SubnetID> SubnetID::Up(const SubnetID &from) const {
  if (children_.size() < from.children_.size()) {
    return std::nullopt;
  }
  auto common = CommonParent(from);
  if (!common) {
    return std::nullopt;
  }
  if (common->first == 0) {
    throw Error(ErrorKind::InvalidArgument,
                "cannot move up from " + from.ToString() + " within " +
                    ToString() + ": the common parent is the root");
  }
  return Truncated(common->first - 1);
}

std::string SubnetID::ToString() const {
  std::string out = root_network_type_ == NetworkType::AccountChain ? "/r" : "/b";
  out += std::to_string(root_);
  for (const auto &child : children_) {
    out.push_back('/');
    out += child.ToString();
  }
  return out;
}

bool SubnetID::operator<(const SubnetID &other) const {
  if (root_network_type_ != other.root_network_type_) {
    return root_network_type_ < other.root_network_type_;
  }
  if (root_ != other.root_) {
    return root_ < other.root_;
  }
  return std::lexicographical_compare(children_.begin(), children_.end(),
                                      other.children_.begin(),
                                      other.children_.end());
}

} // namespace api
} // namespace ipc
