// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/universal_subnet_id.hpp"
#include "api/error.hpp"
#include "util/string_parsing.hpp"

namespace ipc {
namespace api {

namespace {

void CheckChainIdPart(const std::string &part, const char *what) {
  if (part.empty()) {
    throw Error(ErrorKind::InvalidArgument,
                std::string("empty chain ID ") + what);
  }
  if (part.find_first_of(":/") != std::string::npos) {
    throw Error(ErrorKind::InvalidArgument, std::string("chain ID ") + what +
                                                " '" + part +
                                                "' contains ':' or '/'");
  }
}

void CheckChild(const std::string &child) {
  if (child.empty()) {
    throw Error(ErrorKind::InvalidArgument, "empty child segment");
  }
  if (child.find('/') != std::string::npos) {
    throw Error(ErrorKind::InvalidArgument,
                "child segment '" + child + "' contains '/'");
  }
}

} // namespace

UniversalSubnetId::UniversalSubnetId(Caip2ChainId root,
                                     std::vector<std::string> children)
    : root_(std::move(root)), children_(std::move(children)) {
  CheckChainIdPart(root_.name_space, "namespace");
  CheckChainIdPart(root_.reference, "reference");
  for (const auto &child : children_) {
    CheckChild(child);
  }
}

UniversalSubnetId UniversalSubnetId::NewFromParent(const UniversalSubnetId &parent,
                                                   const std::string &child) {
  auto children = parent.children_;
  children.push_back(child);
  return UniversalSubnetId(parent.root_, std::move(children));
}

UniversalSubnetId UniversalSubnetId::FromString(std::string_view str) {
  const std::string raw(str);

  if (str.empty() || str[0] != '/') {
    throw InvalidIdError(raw, "expected to start with '/'");
  }

  auto segments = util::SplitString(str.substr(1), '/');
  if (segments[0].empty()) {
    throw InvalidIdError(raw, "missing chain ID");
  }

  auto parts = util::SplitString(segments[0], ':');
  if (parts.size() != 2) {
    throw InvalidIdError(raw,
                         "invalid chain ID format, expected namespace:reference");
  }
  if (parts[0].empty()) {
    throw InvalidIdError(raw, "empty chain ID namespace");
  }
  if (parts[1].empty()) {
    throw InvalidIdError(raw, "empty chain ID reference");
  }

  std::vector<std::string> children(segments.begin() + 1, segments.end());
  for (size_t i = 0; i < children.size(); ++i) {
    if (children[i].empty()) {
      throw InvalidIdError(raw, "empty child at position " + std::to_string(i));
    }
  }

  return UniversalSubnetId(Caip2ChainId{parts[0], parts[1]},
                           std::move(children));
}

UniversalSubnetId UniversalSubnetId::FromSubnetId(const SubnetID &id) {
  std::vector<std::string> children;
  children.reserve(id.children().size());
  for (const auto &addr : id.children()) {
    children.push_back(addr.ToString());
  }
  return UniversalSubnetId(
      Caip2ChainId{EIP155_NAMESPACE, std::to_string(id.root_id())},
      std::move(children));
}

SubnetID UniversalSubnetId::ToSubnetId() const {
  if (root_.name_space != EIP155_NAMESPACE) {
    throw Error(ErrorKind::UnsupportedConversion,
                "invalid id '" + ToString() +
                    "': only eip155 namespace can be converted to SubnetID");
  }

  auto root_id = util::SafeParseUint64(root_.reference);
  if (!root_id) {
    throw InvalidIdError(ToString(),
                         "root chain ID reference cannot be converted to u64");
  }

  std::vector<Address> children;
  children.reserve(children_.size());
  for (const auto &child : children_) {
    try {
      children.push_back(Address::FromString(child));
    } catch (const InvalidIdError &e) {
      throw InvalidIdError(ToString(), "invalid child address " + child + ": " +
                                           e.reason());
    }
  }

  return SubnetID(*root_id, std::move(children));
}

std::optional<UniversalSubnetId> UniversalSubnetId::Parent() const {
  if (children_.empty()) {
    return std::nullopt;
  }
  return UniversalSubnetId(
      root_, std::vector<std::string>(children_.begin(), children_.end() - 1));
}

std::optional<NetworkType> UniversalSubnetId::RootNetworkType() const {
  if (root_.name_space == EIP155_NAMESPACE) {
    return NetworkType::AccountChain;
  }
  if (root_.name_space == BIP122_NAMESPACE) {
    return NetworkType::UtxoChain;
  }
  return std::nullopt;
}

std::optional<NetworkType> UniversalSubnetId::ParentNetworkType() const {
  switch (children_.size()) {
  case 0:
    return std::nullopt;
  case 1:
    return RootNetworkType();
  default:
    return NetworkType::AccountChain;
  }
}

std::string UniversalSubnetId::ToString() const {
  std::string out = "/" + root_.ToString();
  for (const auto &child : children_) {
    out.push_back('/');
    out += child;
  }
  return out;
}

} // namespace api
} // namespace ipc
