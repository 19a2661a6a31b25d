// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "api/subnet.hpp"

namespace ipc {
namespace api {

std::string PermissionModeToString(PermissionMode mode) {
  switch (mode) {
  case PermissionMode::Collateral:
    return "collateral";
  case PermissionMode::Federated:
    return "federated";
  case PermissionMode::Static:
    return "static";
  }
  return "unknown";
}

} // namespace api
} // namespace ipc
