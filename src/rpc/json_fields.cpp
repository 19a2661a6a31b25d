// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rpc/json_fields.hpp"
#include "api/error.hpp"

namespace ipc {
namespace rpc {

using json = nlohmann::json;

std::string FieldPath(const std::string &parent, const std::string &key) {
  return parent.empty() ? key : parent + "." + key;
}

std::string IndexPath(const std::string &parent, size_t index) {
  return parent + "[" + std::to_string(index) + "]";
}

const json &RequireObject(const json &value, const std::string &path) {
  if (!value.is_object()) {
    throw api::ResponseShapeError(path, "is not an object");
  }
  return value;
}

const json &RequireArray(const json &value, const std::string &path) {
  if (!value.is_array()) {
    throw api::ResponseShapeError(path, "is not an array");
  }
  return value;
}

const json &GetField(const json &obj, const std::string &key,
                     const std::string &path) {
  RequireObject(obj, path);
  auto it = obj.find(key);
  if (it == obj.end()) {
    throw api::ResponseShapeError(FieldPath(path, key), "is missing");
  }
  return *it;
}

const json &GetObjectField(const json &obj, const std::string &key,
                           const std::string &path) {
  return RequireObject(GetField(obj, key, path), FieldPath(path, key));
}

const json &GetArrayField(const json &obj, const std::string &key,
                          const std::string &path) {
  return RequireArray(GetField(obj, key, path), FieldPath(path, key));
}

std::string GetStringField(const json &obj, const std::string &key,
                           const std::string &path) {
  const json &value = GetField(obj, key, path);
  if (!value.is_string()) {
    throw api::ResponseShapeError(FieldPath(path, key), "is not a string");
  }
  return value.get<std::string>();
}

bool GetBoolField(const json &obj, const std::string &key,
                  const std::string &path) {
  const json &value = GetField(obj, key, path);
  if (!value.is_boolean()) {
    throw api::ResponseShapeError(FieldPath(path, key), "is not a boolean");
  }
  return value.get<bool>();
}

uint64_t GetUint64Field(const json &obj, const std::string &key,
                        const std::string &path) {
  const json &value = GetField(obj, key, path);
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  if (value.is_number_integer() && value.get<int64_t>() >= 0) {
    return static_cast<uint64_t>(value.get<int64_t>());
  }
  throw api::ResponseShapeError(FieldPath(path, key),
                                "is not an unsigned integer");
}

} // namespace rpc
} // namespace ipc
