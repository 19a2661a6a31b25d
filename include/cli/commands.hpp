// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "provider/ipc_provider.hpp"
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ipc {
namespace cli {

/** Command-line words after the command name: params and --key=value options */
struct CommandArgs {
  std::vector<std::string> params;
  std::map<std::string, std::string> options;

  std::optional<std::string> Get(const std::string &key) const;
  /** @throws api::Error(InvalidArgument) naming the missing option */
  std::string Require(const std::string &key) const;
};

/** Split words into positional params and --key=value options */
CommandArgs ParseCommandArgs(const std::vector<std::string> &words);

/**
 * CommandRunner - dispatches "<group> <action>" commands
 *
 * Each handler returns its result as JSON and throws on failure. The
 * provider is requested only by commands that talk to a chain, so
 * offline commands (subnet parse) work without a configuration.
 */
class CommandRunner {
public:
  using ProviderAccessor = std::function<provider::IpcProvider &()>;
  using CommandHandler = std::function<nlohmann::json(const CommandArgs &)>;

  explicit CommandRunner(ProviderAccessor provider);

  bool HasCommand(const std::string &name) const;
  std::vector<std::string> CommandNames() const;

  /** @throws api::Error(InvalidArgument) for an unknown command */
  nlohmann::json Execute(const std::string &name, const CommandArgs &args);

private:
  nlohmann::json HandleSubnetParse(const CommandArgs &args);
  nlohmann::json HandleSubnetCreate(const CommandArgs &args);
  nlohmann::json HandleSubnetJoin(const CommandArgs &args);
  nlohmann::json HandleSubnetGenesisInfo(const CommandArgs &args);
  nlohmann::json HandleSubnetList(const CommandArgs &args);
  nlohmann::json HandleCrossMsgFund(const CommandArgs &args);
  nlohmann::json HandleCrossMsgPreFund(const CommandArgs &args);
  nlohmann::json HandleCrossMsgTopDownMsgs(const CommandArgs &args);

  ProviderAccessor provider_;
  std::map<std::string, CommandHandler> handlers_;
};

} // namespace cli
} // namespace ipc
