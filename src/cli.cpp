// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "cli/commands.hpp"
#include "provider/config.hpp"
#include "provider/ipc_provider.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <pwd.h>
#include <string>
#include <unistd.h>
#include <vector>

std::string GetDefaultConfigPath() {
  const char *home = getenv("HOME");
  if (!home) {
    struct passwd *pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }

  if (home) {
    return std::string(home) + "/.ipc/config.json";
  }

  return ".ipc/config.json";
}

void PrintUsage(const char *program_name) {
  std::cout
      << "IPC CLI - Manage hierarchical subnets\n\n"
      << "Usage: " << program_name
      << " [options] <command> [params] [--key=value ...]\n\n"
      << "Options:\n"
      << "  --config=<path>      Config file (default: ~/.ipc/config.json)\n"
      << "  --loglevel=<level>   Log level (trace,debug,info,warn,error,off)\n"
      << "                       Default: warn\n"
      << "  --version            Show version information\n"
      << "  --help               Show this help message\n\n"
      << "Commands:\n"
      << "\n"
      << "Subnet:\n"
      << "  subnet parse <id>    Decode a subnet or universal subnet id\n"
      << "  subnet create --parent=<id> --min-validators=<n>\n"
      << "                --min-validator-stake=<amount>\n"
      << "                --bottomup-check-period=<n> [--from=<addr>]\n"
      << "                [--active-validators-limit=<n>]\n"
      << "                [--majority-percentage=<n>] [--permission-mode=<m>]\n"
      << "                [--min-cross-msg-fee=<amount>] [--whitelist=<k1,k2>]\n"
      << "  subnet join --subnet=<id> --collateral=<amount>\n"
      << "              --public-key=<hex> [--from=<addr>]\n"
      << "              [--ip=<host:port> --backup-address=<addr>]\n"
      << "  subnet genesis-info <id>\n"
      << "  subnet list <parent>  List child subnets registered in the gateway\n"
      << "\n"
      << "Cross-subnet messages:\n"
      << "  crossmsg fund --subnet=<id> --amount=<amount> [--from] [--to]\n"
      << "  crossmsg pre-fund --subnet=<id> --amount=<amount> [--from]\n"
      << "  crossmsg topdown-msgs --subnet=<id> --epoch=<height>\n"
      << "\n"
      << "Amounts are integers in base units (atto or satoshi).\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    // Parse options
    std::string config_path = GetDefaultConfigPath();
    std::string log_level = "warn";
    std::vector<std::string> words;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << ipc::GetFullVersionString() << std::endl;
        std::cout << ipc::GetCopyrightString() << std::endl;
        return 0;
      } else if (words.empty() && arg.find("--config=") == 0) {
        config_path = arg.substr(9);
      } else if (words.empty() && arg.find("--loglevel=") == 0) {
        log_level = arg.substr(11);
      } else {
        words.push_back(arg);
      }
    }

    if (words.size() < 2) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    ipc::util::LogManager::Initialize(log_level);

    // Config is loaded on first use: offline commands run without one
    std::unique_ptr<ipc::provider::IpcProvider> provider;
    ipc::cli::CommandRunner runner([&]() -> ipc::provider::IpcProvider & {
      if (!provider) {
        LOG_CLI_INFO("loading config from {}", config_path);
        provider = std::make_unique<ipc::provider::IpcProvider>(
            ipc::provider::Config::LoadFromFile(config_path));
      }
      return *provider;
    });

    std::string command = words[0] + " " + words[1];
    if (!runner.HasCommand(command)) {
      std::cerr << "Error: Unknown command: " << command << "\n";
      PrintUsage(argv[0]);
      return 1;
    }

    ipc::cli::CommandArgs args = ipc::cli::ParseCommandArgs(
        std::vector<std::string>(words.begin() + 2, words.end()));

    std::cout << runner.Execute(command, args).dump(2) << std::endl;

    ipc::util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception &e) {
    LOG_CLI_ERROR("command failed: {}", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    ipc::util::LogManager::Shutdown();
    return 1;
  }
}
