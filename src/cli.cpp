// Copyright (c) 2025 The Trustledger developers
// Distributed under the MIT software license

#include "application.hpp"
#include "chain/block.hpp"
#include "chain/validation.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace trustledger;

void PrintUsage(const char* program_name) {
  std::cout << "Trustledger CLI - Inspect and feed a local ledger\n\n"
            << "Usage: " << program_name << " [options] <command> [params]\n\n"
            << "Options:\n"
            << "  --datadir=<path>     Data directory (default: ~/.trustledger)\n"
            << "  --params=<file>      Currency parameter file (default: <datadir>/currency_params.json)\n"
            << "  --regtest            Use regtest parameters when no parameter file exists\n"
            << "  --loglevel=<level>   trace, debug, info, warn, error, off (default: warn)\n"
            << "  --logfile            Also log to <datadir>/debug.log\n"
            << "  --saveinterval=<s>   Save chain state every s seconds while importing (default: 600, 0: off)\n"
            << "  --help               Show this help message\n\n"
            << "Commands:\n"
            << "\n"
            << "Chain:\n"
            << "  info                         Current block, chain time, monetary mass\n"
            << "  block <height>               Main chain block at height\n"
            << "  forks                        Known forks and their status\n"
            << "  import <blocks.json>         Submit blocks (JSON array) in order\n"
            << "  revert                       Revert the main chain tip\n"
            << "\n"
            << "Indexes:\n"
            << "  balance <pubkey>             Balance of the SIG(pubkey) condition group\n"
            << "  uid <pubkey>                 Identity uid of a public key\n"
            << "  expiring <height>            Certifications expiring at height\n"
            << "\n"
            << "Control:\n"
            << "  reset                        Drop all chain data\n"
            << std::endl;
}

static int PrintJson(const json& j) {
  std::cout << j.dump(2) << std::endl;
  return 0;
}

static int PrintError(const std::string& message) {
  std::cout << json{{"error", message}}.dump(2) << std::endl;
  return 1;
}

static bool ParseUint32(const std::string& text, uint32_t& out) {
  try {
    size_t pos = 0;
    const unsigned long value = std::stoul(text, &pos);
    if (pos != text.size() || value > 0xFFFFFFFFul) {
      return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

static int CmdInfo(app::Application& application) {
  const chain::ChainSnapshot snapshot = application.coordinator().GetSnapshot();
  const chain::ChainState& state = snapshot.State();
  const auto current = snapshot.GetCurrentBlockstamp();

  json result;
  result["currency"] = application.params().currency_name;
  result["current"] = current ? json(current->ToString()) : json(nullptr);
  result["chain_time"] = snapshot.GetChainTime();
  result["monetary_mass"] = snapshot.GetMonetaryMass();
  result["main_blocks"] = state.blocks.GetMainCount();
  result["fork_blocks"] = state.blocks.GetForkCount();
  result["forks"] = state.forks.GetForkCount();
  result["identities"] = state.identities.Size();
  result["members"] = state.identities.GetMemberCount();
  result["utxos"] = state.balances.GetUtxoCount();
  result["invalid_blocks"] = state.invalid_blocks.size();
  return PrintJson(result);
}

static int CmdBlock(app::Application& application, const std::vector<std::string>& params) {
  BlockHeight height = 0;
  if (params.size() != 1 || !ParseUint32(params[0], height)) {
    return PrintError("usage: block <height>");
  }
  const auto block = application.coordinator().GetSnapshot().GetBlockAt(height);
  if (!block) {
    return PrintError("no main chain block at height " + params[0]);
  }
  return PrintJson(json(*block));
}

static int CmdBalance(app::Application& application, const std::vector<std::string>& params) {
  if (params.size() != 1) {
    return PrintError("usage: balance <pubkey>");
  }
  const ConditionGroup conditions = SingleSigCondition(params[0]);
  const auto entry = application.coordinator().GetSnapshot().GetBalanceOf(conditions);

  json result;
  result["conditions"] = conditions;
  result["amount"] = entry ? entry->amount : 0;
  result["utxos"] = json::array();
  if (entry) {
    for (const UtxoId& id : entry->utxos) {
      result["utxos"].push_back(id.ToString());
    }
  }
  return PrintJson(result);
}

static int CmdUid(app::Application& application, const std::vector<std::string>& params) {
  if (params.size() != 1) {
    return PrintError("usage: uid <pubkey>");
  }
  const auto uid = application.coordinator().GetSnapshot().GetUidFor(params[0]);
  if (!uid) {
    return PrintError("unknown identity " + params[0]);
  }
  return PrintJson(json{{"pubkey", params[0]}, {"uid", *uid}});
}

static int CmdExpiring(app::Application& application, const std::vector<std::string>& params) {
  BlockHeight height = 0;
  if (params.size() != 1 || !ParseUint32(params[0], height)) {
    return PrintError("usage: expiring <height>");
  }
  json result = json::array();
  for (const auto& [issuer, target] : application.coordinator().GetSnapshot().GetExpiringCertifications(height)) {
    result.push_back(json{{"issuer", issuer}, {"target", target}});
  }
  return PrintJson(result);
}

static int CmdForks(app::Application& application) {
  json result = json::array();
  for (const chain::ForkInfo& info : application.coordinator().GetForks()) {
    json entry;
    entry["id"] = info.id;
    entry["status"] = chain::ForkStatusName(info.status);
    entry["head"] = info.head.ToString();
    entry["length"] = info.length;
    if (info.status == chain::ForkStatus::ROLLBACK) {
      entry["common_height"] = info.common_height;
    }
    result.push_back(entry);
  }
  return PrintJson(result);
}

static int CmdImport(app::Application& application, const std::vector<std::string>& params) {
  if (params.size() != 1) {
    return PrintError("usage: import <blocks.json>");
  }
  const auto content = util::read_file_string(params[0]);
  if (!content) {
    return PrintError("cannot read " + params[0]);
  }

  std::vector<Block> blocks;
  try {
    const json root = json::parse(*content);
    blocks = root.get<std::vector<Block>>();
  } catch (const std::exception& e) {
    return PrintError(std::string("malformed block file: ") + e.what());
  }

  size_t accepted = 0;
  size_t buffered = 0;
  json rejected = json::array();
  for (const Block& block : blocks) {
    validation::ValidationState state;
    const validation::SubmitOutcome outcome =
        application.coordinator().SubmitBlock(block, block.GetPreviousBlockstamp(), state);
    switch (outcome.status) {
    case validation::SubmitStatus::ACCEPTED:
      ++accepted;
      break;
    case validation::SubmitStatus::BUFFERED:
      ++buffered;
      break;
    case validation::SubmitStatus::REJECTED:
      rejected.push_back(json{{"block", block.GetBlockstamp().ToString()}, {"reason", state.ToString()}});
      break;
    case validation::SubmitStatus::FAILED:
      // Blocks accepted before a write abort are kept; a halted writer saves nothing
      if (!application.fatal_error() && !application.save_chainstate()) {
        LOG_ERROR("Failed to save chain state after storage failure");
      }
      return PrintError("storage failure at " + block.GetBlockstamp().ToString() + ": " + state.ToString());
    }
  }

  if (!application.save_chainstate()) {
    return PrintError("failed to save chain state");
  }

  const auto current = application.coordinator().GetTipBlockstamp();
  json result;
  result["submitted"] = blocks.size();
  result["accepted"] = accepted;
  result["buffered"] = buffered;
  result["rejected"] = rejected;
  result["current"] = current ? json(current->ToString()) : json(nullptr);
  return PrintJson(result);
}

static int CmdRevert(app::Application& application) {
  validation::ValidationState state;
  if (!application.coordinator().RevertTip(state)) {
    return PrintError(state.ToString());
  }
  if (!application.save_chainstate()) {
    return PrintError("failed to save chain state");
  }
  const auto current = application.coordinator().GetTipBlockstamp();
  return PrintJson(json{{"current", current ? json(current->ToString()) : json(nullptr)}});
}

int main(int argc, char* argv[]) {
  try {
    if (argc < 2) {
      PrintUsage(argv[0]);
      return 1;
    }

    app::AppConfig config;
    std::string command;
    std::vector<std::string> params;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg.starts_with("--datadir=")) {
        config.datadir = arg.substr(10);
        if (config.datadir.empty()) {
          std::cerr << "Error: --datadir requires a non-empty path\n";
          return 1;
        }
      } else if (arg.starts_with("--params=")) {
        config.currency_params_file = arg.substr(9);
      } else if (arg.starts_with("--loglevel=")) {
        config.log_level = arg.substr(11);
      } else if (arg == "--logfile") {
        config.log_to_file = true;
      } else if (arg.starts_with("--saveinterval=")) {
        uint32_t seconds = 0;
        if (!ParseUint32(arg.substr(15), seconds)) {
          std::cerr << "Error: --saveinterval requires a number of seconds\n";
          return 1;
        }
        config.save_interval = std::chrono::seconds(seconds);
      } else if (arg == "--regtest") {
        config.regtest = true;
      } else if (command.empty()) {
        command = arg;
      } else {
        params.push_back(arg);
      }
    }

    // Get default datadir if not specified
    if (config.datadir.empty()) {
      config.datadir = util::get_default_datadir();
      if (config.datadir.empty()) {
        std::cerr << "Error: HOME environment variable not set.\n"
                  << "Cannot determine default data directory.\n"
                  << "Please set HOME or use --datadir explicitly.\n";
        return 1;
      }
    }

    if (command.empty()) {
      std::cerr << "Error: No command specified\n";
      PrintUsage(argv[0]);
      return 1;
    }

    config.load_chainstate = command != "reset";
    util::LogManager::Initialize(config.log_level, config.log_to_file, (config.datadir / "debug.log").string());

    app::Application application(config);
    if (!application.initialize()) {
      std::cerr << "Error: initialization failed (run with --loglevel=info for details)\n";
      util::LogManager::Shutdown();
      return 1;
    }

    int rc = 0;
    if (command == "info") {
      rc = CmdInfo(application);
    } else if (command == "block") {
      rc = CmdBlock(application, params);
    } else if (command == "balance") {
      rc = CmdBalance(application, params);
    } else if (command == "uid") {
      rc = CmdUid(application, params);
    } else if (command == "expiring") {
      rc = CmdExpiring(application, params);
    } else if (command == "forks") {
      rc = CmdForks(application);
    } else if (command == "import") {
      rc = CmdImport(application, params);
    } else if (command == "revert") {
      rc = CmdRevert(application);
    } else if (command == "reset") {
      rc = application.reset() ? PrintJson(json{{"reset", true}}) : PrintError("reset failed");
    } else {
      std::cerr << "Error: Unknown command '" << command << "'\n";
      PrintUsage(argv[0]);
      rc = 1;
    }

    if (application.fatal_error()) {
      rc = 1;
    }
    application.shutdown();
    util::LogManager::Shutdown();
    return rc;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
