#include "config/settings.hpp"

#include <cctype>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <vector>

#include "util/logging.hpp"

namespace regflow::config {

namespace {

std::string Trim(const std::string& value) {
  std::size_t start = 0;
  std::size_t end = value.size();
  while (start < end && std::isspace(static_cast<unsigned char>(value[start]))) {
    ++start;
  }
  while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
    --end;
  }
  return value.substr(start, end - start);
}

bool ParseBool(const std::string& value) {
  const std::string key = NormalizeKey(value);
  if (key == "1" || key == "true" || key == "yes" || key == "on") return true;
  if (key == "0" || key == "false" || key == "no" || key == "off") return false;
  throw std::runtime_error("invalid boolean value: " + value);
}

std::uint64_t ParseUnsigned(const std::string& value, std::uint64_t max, const char* what) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error(std::string("invalid ") + what + ": " + value);
  }
  std::uint64_t parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::exception&) {
    throw std::runtime_error(std::string(what) + " out of range: " + value);
  }
  if (parsed > max) {
    throw std::runtime_error(std::string(what) + " out of range: " + value);
  }
  return parsed;
}

std::string RequireNonEmpty(const std::string& value, const char* what) {
  if (value.empty()) {
    throw std::runtime_error(std::string(what) + " must not be empty");
  }
  return value;
}

}  // namespace

SendMethod SendMethodFromString(std::string_view name) {
  if (name == "sendtoaddress") return SendMethod::kSendToAddress;
  if (name == "send") return SendMethod::kSend;
  throw std::runtime_error("unknown send method: " + std::string(name) +
                           " (use sendtoaddress or send)");
}

std::string_view SendMethodName(SendMethod method) {
  switch (method) {
    case SendMethod::kSendToAddress:
      return "sendtoaddress";
    case SendMethod::kSend:
      return "send";
  }
  return "sendtoaddress";
}

std::uint16_t EffectiveRpcPort(const Settings& settings) {
  if (settings.rpc_port != 0) {
    return settings.rpc_port;
  }
  return ConfigFor(settings.network).rpc_port;
}

std::string NormalizeKey(std::string_view key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool ApplySettingOption(const std::string& raw_key, const std::string& value,
                        Settings* settings) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "network" || key == "chain") {
    settings->network = NetworkFromString(value);
  } else if (key == "regtest") {
    if (ParseBool(value)) {
      settings->network = NetworkType::kRegtest;
    }
  } else if (key == "rpchost" || key == "rpcconnect") {
    settings->rpc_host = RequireNonEmpty(value, "rpc host");
  } else if (key == "rpcport") {
    settings->rpc_port = static_cast<std::uint16_t>(ParseUnsigned(value, 65535, "rpc port"));
  } else if (key == "rpcuser") {
    settings->rpc_user = value;
  } else if (key == "rpcpassword" || key == "rpcpass") {
    settings->rpc_pass = value;
  } else if (key == "rpctimeoutms") {
    settings->rpc_timeout_ms =
        static_cast<int>(ParseUnsigned(value, 3'600'000, "rpc timeout"));
  } else if (key == "minerwallet") {
    settings->miner_wallet = RequireNonEmpty(value, "miner wallet name");
  } else if (key == "traderwallet") {
    settings->trader_wallet = RequireNonEmpty(value, "trader wallet name");
  } else if (key == "mininglabel") {
    settings->mining_label = value;
  } else if (key == "receivelabel") {
    settings->receive_label = value;
  } else if (key == "paymentlabel") {
    settings->payment_label = value;
  } else if (key == "amount") {
    auto parsed = util::ParseAmountString(value);
    if (!parsed || *parsed <= 0) {
      throw std::runtime_error("invalid amount: " + value);
    }
    settings->send_amount = *parsed;
  } else if (key == "sendmethod") {
    settings->send_method = SendMethodFromString(value);
  } else if (key == "output" || key == "out") {
    settings->output_path = RequireNonEmpty(value, "output path");
  } else if (key == "unloaddelayms") {
    settings->unload_delay =
        std::chrono::milliseconds(ParseUnsigned(value, 60'000, "unload delay"));
  } else if (key == "walletsettledelayms") {
    settings->wallet_settle_delay =
        std::chrono::milliseconds(ParseUnsigned(value, 60'000, "wallet settle delay"));
  } else if (key == "maxblocks") {
    settings->max_blocks = ParseUnsigned(value, 1'000'000, "max blocks");
  } else if (key == "loglevel") {
    util::ParseLogLevelString(value);
    settings->log_level = value;
  } else if (key == "debuglog") {
    settings->debug_log_path = value;
  } else if (key == "conf" || key == "config") {
    settings->config_path = value;
  } else {
    return false;
  }
  return true;
}

void LoadSettingsFile(const std::filesystem::path& path, Settings* settings) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
    }
    if (NormalizeKey(key) == "conf" || NormalizeKey(key) == "config") {
      util::LogWarn("config", path.string() + ":" + std::to_string(lineno) +
                                  ": nested config files are not supported");
      continue;
    }
    try {
      if (!ApplySettingOption(key, value, settings)) {
        util::LogWarn("config", "unknown config key '" + key + "' at " + path.string() + ":" +
                                    std::to_string(lineno));
      }
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

Settings ParseCommandLine(int argc, const char* const* argv, bool* show_help) {
  Settings settings;
  if (show_help) {
    *show_help = false;
  }
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    const auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(std::move(token));
    }
  }

  // First pass: help and the config file, so flags can override file values.
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--help" || args[i] == "-h") {
      if (show_help) {
        *show_help = true;
      }
      return settings;
    }
    if (args[i] == "--conf") {
      if (i + 1 >= args.size()) {
        throw std::runtime_error("missing value for --conf");
      }
      settings.config_path = args[++i];
    }
  }
  if (!settings.config_path.empty()) {
    LoadSettingsFile(settings.config_path, &settings);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg.rfind("--", 0) != 0 || arg.size() <= 2) {
      throw std::runtime_error("unexpected argument: " + arg);
    }
    if (i + 1 >= args.size()) {
      throw std::runtime_error("missing value for " + arg);
    }
    const std::string& value = args[++i];
    if (arg == "--conf") {
      continue;
    }
    if (!ApplySettingOption(arg.substr(2), value, &settings)) {
      throw std::runtime_error("unknown option: " + arg);
    }
  }
  return settings;
}

void PrintUsage(std::ostream& out) {
  out << "Usage: regflow [options]\n"
      << "Provisions Miner/Trader wallets on a regtest node, mines a spendable balance,\n"
      << "sends a payment and writes a ten-line reconciliation report.\n"
      << "Options:\n"
      << "  --conf <path>             key=value config file (flags override it)\n"
      << "  --network <net>           mainnet, testnet, signet, regtest (default regtest)\n"
      << "  --rpc-host <host>         RPC host (default 127.0.0.1)\n"
      << "  --rpc-port <port>         RPC port (default depends on network, 18443 on regtest)\n"
      << "  --rpc-user <user>         RPC basic auth user (default alice)\n"
      << "  --rpc-pass <pass>         RPC basic auth password (default password)\n"
      << "  --rpc-timeout-ms <n>      socket read/write timeout, 0 = none (default 0)\n"
      << "  --miner-wallet <name>     funding wallet (default Miner)\n"
      << "  --trader-wallet <name>    receiving wallet (default Trader)\n"
      << "  --amount <btc>            payment amount (default 20)\n"
      << "  --send-method <m>         sendtoaddress or send (default sendtoaddress)\n"
      << "  --max-blocks <n>          abort mining after n blocks, 0 = unbounded (default 0)\n"
      << "  --output <path>           report file (default ../out.txt)\n"
      << "  --log-level <level>       debug, info, warn, error (default info)\n"
      << "  --debug-log <path>        also append log lines to this file\n";
}

}  // namespace regflow::config
