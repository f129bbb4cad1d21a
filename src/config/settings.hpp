#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>

#include "config/network.hpp"
#include "util/amount.hpp"

namespace regflow::config {

enum class SendMethod {
  kSendToAddress,  // sendtoaddress, typed binding
  kSend,           // send, generic call returning {complete, txid}
};

SendMethod SendMethodFromString(std::string_view name);
std::string_view SendMethodName(SendMethod method);

struct Settings {
  NetworkType network{NetworkType::kRegtest};
  std::string rpc_host{"127.0.0.1"};
  // Zero selects the network's default RPC port.
  std::uint16_t rpc_port{0};
  std::string rpc_user{"alice"};
  std::string rpc_pass{"password"};
  // Per-call socket read/write timeout. Zero blocks indefinitely.
  int rpc_timeout_ms{0};

  std::string miner_wallet{"Miner"};
  std::string trader_wallet{"Trader"};
  std::string mining_label{"Mining Reward"};
  std::string receive_label{"Received"};
  std::string payment_label{"Payment to Trader"};
  util::Amount send_amount{20 * util::kSatoshisPerCoin};
  SendMethod send_method{SendMethod::kSendToAddress};

  std::string output_path{"../out.txt"};
  std::chrono::milliseconds unload_delay{1000};
  std::chrono::milliseconds wallet_settle_delay{500};
  // Zero leaves the mining loop unbounded.
  std::uint64_t max_blocks{0};

  std::string log_level{"info"};
  std::string debug_log_path;
  std::string config_path;
};

std::uint16_t EffectiveRpcPort(const Settings& settings);

// Lower-cases and strips '-' and '_', so "rpc-host", "rpc_host" and
// "RpcHost" name the same setting.
std::string NormalizeKey(std::string_view key);

// Applies one setting by (unnormalized) key. Returns false for unknown keys;
// throws std::runtime_error for malformed values.
bool ApplySettingOption(const std::string& raw_key, const std::string& value, Settings* settings);

// Reads key=value lines; '#' starts a comment and a bare key means "1".
// Unknown keys are reported as warnings. Throws when the file cannot be read
// or a value is malformed.
void LoadSettingsFile(const std::filesystem::path& path, Settings* settings);

// Defaults, then the file named by --conf, then the remaining flags. Sets
// `*show_help` and returns early on --help/-h.
Settings ParseCommandLine(int argc, const char* const* argv, bool* show_help);

void PrintUsage(std::ostream& out);

}  // namespace regflow::config
