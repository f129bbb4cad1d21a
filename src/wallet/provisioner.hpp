#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "rpc/node_client.hpp"

namespace regflow::wallet {

enum class ProvisionOutcome {
  kLoaded,
  kCreated,
  kLoadedAfterRetry,
};

std::string_view ProvisionOutcomeName(ProvisionOutcome outcome);

// Makes sure `wallet_name` exists and is loaded on the node behind `node`.
//
// The wallet is first unloaded (a failure there only means it was not
// loaded), then after `unload_delay` loaded by name. If loading fails the
// wallet is created; if creation fails too, for instance because another
// process created it in the meantime, loading is attempted once more and its
// failure is thrown. "Already loaded" replies count as loaded at every step.
// Only node-side RpcErrors enter the fallback chain; transport failures
// propagate immediately. Safe to call repeatedly for the same name.
ProvisionOutcome EnsureWallet(rpc::NodeClient& node, const std::string& wallet_name,
                              std::chrono::milliseconds unload_delay);

}  // namespace regflow::wallet
