#pragma once

#include <string>

#include "nlohmann/json.hpp"

#include "config/settings.hpp"
#include "flow/mining.hpp"
#include "flow/reconcile.hpp"
#include "rpc/node_client.hpp"

namespace regflow::flow {

struct WalkthroughResult {
  rpc::BlockchainInfo chain_info;
  std::string miner_address;
  std::string trader_address;
  MiningResult mining;
  std::string txid;
  nlohmann::json mempool_entry;
  std::string confirmation_block_hash;
  ReconciliationResult reconciliation;
  std::string report_path;
};

// Runs the whole sequence against the node behind `node` (the base endpoint,
// not a wallet endpoint): provision both wallets, mine the miner wallet to a
// spendable balance, pay the trader, inspect the mempool entry, mine one
// confirmation block, reconcile the payment and write the report.
WalkthroughResult RunWalkthrough(rpc::NodeClient& node, const config::Settings& settings);

}  // namespace regflow::flow
