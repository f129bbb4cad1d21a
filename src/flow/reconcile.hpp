#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

#include "rpc/node_client.hpp"
#include "util/amount.hpp"

namespace regflow::flow {

struct ReconciliationResult {
  std::string txid;
  std::string input_address;
  util::Amount input_amount{0};
  std::string output_address;
  util::Amount output_amount{0};
  std::string change_address;
  util::Amount change_amount{0};
  // input_amount - output_amount - change_amount, exact to the satoshi.
  util::Amount fee{0};
  std::uint64_t block_height{0};
  std::string block_hash;
};

struct OutPoint {
  std::string txid;
  std::uint32_t vout{0};
};

// Outpoint spent by the transaction's first input, if it names one.
// Coinbase inputs and malformed entries yield std::nullopt.
std::optional<OutPoint> FirstInputOutPoint(const nlohmann::json& tx);

// Builds the result from verbose getrawtransaction documents for the payment
// and for the transaction its first input spends, plus verbose getblock for
// the confirming block. Output 0 is the payee and output 1, when present, the
// change. Missing fields default to "" and 0 instead of failing.
ReconciliationResult ExtractReconciliation(const nlohmann::json& tx,
                                           const nlohmann::json& prev_tx,
                                           const nlohmann::json& block);

// Fetches the three documents from the node and extracts the result.
ReconciliationResult Reconcile(rpc::NodeClient& node, const std::string& txid,
                               const std::string& block_hash);

}  // namespace regflow::flow
