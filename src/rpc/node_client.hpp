#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

#include "rpc/client.hpp"
#include "util/amount.hpp"

namespace regflow::rpc {

struct BlockchainInfo {
  std::string chain;
  std::uint64_t blocks{0};
  std::string best_block_hash;
  nlohmann::json raw;
};

// Result of the generic "send" call.
struct SendResult {
  bool complete{false};
  std::string txid;
};

// Typed facade over an RpcTransport: one method per node RPC this tool
// uses, plus Call() for anything without a binding. Verbose lookups
// (transactions, blocks, mempool entries) return the node's JSON untouched.
class NodeClient {
 public:
  explicit NodeClient(std::unique_ptr<RpcTransport> transport);

  // Client for the /wallet/<name> endpoint sharing this client's settings.
  NodeClient Wallet(const std::string& wallet_name) const;

  nlohmann::json Call(const std::string& method,
                      const nlohmann::json& params = nlohmann::json::array());

  BlockchainInfo GetBlockchainInfo();

  void UnloadWallet(const std::string& wallet_name);
  void LoadWallet(const std::string& wallet_name);
  void CreateWallet(const std::string& wallet_name);

  std::string GetNewAddress(const std::string& label);
  util::Amount GetBalance();
  std::vector<std::string> GenerateToAddress(std::uint64_t blocks, const std::string& address);

  // sendtoaddress with node-default fee policy. Returns the txid.
  std::string SendToAddress(const std::string& address, util::Amount amount,
                            const std::string& comment);
  // send with a single recipient and node-default fee policy.
  SendResult Send(const std::string& address, util::Amount amount);

  // Verbose getrawtransaction. Passing the containing block lets a node
  // without -txindex serve confirmed transactions.
  nlohmann::json GetRawTransaction(const std::string& txid,
                                   const std::optional<std::string>& block_hash = std::nullopt);
  nlohmann::json GetMempoolEntry(const std::string& txid);
  nlohmann::json GetBlock(const std::string& block_hash);

  std::string Describe() const { return transport_->Describe(); }

 private:
  std::unique_ptr<RpcTransport> transport_;
};

}  // namespace regflow::rpc
