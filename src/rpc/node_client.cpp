#include "rpc/node_client.hpp"

#include <stdexcept>

#include "rpc/errors.hpp"

namespace regflow::rpc {

namespace {

std::string ExpectString(const nlohmann::json& value, const std::string& method) {
  if (!value.is_string()) {
    throw ResponseShapeError(method + " returned " + value.dump() + ", expected a string");
  }
  return value.get<std::string>();
}

}  // namespace

NodeClient::NodeClient(std::unique_ptr<RpcTransport> transport)
    : transport_(std::move(transport)) {
  if (!transport_) {
    throw std::invalid_argument("NodeClient requires a transport");
  }
}

NodeClient NodeClient::Wallet(const std::string& wallet_name) const {
  return NodeClient(transport_->ForWallet(wallet_name));
}

nlohmann::json NodeClient::Call(const std::string& method, const nlohmann::json& params) {
  return transport_->Call(method, params);
}

BlockchainInfo NodeClient::GetBlockchainInfo() {
  auto result = Call("getblockchaininfo");
  if (!result.is_object()) {
    throw ResponseShapeError("getblockchaininfo returned " + result.dump());
  }
  BlockchainInfo info;
  info.chain = result.value("chain", std::string{});
  info.blocks = result.value("blocks", std::uint64_t{0});
  info.best_block_hash = result.value("bestblockhash", std::string{});
  info.raw = std::move(result);
  return info;
}

void NodeClient::UnloadWallet(const std::string& wallet_name) {
  Call("unloadwallet", nlohmann::json::array({wallet_name}));
}

void NodeClient::LoadWallet(const std::string& wallet_name) {
  Call("loadwallet", nlohmann::json::array({wallet_name}));
}

void NodeClient::CreateWallet(const std::string& wallet_name) {
  Call("createwallet", nlohmann::json::array({wallet_name}));
}

std::string NodeClient::GetNewAddress(const std::string& label) {
  return ExpectString(Call("getnewaddress", nlohmann::json::array({label})), "getnewaddress");
}

util::Amount NodeClient::GetBalance() {
  const auto result = Call("getbalance");
  const auto amount = util::ParseAmount(result);
  if (!amount) {
    throw ResponseShapeError("getbalance returned " + result.dump() + ", expected an amount");
  }
  return *amount;
}

std::vector<std::string> NodeClient::GenerateToAddress(std::uint64_t blocks,
                                                       const std::string& address) {
  const auto result = Call("generatetoaddress", nlohmann::json::array({blocks, address}));
  if (!result.is_array()) {
    throw ResponseShapeError("generatetoaddress returned " + result.dump());
  }
  std::vector<std::string> hashes;
  hashes.reserve(result.size());
  for (const auto& hash : result) {
    hashes.push_back(ExpectString(hash, "generatetoaddress"));
  }
  if (hashes.size() != blocks) {
    throw ResponseShapeError("generatetoaddress returned " + std::to_string(hashes.size()) +
                             " hashes for " + std::to_string(blocks) + " blocks");
  }
  return hashes;
}

std::string NodeClient::SendToAddress(const std::string& address, util::Amount amount,
                                      const std::string& comment) {
  // address, amount, comment, comment_to, subtractfeefromamount, replaceable
  const nlohmann::json params =
      nlohmann::json::array({address, util::FormatAmount(amount), comment, "", false, false});
  return ExpectString(Call("sendtoaddress", params), "sendtoaddress");
}

SendResult NodeClient::Send(const std::string& address, util::Amount amount) {
  nlohmann::json recipient = nlohmann::json::object();
  recipient[address] = util::FormatAmount(amount);
  const nlohmann::json outputs = nlohmann::json::array({recipient});
  // outputs, conf_target, estimate_mode, fee_rate, options
  const nlohmann::json params = nlohmann::json::array({outputs, nullptr, nullptr, nullptr, nullptr});
  const auto result = Call("send", params);
  if (!result.is_object() || !result.contains("complete")) {
    throw ResponseShapeError("send returned " + result.dump());
  }
  SendResult out;
  out.complete = result.value("complete", false);
  out.txid = result.value("txid", std::string{});
  return out;
}

nlohmann::json NodeClient::GetRawTransaction(const std::string& txid,
                                             const std::optional<std::string>& block_hash) {
  nlohmann::json params = nlohmann::json::array({txid, true});
  if (block_hash && !block_hash->empty()) {
    params.push_back(*block_hash);
  }
  return Call("getrawtransaction", params);
}

nlohmann::json NodeClient::GetMempoolEntry(const std::string& txid) {
  return Call("getmempoolentry", nlohmann::json::array({txid}));
}

nlohmann::json NodeClient::GetBlock(const std::string& block_hash) {
  return Call("getblock", nlohmann::json::array({block_hash}));
}

}  // namespace regflow::rpc
