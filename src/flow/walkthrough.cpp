#include "flow/walkthrough.hpp"

#include <thread>

#include "flow/dispatcher.hpp"
#include "flow/report.hpp"
#include "util/logging.hpp"
#include "wallet/provisioner.hpp"

namespace regflow::flow {

namespace {

constexpr std::string_view kComponent = "regflow";

void Section(std::string_view title) {
  util::LogInfo(kComponent, "=== " + std::string(title) + " ===");
}

void Info(const std::string& message) { util::LogInfo(kComponent, message); }

std::string Btc(util::Amount amount) { return util::FormatAmountCompact(amount) + " BTC"; }

void ExplainMaturity(const MiningResult& mining, const config::NetworkConfig& network) {
  Section("Balance Explanation");
  Info("It took " + std::to_string(mining.blocks_mined) +
       " blocks to get a positive spendable balance because:");
  Info("1. Each block reward is " + std::to_string(network.initial_subsidy_coins) + " BTC in " +
       network.network_id + " mode");
  Info("2. Block rewards require " + std::to_string(network.coinbase_maturity) +
       " confirmations to become spendable (mature)");
  Info("3. Therefore, we need to mine at least " +
       std::to_string(network.coinbase_maturity + 1) +
       " blocks to have spendable balance from the first block reward");
}

void LogMempoolEntry(const nlohmann::json& entry) {
  std::string summary = "Mempool entry:";
  if (entry.is_object()) {
    if (const auto vsize = entry.find("vsize"); vsize != entry.end()) {
      summary += " vsize=" + vsize->dump();
    }
    if (const auto fees = entry.find("fees"); fees != entry.end() && fees->is_object()) {
      if (const auto base = fees->find("base"); base != fees->end()) {
        if (const auto fee = util::ParseAmount(*base)) {
          summary += " fee=" + Btc(*fee);
        }
      }
    }
  }
  Info(summary);
  util::LogDebug(kComponent, entry.dump(2));
}

void LogSummary(const ReconciliationResult& r) {
  Section("Summary");
  Info("Transaction ID: " + r.txid);
  Info("Miner's Input Address: " + r.input_address);
  Info("Miner's Input Amount: " + Btc(r.input_amount));
  Info("Trader's Output Address: " + r.output_address);
  Info("Trader's Output Amount: " + Btc(r.output_amount));
  Info("Miner's Change Address: " + r.change_address);
  Info("Miner's Change Amount: " + Btc(r.change_amount));
  Info("Transaction Fees: " + Btc(r.fee));
  Info("Block Height: " + std::to_string(r.block_height));
  Info("Block Hash: " + r.block_hash);
}

}  // namespace

WalkthroughResult RunWalkthrough(rpc::NodeClient& node, const config::Settings& settings) {
  WalkthroughResult out;
  const auto& network = config::ConfigFor(settings.network);

  out.chain_info = node.GetBlockchainInfo();
  Info("Connected to " + node.Describe() + ": chain=" + out.chain_info.chain +
       " blocks=" + std::to_string(out.chain_info.blocks) +
       " bestblockhash=" + out.chain_info.best_block_hash);
  util::LogDebug(kComponent, "Blockchain Info: " + out.chain_info.raw.dump());

  if (out.chain_info.chain != network.network_id) {
    util::LogWarn(kComponent, "node reports chain '" + out.chain_info.chain + "', expected " +
                                  std::string(config::NetworkName(settings.network)));
  }

  Section("Creating/Loading Wallets");
  const auto miner_outcome =
      wallet::EnsureWallet(node, settings.miner_wallet, settings.unload_delay);
  if (settings.wallet_settle_delay.count() > 0) {
    std::this_thread::sleep_for(settings.wallet_settle_delay);
  }
  const auto trader_outcome =
      wallet::EnsureWallet(node, settings.trader_wallet, settings.unload_delay);
  util::LogDebug(kComponent,
                 settings.miner_wallet + ": " +
                     std::string(wallet::ProvisionOutcomeName(miner_outcome)) + ", " +
                     settings.trader_wallet + ": " +
                     std::string(wallet::ProvisionOutcomeName(trader_outcome)));

  Section("Generating Mining Rewards");
  auto miner = node.Wallet(settings.miner_wallet);
  out.miner_address = miner.GetNewAddress(settings.mining_label);
  Info("Generated Miner address: " + out.miner_address);
  out.mining = MineUntilPositiveBalance(node, miner, out.miner_address, settings.max_blocks);

  ExplainMaturity(out.mining, network);

  Section("Final Miner Balance");
  Info("Miner wallet balance: " + Btc(out.mining.final_balance));

  Section("Setting up Trader Wallet");
  auto trader = node.Wallet(settings.trader_wallet);
  out.trader_address = trader.GetNewAddress(settings.receive_label);
  Info("Generated Trader address: " + out.trader_address);

  Section("Sending Transaction");
  util::LogDebug(kComponent, "paying " + Btc(settings.send_amount) + " with " +
                                 std::string(config::SendMethodName(settings.send_method)));
  out.txid = Dispatch(settings.send_method, miner, out.trader_address, settings.send_amount,
                      settings.payment_label);
  Info("Transaction sent! TXID: " + out.txid);

  Section("Checking Mempool");
  out.mempool_entry = node.GetMempoolEntry(out.txid);
  LogMempoolEntry(out.mempool_entry);

  Section("Confirming Transaction");
  out.confirmation_block_hash = node.GenerateToAddress(1, out.miner_address).front();
  Info("Confirmation block mined: " + out.confirmation_block_hash);

  Section("Extracting Transaction Details");
  out.reconciliation = Reconcile(node, out.txid, out.confirmation_block_hash);

  Section("Writing Output to File");
  WriteReport(settings.output_path, out.reconciliation);
  out.report_path = settings.output_path;
  Info("Output written to " + out.report_path + " successfully!");

  LogSummary(out.reconciliation);
  return out;
}

}  // namespace regflow::flow
