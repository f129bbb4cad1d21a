#include "flow/mining.hpp"

#include <stdexcept>

#include "util/logging.hpp"

namespace regflow::flow {

namespace {

constexpr std::string_view kComponent = "mining";

}  // namespace

MiningResult MineUntilPositiveBalance(rpc::NodeClient& node, rpc::NodeClient& wallet,
                                      const std::string& address, std::uint64_t max_blocks) {
  MiningResult result;
  while (result.final_balance <= 0) {
    if (max_blocks != 0 && result.blocks_mined >= max_blocks) {
      throw std::runtime_error("no spendable balance after " + std::to_string(max_blocks) +
                               " blocks (balance " + util::FormatAmountCompact(result.final_balance) +
                               " BTC)");
    }
    ++result.blocks_mined;
    util::LogDebug(kComponent, "Mining block " + std::to_string(result.blocks_mined) +
                                   " to address " + address);
    const auto hashes = node.GenerateToAddress(1, address);
    result.last_block_hash = hashes.front();

    result.final_balance = wallet.GetBalance();
    util::LogInfo(kComponent, "Mined block " + std::to_string(result.blocks_mined) + " (" +
                                  result.last_block_hash + "), wallet balance " +
                                  util::FormatAmountCompact(result.final_balance) + " BTC");
  }
  return result;
}

}  // namespace regflow::flow
