#pragma once

#include <cstdint>
#include <string>

#include "rpc/node_client.hpp"
#include "util/amount.hpp"

namespace regflow::flow {

struct MiningResult {
  std::uint64_t blocks_mined{0};
  util::Amount final_balance{0};
  std::string last_block_hash;
};

// Mines one block at a time to `address` through `node`, then asks `wallet`
// for its balance, until that balance is positive. Coinbase outputs only
// become spendable once `maturity` further blocks sit on top of them, so a
// fresh chain needs at least maturity + 1 iterations. `max_blocks` of zero
// means no limit; otherwise std::runtime_error is thrown once that many
// blocks were mined without a positive balance.
MiningResult MineUntilPositiveBalance(rpc::NodeClient& node, rpc::NodeClient& wallet,
                                      const std::string& address, std::uint64_t max_blocks = 0);

}  // namespace regflow::flow
