#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace regflow::config {

enum class NetworkType {
  kMainnet,
  kTestnet,
  kSignet,
  kRegtest,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kRegtest};
  std::string network_id{"regtest"};
  std::uint16_t rpc_port{18443};
  // Number of blocks that must be built on top of a coinbase before its
  // output may be spent.
  std::uint32_t coinbase_maturity{100};
  // Block subsidy at height 0, in whole coins.
  std::uint32_t initial_subsidy_coins{50};
};

const NetworkConfig& ConfigFor(NetworkType type);

// Throws std::runtime_error for names it does not know.
NetworkType NetworkFromString(std::string_view name);
std::string_view NetworkName(NetworkType type);

}  // namespace regflow::config
