#include "config/network.hpp"

#include <stdexcept>
#include <utility>

namespace regflow::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::uint16_t rpc_port) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.rpc_port = rpc_port;
  return cfg;
}

}  // namespace

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig mainnet = BuildConfig(NetworkType::kMainnet, "main", 8332);
  static const NetworkConfig testnet = BuildConfig(NetworkType::kTestnet, "test", 18332);
  static const NetworkConfig signet = BuildConfig(NetworkType::kSignet, "signet", 38332);
  static const NetworkConfig regtest = BuildConfig(NetworkType::kRegtest, "regtest", 18443);
  switch (type) {
    case NetworkType::kMainnet:
      return mainnet;
    case NetworkType::kTestnet:
      return testnet;
    case NetworkType::kSignet:
      return signet;
    case NetworkType::kRegtest:
      return regtest;
  }
  return regtest;
}

NetworkType NetworkFromString(std::string_view name) {
  if (name == "mainnet" || name == "main") return NetworkType::kMainnet;
  if (name == "testnet" || name == "test") return NetworkType::kTestnet;
  if (name == "signet" || name == "sig") return NetworkType::kSignet;
  if (name == "regtest" || name == "reg") return NetworkType::kRegtest;
  throw std::runtime_error("unknown network: " + std::string(name));
}

std::string_view NetworkName(NetworkType type) {
  switch (type) {
    case NetworkType::kMainnet:
      return "mainnet";
    case NetworkType::kTestnet:
      return "testnet";
    case NetworkType::kSignet:
      return "signet";
    case NetworkType::kRegtest:
      return "regtest";
  }
  return "regtest";
}

}  // namespace regflow::config
