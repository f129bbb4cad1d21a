#include "wallet/provisioner.hpp"

#include <thread>

#include "rpc/errors.hpp"
#include "util/logging.hpp"

namespace regflow::wallet {

namespace {

constexpr std::string_view kComponent = "wallet";

// Returns false when the node refused with anything but "already loaded".
bool TryLoad(rpc::NodeClient& node, const std::string& wallet_name, std::string* failure) {
  try {
    node.LoadWallet(wallet_name);
    return true;
  } catch (const rpc::RpcError& ex) {
    if (ex.code() == rpc::kRpcWalletAlreadyLoaded) {
      util::LogDebug(kComponent, "wallet '" + wallet_name + "' was already loaded");
      return true;
    }
    *failure = ex.what();
    return false;
  }
}

}  // namespace

std::string_view ProvisionOutcomeName(ProvisionOutcome outcome) {
  switch (outcome) {
    case ProvisionOutcome::kLoaded:
      return "loaded";
    case ProvisionOutcome::kCreated:
      return "created";
    case ProvisionOutcome::kLoadedAfterRetry:
      return "loaded after retry";
  }
  return "loaded";
}

ProvisionOutcome EnsureWallet(rpc::NodeClient& node, const std::string& wallet_name,
                              std::chrono::milliseconds unload_delay) {
  try {
    node.UnloadWallet(wallet_name);
    util::LogDebug(kComponent, "unloaded wallet '" + wallet_name + "'");
  } catch (const rpc::RpcError& ex) {
    util::LogDebug(kComponent, "unload of '" + wallet_name + "' skipped: " + ex.what());
  }

  // Give the node a moment to release the wallet's database lock.
  if (unload_delay.count() > 0) {
    std::this_thread::sleep_for(unload_delay);
  }

  std::string failure;
  if (TryLoad(node, wallet_name, &failure)) {
    util::LogInfo(kComponent, "Wallet '" + wallet_name + "' loaded successfully");
    return ProvisionOutcome::kLoaded;
  }
  util::LogDebug(kComponent, "load of '" + wallet_name + "' failed: " + failure);

  util::LogInfo(kComponent, "Creating new wallet '" + wallet_name + "'");
  try {
    node.CreateWallet(wallet_name);
    util::LogInfo(kComponent, "Wallet '" + wallet_name + "' created successfully");
    return ProvisionOutcome::kCreated;
  } catch (const rpc::RpcError& ex) {
    util::LogWarn(kComponent,
                  "Wallet creation failed, trying to load again: " + std::string(ex.what()));
  }

  try {
    node.LoadWallet(wallet_name);
  } catch (const rpc::RpcError& ex) {
    if (ex.code() != rpc::kRpcWalletAlreadyLoaded) {
      util::LogError(kComponent, "unable to load or create wallet '" + wallet_name + "'");
      throw;
    }
  }
  util::LogInfo(kComponent, "Wallet '" + wallet_name + "' loaded after retry");
  return ProvisionOutcome::kLoadedAfterRetry;
}

}  // namespace regflow::wallet
