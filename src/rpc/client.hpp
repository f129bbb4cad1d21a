#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "nlohmann/json.hpp"

#include "rpc/http_client.hpp"

namespace regflow::rpc {

// One authenticated node RPC endpoint. Every call, typed or raw, goes through
// Call(); wallet-scoped calls go through the transport returned by ForWallet().
class RpcTransport {
 public:
  virtual ~RpcTransport() = default;

  // Issues `method` with positional `params` and returns the reply's
  // "result" member. Throws RpcError when the node reports an error and
  // TransportError when no usable reply arrives.
  virtual nlohmann::json Call(const std::string& method, const nlohmann::json& params) = 0;

  // A transport with the same connection settings addressing the
  // /wallet/<name> endpoint.
  virtual std::unique_ptr<RpcTransport> ForWallet(const std::string& wallet_name) const = 0;

  // Human-readable endpoint, e.g. "http://127.0.0.1:18443/wallet/Miner".
  virtual std::string Describe() const = 0;
};

struct RpcEndpoint {
  std::string host{"127.0.0.1"};
  std::uint16_t port{18443};
  std::string user;
  std::string password;
  int timeout_ms{0};
};

// "/wallet/<name>" with the name percent-encoded; "/" for an empty name.
std::string WalletPath(const std::string& wallet_name);

nlohmann::json BuildRequest(const std::string& id, const std::string& method,
                            const nlohmann::json& params);

// Maps an HTTP reply from the node onto the JSON-RPC result. Bitcoin Core
// answers RPC errors with HTTP 404/500 and a JSON body, so the status alone
// does not decide between RpcError and TransportError.
nlohmann::json UnwrapResponse(const HttpResponse& response, const std::string& method);

// JSON-RPC 1.0 over HTTP with Basic authentication, one connection per call.
class JsonRpcClient final : public RpcTransport {
 public:
  explicit JsonRpcClient(RpcEndpoint endpoint, std::string wallet_name = {});

  nlohmann::json Call(const std::string& method, const nlohmann::json& params) override;
  std::unique_ptr<RpcTransport> ForWallet(const std::string& wallet_name) const override;
  std::string Describe() const override;

 private:
  std::string NextId();

  RpcEndpoint endpoint_;
  std::string wallet_name_;
  std::uint64_t next_id_{0};
};

}  // namespace regflow::rpc
