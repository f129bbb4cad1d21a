#pragma once

#include <stdexcept>
#include <string>

namespace regflow::rpc {

// The node could not be reached or did not answer with a usable JSON-RPC
// reply: connect/send/receive failures, HTTP 401/403, malformed HTTP, a body
// that is not JSON.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& message, int http_status = 0)
      : std::runtime_error(message), http_status_(http_status) {}

  int http_status() const { return http_status_; }

 private:
  int http_status_;
};

// The node answered with a JSON-RPC error object. what() carries the node's
// message verbatim.
class RpcError : public std::runtime_error {
 public:
  RpcError(int code, const std::string& message, std::string method = {})
      : std::runtime_error(message), code_(code), method_(std::move(method)) {}

  int code() const { return code_; }
  const std::string& method() const { return method_; }

 private:
  int code_;
  std::string method_;
};

// A call succeeded but its result does not have the shape the typed binding
// expects (e.g. getbalance returning a non-amount).
class ResponseShapeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Error codes used by Bitcoin Core (src/rpc/protocol.h) that callers react to.
inline constexpr int kRpcMiscError = -1;
inline constexpr int kRpcInvalidAddressOrKey = -5;
inline constexpr int kRpcMethodNotFound = -32601;
inline constexpr int kRpcWalletError = -4;
inline constexpr int kRpcWalletInsufficientFunds = -6;
inline constexpr int kRpcWalletNotFound = -18;
inline constexpr int kRpcWalletNotSpecified = -19;
inline constexpr int kRpcWalletAlreadyLoaded = -35;

}  // namespace regflow::rpc
