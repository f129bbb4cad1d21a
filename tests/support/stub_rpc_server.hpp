#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"

#include "net/socket.hpp"

namespace regflow::test {

// Minimal bitcoind-shaped JSON-RPC endpoint on a loopback socket. Requests are
// served one at a time on a worker thread; errors are answered the way
// Bitcoin Core answers them (HTTP 500/404 with a JSON error body, HTTP 401
// with an empty body).
class StubRpcServer {
 public:
  struct Options {
    std::string rpc_user{"alice"};
    std::string rpc_password{"password"};
    bool chunked_responses{false};
    int socket_timeout_ms{5000};
  };

  // Receives the wallet decoded from the request path ("" for "/"). Throw
  // rpc::RpcError to produce an error reply.
  using Handler = std::function<nlohmann::json(const std::string& wallet,
                                               const std::string& method,
                                               const nlohmann::json& params)>;

  StubRpcServer(Options options, Handler handler);
  ~StubRpcServer();

  StubRpcServer(const StubRpcServer&) = delete;
  StubRpcServer& operator=(const StubRpcServer&) = delete;

  // Binds an ephemeral loopback port and starts serving.
  void Start();
  void Stop();

  std::uint16_t Port() const { return port_; }
  std::vector<std::string> RequestPaths() const;
  std::size_t UnauthorizedCount() const { return unauthorized_.load(); }

 private:
  void ServeLoop();
  void HandleClient(net::TcpSocket client);
  bool ReadRequest(net::TcpSocket& client, std::string* path, std::string* headers,
                   std::string* body);
  bool Authorized(const std::string& headers) const;
  void SendResponse(net::TcpSocket& client, int status, const std::string& body);

  Options options_;
  Handler handler_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> unauthorized_{0};
  net::TcpSocket listener_;
  std::uint16_t port_{0};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::vector<std::string> paths_;
};

}  // namespace regflow::test
