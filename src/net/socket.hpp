#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace regflow::net {

// Blocking TCP stream socket. Owns its descriptor; movable, not copyable.
class TcpSocket {
 public:
  TcpSocket() = default;
  explicit TcpSocket(int handle);
  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;
  TcpSocket(TcpSocket&& other) noexcept;
  TcpSocket& operator=(TcpSocket&& other) noexcept;
  ~TcpSocket();

  // Tries every resolved address for `host` in turn; each attempt gives up
  // after 5 seconds. On failure `*error` describes the last attempt.
  bool Connect(const std::string& host, std::uint16_t port, std::string* error = nullptr);
  // Port 0 binds an ephemeral port; see LocalPort().
  bool BindAndListen(const std::string& address, std::uint16_t port, int backlog = 8);
  TcpSocket AcceptWithTimeout(int timeout_ms) const;

  std::ptrdiff_t Send(const std::uint8_t* data, std::size_t length) const;
  // Loops over Send() until every byte is written or the peer fails.
  bool SendAll(const std::string& data) const;
  std::ptrdiff_t Recv(std::uint8_t* data, std::size_t length) const;
  bool SetTimeout(int milliseconds);

  std::string PeerAddress() const;
  std::uint16_t LocalPort() const;
  void Close();
  bool IsValid() const noexcept { return handle_ >= 0; }

 private:
  int handle_{-1};
};

}  // namespace regflow::net
