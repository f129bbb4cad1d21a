#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace regflow::rpc {

struct HttpResponse {
  int status{0};
  std::string reason;
  std::string body;
};

struct HttpRequestTarget {
  std::string host;
  std::uint16_t port{0};
  std::string path{"/"};
  // "user:password"; sent as an HTTP Basic Authorization header when set.
  std::optional<std::string> credentials;
  // Socket read/write timeout; zero waits indefinitely.
  int timeout_ms{0};
};

std::string BuildHttpRequest(const HttpRequestTarget& target, std::string_view body);

// Parses a complete HTTP/1.x response (status line, headers, body). Bodies
// framed by Content-Length, chunked transfer coding, or connection close are
// supported. Returns std::nullopt and fills `*error` when `raw` is malformed.
std::optional<HttpResponse> ParseHttpResponse(std::string_view raw, std::string* error);

// POSTs `body` as application/json on a fresh connection and returns the
// response whatever its status. Throws TransportError on connection or
// framing failures.
HttpResponse HttpPost(const HttpRequestTarget& target, std::string_view body);

}  // namespace regflow::rpc
