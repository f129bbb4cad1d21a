#include "rpc/http_client.hpp"

#include <array>
#include <cctype>
#include <sstream>

#include "net/socket.hpp"
#include "rpc/errors.hpp"
#include "util/base64.hpp"

namespace regflow::rpc {

namespace {

constexpr std::size_t kMaxHeaderSize = 64 * 1024;
constexpr std::size_t kMaxBodySize = 64 * 1024 * 1024;

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string_view TrimView(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

std::optional<std::size_t> FindHeaderEnd(std::string_view data) {
  const auto pos = data.find("\r\n\r\n");
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  return pos + 4;
}

std::optional<std::string_view> FindHeader(std::string_view headers, std::string_view name) {
  std::size_t offset = 0;
  while (offset < headers.size()) {
    auto end = headers.find("\r\n", offset);
    if (end == std::string_view::npos) {
      end = headers.size();
    }
    const auto line = headers.substr(offset, end - offset);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos && EqualsIgnoreCase(TrimView(line.substr(0, colon)), name)) {
      return TrimView(line.substr(colon + 1));
    }
    offset = end + 2;
  }
  return std::nullopt;
}

std::optional<std::size_t> ParseContentLength(std::string_view headers) {
  const auto value = FindHeader(headers, "Content-Length");
  if (!value || value->empty()) {
    return std::nullopt;
  }
  std::size_t length = 0;
  for (char c : *value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    length = length * 10 + static_cast<std::size_t>(c - '0');
    if (length > kMaxBodySize) {
      return std::nullopt;
    }
  }
  return length;
}

bool IsChunked(std::string_view headers) {
  const auto value = FindHeader(headers, "Transfer-Encoding");
  return value && value->find("chunked") != std::string_view::npos;
}

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool DecodeChunked(std::string_view data, std::string* out, std::string* error) {
  out->clear();
  std::size_t offset = 0;
  while (true) {
    const auto line_end = data.find("\r\n", offset);
    if (line_end == std::string_view::npos) {
      *error = "truncated chunk header";
      return false;
    }
    auto size_text = data.substr(offset, line_end - offset);
    const auto ext = size_text.find(';');
    if (ext != std::string_view::npos) {
      size_text = size_text.substr(0, ext);
    }
    size_text = TrimView(size_text);
    if (size_text.empty()) {
      *error = "empty chunk size";
      return false;
    }
    std::size_t chunk_size = 0;
    for (char c : size_text) {
      const int digit = HexDigit(c);
      if (digit < 0) {
        *error = "invalid chunk size";
        return false;
      }
      chunk_size = chunk_size * 16 + static_cast<std::size_t>(digit);
      if (chunk_size > kMaxBodySize) {
        *error = "chunk too large";
        return false;
      }
    }
    offset = line_end + 2;
    if (chunk_size == 0) {
      return true;
    }
    if (data.size() < offset + chunk_size + 2) {
      *error = "truncated chunk";
      return false;
    }
    out->append(data.substr(offset, chunk_size));
    offset += chunk_size + 2;
  }
}

}  // namespace

std::string BuildHttpRequest(const HttpRequestTarget& target, std::string_view body) {
  std::ostringstream oss;
  oss << "POST " << (target.path.empty() ? "/" : target.path) << " HTTP/1.1\r\n";
  oss << "Host: " << target.host << ":" << target.port << "\r\n";
  if (target.credentials && !target.credentials->empty()) {
    oss << "Authorization: Basic " << util::Base64Encode(*target.credentials) << "\r\n";
  }
  oss << "Content-Type: application/json\r\n";
  oss << "Content-Length: " << body.size() << "\r\n";
  oss << "Connection: close\r\n\r\n";
  oss << body;
  return oss.str();
}

std::optional<HttpResponse> ParseHttpResponse(std::string_view raw, std::string* error) {
  const auto header_end = FindHeaderEnd(raw);
  if (!header_end) {
    *error = "incomplete HTTP headers";
    return std::nullopt;
  }
  const auto headers = raw.substr(0, *header_end - 4);
  const auto line_end = headers.find("\r\n");
  const auto status_line = headers.substr(0, line_end);
  // "HTTP/1.1 200 OK"
  if (status_line.rfind("HTTP/", 0) != 0) {
    *error = "malformed HTTP status line";
    return std::nullopt;
  }
  const auto first_space = status_line.find(' ');
  if (first_space == std::string_view::npos || status_line.size() < first_space + 4) {
    *error = "malformed HTTP status line";
    return std::nullopt;
  }
  HttpResponse response;
  const auto code_text = status_line.substr(first_space + 1, 3);
  for (char c : code_text) {
    if (c < '0' || c > '9') {
      *error = "malformed HTTP status code";
      return std::nullopt;
    }
    response.status = response.status * 10 + (c - '0');
  }
  if (status_line.size() > first_space + 5) {
    response.reason = std::string(status_line.substr(first_space + 5));
  }

  const auto payload = raw.substr(*header_end);
  if (IsChunked(headers)) {
    if (!DecodeChunked(payload, &response.body, error)) {
      return std::nullopt;
    }
    return response;
  }
  if (const auto length = ParseContentLength(headers)) {
    if (payload.size() < *length) {
      *error = "truncated HTTP body";
      return std::nullopt;
    }
    response.body = std::string(payload.substr(0, *length));
    return response;
  }
  response.body = std::string(payload);
  return response;
}

HttpResponse HttpPost(const HttpRequestTarget& target, std::string_view body) {
  net::TcpSocket socket;
  std::string connect_error;
  if (!socket.Connect(target.host, target.port, &connect_error)) {
    throw TransportError("failed to connect to RPC server: " + connect_error);
  }
  if (target.timeout_ms > 0) {
    (void)socket.SetTimeout(target.timeout_ms);
  }
  if (!socket.SendAll(BuildHttpRequest(target, body))) {
    throw TransportError("failed to send request to " + target.host + ":" +
                         std::to_string(target.port));
  }

  std::string raw;
  raw.reserve(4096);
  std::array<std::uint8_t, 4096> chunk{};
  std::optional<std::size_t> body_offset;
  std::optional<std::size_t> content_length;
  while (true) {
    const auto bytes = socket.Recv(chunk.data(), chunk.size());
    if (bytes < 0) {
      throw TransportError("failed to read RPC response (timeout or reset)");
    }
    if (bytes == 0) {
      break;
    }
    raw.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    if (!body_offset) {
      body_offset = FindHeaderEnd(raw);
      if (!body_offset && raw.size() > kMaxHeaderSize) {
        throw TransportError("RPC response headers too large");
      }
      if (body_offset) {
        const auto headers = std::string_view(raw).substr(0, *body_offset - 4);
        if (!IsChunked(headers)) {
          content_length = ParseContentLength(headers);
        }
      }
    }
    if (body_offset && raw.size() - *body_offset > kMaxBodySize) {
      throw TransportError("RPC response too large");
    }
    if (body_offset && content_length && raw.size() >= *body_offset + *content_length) {
      break;
    }
  }

  std::string parse_error;
  auto response = ParseHttpResponse(raw, &parse_error);
  if (!response) {
    throw TransportError("invalid RPC response: " + parse_error);
  }
  return std::move(*response);
}

}  // namespace regflow::rpc
