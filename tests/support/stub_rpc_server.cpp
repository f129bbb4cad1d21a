#include "support/stub_rpc_server.hpp"

#include <array>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "rpc/errors.hpp"
#include "util/base64.hpp"

namespace regflow::test {

namespace {

constexpr std::size_t kMaxHeaderSize = 64 * 1024;

std::string_view HeaderValue(std::string_view headers, std::string_view name) {
  std::size_t start = 0;
  while (start < headers.size()) {
    auto end = headers.find("\r\n", start);
    auto line = end == std::string_view::npos ? headers.substr(start)
                                              : headers.substr(start, end - start);
    auto colon = line.find(':');
    if (colon == name.size()) {
      bool match = true;
      for (std::size_t i = 0; i < name.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(line[i])) !=
            std::tolower(static_cast<unsigned char>(name[i]))) {
          match = false;
          break;
        }
      }
      if (match) {
        auto value = line.substr(colon + 1);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
          value.remove_prefix(1);
        }
        return value;
      }
    }
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 2;
  }
  return {};
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string PercentDecode(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size() && HexValue(text[i + 1]) >= 0 &&
        HexValue(text[i + 2]) >= 0) {
      out.push_back(static_cast<char>(HexValue(text[i + 1]) * 16 + HexValue(text[i + 2])));
      i += 2;
    } else {
      out.push_back(text[i]);
    }
  }
  return out;
}

std::string WalletFromPath(const std::string& path) {
  constexpr std::string_view kPrefix = "/wallet/";
  if (path.rfind(kPrefix, 0) != 0) {
    return {};
  }
  return PercentDecode(std::string_view(path).substr(kPrefix.size()));
}

const char* ReasonPhrase(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    default:
      return "Internal Server Error";
  }
}

}  // namespace

StubRpcServer::StubRpcServer(Options options, Handler handler)
    : options_(std::move(options)), handler_(std::move(handler)) {}

StubRpcServer::~StubRpcServer() { Stop(); }

void StubRpcServer::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  if (!listener_.BindAndListen("127.0.0.1", 0)) {
    running_.store(false);
    throw std::runtime_error("stub rpc server: failed to bind loopback port");
  }
  port_ = listener_.LocalPort();
  worker_ = std::thread([this]() { ServeLoop(); });
}

void StubRpcServer::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }
  // The accept loop polls running_, so join before closing the listener.
  if (worker_.joinable()) {
    worker_.join();
  }
  listener_.Close();
}

std::vector<std::string> StubRpcServer::RequestPaths() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return paths_;
}

void StubRpcServer::ServeLoop() {
  while (running_) {
    auto client = listener_.AcceptWithTimeout(100);
    if (!client.IsValid()) {
      continue;
    }
    if (options_.socket_timeout_ms > 0) {
      client.SetTimeout(options_.socket_timeout_ms);
    }
    HandleClient(std::move(client));
  }
}

void StubRpcServer::HandleClient(net::TcpSocket client) {
  // Loopback only, like bitcoind's default rpcallowip.
  if (client.PeerAddress().rfind("127.", 0) != 0) {
    SendResponse(client, 403, {});
    return;
  }
  std::string path;
  std::string headers;
  std::string body;
  if (!ReadRequest(client, &path, &headers, &body)) {
    SendResponse(client, 400, {});
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    paths_.push_back(path);
  }
  if (!Authorized(headers)) {
    ++unauthorized_;
    SendResponse(client, 401, {});
    return;
  }

  nlohmann::json request = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (!request.is_object()) {
    nlohmann::json error = {
        {"result", nullptr},
        {"error", {{"code", -32700}, {"message", "Parse error"}}},
        {"id", nullptr},
    };
    SendResponse(client, 500, error.dump());
    return;
  }
  const auto id = request.contains("id") ? request.at("id") : nlohmann::json();
  const auto method =
      request.contains("method") && request.at("method").is_string()
          ? request.at("method").get<std::string>()
          : std::string{};
  const auto params = request.contains("params") ? request.at("params") : nlohmann::json::array();
  try {
    auto result = handler_(WalletFromPath(path), method, params);
    nlohmann::json reply = {{"result", result}, {"error", nullptr}, {"id", id}};
    SendResponse(client, 200, reply.dump());
  } catch (const rpc::RpcError& ex) {
    nlohmann::json reply = {
        {"result", nullptr},
        {"error", {{"code", ex.code()}, {"message", ex.what()}}},
        {"id", id},
    };
    SendResponse(client, ex.code() == rpc::kRpcMethodNotFound ? 404 : 500, reply.dump());
  } catch (const std::exception& ex) {
    nlohmann::json reply = {
        {"result", nullptr},
        {"error", {{"code", rpc::kRpcMiscError}, {"message", ex.what()}}},
        {"id", id},
    };
    SendResponse(client, 500, reply.dump());
  }
}

bool StubRpcServer::ReadRequest(net::TcpSocket& client, std::string* path,
                                std::string* headers, std::string* body) {
  std::string buffer;
  std::array<std::uint8_t, 2048> chunk{};
  std::size_t header_end = std::string::npos;
  while (buffer.size() < kMaxHeaderSize) {
    const auto bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      return false;
    }
    buffer.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    header_end = buffer.find("\r\n\r\n");
    if (header_end != std::string::npos) {
      break;
    }
  }
  if (header_end == std::string::npos) {
    return false;
  }
  *headers = buffer.substr(0, header_end);
  const auto line_end = headers->find("\r\n");
  const auto request_line = headers->substr(0, line_end);
  if (request_line.rfind("POST ", 0) != 0) {
    return false;
  }
  const auto path_end = request_line.find(' ', 5);
  *path = request_line.substr(5, path_end == std::string::npos ? std::string::npos : path_end - 5);

  std::size_t content_length = 0;
  const auto length_value = HeaderValue(*headers, "Content-Length");
  if (!length_value.empty()) {
    try {
      content_length = static_cast<std::size_t>(std::stoul(std::string(length_value)));
    } catch (const std::exception&) {
      return false;
    }
  }
  std::string payload = buffer.substr(header_end + 4);
  while (payload.size() < content_length) {
    const auto bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      return false;
    }
    payload.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
  }
  payload.resize(content_length);
  *body = std::move(payload);
  return true;
}

bool StubRpcServer::Authorized(const std::string& headers) const {
  auto value = HeaderValue(headers, "Authorization");
  constexpr std::string_view kBasic = "Basic ";
  if (!value.starts_with(kBasic)) {
    return false;
  }
  value.remove_prefix(kBasic.size());
  const auto decoded = util::Base64Decode(value);
  return decoded && *decoded == options_.rpc_user + ":" + options_.rpc_password;
}

void StubRpcServer::SendResponse(net::TcpSocket& client, int status, const std::string& body) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << status << ' ' << ReasonPhrase(status) << "\r\n";
  if (status == 401) {
    oss << "WWW-Authenticate: Basic realm=\"jsonrpc\"\r\n";
  } else {
    oss << "Content-Type: application/json\r\n";
  }
  if (options_.chunked_responses && !body.empty()) {
    oss << "Transfer-Encoding: chunked\r\n";
    oss << "Connection: close\r\n\r\n";
    // Split the body so the client has to join more than one chunk.
    const std::size_t half = body.size() / 2;
    const std::string_view parts[] = {std::string_view(body).substr(0, half),
                                      std::string_view(body).substr(half)};
    for (const auto part : parts) {
      if (part.empty()) {
        continue;
      }
      oss << std::hex << part.size() << std::dec << "\r\n" << part << "\r\n";
    }
    oss << "0\r\n\r\n";
  } else {
    oss << "Content-Length: " << body.size() << "\r\n";
    oss << "Connection: close\r\n\r\n";
    oss << body;
  }
  client.SendAll(oss.str());
  client.Close();
}

}  // namespace regflow::test
