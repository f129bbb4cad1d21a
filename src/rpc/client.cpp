#include "rpc/client.hpp"

#include <cctype>
#include <sstream>

#include "rpc/errors.hpp"
#include "util/logging.hpp"

namespace regflow::rpc {

namespace {

bool IsUnreserved(unsigned char c) {
  return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string PercentEncode(const std::string& value) {
  static const char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (IsUnreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0f]);
    }
  }
  return out;
}

std::string Truncate(const std::string& text, std::size_t limit = 200) {
  if (text.size() <= limit) {
    return text;
  }
  return text.substr(0, limit) + "...";
}

}  // namespace

std::string WalletPath(const std::string& wallet_name) {
  if (wallet_name.empty()) {
    return "/";
  }
  return "/wallet/" + PercentEncode(wallet_name);
}

nlohmann::json BuildRequest(const std::string& id, const std::string& method,
                            const nlohmann::json& params) {
  return nlohmann::json{
      {"jsonrpc", "1.0"},
      {"id", id},
      {"method", method},
      {"params", params.is_null() ? nlohmann::json::array() : params},
  };
}

nlohmann::json UnwrapResponse(const HttpResponse& response, const std::string& method) {
  if (response.status == 401) {
    throw TransportError("RPC authorization failed for " + method +
                             " (check rpc user and password)",
                         response.status);
  }
  if (response.status == 403) {
    throw TransportError("RPC access forbidden for " + method + " (check rpcallowip)",
                         response.status);
  }
  nlohmann::json reply;
  try {
    reply = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::exception&) {
    throw TransportError("non-JSON reply to " + method + " (HTTP " +
                             std::to_string(response.status) + "): " + Truncate(response.body),
                         response.status);
  }
  if (!reply.is_object()) {
    throw TransportError("unexpected reply to " + method + ": " + Truncate(reply.dump()),
                         response.status);
  }
  const auto error = reply.find("error");
  if (error != reply.end() && !error->is_null()) {
    int code = kRpcMiscError;
    std::string message = error->dump();
    if (error->is_object()) {
      code = error->value("code", kRpcMiscError);
      message = error->value("message", message);
    }
    throw RpcError(code, message, method);
  }
  if (response.status != 200) {
    throw TransportError("HTTP " + std::to_string(response.status) + " from node for " + method,
                         response.status);
  }
  const auto result = reply.find("result");
  if (result == reply.end()) {
    throw TransportError("reply to " + method + " has no result member", response.status);
  }
  return *result;
}

JsonRpcClient::JsonRpcClient(RpcEndpoint endpoint, std::string wallet_name)
    : endpoint_(std::move(endpoint)), wallet_name_(std::move(wallet_name)) {}

nlohmann::json JsonRpcClient::Call(const std::string& method, const nlohmann::json& params) {
  const auto request = BuildRequest(NextId(), method, params);
  HttpRequestTarget target;
  target.host = endpoint_.host;
  target.port = endpoint_.port;
  target.path = WalletPath(wallet_name_);
  if (!endpoint_.user.empty() || !endpoint_.password.empty()) {
    target.credentials = endpoint_.user + ":" + endpoint_.password;
  }
  target.timeout_ms = endpoint_.timeout_ms;

  util::LogDebug("rpc", Describe() + " -> " + request.dump());
  const auto response = HttpPost(target, request.dump());
  util::LogDebug("rpc", Describe() + " <- HTTP " + std::to_string(response.status) + " " +
                            Truncate(response.body, 512));
  return UnwrapResponse(response, method);
}

std::unique_ptr<RpcTransport> JsonRpcClient::ForWallet(const std::string& wallet_name) const {
  return std::make_unique<JsonRpcClient>(endpoint_, wallet_name);
}

std::string JsonRpcClient::Describe() const {
  std::ostringstream oss;
  oss << "http://" << endpoint_.host << ":" << endpoint_.port;
  if (!wallet_name_.empty()) {
    oss << WalletPath(wallet_name_);
  }
  return oss.str();
}

std::string JsonRpcClient::NextId() {
  std::ostringstream oss;
  oss << "regflow-" << ++next_id_;
  return oss.str();
}

}  // namespace regflow::rpc
