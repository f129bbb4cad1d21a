#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"

#include "rpc/client.hpp"
#include "rpc/errors.hpp"

namespace regflow::test {

// Transport that answers from a queue of canned steps and records every call
// as "method@wallet". Steps are consumed in order regardless of method; a
// call with nothing queued fails as a transport error.
class ScriptedTransport final : public rpc::RpcTransport {
 public:
  struct Step {
    std::string method;
    std::function<nlohmann::json()> reply;
  };

  struct Script {
    std::deque<Step> steps;
    std::vector<std::string> calls;
    std::vector<nlohmann::json> params;
  };

  explicit ScriptedTransport(std::shared_ptr<Script> script, std::string wallet = {})
      : script_(std::move(script)), wallet_(std::move(wallet)) {}

  static Step Result(std::string method, nlohmann::json result) {
    return {std::move(method), [result]() { return result; }};
  }

  static Step Error(std::string method, int code, std::string message) {
    const auto name = method;
    return {std::move(method), [name, code, message]() -> nlohmann::json {
              throw rpc::RpcError(code, message, name);
            }};
  }

  static Step Unreachable(std::string method) {
    return {std::move(method), []() -> nlohmann::json {
              throw rpc::TransportError("failed to connect to RPC server: Connection refused");
            }};
  }

  nlohmann::json Call(const std::string& method, const nlohmann::json& params) override {
    script_->calls.push_back(method + "@" + wallet_);
    script_->params.push_back(params);
    if (script_->steps.empty()) {
      throw rpc::TransportError("unscripted call to " + method);
    }
    auto step = std::move(script_->steps.front());
    script_->steps.pop_front();
    if (step.method != method) {
      throw rpc::TransportError("expected " + step.method + ", got " + method);
    }
    return step.reply();
  }

  std::unique_ptr<rpc::RpcTransport> ForWallet(const std::string& wallet_name) const override {
    return std::make_unique<ScriptedTransport>(script_, wallet_name);
  }

  std::string Describe() const override { return "scripted://" + wallet_; }

 private:
  std::shared_ptr<Script> script_;
  std::string wallet_;
};

}  // namespace regflow::test
