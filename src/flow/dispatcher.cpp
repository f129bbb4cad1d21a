#include "flow/dispatcher.hpp"

#include <stdexcept>

#include "rpc/errors.hpp"
#include "util/logging.hpp"

namespace regflow::flow {

std::string SendPayment(rpc::NodeClient& wallet, const std::string& to_address,
                        util::Amount amount, const std::string& label) {
  util::LogDebug("dispatch", "sendtoaddress " + to_address + " " + util::FormatAmount(amount) +
                                 " via " + wallet.Describe());
  return wallet.SendToAddress(to_address, amount, label);
}

std::string SendWithSendRpc(rpc::NodeClient& wallet, const std::string& to_address,
                            util::Amount amount) {
  util::LogDebug("dispatch", "send " + to_address + " " + util::FormatAmount(amount) + " via " +
                                 wallet.Describe());
  const auto result = wallet.Send(to_address, amount);
  if (!result.complete) {
    throw std::runtime_error("send returned an incomplete transaction" +
                             (result.txid.empty() ? std::string{} : " (" + result.txid + ")"));
  }
  if (result.txid.empty()) {
    throw rpc::ResponseShapeError("send reported completion without a txid");
  }
  return result.txid;
}

std::string Dispatch(config::SendMethod method, rpc::NodeClient& wallet,
                     const std::string& to_address, util::Amount amount,
                     const std::string& label) {
  switch (method) {
    case config::SendMethod::kSendToAddress:
      return SendPayment(wallet, to_address, amount, label);
    case config::SendMethod::kSend:
      return SendWithSendRpc(wallet, to_address, amount);
  }
  throw std::logic_error("unhandled send method");
}

}  // namespace regflow::flow
