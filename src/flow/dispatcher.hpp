#pragma once

#include <string>

#include "config/settings.hpp"
#include "rpc/node_client.hpp"
#include "util/amount.hpp"

namespace regflow::flow {

// Pays `amount` to `to_address` from the wallet behind `wallet` with
// sendtoaddress; `label` becomes the transaction comment. Node defaults
// decide the fee. Node rejections (insufficient funds, bad address, locked
// wallet) propagate as RpcError.
std::string SendPayment(rpc::NodeClient& wallet, const std::string& to_address,
                        util::Amount amount, const std::string& label);

// Same payment through the generic "send" call. Throws std::runtime_error
// when the node reports the transaction as incomplete.
std::string SendWithSendRpc(rpc::NodeClient& wallet, const std::string& to_address,
                            util::Amount amount);

std::string Dispatch(config::SendMethod method, rpc::NodeClient& wallet,
                     const std::string& to_address, util::Amount amount,
                     const std::string& label);

}  // namespace regflow::flow
