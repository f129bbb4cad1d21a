#include "flow/reconcile.hpp"

#include <limits>

#include "util/logging.hpp"

namespace regflow::flow {

namespace {

constexpr std::string_view kComponent = "reconcile";

const nlohmann::json* Member(const nlohmann::json* node, const char* key) {
  if (node == nullptr || !node->is_object()) {
    return nullptr;
  }
  const auto it = node->find(key);
  return it == node->end() ? nullptr : &*it;
}

const nlohmann::json* Element(const nlohmann::json* node, std::size_t index) {
  if (node == nullptr || !node->is_array() || index >= node->size()) {
    return nullptr;
  }
  return &(*node)[index];
}

std::string StringOr(const nlohmann::json* node, std::string fallback = {}) {
  if (node == nullptr || !node->is_string()) {
    return fallback;
  }
  return node->get<std::string>();
}

util::Amount AmountOr(const nlohmann::json* node) {
  if (node == nullptr) {
    return 0;
  }
  return util::ParseAmount(*node).value_or(0);
}

std::optional<std::uint64_t> UnsignedValue(const nlohmann::json* node) {
  if (node == nullptr || !node->is_number_integer()) {
    return std::nullopt;
  }
  if (node->is_number_unsigned()) {
    return node->get<std::uint64_t>();
  }
  const auto value = node->get<std::int64_t>();
  if (value < 0) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(value);
}

// Bitcoin Core 22 and later report scriptPubKey.address; older releases
// used a scriptPubKey.addresses array.
std::string OutputAddress(const nlohmann::json* output) {
  const auto* script = Member(output, "scriptPubKey");
  if (const auto* address = Member(script, "address"); address && address->is_string()) {
    return address->get<std::string>();
  }
  return StringOr(Element(Member(script, "addresses"), 0));
}

const nlohmann::json* Output(const nlohmann::json& tx, std::size_t index) {
  return Element(Member(&tx, "vout"), index);
}

}  // namespace

std::optional<OutPoint> FirstInputOutPoint(const nlohmann::json& tx) {
  const auto* input = Element(Member(&tx, "vin"), 0);
  const auto* txid = Member(input, "txid");
  if (txid == nullptr || !txid->is_string() || txid->get<std::string>().empty()) {
    return std::nullopt;
  }
  OutPoint out;
  out.txid = txid->get<std::string>();
  const auto vout = UnsignedValue(Member(input, "vout"));
  if (vout && *vout <= std::numeric_limits<std::uint32_t>::max()) {
    out.vout = static_cast<std::uint32_t>(*vout);
  }
  return out;
}

ReconciliationResult ExtractReconciliation(const nlohmann::json& tx,
                                           const nlohmann::json& prev_tx,
                                           const nlohmann::json& block) {
  ReconciliationResult result;
  result.txid = StringOr(Member(&tx, "txid"));

  if (const auto outpoint = FirstInputOutPoint(tx)) {
    const auto* spent = Output(prev_tx, outpoint->vout);
    result.input_address = OutputAddress(spent);
    result.input_amount = AmountOr(Member(spent, "value"));
  }

  const auto* payee = Output(tx, 0);
  result.output_address = OutputAddress(payee);
  result.output_amount = AmountOr(Member(payee, "value"));

  const auto* change = Output(tx, 1);
  result.change_address = OutputAddress(change);
  result.change_amount = AmountOr(Member(change, "value"));

  result.fee = result.input_amount - result.output_amount - result.change_amount;

  result.block_height = UnsignedValue(Member(&block, "height")).value_or(0);
  result.block_hash = StringOr(Member(&block, "hash"));
  return result;
}

ReconciliationResult Reconcile(rpc::NodeClient& node, const std::string& txid,
                               const std::string& block_hash) {
  const auto tx = node.GetRawTransaction(txid, block_hash);
  util::LogDebug(kComponent, "Transaction details: " + tx.dump(2));

  if (const auto* inputs = Member(&tx, "vin"); inputs && inputs->is_array() && inputs->size() > 1) {
    util::LogWarn(kComponent, "transaction " + txid + " spends " +
                                  std::to_string(inputs->size()) +
                                  " inputs; only the first is counted towards the fee");
  }

  nlohmann::json prev_tx = nlohmann::json::object();
  if (const auto outpoint = FirstInputOutPoint(tx)) {
    prev_tx = node.GetRawTransaction(outpoint->txid);
  } else {
    util::LogWarn(kComponent, "transaction " + txid + " has no spendable first input reference");
  }

  const auto block = node.GetBlock(block_hash);
  return ExtractReconciliation(tx, prev_tx, block);
}

}  // namespace regflow::flow
