#include "flow/report.hpp"

#include <stdexcept>

#include "util/atomic_file.hpp"

namespace regflow::flow {

namespace {

// Consumers read the report by line number, so a field must never span two.
std::string SingleLine(std::string value) {
  for (char& c : value) {
    if (c == '\n' || c == '\r') {
      c = ' ';
    }
  }
  return value;
}

}  // namespace

std::string FormatReport(const ReconciliationResult& result) {
  std::string out;
  auto line = [&out](const std::string& value) {
    out += SingleLine(value);
    out += '\n';
  };
  line(result.txid);
  line(result.input_address);
  line(util::FormatAmountCompact(result.input_amount));
  line(result.output_address);
  line(util::FormatAmountCompact(result.output_amount));
  line(result.change_address);
  line(util::FormatAmountCompact(result.change_amount));
  line(util::FormatAmountCompact(result.fee));
  line(std::to_string(result.block_height));
  line(result.block_hash);
  return out;
}

void WriteReport(const std::filesystem::path& path, const ReconciliationResult& result) {
  std::string error;
  if (!util::AtomicWriteText(path, FormatReport(result), &error)) {
    throw std::runtime_error("failed to write report to " + path.string() + ": " + error);
  }
}

}  // namespace regflow::flow
