#pragma once

#include <filesystem>
#include <string>

#include "flow/reconcile.hpp"

namespace regflow::flow {

inline constexpr std::size_t kReportLineCount = 10;

// Ten newline-terminated lines, no header: txid, input address, input
// amount, output address, output amount, change address, change amount, fee,
// block height, block hash. Amounts use the compact decimal form.
std::string FormatReport(const ReconciliationResult& result);

// Replaces `path` with FormatReport(result). Throws std::runtime_error when
// the file cannot be written.
void WriteReport(const std::filesystem::path& path, const ReconciliationResult& result);

}  // namespace regflow::flow
