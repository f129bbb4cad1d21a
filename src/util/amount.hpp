#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

namespace regflow::util {

using Amount = std::int64_t;  // Amounts denominated in satoshis (1e-8 BTC).

inline constexpr Amount kSatoshisPerCoin = 100'000'000LL;
inline constexpr Amount kMaxMoney = 21'000'000LL * kSatoshisPerCoin;
inline constexpr int kAmountDecimals = 8;

inline constexpr bool MoneyRange(Amount value) noexcept {
  return value >= -kMaxMoney && value <= kMaxMoney;
}

// Parses a decimal coin string such as "29.9999", "-0.5" or "50". At most
// eight fractional digits are accepted; no exponent, no whitespace.
std::optional<Amount> ParseAmountString(std::string_view text);

// Accepts JSON numbers (rounded to the nearest satoshi) and decimal strings.
std::optional<Amount> ParseAmount(const nlohmann::json& value);

// Fixed form with exactly eight decimals, e.g. "20.00000000".
std::string FormatAmount(Amount value);

// Shortest decimal form: trailing fractional zeros and a bare '.' are
// dropped, e.g. "50", "29.9999", "0.0001", "0".
std::string FormatAmountCompact(Amount value);

}  // namespace regflow::util
