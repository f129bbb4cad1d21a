#include "util/amount.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace regflow::util {

namespace {

struct SplitAmount {
  bool negative{false};
  std::int64_t whole{0};
  std::int64_t fraction{0};
};

SplitAmount Split(Amount value) {
  SplitAmount out;
  out.negative = value < 0;
  // kMaxMoney keeps the magnitude far from INT64_MIN.
  const Amount magnitude = out.negative ? -value : value;
  out.whole = magnitude / kSatoshisPerCoin;
  out.fraction = magnitude % kSatoshisPerCoin;
  return out;
}

}  // namespace

std::optional<Amount> ParseAmountString(std::string_view text) {
  bool negative = false;
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) {
    negative = text.front() == '-';
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }
  bool seen_decimal = false;
  bool seen_digit = false;
  std::int64_t integral = 0;
  std::int64_t fractional = 0;
  int fractional_digits = 0;
  for (char c : text) {
    if (c == '.') {
      if (seen_decimal) return std::nullopt;
      seen_decimal = true;
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    seen_digit = true;
    const auto digit = static_cast<std::int64_t>(c - '0');
    if (!seen_decimal) {
      integral = integral * 10 + digit;
      if (integral > kMaxMoney / kSatoshisPerCoin) {
        return std::nullopt;
      }
    } else {
      if (fractional_digits == kAmountDecimals) {
        return std::nullopt;
      }
      fractional = fractional * 10 + digit;
      ++fractional_digits;
    }
  }
  if (!seen_digit) {
    return std::nullopt;
  }
  for (int i = fractional_digits; i < kAmountDecimals; ++i) {
    fractional *= 10;
  }
  const Amount magnitude = integral * kSatoshisPerCoin + fractional;
  if (!MoneyRange(magnitude)) {
    return std::nullopt;
  }
  return negative ? -magnitude : magnitude;
}

std::optional<Amount> ParseAmount(const nlohmann::json& value) {
  if (value.is_number_integer()) {
    const auto coins = value.get<std::int64_t>();
    if (coins > kMaxMoney / kSatoshisPerCoin || coins < -kMaxMoney / kSatoshisPerCoin) {
      return std::nullopt;
    }
    return coins * kSatoshisPerCoin;
  }
  if (value.is_number_float()) {
    const double coins = value.get<double>();
    if (!std::isfinite(coins)) {
      return std::nullopt;
    }
    const double scaled = coins * static_cast<double>(kSatoshisPerCoin);
    if (std::fabs(scaled) > static_cast<double>(kMaxMoney)) {
      return std::nullopt;
    }
    return static_cast<Amount>(std::llround(scaled));
  }
  if (value.is_string()) {
    return ParseAmountString(value.get<std::string>());
  }
  return std::nullopt;
}

std::string FormatAmount(Amount value) {
  const auto parts = Split(value);
  std::ostringstream oss;
  if (parts.negative) {
    oss << '-';
  }
  oss << parts.whole << '.' << std::setw(kAmountDecimals) << std::setfill('0') << parts.fraction;
  return oss.str();
}

std::string FormatAmountCompact(Amount value) {
  std::string text = FormatAmount(value);
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  if (text == "-0") {
    text = "0";
  }
  return text;
}

}  // namespace regflow::util
