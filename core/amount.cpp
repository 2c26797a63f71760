#include "core/amount.hpp"

#include <iomanip>
#include <sstream>

namespace payments {

std::string formatAmount(Amount amount) {
  std::ostringstream oss;
  oss << amount / kAmountScale << '.'
      << std::setw(kAmountDecimals) << std::setfill('0') << amount % kAmountScale;
  return oss.str();
}

std::optional<Amount> parseAmount(const std::string& text) {
  Amount whole = 0;
  Amount fraction = 0;
  int fraction_digits = 0;
  bool seen_point = false;
  bool seen_digit = false;

  for (char c : text) {
    if (c == '.') {
      if (seen_point) return std::nullopt;
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    seen_digit = true;
    const Amount digit = static_cast<Amount>(c - '0');

    if (!seen_point) {
      if (whole > (std::numeric_limits<Amount>::max() - digit) / 10) {
        return std::nullopt;
      }
      whole = whole * 10 + digit;
    } else if (fraction_digits < kAmountDecimals) {
      fraction = fraction * 10 + digit;
      ++fraction_digits;
    }
    // Further fraction digits are truncated.
  }

  if (!seen_digit) {
    return std::nullopt;
  }

  for (; fraction_digits < kAmountDecimals; ++fraction_digits) {
    fraction *= 10;
  }

  if (whole > (std::numeric_limits<Amount>::max() - fraction) / kAmountScale) {
    return std::nullopt;
  }
  return whole * kAmountScale + fraction;
}

}  // namespace payments
