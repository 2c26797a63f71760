#ifndef PAYMENTS_AMOUNT_HPP_
#define PAYMENTS_AMOUNT_HPP_

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace payments {

// Monetary amount in 1/10,000ths of a currency unit.
using Amount = std::uint64_t;

constexpr int kAmountDecimals = 4;
constexpr Amount kAmountScale = 10000;

inline std::optional<Amount> checkedAdd(Amount lhs, Amount rhs) {
  if (lhs > std::numeric_limits<Amount>::max() - rhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

inline std::optional<Amount> checkedSub(Amount lhs, Amount rhs) {
  if (rhs > lhs) {
    return std::nullopt;
  }
  return lhs - rhs;
}

/**
 * Renders an amount with exactly four decimal places ("12.3400").
 * Uses integer division only, so no precision is lost for large values.
 */
std::string formatAmount(Amount amount);

/**
 * Parses non-negative decimal text ("12", "12.5", ".75") into fixed-point.
 * Digits beyond the fourth decimal place are truncated. Returns nullopt for
 * signs, exponents, stray characters, empty input, or values that overflow.
 */
std::optional<Amount> parseAmount(const std::string& text);

}  // namespace payments

#endif  // PAYMENTS_AMOUNT_HPP_
