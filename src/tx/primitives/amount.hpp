#pragma once

#include <cstdint>

namespace runeforge::primitives {

using Amount = std::uint64_t;  // Amounts denominated in satoshis (1e-8 BTC).

inline constexpr Amount kSatsPerBTC = 100'000'000ULL;
inline constexpr Amount kMaxMoney = 21'000'000ULL * kSatsPerBTC;

inline constexpr bool MoneyRange(Amount value) noexcept { return value <= kMaxMoney; }

inline bool CheckedAdd(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b)) {
    return false;
  }
  if (a > kMaxMoney - b) {
    return false;
  }
  if (out) {
    *out = a + b;
  }
  return true;
}

inline bool CheckedSub(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b)) {
    return false;
  }
  if (b > a) {
    return false;
  }
  if (out) {
    *out = a - b;
  }
  return true;
}

}  // namespace runeforge::primitives
