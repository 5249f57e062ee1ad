#include "policy/reveal_fees.hpp"

#include <algorithm>
#include <cmath>

namespace runeforge::policy {

bool ComputeMinerFee(std::uint64_t virtual_size, double fee_rate_sat_per_vb,
                     primitives::Amount* fee, std::string* error) {
  if (!std::isfinite(fee_rate_sat_per_vb) || fee_rate_sat_per_vb <= 0.0) {
    if (error) *error = "fee rate out of range";
    return false;
  }
  const double raw = std::ceil(static_cast<double>(virtual_size) * fee_rate_sat_per_vb);
  if (!std::isfinite(raw) || raw > static_cast<double>(primitives::kMaxMoney)) {
    if (error) *error = "fee computation overflow";
    return false;
  }
  *fee = static_cast<primitives::Amount>(raw);
  return true;
}

primitives::Amount ComputeServiceFee(primitives::Amount miner_fee,
                                     const ServiceFeeSchedule& schedule) {
  const primitives::Amount proportional = miner_fee / 100 * schedule.percent +
                                          (miner_fee % 100) * schedule.percent / 100;
  const primitives::Amount upper = std::max(schedule.min_fee, schedule.max_fee);
  return std::clamp(proportional, schedule.min_fee, upper);
}

bool ComputeRevealSplit(primitives::Amount funding_value, std::uint64_t virtual_size,
                        double fee_rate_sat_per_vb, const ServiceFeeSchedule& schedule,
                        primitives::Amount dust_threshold, FeeSplit* split,
                        std::string* error) {
  FeeSplit result{};
  if (!ComputeMinerFee(virtual_size, fee_rate_sat_per_vb, &result.miner_fee, error)) {
    return false;
  }
  result.service_fee = ComputeServiceFee(result.miner_fee, schedule);
  primitives::Amount total_fee = 0;
  if (!primitives::CheckedAdd(result.miner_fee, result.service_fee, &total_fee)) {
    if (error) *error = "fee computation overflow";
    return false;
  }
  if (!primitives::CheckedSub(funding_value, total_fee, &result.recipient_value) ||
      result.recipient_value <= dust_threshold) {
    if (error) {
      *error = "funding of " + std::to_string(funding_value) + " sats cannot cover fees of " +
               std::to_string(total_fee) + " sats plus a recipient output above " +
               std::to_string(dust_threshold) + " sats";
    }
    return false;
  }
  *split = result;
  return true;
}

}  // namespace runeforge::policy
