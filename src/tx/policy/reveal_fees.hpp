#pragma once

#include <cstdint>
#include <string>

#include "primitives/amount.hpp"

namespace runeforge::policy {

// Service fee charged on top of the miner fee: a percentage of the miner
// fee clamped into [min_fee, max_fee].
struct ServiceFeeSchedule {
  std::uint32_t percent{10};
  primitives::Amount min_fee{546};
  primitives::Amount max_fee{50'000};
};

struct FeeSplit {
  primitives::Amount miner_fee{0};
  primitives::Amount service_fee{0};
  primitives::Amount recipient_value{0};

  primitives::Amount TotalFee() const { return miner_fee + service_fee; }
};

// ceil(virtual_size * fee_rate). Fails on a non-finite, non-positive or
// out-of-range result.
bool ComputeMinerFee(std::uint64_t virtual_size, double fee_rate_sat_per_vb,
                     primitives::Amount* fee, std::string* error = nullptr);

primitives::Amount ComputeServiceFee(primitives::Amount miner_fee,
                                     const ServiceFeeSchedule& schedule);

// Splits |funding_value| into miner fee, service fee and the amount left for
// the recipient. Fails when the recipient value would be at or below
// |dust_threshold|.
bool ComputeRevealSplit(primitives::Amount funding_value, std::uint64_t virtual_size,
                        double fee_rate_sat_per_vb, const ServiceFeeSchedule& schedule,
                        primitives::Amount dust_threshold, FeeSplit* split,
                        std::string* error = nullptr);

}  // namespace runeforge::policy
