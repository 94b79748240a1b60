#pragma once

#include <string>

#include "invariant_tracker.hpp"

namespace eclp {

// Read fresh on every action; may change between calls.
struct FeeConfig {
    uint256 protocol_fee_pct = 0;   // share of invariant growth taken as fees
    uint256 gyro_portion_pct = 0;   // part of those fees going to the gyro treasury
    std::string gyro_treasury = "gyro-treasury";
    std::string dao_treasury = "dao-treasury";
};

struct ProtocolFeeShares {
    uint256 gyro = 0;
    uint256 dao = 0;

    uint256 total() const { return gyro + dao; }
};

// Shares to mint so the beneficiaries own protocol_fee_pct of the invariant
// growth since the last liquidity event:
//   dS = S * f * dI / (I - f * dI)
ProtocolFeeShares calc_protocol_fees(
    const uint256& previous_invariant,
    const uint256& current_invariant,
    const uint256& current_supply,
    const uint256& protocol_fee_pct,
    const uint256& gyro_portion_pct
);

// No fees when the fee is off, the last invariant is unknown or the
// invariant did not grow.
ProtocolFeeShares compute_protocol_fees(
    const LastInvariant& last_invariant,
    const uint256& invariant_before,
    const uint256& current_supply,
    const FeeConfig& config
);

void validate_fee_config(const FeeConfig& config);

} // namespace eclp
