#include "protocol_fees.hpp"

namespace eclp {

void validate_fee_config(const FeeConfig& config) {
    if (config.protocol_fee_pct > fp::ONE()) {
        throw PoolError(Errc::InvalidConfig, "protocol fee above 100%");
    }
    if (config.gyro_portion_pct > fp::ONE()) {
        throw PoolError(Errc::InvalidConfig, "gyro fee portion above 100%");
    }
}

ProtocolFeeShares calc_protocol_fees(
    const uint256& previous_invariant,
    const uint256& current_invariant,
    const uint256& current_supply,
    const uint256& protocol_fee_pct,
    const uint256& gyro_portion_pct
) {
    if (current_invariant <= previous_invariant) {
        return {};
    }

    uint256 diff_invariant = fp::mul_down(protocol_fee_pct, current_invariant - previous_invariant);
    uint256 numerator = fp::mul_down(diff_invariant, current_supply);
    uint256 denominator = current_invariant - diff_invariant;
    uint256 delta_s = fp::div_down(numerator, denominator);

    ProtocolFeeShares out;
    out.gyro = fp::mul_down(gyro_portion_pct, delta_s);
    out.dao = delta_s - out.gyro;
    return out;
}

ProtocolFeeShares compute_protocol_fees(
    const LastInvariant& last_invariant,
    const uint256& invariant_before,
    const uint256& current_supply,
    const FeeConfig& config
) {
    if (config.protocol_fee_pct == 0) {
        return {};
    }
    validate_fee_config(config);
    if (!last_invariant.is_known()) {
        return {};
    }
    return calc_protocol_fees(
        last_invariant.value(),
        invariant_before,
        current_supply,
        config.protocol_fee_pct,
        config.gyro_portion_pct
    );
}

} // namespace eclp
