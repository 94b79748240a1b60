#pragma once

#include <array>
#include <cstdint>
#include <utility>

#include "fixed_point.hpp"

namespace eclp {

// Block metadata supplied by the vault on every call.
struct BlockInfo {
    uint64_t number = 0;
    uint64_t timestamp = 0;
    uint64_t last_change_block = 0;  // block in which balances last changed
};

enum class OracleVariable {
    PairPrice,
    SharePrice,   // log(invariant / supply)
    Invariant,
};

// Logs are natural logs with 4 decimals; accumulators are log * seconds.
struct OracleSample {
    int64_t log_pair_price = 0;
    int64_t acc_log_pair_price = 0;
    int64_t log_share_price = 0;
    int64_t acc_log_share_price = 0;
    int64_t log_invariant = 0;
    int64_t acc_log_invariant = 0;
    uint64_t timestamp = 0;

    int64_t instant(OracleVariable v) const;
    int64_t accumulator(OracleVariable v) const;
};

struct OracleState {
    size_t index = 0;
    uint64_t sample_creation_timestamp = 0;
    int64_t log_invariant = 0;      // cached at the last liquidity event
    int64_t log_total_supply = 0;   // cached at the last liquidity event
};

// A write computed up front and applied only once the action succeeded.
struct OracleUpdate {
    size_t slot = 0;
    OracleSample sample;
    OracleState state;
};

int64_t to_low_res_log(const uint256& value);
uint256 from_low_res_log(int64_t log);
int64_t log_spot_price(const uint256& price);
int64_t log_invariant_div_supply(const uint256& invariant, int64_t log_supply);

// Ring buffer of time-weighted samples. A slot accumulates until it is
// MAX_SAMPLE_DURATION old, then the next slot starts.
class PriceOracle {
public:
    static constexpr size_t BUFFER_SIZE = 1024;
    static constexpr uint64_t MAX_SAMPLE_DURATION = 120;

    // Returns the index the sample lands in, plus the write itself.
    OracleUpdate process_price_data(
        uint64_t sample_creation_timestamp,
        size_t latest_index,
        int64_t log_pair_price,
        int64_t log_share_price,
        int64_t log_invariant,
        uint64_t now
    ) const;

    // At most one sample per block: nothing is written when the oracle is
    // disabled or balances already changed in this block.
    static bool should_sample(bool enabled, const BlockInfo& block) {
        return enabled && block.number > block.last_change_block;
    }

    OracleUpdate prepare_update(
        uint64_t now,
        const uint256& spot_price,
        const uint256& invariant
    ) const;

    // Cache log(invariant) and log(supply) after a liquidity event.
    OracleState with_cached_invariant_and_supply(
        const uint256& invariant,
        const uint256& total_supply
    ) const;

    void apply(const OracleUpdate& update);
    void apply(const OracleState& state) { state_ = state; }

    const OracleState& state() const { return state_; }
    const OracleSample& sample(size_t index) const { return samples_.at(index); }

    // Queries
    uint256 latest(OracleVariable variable) const;
    int64_t past_accumulator(OracleVariable variable, uint64_t lookup_time) const;
    uint256 time_weighted_average(OracleVariable variable, uint64_t secs, uint64_t ago, uint64_t now) const;

private:
    static OracleSample updated(
        const OracleSample& sample,
        int64_t log_pair_price,
        int64_t log_share_price,
        int64_t log_invariant,
        uint64_t now
    );

    std::pair<const OracleSample*, const OracleSample*> find_nearest_sample(
        uint64_t lookup_time,
        size_t offset,
        size_t length
    ) const;

    std::array<OracleSample, BUFFER_SIZE> samples_{};
    OracleState state_;
};

} // namespace eclp
