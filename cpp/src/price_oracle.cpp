#include "price_oracle.hpp"

#include <algorithm>
#include <cmath>

namespace eclp {

int64_t OracleSample::instant(OracleVariable v) const {
    switch (v) {
        case OracleVariable::PairPrice:  return log_pair_price;
        case OracleVariable::SharePrice: return log_share_price;
        case OracleVariable::Invariant:  return log_invariant;
    }
    return 0;
}

int64_t OracleSample::accumulator(OracleVariable v) const {
    switch (v) {
        case OracleVariable::PairPrice:  return acc_log_pair_price;
        case OracleVariable::SharePrice: return acc_log_share_price;
        case OracleVariable::Invariant:  return acc_log_invariant;
    }
    return 0;
}

namespace {

constexpr double LOG_SCALE = 1e4;

} // namespace

int64_t to_low_res_log(const uint256& value) {
    if (value == 0) {
        throw PoolError(Errc::ZeroInvariant, "log of zero");
    }
    return static_cast<int64_t>(std::llround(std::log(fp::to_double(value)) * LOG_SCALE));
}

uint256 from_low_res_log(int64_t log) {
    return fp::from_double_down(std::exp(static_cast<double>(log) / LOG_SCALE));
}

int64_t log_spot_price(const uint256& price) {
    if (price == 0) {
        throw PoolError(Errc::CurveDomainViolation, "spot price is zero");
    }
    return to_low_res_log(price);
}

int64_t log_invariant_div_supply(const uint256& invariant, int64_t log_supply) {
    return to_low_res_log(invariant) - log_supply;
}

OracleSample PriceOracle::updated(
    const OracleSample& sample,
    int64_t log_pair_price,
    int64_t log_share_price,
    int64_t log_invariant,
    uint64_t now
) {
    // a clock running backwards accrues nothing and keeps the later stamp
    uint64_t stamp = std::max(now, sample.timestamp);
    int64_t elapsed = static_cast<int64_t>(stamp - sample.timestamp);

    OracleSample out;
    out.log_pair_price = log_pair_price;
    out.acc_log_pair_price = sample.acc_log_pair_price + log_pair_price * elapsed;
    out.log_share_price = log_share_price;
    out.acc_log_share_price = sample.acc_log_share_price + log_share_price * elapsed;
    out.log_invariant = log_invariant;
    out.acc_log_invariant = sample.acc_log_invariant + log_invariant * elapsed;
    out.timestamp = stamp;
    return out;
}

OracleUpdate PriceOracle::process_price_data(
    uint64_t sample_creation_timestamp,
    size_t latest_index,
    int64_t log_pair_price,
    int64_t log_share_price,
    int64_t log_invariant,
    uint64_t now
) const {
    OracleSample previous = samples_.at(latest_index);
    bool first = previous.timestamp == 0;
    if (first) {
        // accumulators start at zero with the very first sample
        previous.timestamp = now;
    }

    OracleUpdate out;
    out.sample = updated(previous, log_pair_price, log_share_price, log_invariant, now);

    bool new_sample = !first && now >= sample_creation_timestamp
        && now - sample_creation_timestamp >= MAX_SAMPLE_DURATION;
    out.slot = new_sample ? (latest_index + 1) % BUFFER_SIZE : latest_index;

    out.state = state_;
    if (out.slot != latest_index || first) {
        out.state.index = out.slot;
        out.state.sample_creation_timestamp = now;
    }
    return out;
}

OracleUpdate PriceOracle::prepare_update(
    uint64_t now,
    const uint256& spot_price,
    const uint256& invariant
) const {
    int64_t log_pair_price = log_spot_price(spot_price);
    int64_t log_share_price = log_invariant_div_supply(invariant, state_.log_total_supply);

    return process_price_data(
        state_.sample_creation_timestamp,
        state_.index,
        log_pair_price,
        log_share_price,
        state_.log_invariant,
        now
    );
}

OracleState PriceOracle::with_cached_invariant_and_supply(
    const uint256& invariant,
    const uint256& total_supply
) const {
    OracleState out = state_;
    out.log_invariant = to_low_res_log(invariant);
    out.log_total_supply = to_low_res_log(total_supply);
    return out;
}

void PriceOracle::apply(const OracleUpdate& update) {
    samples_.at(update.slot) = update.sample;
    state_ = update.state;
}

uint256 PriceOracle::latest(OracleVariable variable) const {
    const OracleSample& s = samples_.at(state_.index);
    if (s.timestamp == 0) {
        throw PoolError(Errc::OracleNotInitialized, "no samples recorded");
    }
    return from_low_res_log(s.instant(variable));
}

int64_t PriceOracle::past_accumulator(OracleVariable variable, uint64_t lookup_time) const {
    const OracleSample& latest_sample = samples_.at(state_.index);
    if (latest_sample.timestamp == 0) {
        throw PoolError(Errc::OracleNotInitialized, "no samples recorded");
    }

    if (latest_sample.timestamp <= lookup_time) {
        // extrapolate with the latest instant value
        int64_t elapsed = static_cast<int64_t>(lookup_time - latest_sample.timestamp);
        return latest_sample.accumulator(variable) + latest_sample.instant(variable) * elapsed;
    }

    // Before the buffer wraps, slot 0 is the oldest sample.
    size_t oldest_index = (state_.index + 1) % BUFFER_SIZE;
    size_t length = BUFFER_SIZE;
    if (samples_.at(oldest_index).timestamp == 0) {
        oldest_index = 0;
        length = state_.index + 1;
    }
    if (samples_.at(oldest_index).timestamp > lookup_time) {
        throw PoolError(Errc::OracleQueryTooOld, "lookup time precedes oldest sample");
    }

    auto [prev, next] = find_nearest_sample(lookup_time, oldest_index, length);
    if (next->timestamp == prev->timestamp) {
        return next->accumulator(variable);
    }

    int64_t samples_time_diff = static_cast<int64_t>(next->timestamp - prev->timestamp);
    int64_t elapsed = static_cast<int64_t>(lookup_time - prev->timestamp);
    return prev->accumulator(variable)
        + (next->accumulator(variable) - prev->accumulator(variable)) * elapsed / samples_time_diff;
}

std::pair<const OracleSample*, const OracleSample*> PriceOracle::find_nearest_sample(
    uint64_t lookup_time,
    size_t offset,
    size_t length
) const {
    // binary search over logical positions [0, length) starting at offset
    size_t low = 0;
    size_t high = length - 1;
    const OracleSample* sample = nullptr;
    size_t mid = 0;

    while (low <= high) {
        mid = low + (high - low) / 2;
        sample = &samples_.at((mid + offset) % BUFFER_SIZE);

        if (sample->timestamp < lookup_time) {
            low = mid + 1;
        } else if (sample->timestamp > lookup_time) {
            if (mid == 0) break;
            high = mid - 1;
        } else {
            return {sample, sample};
        }
    }

    // sample is the last candidate: either just before or just after lookup_time
    if (sample->timestamp < lookup_time) {
        return {sample, &samples_.at((mid + 1 + offset) % BUFFER_SIZE)};
    }
    return {&samples_.at((mid + offset + BUFFER_SIZE - 1) % BUFFER_SIZE), sample};
}

uint256 PriceOracle::time_weighted_average(
    OracleVariable variable,
    uint64_t secs,
    uint64_t ago,
    uint64_t now
) const {
    if (secs == 0) {
        throw PoolError(Errc::OracleBadSecs, "averaging window must be positive");
    }
    if (ago + secs > now) {
        throw PoolError(Errc::OracleQueryTooOld, "window starts before time zero");
    }

    int64_t begin = past_accumulator(variable, now - ago - secs);
    int64_t end = past_accumulator(variable, now - ago);
    return from_low_res_log((end - begin) / static_cast<int64_t>(secs));
}

} // namespace eclp
