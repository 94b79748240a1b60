#pragma once

#include <optional>

#include "fixed_point.hpp"

namespace eclp {

// Invariant as of the last liquidity event, or Unknown when it could not be
// computed safely (exits while paused). Consumers must handle both cases.
class LastInvariant {
public:
    static LastInvariant unknown() { return LastInvariant(); }
    static LastInvariant known(const uint256& value) { return LastInvariant(value); }

    bool is_known() const { return value_.has_value(); }

    const uint256& value() const {
        if (!value_) {
            throw PoolError(Errc::NotInitialized, "last invariant is unknown");
        }
        return *value_;
    }

    const std::optional<uint256>& get() const { return value_; }

    bool operator==(const LastInvariant& other) const { return value_ == other.value_; }
    bool operator!=(const LastInvariant& other) const { return !(*this == other); }

private:
    LastInvariant() = default;
    explicit LastInvariant(const uint256& value) : value_(value) {}

    std::optional<uint256> value_;
};

class InvariantTracker {
public:
    const LastInvariant& last() const { return last_; }

    void set(const LastInvariant& value) { last_ = value; }
    void invalidate() { last_ = LastInvariant::unknown(); }

    // Fee-free liquidity changes scale the invariant with the share supply:
    //   I' = I +/- I * dS / S
    static LastInvariant after_join(
        const uint256& invariant_before,
        const uint256& shares_out,
        const uint256& supply_before
    ) {
        return LastInvariant::known(invariant_before + delta(invariant_before, shares_out, supply_before));
    }

    static LastInvariant after_exit(
        const uint256& invariant_before,
        const uint256& shares_in,
        const uint256& supply_before
    ) {
        uint256 d = delta(invariant_before, shares_in, supply_before);
        return LastInvariant::known(d < invariant_before ? invariant_before - d : uint256(0));
    }

private:
    static uint256 delta(const uint256& invariant, const uint256& shares, const uint256& supply) {
        return fp::div_down(fp::mul_down(invariant, shares), supply);
    }

    LastInvariant last_ = LastInvariant::unknown();
};

} // namespace eclp
