#include "eclp_pool.hpp"
#include "trace.hpp"

#include <iostream>
#include <utility>

namespace eclp {

namespace {

uint256 pow10(unsigned n) {
    uint256 v = 1;
    for (unsigned i = 0; i < n; ++i) v *= 10;
    return v;
}

// amounts_in[i] = balances[i] * ceil(shares_out / supply), rounded up
Balances proportional_amounts_in(
    const Balances& balances,
    const uint256& shares_out,
    const uint256& total_supply
) {
    uint256 ratio = fp::div_up(shares_out, total_supply);
    return {fp::mul_up(balances[0], ratio), fp::mul_up(balances[1], ratio)};
}

// amounts_out[i] = balances[i] * floor(shares_in / supply), rounded down
Balances proportional_amounts_out(
    const Balances& balances,
    const uint256& shares_in,
    const uint256& total_supply
) {
    uint256 ratio = fp::div_down(shares_in, total_supply);
    return {fp::mul_down(balances[0], ratio), fp::mul_down(balances[1], ratio)};
}

std::string last_invariant_str(const LastInvariant& v) {
    return v.is_known() ? v.value().str() : std::string("unknown");
}

} // namespace

void ensure_cap(
    const CapConfig& cap,
    const uint256& amount_minted,
    const uint256& recipient_balance,
    const uint256& current_supply
) {
    if (!cap.enabled) {
        return;
    }
    if (recipient_balance + amount_minted > cap.per_address_cap) {
        throw PoolError(Errc::CapExceeded, "per-address cap exceeded");
    }
    if (current_supply + amount_minted > cap.global_cap) {
        throw PoolError(Errc::CapExceeded, "global cap exceeded");
    }
}

EclpPool::EclpPool(PoolSettings settings, const EclpMath& math)
    : settings_(std::move(settings)), math_(math) {
    if (settings_.tokens[0] == settings_.tokens[1]) {
        throw PoolError(Errc::InvalidConfig, "pool tokens must differ");
    }
    for (size_t i = 0; i < N_TOKENS; ++i) {
        if (settings_.decimals[i] > 18) {
            throw PoolError(Errc::InvalidConfig, "tokens with more than 18 decimals are not supported");
        }
        scaling_factors_[i] = pow10(18 - settings_.decimals[i]);
    }
    if (settings_.swap_fee_pct >= fp::ONE()) {
        throw PoolError(Errc::InvalidConfig, "swap fee must be below 100%");
    }

    math_.validate_params(settings_.params);
    math_.validate_derived_params_limits(settings_.params, settings_.derived);
}

// ------------------------------- scaling -------------------------------------

uint256 EclpPool::upscale(const uint256& amount, size_t i) const {
    return amount * scaling_factors_[i];
}

Balances EclpPool::upscale(const Balances& raw) const {
    return {upscale(raw[0], 0), upscale(raw[1], 1)};
}

uint256 EclpPool::downscale_down(const uint256& amount, size_t i) const {
    return amount / scaling_factors_[i];
}

uint256 EclpPool::downscale_up(const uint256& amount, size_t i) const {
    if (amount == 0) return 0;
    return (amount - 1) / scaling_factors_[i] + 1;
}

bool EclpPool::resolve_token_in_is_first(const TokenId& token_in, const TokenId& token_out) const {
    const auto& t = settings_.tokens;
    if (token_in == t[0] && token_out == t[1]) return true;
    if (token_in == t[1] && token_out == t[0]) return false;
    throw PoolError(Errc::InvalidTokenPair, token_in + " -> " + token_out);
}

// -------------------------------- oracle -------------------------------------

std::optional<OracleUpdate> EclpPool::update_oracle(
    const BlockInfo& block,
    const Balances& balances,
    const int256& invariant
) const {
    if (!PriceOracle::should_sample(settings_.oracle_enabled, block)) {
        return std::nullopt;
    }
    uint256 spot_price = math_.calculate_price(balances, settings_.params, settings_.derived, invariant);
    return oracle_.prepare_update(block.timestamp, spot_price, to_unsigned(invariant));
}

std::optional<OracleState> EclpPool::cache_invariant_and_supply(
    const LastInvariant& invariant,
    const uint256& total_supply
) const {
    if (!settings_.oracle_enabled || !invariant.is_known() || invariant.value() == 0 || total_supply == 0) {
        return std::nullopt;
    }
    return oracle_.with_cached_invariant_and_supply(invariant.value(), total_supply);
}

void EclpPool::commit(
    const std::optional<OracleUpdate>& oracle_update,
    const std::optional<OracleState>& oracle_cache
) {
    if (oracle_update) {
        oracle_.apply(*oracle_update);
    }
    if (oracle_cache) {
        // keep the index written above, refresh only the cached logs
        OracleState state = oracle_.state();
        state.log_invariant = oracle_cache->log_invariant;
        state.log_total_supply = oracle_cache->log_total_supply;
        oracle_.apply(state);
    }
}

// --------------------------------- swap --------------------------------------

SwapResult EclpPool::on_swap(
    const SwapRequest& request,
    const uint256& balance_token_in,
    const uint256& balance_token_out,
    const CallContext& ctx
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ctx.paused) {
        throw PoolError(Errc::PoolPaused, "swaps are disabled while paused");
    }

    bool token_in_is_first = resolve_token_in_is_first(request.token_in, request.token_out);
    size_t ix_in = token_in_is_first ? 0 : 1;
    size_t ix_out = 1 - ix_in;

    Balances balances;
    balances[ix_in] = upscale(balance_token_in, ix_in);
    balances[ix_out] = upscale(balance_token_out, ix_out);

    InvariantWithError inv = math_.calculate_invariant_with_error(balances, settings_.params, settings_.derived);
    InvariantBracket bracket{inv.invariant + 2 * inv.error, inv.invariant};

    auto oracle_update = update_oracle(ctx.block, balances, inv.invariant);

    SwapResult result;
    result.invariant = bracket;

    if (request.kind == SwapKind::GivenIn) {
        result.fee_amount = fp::mul_up(request.amount, settings_.swap_fee_pct);
        uint256 amount_in = upscale(request.amount - result.fee_amount, ix_in);
        uint256 amount_out = math_.calc_out_given_in(
            balances, amount_in, token_in_is_first,
            settings_.params, settings_.derived, bracket
        );
        result.amount = downscale_down(amount_out, ix_out);
    } else {
        uint256 amount_out = upscale(request.amount, ix_out);
        uint256 amount_in = math_.calc_in_given_out(
            balances, amount_out, token_in_is_first,
            settings_.params, settings_.derived, bracket
        );
        uint256 net_in = downscale_up(amount_in, ix_in);
        result.amount = fp::div_up(net_in, fp::complement(settings_.swap_fee_pct));
        result.fee_amount = result.amount - net_in;
    }

    commit(oracle_update, std::nullopt);

    if (trace_enabled()) {
        std::cout << "TRACE swap pool=" << settings_.name
                  << " kind=" << (request.kind == SwapKind::GivenIn ? "given_in" : "given_out")
                  << " token_in=" << request.token_in
                  << " request=" << request.amount
                  << " amount=" << result.amount
                  << " fee=" << result.fee_amount
                  << " inv_upper=" << bracket.upper
                  << " inv_lower=" << bracket.lower
                  << " oracle_index=" << oracle_.state().index
                  << std::endl;
    }
    return result;
}

// ------------------------------- initialize ----------------------------------

JoinResult EclpPool::on_initialize(const JoinRequest& request, const CallContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ctx.paused) {
        throw PoolError(Errc::PoolPaused, "joins are disabled while paused");
    }
    if (request.kind != JoinKind::Init) {
        throw PoolError(Errc::UnsupportedJoinKind, "pool must be initialized first");
    }
    if (request.amounts_in.size() != N_TOKENS) {
        throw PoolError(Errc::LengthMismatch, "initial join needs exactly two amounts");
    }

    Balances amounts{request.amounts_in[0], request.amounts_in[1]};
    uint256 invariant = math_.calculate_invariant(upscale(amounts), settings_.params, settings_.derived);
    if (invariant == 0) {
        throw PoolError(Errc::ZeroInvariant, "initial amounts give a zero invariant");
    }

    JoinResult result;
    result.shares_out = invariant * 2;
    result.amounts_in = amounts;

    ensure_cap(ctx.cap, result.shares_out, request.recipient_balance, 0);

    LastInvariant last = LastInvariant::known(invariant);
    auto oracle_cache = cache_invariant_and_supply(last, result.shares_out);

    invariant_.set(last);
    commit(std::nullopt, oracle_cache);

    if (trace_enabled()) {
        std::cout << "TRACE initialize pool=" << settings_.name
                  << " amounts=" << amounts[0] << "," << amounts[1]
                  << " invariant=" << invariant
                  << " shares_out=" << result.shares_out
                  << std::endl;
    }
    return result;
}

// ---------------------------------- join -------------------------------------

JoinResult EclpPool::on_join(
    const Balances& balances,
    const uint256& total_supply,
    const JoinRequest& request,
    const CallContext& ctx
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ctx.paused) {
        throw PoolError(Errc::PoolPaused, "joins are disabled while paused");
    }
    if (total_supply == 0) {
        throw PoolError(Errc::NotInitialized, "join before initialization");
    }

    Balances scaled = upscale(balances);
    InvariantWithError inv = math_.calculate_invariant_with_error(scaled, settings_.params, settings_.derived);
    uint256 invariant_before = to_unsigned(inv.invariant);
    if (invariant_before == 0) {
        throw PoolError(Errc::ZeroInvariant, "pool invariant is zero");
    }

    auto oracle_update = update_oracle(ctx.block, scaled, inv.invariant);

    JoinResult result;
    result.protocol_fees = compute_protocol_fees(invariant_.last(), invariant_before, total_supply, ctx.fees);
    uint256 supply = total_supply + result.protocol_fees.total();

    switch (request.kind) {
        case JoinKind::AllTokensInForExactSharesOut: {
            Balances amounts = proportional_amounts_in(scaled, request.shares_out, supply);
            result.shares_out = request.shares_out;
            result.amounts_in = {downscale_up(amounts[0], 0), downscale_up(amounts[1], 1)};
            break;
        }
        default:
            throw PoolError(Errc::UnsupportedJoinKind,
                            "kind " + std::to_string(static_cast<int>(request.kind)));
    }

    ensure_cap(ctx.cap, result.shares_out, request.recipient_balance, supply);

    LastInvariant last = InvariantTracker::after_join(invariant_before, result.shares_out, supply);
    auto oracle_cache = cache_invariant_and_supply(last, supply + result.shares_out);

    invariant_.set(last);
    commit(oracle_update, oracle_cache);

    if (trace_enabled()) {
        std::cout << "TRACE join pool=" << settings_.name
                  << " shares_out=" << result.shares_out
                  << " amounts_in=" << result.amounts_in[0] << "," << result.amounts_in[1]
                  << " fee_shares=" << result.protocol_fees.gyro << "," << result.protocol_fees.dao
                  << " invariant_before=" << invariant_before
                  << " last_invariant=" << last_invariant_str(last)
                  << std::endl;
    }
    return result;
}

// ---------------------------------- exit -------------------------------------

ExitResult EclpPool::on_exit(
    const Balances& balances,
    const uint256& total_supply,
    const ExitRequest& request,
    const CallContext& ctx
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (total_supply == 0) {
        throw PoolError(Errc::NotInitialized, "exit before initialization");
    }
    if (request.kind != ExitKind::ExactSharesInForTokensOut) {
        throw PoolError(Errc::UnsupportedExitKind,
                        "kind " + std::to_string(static_cast<int>(request.kind)));
    }
    if (request.shares_in > total_supply) {
        throw PoolError(Errc::InsufficientShares, "shares in exceed total supply");
    }

    Balances scaled = upscale(balances);

    ExitResult result;
    result.shares_in = request.shares_in;

    std::optional<OracleUpdate> oracle_update;
    std::optional<OracleState> oracle_cache;
    LastInvariant last = LastInvariant::unknown();
    uint256 supply = total_supply;

    if (!ctx.paused) {
        InvariantWithError inv = math_.calculate_invariant_with_error(scaled, settings_.params, settings_.derived);
        uint256 invariant_before = to_unsigned(inv.invariant);
        if (invariant_before == 0) {
            throw PoolError(Errc::ZeroInvariant, "pool invariant is zero");
        }

        oracle_update = update_oracle(ctx.block, scaled, inv.invariant);
        result.protocol_fees = compute_protocol_fees(invariant_.last(), invariant_before, total_supply, ctx.fees);
        supply += result.protocol_fees.total();

        last = InvariantTracker::after_exit(invariant_before, request.shares_in, supply);
        oracle_cache = cache_invariant_and_supply(last, supply - request.shares_in);
    }

    Balances amounts = proportional_amounts_out(scaled, request.shares_in, supply);
    result.amounts_out = {downscale_down(amounts[0], 0), downscale_down(amounts[1], 1)};

    // A paused exit leaves Unknown behind so the next action recomputes.
    invariant_.set(last);
    commit(oracle_update, oracle_cache);

    if (trace_enabled()) {
        std::cout << "TRACE exit pool=" << settings_.name
                  << " paused=" << ctx.paused
                  << " shares_in=" << result.shares_in
                  << " amounts_out=" << result.amounts_out[0] << "," << result.amounts_out[1]
                  << " fee_shares=" << result.protocol_fees.gyro << "," << result.protocol_fees.dao
                  << " last_invariant=" << last_invariant_str(last)
                  << std::endl;
    }
    return result;
}

// --------------------------------- views -------------------------------------

LastInvariant EclpPool::last_invariant() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invariant_.last();
}

OracleState EclpPool::oracle_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oracle_.state();
}

OracleSample EclpPool::oracle_sample(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oracle_.sample(index);
}

uint256 EclpPool::oracle_latest(OracleVariable variable) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oracle_.latest(variable);
}

uint256 EclpPool::oracle_time_weighted_average(
    OracleVariable variable,
    uint64_t secs,
    uint64_t ago,
    uint64_t now
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return oracle_.time_weighted_average(variable, secs, ago, now);
}

uint256 EclpPool::spot_price(const Balances& balances) const {
    Balances scaled = upscale(balances);
    uint256 inv = math_.calculate_invariant(scaled, settings_.params, settings_.derived);
    return math_.calculate_price(scaled, settings_.params, settings_.derived, to_signed(inv));
}

uint256 EclpPool::invariant(const Balances& balances) const {
    return math_.calculate_invariant(upscale(balances), settings_.params, settings_.derived);
}

} // namespace eclp
