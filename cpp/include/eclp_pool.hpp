// E-CLP pool core: swap / initialize / join / exit accounting.
//
// The pool never holds tokens. The vault passes balances, supply and block
// data on every call and applies the returned amounts. All amounts returned
// are already rounded in the pool's favor.
#pragma once

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "eclp_math.hpp"
#include "invariant_tracker.hpp"
#include "price_oracle.hpp"
#include "protocol_fees.hpp"

namespace eclp {

using TokenId = std::string;

enum class SwapKind { GivenIn, GivenOut };

struct SwapRequest {
    SwapKind kind = SwapKind::GivenIn;
    TokenId token_in;
    TokenId token_out;
    uint256 amount = 0;
};

// Tags carried in the join / exit payload.
enum class JoinKind : uint8_t {
    Init = 0,
    ExactTokensInForSharesOut = 1,
    TokenInForExactSharesOut = 2,
    AllTokensInForExactSharesOut = 3,
};

enum class ExitKind : uint8_t {
    ExactSharesInForOneTokenOut = 0,
    ExactSharesInForTokensOut = 1,
    SharesInForExactTokensOut = 2,
};

struct JoinRequest {
    JoinKind kind = JoinKind::AllTokensInForExactSharesOut;
    std::vector<uint256> amounts_in;    // Init
    uint256 shares_out = 0;             // AllTokensInForExactSharesOut
    uint256 recipient_balance = 0;      // recipient's shares before the join
};

struct ExitRequest {
    ExitKind kind = ExitKind::ExactSharesInForTokensOut;
    uint256 shares_in = 0;
};

struct CapConfig {
    bool enabled = false;
    uint256 per_address_cap = 0;   // max shares a single holder may own
    uint256 global_cap = 0;        // max total share supply
};

// Externally owned gates and config, read fresh per call.
struct CallContext {
    BlockInfo block;
    bool paused = false;
    FeeConfig fees;
    CapConfig cap;
};

struct PoolSettings {
    std::string name;
    std::array<TokenId, N_TOKENS> tokens;
    std::array<unsigned, N_TOKENS> decimals{18, 18};
    uint256 swap_fee_pct = 0;
    CurveParams params;
    DerivedParams derived;
    bool oracle_enabled = true;
};

struct SwapResult {
    uint256 amount = 0;         // amount out for GivenIn, amount in for GivenOut
    uint256 fee_amount = 0;     // in token_in units
    InvariantBracket invariant;
};

struct JoinResult {
    uint256 shares_out = 0;
    std::array<uint256, N_TOKENS> amounts_in{};
    ProtocolFeeShares protocol_fees;
};

struct ExitResult {
    uint256 shares_in = 0;
    std::array<uint256, N_TOKENS> amounts_out{};
    ProtocolFeeShares protocol_fees;
};

class EclpPool {
public:
    // Validates params through the engine; a pool that fails here never exists.
    EclpPool(PoolSettings settings, const EclpMath& math);

    EclpPool(const EclpPool&) = delete;
    EclpPool& operator=(const EclpPool&) = delete;

    // balances are raw token amounts, ordered as (token_in, token_out)
    SwapResult on_swap(
        const SwapRequest& request,
        const uint256& balance_token_in,
        const uint256& balance_token_out,
        const CallContext& ctx
    );

    // First join, only valid while the share supply is zero (checked by the vault).
    JoinResult on_initialize(const JoinRequest& request, const CallContext& ctx);

    JoinResult on_join(
        const Balances& balances,
        const uint256& total_supply,
        const JoinRequest& request,
        const CallContext& ctx
    );

    // Proportional exits stay open while paused.
    ExitResult on_exit(
        const Balances& balances,
        const uint256& total_supply,
        const ExitRequest& request,
        const CallContext& ctx
    );

    // ------------------------ Views ------------------------
    LastInvariant last_invariant() const;
    OracleState oracle_state() const;
    OracleSample oracle_sample(size_t index) const;
    uint256 oracle_latest(OracleVariable variable) const;
    uint256 oracle_time_weighted_average(OracleVariable variable, uint64_t secs, uint64_t ago, uint64_t now) const;

    uint256 spot_price(const Balances& balances) const;
    uint256 invariant(const Balances& balances) const;

    const PoolSettings& settings() const { return settings_; }
    const uint256& scaling_factor(size_t i) const { return scaling_factors_.at(i); }

private:
    bool resolve_token_in_is_first(const TokenId& token_in, const TokenId& token_out) const;

    Balances upscale(const Balances& raw) const;
    uint256 upscale(const uint256& amount, size_t i) const;
    uint256 downscale_down(const uint256& amount, size_t i) const;
    uint256 downscale_up(const uint256& amount, size_t i) const;

    // Oracle sample for the pre-action balances; empty when gated off.
    std::optional<OracleUpdate> update_oracle(
        const BlockInfo& block,
        const Balances& balances,
        const int256& invariant
    ) const;

    std::optional<OracleState> cache_invariant_and_supply(
        const LastInvariant& invariant,
        const uint256& total_supply
    ) const;

    void commit(
        const std::optional<OracleUpdate>& oracle_update,
        const std::optional<OracleState>& oracle_cache
    );

    PoolSettings settings_;
    const EclpMath& math_;
    std::array<uint256, N_TOKENS> scaling_factors_;

    InvariantTracker invariant_;
    PriceOracle oracle_;

    mutable std::mutex mutex_;
};

void ensure_cap(
    const CapConfig& cap,
    const uint256& amount_minted,
    const uint256& recipient_balance,
    const uint256& current_supply
);

} // namespace eclp
