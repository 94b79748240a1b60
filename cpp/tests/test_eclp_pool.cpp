#include "eclp_pool.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace eclp;
using eclp_test::ScriptedMath;
using eclp_test::units;

namespace {

const uint256 ONE_PCT("10000000000000000");
const uint256 HALF("500000000000000000");

PoolSettings settings_with(const uint256& swap_fee, unsigned decimals1 = 18) {
    PoolSettings s;
    s.name = "A/B";
    s.tokens = {"A", "B"};
    s.decimals = {18, decimals1};
    s.swap_fee_pct = swap_fee;
    return s;
}

CallContext at_block(uint64_t number, uint64_t timestamp, uint64_t last_change) {
    CallContext ctx;
    ctx.block.number = number;
    ctx.block.timestamp = timestamp;
    ctx.block.last_change_block = last_change;
    return ctx;
}

JoinRequest init_request(const uint256& a, const uint256& b) {
    JoinRequest req;
    req.kind = JoinKind::Init;
    req.amounts_in = {a, b};
    return req;
}

JoinRequest proportional_join(const uint256& shares) {
    JoinRequest req;
    req.kind = JoinKind::AllTokensInForExactSharesOut;
    req.shares_out = shares;
    return req;
}

ExitRequest proportional_exit(const uint256& shares) {
    ExitRequest req;
    req.kind = ExitKind::ExactSharesInForTokensOut;
    req.shares_in = shares;
    return req;
}

SwapRequest swap_request(SwapKind kind, const char* in, const char* out, const uint256& amount) {
    SwapRequest req;
    req.kind = kind;
    req.token_in = in;
    req.token_out = out;
    req.amount = amount;
    return req;
}

// Pool over 1000/1000 with invariant 500 and 1000 shares outstanding.
class EclpPoolTest : public ::testing::Test {
protected:
    explicit EclpPoolTest(const uint256& swap_fee = 0) : pool(settings_with(swap_fee), math) {}

    void initialize() {
        JoinResult r = pool.on_initialize(init_request(units(1000), units(1000)), ctx);
        ASSERT_EQ(r.shares_out, units(1000));
    }

    ScriptedMath math;
    EclpPool pool;
    CallContext ctx = at_block(10, 1000, 9);
    Balances balances{units(1000), units(1000)};
};

class EclpPoolFeeTest : public EclpPoolTest {
protected:
    EclpPoolFeeTest() : EclpPoolTest(ONE_PCT) {}
};

} // namespace

// ─── construction ────────────────────────────────────────────────────────────

TEST(EclpPoolConstruction, RejectsBadSettings) {
    ScriptedMath math;

    PoolSettings same = settings_with(0);
    same.tokens = {"A", "A"};
    EXPECT_POOL_ERROR((void)EclpPool(same, math), Errc::InvalidConfig);

    EXPECT_POOL_ERROR((void)EclpPool(settings_with(0, 19), math), Errc::InvalidConfig);
    EXPECT_POOL_ERROR((void)EclpPool(settings_with(fp::ONE()), math), Errc::InvalidConfig);
}

TEST(EclpPoolConstruction, ScalingFactorFromDecimals) {
    ScriptedMath math;
    EclpPool pool(settings_with(0, 6), math);
    EXPECT_EQ(pool.scaling_factor(0), uint256(1));
    EXPECT_EQ(pool.scaling_factor(1), uint256("1000000000000"));
}

// ─── initialize ──────────────────────────────────────────────────────────────

TEST_F(EclpPoolTest, InitializeMintsTwiceTheInvariant) {
    EXPECT_FALSE(pool.last_invariant().is_known());

    JoinResult r = pool.on_initialize(init_request(units(1000), units(1000)), ctx);
    EXPECT_EQ(r.shares_out, units(1000));
    EXPECT_EQ(r.amounts_in[0], units(1000));
    EXPECT_EQ(r.amounts_in[1], units(1000));
    EXPECT_EQ(r.protocol_fees.total(), uint256(0));
    EXPECT_EQ(pool.last_invariant(), LastInvariant::known(units(500)));
}

TEST_F(EclpPoolTest, InitializeValidatesRequest) {
    EXPECT_POOL_ERROR(pool.on_initialize(proportional_join(units(1)), ctx), Errc::UnsupportedJoinKind);

    JoinRequest short_req;
    short_req.kind = JoinKind::Init;
    short_req.amounts_in = {units(1000)};
    EXPECT_POOL_ERROR(pool.on_initialize(short_req, ctx), Errc::LengthMismatch);

    math.invariant = 0;
    EXPECT_POOL_ERROR(pool.on_initialize(init_request(0, 0), ctx), Errc::ZeroInvariant);

    ctx.paused = true;
    EXPECT_POOL_ERROR(pool.on_initialize(init_request(units(1000), units(1000)), ctx), Errc::PoolPaused);
    EXPECT_FALSE(pool.last_invariant().is_known());
}

TEST_F(EclpPoolTest, InitializeRespectsCap) {
    ctx.cap.enabled = true;
    ctx.cap.per_address_cap = units(500);
    ctx.cap.global_cap = units(1000000);
    EXPECT_POOL_ERROR(pool.on_initialize(init_request(units(1000), units(1000)), ctx), Errc::CapExceeded);
    EXPECT_FALSE(pool.last_invariant().is_known());
}

// ─── join ────────────────────────────────────────────────────────────────────

TEST_F(EclpPoolTest, ProportionalJoinChargesRoundedUp) {
    initialize();

    JoinResult r = pool.on_join(balances, units(1000), proportional_join(units(100)), ctx);
    EXPECT_EQ(r.shares_out, units(100));
    EXPECT_EQ(r.amounts_in[0], units(100));
    EXPECT_EQ(r.amounts_in[1], units(100));
    EXPECT_EQ(pool.last_invariant(), LastInvariant::known(units(550)));
}

TEST_F(EclpPoolTest, JoinRoundingFavorsPool) {
    initialize();

    // 1/3 of the supply: each side needs at least a third of its balance
    JoinResult r = pool.on_join({units(1000), units(999)}, units(3), proportional_join(units(1)), ctx);
    EXPECT_GE(r.amounts_in[0] * 3, units(1000));
    EXPECT_GE(r.amounts_in[1] * 3, units(999));
}

TEST_F(EclpPoolTest, JoinRejectsUnsupportedKinds) {
    initialize();

    JoinRequest req = proportional_join(units(1));
    for (JoinKind kind : {JoinKind::ExactTokensInForSharesOut, JoinKind::TokenInForExactSharesOut, JoinKind::Init}) {
        req.kind = kind;
        EXPECT_POOL_ERROR(pool.on_join(balances, units(1000), req, ctx), Errc::UnsupportedJoinKind);
    }
    EXPECT_EQ(pool.last_invariant(), LastInvariant::known(units(500)));
}

TEST_F(EclpPoolTest, JoinBeforeInitializeFails) {
    EXPECT_POOL_ERROR(pool.on_join(balances, 0, proportional_join(units(1)), ctx), Errc::NotInitialized);
}

TEST_F(EclpPoolTest, JoinWhilePausedFails) {
    initialize();
    ctx.paused = true;
    EXPECT_POOL_ERROR(pool.on_join(balances, units(1000), proportional_join(units(1)), ctx), Errc::PoolPaused);
}

TEST_F(EclpPoolTest, CapExceededLeavesStateUntouched) {
    initialize();
    OracleState before = pool.oracle_state();

    ctx.cap.enabled = true;
    ctx.cap.per_address_cap = units(1000000);
    ctx.cap.global_cap = units(1050);
    EXPECT_POOL_ERROR(pool.on_join(balances, units(1000), proportional_join(units(100)), ctx), Errc::CapExceeded);

    EXPECT_EQ(pool.last_invariant(), LastInvariant::known(units(500)));
    EXPECT_EQ(pool.oracle_state().index, before.index);
    EXPECT_EQ(pool.oracle_sample(0).timestamp, 0u);

    ctx.cap.per_address_cap = units(50);
    ctx.cap.global_cap = units(1000000);
    JoinRequest req = proportional_join(units(40));
    req.recipient_balance = units(20);
    EXPECT_POOL_ERROR(pool.on_join(balances, units(1000), req, ctx), Errc::CapExceeded);

    req.recipient_balance = units(10);
    EXPECT_NO_THROW(pool.on_join(balances, units(1000), req, ctx));
}

TEST_F(EclpPoolTest, ProtocolFeesMintedOnInvariantGrowth) {
    initialize();
    ctx.fees.protocol_fee_pct = HALF;
    ctx.fees.gyro_portion_pct = HALF;
    math.invariant = units(600);

    JoinResult r = pool.on_join(balances, units(1000), proportional_join(units(100)), ctx);
    EXPECT_EQ(r.protocol_fees.gyro, uint256("45454545454545454545"));
    EXPECT_EQ(r.protocol_fees.dao, uint256("45454545454545454545"));
    // proportional against the diluted supply
    EXPECT_LT(r.amounts_in[0], units(100));

    uint256 supply = units(1000) + r.protocol_fees.total();
    uint256 expected = units(600) + fp::div_down(fp::mul_down(units(600), units(100)), supply);
    EXPECT_EQ(pool.last_invariant(), LastInvariant::known(expected));
}

// ─── exit ────────────────────────────────────────────────────────────────────

TEST_F(EclpPoolTest, JoinThenExitRestoresInvariant) {
    initialize();
    pool.on_join(balances, units(1000), proportional_join(units(100)), ctx);

    math.invariant = units(550);
    ExitResult r = pool.on_exit({units(1100), units(1100)}, units(1100), proportional_exit(units(100)), ctx);
    EXPECT_EQ(r.shares_in, units(100));
    EXPECT_LE(r.amounts_out[0], units(100));
    EXPECT_LE(r.amounts_out[1], units(100));
    EXPECT_EQ(pool.last_invariant(), LastInvariant::known(units(500)));
}

TEST_F(EclpPoolTest, ExitRoundsDown) {
    initialize();
    ExitResult r = pool.on_exit({units(1000), units(999)}, units(3), proportional_exit(units(1)), ctx);
    EXPECT_LE(r.amounts_out[0] * 3, units(1000));
    EXPECT_LE(r.amounts_out[1] * 3, units(999));
}

TEST_F(EclpPoolTest, ExitValidatesRequest) {
    EXPECT_POOL_ERROR(pool.on_exit(balances, 0, proportional_exit(units(1)), ctx), Errc::NotInitialized);

    initialize();
    ExitRequest req = proportional_exit(units(1));
    for (ExitKind kind : {ExitKind::ExactSharesInForOneTokenOut, ExitKind::SharesInForExactTokensOut}) {
        req.kind = kind;
        EXPECT_POOL_ERROR(pool.on_exit(balances, units(1000), req, ctx), Errc::UnsupportedExitKind);
    }
    EXPECT_POOL_ERROR(pool.on_exit(balances, units(1000), proportional_exit(units(1001)), ctx),
                      Errc::InsufficientShares);
}

TEST_F(EclpPoolTest, PausedExitForgetsInvariantUntilNextAction) {
    initialize();
    ctx.fees.protocol_fee_pct = HALF;
    ctx.fees.gyro_portion_pct = HALF;

    ctx.paused = true;
    ExitResult exit = pool.on_exit(balances, units(1000), proportional_exit(units(100)), ctx);
    EXPECT_EQ(exit.amounts_out[0], units(100));
    EXPECT_EQ(exit.amounts_out[1], units(100));
    EXPECT_EQ(exit.protocol_fees.total(), uint256(0));
    EXPECT_FALSE(pool.last_invariant().is_known());

    // grown invariant, but nothing to compare against: no fees, fresh value
    ctx.paused = false;
    math.invariant = units(600);
    JoinResult join = pool.on_join({units(900), units(900)}, units(900), proportional_join(units(90)), ctx);
    EXPECT_EQ(join.protocol_fees.total(), uint256(0));
    EXPECT_EQ(pool.last_invariant(), LastInvariant::known(units(660)));
}

TEST_F(EclpPoolTest, PausedExitSkipsInvariantComputation) {
    initialize();
    math.invariant = 0;  // would fail ZeroInvariant if computed
    ctx.paused = true;
    EXPECT_NO_THROW(pool.on_exit(balances, units(1000), proportional_exit(units(10)), ctx));
}

// ─── swap ────────────────────────────────────────────────────────────────────

TEST_F(EclpPoolFeeTest, GivenInRoutesAmountNetOfFee) {
    initialize();
    math.error = 3;
    math.out_given_in = units(98);

    SwapResult r = pool.on_swap(swap_request(SwapKind::GivenIn, "A", "B", units(100)), units(1000), units(1000), ctx);
    EXPECT_EQ(r.amount, units(98));
    EXPECT_EQ(r.fee_amount, units(1));
    EXPECT_EQ(math.last_amount, units(99));
    EXPECT_TRUE(math.last_token_in_is_first);
    EXPECT_EQ(math.last_bracket.lower, to_signed(units(500)));
    EXPECT_EQ(math.last_bracket.upper, to_signed(units(500)) + 6);
    EXPECT_EQ(r.invariant.upper, math.last_bracket.upper);
}

TEST_F(EclpPoolFeeTest, GivenOutGrossesUpForFee) {
    initialize();
    math.in_given_out = units(99);

    SwapResult r = pool.on_swap(swap_request(SwapKind::GivenOut, "A", "B", units(50)), units(1000), units(1000), ctx);
    EXPECT_EQ(math.last_amount, units(50));
    EXPECT_EQ(r.amount, units(100));
    EXPECT_EQ(r.fee_amount, units(1));
}

TEST_F(EclpPoolTest, ReversedPairSwapsBalanceOrder) {
    initialize();
    math.out_given_in = units(5);

    pool.on_swap(swap_request(SwapKind::GivenIn, "B", "A", units(10)), units(700), units(300), ctx);
    EXPECT_FALSE(math.last_token_in_is_first);
    // balances reach the engine ordered as (A, B)
    EXPECT_EQ(math.last_balances[0], units(300));
    EXPECT_EQ(math.last_balances[1], units(700));
}

TEST_F(EclpPoolTest, SwapRejectsUnknownPair) {
    initialize();
    EXPECT_POOL_ERROR(pool.on_swap(swap_request(SwapKind::GivenIn, "A", "C", units(1)), units(1), units(1), ctx),
                      Errc::InvalidTokenPair);
    EXPECT_POOL_ERROR(pool.on_swap(swap_request(SwapKind::GivenIn, "A", "A", units(1)), units(1), units(1), ctx),
                      Errc::InvalidTokenPair);
}

TEST_F(EclpPoolTest, SwapWhilePausedFails) {
    initialize();
    ctx.paused = true;
    EXPECT_POOL_ERROR(pool.on_swap(swap_request(SwapKind::GivenIn, "A", "B", units(1)), units(1000), units(1000), ctx),
                      Errc::PoolPaused);
}

TEST_F(EclpPoolTest, SwapDoesNotTouchLastInvariant) {
    initialize();
    math.invariant = units(700);
    pool.on_swap(swap_request(SwapKind::GivenIn, "A", "B", units(1)), units(1000), units(1000), ctx);
    EXPECT_EQ(pool.last_invariant(), LastInvariant::known(units(500)));
}

TEST(EclpPoolScaling, AmountsRoundedPerTokenDecimals) {
    ScriptedMath math;
    EclpPool pool(settings_with(0, 6), math);
    CallContext ctx = at_block(10, 1000, 9);

    pool.on_initialize(init_request(units(1000), uint256(1000000000)), ctx);
    EXPECT_EQ(math.last_balances[0], units(1000));
    EXPECT_EQ(math.last_balances[1], units(1000));

    // out in B (6 decimals) floors
    math.out_given_in = uint256("98500000999999999999");
    SwapResult out = pool.on_swap(swap_request(SwapKind::GivenIn, "A", "B", units(100)),
                                  units(1000), uint256(1000000000), ctx);
    EXPECT_EQ(out.amount, uint256(98500000));

    // in of B (6 decimals) ceils
    math.in_given_out = uint256("50000000000000000001");
    SwapResult in = pool.on_swap(swap_request(SwapKind::GivenOut, "B", "A", units(50)),
                                 uint256(1000000000), units(1000), ctx);
    EXPECT_EQ(in.amount, uint256(50000001));
}

// ─── oracle ──────────────────────────────────────────────────────────────────

TEST_F(EclpPoolTest, OracleSamplesOncePerBlock) {
    initialize();

    pool.on_swap(swap_request(SwapKind::GivenIn, "A", "B", units(1)), units(1000), units(1000), ctx);
    EXPECT_EQ(pool.oracle_sample(0).timestamp, 1000u);
    EXPECT_EQ(pool.oracle_latest(OracleVariable::PairPrice), fp::ONE());

    // balances already changed in this block
    CallContext same_block = at_block(10, 1050, 10);
    pool.on_swap(swap_request(SwapKind::GivenIn, "A", "B", units(1)), units(1000), units(1000), same_block);
    EXPECT_EQ(pool.oracle_sample(0).timestamp, 1000u);

    CallContext next_block = at_block(11, 1060, 10);
    pool.on_swap(swap_request(SwapKind::GivenIn, "A", "B", units(1)), units(1000), units(1000), next_block);
    EXPECT_EQ(pool.oracle_sample(0).timestamp, 1060u);
}

TEST(EclpPoolOracle, DisabledOracleNeverSamples) {
    ScriptedMath math;
    PoolSettings s = settings_with(0);
    s.oracle_enabled = false;
    EclpPool pool(s, math);
    CallContext ctx = at_block(10, 1000, 9);

    pool.on_initialize(init_request(units(1000), units(1000)), ctx);
    pool.on_swap(swap_request(SwapKind::GivenIn, "A", "B", units(1)), units(1000), units(1000), ctx);
    EXPECT_EQ(pool.oracle_sample(0).timestamp, 0u);
    EXPECT_EQ(pool.oracle_state().log_total_supply, 0);
    EXPECT_POOL_ERROR(pool.oracle_latest(OracleVariable::PairPrice), Errc::OracleNotInitialized);
}

TEST_F(EclpPoolTest, LiquidityEventsCacheLogs) {
    initialize();
    EXPECT_EQ(pool.oracle_state().log_invariant, to_low_res_log(units(500)));
    EXPECT_EQ(pool.oracle_state().log_total_supply, to_low_res_log(units(1000)));

    pool.on_join(balances, units(1000), proportional_join(units(100)), ctx);
    EXPECT_EQ(pool.oracle_state().log_invariant, to_low_res_log(units(550)));
    EXPECT_EQ(pool.oracle_state().log_total_supply, to_low_res_log(units(1100)));
}

TEST_F(EclpPoolTest, ZeroSpotPriceFailsSwapWithoutSampling) {
    initialize();
    uint64_t stamp = pool.oracle_sample(0).timestamp;

    math.price = 0;
    CallContext next_block = at_block(11, 1060, 10);
    EXPECT_POOL_ERROR(pool.on_swap(swap_request(SwapKind::GivenIn, "A", "B", units(1)), units(1000), units(1000), next_block),
                      Errc::CurveDomainViolation);
    EXPECT_EQ(pool.oracle_sample(0).timestamp, stamp);
}
