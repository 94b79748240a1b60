#include "eclp_math_d.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace eclp {

namespace {

constexpr double WAD = 1e18;
constexpr double XP = 1e38;

// In whole tokens: 1e34 and 3e37 at 18 decimals
constexpr double MAX_BALANCE = 1e16;
constexpr double MAX_INVARIANT = 3e19;

// Past this the rounding bounds below outgrow any useful swap size.
constexpr int MAX_STRETCH = 10000;

// Derived params are recomputed in double; anything further off than this
// was not produced from the same curve.
constexpr double DERIVED_TOLERANCE = 1e-9;

// Twice the unit roundoff, per rounded operation.
constexpr double EPS = std::numeric_limits<double>::epsilon();

struct Vec {
    double x;
    double y;
};

// A double result with a bound on its accumulated rounding error.
struct Bounded {
    double value;
    double error;
};

inline double dot(const Vec& a, const Vec& b) { return a.x * b.x + a.y * b.y; }

inline double to_d(const int256& v, double scale) {
    return v.convert_to<double>() / scale;
}

inline double to_d(const uint256& v) { return fp::to_double(v); }

inline uint256 floor_wad(double v) { return fp::from_double_down(v); }
inline uint256 ceil_wad(double v) { return fp::from_double_up(v); }

int256 round_scaled(double v, double scale) {
    double r = std::round(v * scale);
    if (r == 0.0) return 0;
    return int256(fp::integral_digits(r));
}

// Error of sqrt(d) when d carries error `err`; stays finite as d -> 0.
inline double sqrt_error(double root, double err) {
    if (!(err > 0.0)) return 0.0;
    return 2.0 * err / (root + std::sqrt(err));
}

// The curve in double precision together with the quadratic form of A^T A.
struct Ellipse {
    double alpha, beta, c, s, lambda;
    Vec chi;
    Vec chi_err;
    double pxx, pyy, pxy;
    double pxx_err, pyy_err, pxy_err;

    Vec mul_a(const Vec& t) const {
        return {(c * t.x - s * t.y) / lambda, s * t.x + c * t.y};
    }

    Vec mul_a_error(const Vec& t, const Vec& t_err) const {
        return {
            (3 * EPS * (std::fabs(c * t.x) + std::fabs(s * t.y)) + c * t_err.x + s * t_err.y) / lambda,
            3 * EPS * (std::fabs(s * t.x) + std::fabs(c * t.y)) + s * t_err.x + c * t_err.y
        };
    }
};

Ellipse ellipse_from(const CurveParams& p, const DerivedParams& d) {
    Ellipse e;
    e.alpha  = to_d(p.alpha, WAD);
    e.beta   = to_d(p.beta, WAD);
    e.c      = to_d(p.c, WAD);
    e.s      = to_d(p.s, WAD);
    e.lambda = to_d(p.lambda, WAD);

    Vec ta{to_d(d.tauAlpha.x, XP), to_d(d.tauAlpha.y, XP)};
    Vec tb{to_d(d.tauBeta.x, XP), to_d(d.tauBeta.y, XP)};

    // chi = (A^-1 tau(beta)).x, (A^-1 tau(alpha)).y
    e.chi = {
        e.lambda * e.c * tb.x + e.s * tb.y,
        -e.lambda * e.s * ta.x + e.c * ta.y
    };
    e.chi_err = {
        3 * EPS * (std::fabs(e.lambda * e.c * tb.x) + std::fabs(e.s * tb.y)),
        3 * EPS * (std::fabs(e.lambda * e.s * ta.x) + std::fabs(e.c * ta.y))
    };

    double l2 = e.lambda * e.lambda;
    e.pxx = e.c * e.c / l2 + e.s * e.s;
    e.pyy = e.s * e.s / l2 + e.c * e.c;
    e.pxy = e.c * e.s * (1.0 - 1.0 / l2);
    e.pxx_err = 4 * EPS * e.pxx;
    e.pyy_err = 4 * EPS * e.pyy;
    e.pxy_err = 4 * EPS * std::fabs(e.c * e.s);
    return e;
}

Vec tau(double c, double s, double lambda, double px) {
    // zeta: price in the circle frame
    Vec nd{(-c - s * px) / lambda, -s + c * px};
    double pc = -nd.y / nd.x;
    double z = std::sqrt(1.0 + pc * pc);
    return {pc / z, 1.0 / z};
}

void check_balance(double b) {
    if (b > MAX_BALANCE) {
        throw PoolError(Errc::CurveDomainViolation, "max assets exceeded");
    }
}

// Larger root of den r^2 - 2 (At.Achi) r + |At|^2 = 0, with its error
// propagated through every rounded step.
Bounded invariant_d(const Ellipse& e, double x, double y) {
    check_balance(x);
    check_balance(y);

    Vec at       = e.mul_a({x, y});
    Vec at_err   = e.mul_a_error({x, y}, {EPS * x, EPS * y});
    Vec achi     = e.mul_a(e.chi);
    Vec achi_err = e.mul_a_error(e.chi, e.chi_err);

    double denominator = dot(achi, achi) - 1.0;
    if (!(denominator > 0.0)) {
        throw PoolError(Errc::CurveDomainViolation, "degenerate curve");
    }
    double denominator_err = 3 * EPS * (dot(achi, achi) + 1.0)
        + 2 * (std::fabs(achi.x) * achi_err.x + std::fabs(achi.y) * achi_err.y);

    double at_achi = dot(at, achi);
    double at_achi_err = 3 * EPS * (std::fabs(at.x * achi.x) + std::fabs(at.y * achi.y))
        + std::fabs(at.x) * achi_err.x + std::fabs(achi.x) * at_err.x
        + std::fabs(at.y) * achi_err.y + std::fabs(achi.y) * at_err.y;

    double at_at = dot(at, at);
    double at_at_err = 3 * EPS * at_at + 2 * (std::fabs(at.x) * at_err.x + std::fabs(at.y) * at_err.y);

    double disc = at_achi * at_achi - denominator * at_at;
    double disc_err = 2 * std::fabs(at_achi) * at_achi_err + denominator_err * at_at
        + denominator * at_at_err + 3 * EPS * (at_achi * at_achi + denominator * at_at);
    if (disc < 0.0) disc = 0.0;
    double root = std::sqrt(disc);

    double r = (at_achi + root) / denominator;
    if (r > MAX_INVARIANT) {
        throw PoolError(Errc::CurveDomainViolation, "max invariant exceeded");
    }
    double r_err = (at_achi_err + sqrt_error(root, disc_err)) / denominator
        + r * denominator_err / denominator + 3 * EPS * r;
    return {r, r_err};
}

// One coordinate of the curve: its chi component and diagonal form entry.
struct Axis {
    double chi;
    double chi_err;
    double p;
    double p_err;
};

inline Axis x_axis(const Ellipse& e) { return {e.chi.x, e.chi_err.x, e.pxx, e.pxx_err}; }
inline Axis y_axis(const Ellipse& e) { return {e.chi.y, e.chi_err.y, e.pyy, e.pyy_err}; }

// Lower root along `to` of the level set r, given coordinate v along `from`.
Bounded lower_root(const Ellipse& e, const Axis& from, const Axis& to, double v, double r, const char* what) {
    double V = v - from.chi * r;
    double V_err = 3 * EPS * (std::fabs(v) + std::fabs(from.chi * r)) + r * from.chi_err;

    double pxy2 = e.pxy * e.pxy;
    double disc = pxy2 * V * V - to.p * (from.p * V * V - r * r);
    if (disc < 0.0) {
        throw PoolError(Errc::CurveDomainViolation, what);
    }
    double disc_err = 4 * EPS * (pxy2 * V * V + to.p * (from.p * V * V + r * r))
        + 2 * std::fabs(V) * V_err * (pxy2 + to.p * from.p)
        + 2 * std::fabs(e.pxy) * e.pxy_err * V * V
        + to.p_err * (from.p * V * V + r * r)
        + to.p * from.p_err * V * V;
    double root = std::sqrt(disc);

    double tail = std::fabs(e.pxy * V) + root;
    double out = to.chi * r + (-e.pxy * V - root) / to.p;
    double out_err = 3 * EPS * (std::fabs(to.chi * r) + tail / to.p)
        + r * to.chi_err
        + (e.pxy_err * std::fabs(V) + std::fabs(e.pxy) * V_err + sqrt_error(root, disc_err)) / to.p
        + to.p_err * tail / (to.p * to.p);
    return {out, out_err};
}

Bounded y_given_x(const Ellipse& e, double x, double r) {
    return lower_root(e, x_axis(e), y_axis(e), x, r, "x outside curve");
}

Bounded x_given_y(const Ellipse& e, double y, double r) {
    return lower_root(e, y_axis(e), x_axis(e), y, r, "y outside curve");
}

// -dy/dx along the level set of |A(t - chi r)|^2
double spot_price(const Ellipse& e, double x, double y, double r) {
    double X = x - e.chi.x * r;
    double Y = y - e.chi.y * r;
    double num = e.pxx * X + e.pxy * Y;
    double den = e.pxy * X + e.pyy * Y;
    if (den == 0.0) {
        throw PoolError(Errc::CurveDomainViolation, "price undefined at curve edge");
    }
    return num / den;
}

// An exact-out trade that the curve prices at no input means the bracket
// sits below the balances.
void check_input(const Bounded& new_in, double balance_in, const uint256& amount_out) {
    if (amount_out > 0 && !(new_in.value + new_in.error > balance_in)) {
        throw PoolError(Errc::CurveDomainViolation, "non-positive amount in");
    }
}

bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

} // namespace

DerivedParams EclpMathD::derive_params(const CurveParams& params) {
    double c = to_d(params.c, WAD);
    double s = to_d(params.s, WAD);
    double lambda = to_d(params.lambda, WAD);

    Vec ta = tau(c, s, lambda, to_d(params.alpha, WAD));
    Vec tb = tau(c, s, lambda, to_d(params.beta, WAD));

    DerivedParams d;
    d.tauAlpha = {round_scaled(ta.x, XP), round_scaled(ta.y, XP)};
    d.tauBeta  = {round_scaled(tb.x, XP), round_scaled(tb.y, XP)};
    d.u   = round_scaled(s * c * (tb.x - ta.x), XP);
    d.v   = round_scaled(s * s * tb.y + c * c * ta.y, XP);
    d.w   = round_scaled(s * c * (tb.y - ta.y), XP);
    d.z   = round_scaled(c * c * tb.x + s * s * ta.x, XP);
    d.dSq = round_scaled(c * c + s * s, XP);
    return d;
}

void EclpMathD::validate_params(const CurveParams& params) const {
    const int256 one = fpx::ONE();

    if (params.s < 0 || params.s > one || params.c < 0 || params.c > one) {
        throw PoolError(Errc::InvalidParams, "rotation vector component out of range");
    }

    // |c^2 + s^2 - 1| <= 1e-8, computed at 36 decimals
    int256 norm2 = params.s * params.s + params.c * params.c;
    int256 one2 = one * one;
    int256 tolerance("10000000000000000000000000000");
    int256 deviation = norm2 > one2 ? norm2 - one2 : one2 - norm2;
    if (deviation > tolerance) {
        throw PoolError(Errc::InvalidParams, "rotation vector not normalized");
    }

    if (params.alpha <= 0 || params.beta <= params.alpha) {
        throw PoolError(Errc::InvalidParams, "price bounds must satisfy 0 < alpha < beta");
    }

    if (params.lambda < one || params.lambda > one * MAX_STRETCH) {
        throw PoolError(Errc::InvalidParams, "stretch factor out of range");
    }
}

void EclpMathD::validate_derived_params_limits(
    const CurveParams& params,
    const DerivedParams& derived
) const {
    Vec ta{to_d(derived.tauAlpha.x, XP), to_d(derived.tauAlpha.y, XP)};
    Vec tb{to_d(derived.tauBeta.x, XP), to_d(derived.tauBeta.y, XP)};

    if (!near(dot(ta, ta), 1.0, DERIVED_TOLERANCE) || !near(dot(tb, tb), 1.0, DERIVED_TOLERANCE)) {
        throw PoolError(Errc::InvalidDerivedParams, "tau vectors must have unit norm");
    }
    if (!(ta.y > 0.0) || !(tb.y > 0.0) || !(tb.x > ta.x)) {
        throw PoolError(Errc::InvalidDerivedParams, "tau vectors out of order");
    }

    const double uvwz[] = {
        to_d(derived.u, XP), to_d(derived.v, XP), to_d(derived.w, XP), to_d(derived.z, XP)
    };
    for (double x : uvwz) {
        if (std::fabs(x) > 1.0 + DERIVED_TOLERANCE) {
            throw PoolError(Errc::InvalidDerivedParams, "u, v, w, z must lie in [-1, 1]");
        }
    }

    DerivedParams expected = derive_params(params);
    const std::pair<int256, int256> fields[] = {
        {derived.tauAlpha.x, expected.tauAlpha.x},
        {derived.tauAlpha.y, expected.tauAlpha.y},
        {derived.tauBeta.x, expected.tauBeta.x},
        {derived.tauBeta.y, expected.tauBeta.y},
        {derived.u, expected.u},
        {derived.v, expected.v},
        {derived.w, expected.w},
        {derived.z, expected.z},
        {derived.dSq, expected.dSq},
    };
    for (const auto& f : fields) {
        if (!near(to_d(f.first, XP), to_d(f.second, XP), DERIVED_TOLERANCE)) {
            throw PoolError(Errc::InvalidDerivedParams, "derived params do not match curve params");
        }
    }
}

uint256 EclpMathD::calculate_invariant(
    const Balances& balances,
    const CurveParams& params,
    const DerivedParams& derived
) const {
    Ellipse e = ellipse_from(params, derived);
    return floor_wad(invariant_d(e, to_d(balances[0]), to_d(balances[1])).value);
}

InvariantWithError EclpMathD::calculate_invariant_with_error(
    const Balances& balances,
    const CurveParams& params,
    const DerivedParams& derived
) const {
    Ellipse e = ellipse_from(params, derived);
    Bounded r = invariant_d(e, to_d(balances[0]), to_d(balances[1]));

    InvariantWithError out;
    out.invariant = to_signed(floor_wad(r.value));
    // one wei more for the floor
    out.error = to_signed(ceil_wad(r.error) + 1);
    return out;
}

uint256 EclpMathD::calc_out_given_in(
    const Balances& balances,
    const uint256& amount_in,
    bool token_in_is_first,
    const CurveParams& params,
    const DerivedParams& derived,
    const InvariantBracket& invariant
) const {
    Ellipse e = ellipse_from(params, derived);
    double r = to_d(invariant.upper, WAD);
    double x = to_d(balances[0]);
    double y = to_d(balances[1]);
    double d = to_d(amount_in);

    Bounded new_out{0.0, 0.0};
    Bounded top{0.0, 0.0};
    double balance_out = 0.0;
    if (token_in_is_first) {
        check_balance(x + d);
        new_out = y_given_x(e, x + d, r);
        top = y_given_x(e, x, r);
        balance_out = y;
    } else {
        check_balance(y + d);
        new_out = x_given_y(e, y + d, r);
        top = x_given_y(e, y, r);
        balance_out = x;
    }
    // Past the far end of the arc the lower root turns back upward.
    if (new_out.value < 0.0 || new_out.value > top.value + top.error + new_out.error) {
        throw PoolError(Errc::CurveDomainViolation, "asset bounds exceeded");
    }

    uint256 out = floor_wad(balance_out - new_out.value - new_out.error);
    if (out > balances[token_in_is_first ? 1 : 0]) {
        throw PoolError(Errc::CurveDomainViolation, "asset bounds exceeded");
    }
    return out;
}

uint256 EclpMathD::calc_in_given_out(
    const Balances& balances,
    const uint256& amount_out,
    bool token_in_is_first,
    const CurveParams& params,
    const DerivedParams& derived,
    const InvariantBracket& invariant
) const {
    if (amount_out > balances[token_in_is_first ? 1 : 0]) {
        throw PoolError(Errc::CurveDomainViolation, "asset bounds exceeded");
    }

    Ellipse e = ellipse_from(params, derived);
    double r = to_d(invariant.upper, WAD);
    double x = to_d(balances[0]);
    double y = to_d(balances[1]);
    double d = to_d(amount_out);

    Bounded new_in{0.0, 0.0};
    double balance_in = 0.0;
    // The matching exact-in quote can pay out up to twice the reverse
    // evaluation's bound less; charge that much more here.
    double margin = 0.0;
    if (token_in_is_first) {
        new_in = x_given_y(e, y - d, r);
        balance_in = x;
        check_input(new_in, balance_in, amount_out);
        double price = spot_price(e, new_in.value, y - d, r);
        margin = 2.0 * y_given_x(e, new_in.value, r).error / price;
    } else {
        new_in = y_given_x(e, x - d, r);
        balance_in = y;
        check_input(new_in, balance_in, amount_out);
        double price = spot_price(e, x - d, new_in.value, r);
        margin = 2.0 * x_given_y(e, new_in.value, r).error * price;
    }
    check_balance(new_in.value);
    if (!(margin >= 0.0) || std::isinf(margin)) {
        throw PoolError(Errc::CurveDomainViolation, "price undefined at curve edge");
    }
    return ceil_wad(new_in.value - balance_in + new_in.error + margin);
}

uint256 EclpMathD::calculate_price(
    const Balances& balances,
    const CurveParams& params,
    const DerivedParams& derived,
    const int256& invariant
) const {
    Ellipse e = ellipse_from(params, derived);
    return floor_wad(spot_price(e, to_d(balances[0]), to_d(balances[1]), to_d(invariant, WAD)));
}

} // namespace eclp
