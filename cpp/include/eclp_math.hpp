#ifndef ECLP_MATH_HPP
#define ECLP_MATH_HPP

#include "eclp_params.hpp"

namespace eclp {

// Numeric engine for the elliptical curve. All balances are upscaled to
// 18 decimals. Implementations must throw PoolError(CurveDomainViolation)
// instead of saturating when an amount leaves the curve.
class EclpMath {
public:
    virtual ~EclpMath() = default;

    // Construction-time checks; throw InvalidParams / InvalidDerivedParams.
    virtual void validate_params(const CurveParams& params) const = 0;
    virtual void validate_derived_params_limits(
        const CurveParams& params,
        const DerivedParams& derived
    ) const = 0;

    virtual uint256 calculate_invariant(
        const Balances& balances,
        const CurveParams& params,
        const DerivedParams& derived
    ) const = 0;

    virtual InvariantWithError calculate_invariant_with_error(
        const Balances& balances,
        const CurveParams& params,
        const DerivedParams& derived
    ) const = 0;

    virtual uint256 calc_out_given_in(
        const Balances& balances,
        const uint256& amount_in,
        bool token_in_is_first,
        const CurveParams& params,
        const DerivedParams& derived,
        const InvariantBracket& invariant
    ) const = 0;

    virtual uint256 calc_in_given_out(
        const Balances& balances,
        const uint256& amount_out,
        bool token_in_is_first,
        const CurveParams& params,
        const DerivedParams& derived,
        const InvariantBracket& invariant
    ) const = 0;

    // Spot price of token 0 quoted in token 1, 18 decimals.
    virtual uint256 calculate_price(
        const Balances& balances,
        const CurveParams& params,
        const DerivedParams& derived,
        const int256& invariant
    ) const = 0;
};

} // namespace eclp

#endif // ECLP_MATH_HPP
