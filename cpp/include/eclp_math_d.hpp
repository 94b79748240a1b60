#ifndef ECLP_MATH_D_HPP
#define ECLP_MATH_D_HPP

#include "eclp_math.hpp"

namespace eclp {

// Reference engine evaluating the curve in double precision. Inputs and
// outputs stay fixed point; outputs are floored and inputs ceiled so the
// rounding never favors the trader.
class EclpMathD : public EclpMath {
public:
    // Precompute tau(alpha), tau(beta), u, v, w, z and dSq for a curve.
    static DerivedParams derive_params(const CurveParams& params);

    void validate_params(const CurveParams& params) const override;
    void validate_derived_params_limits(
        const CurveParams& params,
        const DerivedParams& derived
    ) const override;

    uint256 calculate_invariant(
        const Balances& balances,
        const CurveParams& params,
        const DerivedParams& derived
    ) const override;

    InvariantWithError calculate_invariant_with_error(
        const Balances& balances,
        const CurveParams& params,
        const DerivedParams& derived
    ) const override;

    uint256 calc_out_given_in(
        const Balances& balances,
        const uint256& amount_in,
        bool token_in_is_first,
        const CurveParams& params,
        const DerivedParams& derived,
        const InvariantBracket& invariant
    ) const override;

    uint256 calc_in_given_out(
        const Balances& balances,
        const uint256& amount_out,
        bool token_in_is_first,
        const CurveParams& params,
        const DerivedParams& derived,
        const InvariantBracket& invariant
    ) const override;

    uint256 calculate_price(
        const Balances& balances,
        const CurveParams& params,
        const DerivedParams& derived,
        const int256& invariant
    ) const override;
};

} // namespace eclp

#endif // ECLP_MATH_D_HPP
