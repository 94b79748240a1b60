#ifndef ECLP_PARAMS_HPP
#define ECLP_PARAMS_HPP

#include <array>

#include "fixed_point.hpp"

namespace eclp {

constexpr size_t N_TOKENS = 2;

using Balances = std::array<uint256, N_TOKENS>;

struct Vector2 {
    int256 x = 0;
    int256 y = 0;
};

// Shape of the ellipse, 18 decimals:
//   alpha, beta  lower / upper price bound
//   c, s         cos / sin of the rotation angle
//   lambda       stretch factor (>= 1)
struct CurveParams {
    int256 alpha = 0;
    int256 beta = 0;
    int256 c = 0;
    int256 s = 0;
    int256 lambda = 0;
};

// Precomputed from CurveParams, 38 decimals.
struct DerivedParams {
    Vector2 tauAlpha;
    Vector2 tauBeta;
    int256 u = 0;
    int256 v = 0;
    int256 w = 0;
    int256 z = 0;
    int256 dSq = 0;
};

struct InvariantWithError {
    int256 invariant = 0;
    int256 error = 0;
};

// upper >= lower; swaps use upper so amounts out are underestimated and
// amounts in overestimated
struct InvariantBracket {
    int256 upper = 0;
    int256 lower = 0;
};

} // namespace eclp

#endif // ECLP_PARAMS_HPP
