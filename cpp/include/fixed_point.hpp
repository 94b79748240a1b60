#ifndef ECLP_FIXED_POINT_HPP
#define ECLP_FIXED_POINT_HPP

#include <boost/multiprecision/cpp_int.hpp>
#include <cmath>
#include <sstream>
#include <string>

#include "pool_errors.hpp"

namespace eclp {

using uint256 = boost::multiprecision::uint256_t;
using int256 = boost::multiprecision::int256_t;

// 18-decimal unsigned fixed point. Every operation names its rounding
// direction; callers pick the one that favors the pool.
namespace fp {

inline uint256 ONE() { static const uint256 v("1000000000000000000"); return v; }

inline uint256 mul_down(const uint256& a, const uint256& b) {
    return a * b / ONE();
}

inline uint256 mul_up(const uint256& a, const uint256& b) {
    uint256 product = a * b;
    if (product == 0) {
        return 0;
    }
    return (product - 1) / ONE() + 1;
}

inline uint256 div_down(const uint256& a, const uint256& b) {
    if (b == 0) {
        throw PoolError(Errc::ZeroDivision, "div_down by zero");
    }
    return a * ONE() / b;
}

inline uint256 div_up(const uint256& a, const uint256& b) {
    if (b == 0) {
        throw PoolError(Errc::ZeroDivision, "div_up by zero");
    }
    if (a == 0) {
        return 0;
    }
    return (a * ONE() - 1) / b + 1;
}

// 1 - x, saturating at zero
inline uint256 complement(const uint256& x) {
    return x < ONE() ? ONE() - x : uint256(0);
}

inline uint256 from_units(unsigned long long whole) {
    return uint256(whole) * ONE();
}

inline double to_double(const uint256& v) {
    return v.convert_to<double>() / 1e18;
}

// Integral part of an already-rounded double, printed exactly.
inline std::string integral_digits(double v) {
    std::ostringstream oss;
    oss.setf(std::ios::fixed);
    oss.precision(0);
    oss << v;
    return oss.str();
}

inline uint256 from_double_down(double v) {
    if (!(v > 0.0)) return 0;
    return uint256(integral_digits(std::floor(v * 1e18)));
}

inline uint256 from_double_up(double v) {
    if (!(v > 0.0)) return 0;
    return uint256(integral_digits(std::ceil(v * 1e18)));
}

} // namespace fp

// 38-decimal signed fixed point used by derived curve parameters.
namespace fpx {

inline int256 ONE_XP() { static const int256 v("100000000000000000000000000000000000000"); return v; }

// 18-decimal signed scale, used by the curve parameters themselves
inline int256 ONE() { static const int256 v("1000000000000000000"); return v; }

} // namespace fpx

inline int256 to_signed(const uint256& v) { return int256(v); }

inline uint256 to_unsigned(const int256& v) {
    if (v < 0) {
        throw PoolError(Errc::CurveDomainViolation, "negative value where unsigned expected");
    }
    return uint256(v);
}

inline std::string to_string(const uint256& v) { return v.str(); }
inline std::string to_string(const int256& v) { return v.str(); }

} // namespace eclp

#endif // ECLP_FIXED_POINT_HPP
