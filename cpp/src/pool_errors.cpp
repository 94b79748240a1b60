#include "pool_errors.hpp"

namespace eclp {

const char* errc_name(Errc code) {
    switch (code) {
        case Errc::InvalidTokenPair:      return "InvalidTokenPair";
        case Errc::LengthMismatch:        return "LengthMismatch";
        case Errc::UnsupportedJoinKind:   return "UnsupportedJoinKind";
        case Errc::UnsupportedExitKind:   return "UnsupportedExitKind";
        case Errc::CapExceeded:           return "CapExceeded";
        case Errc::PoolPaused:            return "PoolPaused";
        case Errc::CurveDomainViolation:  return "CurveDomainViolation";
        case Errc::InvalidParams:         return "InvalidParams";
        case Errc::InvalidDerivedParams:  return "InvalidDerivedParams";
        case Errc::NotInitialized:        return "NotInitialized";
        case Errc::InsufficientShares:    return "InsufficientShares";
        case Errc::ZeroInvariant:         return "ZeroInvariant";
        case Errc::ZeroDivision:          return "ZeroDivision";
        case Errc::OracleNotInitialized:  return "OracleNotInitialized";
        case Errc::OracleQueryTooOld:     return "OracleQueryTooOld";
        case Errc::OracleBadSecs:         return "OracleBadSecs";
        case Errc::InvalidConfig:         return "InvalidConfig";
    }
    return "Unknown";
}

} // namespace eclp
