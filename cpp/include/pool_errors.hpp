#ifndef ECLP_POOL_ERRORS_HPP
#define ECLP_POOL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace eclp {

enum class Errc {
    InvalidTokenPair,
    LengthMismatch,
    UnsupportedJoinKind,
    UnsupportedExitKind,
    CapExceeded,
    PoolPaused,
    CurveDomainViolation,
    InvalidParams,
    InvalidDerivedParams,
    NotInitialized,
    InsufficientShares,
    ZeroInvariant,
    ZeroDivision,
    OracleNotInitialized,
    OracleQueryTooOld,
    OracleBadSecs,
    InvalidConfig,
};

const char* errc_name(Errc code);

// Every failure aborts the whole action; nothing is written before the throw.
class PoolError : public std::runtime_error {
public:
    PoolError(Errc code, const std::string& what)
        : std::runtime_error(std::string(errc_name(code)) + ": " + what), code_(code) {}

    Errc code() const noexcept { return code_; }

private:
    Errc code_;
};

} // namespace eclp

#endif // ECLP_POOL_ERRORS_HPP
