#include "sim_vault.hpp"

namespace eclp {

SimVault::SimVault(EclpPool& pool, uint64_t start_block, uint64_t start_timestamp)
    : pool_(pool) {
    block_.number = start_block;
    block_.timestamp = start_timestamp;
    block_.last_change_block = 0;
}

CallContext SimVault::context() const {
    CallContext ctx;
    ctx.block = block_;
    ctx.paused = paused_;
    ctx.fees = fees_;
    ctx.cap = cap_;
    return ctx;
}

uint256 SimVault::share_balance(const std::string& account) const {
    auto it = shares_.find(account);
    return it == shares_.end() ? uint256(0) : it->second;
}

void SimVault::mint(const std::string& account, const uint256& amount) {
    if (amount == 0) return;
    shares_[account] += amount;
    total_supply_ += amount;
}

void SimVault::burn(const std::string& account, const uint256& amount) {
    uint256 balance = share_balance(account);
    if (balance < amount) {
        throw PoolError(Errc::InsufficientShares, account + " holds fewer shares than requested");
    }
    shares_[account] = balance - amount;
    total_supply_ -= amount;
}

void SimVault::mint_protocol_fees(const ProtocolFeeShares& fees) {
    mint(fees_.gyro_treasury, fees.gyro);
    mint(fees_.dao_treasury, fees.dao);
}

JoinResult SimVault::join(const std::string& account, const JoinRequest& request) {
    JoinRequest req = request;
    req.recipient_balance = share_balance(account);

    JoinResult result = (total_supply_ == 0)
        ? pool_.on_initialize(req, context())
        : pool_.on_join(balances_, total_supply_, req, context());

    mint_protocol_fees(result.protocol_fees);
    mint(account, result.shares_out);
    balances_[0] += result.amounts_in[0];
    balances_[1] += result.amounts_in[1];
    mark_balances_changed();
    return result;
}

JoinResult SimVault::initialize(const std::string& account, const uint256& amount0, const uint256& amount1) {
    JoinRequest req;
    req.kind = JoinKind::Init;
    req.amounts_in = {amount0, amount1};
    return join(account, req);
}

JoinResult SimVault::join_proportional(const std::string& account, const uint256& shares_out) {
    JoinRequest req;
    req.kind = JoinKind::AllTokensInForExactSharesOut;
    req.shares_out = shares_out;
    return join(account, req);
}

ExitResult SimVault::exit(const std::string& account, const ExitRequest& request) {
    if (share_balance(account) < request.shares_in) {
        throw PoolError(Errc::InsufficientShares, account + " holds fewer shares than requested");
    }

    ExitResult result = pool_.on_exit(balances_, total_supply_, request, context());

    mint_protocol_fees(result.protocol_fees);
    burn(account, result.shares_in);
    balances_[0] -= result.amounts_out[0];
    balances_[1] -= result.amounts_out[1];
    mark_balances_changed();
    return result;
}

ExitResult SimVault::exit_proportional(const std::string& account, const uint256& shares_in) {
    ExitRequest req;
    req.kind = ExitKind::ExactSharesInForTokensOut;
    req.shares_in = shares_in;
    return exit(account, req);
}

SwapResult SimVault::swap(const SwapRequest& request) {
    const auto& tokens = pool_.settings().tokens;
    size_t ix_in = (request.token_in == tokens[0]) ? 0 : 1;
    size_t ix_out = 1 - ix_in;

    // the pool rejects pairs that do not match its tokens
    SwapResult result = pool_.on_swap(request, balances_[ix_in], balances_[ix_out], context());

    uint256 amount_in = request.kind == SwapKind::GivenIn ? request.amount : result.amount;
    uint256 amount_out = request.kind == SwapKind::GivenIn ? result.amount : request.amount;
    if (amount_out > balances_[ix_out]) {
        throw PoolError(Errc::CurveDomainViolation, "vault balance too small for amount out");
    }
    balances_[ix_in] += amount_in;
    balances_[ix_out] -= amount_out;
    mark_balances_changed();
    return result;
}

void SimVault::advance(uint64_t blocks, uint64_t seconds) {
    block_.number += blocks;
    block_.timestamp += seconds;
}

} // namespace eclp
