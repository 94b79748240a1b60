// In-memory vault driving a single E-CLP pool: custodies balances, mints and
// burns shares and supplies block metadata. Used by the harness and tests.
#pragma once

#include <map>
#include <string>

#include "eclp_pool.hpp"

namespace eclp {

class SimVault {
public:
    explicit SimVault(EclpPool& pool, uint64_t start_block = 1, uint64_t start_timestamp = 1700000000);

    // Dispatches to on_initialize while the share supply is zero.
    JoinResult join(const std::string& account, const JoinRequest& request);
    JoinResult join_proportional(const std::string& account, const uint256& shares_out);
    JoinResult initialize(const std::string& account, const uint256& amount0, const uint256& amount1);

    ExitResult exit(const std::string& account, const ExitRequest& request);
    ExitResult exit_proportional(const std::string& account, const uint256& shares_in);

    SwapResult swap(const SwapRequest& request);

    // time travel
    void advance(uint64_t blocks, uint64_t seconds);

    void set_paused(bool paused) { paused_ = paused; }
    void set_fee_config(const FeeConfig& fees) { fees_ = fees; }
    void set_cap(const CapConfig& cap) { cap_ = cap; }

    const Balances& balances() const { return balances_; }
    const uint256& total_supply() const { return total_supply_; }
    uint256 share_balance(const std::string& account) const;
    const BlockInfo& block() const { return block_; }
    bool paused() const { return paused_; }
    const FeeConfig& fee_config() const { return fees_; }
    EclpPool& pool() { return pool_; }

private:
    CallContext context() const;
    void mint(const std::string& account, const uint256& amount);
    void burn(const std::string& account, const uint256& amount);
    void mint_protocol_fees(const ProtocolFeeShares& fees);
    void mark_balances_changed() { block_.last_change_block = block_.number; }

    EclpPool& pool_;
    Balances balances_{};
    uint256 total_supply_ = 0;
    std::map<std::string, uint256> shares_;

    BlockInfo block_;
    bool paused_ = false;
    FeeConfig fees_;
    CapConfig cap_;
};

} // namespace eclp
