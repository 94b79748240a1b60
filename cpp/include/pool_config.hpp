// JSON pool definitions for the harness (Boost.JSON).
#pragma once

#include <string>
#include <vector>

#include <boost/json.hpp>

#include "eclp_pool.hpp"

namespace eclp {

struct PoolConfig {
    PoolSettings settings;
    FeeConfig fees;
    CapConfig cap;
    Balances initial_liquidity{};
};

// Amounts and 18-decimal values are decimal integer strings.
// Missing "derived" is recomputed from "params"; every error is InvalidConfig.
PoolConfig parse_pool_config(const boost::json::object& obj);

// Reads {"pools": [...]} from a file.
std::vector<PoolConfig> load_pool_configs(const std::string& path);

// File contents parsed as JSON; throws InvalidConfig when unreadable.
boost::json::value read_json_file(const std::string& path);

} // namespace eclp
