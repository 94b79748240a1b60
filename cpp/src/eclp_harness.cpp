// E-CLP pool harness: replays an action sequence against every configured pool
#include "eclp_math_d.hpp"
#include "pool_config.hpp"
#include "sim_vault.hpp"

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/json.hpp>

using namespace eclp;
namespace json = boost::json;

namespace {

const char* DEFAULT_ACCOUNT = "lp";

std::string str_field(const json::object& o, const char* key) {
    return std::string(o.at(key).as_string().c_str());
}

uint256 amount_field(const json::object& o, const char* key) {
    return uint256(str_field(o, key));
}

std::string account_of(const json::object& act) {
    return act.if_contains("account") ? str_field(act, "account") : std::string(DEFAULT_ACCOUNT);
}

json::object snapshot(SimVault& vault) {
    EclpPool& pool = vault.pool();
    const Balances& b = vault.balances();

    json::object o;
    o["balances"] = json::array{b[0].str(), b[1].str()};
    o["totalSupply"] = vault.total_supply().str();

    LastInvariant last = pool.last_invariant();
    if (last.is_known()) o["last_invariant"] = last.value().str();
    else o["last_invariant"] = nullptr;

    // views over an empty or degenerate pool are reported as null
    if (vault.total_supply() > 0) {
        try {
            o["invariant"] = pool.invariant(b).str();
            o["spot_price"] = pool.spot_price(b).str();
        } catch (const PoolError&) {
            o["invariant"] = nullptr;
            o["spot_price"] = nullptr;
        }
    }

    o["oracle_index"] = pool.oracle_state().index;
    o["block"] = vault.block().number;
    o["timestamp"] = vault.block().timestamp;
    o["paused"] = vault.paused();
    return o;
}

void run_action(SimVault& vault, const json::object& act) {
    auto type = act.at("type").as_string();
    if (type == "swap") {
        SwapRequest req;
        req.kind = (act.if_contains("kind") && act.at("kind").as_string() == "given_out")
            ? SwapKind::GivenOut : SwapKind::GivenIn;
        req.token_in = str_field(act, "token_in");
        req.token_out = str_field(act, "token_out");
        req.amount = amount_field(act, "amount");
        (void)vault.swap(req);
    } else if (type == "join") {
        if (act.if_contains("amounts")) {
            const auto& arr = act.at("amounts").as_array();
            JoinRequest req;
            req.kind = JoinKind::Init;
            for (const auto& v : arr) req.amounts_in.emplace_back(std::string(v.as_string().c_str()));
            (void)vault.join(account_of(act), req);
        } else {
            (void)vault.join_proportional(account_of(act), amount_field(act, "shares_out"));
        }
    } else if (type == "exit") {
        (void)vault.exit_proportional(account_of(act), amount_field(act, "shares_in"));
    } else if (type == "time_travel") {
        uint64_t blocks = act.if_contains("blocks") ? static_cast<uint64_t>(act.at("blocks").as_int64()) : 1;
        uint64_t secs = act.if_contains("seconds") ? static_cast<uint64_t>(act.at("seconds").as_int64()) : 0;
        vault.advance(blocks, secs);
    } else if (type == "pause") {
        vault.set_paused(true);
    } else if (type == "unpause") {
        vault.set_paused(false);
    } else if (type == "set_protocol_fee") {
        FeeConfig fees = vault.fee_config();
        if (act.if_contains("pct")) fees.protocol_fee_pct = amount_field(act, "pct");
        if (act.if_contains("gyro_portion")) fees.gyro_portion_pct = amount_field(act, "gyro_portion");
        validate_fee_config(fees);
        vault.set_fee_config(fees);
    } else {
        throw PoolError(Errc::InvalidConfig, "unknown action type: " + std::string(type.c_str()));
    }
}

int run_harness(const std::string& pools_file, const std::string& sequences_file, const std::string& output_file) {
    try {
        std::vector<PoolConfig> pools = load_pool_configs(pools_file);

        json::value seq_root = read_json_file(sequences_file);
        json::array seqs = seq_root.as_object().at("sequences").as_array();
        if (seqs.empty()) throw std::runtime_error("No sequences found");
        json::object sequence = seqs[0].as_object();

        // Snapshot controls via env
        size_t snapshot_every = 1;
        if (const char* se = std::getenv("SNAPSHOT_EVERY")) {
            try {
                long v = std::stol(se);
                snapshot_every = v <= 0 ? 0 : static_cast<size_t>(v);
            } catch (const std::exception&) {
                std::cerr << "Ignoring invalid SNAPSHOT_EVERY=" << se << std::endl;
            }
        }

        size_t threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        if (const char* thr = std::getenv("CPP_THREADS")) {
            try {
                threads = std::max<size_t>(1, std::stoul(thr));
            } catch (const std::exception&) {
                std::cerr << "Ignoring invalid CPP_THREADS=" << thr << std::endl;
            }
        }
        threads = std::min(threads, std::max<size_t>(1, pools.size()));

        EclpMathD math;
        std::vector<json::object> results(pools.size());
        std::atomic<size_t> next{0};
        std::mutex io_mu;

        auto worker = [&]() {
            for (;;) {
                size_t idx = next.fetch_add(1);
                if (idx >= pools.size()) break;
                const PoolConfig& cfg = pools[idx];

                json::object tr;
                tr["pool_config"] = cfg.settings.name;
                tr["sequence"] = sequence.at("name").as_string();
                json::object res;
                try {
                    {
                        std::lock_guard<std::mutex> lk(io_mu);
                        std::cout << "Processing " << cfg.settings.name << "..." << std::endl;
                    }

                    EclpPool pool(cfg.settings, math);
                    uint64_t start_ts = sequence.if_contains("start_timestamp")
                        ? static_cast<uint64_t>(sequence.at("start_timestamp").as_int64())
                        : 1700000000;
                    SimVault vault(pool, 1, start_ts);
                    vault.set_fee_config(cfg.fees);
                    vault.set_cap(cfg.cap);
                    if (cfg.initial_liquidity[0] > 0 || cfg.initial_liquidity[1] > 0) {
                        (void)vault.initialize(DEFAULT_ACCOUNT, cfg.initial_liquidity[0], cfg.initial_liquidity[1]);
                    }

                    json::array states;
                    if (snapshot_every != 0) states.push_back(snapshot(vault));

                    const auto& actions = sequence.at("actions").as_array();
                    for (size_t i = 0; i < actions.size(); ++i) {
                        bool success = true;
                        std::string error;
                        try {
                            run_action(vault, actions[i].as_object());
                        } catch (const std::exception& e) {
                            success = false;
                            error = e.what();
                        }
                        bool last = i + 1 == actions.size();
                        if (snapshot_every != 0 && (((i + 1) % snapshot_every) == 0 || last)) {
                            json::object st = snapshot(vault);
                            st["action_success"] = success;
                            if (!success) st["error"] = error;
                            states.push_back(st);
                        }
                    }

                    res["success"] = true;
                    if (snapshot_every == 0) res["final_state"] = snapshot(vault);
                    else res["states"] = states;
                } catch (const std::exception& e) {
                    // Per-pool failure should not bring down the whole harness
                    res["success"] = false;
                    res["error"] = e.what();
                }
                tr["result"] = res;
                results[idx] = std::move(tr);
            }
        };

        std::vector<std::thread> ws;
        ws.reserve(threads);
        for (size_t t = 0; t < threads; ++t) ws.emplace_back(worker);
        for (auto& th : ws) th.join();

        json::array out;
        for (auto& r : results) out.push_back(r);
        json::object O;
        O["results"] = out;
        O["metadata"] = json::object{
            {"pool_configs_file", pools_file},
            {"action_sequences_file", sequences_file},
            {"total_tests", pools.size()}
        };
        std::ofstream of(output_file);
        of << json::serialize(O) << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <pools.json> <sequences.json> <output.json>" << std::endl;
        return 1;
    }
    return run_harness(argv[1], argv[2], argv[3]);
}
