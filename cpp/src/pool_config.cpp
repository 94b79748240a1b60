#include "pool_config.hpp"
#include "eclp_math_d.hpp"

#include <boost/json/src.hpp>

#include <fstream>
#include <iterator>

namespace json = boost::json;

namespace eclp {

namespace {

const json::value& required(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v) {
        throw PoolError(Errc::InvalidConfig, std::string("missing field '") + key + "'");
    }
    return *v;
}

std::string string_field(const json::object& obj, const char* key) {
    const json::value& v = required(obj, key);
    if (!v.is_string()) {
        throw PoolError(Errc::InvalidConfig, std::string("field '") + key + "' must be a string");
    }
    return std::string(v.as_string().c_str());
}

template <typename T>
T integer_from(const std::string& s, const char* key) {
    if (s.empty()) {
        throw PoolError(Errc::InvalidConfig, std::string("field '") + key + "' is empty");
    }
    try {
        return T(s);
    } catch (const std::exception&) {
        throw PoolError(Errc::InvalidConfig, std::string("field '") + key + "' is not an integer: " + s);
    }
}

uint256 uint_field(const json::object& obj, const char* key) {
    return integer_from<uint256>(string_field(obj, key), key);
}

int256 int_field(const json::object& obj, const char* key) {
    return integer_from<int256>(string_field(obj, key), key);
}

uint256 uint_field_or(const json::object& obj, const char* key, const uint256& fallback) {
    return obj.if_contains(key) ? uint_field(obj, key) : fallback;
}

bool bool_field_or(const json::object& obj, const char* key, bool fallback) {
    const json::value* v = obj.if_contains(key);
    if (!v) return fallback;
    if (!v->is_bool()) {
        throw PoolError(Errc::InvalidConfig, std::string("field '") + key + "' must be a boolean");
    }
    return v->as_bool();
}

const json::object& object_field(const json::object& obj, const char* key) {
    const json::value& v = required(obj, key);
    if (!v.is_object()) {
        throw PoolError(Errc::InvalidConfig, std::string("field '") + key + "' must be an object");
    }
    return v.as_object();
}

const json::array& pair_field(const json::object& obj, const char* key) {
    const json::value& v = required(obj, key);
    if (!v.is_array() || v.as_array().size() != N_TOKENS) {
        throw PoolError(Errc::InvalidConfig, std::string("field '") + key + "' must hold two entries");
    }
    return v.as_array();
}

Vector2 vector_field(const json::object& obj, const char* key) {
    const json::object& v = object_field(obj, key);
    return {int_field(v, "x"), int_field(v, "y")};
}

CurveParams parse_params(const json::object& p) {
    CurveParams params;
    params.alpha = int_field(p, "alpha");
    params.beta = int_field(p, "beta");
    params.c = int_field(p, "c");
    params.s = int_field(p, "s");
    params.lambda = int_field(p, "lambda");
    return params;
}

DerivedParams parse_derived(const json::object& d) {
    DerivedParams derived;
    derived.tauAlpha = vector_field(d, "tauAlpha");
    derived.tauBeta = vector_field(d, "tauBeta");
    derived.u = int_field(d, "u");
    derived.v = int_field(d, "v");
    derived.w = int_field(d, "w");
    derived.z = int_field(d, "z");
    derived.dSq = int_field(d, "dSq");
    return derived;
}

} // namespace

PoolConfig parse_pool_config(const json::object& obj) {
    PoolConfig cfg;
    PoolSettings& s = cfg.settings;

    s.name = string_field(obj, "name");

    const json::array& tokens = pair_field(obj, "tokens");
    for (size_t i = 0; i < N_TOKENS; ++i) {
        if (!tokens[i].is_string()) {
            throw PoolError(Errc::InvalidConfig, "token ids must be strings");
        }
        s.tokens[i] = std::string(tokens[i].as_string().c_str());
    }

    if (obj.if_contains("decimals")) {
        const json::array& decimals = pair_field(obj, "decimals");
        for (size_t i = 0; i < N_TOKENS; ++i) {
            if (!decimals[i].is_int64() || decimals[i].as_int64() < 0) {
                throw PoolError(Errc::InvalidConfig, "decimals must be non-negative integers");
            }
            s.decimals[i] = static_cast<unsigned>(decimals[i].as_int64());
        }
    }

    s.swap_fee_pct = uint_field_or(obj, "swap_fee", 0);
    s.oracle_enabled = bool_field_or(obj, "oracle_enabled", true);
    s.params = parse_params(object_field(obj, "params"));
    s.derived = obj.if_contains("derived")
        ? parse_derived(object_field(obj, "derived"))
        : EclpMathD::derive_params(s.params);

    if (const json::value* fee = obj.if_contains("protocol_fee")) {
        if (!fee->is_object()) {
            throw PoolError(Errc::InvalidConfig, "field 'protocol_fee' must be an object");
        }
        const json::object& f = fee->as_object();
        cfg.fees.protocol_fee_pct = uint_field_or(f, "pct", 0);
        cfg.fees.gyro_portion_pct = uint_field_or(f, "gyro_portion", 0);
        if (f.if_contains("gyro_treasury")) cfg.fees.gyro_treasury = string_field(f, "gyro_treasury");
        if (f.if_contains("dao_treasury")) cfg.fees.dao_treasury = string_field(f, "dao_treasury");
        validate_fee_config(cfg.fees);
    }

    if (const json::value* cap = obj.if_contains("cap")) {
        if (!cap->is_object()) {
            throw PoolError(Errc::InvalidConfig, "field 'cap' must be an object");
        }
        const json::object& c = cap->as_object();
        cfg.cap.enabled = bool_field_or(c, "enabled", true);
        cfg.cap.per_address_cap = uint_field_or(c, "per_address", 0);
        cfg.cap.global_cap = uint_field_or(c, "global", 0);
    }

    if (obj.if_contains("initial_liquidity")) {
        const json::array& liq = pair_field(obj, "initial_liquidity");
        for (size_t i = 0; i < N_TOKENS; ++i) {
            if (!liq[i].is_string()) {
                throw PoolError(Errc::InvalidConfig, "initial liquidity amounts must be strings");
            }
            cfg.initial_liquidity[i] = integer_from<uint256>(std::string(liq[i].as_string().c_str()), "initial_liquidity");
        }
    }
    return cfg;
}

json::value read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw PoolError(Errc::InvalidConfig, "cannot open " + path);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    json::error_code ec;
    json::value v = json::parse(text, ec);
    if (ec) {
        throw PoolError(Errc::InvalidConfig, path + ": " + ec.message());
    }
    return v;
}

std::vector<PoolConfig> load_pool_configs(const std::string& path) {
    json::value root = read_json_file(path);
    if (!root.is_object()) {
        throw PoolError(Errc::InvalidConfig, path + ": top level must be an object");
    }
    const json::value& pools = required(root.as_object(), "pools");
    if (!pools.is_array()) {
        throw PoolError(Errc::InvalidConfig, path + ": 'pools' must be an array");
    }

    std::vector<PoolConfig> out;
    out.reserve(pools.as_array().size());
    for (const auto& p : pools.as_array()) {
        if (!p.is_object()) {
            throw PoolError(Errc::InvalidConfig, "pool entries must be objects");
        }
        out.push_back(parse_pool_config(p.as_object()));
    }
    return out;
}

} // namespace eclp
