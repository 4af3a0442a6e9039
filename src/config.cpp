// arbscan - Configuration Implementation

#include "arbscan/config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace arbscan {

using json = nlohmann::json;

namespace {

std::vector<DexConfig> bsc_dexes() {
    return {
        {"PancakeSwap V2", parse_address("0xcA143Ce32Fe78f1f7019d7d551a6402fC5350c73"), 25, PoolType::V2},
        {"PancakeSwap V3", parse_address("0x0BFbCF9fa4f9C56B0F40a671Ad40E0805A091865"), 25, PoolType::V3},
        {"Uniswap V3",     parse_address("0xdB1d10011AD0Ff90774D0C6Bb92e5C5c8b4461F7"), 25, PoolType::V3},
        {"BiSwap",         parse_address("0x858E3312ed3A876947EA49d572A7C42DE08af7EE"), 10, PoolType::V2},
        {"ApeSwap",        parse_address("0x0841BD0B734E4F5853f0dD8d7Ea041c241fb0Da6"), 20, PoolType::V2},
        {"BakerySwap",     parse_address("0x01bF7C66c6BD861915CdaaE475042d3c4BaE16A7"), 30, PoolType::V2},
        {"MDEX",           parse_address("0x3CD1C46068dAEa5Ebb0d3f55F6915B10648062B8"), 20, PoolType::V2},
        {"SushiSwap BSC",  parse_address("0xc35DADB65012eC5796536bD9864eD8773aBc74C4"), 30, PoolType::V2},
    };
}

std::vector<BaseToken> bsc_base_tokens() {
    return {
        {"WBNB", parse_address("0xbb4CdB9CBd36B01bD1cBaEBF2De08d9173bc095c"), 18, false},
        {"BUSD", parse_address("0xe9e7CEA3DedcA5984780Bafc599bD69ADd087D56"), 18, true},
        {"USDT", parse_address("0x55d398326f99059fF775485246999027B3197955"), 18, true},
        {"USDC", parse_address("0x8AC76a51cc950d9822D68b83fE1Ad97B32Cd580d"), 18, true},
        {"CAKE", parse_address("0x0E09FaBB73Bd3Ade0a17ECC321fD13a19e81cE82"), 18, false},
        {"BTCB", parse_address("0x7130d2A12B9BCbFAe4f2634d864A1Ee1Ce3Ead9c"), 18, false},
        {"WETH", parse_address("0x2170Ed0880ac9A755fd29B2688956BD959F933F8"), 18, false},
    };
}

std::vector<KnownPrice> bsc_known_prices() {
    return {
        {"BNB",  parse_address("0xbb4CdB9CBd36B01bD1cBaEBF2De08d9173bc095c"), 689.93},
        {"ETH",  parse_address("0x2170Ed0880ac9A755fd29B2688956BD959F933F8"), 2961.19},
        {"BTC",  parse_address("0x7130d2A12B9BCbFAe4f2634d864A1Ee1Ce3Ead9c"), 117970.0},
        {"USDT", parse_address("0x55d398326f99059fF775485246999027B3197955"), 1.00},
        {"USDC", parse_address("0x8AC76a51cc950d9822D68b83fE1Ad97B32Cd580d"), 1.00},
        {"BUSD", parse_address("0xe9e7CEA3DedcA5984780Bafc599bD69ADd087D56"), 1.00},
        {"CAKE", parse_address("0x0E09FaBB73Bd3Ade0a17ECC321fD13a19e81cE82"), 2.37},
    };
}

std::chrono::milliseconds ms_value(const json& j, const char* key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(j.value(key, static_cast<int64_t>(fallback.count())));
}

void apply_network(const json& j, NetworkConfig& out) {
    out.rpc_url = j.value("rpc_url", out.rpc_url);
    out.ws_url = j.value("ws_url", out.ws_url);
    out.chain_id = j.value("chain_id", out.chain_id);
}

std::vector<DexConfig> parse_dexes(const json& arr) {
    std::vector<DexConfig> out;
    for (const auto& item : arr) {
        DexConfig dex;
        dex.name = item.at("name").get<std::string>();
        if (item.contains("factory")) {
            dex.factory = parse_address(item["factory"].get<std::string>());
        }
        dex.fee_bps = item.value("fee", dex.fee_bps);
        dex.version = parse_pool_type(item.value("version", std::string("V2")));
        out.push_back(std::move(dex));
    }
    return out;
}

std::vector<BaseToken> parse_base_tokens(const json& arr) {
    std::vector<BaseToken> out;
    for (const auto& item : arr) {
        BaseToken token;
        token.symbol = item.at("symbol").get<std::string>();
        token.address = parse_address(item.at("address").get<std::string>());
        token.decimals = item.value("decimals", token.decimals);
        token.is_stable = item.value("is_stable", token.is_stable);
        out.push_back(std::move(token));
    }
    return out;
}

std::vector<KnownPrice> parse_known_prices(const json& arr) {
    std::vector<KnownPrice> out;
    for (const auto& item : arr) {
        KnownPrice price;
        price.symbol = item.value("symbol", std::string());
        price.address = parse_address(item.at("address").get<std::string>());
        price.usd = item.at("usd").get<double>();
        out.push_back(std::move(price));
    }
    return out;
}

void apply_detector(const json& j, DetectorConfig& out) {
    if (j.contains("min_profit")) {
        out.min_profit = parse_u256(j["min_profit"].get<std::string>());
    }
    out.max_profit_percentage = j.value("max_profit_percentage", out.max_profit_percentage);
    out.workers = j.value("workers", out.workers);
    out.routes_per_task = j.value("routes_per_task", out.routes_per_task);
    if (j.contains("v2_fee_override")) {
        out.v2_fee_override = j["v2_fee_override"].get<uint32_t>();
    }
}

void apply_ingestion(const json& j, IngestionConfig& out) {
    out.max_retries = j.value("max_retries", out.max_retries);
    out.backoff_base = ms_value(j, "backoff_base_ms", out.backoff_base);
    out.backoff_max = ms_value(j, "backoff_max_ms", out.backoff_max);
    out.idle_timeout = ms_value(j, "idle_timeout_ms", out.idle_timeout);
    out.receive_timeout = ms_value(j, "receive_timeout_ms", out.receive_timeout);
    out.connect_timeout = ms_value(j, "connect_timeout_ms", out.connect_timeout);
    out.supervisor_restart_delay = ms_value(j, "supervisor_restart_delay_ms", out.supervisor_restart_delay);
    out.channel_capacity = j.value("channel_capacity", out.channel_capacity);
    out.subscribe_v2 = j.value("subscribe_v2", out.subscribe_v2);
    out.subscribe_v3 = j.value("subscribe_v3", out.subscribe_v3);
}

void apply_data(const json& j, DataConfig& out) {
    if (j.contains("pool_files")) {
        out.pool_files = j["pool_files"].get<std::vector<std::string>>();
    }
    out.tax_file = j.value("tax_file", out.tax_file);
    out.preload = j.value("preload", out.preload);
    out.preload_concurrency = j.value("preload_concurrency", out.preload_concurrency);
    out.preload_batch = j.value("preload_batch", out.preload_batch);
}

}  // namespace

Config::Config()
    : dexes(bsc_dexes())
    , base_tokens(bsc_base_tokens())
    , known_prices(bsc_known_prices()) {}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

Config Config::from_json(std::string_view content) {
    Config config;

    json root;
    try {
        root = json::parse(content);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }

    try {
        if (root.contains("network")) apply_network(root["network"], config.network);
        if (root.contains("dexes")) config.dexes = parse_dexes(root["dexes"]);
        if (root.contains("base_tokens")) config.base_tokens = parse_base_tokens(root["base_tokens"]);
        if (root.contains("known_prices")) config.known_prices = parse_known_prices(root["known_prices"]);
        config.default_v3_fee = root.value("default_v3_fee", config.default_v3_fee);

        if (root.contains("routes")) {
            const auto& r = root["routes"];
            config.routes.min_hops = r.value("min_hops", config.routes.min_hops);
            config.routes.max_hops = r.value("max_hops", config.routes.max_hops);
            config.routes.workers = r.value("workers", config.routes.workers);
        }
        if (root.contains("detector")) apply_detector(root["detector"], config.detector);
        if (root.contains("ingestion")) apply_ingestion(root["ingestion"], config.ingestion);
        if (root.contains("reporting")) {
            const auto& r = root["reporting"];
            config.reporting.min_profit_usd = r.value("min_profit_usd", config.reporting.min_profit_usd);
            if (r.contains("min_profit_wei")) {
                config.reporting.min_profit_wei = parse_u256(r["min_profit_wei"].get<std::string>());
            }
            config.reporting.opportunity_log = r.value("opportunity_log", config.reporting.opportunity_log);
        }
        if (root.contains("logging")) {
            const auto& l = root["logging"];
            config.logging.level = l.value("level", config.logging.level);
            config.logging.file = l.value("file", config.logging.file);
        }
        if (root.contains("data")) apply_data(root["data"], config.data);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.validate();
    return config;
}

const DexConfig* Config::find_dex(std::string_view name) const {
    for (const auto& dex : dexes) {
        if (dex.name == name) return &dex;
    }
    return nullptr;
}

const BaseToken* Config::base_token_by_symbol(std::string_view symbol) const {
    for (const auto& token : base_tokens) {
        if (token.symbol == symbol) return &token;
    }
    return nullptr;
}

const BaseToken* Config::base_token_by_address(const Address& address) const {
    for (const auto& token : base_tokens) {
        if (token.address == address) return &token;
    }
    return nullptr;
}

std::vector<const DexConfig*> Config::v2_dexes() const {
    std::vector<const DexConfig*> out;
    for (const auto& dex : dexes) {
        if (dex.version == PoolType::V2) out.push_back(&dex);
    }
    return out;
}

std::vector<const DexConfig*> Config::v3_dexes() const {
    std::vector<const DexConfig*> out;
    for (const auto& dex : dexes) {
        if (dex.version == PoolType::V3) out.push_back(&dex);
    }
    return out;
}

std::vector<const BaseToken*> Config::stable_tokens() const {
    std::vector<const BaseToken*> out;
    for (const auto& token : base_tokens) {
        if (token.is_stable) out.push_back(&token);
    }
    return out;
}

uint32_t Config::v2_fee(std::string_view dex_name) const {
    const DexConfig* dex = find_dex(dex_name);
    return dex != nullptr ? dex->fee_bps : fees::DEFAULT_V2_BPS;
}

void Config::validate() const {
    if (routes.min_hops < 2) {
        throw std::invalid_argument("routes.min_hops must be at least 2");
    }
    if (routes.max_hops < routes.min_hops) {
        throw std::invalid_argument("routes.max_hops must be >= routes.min_hops");
    }
    if (default_v3_fee >= fees::V3_DENOMINATOR) {
        throw std::invalid_argument("default_v3_fee must be below 1000000");
    }
    for (const auto& dex : dexes) {
        if (dex.version == PoolType::V2 && dex.fee_bps >= fees::V2_DENOMINATOR) {
            throw std::invalid_argument("fee for " + dex.name + " must be below 10000 bps");
        }
    }
    if (ingestion.channel_capacity == 0) {
        throw std::invalid_argument("ingestion.channel_capacity must be positive");
    }
    if (ingestion.backoff_max < ingestion.backoff_base) {
        throw std::invalid_argument("ingestion.backoff_max_ms must be >= backoff_base_ms");
    }
}

}  // namespace arbscan
