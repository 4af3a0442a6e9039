#ifndef ARBSCAN_CONFIG_HPP
#define ARBSCAN_CONFIG_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace arbscan {

// =============================================================================
// Network / Venue / Token Settings
// =============================================================================

struct NetworkConfig {
    std::string rpc_url = "http://127.0.0.1:8545";
    std::string ws_url = "ws://127.0.0.1:8546";
    uint64_t chain_id = 56;
};

struct DexConfig {
    std::string name;
    Address factory{};
    uint32_t fee_bps = fees::DEFAULT_V2_BPS;
    PoolType version = PoolType::V2;
};

// Start/end token of every cycle
struct BaseToken {
    std::string symbol;
    Address address{};
    uint8_t decimals = 18;
    bool is_stable = false;
};

// Static USD reference price, only used for log output
struct KnownPrice {
    std::string symbol;
    Address address{};
    double usd = 0.0;
};

// =============================================================================
// Component Settings
// =============================================================================

struct RouteConfig {
    size_t min_hops = 2;
    size_t max_hops = 3;
    size_t workers = 0;               // 0 = hardware concurrency
};

struct DetectorConfig {
    U256 min_profit = 0;              // raw units of the base token
    double max_profit_percentage = 1000.0;
    size_t workers = 0;               // 0 = hardware concurrency
    size_t routes_per_task = 32;
    std::optional<uint32_t> v2_fee_override;
};

struct IngestionConfig {
    uint32_t max_retries = 10;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_max{30000};
    std::chrono::milliseconds idle_timeout{300000};
    std::chrono::milliseconds receive_timeout{10000};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds supervisor_restart_delay{60000};
    size_t channel_capacity = 10000;
    bool subscribe_v2 = true;
    bool subscribe_v3 = true;
};

struct ReportingConfig {
    double min_profit_usd = 0.02;
    U256 min_profit_wei = U256(1000000000000000ULL);   // threshold for unpriced base tokens
    std::string opportunity_log;      // JSONL file, empty = disabled
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                 // empty = console only
};

struct DataConfig {
    std::vector<std::string> pool_files = {
        "data/liquid_pairs_v2.jsonl",
        "data/liquid_pairs_v3.jsonl"
    };
    std::string tax_file = "data/token_tax_report.jsonl";
    bool preload = true;
    size_t preload_concurrency = 16;
    size_t preload_batch = 100;
};

// =============================================================================
// Config
// =============================================================================
//
// Defaults describe a BSC mainnet deployment against a local node. JSON files
// only need to carry the keys they change.

class Config {
public:
    NetworkConfig network;
    std::vector<DexConfig> dexes;
    std::vector<BaseToken> base_tokens;
    std::vector<KnownPrice> known_prices;
    uint32_t default_v3_fee = fees::DEFAULT_V3_PIPS;

    RouteConfig routes;
    DetectorConfig detector;
    IngestionConfig ingestion;
    ReportingConfig reporting;
    LoggingConfig logging;
    DataConfig data;

    Config();

    // Throws std::runtime_error on unreadable files or invalid JSON
    static Config from_file(std::string_view path);
    static Config from_json(std::string_view content);

    Config& with_rpc_url(std::string_view url) {
        network.rpc_url = std::string(url);
        return *this;
    }

    Config& with_ws_url(std::string_view url) {
        network.ws_url = std::string(url);
        return *this;
    }

    Config& with_pool_files(std::vector<std::string> files) {
        data.pool_files = std::move(files);
        return *this;
    }

    Config& with_tax_file(std::string_view path) {
        data.tax_file = std::string(path);
        return *this;
    }

    Config& with_log_level(std::string_view level) {
        logging.level = std::string(level);
        return *this;
    }

    Config& with_max_hops(size_t hops) {
        routes.max_hops = hops;
        return *this;
    }

    Config& without_preload() {
        data.preload = false;
        return *this;
    }

    // Lookups
    const DexConfig* find_dex(std::string_view name) const;
    const BaseToken* base_token_by_symbol(std::string_view symbol) const;
    const BaseToken* base_token_by_address(const Address& address) const;
    std::vector<const DexConfig*> v2_dexes() const;
    std::vector<const DexConfig*> v3_dexes() const;
    std::vector<const BaseToken*> stable_tokens() const;

    // Fee for a V2 venue, 25 bps when the venue is unknown
    uint32_t v2_fee(std::string_view dex_name) const;

    // Throws std::invalid_argument on inconsistent settings
    void validate() const;
};

} // namespace arbscan

#endif // ARBSCAN_CONFIG_HPP
