#include "arbscan/pool_feed.hpp"

#include <fstream>
#include <stdexcept>
#include <unordered_set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace arbscan {

using json = nlohmann::json;

namespace {

// Integers arrive either as JSON numbers or as decimal/hex strings
U256 read_u256(const json& value) {
    if (value.is_string()) return parse_u256(value.get<std::string>());
    if (value.is_number_unsigned()) return U256(value.get<uint64_t>());
    throw std::invalid_argument("expected unsigned integer, got " + value.dump());
}

PoolInfo parse_record(const json& record, const Config& config) {
    PoolInfo info;
    info.address = parse_address(record.at("pair_address").get<std::string>());
    info.token0 = parse_address(record.at("token0").get<std::string>());
    info.token1 = parse_address(record.at("token1").get<std::string>());
    info.dex_name = record.value("dex_name", std::string());
    info.type = parse_pool_type(record.value("dex_version", std::string("V2")));

    if (info.token0 == info.token1) {
        throw std::invalid_argument("pool " + to_hex(info.address) + " has identical tokens");
    }

    if (record.contains("factory_address") && record["factory_address"].is_string()) {
        info.factory = parse_address(record["factory_address"].get<std::string>());
    }
    info.block_number = record.value("block_number", uint64_t{0});
    info.transaction_hash = record.value("transaction_hash", std::string());

    if (info.type == PoolType::V2) {
        info.fee = config.v2_fee(info.dex_name);
        if (record.contains("reserve0") && record.contains("reserve1")) {
            info.initial_state = ReserveUpdate{read_u256(record["reserve0"]), read_u256(record["reserve1"])};
        }
    } else {
        info.fee = record.value("fee", config.default_v3_fee);
        if (info.fee >= fees::V3_DENOMINATOR) {
            throw std::invalid_argument("V3 fee out of range: " + std::to_string(info.fee));
        }
        info.tick_spacing = record.value("tick_spacing", 0);
        if (record.contains("sqrt_price_x96") && record.contains("liquidity")) {
            info.initial_state = PriceUpdate{read_u256(record["sqrt_price_x96"]),
                                             read_u256(record["liquidity"]),
                                             record.value("tick", 0)};
        }
    }
    return info;
}

} // anonymous namespace

PoolFeed parse_pool_feed(std::istream& in, const Config& config) {
    PoolFeed feed;
    std::string line;

    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        try {
            feed.pools.push_back(parse_record(json::parse(line), config));
        } catch (const std::exception& e) {
            feed.skipped++;
            if (feed.skipped <= 3) {
                spdlog::warn("Skipping pool record: {}", e.what());
            }
        }
    }
    return feed;
}

PoolFeed load_pool_feed(const std::vector<std::string>& paths, const Config& config) {
    PoolFeed merged;
    std::unordered_set<Address, AddressHash> seen;
    size_t files_opened = 0;

    for (const auto& path : paths) {
        std::ifstream file{path};
        if (!file.is_open()) {
            spdlog::warn("Pool feed {} not found, skipping", path);
            continue;
        }
        files_opened++;

        PoolFeed feed = parse_pool_feed(file, config);
        merged.skipped += feed.skipped;
        for (auto& pool : feed.pools) {
            if (!seen.insert(pool.address).second) {
                merged.duplicates++;
                continue;
            }
            merged.pools.push_back(std::move(pool));
        }
        spdlog::info("Loaded {} pools from {} ({} malformed lines)",
                     feed.pools.size(), path, feed.skipped);
    }

    if (files_opened == 0) {
        throw std::runtime_error("No pool feed file could be opened");
    }
    return merged;
}

PoolState initial_state(const PoolInfo& pool) {
    if (pool.type == PoolType::V2) {
        PoolState state = PoolState::v2(pool.token0, pool.token1, pool.fee);
        if (pool.initial_state) {
            if (const auto* r = std::get_if<ReserveUpdate>(&*pool.initial_state)) {
                state.data = Reserves{r->reserve0, r->reserve1};
            }
        }
        return state;
    }

    PoolState state = PoolState::v3(pool.token0, pool.token1, pool.fee);
    ConcentratedState cl;
    cl.tick_spacing = pool.tick_spacing;
    if (pool.initial_state) {
        if (const auto* p = std::get_if<PriceUpdate>(&*pool.initial_state)) {
            cl.sqrt_price_x96 = p->sqrt_price_x96;
            cl.liquidity = p->liquidity;
            cl.tick = p->tick;
        }
    }
    state.data = cl;
    return state;
}

void seed_cache(const std::vector<PoolInfo>& pools, PoolStateCache& cache) {
    for (const auto& pool : pools) {
        cache.insert(pool.address, initial_state(pool));
    }
}

} // namespace arbscan
