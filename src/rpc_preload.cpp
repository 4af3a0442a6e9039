// =============================================================================
// rpc_preload.cpp - JSON-RPC batch eth_call snapshot
// =============================================================================

#include "arbscan/rpc_preload.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <unordered_map>

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>

namespace arbscan {

using json = nlohmann::json;

namespace {

constexpr size_t WORD = 32;
constexpr uint64_t CALLS_PER_POOL = 4;

enum CallIndex : uint64_t { CALL_STATE = 0, CALL_LIQUIDITY = 1, CALL_FEE = 2, CALL_TICK_SPACING = 3 };

std::optional<std::vector<uint8_t>> words(std::string_view hex, size_t min_words) {
    std::vector<uint8_t> bytes;
    try {
        bytes = parse_hex_bytes(hex);
    } catch (const std::invalid_argument& e) {
        spdlog::debug("Bad eth_call result: {}", e.what());
        return std::nullopt;
    }
    if (bytes.size() < min_words * WORD) return std::nullopt;
    return bytes;
}

std::optional<int32_t> int24_at(const std::vector<uint8_t>& bytes, size_t word) {
    I256 v = i256_from_be(bytes.data() + word * WORD);
    if (v < -8388608 || v > 8388607) return std::nullopt;
    return v.convert_to<int32_t>();
}

json eth_call(uint64_t id, const Address& to, std::string_view data) {
    return json{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "eth_call"},
        {"params", json::array({
            json{{"to", to_hex(to)}, {"data", std::string(data)}},
            "latest"
        })}
    };
}

} // anonymous namespace

// =============================================================================
// Decoding
// =============================================================================

std::optional<ReserveUpdate> decode_get_reserves(std::string_view hex) {
    // (uint112 reserve0, uint112 reserve1, uint32 blockTimestampLast)
    auto bytes = words(hex, 2);
    if (!bytes) return std::nullopt;
    return ReserveUpdate{u256_from_be(bytes->data(), WORD),
                         u256_from_be(bytes->data() + WORD, WORD)};
}

std::optional<std::pair<U256, int32_t>> decode_slot0(std::string_view hex) {
    auto bytes = words(hex, 2);
    if (!bytes) return std::nullopt;
    auto tick = int24_at(*bytes, 1);
    if (!tick) return std::nullopt;
    return std::make_pair(u256_from_be(bytes->data(), WORD), *tick);
}

std::optional<U256> decode_uint_word(std::string_view hex) {
    auto bytes = words(hex, 1);
    if (!bytes) return std::nullopt;
    return u256_from_be(bytes->data(), WORD);
}

std::optional<int32_t> decode_int24_word(std::string_view hex) {
    auto bytes = words(hex, 1);
    if (!bytes) return std::nullopt;
    return int24_at(*bytes, 0);
}

// =============================================================================
// RpcStatePreloader
// =============================================================================

RpcStatePreloader::RpcStatePreloader(std::string rpc_url, size_t batch_size, size_t concurrency)
    : rpc_url_(std::move(rpc_url))
    , batch_size_(std::max<size_t>(1, batch_size))
    , concurrency_(std::max<size_t>(1, concurrency)) {}

json RpcStatePreloader::build_batch(const std::vector<const PoolInfo*>& pools) {
    json batch = json::array();
    for (size_t slot = 0; slot < pools.size(); ++slot) {
        const PoolInfo& pool = *pools[slot];
        uint64_t base = slot * CALLS_PER_POOL;

        if (pool.type == PoolType::V2) {
            batch.push_back(eth_call(base + CALL_STATE, pool.address, selectors::GET_RESERVES));
        } else {
            batch.push_back(eth_call(base + CALL_STATE, pool.address, selectors::SLOT0));
            batch.push_back(eth_call(base + CALL_LIQUIDITY, pool.address, selectors::LIQUIDITY));
            batch.push_back(eth_call(base + CALL_FEE, pool.address, selectors::FEE));
            batch.push_back(eth_call(base + CALL_TICK_SPACING, pool.address, selectors::TICK_SPACING));
        }
    }
    return batch;
}

size_t RpcStatePreloader::apply_batch(const std::vector<const PoolInfo*>& pools,
                                      const json& response,
                                      PoolStateCache& cache) {
    if (!response.is_array()) {
        throw std::runtime_error("batch response is not an array");
    }

    // Nodes may answer a batch in any order
    std::unordered_map<uint64_t, std::string> results;
    for (const auto& item : response) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_number_unsigned()) continue;
        auto result = item.find("result");
        if (result == item.end() || !result->is_string()) continue;
        results.emplace(item["id"].get<uint64_t>(), result->get<std::string>());
    }

    auto result_for = [&](size_t slot, uint64_t call) -> const std::string* {
        auto it = results.find(slot * CALLS_PER_POOL + call);
        return it == results.end() ? nullptr : &it->second;
    };

    size_t loaded = 0;
    for (size_t slot = 0; slot < pools.size(); ++slot) {
        const PoolInfo& pool = *pools[slot];

        if (pool.type == PoolType::V2) {
            const std::string* raw = result_for(slot, CALL_STATE);
            auto reserves = raw ? decode_get_reserves(*raw) : std::nullopt;
            if (!reserves) continue;
            cache.insert(pool.address, PoolState::v2(pool.token0, pool.token1, pool.fee,
                                                     reserves->reserve0, reserves->reserve1));
            ++loaded;
            continue;
        }

        const std::string* raw_slot0 = result_for(slot, CALL_STATE);
        const std::string* raw_liquidity = result_for(slot, CALL_LIQUIDITY);
        if (!raw_slot0 || !raw_liquidity) continue;

        auto slot0 = decode_slot0(*raw_slot0);
        auto liquidity = decode_uint_word(*raw_liquidity);
        if (!slot0 || !liquidity) continue;

        // The feed's fee and spacing stand in when the optional calls fail
        uint32_t fee = pool.fee;
        if (const std::string* raw = result_for(slot, CALL_FEE)) {
            auto on_chain = decode_uint_word(*raw);
            if (on_chain && *on_chain < fees::V3_DENOMINATOR) fee = on_chain->convert_to<uint32_t>();
        }
        int32_t spacing = pool.tick_spacing;
        if (const std::string* raw = result_for(slot, CALL_TICK_SPACING)) {
            if (auto on_chain = decode_int24_word(*raw)) spacing = *on_chain;
        }

        cache.insert(pool.address, PoolState::v3(pool.token0, pool.token1, fee,
                                                 slot0->first, *liquidity, slot0->second, spacing));
        ++loaded;
    }
    return loaded;
}

json RpcStatePreloader::post(const json& body) const {
    auto response = cpr::Post(
        cpr::Url{rpc_url_},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{body.dump()},
        cpr::Timeout{30000});

    if (response.error) {
        throw std::runtime_error("RPC request failed: " + response.error.message);
    }
    if (response.status_code != 200) {
        throw std::runtime_error("HTTP " + std::to_string(response.status_code) +
                                 ": " + response.text);
    }
    return json::parse(response.text);
}

PreloadStats RpcStatePreloader::preload(const std::vector<PoolInfo>& pools,
                                        PoolStateCache& cache) const {
    auto start = std::chrono::steady_clock::now();
    PreloadStats stats;
    stats.requested = pools.size();

    std::vector<std::vector<const PoolInfo*>> chunks;
    for (size_t i = 0; i < pools.size(); i += batch_size_) {
        std::vector<const PoolInfo*> chunk;
        for (size_t j = i; j < std::min(pools.size(), i + batch_size_); ++j) {
            chunk.push_back(&pools[j]);
        }
        chunks.push_back(std::move(chunk));
    }
    stats.batches = chunks.size();

    // Waves of at most `concurrency_` requests
    for (size_t wave = 0; wave < chunks.size(); wave += concurrency_) {
        size_t wave_end = std::min(chunks.size(), wave + concurrency_);

        std::vector<std::future<size_t>> futures;
        for (size_t c = wave; c < wave_end; ++c) {
            futures.push_back(std::async(std::launch::async, [this, &chunks, &cache, c]() {
                return apply_batch(chunks[c], post(build_batch(chunks[c])), cache);
            }));
        }

        for (size_t k = 0; k < futures.size(); ++k) {
            const auto& chunk = chunks[wave + k];
            try {
                size_t loaded = futures[k].get();
                stats.loaded += loaded;
                stats.failed += chunk.size() - loaded;
            } catch (const std::exception& e) {
                stats.failed += chunk.size();
                spdlog::warn("Preload batch of {} pools failed: {}", chunk.size(), e.what());
            }
        }
    }

    stats.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("Preloaded {}/{} pools in {} batches ({} failed, {} ms)",
                 stats.loaded, stats.requested, stats.batches, stats.failed, stats.elapsed_ms);
    return stats;
}

} // namespace arbscan
