// =============================================================================
// events.cpp - Sync / Swap log decoding and trigger derivation
// =============================================================================

#include "arbscan/events.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace arbscan {

using json = nlohmann::json;

namespace {

constexpr size_t WORD = 32;
constexpr size_t SYNC_DATA_SIZE = 2 * WORD;
constexpr size_t UNISWAP_SWAP_DATA_SIZE = 5 * WORD;
constexpr size_t PANCAKE_SWAP_DATA_SIZE = 7 * WORD;

const U256 U160_MAX = (U256(1) << 160) - 1;

enum class LogKind { Sync, UniswapSwap, PancakeSwap };

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<LogKind> classify(const std::string& topic0) {
    std::string t = lowercase(topic0);
    if (t == topics::SYNC) return LogKind::Sync;
    if (t == topics::UNISWAP_V3_SWAP) return LogKind::UniswapSwap;
    if (t == topics::PANCAKE_V3_SWAP) return LogKind::PancakeSwap;
    return std::nullopt;
}

std::vector<uint8_t> log_data(const json& log, size_t expected) {
    std::vector<uint8_t> data;
    try {
        data = parse_hex_bytes(log.at("data").get<std::string>());
    } catch (const std::exception& e) {
        throw DecodeError(std::string("bad log data: ") + e.what());
    }
    if (data.size() != expected) {
        throw DecodeError("unexpected log data size " + std::to_string(data.size()) +
                          ", wanted " + std::to_string(expected));
    }
    return data;
}

ReserveUpdate decode_sync(const std::vector<uint8_t>& data) {
    return ReserveUpdate{u256_from_be(data.data(), WORD),
                         u256_from_be(data.data() + WORD, WORD)};
}

// Shared head of both V3 Swap layouts; PancakeSwap appends two protocol fee words
void decode_swap(const std::vector<uint8_t>& data, StateChangeEvent& event) {
    I256 amount0 = i256_from_be(data.data());
    I256 amount1 = i256_from_be(data.data() + WORD);
    U256 sqrt_price = u256_from_be(data.data() + 2 * WORD, WORD);
    U256 liquidity = u256_from_be(data.data() + 3 * WORD, WORD);
    I256 tick = i256_from_be(data.data() + 4 * WORD);

    if (sqrt_price > U160_MAX) throw DecodeError("sqrtPriceX96 wider than 160 bits");
    if (liquidity > U128_MAX) throw DecodeError("liquidity wider than 128 bits");
    if (tick < -8388608 || tick > 8388607) throw DecodeError("tick outside int24");

    event.update = PriceUpdate{sqrt_price, liquidity, tick.convert_to<int32_t>()};
    event.amount0 = amount0;
    event.amount1 = amount1;
}

U256 magnitude(const I256& v) {
    return static_cast<U256>(v < 0 ? I256(-v) : v);
}

} // anonymous namespace

std::vector<std::string> subscription_topics(bool v2, bool v3) {
    std::vector<std::string> out;
    if (v2) out.emplace_back(topics::SYNC);
    if (v3) {
        out.emplace_back(topics::UNISWAP_V3_SWAP);
        out.emplace_back(topics::PANCAKE_V3_SWAP);
    }
    return out;
}

std::optional<StateChangeEvent> decode_log(const json& log) {
    if (!log.is_object()) {
        throw DecodeError("log is not an object");
    }
    auto removed = log.find("removed");
    if (removed != log.end()) {
        if (!removed->is_boolean()) {
            throw DecodeError(std::string("removed flag is a JSON ") + removed->type_name());
        }
        if (removed->get<bool>()) {
            return std::nullopt;  // reorged out
        }
    }

    auto topics_it = log.find("topics");
    if (topics_it == log.end() || !topics_it->is_array() || topics_it->empty() ||
        !(*topics_it)[0].is_string()) {
        throw DecodeError("log has no topic0");
    }
    auto kind = classify((*topics_it)[0].get<std::string>());
    if (!kind) {
        return std::nullopt;
    }

    StateChangeEvent event;
    try {
        event.pool = parse_address(log.at("address").get<std::string>());
    } catch (const std::exception& e) {
        throw DecodeError(std::string("bad log address: ") + e.what());
    }

    switch (*kind) {
        case LogKind::Sync:
            event.update = decode_sync(log_data(log, SYNC_DATA_SIZE));
            break;
        case LogKind::UniswapSwap:
            decode_swap(log_data(log, UNISWAP_SWAP_DATA_SIZE), event);
            break;
        case LogKind::PancakeSwap:
            decode_swap(log_data(log, PANCAKE_SWAP_DATA_SIZE), event);
            break;
    }

    // Pending logs carry null block fields
    auto block = log.find("blockNumber");
    if (block != log.end() && block->is_string()) {
        try {
            U256 number = parse_u256(block->get<std::string>());
            if (number > std::numeric_limits<uint64_t>::max()) {
                throw DecodeError("block number out of range");
            }
            event.block_number = number.convert_to<uint64_t>();
        } catch (const std::invalid_argument& e) {
            throw DecodeError(std::string("bad block number: ") + e.what());
        }
    }
    auto tx = log.find("transactionHash");
    if (tx != log.end() && tx->is_string()) {
        event.tx_hash = tx->get<std::string>();
    }
    return event;
}

std::optional<TriggerEvent> derive_trigger(const StateChangeEvent& event,
                                           const PoolState& previous) {
    TriggerEvent trigger;
    trigger.pool = event.pool;
    trigger.block_number = event.block_number;
    trigger.tx_hash = event.tx_hash;

    if (const auto* update = std::get_if<ReserveUpdate>(&event.update)) {
        const Reserves* before = previous.reserves();
        if (before == nullptr) return std::nullopt;

        if (update->reserve0 < before->reserve0) {
            trigger.token = previous.token0;
            trigger.amount = before->reserve0 - update->reserve0;
        } else if (update->reserve1 < before->reserve1) {
            trigger.token = previous.token1;
            trigger.amount = before->reserve1 - update->reserve1;
        } else {
            return std::nullopt;
        }
        return trigger;
    }

    if (!event.amount0 || !event.amount1) return std::nullopt;

    if (*event.amount0 < 0) {
        trigger.token = previous.token0;
        trigger.amount = magnitude(*event.amount0);
    } else if (*event.amount1 < 0) {
        trigger.token = previous.token1;
        trigger.amount = magnitude(*event.amount1);
    } else {
        return std::nullopt;
    }
    return trigger;
}

} // namespace arbscan
