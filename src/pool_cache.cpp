// =============================================================================
// pool_cache.cpp - Sharded pool state store
// =============================================================================

#include "arbscan/pool_cache.hpp"

#include <mutex>
#include <stdexcept>

namespace arbscan {

// =============================================================================
// PoolState Factories
// =============================================================================

PoolState PoolState::v2(const Address& token0, const Address& token1, uint32_t fee_bps,
                        U256 reserve0, U256 reserve1) {
    PoolState state;
    state.token0 = token0;
    state.token1 = token1;
    state.fee = fee_bps;
    state.data = Reserves{std::move(reserve0), std::move(reserve1)};
    state.last_updated = now_ms();
    return state;
}

PoolState PoolState::v3(const Address& token0, const Address& token1, uint32_t fee_pips,
                        U256 sqrt_price_x96, U256 liquidity,
                        int32_t tick, int32_t tick_spacing) {
    PoolState state;
    state.token0 = token0;
    state.token1 = token1;
    state.fee = fee_pips;
    state.data = ConcentratedState{std::move(sqrt_price_x96), std::move(liquidity), tick, tick_spacing};
    state.last_updated = now_ms();
    return state;
}

// =============================================================================
// PoolStateCache
// =============================================================================

PoolStateCache::PoolStateCache(size_t shard_count)
    : shard_count_(shard_count == 0 ? 1 : shard_count)
    , shards_(std::make_unique<Shard[]>(shard_count_)) {}

PoolStateCache::~PoolStateCache() = default;

PoolStateCache::Shard& PoolStateCache::shard_for(const Address& pool) const {
    return shards_[AddressHash{}(pool) % shard_count_];
}

void PoolStateCache::insert(const Address& pool, PoolState state) {
    auto record = std::make_shared<const PoolState>(std::move(state));
    Shard& shard = shard_for(pool);
    std::unique_lock lock(shard.mutex);
    shard.entries[pool] = std::move(record);
}

std::optional<PoolState> PoolStateCache::get(const Address& pool) const {
    auto record = find(pool);
    if (!record) return std::nullopt;
    return *record;
}

std::shared_ptr<const PoolState> PoolStateCache::find(const Address& pool) const {
    const Shard& shard = shard_for(pool);
    std::shared_lock lock(shard.mutex);
    auto it = shard.entries.find(pool);
    return it != shard.entries.end() ? it->second : nullptr;
}

std::optional<PoolState> PoolStateCache::update(const Address& pool, const PoolStateUpdate& update) {
    Shard& shard = shard_for(pool);
    std::unique_lock lock(shard.mutex);

    auto it = shard.entries.find(pool);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }

    const PoolState& current = *it->second;
    PoolState next = current;

    if (const auto* reserves = std::get_if<ReserveUpdate>(&update)) {
        if (current.type() != PoolType::V2) return std::nullopt;
        next.data = Reserves{reserves->reserve0, reserves->reserve1};
    } else {
        const auto& price = std::get<PriceUpdate>(update);
        const ConcentratedState* prev = current.concentrated();
        if (prev == nullptr) return std::nullopt;
        next.data = ConcentratedState{price.sqrt_price_x96, price.liquidity,
                                      price.tick, prev->tick_spacing};
    }
    next.last_updated = now_ms();

    PoolState previous = current;
    it->second = std::make_shared<const PoolState>(std::move(next));
    return previous;
}

bool PoolStateCache::contains(const Address& pool) const {
    const Shard& shard = shard_for(pool);
    std::shared_lock lock(shard.mutex);
    return shard.entries.count(pool) != 0;
}

size_t PoolStateCache::size() const {
    size_t total = 0;
    for (size_t i = 0; i < shard_count_; ++i) {
        std::shared_lock lock(shards_[i].mutex);
        total += shards_[i].entries.size();
    }
    return total;
}

std::vector<Address> PoolStateCache::addresses() const {
    std::vector<Address> out;
    for (size_t i = 0; i < shard_count_; ++i) {
        std::shared_lock lock(shards_[i].mutex);
        for (const auto& [addr, _] : shards_[i].entries) {
            out.push_back(addr);
        }
    }
    return out;
}

std::vector<Address> PoolStateCache::addresses(PoolType type) const {
    std::vector<Address> out;
    for (size_t i = 0; i < shard_count_; ++i) {
        std::shared_lock lock(shards_[i].mutex);
        for (const auto& [addr, record] : shards_[i].entries) {
            if (record->type() == type) out.push_back(addr);
        }
    }
    return out;
}

} // namespace arbscan
