#ifndef ARBSCAN_POOL_CACHE_HPP
#define ARBSCAN_POOL_CACHE_HPP

#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <variant>
#include <vector>

#include "types.hpp"

namespace arbscan {

// =============================================================================
// Pool State
// =============================================================================

struct Reserves {
    U256 reserve0;
    U256 reserve1;
};

struct ConcentratedState {
    U256 sqrt_price_x96;    // Q64.96
    U256 liquidity;         // active in-range liquidity
    int32_t tick = 0;
    int32_t tick_spacing = 0;
};

struct PoolState {
    Address token0{};
    Address token1{};
    uint32_t fee = 0;                                  // bps (V2) or pips (V3)
    std::variant<Reserves, ConcentratedState> data;    // family-specific state
    int64_t last_updated = 0;                          // unix ms

    PoolType type() const noexcept {
        return std::holds_alternative<Reserves>(data) ? PoolType::V2 : PoolType::V3;
    }
    const Reserves* reserves() const noexcept { return std::get_if<Reserves>(&data); }
    const ConcentratedState* concentrated() const noexcept {
        return std::get_if<ConcentratedState>(&data);
    }

    static PoolState v2(const Address& token0, const Address& token1, uint32_t fee_bps,
                        U256 reserve0 = 0, U256 reserve1 = 0);
    static PoolState v3(const Address& token0, const Address& token1, uint32_t fee_pips,
                        U256 sqrt_price_x96 = 0, U256 liquidity = 0,
                        int32_t tick = 0, int32_t tick_spacing = 0);
};

// =============================================================================
// Partial Updates (one per event family)
// =============================================================================

struct ReserveUpdate {
    U256 reserve0;
    U256 reserve1;
};

struct PriceUpdate {
    U256 sqrt_price_x96;
    U256 liquidity;
    int32_t tick = 0;
};

using PoolStateUpdate = std::variant<ReserveUpdate, PriceUpdate>;

// =============================================================================
// PoolStateCache - lock-striped map of immutable state records
// =============================================================================
//
// Each entry is a shared_ptr to a const record. Writers build a new record and
// swap the pointer under the shard's unique lock; readers copy the pointer under
// a shared lock. A reader therefore sees either the old or the new record, never
// a mix of fields.

class PoolStateCache {
public:
    explicit PoolStateCache(size_t shard_count = 64);
    ~PoolStateCache();

    // Non-copyable
    PoolStateCache(const PoolStateCache&) = delete;
    PoolStateCache& operator=(const PoolStateCache&) = delete;

    // Insert or overwrite a whole record (start-up seeding and preload)
    void insert(const Address& pool, PoolState state);

    std::optional<PoolState> get(const Address& pool) const;

    // Zero-copy read for the simulation hot path; null when missing
    std::shared_ptr<const PoolState> find(const Address& pool) const;

    // Replace the family fields carried by `update` and refresh the timestamp.
    // Returns the previous record, or nullopt when the pool is unknown or the
    // update family does not match the pool's.
    std::optional<PoolState> update(const Address& pool, const PoolStateUpdate& update);

    bool contains(const Address& pool) const;
    size_t size() const;

    // Addresses of all pools (optionally of one family), unordered
    std::vector<Address> addresses() const;
    std::vector<Address> addresses(PoolType type) const;

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<Address, std::shared_ptr<const PoolState>, AddressHash> entries;
    };

    Shard& shard_for(const Address& pool) const;

    size_t shard_count_;
    std::unique_ptr<Shard[]> shards_;
};

} // namespace arbscan

#endif // ARBSCAN_POOL_CACHE_HPP
