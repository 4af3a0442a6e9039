#ifndef ARBSCAN_POOL_FEED_HPP
#define ARBSCAN_POOL_FEED_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "pool_cache.hpp"
#include "types.hpp"

namespace arbscan {

// =============================================================================
// Pool Discovery Records
// =============================================================================

struct PoolInfo {
    Address address{};
    Address token0{};
    Address token1{};
    PoolType type = PoolType::V2;
    uint32_t fee = 0;                      // bps (V2) or pips (V3)
    std::string dex_name;
    std::optional<Address> factory;
    uint64_t block_number = 0;
    std::string transaction_hash;

    // Optional state snapshot carried by the feed
    std::optional<PoolStateUpdate> initial_state;
    int32_t tick_spacing = 0;
};

struct PoolFeed {
    std::vector<PoolInfo> pools;
    size_t skipped = 0;       // malformed lines
    size_t duplicates = 0;    // repeated pool addresses
};

// One JSON object per line:
//   {"pair_address": "0x..", "token0": "0x..", "token1": "0x..",
//    "dex_name": "PancakeSwap V2", "dex_version": "V2", "fee": 2500, ...}
// V2 fees come from the venue table, V3 fees from the record or the default.
PoolFeed parse_pool_feed(std::istream& in, const Config& config);

// Concatenates several files, dropping duplicate pool addresses.
// Missing files are skipped with a warning; throws std::runtime_error if
// none of them could be opened.
PoolFeed load_pool_feed(const std::vector<std::string>& paths, const Config& config);

// Insert one record per pool. Pools without a snapshot start empty.
void seed_cache(const std::vector<PoolInfo>& pools, PoolStateCache& cache);

PoolState initial_state(const PoolInfo& pool);

} // namespace arbscan

#endif // ARBSCAN_POOL_FEED_HPP
