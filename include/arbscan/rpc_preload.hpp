#ifndef ARBSCAN_RPC_PRELOAD_HPP
#define ARBSCAN_RPC_PRELOAD_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "pool_cache.hpp"
#include "pool_feed.hpp"

namespace arbscan {

namespace selectors {

inline constexpr std::string_view GET_RESERVES = "0x0902f1ac";
inline constexpr std::string_view SLOT0 = "0x3850c7bd";
inline constexpr std::string_view LIQUIDITY = "0x1a686502";
inline constexpr std::string_view FEE = "0xddca3f43";
inline constexpr std::string_view TICK_SPACING = "0xd0c93a7c";

} // namespace selectors

struct PreloadStats {
    size_t requested = 0;
    size_t loaded = 0;
    size_t failed = 0;
    size_t batches = 0;
    int64_t elapsed_ms = 0;
};

// =============================================================================
// ABI return decoding (hex strings as returned by eth_call)
// =============================================================================

std::optional<ReserveUpdate> decode_get_reserves(std::string_view hex);

// sqrtPriceX96 and tick from slot0()
std::optional<std::pair<U256, int32_t>> decode_slot0(std::string_view hex);

std::optional<U256> decode_uint_word(std::string_view hex);
std::optional<int32_t> decode_int24_word(std::string_view hex);

// =============================================================================
// RpcStatePreloader - batched eth_call snapshot of every pool
// =============================================================================
//
// Pools are grouped into JSON-RPC batch requests of `batch_size` pools with at
// most `concurrency` requests in flight. A failed request or call only marks
// the pools it covers as failed; they keep whatever state the cache had.

class RpcStatePreloader {
public:
    RpcStatePreloader(std::string rpc_url, size_t batch_size = 100, size_t concurrency = 16);

    PreloadStats preload(const std::vector<PoolInfo>& pools, PoolStateCache& cache) const;

    // Request ids are pool_slot * 4 + call index
    static nlohmann::json build_batch(const std::vector<const PoolInfo*>& pools);

    // Returns the number of pools written to the cache
    static size_t apply_batch(const std::vector<const PoolInfo*>& pools,
                              const nlohmann::json& response,
                              PoolStateCache& cache);

private:
    // Throws std::runtime_error on transport or HTTP errors
    nlohmann::json post(const nlohmann::json& body) const;

    std::string rpc_url_;
    size_t batch_size_;
    size_t concurrency_;
};

} // namespace arbscan

#endif // ARBSCAN_RPC_PRELOAD_HPP
