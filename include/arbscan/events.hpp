#ifndef ARBSCAN_EVENTS_HPP
#define ARBSCAN_EVENTS_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "detector.hpp"
#include "pool_cache.hpp"

namespace arbscan {

// =============================================================================
// Log Topics
// =============================================================================

namespace topics {

// Sync(uint112,uint112)
inline constexpr std::string_view SYNC =
    "0x1c411e9a96e071241c2f21f7726b17ae89e3cab4c78be50e062b03a9fffbbad1";

// Swap(address,address,int256,int256,uint160,uint128,int24)
inline constexpr std::string_view UNISWAP_V3_SWAP =
    "0xc42079f94a6350d7e6235f29174924f928cc2ac818eb64fed8004e115fbcca67";

// Swap(address,address,int256,int256,uint160,uint128,int24,uint128,uint128)
inline constexpr std::string_view PANCAKE_V3_SWAP =
    "0x19b47279256b2a23a1665c810c8d55a1758940ee09377d4f8d26497a3577dc83";

} // namespace topics

// topic0 filter for eth_subscribe
std::vector<std::string> subscription_topics(bool v2, bool v3);

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// =============================================================================
// Decoded Events
// =============================================================================

struct StateChangeEvent {
    Address pool{};
    PoolStateUpdate update;
    std::optional<I256> amount0;    // V3 swaps only, pool perspective
    std::optional<I256> amount1;
    uint64_t block_number = 0;
    std::string tx_hash;
};

// Decode an Ethereum log object ({address, topics, data, blockNumber, ...}).
// Returns nullopt for removed logs and topics we do not track; throws
// DecodeError when a tracked event is malformed.
std::optional<StateChangeEvent> decode_log(const nlohmann::json& log);

// The token the pool paid out and how much, given the state before the event.
// V2: the token whose reserve decreased. V3: the token with a negative amount.
std::optional<TriggerEvent> derive_trigger(const StateChangeEvent& event,
                                           const PoolState& previous);

} // namespace arbscan

#endif // ARBSCAN_EVENTS_HPP
