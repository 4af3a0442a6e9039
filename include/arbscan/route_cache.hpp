#ifndef ARBSCAN_ROUTE_CACHE_HPP
#define ARBSCAN_ROUTE_CACHE_HPP

#include <cstdint>
#include <map>
#include <unordered_map>
#include <vector>

#include "config.hpp"
#include "pool_feed.hpp"
#include "route.hpp"
#include "tax.hpp"
#include "token_index.hpp"

namespace arbscan {

struct RouteCacheStats {
    size_t base_tokens = 0;
    size_t indexed_tokens = 0;          // tokens with at least one route
    size_t unique_routes = 0;
    size_t excluded_tokens = 0;         // failed tax simulation
    std::map<size_t, size_t> routes_by_hops;
    int64_t build_ms = 0;
};

// =============================================================================
// RouteCache - precomputed cycles indexed by intermediate token
// =============================================================================
//
// Built once, then read-only: lookups take no locks. Cycles start and end at a
// base token, visit each intermediate token at most once, never reuse a pool
// and never pass through a token whose tax simulation failed.

class RouteCache {
public:
    RouteCache() = default;

    // Throws std::logic_error when a pool references a token missing from
    // `index` or a generated route breaks the cycle invariants.
    static RouteCache build(const TokenIndex& index,
                            const std::vector<PoolInfo>& pools,
                            const std::vector<TokenId>& base_tokens,
                            const TokenTaxTable& taxes,
                            const RouteConfig& config = {});

    // Empty when the token is on no cycle
    const std::vector<RoutePath>& routes_for(TokenId token) const;

    size_t token_count() const { return by_token_.size(); }
    const RouteCacheStats& stats() const { return stats_; }

private:
    std::unordered_map<TokenId, std::vector<RoutePath>> by_token_;
    RouteCacheStats stats_;
};

// Ids of configured base tokens that appear in the index, in config order
std::vector<TokenId> resolve_base_tokens(const TokenIndex& index,
                                         const std::vector<BaseToken>& base_tokens);

using BasePoolMap = std::unordered_map<Address, std::vector<Address>, AddressHash>;

// token -> (base token -> direct pools between them), for every non-base token
std::unordered_map<Address, BasePoolMap, AddressHash>
build_token_to_base_pools(const std::vector<PoolInfo>& pools,
                          const std::vector<Address>& base_tokens);

} // namespace arbscan

#endif // ARBSCAN_ROUTE_CACHE_HPP
