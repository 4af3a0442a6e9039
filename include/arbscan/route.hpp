#ifndef ARBSCAN_ROUTE_HPP
#define ARBSCAN_ROUTE_HPP

#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"

namespace arbscan {

// =============================================================================
// RoutePath - a cycle (or a leg of one) through pools
// =============================================================================
//
// hops has one more entry than pools; pools[i] connects hops[i] and hops[i+1].
// A full cycle starts and ends at its base token.

struct RoutePath {
    std::vector<TokenId> hops;
    std::vector<Address> pools;
    std::vector<PoolType> pool_types;

    size_t hop_count() const noexcept { return pools.size(); }
    bool is_cycle() const noexcept { return hops.size() >= 2 && hops.front() == hops.back(); }
    bool uses_pool(const Address& pool) const;

    bool operator==(const RoutePath& other) const {
        return hops == other.hops && pools == other.pools;
    }
    bool operator!=(const RoutePath& other) const { return !(*this == other); }
};

struct RoutePathHash {
    size_t operator()(const RoutePath& route) const noexcept;
};

// Checks the hop/pool/type length relation and the cycle property.
// Throws std::logic_error on violation.
void validate_cycle(const RoutePath& route);

// Split at the first occurrence of `token`:
//   buy  = hops[0..=pos], pools[0..pos)
//   sell = hops[pos..],   pools[pos..)
// Returns nullopt when the token is not on the route.
std::optional<std::pair<RoutePath, RoutePath>>
split_route_around_token(const RoutePath& route, TokenId token);

} // namespace arbscan

#endif // ARBSCAN_ROUTE_HPP
