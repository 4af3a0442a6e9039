#include "arbscan/route.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace arbscan {

bool RoutePath::uses_pool(const Address& pool) const {
    return std::find(pools.begin(), pools.end(), pool) != pools.end();
}

size_t RoutePathHash::operator()(const RoutePath& route) const noexcept {
    uint64_t h = route.hops.size();
    for (TokenId id : route.hops) h = h * 31 + id;
    AddressHash address_hash;
    for (const auto& pool : route.pools) h = h * 31 + address_hash(pool);
    return static_cast<size_t>(h);
}

void validate_cycle(const RoutePath& route) {
    if (route.pools.empty() || route.hops.size() != route.pools.size() + 1) {
        throw std::logic_error("route has " + std::to_string(route.hops.size()) + " hops for " +
                               std::to_string(route.pools.size()) + " pools");
    }
    if (route.pool_types.size() != route.pools.size()) {
        throw std::logic_error("route pool type count does not match pool count");
    }
    if (!route.is_cycle()) {
        throw std::logic_error("route does not return to its base token");
    }
}

std::optional<std::pair<RoutePath, RoutePath>>
split_route_around_token(const RoutePath& route, TokenId token) {
    if (route.hops.size() != route.pools.size() + 1 || route.pool_types.size() != route.pools.size()) {
        throw std::logic_error("cannot split a route with mismatched hop/pool lengths");
    }

    auto it = std::find(route.hops.begin(), route.hops.end(), token);
    if (it == route.hops.end()) {
        return std::nullopt;
    }
    size_t pos = static_cast<size_t>(it - route.hops.begin());

    RoutePath buy;
    buy.hops.assign(route.hops.begin(), route.hops.begin() + pos + 1);
    buy.pools.assign(route.pools.begin(), route.pools.begin() + pos);
    buy.pool_types.assign(route.pool_types.begin(), route.pool_types.begin() + pos);

    RoutePath sell;
    sell.hops.assign(route.hops.begin() + pos, route.hops.end());
    sell.pools.assign(route.pools.begin() + pos, route.pools.end());
    sell.pool_types.assign(route.pool_types.begin() + pos, route.pool_types.end());

    return std::make_pair(std::move(buy), std::move(sell));
}

} // namespace arbscan
