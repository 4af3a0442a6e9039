// arbscan - Route Path Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "arbscan/route.hpp"

using namespace arbscan;

namespace {

RoutePath four_hop_cycle() {
    RoutePath r;
    r.hops = {0, 5, 6, 7, 0};
    r.pools = {make_address(0x10), make_address(0x11), make_address(0x12), make_address(0x13)};
    r.pool_types = {PoolType::V2, PoolType::V3, PoolType::V2, PoolType::V3};
    return r;
}

} // anonymous namespace

TEST_CASE("Route shape", "[route]") {
    RoutePath r = four_hop_cycle();

    REQUIRE(r.hop_count() == 4);
    REQUIRE(r.is_cycle());
    REQUIRE(r.uses_pool(make_address(0x12)));
    REQUIRE_FALSE(r.uses_pool(make_address(0x14)));
    REQUIRE_NOTHROW(validate_cycle(r));

    SECTION("Open path") {
        r.hops.back() = 9;
        REQUIRE_FALSE(r.is_cycle());
        REQUIRE_THROWS_AS(validate_cycle(r), std::logic_error);
    }

    SECTION("Length mismatch") {
        r.pools.pop_back();
        REQUIRE_THROWS_AS(validate_cycle(r), std::logic_error);
    }

    SECTION("Missing pool types") {
        r.pool_types.pop_back();
        REQUIRE_THROWS_AS(validate_cycle(r), std::logic_error);
    }
}

TEST_CASE("Split around a token", "[route]") {
    RoutePath r = four_hop_cycle();

    SECTION("Every token on the route") {
        for (TokenId token : {TokenId{5}, TokenId{6}, TokenId{7}}) {
            auto split = split_route_around_token(r, token);
            REQUIRE(split.has_value());
            const auto& [buy, sell] = *split;

            REQUIRE(buy.hops.front() == r.hops.front());
            REQUIRE(buy.hops.back() == token);
            REQUIRE(sell.hops.front() == token);
            REQUIRE(sell.hops.back() == r.hops.back());

            REQUIRE(buy.hops.size() == buy.pools.size() + 1);
            REQUIRE(sell.hops.size() == sell.pools.size() + 1);
            REQUIRE(buy.pools.size() + sell.pools.size() == r.pools.size());
            REQUIRE(buy.pool_types.size() == buy.pools.size());

            // Rejoining gives the original route
            RoutePath joined = buy;
            joined.hops.insert(joined.hops.end(), sell.hops.begin() + 1, sell.hops.end());
            joined.pools.insert(joined.pools.end(), sell.pools.begin(), sell.pools.end());
            REQUIRE(joined == r);
        }
    }

    SECTION("Base token splits at the start") {
        auto split = split_route_around_token(r, 0);
        REQUIRE(split.has_value());
        REQUIRE(split->first.hops.size() == 1);
        REQUIRE(split->first.pools.empty());
        REQUIRE(split->second == r);
    }

    SECTION("Token not on the route") {
        REQUIRE_FALSE(split_route_around_token(r, 42).has_value());
    }

    SECTION("Malformed route") {
        r.hops.pop_back();
        REQUIRE_THROWS_AS(split_route_around_token(r, 5), std::logic_error);
    }
}

TEST_CASE("Route hashing", "[route]") {
    RoutePath a = four_hop_cycle();
    RoutePath b = four_hop_cycle();
    RoutePath reversed = four_hop_cycle();
    std::reverse(reversed.hops.begin(), reversed.hops.end());
    std::reverse(reversed.pools.begin(), reversed.pools.end());

    REQUIRE(a == b);
    REQUIRE(RoutePathHash{}(a) == RoutePathHash{}(b));
    REQUIRE(a != reversed);

    std::unordered_set<RoutePath, RoutePathHash> seen{a, b, reversed};
    REQUIRE(seen.size() == 2);
}
