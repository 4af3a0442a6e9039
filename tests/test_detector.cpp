// arbscan - Arbitrage Detector Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <string>

#include "arbscan/channel.hpp"
#include "arbscan/detector.hpp"
#include "arbscan/events.hpp"
#include "arbscan/ingestion.hpp"

using namespace arbscan;
using Catch::Approx;

namespace {

const Address BASE = make_address(1);
const Address X = make_address(2);
const Address POOL1 = make_address(0x101);   // BASE/X
const Address POOL2 = make_address(0x102);   // X/BASE

PoolInfo v2_pool(const Address& address, const Address& t0, const Address& t1) {
    PoolInfo p;
    p.address = address;
    p.token0 = t0;
    p.token1 = t1;
    p.type = PoolType::V2;
    p.fee = 25;
    return p;
}

std::string word(const std::string& hex) {
    return std::string(64 - hex.size(), '0') + hex;
}

// Two v2 pools quoting X at slightly different prices against BASE
struct TwoPoolMarket {
    std::vector<PoolInfo> pools = {v2_pool(POOL1, BASE, X), v2_pool(POOL2, X, BASE)};
    TokenIndex index = TokenIndex::from_pools(pools);
    PoolStateCache cache;
    TokenTaxTable taxes;
    RouteCache routes;

    TwoPoolMarket() {
        cache.insert(POOL1, PoolState::v2(BASE, X, 25, 1000000, 2000000));
        cache.insert(POOL2, PoolState::v2(X, BASE, 25, 2000000, 1050000));

        RouteConfig rc;
        rc.max_hops = 3;
        rc.workers = 1;
        routes = RouteCache::build(index, pools, {*index.find(BASE)}, taxes, rc);
    }

    // Someone bought 2000 X from pool 1
    void apply_swap() {
        auto previous = cache.update(POOL1, ReserveUpdate{U256(1001000), U256(1998000)});
        REQUIRE(previous.has_value());
    }

    TriggerEvent trigger() const {
        TriggerEvent t;
        t.pool = POOL1;
        t.token = X;
        t.amount = 2000;
        t.block_number = 100;
        return t;
    }
};

DetectorConfig sequential() {
    DetectorConfig config;
    config.workers = 1;
    return config;
}

void check_single_route(const ArbitrageOpportunity& opp) {
    REQUIRE(opp.profitable_routes.size() == 1);
    REQUIRE(opp.best_route.has_value());

    const SimulatedRoute& best = *opp.best_route;
    REQUIRE(best.buy_path.pools == std::vector<Address>{POOL1});
    REQUIRE(best.sell_path.pools == std::vector<Address>{POOL2});
    REQUIRE(best.amount_in() == 1006);
    REQUIRE(best.amount_out() == 1046);
    REQUIRE(best.profit == 40);
    REQUIRE(best.profit_percentage == Approx(40.0 / 1006.0 * 100.0));
    REQUIRE(opp.estimated_profit == 40);

    // Both legs meet at the trade size
    REQUIRE(best.buy_amounts.back() == 2000);
    REQUIRE(best.sell_amounts.front() == 2000);
    REQUIRE(best.merged_amounts == std::vector<U256>{1006, 2000, 1046});
}

} // anonymous namespace

TEST_CASE("Profit arithmetic", "[detector]") {
    SECTION("Gain") {
        auto [profit, pct] = compute_profit(1000, 1050);
        REQUIRE(profit == 50);
        REQUIRE(pct == Approx(5.0));
    }

    SECTION("Loss saturates at zero") {
        auto [profit, pct] = compute_profit(1050, 1000);
        REQUIRE(profit == 0);
        REQUIRE(pct == Approx(0.0));
    }

    SECTION("Zero input") {
        auto [profit, pct] = compute_profit(0, 10);
        REQUIRE(profit == 10);
        REQUIRE(pct == 0.0);
    }
}

TEST_CASE("Detector finds the profitable direction", "[detector]") {
    TwoPoolMarket m;
    m.apply_swap();

    SECTION("Sequential evaluation") {
        ArbitrageDetector detector(m.index, m.routes, m.cache, &m.taxes, sequential());
        auto opp = detector.detect(m.trigger());
        REQUIRE(opp.has_value());
        check_single_route(*opp);
        REQUIRE(opp->trigger.block_number == 100);
        REQUIRE(opp->detected_at_ms > 0);
        REQUIRE(opp->latency_us >= 0);

        auto stats = detector.stats();
        REQUIRE(stats.detections == 1);
        REQUIRE(stats.candidate_routes == 2);
        REQUIRE(stats.simulated_routes == 2);
        REQUIRE(stats.profitable_routes == 1);
        REQUIRE(stats.opportunities == 1);
    }

    SECTION("Parallel evaluation agrees") {
        DetectorConfig config;
        config.workers = 4;
        config.routes_per_task = 1;
        ArbitrageDetector detector(m.index, m.routes, m.cache, &m.taxes, config);
        auto opp = detector.detect(m.trigger());
        REQUIRE(opp.has_value());
        check_single_route(*opp);
    }

    SECTION("Reverse direction loses money") {
        ArbitrageDetector detector(m.index, m.routes, m.cache, &m.taxes, sequential());
        for (const auto& route : m.routes.routes_for(*m.index.find(X))) {
            if (route.pools.front() != POOL2) continue;
            REQUIRE_FALSE(detector.evaluate(route, *m.index.find(X), 2000).has_value());
        }
    }

    SECTION("Minimum profit filter") {
        DetectorConfig config = sequential();
        config.min_profit = 41;
        ArbitrageDetector detector(m.index, m.routes, m.cache, &m.taxes, config);
        REQUIRE_FALSE(detector.detect(m.trigger()).has_value());

        config.min_profit = 40;
        ArbitrageDetector at_threshold(m.index, m.routes, m.cache, &m.taxes, config);
        REQUIRE(at_threshold.detect(m.trigger()).has_value());
    }

    SECTION("Implausible percentage filter") {
        DetectorConfig config = sequential();
        config.max_profit_percentage = 3.0;
        ArbitrageDetector detector(m.index, m.routes, m.cache, &m.taxes, config);
        REQUIRE_FALSE(detector.detect(m.trigger()).has_value());
    }

    SECTION("Sell tax on X wipes out the edge") {
        TokenTaxInfo info;
        info.sell_tax = 10.0;
        m.taxes.insert(X, info);
        ArbitrageDetector detector(m.index, m.routes, m.cache, &m.taxes, sequential());
        REQUIRE_FALSE(detector.detect(m.trigger()).has_value());
    }
}

TEST_CASE("Detector ignores unusable triggers", "[detector]") {
    TwoPoolMarket m;
    m.apply_swap();
    ArbitrageDetector detector(m.index, m.routes, m.cache, &m.taxes, sequential());

    SECTION("Base token") {
        TriggerEvent t = m.trigger();
        t.token = BASE;
        REQUIRE_FALSE(detector.detect(t).has_value());
    }

    SECTION("Unknown token") {
        TriggerEvent t = m.trigger();
        t.token = make_address(0x77);
        REQUIRE_FALSE(detector.detect(t).has_value());
    }

    SECTION("Zero amount") {
        TriggerEvent t = m.trigger();
        t.amount = 0;
        REQUIRE_FALSE(detector.detect(t).has_value());
    }

    SECTION("Pool on no cached route") {
        TriggerEvent t = m.trigger();
        t.pool = make_address(0x999);
        REQUIRE_FALSE(detector.detect(t).has_value());
        REQUIRE(detector.stats().candidate_routes == 0);
    }

    SECTION("Trade larger than the pool") {
        TriggerEvent t = m.trigger();
        t.amount = 5000000;
        REQUIRE_FALSE(detector.detect(t).has_value());
        REQUIRE(detector.stats().failed_simulations == 2);
    }
}

TEST_CASE("Sync log to opportunity", "[detector][pipeline]") {
    TwoPoolMarket m;
    ArbitrageDetector detector(m.index, m.routes, m.cache, &m.taxes, sequential());
    OpportunityChannel channel(8);
    IngestionLoop loop(m.cache, detector, channel);

    nlohmann::json log = {
        {"address", to_hex(POOL1)},
        {"topics", nlohmann::json::array({std::string(topics::SYNC)})},
        {"data", "0x" + word("f4628") + word("1e7cb0")},
        {"blockNumber", "0x64"},
        {"transactionHash", "0xabc"},
        {"removed", false}
    };
    loop.handle_log(log);

    auto state = m.cache.get(POOL1);
    REQUIRE(state->reserves()->reserve0 == 1001000);
    REQUIRE(state->reserves()->reserve1 == 1998000);

    REQUIRE(channel.size() == 1);
    auto opp = channel.pop(std::chrono::milliseconds(0));
    REQUIRE(opp.has_value());
    check_single_route(*opp);
    REQUIRE(opp->trigger.token == X);
    REQUIRE(opp->trigger.amount == 2000);
    REQUIRE(opp->trigger.block_number == 100);
    REQUIRE(opp->trigger.tx_hash == "0xabc");

    auto stats = loop.stats();
    REQUIRE(stats.events_received == 1);
    REQUIRE(stats.state_updates == 1);
    REQUIRE(stats.triggers == 1);
    REQUIRE(stats.opportunities == 1);

    SECTION("Replaying the same reserves triggers nothing") {
        loop.handle_log(log);
        REQUIRE(channel.size() == 0);
        REQUIRE(loop.stats().state_updates == 2);
        REQUIRE(loop.stats().triggers == 1);
    }

    SECTION("Closed channel drops the result") {
        m.cache.insert(POOL1, PoolState::v2(BASE, X, 25, 1000000, 2000000));
        channel.close();
        loop.handle_log(log);
        REQUIRE(loop.stats().opportunities == 2);
        REQUIRE(loop.stats().dropped_opportunities == 1);
    }
}
