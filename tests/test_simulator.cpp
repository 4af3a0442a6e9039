// arbscan - Swap Simulator Tests

#include <catch2/catch_test_macros.hpp>

#include "arbscan/amm_math.hpp"
#include "arbscan/simulator.hpp"

using namespace arbscan;

namespace {

const Address BASE = make_address(1);
const Address TAXED = make_address(2);
const Address OTHER = make_address(3);

const Address POOL_BT = make_address(0x201);   // BASE/TAXED, v2
const Address POOL_TO = make_address(0x202);   // TAXED/OTHER, v3
const Address POOL_OB = make_address(0x203);   // OTHER/BASE, v2

struct Market {
    PoolStateCache cache;
    TokenIndex index;

    Market() {
        index.get_or_assign(BASE);
        index.get_or_assign(TAXED);
        index.get_or_assign(OTHER);

        cache.insert(POOL_BT, PoolState::v2(BASE, TAXED, 25, U256(1000000000), U256(1000000000)));
        cache.insert(POOL_TO, PoolState::v3(TAXED, OTHER, 2500, Q96,
                                            U256("1000000000000000000"), 0, 50));
        cache.insert(POOL_OB, PoolState::v2(OTHER, BASE, 30, U256(2000000000), U256(2000000000)));
    }

    RoutePath cycle() const {
        RoutePath r;
        r.hops = {0, 1, 2, 0};
        r.pools = {POOL_BT, POOL_TO, POOL_OB};
        r.pool_types = {PoolType::V2, PoolType::V3, PoolType::V2};
        return r;
    }
};

TokenTaxTable tax_on_taxed(double buy, double sell) {
    TokenTaxTable taxes;
    TokenTaxInfo info;
    info.buy_tax = buy;
    info.sell_tax = sell;
    taxes.insert(TAXED, info);
    return taxes;
}

} // anonymous namespace

TEST_CASE("Tax keep factor", "[simulator][tax]") {
    REQUIRE(keep_ppm(0.0) == 1000000);
    REQUIRE(keep_ppm(-5.0) == 1000000);
    REQUIRE(keep_ppm(10.0) == 900000);
    REQUIRE(keep_ppm(0.5) == 995000);
    REQUIRE(keep_ppm(100.0) == 0);
    REQUIRE(keep_ppm(250.0) == 0);
}

TEST_CASE("Single hop with fees and taxes", "[simulator]") {
    Market m;
    auto pool = m.cache.get(POOL_BT);
    REQUIRE(pool.has_value());

    SwapSimulator plain(m.cache, m.index);

    SECTION("No tax matches the raw pool math") {
        auto out = plain.hop_exact_in(*pool, BASE, 1000000);
        auto expected = v2_math::get_amount_out(1000000, 1000000000, 1000000000, 25);
        REQUIRE(out.has_value());
        REQUIRE(*out == *expected);
    }

    SECTION("Sell tax shrinks the deposit") {
        TokenTaxTable taxes = tax_on_taxed(0.0, 10.0);
        SwapSimulator taxed(m.cache, m.index, SimulationConfig{std::nullopt, &taxes});

        auto with_tax = taxed.hop_exact_in(*pool, TAXED, 1000000);
        auto as_if_900k = plain.hop_exact_in(*pool, TAXED, 900000);
        REQUIRE(with_tax.has_value());
        REQUIRE(*with_tax == *as_if_900k);
    }

    SECTION("Buy tax shrinks what arrives") {
        TokenTaxTable taxes = tax_on_taxed(10.0, 0.0);
        SwapSimulator taxed(m.cache, m.index, SimulationConfig{std::nullopt, &taxes});

        auto gross = plain.hop_exact_in(*pool, BASE, 1000000);
        auto net = taxed.hop_exact_in(*pool, BASE, 1000000);
        REQUIRE(*net == *gross * 9 / 10);
    }

    SECTION("Full buy tax") {
        TokenTaxTable taxes = tax_on_taxed(100.0, 0.0);
        SwapSimulator taxed(m.cache, m.index, SimulationConfig{std::nullopt, &taxes});

        auto out = taxed.hop_exact_in(*pool, BASE, 1000000);
        REQUIRE(out.has_value());
        REQUIRE(*out == 0);
        REQUIRE_FALSE(taxed.hop_exact_out(*pool, TAXED, 1000).has_value());
    }

    SECTION("Exact out covers the requested amount under tax") {
        TokenTaxTable taxes = tax_on_taxed(5.0, 7.0);
        SwapSimulator taxed(m.cache, m.index, SimulationConfig{std::nullopt, &taxes});

        auto in = taxed.hop_exact_out(*pool, TAXED, 50000);
        REQUIRE(in.has_value());
        auto out = taxed.hop_exact_in(*pool, BASE, *in);
        REQUIRE(*out >= 50000);
    }

    SECTION("v2 fee override") {
        SwapSimulator zero_fee(m.cache, m.index, SimulationConfig{0u, nullptr});
        auto out = zero_fee.hop_exact_in(*pool, BASE, 1000000);
        auto expected = v2_math::get_amount_out(1000000, 1000000000, 1000000000, 0);
        REQUIRE(*out == *expected);
    }

    SECTION("Foreign token") {
        REQUIRE_FALSE(plain.hop_exact_in(*pool, OTHER, 1000).has_value());
        REQUIRE_FALSE(plain.hop_exact_out(*pool, OTHER, 1000).has_value());
    }
}

TEST_CASE("Route walks", "[simulator][route]") {
    Market m;
    SwapSimulator sim(m.cache, m.index);
    RoutePath route = m.cycle();

    SECTION("Forward walk chains hop outputs") {
        auto amounts = sim.simulate_sell_path_amounts(route, 100000);
        REQUIRE(amounts.has_value());
        REQUIRE(amounts->size() == 4);
        REQUIRE(amounts->front() == 100000);

        auto bt = m.cache.get(POOL_BT);
        REQUIRE((*amounts)[1] == *sim.hop_exact_in(*bt, BASE, 100000));
        // Fees on every hop: a balanced market loses money
        REQUIRE(amounts->back() < 100000);
    }

    SECTION("Reverse walk ends at the requested output") {
        auto amounts = sim.simulate_buy_path_amounts(route, 100000);
        REQUIRE(amounts.has_value());
        REQUIRE(amounts->size() == 4);
        REQUIRE(amounts->back() == 100000);
        REQUIRE(amounts->front() > 100000);

        auto forward = sim.simulate_sell_path_amounts(route, amounts->front());
        REQUIRE(forward->back() >= 100000);
    }

    SECTION("Missing pool") {
        route.pools[1] = make_address(0x999);
        REQUIRE_FALSE(sim.simulate_sell_path_amounts(route, 1000).has_value());
        REQUIRE_FALSE(sim.simulate_buy_path_amounts(route, 1000).has_value());
    }

    SECTION("Pool that does not connect the hops") {
        route.hops = {0, 2, 1, 0};
        REQUIRE_FALSE(sim.simulate_sell_path_amounts(route, 1000).has_value());
        REQUIRE_FALSE(sim.simulate_buy_path_amounts(route, 1000).has_value());
    }

    SECTION("Full tax on an intermediate token") {
        TokenTaxTable taxes = tax_on_taxed(100.0, 0.0);
        SwapSimulator taxed(m.cache, m.index, SimulationConfig{std::nullopt, &taxes});

        REQUIRE_FALSE(taxed.simulate_buy_path_amounts(route, 1000).has_value());
        // Nothing of the taxed token arrives, so every later hop trades zero
        auto forward = taxed.simulate_sell_path_amounts(route, 1000);
        REQUIRE(forward.has_value());
        REQUIRE((*forward)[1] == 0);
        REQUIRE(forward->back() == 0);
    }
}
