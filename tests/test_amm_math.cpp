// arbscan - AMM Math Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "arbscan/amm_math.hpp"

using namespace arbscan;
using Catch::Approx;

TEST_CASE("v2 amount out", "[math][v2]") {
    SECTION("Known value") {
        // 1000 * 9975 * 2e6 / (1e6 * 10000 + 1000 * 9975)
        auto out = v2_math::get_amount_out(1000, 1000000, 2000000, 25);
        REQUIRE(out.has_value());
        REQUIRE(*out == 1993);
    }

    SECTION("Zero fee is the plain constant product") {
        auto out = v2_math::get_amount_out(1000, 1000000, 1000000, 0);
        REQUIRE(out.has_value());
        REQUIRE(*out == 999);  // 1e9 / 1001000
    }

    SECTION("Monotonic in input") {
        U256 prev = 0;
        for (uint64_t in : {100ULL, 1000ULL, 10000ULL, 100000ULL, 1000000ULL}) {
            auto out = v2_math::get_amount_out(in, 5000000, 7000000, 30);
            REQUIRE(out.has_value());
            REQUIRE(*out > prev);
            REQUIRE(*out < 7000000);
            prev = *out;
        }
    }

    SECTION("Rejected inputs") {
        REQUIRE_FALSE(v2_math::get_amount_out(1000, 0, 2000000, 25).has_value());
        REQUIRE_FALSE(v2_math::get_amount_out(1000, 1000000, 0, 25).has_value());
        REQUIRE_FALSE(v2_math::get_amount_out(1000, 1000000, 2000000, 10000).has_value());
    }
}

TEST_CASE("v2 amount in", "[math][v2]") {
    SECTION("Known value") {
        // 1e6 * 2000 * 10000 / (1998000 * 9975) + 1
        auto in = v2_math::get_amount_in(2000, 1000000, 2000000, 25);
        REQUIRE(in.has_value());
        REQUIRE(*in == 1004);
    }

    SECTION("Round trip covers the requested output") {
        const U256 reserve_in("123456789012345678901");
        const U256 reserve_out("98765432109876543210");
        for (const char* want : {"1", "1000", "1000000000000", "5000000000000000000"}) {
            U256 amount_out(want);
            auto in = v2_math::get_amount_in(amount_out, reserve_in, reserve_out, 30);
            REQUIRE(in.has_value());
            auto out = v2_math::get_amount_out(*in, reserve_in, reserve_out, 30);
            REQUIRE(out.has_value());
            REQUIRE(*out >= amount_out);
        }
    }

    SECTION("Cannot drain the pool") {
        REQUIRE_FALSE(v2_math::get_amount_in(2000000, 1000000, 2000000, 25).has_value());
        REQUIRE_FALSE(v2_math::get_amount_in(3000000, 1000000, 2000000, 25).has_value());
        REQUIRE(v2_math::get_amount_in(1999999, 1000000, 2000000, 25).has_value());
    }

    SECTION("Rejected inputs") {
        REQUIRE_FALSE(v2_math::get_amount_in(10, 0, 2000000, 25).has_value());
        REQUIRE_FALSE(v2_math::get_amount_in(10, 1000000, 2000000, 10000).has_value());
    }
}

TEST_CASE("v3 single-step swaps", "[math][v3]") {
    const U256 liquidity("1000000000000000000");  // 1e18
    const U256 sqrt_price = Q96;                  // price 1.0

    SECTION("Price of Q96 is one") {
        REQUIRE(v3_math::sqrt_price_to_price(Q96) == Approx(1.0));
        REQUIRE(v3_math::sqrt_price_to_price(Q96 * 2) == Approx(4.0));
    }

    SECTION("Exact in at unit price loses the fee") {
        for (bool zero_for_one : {true, false}) {
            auto out = v3_math::swap_exact_in(1000000, sqrt_price, liquidity, 3000, zero_for_one);
            REQUIRE(out.has_value());
            REQUIRE(*out <= 997000);
            REQUIRE(*out >= 996990);
        }
    }

    SECTION("Exact out then exact in covers the output") {
        for (bool zero_for_one : {true, false}) {
            for (const char* want : {"1", "997", "1000000", "50000000000000000"}) {
                U256 amount_out(want);
                auto in = v3_math::swap_exact_out(amount_out, sqrt_price, liquidity, 2500, zero_for_one);
                REQUIRE(in.has_value());
                REQUIRE(*in > amount_out);
                auto out = v3_math::swap_exact_in(*in, sqrt_price, liquidity, 2500, zero_for_one);
                REQUIRE(out.has_value());
                REQUIRE(*out >= amount_out);
            }
        }
    }

    SECTION("Exact out away from unit price") {
        const U256 sp("6478339464120497475");
        const U256 deep("219117476940123774420787");
        int quoted = 0;
        for (bool zero_for_one : {true, false}) {
            for (const char* want : {"1", "24334", "1000000", "1000000000000000"}) {
                U256 amount_out(want);
                auto in = v3_math::swap_exact_out(amount_out, sp, deep, 2500, zero_for_one);
                if (!in) continue;
                ++quoted;
                auto out = v3_math::swap_exact_in(*in, sp, deep, 2500, zero_for_one);
                REQUIRE(out.has_value());
                REQUIRE(*out >= amount_out);
            }
        }
        REQUIRE(quoted > 0);
    }

    SECTION("Every exact out quote replays forward") {
        const U256 deep("1000000000000000000000000");  // 1e24
        for (unsigned shift = 0; shift <= 12; shift += 2) {
            const U256 prices[] = {Q96 << shift, Q96 >> shift};
            for (const U256& sp : prices) {
                for (bool zero_for_one : {true, false}) {
                    for (const char* want : {"1", "1000", "24334", "1000000000000000"}) {
                        U256 amount_out(want);
                        auto in = v3_math::swap_exact_out(amount_out, sp, deep, 2500, zero_for_one);
                        if (!in) continue;
                        auto out = v3_math::swap_exact_in(*in, sp, deep, 2500, zero_for_one);
                        REQUIRE(out.has_value());
                        REQUIRE(*out >= amount_out);
                    }
                }
            }
        }
    }

    SECTION("Monotonic in input") {
        U256 prev = 0;
        for (uint64_t in : {1000ULL, 10000ULL, 100000ULL, 1000000ULL}) {
            auto out = v3_math::swap_exact_in(in, sqrt_price, liquidity, 500, true);
            REQUIRE(out.has_value());
            REQUIRE(*out > prev);
            prev = *out;
        }
    }

    SECTION("Rejected inputs") {
        REQUIRE_FALSE(v3_math::swap_exact_in(1000, sqrt_price, 0, 3000, true).has_value());
        REQUIRE_FALSE(v3_math::swap_exact_in(1000, 0, liquidity, 3000, true).has_value());
        REQUIRE_FALSE(v3_math::swap_exact_in(1000, sqrt_price, U128_MAX + 1, 3000, true).has_value());
        REQUIRE_FALSE(v3_math::swap_exact_in(1000, U128_MAX + 1, liquidity, 3000, true).has_value());
        REQUIRE_FALSE(v3_math::swap_exact_in(1000, sqrt_price, liquidity, 1000000, true).has_value());
        REQUIRE_FALSE(v3_math::swap_exact_out(1000, sqrt_price, 0, 3000, false).has_value());
    }

    SECTION("Output above the liquidity is infeasible") {
        REQUIRE_FALSE(v3_math::swap_exact_out(liquidity + 1, sqrt_price, liquidity, 3000, true).has_value());
        REQUIRE_FALSE(v3_math::swap_exact_out(liquidity, sqrt_price, liquidity, 3000, false).has_value());
    }

    SECTION("Implausible amount ratios are rejected") {
        // price 2^40 token1 per token0: selling token0 returns ~1e12x the input
        const U256 steep = Q96 << 20;
        const U256 deep("1000000000000000000000000000000");
        REQUIRE_FALSE(v3_math::swap_exact_in(1000000, steep, deep, 3000, true).has_value());
        // buying token0 with token1 costs ~1e12x the output
        REQUIRE_FALSE(v3_math::swap_exact_out(1000, steep, deep, 3000, false).has_value());
        // selling token0 for a fixed output needs a few wei the forward step refuses
        REQUIRE_FALSE(v3_math::swap_exact_out(1000000, steep, deep, 3000, true).has_value());
    }
}
