// arbscan - Event Decoding Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cctype>
#include <string>

#include "arbscan/events.hpp"

using namespace arbscan;
using json = nlohmann::json;

namespace {

const Address POOL = make_address(0x500);
const Address T0 = make_address(0x10);
const Address T1 = make_address(0x11);

std::string word(const std::string& hex) {
    return std::string(64 - hex.size(), '0') + hex;
}

// Two's-complement word whose low digits are `low`
std::string negative_word(const std::string& low) {
    return std::string(64 - low.size(), 'f') + low;
}

json make_log(std::string_view topic, const std::string& data) {
    return {
        {"address", to_hex(POOL)},
        {"topics", json::array({std::string(topic), "0x" + word("abc")})},
        {"data", "0x" + data},
        {"blockNumber", "0x1b4"},
        {"transactionHash", "0xdeadbeef"},
        {"logIndex", "0x0"},
        {"removed", false}
    };
}

// amount0 +1000, amount1 -500, sqrtPrice Q96, liquidity 1e6, tick -100
std::string swap_head() {
    return word("3e8") + negative_word("fe0c") + word("1" + std::string(24, '0')) +
           word("f4240") + negative_word("9c");
}

} // anonymous namespace

TEST_CASE("Subscription topics", "[events]") {
    REQUIRE(subscription_topics(true, false) == std::vector<std::string>{std::string(topics::SYNC)});
    REQUIRE(subscription_topics(false, true).size() == 2);
    REQUIRE(subscription_topics(true, true).size() == 3);
    REQUIRE(subscription_topics(false, false).empty());
}

TEST_CASE("Sync logs", "[events][v2]") {
    json log = make_log(topics::SYNC, word("3e8") + word("7d0"));

    auto event = decode_log(log);
    REQUIRE(event.has_value());
    REQUIRE(event->pool == POOL);
    REQUIRE(event->block_number == 436);
    REQUIRE(event->tx_hash == "0xdeadbeef");
    REQUIRE_FALSE(event->amount0.has_value());

    const auto& update = std::get<ReserveUpdate>(event->update);
    REQUIRE(update.reserve0 == 1000);
    REQUIRE(update.reserve1 == 2000);

    SECTION("Topic case does not matter") {
        std::string upper(topics::SYNC);
        std::transform(upper.begin() + 2, upper.end(), upper.begin() + 2,
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        log["topics"][0] = upper;
        REQUIRE(decode_log(log).has_value());
    }

    SECTION("Pending log without a block") {
        log["blockNumber"] = nullptr;
        auto pending = decode_log(log);
        REQUIRE(pending.has_value());
        REQUIRE(pending->block_number == 0);
    }

    SECTION("Wrong data size") {
        log["data"] = "0x" + word("3e8") + word("7d0") + word("1");
        REQUIRE_THROWS_AS(decode_log(log), DecodeError);
        log["data"] = "0x" + word("3e8");
        REQUIRE_THROWS_AS(decode_log(log), DecodeError);
    }
}

TEST_CASE("Swap logs", "[events][v3]") {
    SECTION("Uniswap layout") {
        auto event = decode_log(make_log(topics::UNISWAP_V3_SWAP, swap_head()));
        REQUIRE(event.has_value());

        const auto& update = std::get<PriceUpdate>(event->update);
        REQUIRE(update.sqrt_price_x96 == Q96);
        REQUIRE(update.liquidity == 1000000);
        REQUIRE(update.tick == -100);
        REQUIRE(*event->amount0 == 1000);
        REQUIRE(*event->amount1 == -500);
    }

    SECTION("PancakeSwap layout carries two protocol fee words") {
        auto event = decode_log(make_log(topics::PANCAKE_V3_SWAP, swap_head() + word("5") + word("6")));
        REQUIRE(event.has_value());
        REQUIRE(std::get<PriceUpdate>(event->update).tick == -100);
        REQUIRE(*event->amount1 == -500);
    }

    SECTION("Layouts are not interchangeable") {
        REQUIRE_THROWS_AS(decode_log(make_log(topics::PANCAKE_V3_SWAP, swap_head())), DecodeError);
        REQUIRE_THROWS_AS(decode_log(make_log(topics::UNISWAP_V3_SWAP, swap_head() + word("5") + word("6"))),
                          DecodeError);
    }

    SECTION("Out-of-range fields") {
        std::string amounts = word("3e8") + negative_word("fe0c");

        std::string wide_price = amounts + word("1" + std::string(40, '0')) + word("f4240") + word("0");
        REQUIRE_THROWS_AS(decode_log(make_log(topics::UNISWAP_V3_SWAP, wide_price)), DecodeError);

        std::string wide_liquidity = amounts + word("1" + std::string(24, '0')) +
                                     word("1" + std::string(32, '0')) + word("0");
        REQUIRE_THROWS_AS(decode_log(make_log(topics::UNISWAP_V3_SWAP, wide_liquidity)), DecodeError);

        std::string big_tick = amounts + word("1" + std::string(24, '0')) + word("f4240") + word("800000");
        REQUIRE_THROWS_AS(decode_log(make_log(topics::UNISWAP_V3_SWAP, big_tick)), DecodeError);
    }
}

TEST_CASE("Logs that are skipped or rejected", "[events]") {
    SECTION("Removed by a reorg") {
        json log = make_log(topics::SYNC, word("1") + word("2"));
        log["removed"] = true;
        REQUIRE_FALSE(decode_log(log).has_value());
    }

    SECTION("Removed flag of the wrong type") {
        for (const json& flag : {json(nullptr), json("true"), json(1)}) {
            json log = make_log(topics::SYNC, word("1") + word("2"));
            log["removed"] = flag;
            REQUIRE_THROWS_AS(decode_log(log), DecodeError);
        }

        json absent = make_log(topics::SYNC, word("1") + word("2"));
        absent.erase("removed");
        REQUIRE(decode_log(absent).has_value());
    }

    SECTION("Untracked topic") {
        json log = make_log("0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef", "");
        REQUIRE_FALSE(decode_log(log).has_value());
    }

    SECTION("Structural problems") {
        REQUIRE_THROWS_AS(decode_log(json::array()), DecodeError);

        json no_topics = make_log(topics::SYNC, word("1") + word("2"));
        no_topics.erase("topics");
        REQUIRE_THROWS_AS(decode_log(no_topics), DecodeError);

        json empty_topics = make_log(topics::SYNC, word("1") + word("2"));
        empty_topics["topics"] = json::array();
        REQUIRE_THROWS_AS(decode_log(empty_topics), DecodeError);

        json bad_address = make_log(topics::SYNC, word("1") + word("2"));
        bad_address["address"] = "0x1234";
        REQUIRE_THROWS_AS(decode_log(bad_address), DecodeError);

        json odd_data = make_log(topics::SYNC, word("1") + word("2") + "f");
        REQUIRE_THROWS_AS(decode_log(odd_data), DecodeError);

        json bad_block = make_log(topics::SYNC, word("1") + word("2"));
        bad_block["blockNumber"] = "0xzz";
        REQUIRE_THROWS_AS(decode_log(bad_block), DecodeError);
    }
}

TEST_CASE("Trigger derivation", "[events][trigger]") {
    SECTION("Reserve decrease on token0") {
        PoolState before = PoolState::v2(T0, T1, 25, 1000, 2000);
        StateChangeEvent event;
        event.pool = POOL;
        event.update = ReserveUpdate{900, 2100};
        event.block_number = 9;

        auto trigger = derive_trigger(event, before);
        REQUIRE(trigger.has_value());
        REQUIRE(trigger->token == T0);
        REQUIRE(trigger->amount == 100);
        REQUIRE(trigger->pool == POOL);
        REQUIRE(trigger->block_number == 9);
    }

    SECTION("Reserve decrease on token1") {
        PoolState before = PoolState::v2(T0, T1, 25, 1000, 2000);
        StateChangeEvent event;
        event.update = ReserveUpdate{1100, 1850};

        auto trigger = derive_trigger(event, before);
        REQUIRE(trigger->token == T1);
        REQUIRE(trigger->amount == 150);
    }

    SECTION("Both reserves fell: token0 wins") {
        PoolState before = PoolState::v2(T0, T1, 25, 1000, 2000);
        StateChangeEvent event;
        event.update = ReserveUpdate{990, 1500};

        auto trigger = derive_trigger(event, before);
        REQUIRE(trigger->token == T0);
        REQUIRE(trigger->amount == 10);
    }

    SECTION("Liquidity added") {
        PoolState before = PoolState::v2(T0, T1, 25, 1000, 2000);
        StateChangeEvent event;
        event.update = ReserveUpdate{1000, 2000};
        REQUIRE_FALSE(derive_trigger(event, before).has_value());
        event.update = ReserveUpdate{1500, 3000};
        REQUIRE_FALSE(derive_trigger(event, before).has_value());
    }

    SECTION("Swap paying out token1") {
        PoolState before = PoolState::v3(T0, T1, 500, Q96, 1000000, 0, 10);
        auto event = decode_log(make_log(topics::UNISWAP_V3_SWAP, swap_head()));

        auto trigger = derive_trigger(*event, before);
        REQUIRE(trigger.has_value());
        REQUIRE(trigger->token == T1);
        REQUIRE(trigger->amount == 500);
        REQUIRE(trigger->tx_hash == "0xdeadbeef");
    }

    SECTION("Swap paying out token0") {
        PoolState before = PoolState::v3(T0, T1, 500, Q96, 1000000, 0, 10);
        StateChangeEvent event;
        event.update = PriceUpdate{Q96, 1000000, 0};
        event.amount0 = I256(-42);
        event.amount1 = I256(50);

        auto trigger = derive_trigger(event, before);
        REQUIRE(trigger->token == T0);
        REQUIRE(trigger->amount == 42);
    }

    SECTION("Swap without a payout") {
        PoolState before = PoolState::v3(T0, T1, 500, Q96, 1000000, 0, 10);
        StateChangeEvent event;
        event.update = PriceUpdate{Q96, 1000000, 0};
        event.amount0 = I256(0);
        event.amount1 = I256(0);
        REQUIRE_FALSE(derive_trigger(event, before).has_value());
    }

    SECTION("Family mismatch") {
        PoolState v3 = PoolState::v3(T0, T1, 500, Q96, 1000000, 0, 10);
        StateChangeEvent sync;
        sync.update = ReserveUpdate{1, 1};
        REQUIRE_FALSE(derive_trigger(sync, v3).has_value());
    }
}
