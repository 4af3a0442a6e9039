// arbscan - Opportunity Channel Tests

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

#include "arbscan/channel.hpp"

using namespace arbscan;
using namespace std::chrono_literals;

namespace {

ArbitrageOpportunity opportunity(uint64_t block) {
    ArbitrageOpportunity opp;
    opp.trigger.block_number = block;
    return opp;
}

} // anonymous namespace

TEST_CASE("Channel ordering and close", "[channel]") {
    OpportunityChannel channel(4);
    REQUIRE(channel.capacity() == 4);

    SECTION("FIFO") {
        REQUIRE(channel.push(opportunity(1)));
        REQUIRE(channel.push(opportunity(2)));
        REQUIRE(channel.size() == 2);
        REQUIRE(channel.pop(0ms)->trigger.block_number == 1);
        REQUIRE(channel.pop(0ms)->trigger.block_number == 2);
        REQUIRE_FALSE(channel.pop(10ms).has_value());
    }

    SECTION("Close drains what is queued") {
        REQUIRE(channel.push(opportunity(7)));
        channel.close();

        REQUIRE(channel.closed());
        REQUIRE_FALSE(channel.drained());
        REQUIRE_FALSE(channel.push(opportunity(8)));

        auto last = channel.pop(0ms);
        REQUIRE(last.has_value());
        REQUIRE(last->trigger.block_number == 7);
        REQUIRE(channel.drained());
        REQUIRE_FALSE(channel.pop(0ms).has_value());
    }

    SECTION("Zero capacity still holds one") {
        OpportunityChannel tiny(0);
        REQUIRE(tiny.capacity() == 1);
        REQUIRE(tiny.push(opportunity(1)));
    }
}

TEST_CASE("Channel back-pressure", "[channel][concurrency]") {
    OpportunityChannel channel(1);
    REQUIRE(channel.push(opportunity(1)));

    SECTION("Full push waits for a pop") {
        std::atomic<bool> pushed{false};
        std::thread producer([&]() {
            pushed.store(channel.push(opportunity(2)));
        });

        std::this_thread::sleep_for(50ms);
        REQUIRE_FALSE(pushed.load());

        REQUIRE(channel.pop(1000ms)->trigger.block_number == 1);
        producer.join();
        REQUIRE(pushed.load());
        REQUIRE(channel.pop(0ms)->trigger.block_number == 2);
    }

    SECTION("Close releases a blocked producer") {
        std::atomic<bool> returned{false};
        bool result = true;
        std::thread producer([&]() {
            result = channel.push(opportunity(2));
            returned.store(true);
        });

        std::this_thread::sleep_for(50ms);
        channel.close();
        producer.join();
        REQUIRE(returned.load());
        REQUIRE_FALSE(result);
    }

    SECTION("Blocked consumer wakes on push") {
        REQUIRE(channel.pop(0ms).has_value());

        std::thread producer([&]() {
            std::this_thread::sleep_for(20ms);
            channel.push(opportunity(3));
        });
        auto got = channel.pop(2000ms);
        producer.join();
        REQUIRE(got.has_value());
        REQUIRE(got->trigger.block_number == 3);
    }
}
