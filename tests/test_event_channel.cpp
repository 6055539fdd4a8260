#include <catch2/catch.hpp>

#include "lcu_companion/utils/event_channel.hpp"

#include <chrono>
#include <future>
#include <stop_token>
#include <thread>
#include <vector>

using lcu_companion::utils::EventChannel;

TEST_CASE("EventChannel - delivers in FIFO order", "[channel]") {
    EventChannel<int> channel;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(channel.push(i));
    }
    REQUIRE(channel.size() == 5);

    for (int i = 0; i < 5; ++i) {
        auto value = channel.try_pop();
        REQUIRE(value.has_value());
        REQUIRE(*value == i);
    }
    REQUIRE_FALSE(channel.try_pop().has_value());
}

TEST_CASE("EventChannel - close refuses producers but drains consumers", "[channel]") {
    EventChannel<int> channel;
    channel.push(1);
    channel.push(2);
    channel.close();

    REQUIRE(channel.is_closed());
    REQUIRE_FALSE(channel.push(3));

    REQUIRE(channel.pop() == 1);
    REQUIRE(channel.pop() == 2);
    REQUIRE_FALSE(channel.pop().has_value());
}

TEST_CASE("EventChannel - blocked consumer wakes up", "[channel][concurrency]") {
    EventChannel<int> channel;

    SECTION("On push") {
        auto consumer = std::async(std::launch::async, [&] { return channel.pop(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.push(42);
        REQUIRE(consumer.get() == 42);
    }

    SECTION("On close") {
        auto consumer = std::async(std::launch::async, [&] { return channel.pop(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.close();
        REQUIRE_FALSE(consumer.get().has_value());
    }

    SECTION("On stop request") {
        std::stop_source source;
        auto consumer = std::async(std::launch::async, [&] { return channel.pop(source.get_token()); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.request_stop();
        REQUIRE_FALSE(consumer.get().has_value());
    }
}

TEST_CASE("EventChannel - keeps per-producer order across threads", "[channel][concurrency]") {
    EventChannel<std::pair<int, int>> channel;
    constexpr int PRODUCERS = 4;
    constexpr int PER_PRODUCER = 500;

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&channel, p] {
            for (int i = 0; i < PER_PRODUCER; ++i) {
                channel.push({p, i});
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    channel.close();

    std::vector<int> next(PRODUCERS, 0);
    while (auto item = channel.pop()) {
        REQUIRE(item->second == next[item->first]);
        ++next[item->first];
    }
    REQUIRE(next == std::vector<int>(PRODUCERS, PER_PRODUCER));
}
