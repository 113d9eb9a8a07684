#include <catch2/catch_test_macros.hpp>

#include <mediafetch/common/event_channel.h>

#include <chrono>
#include <string>
#include <thread>

using mediafetch::EventChannel;

TEST_CASE("EventChannel preserves FIFO order", "[common][events]") {
    EventChannel<int> ch(8);
    CHECK(ch.empty());
    CHECK(ch.capacity() == 8);
    for (int i = 0; i < 5; ++i)
        REQUIRE(ch.try_push(i));
    CHECK(ch.size() == 5);

    for (int i = 0; i < 5; ++i) {
        int v = -1;
        REQUIRE(ch.try_pop(v));
        CHECK(v == i);
    }
    CHECK_FALSE(ch.try_pop().has_value());
}

TEST_CASE("EventChannel drops and counts events when full", "[common][events]") {
    EventChannel<std::string> ch(2);
    CHECK(ch.try_push(std::string("a")));
    CHECK(ch.try_push(std::string("b")));
    CHECK_FALSE(ch.try_push(std::string("c")));
    CHECK(ch.dropped() == 1);
    CHECK(ch.size() == 2);

    CHECK(ch.try_pop() == std::optional<std::string>("a"));
    CHECK(ch.try_push(std::string("d")));
    CHECK(ch.try_pop() == std::optional<std::string>("b"));
    CHECK(ch.try_pop() == std::optional<std::string>("d"));
}

TEST_CASE("EventChannel pop_for waits for a producer", "[common][events]") {
    EventChannel<int> ch(4);
    CHECK_FALSE(ch.pop_for(std::chrono::milliseconds(10)).has_value());

    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.try_push(42);
    });
    auto v = ch.pop_for(std::chrono::seconds(5));
    producer.join();
    REQUIRE(v.has_value());
    CHECK(*v == 42);
}
