// =============================================================================
// Runnel - Message Queue Tests
// =============================================================================

#include <catch2/catch_all.hpp>
#include "core/threading/MessageQueue.h"
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace Runnel;

TEST_CASE("MessageQueue preserves FIFO order", "[core][queue]") {
    MessageQueue<int> queue;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(queue.push(int(i)));
    }
    REQUIRE(queue.size() == 5);

    int value = -1;
    for (int i = 0; i < 5; ++i) {
        REQUIRE(queue.tryPop(value));
        REQUIRE(value == i);
    }
    REQUIRE_FALSE(queue.tryPop(value));
}

TEST_CASE("MessageQueue moves move-only messages", "[core][queue]") {
    MessageQueue<std::unique_ptr<int>> queue;
    queue.push(std::make_unique<int>(42));

    std::vector<std::unique_ptr<int>> out;
    REQUIRE(queue.popAll(out) == 1);
    REQUIRE(out.size() == 1);
    REQUIRE(*out[0] == 42);
    REQUIRE(queue.size() == 0);
}

TEST_CASE("MessageQueue waitPopUntil times out when empty", "[core][queue]") {
    MessageQueue<int> queue;
    int value = 0;

    auto start = std::chrono::steady_clock::now();
    bool received = queue.waitPopUntil(value, start + std::chrono::milliseconds(20));
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(received);
    REQUIRE(elapsed >= std::chrono::milliseconds(20));
}

TEST_CASE("MessageQueue wakes a blocked consumer", "[core][queue]") {
    MessageQueue<int> queue;
    int value = 0;

    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        queue.push(7);
    });

    REQUIRE(queue.waitPop(value));
    REQUIRE(value == 7);
    producer.join();
}

TEST_CASE("MessageQueue close", "[core][queue]") {
    MessageQueue<int> queue;
    queue.push(1);
    queue.close();

    SECTION("Rejects new messages") {
        REQUIRE(queue.isClosed());
        REQUIRE_FALSE(queue.push(2));
    }

    SECTION("Delivers pending messages then stops blocking") {
        int value = 0;
        REQUIRE(queue.waitPop(value));
        REQUIRE(value == 1);
        REQUIRE_FALSE(queue.waitPop(value));
    }
}
