#include <catch2/catch_test_macros.hpp>
#include "lucid/pipeline/bounded_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
using namespace lucid::pipeline;
TEST_CASE("BoundedQueue - FIFO Order", "[pipeline][queue]") {
    BoundedQueue<int> queue(4);
    REQUIRE(queue.Push(1));
    REQUIRE(queue.Push(2));
    REQUIRE(queue.Push(3));
    REQUIRE(queue.Size() == 3);
    REQUIRE(queue.Pop() == 1);
    REQUIRE(queue.Pop() == 2);
    REQUIRE(queue.Pop() == 3);
    REQUIRE(queue.Size() == 0);
}
TEST_CASE("BoundedQueue - Close", "[pipeline][queue]") {
    BoundedQueue<int> queue(4);
    REQUIRE(queue.Push(7));
    queue.Close();
    SECTION("Queued items drain after close") {
        REQUIRE(queue.Pop() == 7);
        REQUIRE_FALSE(queue.Pop().has_value());
    }
    SECTION("Push after close fails") {
        REQUIRE_FALSE(queue.Push(8));
    }
}
TEST_CASE("BoundedQueue - Cancel", "[pipeline][queue]") {
    BoundedQueue<int> queue(4);
    REQUIRE(queue.Push(1));
    REQUIRE(queue.Push(2));
    queue.Cancel();
    REQUIRE(queue.Size() == 0);
    REQUIRE_FALSE(queue.Pop().has_value());
    REQUIRE_FALSE(queue.Push(3));
}
TEST_CASE("BoundedQueue - Zero Capacity Is Treated As One", "[pipeline][queue]") {
    BoundedQueue<int> queue(0);
    REQUIRE(queue.Capacity() == 1);
}
TEST_CASE("BoundedQueue - Backpressure", "[pipeline][queue][concurrency]") {
    BoundedQueue<int> queue(2);
    REQUIRE(queue.Push(1));
    REQUIRE(queue.Push(2));

    SECTION("Full queue blocks the producer until a pop") {
        std::atomic<bool> pushed{false};
        std::thread producer([&] {
            REQUIRE(queue.Push(3));
            pushed = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        REQUIRE_FALSE(pushed.load());
        REQUIRE(queue.Pop() == 1);
        producer.join();
        REQUIRE(pushed.load());
        REQUIRE(queue.Size() == 2);
    }
    SECTION("Cancel releases a blocked producer") {
        std::atomic<bool> result{true};
        std::thread producer([&] { result = queue.Push(3); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.Cancel();
        producer.join();
        REQUIRE_FALSE(result.load());
    }
}
TEST_CASE("BoundedQueue - Producer and Consumer", "[pipeline][queue][concurrency]") {
    constexpr int ITEMS = 1000;
    BoundedQueue<int> queue(3);
    std::vector<int> received;
    std::thread consumer([&] {
        while (auto item = queue.Pop()) {
            received.push_back(*item);
        }
    });
    for (int i = 0; i < ITEMS; ++i) {
        REQUIRE(queue.Push(i));
    }
    queue.Close();
    consumer.join();
    REQUIRE(received.size() == ITEMS);
    for (int i = 0; i < ITEMS; ++i) {
        REQUIRE(received[static_cast<size_t>(i)] == i);
    }
}
