#include <catch2/catch_all.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "../include/work_queue.hpp"

using maketorrent::create::WorkQueue;

TEST_CASE("WorkQueue: FIFO order for a single consumer") {
    WorkQueue<int> q(4);
    REQUIRE(q.push(1));
    REQUIRE(q.push(2));
    REQUIRE(q.push(3));
    CHECK(q.size() == 3);

    int v = 0;
    REQUIRE(q.pop(v)); CHECK(v == 1);
    REQUIRE(q.pop(v)); CHECK(v == 2);
    REQUIRE(q.pop(v)); CHECK(v == 3);
}

TEST_CASE("WorkQueue: close drains queued items, then pop returns false") {
    WorkQueue<int> q(4);
    q.push(7);
    q.push(8);
    q.close();

    CHECK_FALSE(q.push(9));

    int v = 0;
    REQUIRE(q.pop(v)); CHECK(v == 7);
    REQUIRE(q.pop(v)); CHECK(v == 8);
    CHECK_FALSE(q.pop(v));
}

TEST_CASE("WorkQueue: abort drops queued items") {
    WorkQueue<int> q(4);
    q.push(1);
    q.abort();

    int v = 0;
    CHECK_FALSE(q.pop(v));
    CHECK(q.size() == 0);
}

TEST_CASE("WorkQueue: close wakes a blocked consumer") {
    WorkQueue<int> q(1);
    std::atomic<bool> returned{false};
    bool got = true;

    std::thread consumer([&] {
        int v;
        got = q.pop(v);
        returned = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK_FALSE(returned.load());
    q.close();
    consumer.join();

    CHECK(returned.load());
    CHECK_FALSE(got);
}

TEST_CASE("WorkQueue: push blocks while full") {
    WorkQueue<int> q(2);
    q.push(1);
    q.push(2);

    std::atomic<bool> pushed{false};
    std::thread producer([&] {
        q.push(3);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK_FALSE(pushed.load());
    CHECK(q.size() == 2);

    int v = 0;
    REQUIRE(q.pop(v));
    producer.join();
    CHECK(pushed.load());
    CHECK(q.size() == 2);
}

TEST_CASE("WorkQueue: every item is delivered exactly once to many consumers") {
    constexpr int kItems = 5000;
    WorkQueue<int> q(8);
    std::vector<std::atomic<int>> seen(kItems);

    std::vector<std::thread> consumers;
    for (int t = 0; t < 4; ++t) {
        consumers.emplace_back([&] {
            int v;
            while (q.pop(v)) seen[v].fetch_add(1);
        });
    }
    for (int i = 0; i < kItems; ++i) REQUIRE(q.push(i));
    q.close();
    for (auto& c : consumers) c.join();

    for (int i = 0; i < kItems; ++i) CHECK(seen[i].load() == 1);
}

TEST_CASE("WorkQueue: zero capacity is rejected") {
    CHECK_THROWS_AS(WorkQueue<int>(0), std::invalid_argument);
}
