#include <gtest/gtest.h>
#include "utils/ring_buffer.hpp"
#include "utils/thread_pool.hpp"
#include "utils/time_format.hpp"
#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <thread>

using namespace voxplay::utils;

TEST(ThreadPoolTest, SimpleTask) {
    ThreadPool pool(2);
    auto fut = pool.enqueue([]() { return 42; });
    EXPECT_EQ(fut.get(), 42);
}

TEST(ThreadPoolTest, MultipleTasks) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.enqueue([i]() { return i * i; }));
    }
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ClearPendingDropsQueuedTasks) {
    ThreadPool pool(1);
    std::atomic<bool> release{false};
    std::atomic<int> ran{0};
    pool.enqueue([&]() {
        while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        ++ran;
    });
    for (int i = 0; i < 5; ++i) {
        pool.enqueue([&]() { ++ran; });
    }
    // The first task may still be waiting to be picked up.
    EXPECT_GE(pool.pending(), 5u);
    pool.clear_pending();
    EXPECT_EQ(pool.pending(), 0u);
    release = true;

    auto done = pool.enqueue([]() { return true; });
    EXPECT_TRUE(done.get());
    EXPECT_LE(ran.load(), 1);
}

TEST(ThreadPoolTest, StopAndQueue) {
    auto pool = std::make_unique<ThreadPool>(1);
    EXPECT_EQ(pool->size(), 1u);
    pool.reset(); // Destructor called, pool stopped.
}

TEST(RingBufferTest, PushPopPreservesOrder) {
    RingBuffer<int16_t> ring(8);
    int16_t in[5] = {1, 2, 3, 4, 5};
    EXPECT_EQ(ring.push(in, 5), 5u);
    EXPECT_EQ(ring.size(), 5u);
    EXPECT_EQ(ring.free_space(), 3u);

    int16_t out[5] = {};
    EXPECT_EQ(ring.pop(out, 3), 3u);
    EXPECT_EQ(out[0], 1);
    EXPECT_EQ(out[2], 3);
    EXPECT_EQ(ring.read_index(), 3u);
    EXPECT_EQ(ring.write_index(), 5u);
}

TEST(RingBufferTest, PushStopsWhenFullAndWraps) {
    RingBuffer<int16_t> ring(4);
    int16_t in[6] = {1, 2, 3, 4, 5, 6};
    EXPECT_EQ(ring.push(in, 6), 4u);

    int16_t out[4] = {};
    EXPECT_EQ(ring.pop(out, 2), 2u);
    EXPECT_EQ(ring.push(in + 4, 2), 2u);
    EXPECT_EQ(ring.pop(out, 4), 4u);
    EXPECT_EQ(out[0], 3);
    EXPECT_EQ(out[1], 4);
    EXPECT_EQ(out[2], 5);
    EXPECT_EQ(out[3], 6);
    EXPECT_EQ(ring.pop(out, 1), 0u);
}

TEST(RingBufferTest, DiscardUntilClampsToWriteIndex) {
    RingBuffer<int16_t> ring(16);
    int16_t in[10] = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    ring.push(in, 10);

    ring.discard_until(7);
    int16_t out[1] = {};
    ASSERT_EQ(ring.pop(out, 1), 1u);
    EXPECT_EQ(out[0], 7);

    ring.discard_until(100);
    EXPECT_EQ(ring.size(), 0u);
    EXPECT_EQ(ring.read_index(), 10u);

    // Never moves backwards.
    ring.discard_until(2);
    EXPECT_EQ(ring.read_index(), 10u);
}

TEST(RingBufferTest, ConcurrentProducerConsumer) {
    RingBuffer<int32_t> ring(64);
    constexpr int32_t kCount = 20000;
    std::thread producer([&]() {
        int32_t next = 0;
        while (next < kCount) {
            if (ring.push(&next, 1) == 1) ++next;
        }
    });

    int32_t expected = 0;
    bool ordered = true;
    while (expected < kCount) {
        int32_t v;
        if (ring.pop(&v, 1) == 1) {
            if (v != expected) ordered = false;
            ++expected;
        }
    }
    producer.join();
    EXPECT_TRUE(ordered);
}

TEST(TimeFormatTest, MinutesAndSeconds) {
    EXPECT_EQ(format_duration(0.0), "00:00");
    EXPECT_EQ(format_duration(5.9), "00:05");
    EXPECT_EQ(format_duration(65.0), "01:05");
    EXPECT_EQ(format_duration(3599.0), "59:59");
}

TEST(TimeFormatTest, HoursFromOneHour) {
    EXPECT_EQ(format_duration(3600.0), "01:00:00");
    EXPECT_EQ(format_duration(3723.0), "01:02:03");
}

TEST(TimeFormatTest, InvalidInputPrintsZero) {
    EXPECT_EQ(format_duration(-3.0), "00:00");
    EXPECT_EQ(format_duration(std::nan("")), "00:00");
}

TEST(TimeFormatTest, Progress) {
    EXPECT_EQ(format_progress(65.0, 180.0), "01:05 / 03:00");
}
