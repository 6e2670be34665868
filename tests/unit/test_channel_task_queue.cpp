///////////////////////////////////////////////////////////////////////////////////////////////////
/**
 * @file test_channel_task_queue.cpp
 * @brief Unit tests for the event channel and the background task queue
 */
///////////////////////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_all.hpp>
#include "test_helpers.h"

#include "util/channel.h"
#include "util/task_queue.h"

#include <condition_variable>
#include <stdexcept>

using namespace FlightBridge;
using namespace TestHelpers;

TEST_CASE("Channel", "[unit][channel]") {
    Channel<int> channel;

    SECTION("Items arrive in order") {
        channel.Send(1);
        channel.Send(2);
        REQUIRE(channel.Size() == 2);
        REQUIRE(channel.Receive() == std::optional<int>(1));
        REQUIRE(channel.TryReceive() == std::optional<int>(2));
        REQUIRE_FALSE(channel.TryReceive().has_value());
    }

    SECTION("Close drains before reporting the end") {
        channel.Send(7);
        channel.Close();
        REQUIRE_FALSE(channel.Send(8));
        REQUIRE(channel.Receive() == std::optional<int>(7));
        REQUIRE_FALSE(channel.Receive().has_value());
    }

    SECTION("Close wakes a blocked receiver") {
        std::optional<int> received = 99;
        std::thread consumer([&] { received = channel.Receive(); });
        SleepMs(20);
        channel.Close();
        consumer.join();
        REQUIRE_FALSE(received.has_value());
    }

    SECTION("Receive with a timeout") {
        REQUIRE_FALSE(channel.ReceiveFor(std::chrono::milliseconds(10)).has_value());
        channel.Send(3);
        REQUIRE(channel.ReceiveFor(std::chrono::milliseconds(10)) == std::optional<int>(3));
    }

    SECTION("Reset reopens and discards leftovers") {
        channel.Send(1);
        channel.Close();
        channel.Reset();
        REQUIRE_FALSE(channel.IsClosed());
        REQUIRE(channel.Size() == 0);
        REQUIRE(channel.Send(2));
    }
}

TEST_CASE("Task queue", "[unit][task_queue]") {
    SECTION("Tasks run in order on the worker") {
        std::mutex mutex;
        std::vector<int> order;
        TaskQueue queue("test");
        for (int i = 0; i < 5; ++i) {
            queue.Post([&, i] {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            });
        }
        queue.Stop();
        REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
    }

    SECTION("Stop runs what was queued and refuses new work") {
        std::atomic<int> ran{0};
        TaskQueue queue("test");
        queue.Post([&] { SleepMs(30); ++ran; });
        queue.Post([&] { ++ran; });
        queue.Stop();
        REQUIRE(ran.load() == 2);
        REQUIRE_FALSE(queue.Post([&] { ++ran; }));
        queue.Stop();
    }

    SECTION("A throwing task does not stop the worker") {
        std::atomic<bool> after{false};
        TaskQueue queue("test");
        queue.Post([] { throw std::runtime_error("task failed"); });
        queue.Post([&] { after = true; });
        queue.Stop();
        REQUIRE(after.load());
    }

    SECTION("Several workers run tasks side by side") {
        std::mutex mutex;
        std::condition_variable cv;
        bool released = false;
        std::atomic<bool> second_ran{false};

        TaskQueue queue("test", 2);
        queue.Post([&] {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [&] { return released; });
        });
        queue.Post([&] { second_ran = true; });

        REQUIRE(WaitFor([&] { return second_ran.load(); }));
        {
            std::lock_guard<std::mutex> lock(mutex);
            released = true;
        }
        cv.notify_all();
        queue.Stop();
    }
}
