//
// Created by igor on 04/01/2026.
//
// Unit tests for idle_task_queue and manual_idle_scheduler
//

#include <doctest/doctest.h>
#include <glyph_atlas/idle_task_queue.hh>
#include <stdexcept>
#include <vector>

using namespace glyph_atlas;

TEST_SUITE("idle_task_queue") {

    TEST_CASE("counted_deadline") {
        counted_deadline deadline(2);
        CHECK(deadline.time_remaining());
        CHECK(deadline.time_remaining());
        CHECK_FALSE(deadline.time_remaining());
    }

    TEST_CASE("tasks run in order across idle slices") {
        manual_idle_scheduler scheduler;
        idle_task_queue queue(scheduler);
        std::vector<int> ran;

        for (int i = 0; i < 5; ++i) {
            queue.enqueue([&ran, i] { ran.push_back(i); });
        }
        CHECK(queue.pending() == 5);
        CHECK(ran.empty());  // nothing runs until the host is idle
        CHECK(scheduler.pending_callbacks() == 1);

        CHECK(scheduler.run_idle_units(2) == 1);
        CHECK(ran == std::vector<int>{0, 1});
        CHECK(queue.pending() == 3);
        CHECK(scheduler.has_pending());

        scheduler.run_idle_units(10);
        CHECK(ran == std::vector<int>{0, 1, 2, 3, 4});
        CHECK(queue.pending() == 0);
        CHECK_FALSE(scheduler.has_pending());
    }

    TEST_CASE("expired clock deadline runs nothing") {
        manual_idle_scheduler scheduler;
        idle_task_queue queue(scheduler);
        int ran = 0;
        queue.enqueue([&ran] { ++ran; });

        scheduler.run_idle(std::chrono::steady_clock::duration::zero());
        CHECK(ran == 0);
        CHECK(queue.pending() == 1);
        CHECK(scheduler.has_pending());

        scheduler.run_idle(std::chrono::seconds(10));
        CHECK(ran == 1);
    }

    TEST_CASE("clear drops pending tasks") {
        manual_idle_scheduler scheduler;
        idle_task_queue queue(scheduler);
        int ran = 0;
        queue.enqueue([&ran] { ++ran; });
        queue.enqueue([&ran] { ++ran; });

        scheduler.run_idle_units(1);
        CHECK(ran == 1);

        queue.clear();
        CHECK(queue.pending() == 0);
        CHECK_FALSE(scheduler.has_pending());
        scheduler.drain();
        CHECK(ran == 1);

        // Usable after clear
        queue.enqueue([&ran] { ++ran; });
        scheduler.drain();
        CHECK(ran == 2);
    }

    TEST_CASE("clear from a running task") {
        manual_idle_scheduler scheduler;
        idle_task_queue queue(scheduler);
        int ran = 0;
        queue.enqueue([&] { ++ran; queue.clear(); });
        queue.enqueue([&ran] { ++ran; });

        scheduler.drain();
        CHECK(ran == 1);
        CHECK_FALSE(scheduler.has_pending());
    }

    TEST_CASE("failing task does not stop the queue") {
        manual_idle_scheduler scheduler;
        idle_task_queue queue(scheduler);
        std::vector<int> ran;
        queue.enqueue([&ran] { ran.push_back(1); });
        queue.enqueue([] { throw std::runtime_error("boom"); });
        queue.enqueue([&ran] { ran.push_back(3); });

        CHECK_NOTHROW(scheduler.drain());
        CHECK(ran == std::vector<int>{1, 3});
    }

    TEST_CASE("tasks enqueued while running wait for the next slice") {
        manual_idle_scheduler scheduler;
        idle_task_queue first(scheduler);
        idle_task_queue second(scheduler);
        std::vector<int> ran;

        first.enqueue([&] {
            ran.push_back(1);
            second.enqueue([&ran] { ran.push_back(2); });
        });

        CHECK(scheduler.run_idle_units(100) == 1);
        CHECK(ran == std::vector<int>{1});
        CHECK(scheduler.has_pending());

        scheduler.run_idle_units(100);
        CHECK(ran == std::vector<int>{1, 2});
    }

    TEST_CASE("destruction cancels the idle callback") {
        manual_idle_scheduler scheduler;
        int ran = 0;
        {
            idle_task_queue queue(scheduler);
            queue.enqueue([&ran] { ++ran; });
            CHECK(scheduler.has_pending());
        }
        CHECK_FALSE(scheduler.has_pending());
        scheduler.drain();
        CHECK(ran == 0);
    }

    TEST_CASE("cancel unknown handle is ignored") {
        manual_idle_scheduler scheduler;
        auto h = scheduler.request_idle_callback([](const idle_deadline&) {});
        scheduler.cancel_idle_callback(h + 100);
        CHECK(scheduler.pending_callbacks() == 1);
        scheduler.cancel_idle_callback(h);
        CHECK_FALSE(scheduler.has_pending());
    }
}
