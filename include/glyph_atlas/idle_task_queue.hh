/**
 * @file idle_task_queue.hh
 * @brief Cooperative background work that runs only when the host is idle.
 *
 * Warming up an atlas means thousands of rasterization calls. Running
 * them in one burst would stall the render loop, so they are split into
 * small tasks and fed to an idle_task_queue. The queue asks its
 * idle_scheduler for an idle slice, runs tasks while the slice's
 * deadline has time left, then yields and asks again.
 *
 * @section idle_overview Overview
 *
 * | Class | Purpose |
 * |-------|---------|
 * | idle_deadline | Tells a running callback whether it may keep going |
 * | idle_scheduler | Host hook that grants idle slices |
 * | idle_task_queue | FIFO of tasks drained during idle slices |
 * | manual_idle_scheduler | Scheduler pumped explicitly by the host loop |
 *
 * @section idle_usage Usage
 *
 * @code{.cpp}
 * manual_idle_scheduler scheduler;
 * idle_task_queue queue(scheduler);
 *
 * queue.enqueue([] { expensive_step(1); });
 * queue.enqueue([] { expensive_step(2); });
 *
 * // In the host loop, after the frame is presented:
 * scheduler.run_idle(std::chrono::milliseconds(4));
 * @endcode
 *
 * @author Igor
 * @date 04/01/2026
 */

#pragma once

#include <glyph_atlas/export.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>

namespace glyph_atlas {
    /**
     * @brief Budget of an idle slice.
     */
    class GLYPH_ATLAS_EXPORT idle_deadline {
    public:
        virtual ~idle_deadline() = default;

        /**
         * @brief Whether another unit of work may start.
         *
         * Called once before every task; implementations may count calls.
         */
        [[nodiscard]] virtual bool time_remaining() const = 0;
    };

    /**
     * @brief Deadline at a fixed point in time.
     */
    class GLYPH_ATLAS_EXPORT clock_deadline final : public idle_deadline {
    public:
        explicit clock_deadline(std::chrono::steady_clock::time_point end) noexcept
            : m_end(end) {
        }

        [[nodiscard]] bool time_remaining() const override {
            return std::chrono::steady_clock::now() < m_end;
        }

    private:
        std::chrono::steady_clock::time_point m_end;
    };

    /**
     * @brief Deadline that allows a fixed number of units.
     *
     * Deterministic, which makes it the deadline of choice for tests and
     * for hosts that budget by work rather than time.
     */
    class GLYPH_ATLAS_EXPORT counted_deadline final : public idle_deadline {
    public:
        explicit counted_deadline(std::size_t units) noexcept
            : m_remaining(units) {
        }

        [[nodiscard]] bool time_remaining() const override {
            if (m_remaining == 0) {
                return false;
            }
            --m_remaining;
            return true;
        }

    private:
        mutable std::size_t m_remaining;
    };

    /**
     * @brief Host hook granting idle slices.
     */
    class GLYPH_ATLAS_EXPORT idle_scheduler {
    public:
        using callback = std::function<void(const idle_deadline&)>;
        using handle = std::uint64_t;

        virtual ~idle_scheduler() = default;

        /**
         * @brief Run the callback once, the next time the host is idle.
         * @return Handle for cancel_idle_callback()
         */
        virtual handle request_idle_callback(callback cb) = 0;

        /// Cancel a pending callback; unknown handles are ignored
        virtual void cancel_idle_callback(handle h) noexcept = 0;
    };

    /**
     * @brief FIFO of tasks drained during idle slices.
     *
     * Tasks run one at a time in enqueue order. A task that throws a
     * std::exception is logged and dropped; the next one still runs.
     *
     * @warning The scheduler must outlive the queue.
     */
    class GLYPH_ATLAS_EXPORT idle_task_queue {
    public:
        using task = std::function<void()>;

        explicit idle_task_queue(idle_scheduler& scheduler);
        ~idle_task_queue();

        idle_task_queue(const idle_task_queue&) = delete;
        idle_task_queue& operator=(const idle_task_queue&) = delete;

        /// Append a task and request an idle slice if none is pending
        void enqueue(task t);

        /**
         * @brief Drop every task that has not started yet.
         *
         * A task that is currently running is not interrupted.
         */
        void clear() noexcept;

        /// Number of tasks not yet started
        [[nodiscard]] std::size_t pending() const noexcept { return m_tasks.size(); }

    private:
        void schedule();
        void process(const idle_deadline& deadline);

        idle_scheduler& m_scheduler;
        std::deque<task> m_tasks;
        std::optional<idle_scheduler::handle> m_handle;
    };

    /**
     * @brief Idle scheduler driven by explicit calls from the host loop.
     *
     * Callbacks requested while a run is in progress are deferred to the
     * next run, so a single run_idle() call always terminates.
     */
    class GLYPH_ATLAS_EXPORT manual_idle_scheduler final : public idle_scheduler {
    public:
        handle request_idle_callback(callback cb) override;
        void cancel_idle_callback(handle h) noexcept override;

        /**
         * @brief Run the pending callbacks with a time budget.
         * @return Number of callbacks run
         */
        std::size_t run_idle(std::chrono::steady_clock::duration budget);

        /**
         * @brief Run the pending callbacks allowing at most @p units tasks.
         * @return Number of callbacks run
         */
        std::size_t run_idle_units(std::size_t units);

        /**
         * @brief Run until no callback is pending.
         * @return Number of callbacks run
         */
        std::size_t drain();

        [[nodiscard]] bool has_pending() const noexcept { return !m_callbacks.empty(); }
        [[nodiscard]] std::size_t pending_callbacks() const noexcept { return m_callbacks.size(); }

    private:
        std::size_t run(const idle_deadline& deadline);

        handle m_next = 1;
        std::map<handle, callback> m_callbacks;
    };
} // namespace glyph_atlas
