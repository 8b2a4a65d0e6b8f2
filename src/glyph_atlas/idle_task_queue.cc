//
// Created by igor on 04/01/2026.
//

#include <glyph_atlas/idle_task_queue.hh>
#include <failsafe/logger.hh>
#include <exception>
#include <limits>
#include <utility>
#include <vector>

namespace glyph_atlas {
    // =============================================================================
    // idle_task_queue
    // =============================================================================
    idle_task_queue::idle_task_queue(idle_scheduler& scheduler)
        : m_scheduler(scheduler) {
    }

    idle_task_queue::~idle_task_queue() {
        clear();
    }

    void idle_task_queue::enqueue(task t) {
        m_tasks.push_back(std::move(t));
        schedule();
    }

    void idle_task_queue::clear() noexcept {
        m_tasks.clear();
        if (m_handle) {
            m_scheduler.cancel_idle_callback(*m_handle);
            m_handle.reset();
        }
    }

    void idle_task_queue::schedule() {
        if (m_handle || m_tasks.empty()) {
            return;
        }
        m_handle = m_scheduler.request_idle_callback([this](const idle_deadline& deadline) {
            process(deadline);
        });
    }

    void idle_task_queue::process(const idle_deadline& deadline) {
        m_handle.reset();

        while (!m_tasks.empty() && deadline.time_remaining()) {
            task next = std::move(m_tasks.front());
            m_tasks.pop_front();
            try {
                next();
            } catch (const std::exception& e) {
                LOG_WARN("Idle task failed:", e.what());
            }
        }

        schedule();
    }

    // =============================================================================
    // manual_idle_scheduler
    // =============================================================================
    idle_scheduler::handle manual_idle_scheduler::request_idle_callback(callback cb) {
        const handle h = m_next++;
        m_callbacks.emplace(h, std::move(cb));
        return h;
    }

    void manual_idle_scheduler::cancel_idle_callback(handle h) noexcept {
        m_callbacks.erase(h);
    }

    std::size_t manual_idle_scheduler::run_idle(std::chrono::steady_clock::duration budget) {
        clock_deadline deadline(std::chrono::steady_clock::now() + budget);
        return run(deadline);
    }

    std::size_t manual_idle_scheduler::run_idle_units(std::size_t units) {
        counted_deadline deadline(units);
        return run(deadline);
    }

    std::size_t manual_idle_scheduler::drain() {
        std::size_t total = 0;
        while (has_pending()) {
            total += run_idle_units(std::numeric_limits<std::size_t>::max());
        }
        return total;
    }

    std::size_t manual_idle_scheduler::run(const idle_deadline& deadline) {
        // Only callbacks pending right now; new requests wait for the next run
        std::vector<handle> due;
        due.reserve(m_callbacks.size());
        for (const auto& [h, cb] : m_callbacks) {
            due.push_back(h);
        }

        std::size_t ran = 0;
        for (handle h : due) {
            auto it = m_callbacks.find(h);
            if (it == m_callbacks.end()) {
                continue; // cancelled by an earlier callback
            }
            callback cb = std::move(it->second);
            m_callbacks.erase(it);
            cb(deadline);
            ++ran;
        }
        return ran;
    }
} // namespace glyph_atlas
