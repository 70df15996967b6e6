/// @file async.cpp
/// @brief CancellationToken and BackgroundTasks implementation

#include <sker/core/async.hpp>
#include <sker/core/log.hpp>
#include <algorithm>

namespace sker_core {

// =============================================================================
// CancellationToken
// =============================================================================

void CancellationToken::cancel() const noexcept {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->cancelled.store(true, std::memory_order_release);
    }
    m_state->cv.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    return m_state->cv.wait_for(lock, duration, [this] {
        return m_state->cancelled.load(std::memory_order_acquire);
    });
}

// =============================================================================
// BackgroundTasks
// =============================================================================

BackgroundTasks::~BackgroundTasks() {
    join_all();
}

void BackgroundTasks::spawn(std::function<void()> work) {
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::thread thread([work = std::move(work), done]() {
        try {
            work();
        } catch (const std::exception& e) {
            SKER_LOG_ERROR("Background task failed: {}", e.what());
        }
        done->store(true, std::memory_order_release);
    });

    std::lock_guard<std::mutex> lock(m_mutex);
    reap_finished();
    m_tasks.push_back(Task{std::move(thread), std::move(done)});
}

void BackgroundTasks::join_all() {
    for (;;) {
        std::vector<Task> pending;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            pending.swap(m_tasks);
        }
        if (pending.empty()) {
            return;
        }
        for (auto& task : pending) {
            if (task.thread.joinable()) {
                task.thread.join();
            }
        }
    }
}

std::size_t BackgroundTasks::active() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<std::size_t>(std::count_if(m_tasks.begin(), m_tasks.end(),
        [](const Task& task) { return !task.done->load(std::memory_order_acquire); }));
}

/// Join threads that already finished so the list does not grow unbounded (lock held)
void BackgroundTasks::reap_finished() {
    auto it = std::partition(m_tasks.begin(), m_tasks.end(),
        [](const Task& task) { return !task.done->load(std::memory_order_acquire); });
    for (auto finished = it; finished != m_tasks.end(); ++finished) {
        if (finished->thread.joinable()) {
            finished->thread.join();
        }
    }
    m_tasks.erase(it, m_tasks.end());
}

// =============================================================================
// Timeout Race
// =============================================================================

Error timeout_error(std::chrono::milliseconds timeout) {
    Error err(ErrorCode::Timeout, "Operation timed out after " + std::to_string(timeout.count()) + "ms");
    err.with_context("timeout_ms", std::to_string(timeout.count()));
    return err;
}

} // namespace sker_core
