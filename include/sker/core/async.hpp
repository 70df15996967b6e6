#pragma once

/// @file async.hpp
/// @brief Cooperative cancellation, tracked worker threads and timeout races

#include "fwd.hpp"
#include "error.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sker_core {

// =============================================================================
// CancellationToken
// =============================================================================

/// Shared cancellation flag. Copies observe the same state.
///
/// Cancelling never stops running work; it is a request that cooperative
/// work polls (is_cancelled) or sleeps on (wait_for).
class CancellationToken {
public:
    CancellationToken() : m_state(std::make_shared<State>()) {}

    /// Request cancellation. Const because the flag lives in the shared state.
    void cancel() const noexcept;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return m_state->cancelled.load(std::memory_order_acquire);
    }

    /// Block for up to @p duration or until cancelled.
    /// @return true if the token is cancelled
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> m_state;
};

// =============================================================================
// BackgroundTasks
// =============================================================================

/// Owns worker threads whose results may be abandoned by their caller.
/// The destructor joins everything still running.
class BackgroundTasks {
public:
    BackgroundTasks() = default;
    ~BackgroundTasks();

    BackgroundTasks(const BackgroundTasks&) = delete;
    BackgroundTasks& operator=(const BackgroundTasks&) = delete;

    /// Run @p work on a new tracked thread
    void spawn(std::function<void()> work);

    /// Join all tracked threads, including ones spawned while joining
    void join_all();

    /// Threads not yet finished
    [[nodiscard]] std::size_t active() const;

private:
    struct Task {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reap_finished();

    mutable std::mutex m_mutex;
    std::vector<Task> m_tasks;
};

// =============================================================================
// Timeout Race
// =============================================================================

/// Build the error returned when a race against the timer is lost
[[nodiscard]] Error timeout_error(std::chrono::milliseconds timeout);

/// Run @p work against a timer.
///
/// The work runs on a thread owned by @p tasks while the caller waits up to
/// @p timeout. If the timer wins, @p token is cancelled and a Timeout error
/// is returned; the work is left to finish in the background and its result
/// is discarded. A non-positive timeout runs the work inline with no timer.
template<typename T>
Result<T> run_with_timeout(
    BackgroundTasks& tasks,
    std::function<Result<T>()> work,
    std::chrono::milliseconds timeout,
    const CancellationToken& token)
{
    if (timeout.count() <= 0) {
        return invoke_guarded(work);
    }

    auto promise = std::make_shared<std::promise<Result<T>>>();
    auto future = promise->get_future();

    tasks.spawn([promise, work = std::move(work)]() mutable {
        promise->set_value(invoke_guarded(work));
    });

    if (future.wait_for(timeout) == std::future_status::ready) {
        return future.get();
    }

    token.cancel();
    return Result<T>(timeout_error(timeout));
}

} // namespace sker_core
