#pragma once

/// @file signals.hpp
/// @brief Process termination signal interception

#include "fwd.hpp"

#include <sker/core/error.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace sker_kernel {

/// Turns SIGINT/SIGTERM into a callback run on a regular thread.
///
/// The signal handler itself only records the signal number; a watcher
/// thread picks it up and runs the callback once. Only one watcher may be
/// installed per process. Previous handlers are restored as soon as the
/// callback fires, so a second signal gets the default behaviour, and on
/// destruction otherwise.
class ShutdownSignalWatcher {
public:
    using Callback = std::function<void(int signal)>;

    /// Install handlers for @p signals
    /// @return AlreadyExists if another watcher is active
    [[nodiscard]] static sker_core::Result<std::unique_ptr<ShutdownSignalWatcher>> install(
        Callback callback,
        std::vector<int> signals = {SIGINT, SIGTERM});

    ~ShutdownSignalWatcher();

    ShutdownSignalWatcher(const ShutdownSignalWatcher&) = delete;
    ShutdownSignalWatcher& operator=(const ShutdownSignalWatcher&) = delete;

    /// True once the callback has been invoked
    [[nodiscard]] bool triggered() const noexcept { return m_triggered.load(); }

    /// Signal that triggered the callback, 0 if none
    [[nodiscard]] int received_signal() const noexcept { return m_received.load(); }

private:
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use install()
    ShutdownSignalWatcher(PrivateTag, Callback callback, std::vector<int> signals);

private:
    using SignalHandler = void (*)(int);

    void run();
    void restore_handlers();

    Callback m_callback;
    std::vector<int> m_signals;
    std::vector<SignalHandler> m_previous;
    std::thread m_thread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_stop_requested = false;
    bool m_handlers_restored = false;
    std::atomic<bool> m_triggered{false};
    std::atomic<int> m_received{0};
};

} // namespace sker_kernel
