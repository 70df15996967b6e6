/// @file signals.cpp
/// @brief ShutdownSignalWatcher implementation

#include <sker/kernel/signals.hpp>
#include <sker/core/log.hpp>

#include <chrono>

namespace sker_kernel {

namespace {

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(20);

/// Written from the signal handler, read by the watcher thread
volatile std::sig_atomic_t g_pending_signal = 0;

std::atomic<bool> g_watcher_active{false};

void sker_shutdown_signal_handler(int signal) {
    g_pending_signal = signal;
}

} // anonymous namespace

sker_core::Result<std::unique_ptr<ShutdownSignalWatcher>> ShutdownSignalWatcher::install(
    Callback callback, std::vector<int> signals)
{
    if (!callback) {
        return sker_core::Err<std::unique_ptr<ShutdownSignalWatcher>>(
            sker_core::Error(sker_core::ErrorCode::InvalidArgument, "Signal callback is required"));
    }

    bool expected = false;
    if (!g_watcher_active.compare_exchange_strong(expected, true)) {
        return sker_core::Err<std::unique_ptr<ShutdownSignalWatcher>>(
            sker_core::Error(sker_core::ErrorCode::AlreadyExists, "A shutdown signal watcher is already installed"));
    }

    g_pending_signal = 0;
    return sker_core::Ok(std::make_unique<ShutdownSignalWatcher>(
        PrivateTag{}, std::move(callback), std::move(signals)));
}

ShutdownSignalWatcher::ShutdownSignalWatcher(PrivateTag, Callback callback, std::vector<int> signals)
    : m_callback(std::move(callback))
    , m_signals(std::move(signals))
{
    for (int sig : m_signals) {
        m_previous.push_back(std::signal(sig, &sker_shutdown_signal_handler));
    }

    m_thread = std::thread([this] { run(); });
    sker_core::lifecycle_logger()->debug("Shutdown signal watcher installed ({} signal(s))", m_signals.size());
}

ShutdownSignalWatcher::~ShutdownSignalWatcher() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop_requested = true;
    }
    m_cv.notify_all();
    if (m_thread.joinable()) {
        m_thread.join();
    }

    restore_handlers();

    g_pending_signal = 0;
    g_watcher_active.store(false);
}

void ShutdownSignalWatcher::restore_handlers() {
    if (m_handlers_restored) {
        return;
    }
    for (std::size_t i = 0; i < m_signals.size(); ++i) {
        SignalHandler previous = m_previous[i];
        std::signal(m_signals[i], previous == SIG_ERR ? SIG_DFL : previous);
    }
    m_handlers_restored = true;
}

void ShutdownSignalWatcher::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stop_requested) {
        m_cv.wait_for(lock, POLL_INTERVAL, [this] { return m_stop_requested; });

        int signal = g_pending_signal;
        if (signal == 0) {
            continue;
        }
        g_pending_signal = 0;

        if (m_triggered.load()) {
            continue;
        }
        m_received.store(signal);
        restore_handlers();
        m_triggered.store(true);

        lock.unlock();
        sker_core::lifecycle_logger()->info("Received signal {}. Starting graceful shutdown...", signal);
        auto result = sker_core::invoke_guarded([this, signal] { m_callback(signal); });
        if (!result) {
            sker_core::lifecycle_logger()->error("Graceful shutdown failed: {}", result.error().message());
        }
        lock.lock();
    }
}

} // namespace sker_kernel
