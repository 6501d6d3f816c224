// SPDX-License-Identifier: Apache-2.0
#include "CleanupScheduler.hpp"

#include <core/Log.hpp>
#include <session/SessionManager.hpp>

#include <condition_variable>
#include <mutex>
#include <thread>

namespace mcprunner
{

struct CleanupScheduler::Impl
{
    SessionManager& manager;
    std::chrono::milliseconds interval;

    std::jthread worker;
    mutable std::mutex mutex;
    std::condition_variable_any cv;
    size_t passes = 0;

    void run(const std::stop_token& stopToken)
    {
        log::debug("Cleanup scheduler started (interval {})", interval);
        while (!stopToken.stop_requested())
        {
            {
                auto lock = std::unique_lock(mutex);
                // Wakes early only when a stop is requested.
                cv.wait_for(lock, stopToken, interval, [] { return false; });
                if (stopToken.stop_requested())
                    break;
            }

            auto const reclaimed = manager.reclaimIdle();
            if (reclaimed > 0)
                log::info("Cleanup reclaimed {} session(s)", reclaimed);

            auto lock = std::lock_guard(mutex);
            ++passes;
        }
        log::debug("Cleanup scheduler stopped");
    }
};

CleanupScheduler::CleanupScheduler(SessionManager& manager, std::chrono::milliseconds interval):
    _impl(std::make_unique<Impl>(manager, interval))
{
}

CleanupScheduler::~CleanupScheduler()
{
    stop();
}

void CleanupScheduler::start()
{
    if (_impl->worker.joinable())
        return;
    _impl->worker = std::jthread([this](const std::stop_token& token) { _impl->run(token); });
}

void CleanupScheduler::stop()
{
    if (!_impl->worker.joinable())
        return;
    _impl->worker.request_stop();
    _impl->worker.join();
}

auto CleanupScheduler::runOnce() -> size_t
{
    return _impl->manager.reclaimIdle();
}

auto CleanupScheduler::isRunning() const -> bool
{
    return _impl->worker.joinable();
}

auto CleanupScheduler::passes() const -> size_t
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->passes;
}

} // namespace mcprunner
