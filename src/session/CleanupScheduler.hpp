// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <memory>

namespace mcprunner
{

class SessionManager;

/// @brief Periodically reclaims idle and failed sessions of a SessionManager.
///
/// Runs SessionManager::reclaimIdle() on a background thread every interval.
/// The manager must outlive the scheduler.
class CleanupScheduler
{
  public:
    explicit CleanupScheduler(SessionManager& manager,
                              std::chrono::milliseconds interval = std::chrono::seconds { 60 });
    ~CleanupScheduler();

    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;

    /// @brief Starts the background loop. Does nothing if already running.
    void start();

    /// @brief Stops the background loop and waits for a pass in progress to finish.
    void stop();

    /// @brief Runs one reclamation pass on the calling thread.
    /// @return The number of sessions stopped.
    auto runOnce() -> size_t;

    [[nodiscard]] auto isRunning() const -> bool;

    /// @brief Returns the number of passes the background loop has completed.
    [[nodiscard]] auto passes() const -> size_t;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace mcprunner
