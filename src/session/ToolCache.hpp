// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcprunner
{

/// @brief Tool lists keyed by server configuration fingerprint, each valid for a fixed TTL.
///
/// Shared by all sessions. Thread-safe. Two concurrent misses for the same fingerprint
/// may both perform discovery; the later put() wins.
class ToolCache
{
  public:
    /// @brief Constructs a cache.
    /// @param ttl How long an entry stays valid after put().
    /// @param enabled When false, get() always misses and put() does nothing.
    /// @param now Time source used for stamping and expiry.
    explicit ToolCache(std::chrono::seconds ttl = std::chrono::seconds { 300 },
                       bool enabled = true,
                       TimeSource now = systemTimeSource());

    /// @brief Returns the cached tool list if present and not expired; evicts expired entries.
    [[nodiscard]] auto get(const std::string& fingerprint) -> std::optional<std::vector<ToolDescriptor>>;

    /// @brief Stores or replaces the tool list for a fingerprint, stamped now.
    void put(const std::string& fingerprint, std::vector<ToolDescriptor> tools);

    /// @brief Removes the entry for a fingerprint, if any.
    void invalidate(const std::string& fingerprint);

    void clear();

    /// @brief Returns the number of stored entries (expired ones included until next read).
    [[nodiscard]] auto size() const -> size_t;

    [[nodiscard]] auto enabled() const noexcept -> bool { return _enabled; }
    [[nodiscard]] auto ttl() const noexcept -> std::chrono::seconds { return _ttl; }

  private:
    struct Entry
    {
        std::vector<ToolDescriptor> tools;
        Clock::time_point storedAt;
    };

    std::chrono::seconds _ttl;
    bool _enabled;
    TimeSource _now;

    mutable std::mutex _mutex;
    std::map<std::string, Entry> _entries;
};

} // namespace mcprunner
