// SPDX-License-Identifier: Apache-2.0
#include "ToolCache.hpp"

#include <core/Log.hpp>

namespace mcprunner
{

ToolCache::ToolCache(std::chrono::seconds ttl, bool enabled, TimeSource now):
    _ttl(ttl), _enabled(enabled), _now(std::move(now))
{
}

auto ToolCache::get(const std::string& fingerprint) -> std::optional<std::vector<ToolDescriptor>>
{
    if (!_enabled)
        return std::nullopt;

    auto lock = std::scoped_lock(_mutex);
    auto it = _entries.find(fingerprint);
    if (it == _entries.end())
        return std::nullopt;

    if (_now() - it->second.storedAt >= _ttl)
    {
        log::debug("Tool cache entry expired");
        _entries.erase(it);
        return std::nullopt;
    }

    return it->second.tools;
}

void ToolCache::put(const std::string& fingerprint, std::vector<ToolDescriptor> tools)
{
    if (!_enabled)
        return;

    auto lock = std::scoped_lock(_mutex);
    _entries.insert_or_assign(fingerprint, Entry { .tools = std::move(tools), .storedAt = _now() });
}

void ToolCache::invalidate(const std::string& fingerprint)
{
    auto lock = std::scoped_lock(_mutex);
    _entries.erase(fingerprint);
}

void ToolCache::clear()
{
    auto lock = std::scoped_lock(_mutex);
    _entries.clear();
}

auto ToolCache::size() const -> size_t
{
    auto lock = std::scoped_lock(_mutex);
    return _entries.size();
}

} // namespace mcprunner
