// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>

#include <atomic>
#include <chrono>
#include <memory>

namespace mcprunner::test
{

/// @brief Manually advanced clock; copies of source() observe every advance().
class FakeClock
{
  public:
    FakeClock(): _offset(std::make_shared<std::atomic<Clock::rep>>(0)) {}

    [[nodiscard]] auto source() const -> TimeSource
    {
        return [start = _start, offset = _offset] { return start + Clock::duration { offset->load() }; };
    }

    void advance(Clock::duration by) { *_offset += by.count(); }

  private:
    Clock::time_point _start = Clock::now();
    std::shared_ptr<std::atomic<Clock::rep>> _offset;
};

} // namespace mcprunner::test
