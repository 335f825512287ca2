// === Clock ===================================================================
//
// Time source injected into the cache and the quota ledger so tests can drive
// expiry and window boundaries deterministically.

#pragma once

#include <memory>

#include "wx_gateway/types.hpp"

namespace wx_gateway {

/** @brief Abstract source of the current wall-clock time. */
class Clock {
  public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

/** @brief Clock backed by std::chrono::system_clock. */
class SystemClock final : public Clock {
  public:
    [[nodiscard]] TimePoint now() const override;
};

using ClockPtr = std::shared_ptr<const Clock>;

}  // namespace wx_gateway
