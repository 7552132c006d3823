/**
 * @file settle_waiter.hpp
 * @brief Waits out the settle delay that follows each command write
 */

#pragma once

#include <cstdint>

namespace trainer_link {

class SettleWaiter {
public:
    virtual ~SettleWaiter() = default;
    virtual void Wait(uint32_t ms) noexcept = 0;
};

/// Blocks the calling FreeRTOS task.
class TaskDelayWaiter : public SettleWaiter {
public:
    void Wait(uint32_t ms) noexcept override;
};

} // namespace trainer_link
