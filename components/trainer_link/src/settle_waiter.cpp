/**
 * @file settle_waiter.cpp
 * @brief FreeRTOS settle delay
 */

#include "settle_waiter.hpp"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

namespace trainer_link {

void TaskDelayWaiter::Wait(uint32_t ms) noexcept
{
    if (ms == 0) return;
    vTaskDelay(pdMS_TO_TICKS(ms));
}

} // namespace trainer_link
