/**
 * @file rtos_mutex.hpp
 * @brief Statically allocated FreeRTOS mutex and its scoped guard
 */
#pragma once

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

namespace trainer_link {

/**
 * @brief FreeRTOS mutex backed by static storage, so creation cannot fail.
 *
 * Not recursive: a task that already holds it must not take it again.
 */
class RtosMutex {
public:
    RtosMutex() noexcept : handle_(xSemaphoreCreateMutexStatic(&storage_)) {}
    ~RtosMutex() { vSemaphoreDelete(handle_); }

    RtosMutex(const RtosMutex&) = delete;
    RtosMutex& operator=(const RtosMutex&) = delete;

    // portMAX_DELAY blocks until the mutex is available
    void Lock() noexcept { (void)xSemaphoreTake(handle_, portMAX_DELAY); }
    void Unlock() noexcept { (void)xSemaphoreGive(handle_); }

private:
    StaticSemaphore_t storage_;
    SemaphoreHandle_t handle_;
};

/// Holds an RtosMutex for the lifetime of the guard.
class MutexGuard {
public:
    explicit MutexGuard(RtosMutex& mutex) noexcept : mutex_(mutex) { mutex_.Lock(); }
    ~MutexGuard() { mutex_.Unlock(); }

    MutexGuard(const MutexGuard&) = delete;
    MutexGuard& operator=(const MutexGuard&) = delete;

private:
    RtosMutex& mutex_;
};

} // namespace trainer_link
