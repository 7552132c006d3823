/**
 * @file event_log.hpp
 * @brief Bounded history of consumer-facing log events
 *
 * Each entry is mirrored to esp_log under the owner's tag and forwarded to the
 * optional callback. Safe to call from the transport's notification context.
 */

#pragma once

#include <cstdarg>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>
#include "rtos_mutex.hpp"

namespace trainer_link {

// Enum class: PascalCase
enum class Severity : uint8_t {
    Info = 0,
    Success,
    Warning,
    Error
};

const char* ToString(Severity severity) noexcept;

struct LogEntry {
    uint32_t    timestamp_ms = 0;
    Severity    severity = Severity::Info;
    std::string message;
};

class EventLog {
public:
    using Callback = std::function<void(const LogEntry& entry)>;
    using ClockFn = uint32_t (*)();

    static constexpr size_t DEFAULT_CAPACITY_ = 200;
    static constexpr size_t MAX_MESSAGE_LEN_ = 192;

    /// clock defaults to the FreeRTOS tick counter in ms.
    explicit EventLog(const char* tag, size_t capacity = DEFAULT_CAPACITY_,
                      ClockFn clock = nullptr);

    void Info(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void Success(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void Warning(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void Error(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

    void SetCallback(Callback cb);
    void SetCapacity(size_t capacity);

    std::vector<LogEntry> Snapshot() const;
    void Clear();
    size_t Size() const;

private:
    void append(Severity severity, const char* fmt, va_list args);

    const char*          tag_;
    size_t               capacity_;
    ClockFn              clock_;
    mutable RtosMutex    mutex_;
    std::deque<LogEntry> entries_;
    Callback             callback_;
};

} // namespace trainer_link
