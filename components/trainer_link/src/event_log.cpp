/**
 * @file event_log.cpp
 * @brief Event history with esp_log mirroring
 */

#include "event_log.hpp"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"

#include <cstdio>
#include <utility>

namespace trainer_link {

namespace {

uint32_t tickClockMs()
{
    return static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
}

} // namespace

const char* ToString(Severity severity) noexcept
{
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Success: return "success";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

EventLog::EventLog(const char* tag, size_t capacity, ClockFn clock)
    : tag_(tag)
    , capacity_(capacity > 0 ? capacity : 1)
    , clock_(clock ? clock : tickClockMs)
{
}

void EventLog::Info(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    append(Severity::Info, fmt, args);
    va_end(args);
}

void EventLog::Success(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    append(Severity::Success, fmt, args);
    va_end(args);
}

void EventLog::Warning(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    append(Severity::Warning, fmt, args);
    va_end(args);
}

void EventLog::Error(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    append(Severity::Error, fmt, args);
    va_end(args);
}

void EventLog::append(Severity severity, const char* fmt, va_list args)
{
    char buf[MAX_MESSAGE_LEN_];
    vsnprintf(buf, sizeof(buf), fmt, args);

    switch (severity) {
        case Severity::Info:
        case Severity::Success:
            ESP_LOGI(tag_, "%s", buf);
            break;
        case Severity::Warning:
            ESP_LOGW(tag_, "%s", buf);
            break;
        case Severity::Error:
            ESP_LOGE(tag_, "%s", buf);
            break;
    }

    LogEntry entry;
    entry.timestamp_ms = clock_();
    entry.severity = severity;
    entry.message = buf;

    Callback cb;
    {
        MutexGuard lock(mutex_);
        entries_.push_back(entry);
        while (entries_.size() > capacity_) {
            entries_.pop_front();
        }
        cb = callback_;
    }

    // Outside the lock so the callback may query the log
    if (cb) {
        cb(entry);
    }
}

void EventLog::SetCallback(Callback cb)
{
    MutexGuard lock(mutex_);
    callback_ = std::move(cb);
}

void EventLog::SetCapacity(size_t capacity)
{
    MutexGuard lock(mutex_);
    capacity_ = capacity > 0 ? capacity : 1;
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
}

std::vector<LogEntry> EventLog::Snapshot() const
{
    MutexGuard lock(mutex_);
    return std::vector<LogEntry>(entries_.begin(), entries_.end());
}

void EventLog::Clear()
{
    MutexGuard lock(mutex_);
    entries_.clear();
}

size_t EventLog::Size() const
{
    MutexGuard lock(mutex_);
    return entries_.size();
}

} // namespace trainer_link
