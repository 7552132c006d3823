/**
 * @file fakes.hpp
 * @brief Scripted transport, recording waiter and deterministic RNG for host tests
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include "settle_waiter.hpp"
#include "transport.hpp"
#include "trainer_types.hpp"

namespace trainer_link {
namespace test {

struct WriteRecord {
    BleUuid              service;
    BleUuid              characteristic;
    std::vector<uint8_t> bytes;
    bool                 with_response;
};

struct Attribute {
    BleUuid              service;
    BleUuid              characteristic;
    std::vector<uint8_t> value;
};

class FakeTransport : public Transport {
public:
    // Scripted results
    esp_err_t connect_result   = ESP_OK;
    esp_err_t discover_result  = ESP_OK;
    esp_err_t read_result      = ESP_OK;
    esp_err_t write_result     = ESP_OK;
    esp_err_t subscribe_result = ESP_OK;

    std::vector<BleUuid>   services;
    std::vector<Attribute> attributes;   // every characteristic the peer exposes

    // Runs inside Connect before it returns, e.g. to race a teardown against it
    std::function<void()> on_connect;

    // Observations
    std::vector<WriteRecord> writes;
    int connect_calls = 0;
    int disconnect_calls = 0;
    int unsubscribe_calls = 0;
    bool link_up = false;

    void AddCharacteristic(const BleUuid& service, const BleUuid& characteristic,
                           std::vector<uint8_t> value = {})
    {
        attributes.push_back(Attribute{service, characteristic, std::move(value)});
    }

    esp_err_t Connect(const std::string& device_id) noexcept override
    {
        (void)device_id;
        ++connect_calls;
        if (on_connect) on_connect();
        if (connect_result == ESP_OK) link_up = true;
        return connect_result;
    }

    esp_err_t DiscoverServices(std::vector<BleUuid>& out) noexcept override
    {
        if (discover_result != ESP_OK) return discover_result;
        out = services;
        return ESP_OK;
    }

    bool HasCharacteristic(const BleUuid& service, const BleUuid& characteristic) const noexcept override
    {
        return find(service, characteristic) != nullptr;
    }

    esp_err_t Read(const BleUuid& service, const BleUuid& characteristic,
                   std::vector<uint8_t>& out) noexcept override
    {
        if (read_result != ESP_OK) return read_result;
        const Attribute* a = find(service, characteristic);
        if (a == nullptr) return ESP_ERR_NOT_FOUND;
        out = a->value;
        return ESP_OK;
    }

    esp_err_t Write(const BleUuid& service, const BleUuid& characteristic,
                    const uint8_t* data, size_t len, bool with_response) noexcept override
    {
        writes.push_back(WriteRecord{service, characteristic,
                                     std::vector<uint8_t>(data, data + len), with_response});
        return write_result;
    }

    esp_err_t Subscribe(const BleUuid& service, const BleUuid& characteristic,
                        FrameCallback on_frame, SubscriptionHandle& out) noexcept override
    {
        if (subscribe_result != ESP_OK) return subscribe_result;
        if (find(service, characteristic) == nullptr) return ESP_ERR_NOT_FOUND;
        subs_.push_back(Sub{next_handle_, service, characteristic, std::move(on_frame), true});
        out = next_handle_++;
        return ESP_OK;
    }

    esp_err_t Unsubscribe(SubscriptionHandle handle) noexcept override
    {
        ++unsubscribe_calls;
        for (auto& s : subs_) {
            if (s.handle == handle) s.active = false;
        }
        return ESP_OK;
    }

    esp_err_t Disconnect() noexcept override
    {
        ++disconnect_calls;
        link_up = false;
        return ESP_OK;
    }

    /// Delivers a frame to every active subscriber; returns how many were reached.
    int Notify(const BleUuid& service, const BleUuid& characteristic, std::vector<uint8_t> frame)
    {
        int reached = 0;
        for (auto& s : subs_) {
            if (!s.active || s.service != service || s.characteristic != characteristic) continue;
            s.on_frame(frame.data(), frame.size());
            ++reached;
        }
        return reached;
    }

    /// Same, ignoring unsubscription: models a frame already queued in the stack.
    int NotifyStale(const BleUuid& service, const BleUuid& characteristic, std::vector<uint8_t> frame)
    {
        int reached = 0;
        for (auto& s : subs_) {
            if (s.service != service || s.characteristic != characteristic) continue;
            s.on_frame(frame.data(), frame.size());
            ++reached;
        }
        return reached;
    }

    size_t ActiveSubscriptions() const
    {
        size_t n = 0;
        for (const auto& s : subs_) {
            if (s.active) ++n;
        }
        return n;
    }

private:
    struct Sub {
        SubscriptionHandle handle;
        BleUuid            service;
        BleUuid            characteristic;
        FrameCallback      on_frame;
        bool               active;
    };

    const Attribute* find(const BleUuid& service, const BleUuid& characteristic) const noexcept
    {
        for (const auto& a : attributes) {
            if (a.service == service && a.characteristic == characteristic) return &a;
        }
        return nullptr;
    }

    std::vector<Sub>   subs_;
    SubscriptionHandle next_handle_ = 1;
};

class RecordingWaiter : public SettleWaiter {
public:
    std::vector<uint32_t> waits;
    std::function<void(uint32_t ms)> on_wait;   // stands in for time passing

    void Wait(uint32_t ms) noexcept override
    {
        waits.push_back(ms);
        if (on_wait) on_wait(ms);
    }
};

/// 1, 2, 3 ... so challenges are reproducible.
inline void CountingFill(void* buf, size_t len)
{
    auto* p = static_cast<uint8_t*>(buf);
    for (size_t i = 0; i < len; ++i) {
        p[i] = static_cast<uint8_t>(i + 1);
    }
}

inline uint32_t FixedClock()
{
    return 1234;
}

/// Clock the test advances by hand.
inline uint32_t& FakeNow()
{
    static uint32_t now = 0;
    return now;
}

inline uint32_t ManualClock()
{
    return FakeNow();
}

} // namespace test
} // namespace trainer_link
