/**
 * @file transport.hpp
 * @brief Capability interface the session consumes from the BLE stack
 *
 * One instance models one physical link. Scanning and radio management stay
 * in the application; the core only sees these calls.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "esp_err.h"
#include "trainer_types.hpp"

namespace trainer_link {

class Transport {
public:
    using FrameCallback = std::function<void(const uint8_t* data, size_t len)>;
    using SubscriptionHandle = uint32_t;

    static constexpr SubscriptionHandle INVALID_SUBSCRIPTION_ = 0;

    virtual ~Transport() = default;

    virtual esp_err_t Connect(const std::string& device_id) noexcept = 0;

    /// Service and characteristic discovery; fills the discovered service identifiers.
    virtual esp_err_t DiscoverServices(std::vector<BleUuid>& services) noexcept = 0;

    /// Valid after DiscoverServices.
    virtual bool HasCharacteristic(const BleUuid& service, const BleUuid& characteristic) const noexcept = 0;

    virtual esp_err_t Read(const BleUuid& service, const BleUuid& characteristic,
                           std::vector<uint8_t>& out) noexcept = 0;

    virtual esp_err_t Write(const BleUuid& service, const BleUuid& characteristic,
                            const uint8_t* data, size_t len, bool with_response) noexcept = 0;

    /// Enables notify / indicate and routes every frame to `on_frame`.
    virtual esp_err_t Subscribe(const BleUuid& service, const BleUuid& characteristic,
                                FrameCallback on_frame, SubscriptionHandle& out) noexcept = 0;

    virtual esp_err_t Unsubscribe(SubscriptionHandle handle) noexcept = 0;

    /// Must tolerate being called while not connected.
    virtual esp_err_t Disconnect() noexcept = 0;
};

} // namespace trainer_link
