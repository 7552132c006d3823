/**
 * @file nimble_transport.hpp
 * @brief NimBLE central implementation of trainer_link::Transport
 *
 * One connection at a time. Every GATT procedure is run synchronously: the
 * caller blocks on a semaphore released from the NimBLE host task.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "host/ble_hs.h"
#include "rtos_mutex.hpp"
#include "transport.hpp"

namespace ble {

// Constants: UPPER_CASE + trailing underscore
static constexpr uint32_t PROC_TIMEOUT_MS_    = 5000;
static constexpr uint32_t CONNECT_TIMEOUT_MS_ = 10000;
static constexpr uint16_t PREFERRED_MTU_      = 185;

struct ScanResult {
    std::string id;     // "aa:bb:cc:dd:ee:ff"
    std::string name;
    int8_t      rssi = 0;
};

using NameFilter = std::function<bool(const std::string& name)>;

/// Starts the NimBLE host task and waits for the host/controller sync.
esp_err_t InitHost() noexcept;

class NimbleTransport final : public trainer_link::Transport {
public:
    NimbleTransport() noexcept;
    ~NimbleTransport() override;

    NimbleTransport(const NimbleTransport&) = delete;
    NimbleTransport& operator=(const NimbleTransport&) = delete;

    /// Active scan until an advertised name passes `accept` or the timeout expires.
    esp_err_t Scan(const NameFilter& accept, uint32_t timeout_ms, ScanResult& out) noexcept;

    esp_err_t Connect(const std::string& device_id) noexcept override;
    esp_err_t DiscoverServices(std::vector<trainer_link::BleUuid>& services) noexcept override;
    bool HasCharacteristic(const trainer_link::BleUuid& service,
                           const trainer_link::BleUuid& characteristic) const noexcept override;
    esp_err_t Read(const trainer_link::BleUuid& service, const trainer_link::BleUuid& characteristic,
                   std::vector<uint8_t>& out) noexcept override;
    esp_err_t Write(const trainer_link::BleUuid& service, const trainer_link::BleUuid& characteristic,
                    const uint8_t* data, size_t len, bool with_response) noexcept override;
    esp_err_t Subscribe(const trainer_link::BleUuid& service, const trainer_link::BleUuid& characteristic,
                        FrameCallback on_frame, SubscriptionHandle& out) noexcept override;
    esp_err_t Unsubscribe(SubscriptionHandle handle) noexcept override;
    esp_err_t Disconnect() noexcept override;

    /// False once the peer or the controller dropped the link.
    bool IsLinkUp() const noexcept;

private:
    struct Peer {
        std::string id;
        ble_addr_t  addr;
    };

    struct Service {
        trainer_link::BleUuid uuid;
        uint16_t start_handle;
        uint16_t end_handle;
    };

    struct Characteristic {
        trainer_link::BleUuid service;
        trainer_link::BleUuid uuid;
        uint16_t def_handle;
        uint16_t val_handle;
        uint16_t end_handle;
        uint8_t  properties;
    };

    struct Route {
        SubscriptionHandle handle;
        uint16_t           val_handle;
        uint16_t           cccd_handle;
        FrameCallback      on_frame;
    };

    // Private functions: camelCase
    const Characteristic* findCharacteristic(const trainer_link::BleUuid& service,
                                             const trainer_link::BleUuid& characteristic) const noexcept;
    esp_err_t findCccd(const Characteristic& chr, uint16_t& out) noexcept;
    esp_err_t writeAttribute(uint16_t attr_handle, const uint8_t* data, size_t len) noexcept;
    esp_err_t waitProcedure(uint32_t timeout_ms) noexcept;
    void dispatchNotification(uint16_t attr_handle, const struct os_mbuf* om);

    static int gapEvent(struct ble_gap_event* event, void* arg);
    static int onService(uint16_t conn_handle, const struct ble_gatt_error* error,
                         const struct ble_gatt_svc* service, void* arg);
    static int onCharacteristic(uint16_t conn_handle, const struct ble_gatt_error* error,
                                const struct ble_gatt_chr* chr, void* arg);
    static int onDescriptor(uint16_t conn_handle, const struct ble_gatt_error* error,
                            uint16_t chr_val_handle, const struct ble_gatt_dsc* dsc, void* arg);
    static int onAttribute(uint16_t conn_handle, const struct ble_gatt_error* error,
                           struct ble_gatt_attr* attr, void* arg);

    SemaphoreHandle_t done_sem_;       // released by the host task when a procedure ends
    int               proc_status_;    // NimBLE status of the last procedure
    trainer_link::RtosMutex proc_mutex_;    // one GATT procedure in flight

    mutable trainer_link::RtosMutex table_mutex_;  // guards everything below
    uint16_t          conn_handle_;
    bool              scan_matched_;
    NameFilter        scan_filter_;
    ScanResult        scan_result_;
    ble_addr_t        scan_addr_;
    std::vector<Peer> peers_;
    std::vector<Service> services_;
    std::vector<Characteristic> characteristics_;
    std::vector<Route> routes_;
    SubscriptionHandle next_handle_;

    // Scratch state filled by the host task during a procedure
    std::vector<uint8_t> read_buf_;
    uint16_t             dsc_owner_;
    uint16_t             dsc_cccd_;
};

} // namespace ble
