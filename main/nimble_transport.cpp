/**
 * @file nimble_transport.cpp
 * @brief NimBLE central transport implementation
 */

#include "nimble_transport.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include "esp_log.h"
#include "nimble/nimble_port.h"
#include "nimble/nimble_port_freertos.h"
#include "host/util/util.h"
#include "gatt_uuids.hpp"
#include "trainer_err.hpp"

using trainer_link::BleUuid;
using trainer_link::MutexGuard;

static const char* TAG_ = "NimbleTransport";

static SemaphoreHandle_t s_sync_sem_ = nullptr;
static uint8_t s_own_addr_type_ = 0;

// -------- HOST --------

static void onSync()
{
    int rc = ble_hs_util_ensure_addr(0);
    if (rc != 0) {
        ESP_LOGE(TAG_, "ble_hs_util_ensure_addr failed: %d", rc);
        return;
    }
    rc = ble_hs_id_infer_auto(0, &s_own_addr_type_);
    if (rc != 0) {
        ESP_LOGE(TAG_, "ble_hs_id_infer_auto failed: %d", rc);
        return;
    }
    ESP_LOGI(TAG_, "Host synced, own addr type %u", s_own_addr_type_);
    xSemaphoreGive(s_sync_sem_);
}

static void onReset(int reason)
{
    ESP_LOGW(TAG_, "Host reset, reason=%d", reason);
}

static void hostTask(void* param)
{
    (void)param;
    nimble_port_run();
    nimble_port_freertos_deinit();
}

namespace ble {

esp_err_t InitHost() noexcept
{
    if (s_sync_sem_ != nullptr) return ESP_OK;

    s_sync_sem_ = xSemaphoreCreateBinary();
    if (s_sync_sem_ == nullptr) return ESP_ERR_NO_MEM;

    esp_err_t err = nimble_port_init();
    if (err != ESP_OK) {
        ESP_LOGE(TAG_, "nimble_port_init failed: %s", esp_err_to_name(err));
        return err;
    }

    ble_hs_cfg.sync_cb = onSync;
    ble_hs_cfg.reset_cb = onReset;

    int rc = ble_att_set_preferred_mtu(PREFERRED_MTU_);
    if (rc != 0) {
        ESP_LOGW(TAG_, "ble_att_set_preferred_mtu failed: %d", rc);
    }

    nimble_port_freertos_init(hostTask);

    if (xSemaphoreTake(s_sync_sem_, pdMS_TO_TICKS(PROC_TIMEOUT_MS_)) != pdTRUE) {
        ESP_LOGE(TAG_, "Host sync timeout");
        return ESP_ERR_TIMEOUT;
    }
    ESP_LOGI(TAG_, "NimBLE host ready");
    return ESP_OK;
}

// -------- HELPERS --------

static BleUuid fromNimble(const ble_uuid_any_t& u)
{
    BleUuid out;
    switch (u.u.type) {
        case BLE_UUID_TYPE_16:
            return BleUuid::From16(u.u16.value);
        case BLE_UUID_TYPE_32:
            out = BleUuid::From16(0);
            out.bytes[0] = static_cast<uint8_t>(u.u32.value >> 24);
            out.bytes[1] = static_cast<uint8_t>(u.u32.value >> 16);
            out.bytes[2] = static_cast<uint8_t>(u.u32.value >> 8);
            out.bytes[3] = static_cast<uint8_t>(u.u32.value);
            return out;
        default:
            // NimBLE stores 128-bit values little-endian
            for (size_t i = 0; i < out.bytes.size(); ++i) {
                out.bytes[i] = u.u128.value[out.bytes.size() - 1 - i];
            }
            return out;
    }
}

static std::string formatAddr(const ble_addr_t& addr)
{
    char buf[18];
    snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
             addr.val[5], addr.val[4], addr.val[3], addr.val[2], addr.val[1], addr.val[0]);
    return buf;
}

static esp_err_t toEspErr(int rc)
{
    switch (rc) {
        case 0:               return ESP_OK;
        case BLE_HS_ETIMEOUT: return ESP_ERR_TIMEOUT;
        case BLE_HS_ENOTCONN: return ESP_ERR_INVALID_STATE;
        case BLE_HS_ENOMEM:   return ESP_ERR_NO_MEM;
        default:              return trainer_link::ERR_TRANSPORT_;
    }
}

// -------- LIFECYCLE --------

NimbleTransport::NimbleTransport() noexcept
    : done_sem_(xSemaphoreCreateBinary())
    , proc_status_(0)
    , conn_handle_(BLE_HS_CONN_HANDLE_NONE)
    , scan_matched_(false)
    , scan_addr_{}
    , next_handle_(1)
    , dsc_owner_(0)
    , dsc_cccd_(0)
{
}

NimbleTransport::~NimbleTransport()
{
    esp_err_t err = Disconnect();
    if (err != ESP_OK) {
        ESP_LOGW(TAG_, "Disconnect on destroy failed: %s", esp_err_to_name(err));
    }
    if (done_sem_ != nullptr) {
        vSemaphoreDelete(done_sem_);
    }
}

esp_err_t NimbleTransport::waitProcedure(uint32_t timeout_ms) noexcept
{
    if (xSemaphoreTake(done_sem_, pdMS_TO_TICKS(timeout_ms)) != pdTRUE) {
        ESP_LOGE(TAG_, "GATT procedure timeout");
        return ESP_ERR_TIMEOUT;
    }
    if (proc_status_ != 0 && proc_status_ != BLE_HS_EDONE) {
        ESP_LOGE(TAG_, "GATT procedure failed: status=%d", proc_status_);
        return toEspErr(proc_status_);
    }
    return ESP_OK;
}

esp_err_t NimbleTransport::Scan(const NameFilter& accept, uint32_t timeout_ms, ScanResult& out) noexcept
{
    MutexGuard proc(proc_mutex_);
    {
        MutexGuard lock(table_mutex_);
        scan_matched_ = false;
        scan_filter_ = accept;
        scan_result_ = ScanResult{};
    }
    (void)xSemaphoreTake(done_sem_, 0);

    struct ble_gap_disc_params params = {};
    params.filter_duplicates = 1;
    params.passive = 0;

    int rc = ble_gap_disc(s_own_addr_type_, static_cast<int32_t>(timeout_ms), &params, gapEvent, this);
    if (rc != 0) {
        ESP_LOGE(TAG_, "ble_gap_disc failed: %d", rc);
        return toEspErr(rc);
    }

    // DISC_COMPLETE also releases the semaphore when the window closes
    if (xSemaphoreTake(done_sem_, pdMS_TO_TICKS(timeout_ms + 1000)) != pdTRUE) {
        ESP_LOGW(TAG_, "Scan did not complete in time");
    }
    if (ble_gap_disc_active()) {
        rc = ble_gap_disc_cancel();
        if (rc != 0 && rc != BLE_HS_EALREADY) {
            ESP_LOGW(TAG_, "ble_gap_disc_cancel failed: %d", rc);
        }
    }

    MutexGuard lock(table_mutex_);
    scan_filter_ = nullptr;
    if (!scan_matched_) {
        return ESP_ERR_NOT_FOUND;
    }
    auto it = std::find_if(peers_.begin(), peers_.end(),
                           [this](const Peer& p) { return p.id == scan_result_.id; });
    if (it == peers_.end()) {
        peers_.push_back(Peer{scan_result_.id, scan_addr_});
    } else {
        it->addr = scan_addr_;
    }
    out = scan_result_;
    ESP_LOGI(TAG_, "Found '%s' at %s (rssi %d)", out.name.c_str(), out.id.c_str(), out.rssi);
    return ESP_OK;
}

esp_err_t NimbleTransport::Connect(const std::string& device_id) noexcept
{
    MutexGuard proc(proc_mutex_);
    ble_addr_t addr{};
    {
        MutexGuard lock(table_mutex_);
        if (conn_handle_ != BLE_HS_CONN_HANDLE_NONE) return ESP_ERR_INVALID_STATE;
        auto it = std::find_if(peers_.begin(), peers_.end(),
                               [&device_id](const Peer& p) { return p.id == device_id; });
        if (it == peers_.end()) {
            ESP_LOGE(TAG_, "Unknown device %s, scan first", device_id.c_str());
            return ESP_ERR_NOT_FOUND;
        }
        addr = it->addr;
    }
    (void)xSemaphoreTake(done_sem_, 0);

    int rc = ble_gap_connect(s_own_addr_type_, &addr, CONNECT_TIMEOUT_MS_, nullptr, gapEvent, this);
    if (rc != 0) {
        ESP_LOGE(TAG_, "ble_gap_connect failed: %d", rc);
        return toEspErr(rc);
    }
    esp_err_t err = waitProcedure(CONNECT_TIMEOUT_MS_ + 1000);
    if (err != ESP_OK) return err;

    uint16_t conn = BLE_HS_CONN_HANDLE_NONE;
    {
        MutexGuard lock(table_mutex_);
        conn = conn_handle_;
    }
    if (conn == BLE_HS_CONN_HANDLE_NONE) return trainer_link::ERR_TRANSPORT_;

    rc = ble_gattc_exchange_mtu(conn, nullptr, nullptr);
    if (rc != 0) {
        ESP_LOGW(TAG_, "MTU exchange failed: %d", rc);
    }
    ESP_LOGI(TAG_, "Connected to %s (handle %u)", device_id.c_str(), conn);
    return ESP_OK;
}

esp_err_t NimbleTransport::Disconnect() noexcept
{
    uint16_t conn = BLE_HS_CONN_HANDLE_NONE;
    {
        MutexGuard lock(table_mutex_);
        conn = conn_handle_;
        routes_.clear();
    }
    if (conn == BLE_HS_CONN_HANDLE_NONE) return ESP_OK;

    MutexGuard proc(proc_mutex_);
    (void)xSemaphoreTake(done_sem_, 0);
    int rc = ble_gap_terminate(conn, BLE_ERR_REM_USER_CONN_TERM);
    if (rc == BLE_HS_ENOTCONN) return ESP_OK;
    if (rc != 0) {
        ESP_LOGE(TAG_, "ble_gap_terminate failed: %d", rc);
        return toEspErr(rc);
    }
    if (xSemaphoreTake(done_sem_, pdMS_TO_TICKS(PROC_TIMEOUT_MS_)) != pdTRUE) {
        ESP_LOGW(TAG_, "No disconnect event, dropping link state");
        MutexGuard lock(table_mutex_);
        conn_handle_ = BLE_HS_CONN_HANDLE_NONE;
    }
    return ESP_OK;
}

// -------- DISCOVERY --------

esp_err_t NimbleTransport::DiscoverServices(std::vector<BleUuid>& services) noexcept
{
    MutexGuard proc(proc_mutex_);
    uint16_t conn = BLE_HS_CONN_HANDLE_NONE;
    {
        MutexGuard lock(table_mutex_);
        conn = conn_handle_;
        services_.clear();
        characteristics_.clear();
    }
    if (conn == BLE_HS_CONN_HANDLE_NONE) return ESP_ERR_INVALID_STATE;

    (void)xSemaphoreTake(done_sem_, 0);
    int rc = ble_gattc_disc_all_svcs(conn, onService, this);
    if (rc != 0) {
        ESP_LOGE(TAG_, "ble_gattc_disc_all_svcs failed: %d", rc);
        return toEspErr(rc);
    }
    esp_err_t err = waitProcedure(PROC_TIMEOUT_MS_);
    if (err != ESP_OK) return err;

    std::vector<Service> found;
    {
        MutexGuard lock(table_mutex_);
        found = services_;
    }

    for (const Service& svc : found) {
        (void)xSemaphoreTake(done_sem_, 0);
        rc = ble_gattc_disc_all_chrs(conn, svc.start_handle, svc.end_handle, onCharacteristic, this);
        if (rc != 0) {
            ESP_LOGE(TAG_, "ble_gattc_disc_all_chrs failed: %d", rc);
            return toEspErr(rc);
        }
        err = waitProcedure(PROC_TIMEOUT_MS_);
        if (err != ESP_OK) return err;

        // Close each characteristic's handle range for descriptor lookup
        MutexGuard lock(table_mutex_);
        for (auto& chr : characteristics_) {
            if (chr.def_handle < svc.start_handle || chr.def_handle > svc.end_handle) continue;
            chr.service = svc.uuid;
            chr.end_handle = svc.end_handle;
            for (const auto& other : characteristics_) {
                if (other.def_handle > chr.def_handle && other.def_handle <= chr.end_handle) {
                    chr.end_handle = static_cast<uint16_t>(other.def_handle - 1);
                }
            }
        }
    }

    services.clear();
    for (const Service& svc : found) {
        services.push_back(svc.uuid);
    }
    ESP_LOGI(TAG_, "Discovered %u services", static_cast<unsigned>(services.size()));
    return ESP_OK;
}

const NimbleTransport::Characteristic* NimbleTransport::findCharacteristic(
    const BleUuid& service, const BleUuid& characteristic) const noexcept
{
    for (const auto& chr : characteristics_) {
        if (chr.service == service && chr.uuid == characteristic) return &chr;
    }
    return nullptr;
}

bool NimbleTransport::HasCharacteristic(const BleUuid& service, const BleUuid& characteristic) const noexcept
{
    MutexGuard lock(table_mutex_);
    return findCharacteristic(service, characteristic) != nullptr;
}

bool NimbleTransport::IsLinkUp() const noexcept
{
    MutexGuard lock(table_mutex_);
    return conn_handle_ != BLE_HS_CONN_HANDLE_NONE;
}

esp_err_t NimbleTransport::findCccd(const Characteristic& chr, uint16_t& out) noexcept
{
    if (chr.end_handle <= chr.val_handle) return ESP_ERR_NOT_FOUND;

    uint16_t conn = BLE_HS_CONN_HANDLE_NONE;
    {
        MutexGuard lock(table_mutex_);
        conn = conn_handle_;
        dsc_owner_ = chr.val_handle;
        dsc_cccd_ = 0;
    }
    (void)xSemaphoreTake(done_sem_, 0);
    int rc = ble_gattc_disc_all_dscs(conn, chr.val_handle, chr.end_handle, onDescriptor, this);
    if (rc != 0) {
        ESP_LOGE(TAG_, "ble_gattc_disc_all_dscs failed: %d", rc);
        return toEspErr(rc);
    }
    esp_err_t err = waitProcedure(PROC_TIMEOUT_MS_);
    if (err != ESP_OK) return err;

    MutexGuard lock(table_mutex_);
    if (dsc_cccd_ == 0) return ESP_ERR_NOT_FOUND;
    out = dsc_cccd_;
    return ESP_OK;
}

// -------- READ / WRITE --------

esp_err_t NimbleTransport::Read(const BleUuid& service, const BleUuid& characteristic,
                                std::vector<uint8_t>& out) noexcept
{
    MutexGuard proc(proc_mutex_);
    uint16_t conn = BLE_HS_CONN_HANDLE_NONE;
    uint16_t handle = 0;
    {
        MutexGuard lock(table_mutex_);
        conn = conn_handle_;
        const Characteristic* chr = findCharacteristic(service, characteristic);
        if (chr == nullptr) return ESP_ERR_NOT_FOUND;
        handle = chr->val_handle;
        read_buf_.clear();
    }
    if (conn == BLE_HS_CONN_HANDLE_NONE) return ESP_ERR_INVALID_STATE;

    (void)xSemaphoreTake(done_sem_, 0);
    int rc = ble_gattc_read(conn, handle, onAttribute, this);
    if (rc != 0) {
        ESP_LOGE(TAG_, "ble_gattc_read failed: %d", rc);
        return toEspErr(rc);
    }
    esp_err_t err = waitProcedure(PROC_TIMEOUT_MS_);
    if (err != ESP_OK) return err;

    MutexGuard lock(table_mutex_);
    out = read_buf_;
    return ESP_OK;
}

esp_err_t NimbleTransport::writeAttribute(uint16_t attr_handle, const uint8_t* data, size_t len) noexcept
{
    uint16_t conn = BLE_HS_CONN_HANDLE_NONE;
    {
        MutexGuard lock(table_mutex_);
        conn = conn_handle_;
    }
    if (conn == BLE_HS_CONN_HANDLE_NONE) return ESP_ERR_INVALID_STATE;

    (void)xSemaphoreTake(done_sem_, 0);
    int rc = ble_gattc_write_flat(conn, attr_handle, data, static_cast<uint16_t>(len), onAttribute, this);
    if (rc != 0) {
        ESP_LOGE(TAG_, "ble_gattc_write_flat failed: %d", rc);
        return toEspErr(rc);
    }
    return waitProcedure(PROC_TIMEOUT_MS_);
}

esp_err_t NimbleTransport::Write(const BleUuid& service, const BleUuid& characteristic,
                                 const uint8_t* data, size_t len, bool with_response) noexcept
{
    if (data == nullptr || len == 0 || len > BLE_ATT_ATTR_MAX_LEN) return ESP_ERR_INVALID_ARG;

    uint16_t conn = BLE_HS_CONN_HANDLE_NONE;
    uint16_t handle = 0;
    {
        MutexGuard lock(table_mutex_);
        conn = conn_handle_;
        const Characteristic* chr = findCharacteristic(service, characteristic);
        if (chr == nullptr) return ESP_ERR_NOT_FOUND;
        handle = chr->val_handle;
    }
    if (conn == BLE_HS_CONN_HANDLE_NONE) return ESP_ERR_INVALID_STATE;

    if (!with_response) {
        // Runs from notification context too; no procedure to wait for
        int rc = ble_gattc_write_no_rsp_flat(conn, handle, data, static_cast<uint16_t>(len));
        if (rc != 0) {
            ESP_LOGE(TAG_, "ble_gattc_write_no_rsp_flat failed: %d", rc);
        }
        return toEspErr(rc);
    }

    MutexGuard proc(proc_mutex_);
    return writeAttribute(handle, data, len);
}

// -------- NOTIFICATIONS --------

esp_err_t NimbleTransport::Subscribe(const BleUuid& service, const BleUuid& characteristic,
                                     FrameCallback on_frame, SubscriptionHandle& out) noexcept
{
    MutexGuard proc(proc_mutex_);
    Characteristic chr{};
    {
        MutexGuard lock(table_mutex_);
        if (conn_handle_ == BLE_HS_CONN_HANDLE_NONE) return ESP_ERR_INVALID_STATE;
        const Characteristic* found = findCharacteristic(service, characteristic);
        if (found == nullptr) return ESP_ERR_NOT_FOUND;
        chr = *found;
    }
    if ((chr.properties & (BLE_GATT_CHR_PROP_NOTIFY | BLE_GATT_CHR_PROP_INDICATE)) == 0) {
        ESP_LOGE(TAG_, "%s cannot notify", characteristic.ToString().c_str());
        return ESP_ERR_NOT_SUPPORTED;
    }

    uint16_t cccd = 0;
    esp_err_t err = findCccd(chr, cccd);
    if (err != ESP_OK) {
        ESP_LOGE(TAG_, "No CCCD for %s", characteristic.ToString().c_str());
        return err;
    }

    SubscriptionHandle handle = INVALID_SUBSCRIPTION_;
    {
        MutexGuard lock(table_mutex_);
        handle = next_handle_++;
        routes_.push_back(Route{handle, chr.val_handle, cccd, std::move(on_frame)});
    }

    const uint8_t enable[2] = {
        static_cast<uint8_t>((chr.properties & BLE_GATT_CHR_PROP_NOTIFY) ? 0x01 : 0x02), 0x00};
    err = writeAttribute(cccd, enable, sizeof(enable));
    if (err != ESP_OK) {
        MutexGuard lock(table_mutex_);
        routes_.erase(std::remove_if(routes_.begin(), routes_.end(),
                                     [handle](const Route& r) { return r.handle == handle; }),
                      routes_.end());
        return err;
    }
    out = handle;
    return ESP_OK;
}

esp_err_t NimbleTransport::Unsubscribe(SubscriptionHandle handle) noexcept
{
    uint16_t cccd = 0;
    bool shared = false;
    {
        MutexGuard lock(table_mutex_);
        auto it = std::find_if(routes_.begin(), routes_.end(),
                               [handle](const Route& r) { return r.handle == handle; });
        if (it == routes_.end()) return ESP_ERR_NOT_FOUND;
        cccd = it->cccd_handle;
        const uint16_t val = it->val_handle;
        routes_.erase(it);
        shared = std::any_of(routes_.begin(), routes_.end(),
                             [val](const Route& r) { return r.val_handle == val; });
        if (conn_handle_ == BLE_HS_CONN_HANDLE_NONE) return ESP_OK;
    }
    if (shared) return ESP_OK;

    MutexGuard proc(proc_mutex_);
    const uint8_t disable[2] = {0x00, 0x00};
    return writeAttribute(cccd, disable, sizeof(disable));
}

void NimbleTransport::dispatchNotification(uint16_t attr_handle, const struct os_mbuf* om)
{
    const uint16_t len = OS_MBUF_PKTLEN(om);
    std::vector<uint8_t> frame(len);
    if (len > 0 && os_mbuf_copydata(om, 0, len, frame.data()) != 0) {
        ESP_LOGW(TAG_, "Notification copy failed (handle %u)", attr_handle);
        return;
    }

    std::vector<FrameCallback> targets;
    {
        MutexGuard lock(table_mutex_);
        for (const auto& r : routes_) {
            if (r.val_handle == attr_handle) targets.push_back(r.on_frame);
        }
    }
    for (const auto& cb : targets) {
        cb(frame.data(), frame.size());
    }
}

// -------- HOST CALLBACKS --------

int NimbleTransport::gapEvent(struct ble_gap_event* event, void* arg)
{
    auto* self = static_cast<NimbleTransport*>(arg);

    switch (event->type) {
        case BLE_GAP_EVENT_DISC: {
            struct ble_hs_adv_fields fields = {};
            if (ble_hs_adv_parse_fields(&fields, event->disc.data, event->disc.length_data) != 0) {
                return 0;
            }
            if (fields.name == nullptr || fields.name_len == 0) return 0;
            const std::string name(reinterpret_cast<const char*>(fields.name), fields.name_len);

            MutexGuard lock(self->table_mutex_);
            if (self->scan_matched_ || !self->scan_filter_ || !self->scan_filter_(name)) return 0;
            self->scan_matched_ = true;
            self->scan_addr_ = event->disc.addr;
            self->scan_result_.id = formatAddr(event->disc.addr);
            self->scan_result_.name = name;
            self->scan_result_.rssi = event->disc.rssi;
            xSemaphoreGive(self->done_sem_);
            return 0;
        }

        case BLE_GAP_EVENT_DISC_COMPLETE:
            xSemaphoreGive(self->done_sem_);
            return 0;

        case BLE_GAP_EVENT_CONNECT:
            self->proc_status_ = event->connect.status;
            if (event->connect.status == 0) {
                MutexGuard lock(self->table_mutex_);
                self->conn_handle_ = event->connect.conn_handle;
            } else {
                ESP_LOGE(TAG_, "Connection failed: status=%d", event->connect.status);
            }
            xSemaphoreGive(self->done_sem_);
            return 0;

        case BLE_GAP_EVENT_DISCONNECT: {
            ESP_LOGI(TAG_, "Disconnected, reason=0x%x", event->disconnect.reason);
            {
                MutexGuard lock(self->table_mutex_);
                self->conn_handle_ = BLE_HS_CONN_HANDLE_NONE;
                self->routes_.clear();
            }
            // Fails any procedure still waiting on this link
            self->proc_status_ = BLE_HS_ENOTCONN;
            xSemaphoreGive(self->done_sem_);
            return 0;
        }

        case BLE_GAP_EVENT_NOTIFY_RX:
            self->dispatchNotification(event->notify_rx.attr_handle, event->notify_rx.om);
            return 0;

        case BLE_GAP_EVENT_MTU:
            ESP_LOGI(TAG_, "MTU updated: %u", event->mtu.value);
            return 0;

        default:
            return 0;
    }
}

int NimbleTransport::onService(uint16_t conn_handle, const struct ble_gatt_error* error,
                               const struct ble_gatt_svc* service, void* arg)
{
    (void)conn_handle;
    auto* self = static_cast<NimbleTransport*>(arg);
    if (error->status == 0) {
        MutexGuard lock(self->table_mutex_);
        self->services_.push_back(Service{fromNimble(service->uuid), service->start_handle, service->end_handle});
        return 0;
    }
    self->proc_status_ = error->status;
    xSemaphoreGive(self->done_sem_);
    return 0;
}

int NimbleTransport::onCharacteristic(uint16_t conn_handle, const struct ble_gatt_error* error,
                                      const struct ble_gatt_chr* chr, void* arg)
{
    (void)conn_handle;
    auto* self = static_cast<NimbleTransport*>(arg);
    if (error->status == 0) {
        Characteristic c{};
        c.uuid = fromNimble(chr->uuid);
        c.def_handle = chr->def_handle;
        c.val_handle = chr->val_handle;
        c.end_handle = chr->val_handle;
        c.properties = chr->properties;
        MutexGuard lock(self->table_mutex_);
        self->characteristics_.push_back(c);
        return 0;
    }
    self->proc_status_ = error->status;
    xSemaphoreGive(self->done_sem_);
    return 0;
}

int NimbleTransport::onDescriptor(uint16_t conn_handle, const struct ble_gatt_error* error,
                                  uint16_t chr_val_handle, const struct ble_gatt_dsc* dsc, void* arg)
{
    (void)conn_handle;
    auto* self = static_cast<NimbleTransport*>(arg);
    if (error->status == 0) {
        MutexGuard lock(self->table_mutex_);
        if (chr_val_handle == self->dsc_owner_ && fromNimble(dsc->uuid) == trainer_link::gatt::CCCD_) {
            self->dsc_cccd_ = dsc->handle;
        }
        return 0;
    }
    self->proc_status_ = error->status;
    xSemaphoreGive(self->done_sem_);
    return 0;
}

int NimbleTransport::onAttribute(uint16_t conn_handle, const struct ble_gatt_error* error,
                                 struct ble_gatt_attr* attr, void* arg)
{
    (void)conn_handle;
    auto* self = static_cast<NimbleTransport*>(arg);
    self->proc_status_ = error->status;
    if (error->status == 0 && attr != nullptr && attr->om != nullptr) {
        const uint16_t len = OS_MBUF_PKTLEN(attr->om);
        MutexGuard lock(self->table_mutex_);
        self->read_buf_.resize(len);
        if (len > 0 && os_mbuf_copydata(attr->om, 0, len, self->read_buf_.data()) != 0) {
            self->proc_status_ = BLE_HS_EUNKNOWN;
        }
    }
    xSemaphoreGive(self->done_sem_);
    return 0;
}

} // namespace ble
