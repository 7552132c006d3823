/**
 * @file main.cpp
 * @brief Trainer bridge: scan, connect, stream telemetry
 */

#include <memory>
#include <string>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "esp_log.h"

#include "app_config.hpp"
#include "nimble_transport.hpp"
#include "config_store.hpp"
#include "event_log.hpp"
#include "protocol_detector.hpp"
#include "settle_waiter.hpp"
#include "trainer_err.hpp"
#include "trainer_session.hpp"

using namespace trainer_link;

static const char* TAG_MAIN_ = "Main";

// Must outlive app_main
static TrainerConfig g_config_;
static EventLog g_log_("TrainerLink");
static ble::NimbleTransport* g_transport_ = nullptr;
static TaskDelayWaiter g_waiter_;
static std::unique_ptr<TrainerSession> g_session_;

static void session_task(void* arg);
static void on_telemetry(ProtocolKind kind, const TelemetryRecord& rec);
static bool accept_name(const std::string& name);

extern "C" void app_main(void)
{
    esp_err_t err = ConfigStore::Init(g_config_);
    if (err != ESP_OK) {
        ESP_LOGW(TAG_MAIN_, "Config init failed (%s), running on defaults", esp_err_to_name(err));
    }
    g_log_.SetCapacity(g_config_.event_log_capacity);

    err = ble::InitHost();
    if (err != ESP_OK) {
        ESP_LOGE(TAG_MAIN_, "BLE host init failed: %s", esp_err_to_name(err));
        return;
    }

    static ble::NimbleTransport transport;
    g_transport_ = &transport;
    g_session_ = std::make_unique<TrainerSession>(transport, g_waiter_, g_log_,
                                                  ConfigStore::ToDelayPolicy(g_config_));
    g_session_->SetTelemetryCallback(on_telemetry);
    g_session_->SetControlPointCallback([](const ControlPointResponse& rsp) {
        ESP_LOGD(TAG_MAIN_, "Control point ack op=0x%02x result=0x%02x",
                 rsp.request_op_code, rsp.result_code);
    });

    xTaskCreate(session_task, "session_task", SESSION_TASK_STACK_, nullptr, SESSION_TASK_PRIO_, nullptr);
}

static bool accept_name(const std::string& name)
{
    if (g_config_.target_name_filter[0] != '\0') {
        return name.find(g_config_.target_name_filter) != std::string::npos;
    }
    return detect::HasNameMarker(name);
}

static void on_telemetry(ProtocolKind kind, const TelemetryRecord& rec)
{
    ESP_LOGI(TAG_MAIN_, "[%s] speed=%.2f cadence=%.1f power=%d hr=%d",
             ToString(kind),
             rec.instantaneous_speed.value_or(0.0f),
             rec.instantaneous_cadence.value_or(0.0f),
             static_cast<int>(rec.instantaneous_power.value_or(0)),
             static_cast<int>(rec.heart_rate.value_or(0)));
}

// One attempt: scan -> connect -> subscribe -> connection sequence
static esp_err_t bring_up()
{
    ble::ScanResult found;
    esp_err_t err = g_transport_->Scan(accept_name, SCAN_WINDOW_MS_, found);
    if (err != ESP_OK) {
        ESP_LOGI(TAG_MAIN_, "No trainer found");
        return err;
    }

    err = g_session_->Connect(found.id, found.name);
    if (err != ESP_OK) return err;

    err = g_session_->SubscribeNotifications();
    if (err != ESP_OK) return err;

    const SequenceMode mode = g_config_.telemetry_only ? SequenceMode::TelemetryOnly : SequenceMode::Full;
    err = g_session_->RunConnectSequence(mode);
    if (err != ESP_OK) return err;

    const std::optional<ProtocolKind> kind = g_session_->DetectedProtocol();
    if (mode == SequenceMode::Full && kind && detect::SupportsControlCommands(*kind)) {
        // Start on a flat road with the stored rolling / wind coefficients
        err = g_session_->SetSimulationParams(ConfigStore::DefaultSimulation(g_config_));
        if (err != ESP_OK) {
            ESP_LOGW(TAG_MAIN_, "Initial simulation rejected: %s", ErrorToName(err));
        }
    }
    return ESP_OK;
}

static void session_task(void* arg)
{
    (void)arg;
    while (true) {
        esp_err_t err = bring_up();
        if (err != ESP_OK) {
            ESP_LOGW(TAG_MAIN_, "Bring-up failed: %s", ErrorToName(err));
            err = g_session_->Disconnect();
            if (err != ESP_OK) {
                ESP_LOGW(TAG_MAIN_, "Disconnect failed: %s", ErrorToName(err));
            }
            vTaskDelay(pdMS_TO_TICKS(RETRY_DELAY_MS_));
            continue;
        }

        // Stay here until the session drops or the trainer refuses us, then rescan
        while (g_session_->State() == SessionState::Active && g_transport_->IsLinkUp() &&
               !g_session_->AuthFailed()) {
            vTaskDelay(pdMS_TO_TICKS(LINK_POLL_MS_));
        }
        if (g_session_->AuthFailed()) {
            ESP_LOGW(TAG_MAIN_, "Authentication failed (%s), reconnecting",
                     ToString(g_session_->HandshakeState()));
        } else {
            ESP_LOGW(TAG_MAIN_, "Link lost (last transport error: %s), reconnecting",
                     ErrorToName(g_session_->LastTransportError()));
        }
        err = g_session_->Disconnect();
        if (err != ESP_OK) {
            ESP_LOGW(TAG_MAIN_, "Disconnect failed: %s", ErrorToName(err));
        }
    }
}
