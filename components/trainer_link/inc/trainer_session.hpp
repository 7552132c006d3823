/**
 * @file trainer_session.hpp
 * @brief One physical trainer connection: detect, initialize, authenticate,
 *        stream telemetry, accept commands, tear down.
 *
 * State flow:
 *   Disconnected -> Connecting -> Detecting -> Initializing -> Active
 *   any state -> Disconnecting -> Disconnected   (Disconnect, or a failed step)
 *
 * Threading: Connect / RunConnectSequence / commands run on the caller's task;
 * notification frames arrive on the transport's task. Control commands are
 * serialised by a command lock held across write + settle delay. Disconnect
 * never takes that lock, so it can run while a command is in flight.
 * No lock is held while logging, so an EventLog callback may call back in.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "esp_err.h"
#include "command_encoder.hpp"
#include "event_log.hpp"
#include "protocol_detector.hpp"
#include "protocol_handler.hpp"
#include "reborn_auth.hpp"
#include "rtos_mutex.hpp"
#include "settle_waiter.hpp"
#include "telemetry_codec.hpp"
#include "transport.hpp"
#include "trainer_types.hpp"

namespace trainer_link {

// Enum class: PascalCase
enum class SessionState : uint8_t {
    Disconnected = 0,
    Connecting,
    Detecting,
    Initializing,
    Active,
    Disconnecting
};

const char* ToString(SessionState state) noexcept;

enum class SequenceMode : uint8_t {
    Full = 0,       // request control -> reset -> start
    TelemetryOnly   // best-effort request control, no mode change on the device
};

class TrainerSession {
public:
    using TelemetryCallback = std::function<void(ProtocolKind kind, const TelemetryRecord& record)>;
    using ControlPointCallback = std::function<void(const ControlPointResponse& response)>;

    TrainerSession(Transport& transport, SettleWaiter& waiter, EventLog& log,
                   const command::DelayPolicy& delays = command::DelayPolicy{},
                   RebornHandshake::RandomFillFn random_fill = nullptr);
    ~TrainerSession();

    TrainerSession(const TrainerSession&) = delete;
    TrainerSession& operator=(const TrainerSession&) = delete;

    /**
     * @brief Connect, discover services, detect the protocol and initialize it.
     *
     * Ends in Initializing. On failure the session is back in Disconnected:
     * ERR_TRANSPORT_ for connect / initialization reads, ERR_PROTOCOL_DETECTION_
     * when service discovery failed.
     */
    esp_err_t Connect(const std::string& device_id, const std::string& name);

    /// Subscribes every channel of the bound protocol. Initializing or Active only.
    esp_err_t SubscribeNotifications();

    /// Initializing -> Active following the bound protocol's connection sequence.
    esp_err_t RunConnectSequence(SequenceMode mode);

    /// Idempotent; safe from any state and concurrently with other calls.
    esp_err_t Disconnect();

    // -------- CONTROL COMMANDS (Active only) --------
    esp_err_t SendCommand(const command::Command& cmd);
    esp_err_t RequestControl();
    esp_err_t Reset();
    esp_err_t Start();
    esp_err_t Stop();
    esp_err_t Pause();
    esp_err_t SetResistanceLevel(float level);
    esp_err_t SetTargetPower(int16_t watts);
    esp_err_t SetSimulationParams(const command::SimulationParams& params);

    /**
     * @brief Resistance sweep used to check that the trainer reacts to commands.
     *
     * Sends request control / reset / start first unless the device was already
     * started. FitShow steps 16 -> 32 -> 1 with 2 s pauses; every other protocol
     * gets a single level of 100 followed by a 3 s pause.
     */
    esp_err_t RunTestSequence();

    void SetTelemetryCallback(TelemetryCallback cb);
    void SetControlPointCallback(ControlPointCallback cb);

    // -------- GETTERS --------
    SessionState State() const;
    std::optional<ProtocolKind> DetectedProtocol() const;
    std::vector<ProtocolKind> AllDetectedProtocols() const;
    std::optional<uint32_t> FeatureBits() const;
    InitResult DeviceCapabilities() const;
    DeviceDescriptor Device() const;
    AuthState HandshakeState() const;
    /// True after a rejected or device-failed Reborn handshake; only a reconnect clears it.
    bool AuthFailed() const;
    esp_err_t LastTransportError() const;

private:
    using HandlerPtr = std::shared_ptr<ProtocolHandler>;

    static constexpr uint32_t TEST_STEP_MS_ = 2000;  // FitShow sweep pause
    static constexpr uint32_t TEST_HOLD_MS_ = 3000;

    // Private functions: camelCase
    esp_err_t sendCommandLocked(const HandlerPtr& handler, const command::Command& cmd);
    esp_err_t writeFrameLocked(const char* what, const CommandFrame& frame, uint32_t settle_ms);
    esp_err_t startHandshake();
    esp_err_t markActive(uint32_t generation);
    void abortConnect(uint32_t generation);
    esp_err_t releaseOrphanLink();
    void recordTransportError(esp_err_t err);
    bool isCurrent(uint32_t generation) const;

    void onFrame(const NotifyChannel& channel, uint32_t generation, const uint8_t* data, size_t len);
    void onControlPoint(uint32_t generation, const uint8_t* data, size_t len);
    void onRebornFrame(const NotifyChannel& channel, uint32_t generation, const uint8_t* data, size_t len);
    void deliverTelemetry(const NotifyChannel& channel, uint32_t generation, const uint8_t* data, size_t len);

    Transport&           transport_;
    SettleWaiter&        waiter_;
    EventLog&            log_;
    command::DelayPolicy delays_;

    // Guards everything below
    mutable RtosMutex    state_mutex_;
    SessionState         state_;
    uint32_t             generation_;   // bumped by every teardown
    DeviceDescriptor     device_;
    HandlerPtr           handler_;
    detect::DetectionResult detection_;
    bool                 detected_;
    InitResult           init_;
    RebornHandshake      handshake_;
    bool                 auth_failed_;
    bool                 started_;      // a Start command was accepted on this link
    codec::CrankCadenceTracker crank_tracker_;
    std::vector<Transport::SubscriptionHandle> subscriptions_;
    esp_err_t            last_transport_error_;
    TelemetryCallback    telemetry_cb_;
    ControlPointCallback control_point_cb_;

    // Held across write + settle delay
    RtosMutex            command_mutex_;
};

} // namespace trainer_link
