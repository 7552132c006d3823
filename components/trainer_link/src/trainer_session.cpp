/**
 * @file trainer_session.cpp
 * @brief Session orchestrator
 */

#include "trainer_session.hpp"
#include "control_point.hpp"
#include "gatt_uuids.hpp"
#include "handler_registry.hpp"
#include "trainer_err.hpp"

#include <utility>

namespace trainer_link {

const char* ToString(SessionState state) noexcept
{
    switch (state) {
        case SessionState::Disconnected:  return "Disconnected";
        case SessionState::Connecting:    return "Connecting";
        case SessionState::Detecting:     return "Detecting";
        case SessionState::Initializing:  return "Initializing";
        case SessionState::Active:        return "Active";
        case SessionState::Disconnecting: return "Disconnecting";
    }
    return "Unknown";
}

TrainerSession::TrainerSession(Transport& transport, SettleWaiter& waiter, EventLog& log,
                               const command::DelayPolicy& delays,
                               RebornHandshake::RandomFillFn random_fill)
    : transport_(transport)
    , waiter_(waiter)
    , log_(log)
    , delays_(delays)
    , state_(SessionState::Disconnected)
    , generation_(0)
    , detected_(false)
    , handshake_(random_fill)
    , auth_failed_(false)
    , started_(false)
    , last_transport_error_(ESP_OK)
{
}

TrainerSession::~TrainerSession()
{
    Disconnect();
}

// -------- CONNECT --------

esp_err_t TrainerSession::Connect(const std::string& device_id, const std::string& name)
{
    uint32_t gen = 0;
    SessionState refused_in = SessionState::Disconnected;
    bool refused = false;
    {
        MutexGuard lock(state_mutex_);
        if (state_ != SessionState::Disconnected) {
            refused = true;
            refused_in = state_;
        } else {
            state_ = SessionState::Connecting;
            gen = generation_;
            device_ = DeviceDescriptor{device_id, name, {}};
            last_transport_error_ = ESP_OK;
        }
    }
    if (refused) {
        log_.Warning("Connect refused in state %s", ToString(refused_in));
        return ESP_ERR_INVALID_STATE;
    }

    log_.Info("Connecting to %s ('%s')", device_id.c_str(), name.c_str());
    esp_err_t err = transport_.Connect(device_id);
    if (err != ESP_OK) {
        recordTransportError(err);
        log_.Error("Connection error: %s", ErrorToName(err));
        abortConnect(gen);
        return ERR_TRANSPORT_;
    }

    bool stale = false;
    {
        MutexGuard lock(state_mutex_);
        stale = (generation_ != gen || state_ != SessionState::Connecting);
        if (!stale) state_ = SessionState::Detecting;
    }
    if (stale) return releaseOrphanLink();

    std::vector<BleUuid> services;
    err = transport_.DiscoverServices(services);
    if (err != ESP_OK) {
        recordTransportError(err);
        log_.Error("Protocol detection error: service discovery failed (%s)", ErrorToName(err));
        abortConnect(gen);
        return ERR_PROTOCOL_DETECTION_;
    }

    detect::DetectionResult result = detect::Detect(name, services);
    HandlerPtr handler = handler_registry::CreateHandler(result.resolved);

    std::string all;
    for (auto k : result.matched) {
        if (!all.empty()) all += ", ";
        all += ToString(k);
    }

    {
        MutexGuard lock(state_mutex_);
        stale = (generation_ != gen || state_ != SessionState::Detecting);
        if (!stale) {
            device_.services = services;
            detection_ = result;
            detected_ = true;
            handler_ = handler;
            state_ = SessionState::Initializing;
        }
    }
    if (stale) return releaseOrphanLink();
    log_.Success("Protocol detection completed: %s", ToString(result.resolved));
    log_.Info("All detected protocols: %s", all.c_str());

    InitResult init;
    err = handler->Initialize(transport_, log_, init);
    if (err != ESP_OK) {
        log_.Error("%s initialization failed: %s", ToString(result.resolved), ErrorToName(err));
        abortConnect(gen);
        if (err == ESP_ERR_INVALID_SIZE) return err;
        recordTransportError(err);
        return ERR_TRANSPORT_;
    }

    {
        MutexGuard lock(state_mutex_);
        stale = (generation_ != gen);
        if (!stale) init_ = init;
    }
    if (stale) return releaseOrphanLink();
    return ESP_OK;
}

void TrainerSession::abortConnect(uint32_t generation)
{
    if (!isCurrent(generation)) return;
    Disconnect();
}

esp_err_t TrainerSession::releaseOrphanLink()
{
    // A Disconnect ran while the link was coming up. Drop the link it could not
    // see, unless a newer connection already owns the transport.
    bool idle = false;
    {
        MutexGuard lock(state_mutex_);
        idle = (state_ == SessionState::Disconnected || state_ == SessionState::Disconnecting);
    }
    if (idle) {
        log_.Warning("Connection torn down while connecting, releasing link");
        esp_err_t err = transport_.Disconnect();
        if (err != ESP_OK) {
            log_.Warning("Disconnection error: %s", ErrorToName(err));
        }
    }
    return ESP_ERR_INVALID_STATE;
}

// -------- SUBSCRIPTIONS --------

esp_err_t TrainerSession::SubscribeNotifications()
{
    HandlerPtr handler;
    uint32_t gen = 0;
    SessionState state = SessionState::Disconnected;
    bool already_subscribed = false;
    {
        MutexGuard lock(state_mutex_);
        state = state_;
        already_subscribed = !subscriptions_.empty();
        handler = handler_;
        gen = generation_;
    }
    if (state != SessionState::Initializing && state != SessionState::Active) {
        log_.Warning("Subscribe refused in state %s", ToString(state));
        return ESP_ERR_INVALID_STATE;
    }
    if (already_subscribed) return ESP_OK;

    for (const NotifyChannel& ch : handler->Channels()) {
        const std::string uuid = ch.characteristic.ToString();
        if (ch.optional && !transport_.HasCharacteristic(ch.service, ch.characteristic)) {
            log_.Info("Optional channel %s not present", uuid.c_str());
            continue;
        }

        Transport::SubscriptionHandle handle = Transport::INVALID_SUBSCRIPTION_;
        esp_err_t err = transport_.Subscribe(
            ch.service, ch.characteristic,
            [this, ch, gen](const uint8_t* data, size_t len) { onFrame(ch, gen, data, len); },
            handle);

        if (err != ESP_OK) {
            if (ch.optional) {
                log_.Warning("Subscription to %s failed: %s", uuid.c_str(), ErrorToName(err));
                continue;
            }
            recordTransportError(err);
            log_.Error("Subscription to %s failed: %s", uuid.c_str(), ErrorToName(err));
            abortConnect(gen);
            return ERR_TRANSPORT_;
        }

        bool stale = false;
        {
            MutexGuard lock(state_mutex_);
            if (generation_ == gen) {
                subscriptions_.push_back(handle);
            } else {
                stale = true;
            }
        }
        if (stale) {
            // Torn down while subscribing; release the orphan handle
            esp_err_t unsub = transport_.Unsubscribe(handle);
            if (unsub != ESP_OK) {
                log_.Warning("Unsubscribe after teardown failed: %s", ErrorToName(unsub));
            }
            return ESP_ERR_INVALID_STATE;
        }
        log_.Info("Subscribed to %s", uuid.c_str());
    }

    log_.Success("%s notifications started", ToString(handler->Kind()));
    return ESP_OK;
}

// -------- CONNECTION SEQUENCE --------

esp_err_t TrainerSession::RunConnectSequence(SequenceMode mode)
{
    HandlerPtr handler;
    uint32_t gen = 0;
    SessionState state = SessionState::Disconnected;
    {
        MutexGuard lock(state_mutex_);
        state = state_;
        handler = handler_;
        gen = generation_;
    }
    if (state != SessionState::Initializing) {
        log_.Warning("Connection sequence refused in state %s", ToString(state));
        return ESP_ERR_INVALID_STATE;
    }

    const char* name = ToString(handler->Kind());
    const bool full = (mode == SequenceMode::Full);
    log_.Info("Running %s %s connection sequence", name, full ? "full" : "telemetry-only");

    switch (handler->Sequence()) {
        case SequenceStyle::ReadOnly:
            log_.Info("%s is read-only", name);
            break;

        case SequenceStyle::Handshake: {
            esp_err_t err = startHandshake();
            if (err != ESP_OK) {
                log_.Error("%s connection sequence error: %s", name, ErrorToName(err));
                abortConnect(gen);
                return err;
            }
            log_.Info("%s authentication initiated", name);
            break;
        }

        case SequenceStyle::ControlStrict: {
            if (!full) {
                esp_err_t err = sendCommandLocked(handler, command::Command::RequestControl());
                if (err != ESP_OK) {
                    log_.Warning("Control commands failed in telemetry-only mode: %s", ErrorToName(err));
                    log_.Info("Continuing without control commands");
                }
                break;
            }
            const command::Command steps[] = {
                command::Command::RequestControl(),
                command::Command::Reset(),
                command::Command::Start(),
            };
            for (const auto& step : steps) {
                esp_err_t err = sendCommandLocked(handler, step);
                if (err != ESP_OK) {
                    log_.Error("%s connection sequence failed at %s: %s", name,
                               command::ToString(step.op), ErrorToName(err));
                    abortConnect(gen);
                    return err;
                }
            }
            break;
        }

        case SequenceStyle::ControlBestEffort: {
            std::vector<PreambleStep> preamble;
            esp_err_t err = handler->VendorPreamble(delays_, preamble);
            if (err != ESP_OK) {
                log_.Warning("%s vendor preamble unavailable: %s", name, ErrorToName(err));
                preamble.clear();
            }
            for (const auto& step : preamble) {
                err = writeFrameLocked(step.name, step.frame, step.settle_ms);
                if (err != ESP_OK) {
                    log_.Warning("%s command failed: %s", step.name, ErrorToName(err));
                }
            }

            std::vector<command::Command> steps = {command::Command::RequestControl()};
            if (full) {
                steps.push_back(command::Command::Reset());
                steps.push_back(command::Command::Start());
            }
            for (const auto& step : steps) {
                err = sendCommandLocked(handler, step);
                if (err == ERR_NO_VENDOR_FRAME_) {
                    log_.Info("%s has no %s frame, skipped", name, command::ToString(step.op));
                } else if (err != ESP_OK) {
                    log_.Warning("%s %s failed: %s", name, command::ToString(step.op), ErrorToName(err));
                }
            }
            break;
        }
    }

    esp_err_t err = markActive(gen);
    if (err == ESP_OK) {
        log_.Success("%s connection sequence completed, device active", name);
    }
    return err;
}

esp_err_t TrainerSession::startHandshake()
{
    RebornHandshake::Challenge challenge;
    esp_err_t err = ESP_OK;
    {
        MutexGuard lock(state_mutex_);
        err = handshake_.BeginChallenge(challenge);
    }
    if (err != ESP_OK) return err;

    CommandFrame frame;
    frame.bytes.assign(challenge.begin(), challenge.end());
    frame.service = gatt::REBORN_SERVICE_;
    frame.characteristic = gatt::REBORN_WRITE_CHAR_;
    frame.with_response = false;

    err = writeFrameLocked("Reborn challenge", frame, 0);
    if (err != ESP_OK) {
        MutexGuard lock(state_mutex_);
        handshake_.Reset();
    }
    return err;
}

esp_err_t TrainerSession::markActive(uint32_t generation)
{
    MutexGuard lock(state_mutex_);
    if (generation_ != generation || state_ != SessionState::Initializing) {
        return ESP_ERR_INVALID_STATE;
    }
    state_ = SessionState::Active;
    return ESP_OK;
}

// -------- DISCONNECT --------

esp_err_t TrainerSession::Disconnect()
{
    std::vector<Transport::SubscriptionHandle> subs;
    {
        MutexGuard lock(state_mutex_);
        if (state_ == SessionState::Disconnected && subscriptions_.empty()) return ESP_OK;
        if (state_ == SessionState::Disconnecting) return ESP_OK;
        state_ = SessionState::Disconnecting;
        ++generation_;
        subs.swap(subscriptions_);
    }

    for (auto handle : subs) {
        esp_err_t err = transport_.Unsubscribe(handle);
        if (err != ESP_OK) {
            log_.Warning("Unsubscribe failed: %s", ErrorToName(err));
        }
    }

    esp_err_t err = transport_.Disconnect();
    if (err != ESP_OK) {
        log_.Warning("Disconnection error: %s", ErrorToName(err));
    }

    {
        MutexGuard lock(state_mutex_);
        handshake_.Reset();
        auth_failed_ = false;
        started_ = false;
        detection_ = detect::DetectionResult{};
        detected_ = false;
        handler_.reset();
        init_ = InitResult{};
        crank_tracker_.Reset();
        device_ = DeviceDescriptor{};
        state_ = SessionState::Disconnected;
    }
    log_.Info("Disconnected");
    return ESP_OK;
}

// -------- COMMANDS --------

esp_err_t TrainerSession::SendCommand(const command::Command& cmd)
{
    HandlerPtr handler;
    SessionState state = SessionState::Disconnected;
    bool auth_failed = false;
    {
        MutexGuard lock(state_mutex_);
        state = state_;
        auth_failed = auth_failed_;
        handler = handler_;
    }
    if (state != SessionState::Active) {
        log_.Warning("%s refused in state %s", command::ToString(cmd.op), ToString(state));
        return ESP_ERR_INVALID_STATE;
    }
    if (auth_failed) {
        log_.Error("%s refused: authentication failed, reconnect required",
                   command::ToString(cmd.op));
        return ERR_AUTHENTICATION_;
    }

    if (!handler->SupportsControl()) {
        log_.Warning("Control commands not supported for %s protocol", ToString(handler->Kind()));
        return ERR_UNSUPPORTED_OPERATION_;
    }
    return sendCommandLocked(handler, cmd);
}

esp_err_t TrainerSession::RequestControl()
{
    return SendCommand(command::Command::RequestControl());
}

esp_err_t TrainerSession::Reset()
{
    return SendCommand(command::Command::Reset());
}

esp_err_t TrainerSession::Start()
{
    return SendCommand(command::Command::Start());
}

esp_err_t TrainerSession::Stop()
{
    return SendCommand(command::Command::Stop());
}

esp_err_t TrainerSession::Pause()
{
    return SendCommand(command::Command::Pause());
}

esp_err_t TrainerSession::SetResistanceLevel(float level)
{
    return SendCommand(command::Command::Resistance(level));
}

esp_err_t TrainerSession::SetTargetPower(int16_t watts)
{
    return SendCommand(command::Command::TargetPower(watts));
}

esp_err_t TrainerSession::SetSimulationParams(const command::SimulationParams& params)
{
    return SendCommand(command::Command::Simulation(params));
}

esp_err_t TrainerSession::RunTestSequence()
{
    bool started = false;
    ProtocolKind kind = ProtocolKind::Ftms;
    {
        MutexGuard lock(state_mutex_);
        started = started_;
        if (handler_ != nullptr) kind = handler_->Kind();
    }

    log_.Info("Starting resistance test sequence");
    esp_err_t err = ESP_OK;
    if (!started) {
        const command::Command steps[] = {
            command::Command::RequestControl(),
            command::Command::Reset(),
            command::Command::Start(),
        };
        for (const auto& step : steps) {
            err = SendCommand(step);
            if (err == ERR_NO_VENDOR_FRAME_) {
                log_.Info("No %s frame for this protocol, skipped", command::ToString(step.op));
                err = ESP_OK;
            }
            if (err != ESP_OK) break;
        }
    }

    if (err == ESP_OK && kind == ProtocolKind::FitShow) {
        err = SetResistanceLevel(16.0f);
        if (err == ESP_OK) {
            waiter_.Wait(TEST_STEP_MS_);
            err = SetResistanceLevel(32.0f);
        }
        if (err == ESP_OK) {
            waiter_.Wait(TEST_STEP_MS_);
            err = SetResistanceLevel(1.0f);
        }
    } else if (err == ESP_OK) {
        err = SetResistanceLevel(100.0f);
        if (err == ESP_OK) waiter_.Wait(TEST_HOLD_MS_);
    }

    if (err != ESP_OK) {
        log_.Error("Test sequence error: %s", ErrorToName(err));
        return err;
    }
    log_.Success("Resistance test sequence completed");
    return ESP_OK;
}

esp_err_t TrainerSession::sendCommandLocked(const HandlerPtr& handler, const command::Command& cmd)
{
    CommandFrame frame;
    esp_err_t err = handler->Encode(cmd, frame);
    if (err != ESP_OK) return err;

    err = writeFrameLocked(command::ToString(cmd.op), frame, delays_.SettleDelayFor(cmd.op));
    if (err == ESP_OK && (cmd.op == command::CommandOp::Start || cmd.op == command::CommandOp::Stop)) {
        MutexGuard lock(state_mutex_);
        started_ = (cmd.op == command::CommandOp::Start);
    }
    return err;
}

esp_err_t TrainerSession::writeFrameLocked(const char* what, const CommandFrame& frame, uint32_t settle_ms)
{
    log_.Info("Sending %s: %s", what, ToHex(frame.bytes.data(), frame.bytes.size()).c_str());

    esp_err_t err = ESP_OK;
    {
        MutexGuard lock(command_mutex_);
        err = transport_.Write(frame.service, frame.characteristic,
                               frame.bytes.data(), frame.bytes.size(), frame.with_response);
        if (err == ESP_OK) {
            waiter_.Wait(settle_ms);
        }
    }

    if (err != ESP_OK) {
        recordTransportError(err);
        log_.Error("Write %s failed: %s", what, ErrorToName(err));
        return ERR_TRANSPORT_;
    }
    log_.Success("Write %s successful", what);
    return ESP_OK;
}

// -------- NOTIFICATIONS --------

void TrainerSession::onFrame(const NotifyChannel& channel, uint32_t generation,
                             const uint8_t* data, size_t len)
{
    switch (channel.role) {
        case ChannelRole::ControlPoint:
            onControlPoint(generation, data, len);
            break;
        case ChannelRole::RebornData:
            onRebornFrame(channel, generation, data, len);
            break;
        case ChannelRole::Telemetry:
            deliverTelemetry(channel, generation, data, len);
            break;
    }
}

void TrainerSession::onControlPoint(uint32_t generation, const uint8_t* data, size_t len)
{
    std::optional<ControlPointResponse> response = control_point::ParseResponse(data, len);
    if (!response) {
        log_.Warning("Unexpected control point frame: %s", ToHex(data, len).c_str());
        return;
    }

    ControlPointCallback cb;
    {
        MutexGuard lock(state_mutex_);
        if (generation_ != generation) return;
        cb = control_point_cb_;
    }

    const char* op = control_point::OpCodeName(response->request_op_code);
    const char* result = control_point::ResultCodeName(response->result_code);
    if (response->IsSuccess()) {
        log_.Success("Command response [success] %s (0x%02x): %s", op,
                     response->request_op_code, result);
    } else {
        log_.Warning("Command response [failed] %s (0x%02x): %s (0x%02x)", op,
                     response->request_op_code, result, response->result_code);
    }

    if (cb) {
        cb(*response);
    }
}

void TrainerSession::onRebornFrame(const NotifyChannel& channel, uint32_t generation,
                                   const uint8_t* data, size_t len)
{
    switch (RebornHandshake::Classify(data, len)) {
        case RebornFrame::AuthReply: {
            RebornHandshake::Verdict verdict{};
            esp_err_t err = ESP_OK;
            {
                MutexGuard lock(state_mutex_);
                if (generation_ != generation) return;
                err = handshake_.HandleReply(data, len, verdict);
                if (err == ERR_AUTHENTICATION_) auth_failed_ = true;
            }

            if (err != ESP_OK && err != ERR_AUTHENTICATION_) {
                log_.Warning("Ignoring auth reply: %s", ErrorToName(err));
                return;
            }
            if (err == ESP_OK) {
                log_.Success("Reborn authentication successful");
            } else {
                log_.Error("Reborn authentication failed - invalid response");
            }

            // Verdict goes out from the notification context, outside the command lock
            esp_err_t werr = transport_.Write(gatt::REBORN_SERVICE_, gatt::REBORN_WRITE_CHAR_,
                                              verdict.data(), verdict.size(), false);
            if (werr != ESP_OK) {
                recordTransportError(werr);
                log_.Error("Failed to send Reborn auth verdict: %s", ErrorToName(werr));
            }
            break;
        }

        case RebornFrame::DeviceFailure: {
            {
                MutexGuard lock(state_mutex_);
                if (generation_ != generation) return;
                auth_failed_ = true;
            }
            log_.Error("Reborn authentication error reported by device - restart the connection");
            break;
        }

        case RebornFrame::Telemetry: {
            {
                MutexGuard lock(state_mutex_);
                if (!handshake_.IsVerified()) return;
            }
            deliverTelemetry(channel, generation, data, len);
            break;
        }

        case RebornFrame::Other:
            break;
    }
}

void TrainerSession::deliverTelemetry(const NotifyChannel& channel, uint32_t generation,
                                      const uint8_t* data, size_t len)
{
    if (channel.decode == nullptr) return;
    TelemetryRecord record = channel.decode(data, len);

    TelemetryCallback cb;
    ProtocolKind kind = ProtocolKind::Csc;
    {
        MutexGuard lock(state_mutex_);
        if (generation_ != generation || handler_ == nullptr) return;
        if (state_ != SessionState::Initializing && state_ != SessionState::Active) return;
        if (channel.derive_crank_cadence) {
            crank_tracker_.Apply(record);
        }
        kind = handler_->Kind();
        cb = telemetry_cb_;
    }

    if (cb) {
        cb(kind, record);
    }
}

// -------- CALLBACKS / GETTERS --------

void TrainerSession::SetTelemetryCallback(TelemetryCallback cb)
{
    MutexGuard lock(state_mutex_);
    telemetry_cb_ = std::move(cb);
}

void TrainerSession::SetControlPointCallback(ControlPointCallback cb)
{
    MutexGuard lock(state_mutex_);
    control_point_cb_ = std::move(cb);
}

SessionState TrainerSession::State() const
{
    MutexGuard lock(state_mutex_);
    return state_;
}

std::optional<ProtocolKind> TrainerSession::DetectedProtocol() const
{
    MutexGuard lock(state_mutex_);
    if (!detected_) return std::nullopt;
    return detection_.resolved;
}

std::vector<ProtocolKind> TrainerSession::AllDetectedProtocols() const
{
    MutexGuard lock(state_mutex_);
    if (!detected_) return {};
    return detection_.matched;
}

std::optional<uint32_t> TrainerSession::FeatureBits() const
{
    MutexGuard lock(state_mutex_);
    return init_.feature_bits;
}

InitResult TrainerSession::DeviceCapabilities() const
{
    MutexGuard lock(state_mutex_);
    return init_;
}

DeviceDescriptor TrainerSession::Device() const
{
    MutexGuard lock(state_mutex_);
    return device_;
}

AuthState TrainerSession::HandshakeState() const
{
    MutexGuard lock(state_mutex_);
    return handshake_.State();
}

bool TrainerSession::AuthFailed() const
{
    MutexGuard lock(state_mutex_);
    return auth_failed_;
}

esp_err_t TrainerSession::LastTransportError() const
{
    MutexGuard lock(state_mutex_);
    return last_transport_error_;
}

void TrainerSession::recordTransportError(esp_err_t err)
{
    MutexGuard lock(state_mutex_);
    last_transport_error_ = err;
}

bool TrainerSession::isCurrent(uint32_t generation) const
{
    MutexGuard lock(state_mutex_);
    return generation_ == generation;
}

} // namespace trainer_link
