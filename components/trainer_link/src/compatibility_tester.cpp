/**
 * @file compatibility_tester.cpp
 * @brief Compatibility run, resistance attribution and report rating
 */

#include "compatibility_tester.hpp"
#include "control_point.hpp"
#include "trainer_err.hpp"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace trainer_link {
namespace compat {

namespace {

static constexpr size_t AUTO_CHANGE_LIMIT_ = 5;

uint32_t tickClockMs()
{
    return static_cast<uint32_t>(xTaskGetTickCount() * portTICK_PERIOD_MS);
}

bool contains(const std::vector<ProtocolKind>& kinds, ProtocolKind kind)
{
    return std::find(kinds.begin(), kinds.end(), kind) != kinds.end();
}

bool isFtmsBased(ProtocolKind kind)
{
    switch (kind) {
        case ProtocolKind::Ftms:
        case ProtocolKind::YafitS3:
        case ProtocolKind::YafitS4:
        case ProtocolKind::FitShow:
        case ProtocolKind::Tacx:
        case ProtocolKind::Reborn:
            return true;
        default:
            return false;
    }
}

// Vendor protocols rated on par with FTMS even without control
bool isPriority(ProtocolKind kind)
{
    return kind == ProtocolKind::Mobi || kind == ProtocolKind::YafitS3 || kind == ProtocolKind::YafitS4;
}

// Protocols whose control tests run: FTMS family plus Tacx
bool runsControlTests(ProtocolKind kind)
{
    switch (kind) {
        case ProtocolKind::Ftms:
        case ProtocolKind::YafitS3:
        case ProtocolKind::YafitS4:
        case ProtocolKind::Tacx:
            return true;
        default:
            return false;
    }
}

bool isControlTestOp(command::CommandOp op)
{
    return op == command::CommandOp::SetResistanceLevel ||
           op == command::CommandOp::SetTargetPower ||
           op == command::CommandOp::SetSimulationParams;
}

uint8_t ftmsOpCode(command::CommandOp op)
{
    switch (op) {
        case command::CommandOp::RequestControl:      return command::FTMS_OP_REQUEST_CONTROL_;
        case command::CommandOp::Reset:               return command::FTMS_OP_RESET_;
        case command::CommandOp::Start:               return command::FTMS_OP_START_;
        case command::CommandOp::Stop:                return command::FTMS_OP_STOP_;
        case command::CommandOp::Pause:               return command::FTMS_OP_PAUSE_;
        case command::CommandOp::SetResistanceLevel:  return command::FTMS_OP_SET_RESISTANCE_;
        case command::CommandOp::SetTargetPower:      return command::FTMS_OP_SET_POWER_;
        case command::CommandOp::SetSimulationParams: return command::FTMS_OP_SET_SIM_PARAMS_;
    }
    return 0xFF;
}

bool controlTestFailed(const TestReport& report, command::CommandOp op)
{
    auto it = report.control_tests.find(op);
    if (it == report.control_tests.end()) return false;
    return it->second.status == ControlStatus::Failed || it->second.status == ControlStatus::Pending;
}

void addUnique(std::vector<Reason>& out, Reason reason)
{
    if (std::find(out.begin(), out.end(), reason) == out.end()) {
        out.push_back(reason);
    }
}

bool has(const std::vector<Reason>& reasons, Reason reason)
{
    return std::find(reasons.begin(), reasons.end(), reason) != reasons.end();
}

std::string summaryLine(const TestReport& report)
{
    const std::vector<Reason>& reasons = report.reasons;
    switch (report.level) {
        case CompatibilityLevel::Impossible:
            if (has(reasons, Reason::Stopped)) return "Test stopped before completion";
            if (has(reasons, Reason::Cadence)) return "Cadence was not detected";
            return "No supported protocol";

        case CompatibilityLevel::PartiallyCompatible:
            return "Partially compatible: riding works, some features are limited";

        case CompatibilityLevel::NeedsModification: {
            std::vector<const char*> issues;
            if (has(reasons, Reason::AutoChange)) issues.push_back("resistance changes unexpectedly");
            if (has(reasons, Reason::Gear)) {
                issues.push_back(report.Field(DataField::Resistance).detected
                                     ? "gears must be changed on the trainer"
                                     : "gear stays at the default level");
            }
            if (has(reasons, Reason::Erg)) issues.push_back("ERG mode is unavailable");
            if (has(reasons, Reason::Sim)) issues.push_back("simulation mode is unavailable");
            if (has(reasons, Reason::ControlCommand)) issues.push_back("control commands are limited");

            std::string line = "Usable after adjustments";
            for (size_t i = 0; i < issues.size(); ++i) {
                line += (i == 0) ? ", but " : ", ";
                line += issues[i];
            }
            return line;
        }

        case CompatibilityLevel::FullyCompatible:
            return "Fully compatible";
    }
    return "";
}

} // namespace

// -------- NAMES --------

const char* ToString(ControlStatus status) noexcept
{
    switch (status) {
        case ControlStatus::Pending:      return "Pending";
        case ControlStatus::Ok:           return "OK";
        case ControlStatus::Failed:       return "Failed";
        case ControlStatus::NotSupported: return "Not Supported";
    }
    return "Unknown";
}

const char* ToString(DataField field) noexcept
{
    switch (field) {
        case DataField::Speed:      return "speed";
        case DataField::Cadence:    return "cadence";
        case DataField::Power:      return "power";
        case DataField::Resistance: return "resistance";
        case DataField::HeartRate:  return "heartRate";
        case DataField::Distance:   return "distance";
        case DataField::Gear:       return "gear";
        case DataField::Battery:    return "battery";
    }
    return "unknown";
}

const char* ToString(ChangeCause cause) noexcept
{
    switch (cause) {
        case ChangeCause::Command:        return "command";
        case ChangeCause::DelayedCommand: return "delayed command";
        case ChangeCause::Automatic:      return "automatic";
    }
    return "unknown";
}

const char* ToString(CompatibilityLevel level) noexcept
{
    switch (level) {
        case CompatibilityLevel::FullyCompatible:     return "Fully compatible";
        case CompatibilityLevel::PartiallyCompatible: return "Partially compatible";
        case CompatibilityLevel::NeedsModification:   return "Needs modification";
        case CompatibilityLevel::Impossible:          return "Impossible";
    }
    return "Unknown";
}

const char* ToString(Reason reason) noexcept
{
    switch (reason) {
        case Reason::Stopped:        return "stopped";
        case Reason::Cadence:        return "rpm";
        case Reason::Protocol:       return "protocol";
        case Reason::ControlCommand: return "controlCommand";
        case Reason::BasicFunction:  return "basicFunction";
        case Reason::Gear:           return "gear";
        case Reason::Erg:            return "erg";
        case Reason::Sim:            return "sim";
        case Reason::AutoChange:     return "autoChange";
    }
    return "unknown";
}

// -------- REPORT HELPERS --------

void UpdateDataField(TestReport& report, DataField field, float value)
{
    FieldStats& stats = report.fields[static_cast<size_t>(field)];
    if (!stats.detected) {
        stats.detected = true;
        stats.minimum = value;
        stats.maximum = value;
    } else {
        stats.minimum = std::min(stats.minimum, value);
        stats.maximum = std::max(stats.maximum, value);
    }
    stats.current = value;
}

void TrackResistanceChange(TestReport& report, uint32_t timestamp_ms, std::optional<float> old_value,
                           float new_value, ChangeCause cause, command::CommandOp op)
{
    ResistanceChange change;
    change.timestamp_ms = timestamp_ms;
    change.old_value = old_value;
    change.new_value = new_value;
    change.cause = cause;
    change.op = op;
    report.resistance_changes.push_back(change);
}

size_t AutomaticChangeCount(const TestReport& report)
{
    return static_cast<size_t>(std::count_if(
        report.resistance_changes.begin(), report.resistance_changes.end(),
        [](const ResistanceChange& c) { return c.cause == ChangeCause::Automatic && c.old_value.has_value(); }));
}

void DetermineCompatibility(TestReport& report)
{
    const std::vector<ProtocolKind>& protocols = report.supported_protocols;
    const bool has_ftms = std::any_of(protocols.begin(), protocols.end(), isFtmsBased);
    const bool has_priority = std::any_of(protocols.begin(), protocols.end(), isPriority);
    const bool has_csc = contains(protocols, ProtocolKind::Csc);
    const bool has_reborn = contains(protocols, ProtocolKind::Reborn);
    const bool has_fitshow = contains(protocols, ProtocolKind::FitShow);
    const bool cadence = report.Field(DataField::Cadence).detected;

    std::vector<Reason> impossible;
    std::vector<Reason> partial;
    std::vector<Reason> warning;

    if (report.interrupted) {
        addUnique(impossible, Reason::Stopped);
    }
    // Priority vendors may omit cadence, unless they are Reborn or FitShow
    if (!cadence && (!has_priority || has_reborn || has_fitshow)) {
        addUnique(impossible, Reason::Cadence);
    }
    if (has_reborn || has_fitshow) {
        addUnique(partial, Reason::ControlCommand);
    }
    if (!has_ftms && !has_csc && !has_priority && !has_reborn) {
        addUnique(impossible, Reason::Protocol);
    } else if (!has_ftms && (has_priority || has_reborn || has_csc)) {
        addUnique(partial, Reason::BasicFunction);
    }
    if (!report.Field(DataField::Resistance).detected) {
        addUnique(partial, Reason::Gear);
    }
    if (has_ftms) {
        if (controlTestFailed(report, command::CommandOp::SetResistanceLevel)) addUnique(partial, Reason::Gear);
        if (controlTestFailed(report, command::CommandOp::SetTargetPower)) addUnique(partial, Reason::Erg);
        if (controlTestFailed(report, command::CommandOp::SetSimulationParams)) addUnique(partial, Reason::Sim);
    }
    if (AutomaticChangeCount(report) >= AUTO_CHANGE_LIMIT_) {
        addUnique(warning, Reason::AutoChange);
    }

    report.reasons.clear();
    if (!impossible.empty()) {
        report.level = CompatibilityLevel::Impossible;
        report.reasons = impossible;
    } else if (!warning.empty()) {
        report.level = CompatibilityLevel::NeedsModification;
        report.reasons = partial;
        for (Reason r : warning) addUnique(report.reasons, r);
    } else if (!partial.empty()) {
        report.level = CompatibilityLevel::PartiallyCompatible;
        report.reasons = partial;
    } else if (has_ftms || has_priority) {
        report.level = CompatibilityLevel::FullyCompatible;
    } else {
        report.level = CompatibilityLevel::Impossible;
        report.reasons = {Reason::Protocol};
    }

    report.notes.clear();
    report.notes.push_back(summaryLine(report));
    if (has_reborn) {
        report.notes.push_back("Reborn: telemetry only after the authentication handshake, no control commands");
    }
    if (has_fitshow) {
        report.notes.push_back("FitShow: start, stop, pause and resistance levels 1..32 only");
    }
}

// -------- TESTER --------

CompatibilityTester::CompatibilityTester(TrainerSession& session, SettleWaiter& waiter, EventLog& log,
                                         EventLog::ClockFn clock)
    : session_(session)
    , waiter_(waiter)
    , log_(log)
    , clock_(clock ? clock : tickClockMs)
    , running_(false)
    , stop_requested_(false)
{
}

esp_err_t CompatibilityTester::Run(const std::string& device_id, const std::string& name, TestReport& out,
                                   uint32_t duration_ms)
{
    const uint32_t start_ms = clock_();
    bool busy = false;
    {
        MutexGuard lock(mutex_);
        busy = running_;
        if (!busy) {
            running_ = true;
            stop_requested_ = false;
            report_ = TestReport{};
            report_.device_id = device_id;
            report_.device_name = name;
            tracking_ = Tracking{};
        }
    }
    if (busy) {
        log_.Warning("Compatibility test already running");
        return ESP_ERR_INVALID_STATE;
    }

    session_.SetTelemetryCallback([this](ProtocolKind kind, const TelemetryRecord& record) {
        (void)kind;
        onTelemetry(record);
    });
    session_.SetControlPointCallback([this](const ControlPointResponse& response) {
        onControlPoint(response);
    });

    log_.Info("Compatibility test of '%s' started (%u ms)", name.c_str(), (unsigned)duration_ms);
    esp_err_t err = session_.Connect(device_id, name);
    if (err == ESP_OK) {
        const DeviceDescriptor device = session_.Device();
        const std::optional<ProtocolKind> protocol = session_.DetectedProtocol();
        const std::vector<ProtocolKind> supported = session_.AllDetectedProtocols();
        const InitResult capabilities = session_.DeviceCapabilities();
        MutexGuard lock(mutex_);
        report_.connected = true;
        report_.connected_ms = clock_();
        report_.services = device.services;
        report_.protocol = protocol;
        report_.supported_protocols = supported;
        report_.capabilities = capabilities;
    }
    if (err == ESP_OK) err = session_.SubscribeNotifications();
    if (err == ESP_OK) err = session_.RunConnectSequence(SequenceMode::Full);

    if (err != ESP_OK) {
        log_.Error("Compatibility test could not connect: %s", ErrorToName(err));
        MutexGuard lock(mutex_);
        report_.issues.push_back(std::string("Connection error: ") + ErrorToName(err));
    } else {
        const ProtocolKind kind = session_.DetectedProtocol().value_or(ProtocolKind::Csc);
        if (runsControlTests(kind)) {
            runControlTests();
        } else {
            log_.Info("%s: control tests skipped, collecting telemetry only", ToString(kind));
        }

        const uint32_t elapsed = clock_() - start_ms;
        if (elapsed < duration_ms && keepRunning()) {
            log_.Info("Collecting data for %u ms", (unsigned)(duration_ms - elapsed));
            waitFor(duration_ms - elapsed);
        }
    }

    finish(out);

    if (session_.State() != SessionState::Disconnected) {
        // Let in-flight acknowledgements land before tearing down
        waiter_.Wait(FINAL_SETTLE_MS_);
        esp_err_t derr = session_.Disconnect();
        if (derr != ESP_OK) {
            log_.Warning("Disconnect after test failed: %s", ErrorToName(derr));
        }
    }
    session_.SetTelemetryCallback(nullptr);
    session_.SetControlPointCallback(nullptr);
    {
        MutexGuard lock(mutex_);
        running_ = false;
    }
    return err;
}

void CompatibilityTester::Stop()
{
    bool was_running = false;
    {
        MutexGuard lock(mutex_);
        was_running = running_;
        if (running_) stop_requested_ = true;
    }
    if (was_running) {
        log_.Warning("Compatibility test stop requested");
    }
}

bool CompatibilityTester::IsRunning() const
{
    MutexGuard lock(mutex_);
    return running_;
}

// -------- CONTROL TESTS --------

void CompatibilityTester::runControlTests()
{
    command::SimulationParams sim;
    sim.wind_speed_mps = 0.0f;
    sim.grade_pct = TEST_GRADE_PCT_;

    if (!keepRunning()) return;
    testCommand(command::Command::Simulation(sim));

    if (!keepRunning()) return;
    testCommand(command::Command::TargetPower(TEST_POWER_W_));
    if (!waitFor(AFTER_POWER_TEST_MS_)) return;

    testCommand(command::Command::Resistance(TEST_RESISTANCE_));
    waitFor(AFTER_RESISTANCE_TEST_MS_);
}

void CompatibilityTester::testCommand(const command::Command& cmd)
{
    const char* name = command::ToString(cmd.op);
    {
        MutexGuard lock(mutex_);
        tracking_.pending = true;
        tracking_.noted = false;
        tracking_.has_command = true;
        tracking_.last_op = cmd.op;
        tracking_.sent_ms = clock_();
        if (report_.control_tests.find(cmd.op) == report_.control_tests.end()) {
            ControlTestResult result;
            result.timestamp_ms = tracking_.sent_ms;
            report_.control_tests.emplace(cmd.op, result);
        }
    }

    log_.Info("Testing %s", name);
    esp_err_t err = session_.SendCommand(cmd);
    if (err != ESP_OK) {
        const bool unsupported = (err == ERR_UNSUPPORTED_OPERATION_ || err == ERR_NO_VENDOR_FRAME_);
        {
            MutexGuard lock(mutex_);
            ControlTestResult& result = report_.control_tests[cmd.op];
            result.status = unsupported ? ControlStatus::NotSupported : ControlStatus::Failed;
            result.details = std::string(unsupported ? "Not supported: " : "Error: ") + ErrorToName(err);
            tracking_.pending = false;
            if (!unsupported) tracking_.window_end_ms = clock_() + ERROR_WINDOW_MS_;
        }
        if (unsupported) {
            log_.Info("%s not supported by this protocol", name);
        } else {
            log_.Error("%s failed: %s", name, ErrorToName(err));
        }
        return;
    }

    waitFor(cmd.op == command::CommandOp::SetTargetPower ? POWER_RESPONSE_MS_ : COMMAND_RESPONSE_MS_);

    bool timed_out = false;
    ControlTestResult result;
    {
        MutexGuard lock(mutex_);
        ControlTestResult& entry = report_.control_tests[cmd.op];
        if (entry.status == ControlStatus::Pending) {
            entry.status = ControlStatus::Failed;
            entry.details = entry.acknowledged
                ? "CP response successful but no resistance change observed within timeout"
                : "No CP response received within timeout";
            tracking_.pending = false;
            tracking_.window_end_ms = clock_() + TIMEOUT_WINDOW_MS_;
            timed_out = true;
        }
        result = entry;
    }

    if (timed_out) {
        log_.Warning("%s: %s", name, result.details.c_str());
    } else if (result.status == ControlStatus::Ok) {
        log_.Success("%s: %s", name, result.details.c_str());
    } else {
        log_.Warning("%s %s: %s", name, ToString(result.status), result.details.c_str());
    }
}

// -------- NOTIFICATIONS --------

void CompatibilityTester::onControlPoint(const ControlPointResponse& response)
{
    command::CommandOp op = command::CommandOp::RequestControl;
    const bool success = response.IsSuccess();
    {
        MutexGuard lock(mutex_);
        if (!running_ || !tracking_.pending) return;
        if (ftmsOpCode(tracking_.last_op) != response.request_op_code) return;

        op = tracking_.last_op;
        ControlTestResult& result = report_.control_tests[op];
        if (success) {
            result.acknowledged = true;
            result.details = "CP response: success, waiting for a resistance change";
        } else {
            result.status = ControlStatus::Failed;
            result.details = std::string("CP response: ") + control_point::ResultCodeName(response.result_code);
            tracking_.pending = false;
            tracking_.window_end_ms = clock_() + REJECTED_WINDOW_MS_;
        }
    }

    if (success) {
        log_.Info("%s acknowledged, waiting for a resistance change", command::ToString(op));
    } else {
        log_.Warning("%s rejected: %s", command::ToString(op),
                     control_point::ResultCodeName(response.result_code));
    }
}

void CompatibilityTester::onTelemetry(const TelemetryRecord& record)
{
    const uint32_t now = clock_();
    std::optional<ResistanceChange> change;
    bool confirmed = false;
    uint32_t after_ms = 0;
    {
        MutexGuard lock(mutex_);
        if (!running_) return;

        if (record.instantaneous_speed) UpdateDataField(report_, DataField::Speed, *record.instantaneous_speed);
        if (record.instantaneous_cadence) UpdateDataField(report_, DataField::Cadence, *record.instantaneous_cadence);
        if (record.instantaneous_power) UpdateDataField(report_, DataField::Power, *record.instantaneous_power);
        if (record.heart_rate) UpdateDataField(report_, DataField::HeartRate, *record.heart_rate);
        if (record.total_distance) {
            UpdateDataField(report_, DataField::Distance, static_cast<float>(*record.total_distance));
        }
        if (record.gear_level) UpdateDataField(report_, DataField::Gear, *record.gear_level);
        if (record.battery_level) UpdateDataField(report_, DataField::Battery, *record.battery_level);

        if (record.resistance_level) {
            const float level = *record.resistance_level;
            if (!tracking_.has_resistance || tracking_.last_resistance != level) {
                std::optional<float> old_value;
                if (tracking_.has_resistance) old_value = tracking_.last_resistance;

                ChangeCause cause = ChangeCause::Automatic;
                if (tracking_.pending && !tracking_.noted) {
                    cause = ChangeCause::Command;
                } else if (!tracking_.pending && tracking_.has_command && tracking_.window_end_ms > now) {
                    cause = ChangeCause::DelayedCommand;
                }
                const command::CommandOp op = tracking_.last_op;
                TrackResistanceChange(report_, now, old_value, level, cause, op);
                change = report_.resistance_changes.back();

                if (cause == ChangeCause::Command && isControlTestOp(op)) {
                    after_ms = now - tracking_.sent_ms;
                    char details[96];
                    if (old_value) {
                        snprintf(details, sizeof(details), "Resistance changed from %.1f to %.1f after %u ms",
                                 *old_value, level, (unsigned)after_ms);
                    } else {
                        snprintf(details, sizeof(details), "Resistance reported as %.1f after %u ms",
                                 level, (unsigned)after_ms);
                    }
                    ControlTestResult& result = report_.control_tests[op];
                    result.status = ControlStatus::Ok;
                    result.details = details;
                    tracking_.noted = true;
                    tracking_.pending = false;
                    tracking_.window_end_ms = now + (op == command::CommandOp::SetTargetPower
                                                         ? POWER_WINDOW_MS_ : COMMAND_WINDOW_MS_);
                    confirmed = true;
                }

                tracking_.has_resistance = true;
                tracking_.last_resistance = level;
            }
            UpdateDataField(report_, DataField::Resistance, level);
        }
    }

    if (change) {
        log_.Info("Resistance %.1f (%s%s%s)", change->new_value, ToString(change->cause),
                  change->cause == ChangeCause::Automatic ? "" : ": ",
                  change->cause == ChangeCause::Automatic ? "" : command::ToString(change->op));
    }
    if (confirmed) {
        log_.Success("%s confirmed by a resistance change after %u ms",
                     command::ToString(change->op), (unsigned)after_ms);
    }
}

// -------- WAITING / WRAP-UP --------

bool CompatibilityTester::waitFor(uint32_t ms)
{
    while (ms > 0) {
        if (!keepRunning()) return false;
        const uint32_t slice = std::min(ms, CHECK_INTERVAL_MS_);
        waiter_.Wait(slice);
        ms -= slice;
    }
    return keepRunning();
}

bool CompatibilityTester::keepRunning()
{
    const char* issue = nullptr;
    bool stop = false;
    {
        MutexGuard lock(mutex_);
        stop = stop_requested_;
    }
    if (stop) {
        issue = "Test stopped";
    } else if (session_.State() != SessionState::Active) {
        issue = "Device connection lost during test";
    }
    if (issue == nullptr) return true;

    bool first = false;
    {
        MutexGuard lock(mutex_);
        if (!report_.interrupted) {
            report_.interrupted = true;
            report_.issues.push_back(issue);
            first = true;
        }
    }
    if (first) {
        log_.Error("%s", issue);
    }
    return false;
}

void CompatibilityTester::resolvePendingAtEnd()
{
    bool failed = false;
    command::CommandOp op = command::CommandOp::RequestControl;
    {
        MutexGuard lock(mutex_);
        if (!tracking_.pending) return;
        op = tracking_.last_op;
        if (!tracking_.noted) {
            ControlTestResult& result = report_.control_tests[op];
            if (result.status == ControlStatus::Pending) {
                result.status = ControlStatus::Failed;
                result.details = "No CP response and no resistance change within timeout";
                failed = true;
            }
        }
        tracking_.pending = false;
        tracking_.window_end_ms = clock_() + TIMEOUT_WINDOW_MS_;
    }
    if (failed) {
        log_.Warning("%s still pending at the end of the test", command::ToString(op));
    }
}

void CompatibilityTester::finish(TestReport& out)
{
    resolvePendingAtEnd();

    CompatibilityLevel level = CompatibilityLevel::Impossible;
    {
        MutexGuard lock(mutex_);
        report_.completed = true;
        report_.completed_ms = clock_();
        DetermineCompatibility(report_);
        level = report_.level;
        out = report_;
    }
    log_.Success("Compatibility test finished: %s", ToString(level));
}

} // namespace compat
} // namespace trainer_link
