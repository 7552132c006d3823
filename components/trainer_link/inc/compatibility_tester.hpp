/**
 * @file compatibility_tester.hpp
 * @brief Timed trainer compatibility run and its report
 *
 * A run connects through a TrainerSession, records which telemetry fields the
 * trainer reports, sends simulation / target power / resistance commands to
 * control-capable protocols and attributes every resistance change to the
 * command that caused it. The finished report carries a compatibility level
 * with the reasons behind it.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "esp_err.h"
#include "command_encoder.hpp"
#include "event_log.hpp"
#include "rtos_mutex.hpp"
#include "settle_waiter.hpp"
#include "trainer_session.hpp"
#include "trainer_types.hpp"

namespace trainer_link {
namespace compat {

// Enum class: PascalCase
enum class ControlStatus : uint8_t {
    Pending = 0,    // sent, waiting for a resistance change
    Ok,
    Failed,
    NotSupported    // the protocol has no frame for this command
};

enum class DataField : uint8_t {
    Speed = 0,
    Cadence,
    Power,
    Resistance,
    HeartRate,
    Distance,
    Gear,
    Battery
};

static constexpr size_t DATA_FIELD_COUNT_ = 8;

enum class ChangeCause : uint8_t {
    Command = 0,        // first change while the command was pending
    DelayedCommand,     // inside the command's attribution window
    Automatic
};

enum class CompatibilityLevel : uint8_t {
    FullyCompatible = 0,
    PartiallyCompatible,
    NeedsModification,
    Impossible
};

enum class Reason : uint8_t {
    Stopped = 0,        // run interrupted or link lost
    Cadence,            // no cadence reported
    Protocol,           // no usable protocol
    ControlCommand,     // vendor protocol without full control
    BasicFunction,      // telemetry-only protocol
    Gear,               // no resistance data or resistance command ignored
    Erg,                // target power command ignored
    Sim,                // simulation command ignored
    AutoChange          // trainer changes resistance on its own
};

const char* ToString(ControlStatus status) noexcept;
const char* ToString(DataField field) noexcept;
const char* ToString(ChangeCause cause) noexcept;
const char* ToString(CompatibilityLevel level) noexcept;
const char* ToString(Reason reason) noexcept;

struct ControlTestResult {
    ControlStatus status       = ControlStatus::Pending;
    uint32_t      timestamp_ms = 0;
    bool          acknowledged = false;   // control point answered with success
    std::string   details;
};

struct FieldStats {
    bool  detected = false;
    float minimum  = 0.0f;
    float maximum  = 0.0f;
    float current  = 0.0f;
};

struct ResistanceChange {
    uint32_t             timestamp_ms = 0;
    std::optional<float> old_value;   // absent for the first reading
    float                new_value = 0.0f;
    ChangeCause          cause = ChangeCause::Automatic;
    command::CommandOp   op = command::CommandOp::RequestControl;  // unless Automatic
};

struct TestReport {
    std::string                 device_name;
    std::string                 device_id;
    std::vector<BleUuid>        services;
    std::optional<ProtocolKind> protocol;
    std::vector<ProtocolKind>   supported_protocols;
    bool                        connected = false;
    uint32_t                    connected_ms = 0;
    InitResult                  capabilities;   // feature bits and supported ranges

    std::array<FieldStats, DATA_FIELD_COUNT_>         fields{};
    std::map<command::CommandOp, ControlTestResult>   control_tests;
    std::vector<ResistanceChange>                     resistance_changes;
    std::vector<std::string>                          issues;

    bool     interrupted = false;
    bool     completed = false;
    uint32_t completed_ms = 0;

    CompatibilityLevel       level = CompatibilityLevel::Impossible;
    std::vector<Reason>      reasons;   // deduplicated, in evaluation order
    std::vector<std::string> notes;     // summary line plus protocol limitations

    const FieldStats& Field(DataField field) const { return fields[static_cast<size_t>(field)]; }
};

// -------- REPORT HELPERS --------

/// Marks the field detected and folds the value into its min / max / current.
void UpdateDataField(TestReport& report, DataField field, float value);

void TrackResistanceChange(TestReport& report, uint32_t timestamp_ms, std::optional<float> old_value,
                           float new_value, ChangeCause cause, command::CommandOp op);

/// Changes the trainer made on its own; the first reading does not count.
size_t AutomaticChangeCount(const TestReport& report);

/**
 * @brief Fills level, reasons and notes from the rest of the report.
 *
 * Impossible wins over NeedsModification, which wins over PartiallyCompatible.
 * Full compatibility needs an FTMS-based or priority (Mobi, Yafit) protocol.
 */
void DetermineCompatibility(TestReport& report);

/**
 * @brief Drives one compatibility run over a session.
 *
 * Run takes over the session's telemetry and control point callbacks for its
 * duration and leaves the session disconnected. Stop may be called from any task.
 */
class CompatibilityTester {
public:
    static constexpr uint32_t DEFAULT_DURATION_MS_    = 20000;
    static constexpr uint32_t CHECK_INTERVAL_MS_      = 2000;   // link / stop check while waiting
    static constexpr uint32_t POWER_RESPONSE_MS_      = 5000;
    static constexpr uint32_t COMMAND_RESPONSE_MS_    = 3000;
    static constexpr uint32_t AFTER_POWER_TEST_MS_    = 4000;
    static constexpr uint32_t AFTER_RESISTANCE_TEST_MS_ = 5000;
    static constexpr uint32_t FINAL_SETTLE_MS_        = 3000;

    // Attribution windows opened after a command resolves
    static constexpr uint32_t POWER_WINDOW_MS_        = 12000;
    static constexpr uint32_t COMMAND_WINDOW_MS_      = 3000;
    static constexpr uint32_t TIMEOUT_WINDOW_MS_      = 2000;
    static constexpr uint32_t REJECTED_WINDOW_MS_     = 1500;
    static constexpr uint32_t ERROR_WINDOW_MS_        = 1000;

    // Commands sent by the control tests
    static constexpr float   TEST_GRADE_PCT_   = 10.0f;
    static constexpr int16_t TEST_POWER_W_     = 50;
    static constexpr float   TEST_RESISTANCE_  = 40.0f;

    CompatibilityTester(TrainerSession& session, SettleWaiter& waiter, EventLog& log,
                        EventLog::ClockFn clock = nullptr);

    CompatibilityTester(const CompatibilityTester&) = delete;
    CompatibilityTester& operator=(const CompatibilityTester&) = delete;

    /**
     * @brief Connects, tests and disconnects. `out` is filled even on failure.
     * @return ESP_ERR_INVALID_STATE if a run is already in progress, otherwise
     *         the session error that ended the run early, or ESP_OK.
     */
    esp_err_t Run(const std::string& device_id, const std::string& name, TestReport& out,
                  uint32_t duration_ms = DEFAULT_DURATION_MS_);

    void Stop();
    bool IsRunning() const;

private:
    struct Tracking {
        bool               pending = false;
        bool               noted = false;   // a change was already credited to the last command
        bool               has_command = false;
        command::CommandOp last_op = command::CommandOp::RequestControl;
        uint32_t           sent_ms = 0;
        uint32_t           window_end_ms = 0;
        bool               has_resistance = false;
        float              last_resistance = 0.0f;
    };

    // Private functions: camelCase
    void onTelemetry(const TelemetryRecord& record);
    void onControlPoint(const ControlPointResponse& response);

    void runControlTests();
    void testCommand(const command::Command& cmd);
    bool waitFor(uint32_t ms);
    bool keepRunning();
    void resolvePendingAtEnd();
    void finish(TestReport& out);

    TrainerSession&   session_;
    SettleWaiter&     waiter_;
    EventLog&         log_;
    EventLog::ClockFn clock_;

    // Guards everything below
    mutable RtosMutex mutex_;
    bool              running_;
    bool              stop_requested_;
    TestReport        report_;
    Tracking          tracking_;
};

} // namespace compat
} // namespace trainer_link
