/**
 * @file protocol_handler.hpp
 * @brief Per-protocol behaviour bound once when the session detects a device
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "esp_err.h"
#include "command_encoder.hpp"
#include "control_point.hpp"
#include "event_log.hpp"
#include "transport.hpp"
#include "trainer_types.hpp"

namespace trainer_link {

using DecodeFn = TelemetryRecord (*)(const uint8_t* data, size_t len);

// Enum class: PascalCase
enum class ChannelRole : uint8_t {
    Telemetry = 0,
    ControlPoint,   // FTMS acknowledgements
    RebornData      // handshake replies + telemetry, routed by frame shape
};

/**
 * @brief One characteristic the session subscribes to.
 *
 * Optional channels are subscribed only if discovery found them, and a failed
 * subscription there is a warning instead of an error.
 */
struct NotifyChannel {
    BleUuid     service;
    BleUuid     characteristic;
    ChannelRole role = ChannelRole::Telemetry;
    DecodeFn    decode = nullptr;
    bool        optional = false;
    bool        derive_crank_cadence = false;
};

enum class SequenceStyle : uint8_t {
    ReadOnly = 0,       // Active immediately
    ControlStrict,      // request control -> reset -> start must all succeed
    ControlBestEffort,  // same steps, failures logged, Active regardless
    Handshake           // send the challenge, Active without waiting for the verdict
};

/// Vendor frame written ahead of the control steps, followed by its own delay.
struct PreambleStep {
    const char*  name = "";
    CommandFrame frame;
    uint32_t     settle_ms = 0;
};

/// Static device facts read while Initializing.
struct InitResult {
    std::optional<uint32_t>                      feature_bits;
    std::optional<control_point::SupportedRange> speed_range;
    std::optional<control_point::SupportedRange> incline_range;
    std::optional<control_point::SupportedRange> resistance_range;
    std::optional<control_point::SupportedRange> power_range;
};

class ProtocolHandler {
public:
    virtual ~ProtocolHandler() = default;

    // Public functions: PascalCase
    virtual ProtocolKind Kind() const noexcept = 0;
    virtual SequenceStyle Sequence() const noexcept = 0;
    virtual std::vector<NotifyChannel> Channels() const = 0;

    /// Default: ERR_UNSUPPORTED_OPERATION_.
    virtual esp_err_t Encode(const command::Command& cmd, CommandFrame& out) const;

    /// One-time setup after detection. Default logs and succeeds.
    virtual esp_err_t Initialize(Transport& transport, EventLog& log, InitResult& out);

    /// Default: no vendor preamble.
    virtual esp_err_t VendorPreamble(const command::DelayPolicy& delays,
                                     std::vector<PreambleStep>& steps) const;

    bool SupportsControl() const noexcept;
    bool RequiresHandshake() const noexcept { return Sequence() == SequenceStyle::Handshake; }

protected:
    ProtocolHandler() noexcept = default;
};

} // namespace trainer_link
