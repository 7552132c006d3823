/**
 * @file vendor_handlers.hpp
 * @brief Handlers for the proprietary trainer protocols
 */

#pragma once

#include "protocol_handler.hpp"

namespace trainer_link {

/// Read-only, single data characteristic.
class MobiHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::Mobi; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ReadOnly; }
    std::vector<NotifyChannel> Channels() const override;
};

/**
 * @brief Handshake-gated telemetry. Encodes the FTMS opcode subset the device
 *        accepts on its write characteristic, though the session never sends
 *        control commands to it.
 */
class RebornHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::Reborn; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::Handshake; }
    std::vector<NotifyChannel> Channels() const override;
    esp_err_t Encode(const command::Command& cmd, CommandFrame& out) const override;
};

class TacxHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::Tacx; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ControlBestEffort; }
    std::vector<NotifyChannel> Channels() const override;
    esp_err_t Encode(const command::Command& cmd, CommandFrame& out) const override;
};

/// Telemetry from 0xFFF3 and, when present, the FTMS indoor bike data characteristic.
class FitShowHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::FitShow; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ControlBestEffort; }
    std::vector<NotifyChannel> Channels() const override;
    esp_err_t Encode(const command::Command& cmd, CommandFrame& out) const override;

    /// Vendor init, then vendor start.
    esp_err_t VendorPreamble(const command::DelayPolicy& delays,
                             std::vector<PreambleStep>& steps) const override;
};

} // namespace trainer_link
