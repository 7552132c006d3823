/**
 * @file profile_handlers.hpp
 * @brief Read-only handlers for the standard sensor profiles and the UART-style service
 */

#pragma once

#include "protocol_handler.hpp"

namespace trainer_link {

/// Crank cadence is derived by the session from successive measurements.
class CscHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::Csc; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ReadOnly; }
    std::vector<NotifyChannel> Channels() const override;
};

class CpsHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::Cps; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ReadOnly; }
    std::vector<NotifyChannel> Channels() const override;
};

class HrsHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::Hrs; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ReadOnly; }
    std::vector<NotifyChannel> Channels() const override;
};

class BmsHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::Bms; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ReadOnly; }
    std::vector<NotifyChannel> Channels() const override;
};

/// No notifications; the manufacturer name is read and logged once.
class DisHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::Dis; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ReadOnly; }
    std::vector<NotifyChannel> Channels() const override { return {}; }
    esp_err_t Initialize(Transport& transport, EventLog& log, InitResult& out) override;
};

class NusHandler : public ProtocolHandler {
public:
    ProtocolKind Kind() const noexcept override { return ProtocolKind::Nus; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ReadOnly; }
    std::vector<NotifyChannel> Channels() const override;
};

} // namespace trainer_link
