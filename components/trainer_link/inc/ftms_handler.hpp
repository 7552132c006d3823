/**
 * @file ftms_handler.hpp
 * @brief FTMS-family handler (standard FTMS and the Yafit S3 / S4 variants)
 */

#pragma once

#include "protocol_handler.hpp"

namespace trainer_link {

class FtmsHandler : public ProtocolHandler {
public:
    /// kind must be Ftms, YafitS3 or YafitS4.
    explicit FtmsHandler(ProtocolKind kind) noexcept;

    ProtocolKind Kind() const noexcept override { return kind_; }
    SequenceStyle Sequence() const noexcept override { return SequenceStyle::ControlStrict; }
    std::vector<NotifyChannel> Channels() const override;
    esp_err_t Encode(const command::Command& cmd, CommandFrame& out) const override;

    /// Standard FTMS: feature bitmap (required) and supported ranges (best effort).
    esp_err_t Initialize(Transport& transport, EventLog& log, InitResult& out) override;

private:
    ProtocolKind kind_;
};

} // namespace trainer_link
