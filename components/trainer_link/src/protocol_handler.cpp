/**
 * @file protocol_handler.cpp
 * @brief Default handler behaviour
 */

#include "protocol_handler.hpp"
#include "protocol_detector.hpp"
#include "trainer_err.hpp"

namespace trainer_link {

esp_err_t ProtocolHandler::Encode(const command::Command& cmd, CommandFrame& out) const
{
    (void)cmd;
    (void)out;
    return ERR_UNSUPPORTED_OPERATION_;
}

esp_err_t ProtocolHandler::Initialize(Transport& transport, EventLog& log, InitResult& out)
{
    (void)transport;
    (void)out;
    log.Info("%s: no protocol-specific initialization", ToString(Kind()));
    return ESP_OK;
}

esp_err_t ProtocolHandler::VendorPreamble(const command::DelayPolicy& delays,
                                          std::vector<PreambleStep>& steps) const
{
    (void)delays;
    steps.clear();
    return ESP_OK;
}

bool ProtocolHandler::SupportsControl() const noexcept
{
    return detect::SupportsControlCommands(Kind());
}

} // namespace trainer_link
