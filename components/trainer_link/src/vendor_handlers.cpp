/**
 * @file vendor_handlers.cpp
 * @brief Mobi, Reborn, Tacx and FitShow handlers
 */

#include "vendor_handlers.hpp"
#include "gatt_uuids.hpp"
#include "telemetry_codec.hpp"
#include "trainer_err.hpp"

namespace trainer_link {

namespace {

NotifyChannel telemetryChannel(const BleUuid& service, const BleUuid& characteristic,
                               DecodeFn decode, bool optional = false)
{
    NotifyChannel ch;
    ch.service = service;
    ch.characteristic = characteristic;
    ch.decode = decode;
    ch.optional = optional;
    return ch;
}

} // namespace

// -------- MOBI --------

std::vector<NotifyChannel> MobiHandler::Channels() const
{
    return {telemetryChannel(gatt::MOBI_SERVICE_, gatt::MOBI_DATA_CHAR_, codec::DecodeMobi)};
}

// -------- REBORN --------

std::vector<NotifyChannel> RebornHandler::Channels() const
{
    NotifyChannel ch = telemetryChannel(gatt::REBORN_SERVICE_, gatt::REBORN_DATA_CHAR_,
                                        codec::DecodeReborn);
    ch.role = ChannelRole::RebornData;
    return {ch};
}

esp_err_t RebornHandler::Encode(const command::Command& cmd, CommandFrame& out) const
{
    switch (cmd.op) {
        case command::CommandOp::RequestControl:
        case command::CommandOp::Reset:
        case command::CommandOp::Start:
        case command::CommandOp::Stop:
        case command::CommandOp::SetResistanceLevel:
            return command::EncodeFtms(cmd, gatt::REBORN_SERVICE_, gatt::REBORN_WRITE_CHAR_, out);
        default:
            return ERR_NO_VENDOR_FRAME_;
    }
}

// -------- TACX --------

std::vector<NotifyChannel> TacxHandler::Channels() const
{
    return {telemetryChannel(gatt::TACX_SERVICE_, gatt::TACX_READ_CHAR_, codec::DecodeTacx)};
}

esp_err_t TacxHandler::Encode(const command::Command& cmd, CommandFrame& out) const
{
    return command::EncodeTacx(cmd, out);
}

// -------- FITSHOW --------

std::vector<NotifyChannel> FitShowHandler::Channels() const
{
    return {
        telemetryChannel(gatt::FITSHOW_SERVICE_, gatt::FITSHOW_BIKE_DATA_CHAR_, codec::DecodeFitShow),
        // Some units mirror the same vendor layout on the FTMS characteristic
        telemetryChannel(gatt::FTMS_SERVICE_, gatt::FTMS_INDOOR_BIKE_DATA_CHAR_,
                         codec::DecodeFitShow, true),
    };
}

esp_err_t FitShowHandler::Encode(const command::Command& cmd, CommandFrame& out) const
{
    return command::EncodeFitShow(cmd, out);
}

esp_err_t FitShowHandler::VendorPreamble(const command::DelayPolicy& delays,
                                         std::vector<PreambleStep>& steps) const
{
    steps.clear();

    PreambleStep init;
    init.name = "FitShow init";
    init.settle_ms = delays.fitshow_init_ms;
    esp_err_t err = command::FitShowInitFrame(init.frame);
    if (err != ESP_OK) return err;

    PreambleStep start;
    start.name = "FitShow start";
    start.settle_ms = delays.fitshow_start_ms;
    err = command::FitShowStartFrame(start.frame);
    if (err != ESP_OK) return err;

    steps.push_back(init);
    steps.push_back(start);
    return ESP_OK;
}

} // namespace trainer_link
