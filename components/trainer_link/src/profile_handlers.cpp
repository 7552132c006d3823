/**
 * @file profile_handlers.cpp
 * @brief CSC, CPS, HRS, BMS, DIS and NUS handlers
 */

#include "profile_handlers.hpp"
#include "gatt_uuids.hpp"
#include "telemetry_codec.hpp"
#include "trainer_err.hpp"

#include <string>

namespace trainer_link {

namespace {

NotifyChannel channel(const BleUuid& service, const BleUuid& characteristic, DecodeFn decode)
{
    NotifyChannel ch;
    ch.service = service;
    ch.characteristic = characteristic;
    ch.decode = decode;
    return ch;
}

} // namespace

std::vector<NotifyChannel> CscHandler::Channels() const
{
    NotifyChannel ch = channel(gatt::CSC_SERVICE_, gatt::CSC_MEASUREMENT_CHAR_, codec::DecodeCsc);
    ch.derive_crank_cadence = true;
    return {ch};
}

std::vector<NotifyChannel> CpsHandler::Channels() const
{
    return {channel(gatt::CPS_SERVICE_, gatt::CPS_MEASUREMENT_CHAR_, codec::DecodeCyclingPower)};
}

std::vector<NotifyChannel> HrsHandler::Channels() const
{
    return {channel(gatt::HRS_SERVICE_, gatt::HRS_MEASUREMENT_CHAR_, codec::DecodeHeartRate)};
}

std::vector<NotifyChannel> BmsHandler::Channels() const
{
    return {channel(gatt::BMS_SERVICE_, gatt::BMS_LEVEL_CHAR_, codec::DecodeBattery)};
}

std::vector<NotifyChannel> NusHandler::Channels() const
{
    return {channel(gatt::NUS_SERVICE_, gatt::NUS_READ_CHAR_, codec::DecodeRawOnly)};
}

esp_err_t DisHandler::Initialize(Transport& transport, EventLog& log, InitResult& out)
{
    (void)out;
    if (!transport.HasCharacteristic(gatt::DIS_SERVICE_, gatt::DIS_MANUFACTURER_CHAR_)) {
        log.Info("DIS: no manufacturer name characteristic");
        return ESP_OK;
    }

    std::vector<uint8_t> value;
    esp_err_t err = transport.Read(gatt::DIS_SERVICE_, gatt::DIS_MANUFACTURER_CHAR_, value);
    if (err != ESP_OK) {
        log.Warning("DIS: manufacturer read failed: %s", ErrorToName(err));
        return ESP_OK;
    }
    const std::string manufacturer(value.begin(), value.end());
    log.Info("DIS: manufacturer '%s'", manufacturer.c_str());
    return ESP_OK;
}

} // namespace trainer_link
