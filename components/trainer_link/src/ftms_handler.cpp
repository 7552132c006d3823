/**
 * @file ftms_handler.cpp
 * @brief FTMS-family handler
 */

#include "ftms_handler.hpp"
#include "gatt_uuids.hpp"
#include "telemetry_codec.hpp"
#include "trainer_err.hpp"

namespace trainer_link {

namespace {

struct RangeSpec {
    const BleUuid* characteristic;
    const char*    name;
    float          scale;
    const char*    unit;
    std::optional<control_point::SupportedRange> InitResult::* slot;
};

const RangeSpec RANGES_[] = {
    {&gatt::FTMS_SPEED_RANGE_CHAR_,      "speed",       0.01f, "km/h", &InitResult::speed_range},
    {&gatt::FTMS_INCLINE_RANGE_CHAR_,    "inclination", 0.1f,  "%",    &InitResult::incline_range},
    {&gatt::FTMS_RESISTANCE_RANGE_CHAR_, "resistance",  1.0f,  "",     &InitResult::resistance_range},
    {&gatt::FTMS_POWER_RANGE_CHAR_,      "power",       1.0f,  "W",    &InitResult::power_range},
};

} // namespace

FtmsHandler::FtmsHandler(ProtocolKind kind) noexcept
    : kind_(kind)
{
}

std::vector<NotifyChannel> FtmsHandler::Channels() const
{
    NotifyChannel cp;
    cp.service = gatt::FTMS_SERVICE_;
    cp.characteristic = gatt::FTMS_CONTROL_POINT_CHAR_;
    cp.role = ChannelRole::ControlPoint;

    NotifyChannel data;
    data.service = gatt::FTMS_SERVICE_;
    data.characteristic = gatt::FTMS_INDOOR_BIKE_DATA_CHAR_;
    data.decode = codec::DecodeIndoorBikeData;

    return {cp, data};
}

esp_err_t FtmsHandler::Encode(const command::Command& cmd, CommandFrame& out) const
{
    return command::EncodeFtms(cmd, gatt::FTMS_SERVICE_, gatt::FTMS_CONTROL_POINT_CHAR_, out);
}

esp_err_t FtmsHandler::Initialize(Transport& transport, EventLog& log, InitResult& out)
{
    if (kind_ != ProtocolKind::Ftms) {
        log.Info("%s: FTMS-compatible, skipping feature read", ToString(kind_));
        return ESP_OK;
    }

    std::vector<uint8_t> value;
    esp_err_t err = transport.Read(gatt::FTMS_SERVICE_, gatt::FTMS_FEATURE_CHAR_, value);
    if (err != ESP_OK) {
        log.Error("Read FTMS features failed: %s", ErrorToName(err));
        return err;
    }

    uint32_t bits = 0;
    if (!control_point::ParseFeatureBits(value.data(), value.size(), bits)) {
        log.Error("FTMS feature value too short (%u bytes)", (unsigned)value.size());
        return ESP_ERR_INVALID_SIZE;
    }
    out.feature_bits = bits;
    log.Info("FTMS features 0x%08lx: %s", (unsigned long)bits,
             control_point::DescribeFeatures(bits).c_str());

    for (const auto& r : RANGES_) {
        if (!transport.HasCharacteristic(gatt::FTMS_SERVICE_, *r.characteristic)) {
            log.Warning("Supported %s range characteristic not present", r.name);
            continue;
        }

        value.clear();
        err = transport.Read(gatt::FTMS_SERVICE_, *r.characteristic, value);
        control_point::SupportedRange range;
        if (err != ESP_OK ||
            !control_point::ParseSupportedRange(value.data(), value.size(), r.scale, range)) {
            log.Warning("Supported %s range unavailable", r.name);
            continue;
        }
        out.*(r.slot) = range;
        log.Info("Supported %s range %.2f..%.2f %s (step %.2f)", r.name,
                 range.minimum, range.maximum, r.unit, range.increment);
    }
    return ESP_OK;
}

} // namespace trainer_link
