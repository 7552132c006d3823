/**
 * @file telemetry_codec.cpp
 * @brief Per-protocol telemetry decoders
 */

#include "telemetry_codec.hpp"

#include <algorithm>
#include <cmath>

namespace trainer_link {
namespace codec {

namespace {

/// Little-endian cursor over a notification payload. Reads never run past len.
class FrameReader {
public:
    FrameReader(const uint8_t* data, size_t len) noexcept
        : data_(data)
        , len_(data ? len : 0)
        , pos_(0)
    {
    }

    bool CanRead(size_t n) const noexcept { return pos_ + n <= len_; }
    void Skip(size_t n) noexcept { pos_ += n; }

    uint8_t U8() noexcept { return data_[pos_++]; }

    uint16_t U16() noexcept
    {
        uint16_t v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }

    int16_t I16() noexcept { return static_cast<int16_t>(U16()); }

    uint32_t U24() noexcept
    {
        uint32_t v = static_cast<uint32_t>(data_[pos_]) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 16);
        pos_ += 3;
        return v;
    }

private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_;
};

TelemetryRecord withRaw(const uint8_t* data, size_t len)
{
    TelemetryRecord rec;
    rec.raw = ToHex(data, len);
    return rec;
}

} // namespace

TelemetryRecord DecodeIndoorBikeData(const uint8_t* data, size_t len)
{
    TelemetryRecord rec = withRaw(data, len);
    FrameReader r(data, len);
    if (!r.CanRead(2)) return rec;

    const uint16_t flags = r.U16();
    rec.flags = flags;

    // Fields are laid out in bit order; stop at the first one that does not fit.
    if (!(flags & IBD_MORE_DATA_)) {
        if (!r.CanRead(2)) return rec;
        rec.instantaneous_speed = r.U16() / 100.0f;
    }
    if (flags & IBD_AVERAGE_SPEED_) {
        if (!r.CanRead(2)) return rec;
        rec.average_speed = r.U16() / 100.0f;
    }
    if (flags & IBD_INSTANT_CADENCE_) {
        if (!r.CanRead(2)) return rec;
        rec.instantaneous_cadence = r.U16() / 2.0f;
    }
    if (flags & IBD_AVERAGE_CADENCE_) {
        if (!r.CanRead(2)) return rec;
        rec.average_cadence = r.U16() / 2.0f;
    }
    if (flags & IBD_TOTAL_DISTANCE_) {
        if (!r.CanRead(3)) return rec;
        rec.total_distance = r.U24();
    }
    if (flags & IBD_RESISTANCE_LEVEL_) {
        if (!r.CanRead(2)) return rec;
        rec.resistance_level = static_cast<float>(r.I16());
    }
    if (flags & IBD_INSTANT_POWER_) {
        if (!r.CanRead(2)) return rec;
        rec.instantaneous_power = r.I16();
    }
    if (flags & IBD_AVERAGE_POWER_) {
        if (!r.CanRead(2)) return rec;
        rec.average_power = r.I16();
    }
    if (flags & IBD_EXPENDED_ENERGY_) {
        if (!r.CanRead(2)) return rec;
        rec.expended_energy = r.U16();
    }
    if (flags & IBD_HEART_RATE_) {
        if (!r.CanRead(1)) return rec;
        rec.heart_rate = r.U8();
    }
    if (flags & IBD_METABOLIC_EQUIV_) {
        if (!r.CanRead(1)) return rec;
        rec.metabolic_equivalent = r.U8() / 10.0f;
    }
    if (flags & IBD_ELAPSED_TIME_) {
        if (!r.CanRead(2)) return rec;
        rec.elapsed_time = r.U16();
    }
    if (flags & IBD_REMAINING_TIME_) {
        if (!r.CanRead(2)) return rec;
        rec.remaining_time = r.U16();
    }
    return rec;
}

TelemetryRecord DecodeCsc(const uint8_t* data, size_t len)
{
    TelemetryRecord rec = withRaw(data, len);
    FrameReader r(data, len);
    // A flags byte with nothing after it carries no measurement
    if (!r.CanRead(2)) return rec;

    const uint8_t flags = r.U8();
    rec.flags = flags;

    if (flags & 0x01) {
        // Wheel revolution block: uint32 revolutions + uint16 event time, not mapped
        if (!r.CanRead(6)) return rec;
        r.Skip(6);
    }
    if (flags & 0x02) {
        if (!r.CanRead(4)) return rec;
        rec.crank_revolutions = r.U16();
        rec.last_crank_event_time = r.U16();
    }
    return rec;
}

TelemetryRecord DecodeMobi(const uint8_t* data, size_t len)
{
    TelemetryRecord rec = withRaw(data, len);
    if (data == nullptr || len <= 14) return rec;

    rec.instantaneous_cadence = static_cast<float>((data[9] << 8) | data[10]);
    rec.gear_level = data[13];
    rec.resistance_level = static_cast<float>(data[13]);
    rec.battery_level = FIXED_BATTERY_LEVEL_;
    return rec;
}

uint8_t RebornSystemGear(uint8_t raw_gear) noexcept
{
    const double gear = std::ceil(raw_gear / 14.3);
    return static_cast<uint8_t>(std::min(7.0, std::max(1.0, gear)));
}

TelemetryRecord DecodeReborn(const uint8_t* data, size_t len)
{
    TelemetryRecord rec = withRaw(data, len);
    if (data == nullptr || len != REBORN_FRAME_LEN_) return rec;
    if (data[2] != 0x00 || data[3] != 0x80) return rec;
    if (data[1] != len) return rec;

    // Byte 11 carries revolutions per minute as an inverse round time
    if (data[11] > 0) {
        const double seconds_per_round = 60.0 / data[11];
        rec.instantaneous_cadence = static_cast<float>(std::round(60.0 / seconds_per_round));
    }
    rec.gear_level = data[14];
    rec.resistance_level = static_cast<float>(RebornSystemGear(data[14]));
    rec.battery_level = FIXED_BATTERY_LEVEL_;
    return rec;
}

uint8_t TacxGearBucket(int resistance) noexcept
{
    if (resistance < -10) return 1;
    if (resistance < 0)   return 2;
    if (resistance < 7)   return 3;
    if (resistance < 13)  return 4;
    if (resistance < 20)  return 5;
    if (resistance < 27)  return 6;
    return 7;
}

TelemetryRecord DecodeTacx(const uint8_t* data, size_t len)
{
    TelemetryRecord rec = withRaw(data, len);
    if (data == nullptr || len != TACX_FRAME_LEN_) return rec;

    const uint8_t page = data[4];
    if (page == TACX_PAGE_CADENCE_) {
        const uint8_t rpm_raw = data[6];
        if (rpm_raw > 0) {
            const double seconds_per_round = 60.0 / rpm_raw;
            rec.instantaneous_cadence = static_cast<float>(60.0 / seconds_per_round);
        } else {
            rec.instantaneous_cadence = 0.0f;
        }
    } else if (page == TACX_PAGE_GEAR_) {
        const int front = data[10];
        const int rear = data[11];
        rec.gear_level = TacxGearBucket(front - rear);
    }
    return rec;
}

TelemetryRecord DecodeFitShow(const uint8_t* data, size_t len)
{
    TelemetryRecord rec = withRaw(data, len);
    if (data == nullptr || len < FITSHOW_MIN_LEN_) return rec;

    // Vendor composes two-byte values with x255, not x256
    rec.instantaneous_speed = (data[2] + data[3] * 255) * 0.01f;
    rec.instantaneous_cadence = (data[4] + data[5] * 255) * 0.5f;
    rec.resistance_level = (data[9] + data[10] * 255) * 0.1f;
    rec.instantaneous_power = static_cast<int16_t>(data[11]);
    rec.battery_level = FIXED_BATTERY_LEVEL_;
    return rec;
}

TelemetryRecord DecodeCyclingPower(const uint8_t* data, size_t len)
{
    TelemetryRecord rec = withRaw(data, len);
    FrameReader r(data, len);
    if (!r.CanRead(4)) return rec;

    const uint16_t flags = r.U16();
    rec.flags = flags;
    rec.instantaneous_power = r.I16();

    if (flags & CPM_PEDAL_BALANCE_) {
        if (!r.CanRead(1)) return rec;
        rec.pedal_power_balance = r.U8() / 2.0f;
    }
    if (flags & CPM_ACCUM_TORQUE_) {
        if (!r.CanRead(2)) return rec;
        rec.accumulated_torque = r.U16() / 32.0f;
    }
    if (flags & CPM_WHEEL_REV_) {
        if (!r.CanRead(6)) return rec;
        r.Skip(6);
    }
    if (flags & CPM_CRANK_REV_) {
        if (!r.CanRead(4)) return rec;
        const uint16_t revolutions = r.U16();
        const uint16_t event_time = r.U16();
        // Single-sample estimate, no delta against the previous frame
        if (event_time > 0) {
            rec.instantaneous_cadence =
                static_cast<float>(revolutions / (event_time / 1024.0) * 60.0);
        }
    }
    if (flags & CPM_EXTREME_FORCE_) {
        if (!r.CanRead(4)) return rec;
        r.Skip(4);
    }
    if (flags & CPM_EXTREME_TORQUE_) {
        if (!r.CanRead(4)) return rec;
        r.Skip(4);
    }
    if (flags & CPM_EXTREME_ANGLES_) {
        if (!r.CanRead(3)) return rec;
        r.Skip(3);
    }
    if (flags & CPM_TOP_DEAD_SPOT_) {
        if (!r.CanRead(2)) return rec;
        r.Skip(2);
    }
    if (flags & CPM_BOTTOM_DEAD_SPOT_) {
        if (!r.CanRead(2)) return rec;
        r.Skip(2);
    }
    if (flags & CPM_ACCUM_ENERGY_) {
        if (!r.CanRead(2)) return rec;
        rec.expended_energy = r.U16();
    }
    return rec;
}

TelemetryRecord DecodeHeartRate(const uint8_t* data, size_t len)
{
    TelemetryRecord rec = withRaw(data, len);
    FrameReader r(data, len);
    if (!r.CanRead(2)) return rec;

    const uint8_t flags = r.U8();
    rec.flags = flags;
    if (flags & 0x01) {
        if (r.CanRead(2)) rec.heart_rate = r.U16();
    } else {
        if (r.CanRead(1)) rec.heart_rate = r.U8();
    }
    return rec;
}

TelemetryRecord DecodeBattery(const uint8_t* data, size_t len)
{
    TelemetryRecord rec = withRaw(data, len);
    if (data != nullptr && len >= 1) {
        rec.battery_level = data[0];
    }
    return rec;
}

TelemetryRecord DecodeRawOnly(const uint8_t* data, size_t len)
{
    return withRaw(data, len);
}

// -------- CRANK CADENCE --------

void CrankCadenceTracker::Apply(TelemetryRecord& record) noexcept
{
    if (!record.crank_revolutions || !record.last_crank_event_time) return;

    const uint16_t revs = *record.crank_revolutions;
    const uint16_t event_time = *record.last_crank_event_time;

    if (primed_) {
        const uint16_t d_revs = static_cast<uint16_t>(revs - last_revolutions_);
        const uint16_t d_time = static_cast<uint16_t>(event_time - last_event_time_);
        if (d_time > 0) {
            record.instantaneous_cadence =
                static_cast<float>(d_revs * 60.0 * 1024.0 / d_time);
        }
    }

    primed_ = true;
    last_revolutions_ = revs;
    last_event_time_ = event_time;
}

void CrankCadenceTracker::Reset() noexcept
{
    primed_ = false;
    last_revolutions_ = 0;
    last_event_time_ = 0;
}

} // namespace codec
} // namespace trainer_link
