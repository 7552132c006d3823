/**
 * @file telemetry_codec.hpp
 * @brief Stateless telemetry decoders, one per protocol
 *
 * Every decoder is total: short or malformed frames yield a record that only
 * carries the fields that could be read safely (at minimum TelemetryRecord::raw).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include "trainer_types.hpp"

namespace trainer_link {
namespace codec {

// FTMS Indoor Bike Data flag bits
static constexpr uint16_t IBD_MORE_DATA_          = 1u << 0;  // speed present when CLEAR
static constexpr uint16_t IBD_AVERAGE_SPEED_      = 1u << 1;
static constexpr uint16_t IBD_INSTANT_CADENCE_    = 1u << 2;
static constexpr uint16_t IBD_AVERAGE_CADENCE_    = 1u << 3;
static constexpr uint16_t IBD_TOTAL_DISTANCE_     = 1u << 4;
static constexpr uint16_t IBD_RESISTANCE_LEVEL_   = 1u << 5;
static constexpr uint16_t IBD_INSTANT_POWER_      = 1u << 6;
static constexpr uint16_t IBD_AVERAGE_POWER_      = 1u << 7;
static constexpr uint16_t IBD_EXPENDED_ENERGY_    = 1u << 8;
static constexpr uint16_t IBD_HEART_RATE_         = 1u << 9;
static constexpr uint16_t IBD_METABOLIC_EQUIV_    = 1u << 10;
static constexpr uint16_t IBD_ELAPSED_TIME_       = 1u << 11;
static constexpr uint16_t IBD_REMAINING_TIME_     = 1u << 12;

// Cycling Power Measurement flag bits
static constexpr uint16_t CPM_PEDAL_BALANCE_      = 1u << 0;
static constexpr uint16_t CPM_ACCUM_TORQUE_       = 1u << 2;
static constexpr uint16_t CPM_WHEEL_REV_          = 1u << 4;
static constexpr uint16_t CPM_CRANK_REV_          = 1u << 5;
static constexpr uint16_t CPM_EXTREME_FORCE_      = 1u << 6;
static constexpr uint16_t CPM_EXTREME_TORQUE_     = 1u << 7;
static constexpr uint16_t CPM_EXTREME_ANGLES_     = 1u << 8;
static constexpr uint16_t CPM_TOP_DEAD_SPOT_      = 1u << 9;
static constexpr uint16_t CPM_BOTTOM_DEAD_SPOT_   = 1u << 10;
static constexpr uint16_t CPM_ACCUM_ENERGY_       = 1u << 11;

// Vendor frame constants
static constexpr size_t  REBORN_FRAME_LEN_        = 16;
static constexpr size_t  TACX_FRAME_LEN_          = 13;
static constexpr uint8_t TACX_PAGE_CADENCE_       = 0x19;
static constexpr uint8_t TACX_PAGE_GEAR_          = 0xFB;
static constexpr size_t  FITSHOW_MIN_LEN_         = 12;
static constexpr uint8_t FIXED_BATTERY_LEVEL_     = 100;

// Public functions: PascalCase
TelemetryRecord DecodeIndoorBikeData(const uint8_t* data, size_t len);
TelemetryRecord DecodeCsc(const uint8_t* data, size_t len);
TelemetryRecord DecodeMobi(const uint8_t* data, size_t len);
TelemetryRecord DecodeReborn(const uint8_t* data, size_t len);
TelemetryRecord DecodeTacx(const uint8_t* data, size_t len);
TelemetryRecord DecodeFitShow(const uint8_t* data, size_t len);
TelemetryRecord DecodeCyclingPower(const uint8_t* data, size_t len);
TelemetryRecord DecodeHeartRate(const uint8_t* data, size_t len);
TelemetryRecord DecodeBattery(const uint8_t* data, size_t len);
TelemetryRecord DecodeRawOnly(const uint8_t* data, size_t len);

/// Maps Reborn raw gear (0..100) onto the 1..7 system gear.
uint8_t RebornSystemGear(uint8_t raw_gear) noexcept;

/// Buckets Tacx (front - rear) gear difference into 7 levels.
uint8_t TacxGearBucket(int resistance) noexcept;

/**
 * @brief Derives crank cadence (rpm) from two successive CSC crank samples.
 *
 * Both counters are 16-bit and wrap; event time is in 1/1024 s. The first
 * sample only primes the tracker. A sample whose event time did not advance
 * produces no cadence.
 */
class CrankCadenceTracker {
public:
    CrankCadenceTracker() noexcept = default;

    /// Fills record.instantaneous_cadence when a cadence can be derived.
    void Apply(TelemetryRecord& record) noexcept;
    void Reset() noexcept;

private:
    bool     primed_ = false;
    uint16_t last_revolutions_ = 0;
    uint16_t last_event_time_ = 0;
};

} // namespace codec
} // namespace trainer_link
