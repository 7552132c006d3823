#include "doctest.h"

#include "telemetry_codec.hpp"

#include <string>
#include <vector>

using namespace trainer_link;
using doctest::Approx;

namespace {
using DecodeFn = TelemetryRecord (*)(const uint8_t*, size_t);

TelemetryRecord decode(DecodeFn fn, const std::vector<uint8_t>& frame)
{
    return fn(frame.data(), frame.size());
}

bool hasMeasurement(const TelemetryRecord& r)
{
    return r.instantaneous_speed || r.average_speed || r.instantaneous_cadence ||
           r.average_cadence || r.total_distance || r.resistance_level ||
           r.instantaneous_power || r.average_power || r.expended_energy ||
           r.heart_rate || r.metabolic_equivalent || r.elapsed_time ||
           r.remaining_time || r.gear_level || r.battery_level ||
           r.pedal_power_balance || r.accumulated_torque || r.crank_revolutions ||
           r.last_crank_event_time || r.flags;
}
}

// ============================================================================
// FTMS Indoor Bike Data
// ============================================================================

TEST_CASE("IndoorBikeData: flags zero carries speed only") {
    const auto rec = decode(codec::DecodeIndoorBikeData, {0x00, 0x00, 0x64, 0x00});
    REQUIRE(rec.instantaneous_speed.has_value());
    CHECK(*rec.instantaneous_speed == Approx(1.0f));
    CHECK(rec.flags == 0u);
    CHECK_FALSE(rec.instantaneous_cadence.has_value());
    CHECK_FALSE(rec.instantaneous_power.has_value());
    CHECK(rec.raw == "00006400");
}

TEST_CASE("IndoorBikeData: every optional field in bit order") {
    const auto rec = decode(codec::DecodeIndoorBikeData, {
        0xFE, 0x1F,            // flags: bits 1..12, speed present
        0x28, 0x0A,            // speed 26.00
        0xC4, 0x09,            // average speed 25.00
        0xB4, 0x00,            // cadence 90.0
        0xA0, 0x00,            // average cadence 80.0
        0x45, 0x23, 0x01,      // distance 0x012345
        0x05, 0x00,            // resistance 5
        0xFA, 0x00,            // power 250
        0xC8, 0x00,            // average power 200
        0x2C, 0x01,            // energy 300
        0x8C,                  // heart rate 140
        0x2D,                  // MET 4.5
        0x58, 0x02,            // elapsed 600
        0x78, 0x00,            // remaining 120
    });
    CHECK(*rec.instantaneous_speed == Approx(26.0f));
    CHECK(*rec.average_speed == Approx(25.0f));
    CHECK(*rec.instantaneous_cadence == Approx(90.0f));
    CHECK(*rec.average_cadence == Approx(80.0f));
    CHECK(*rec.total_distance == 0x012345u);
    CHECK(*rec.resistance_level == Approx(5.0f));
    CHECK(*rec.instantaneous_power == 250);
    CHECK(*rec.average_power == 200);
    CHECK(*rec.expended_energy == 300);
    CHECK(*rec.heart_rate == 140);
    CHECK(*rec.metabolic_equivalent == Approx(4.5f));
    CHECK(*rec.elapsed_time == 600);
    CHECK(*rec.remaining_time == 120);
}

TEST_CASE("IndoorBikeData: more-data bit suppresses speed") {
    const auto rec = decode(codec::DecodeIndoorBikeData, {0x41, 0x00, 0x96, 0x00});
    CHECK_FALSE(rec.instantaneous_speed.has_value());
    REQUIRE(rec.instantaneous_power.has_value());
    CHECK(*rec.instantaneous_power == 150);
}

TEST_CASE("IndoorBikeData: negative power is signed") {
    const auto rec = decode(codec::DecodeIndoorBikeData, {0x41, 0x00, 0xF6, 0xFF});
    CHECK(*rec.instantaneous_power == -10);
}

TEST_CASE("IndoorBikeData: truncated field stops decoding") {
    const auto rec = decode(codec::DecodeIndoorBikeData, {0x44, 0x00, 0x64, 0x00, 0xB4, 0x00, 0xFA});
    CHECK(*rec.instantaneous_speed == Approx(1.0f));
    CHECK(*rec.instantaneous_cadence == Approx(90.0f));
    CHECK_FALSE(rec.instantaneous_power.has_value());
}

TEST_CASE("IndoorBikeData: empty and one-byte frames only carry raw") {
    const auto empty = codec::DecodeIndoorBikeData(nullptr, 0);
    CHECK(empty.raw.empty());
    CHECK_FALSE(empty.flags.has_value());

    const auto one = decode(codec::DecodeIndoorBikeData, {0x00});
    CHECK(one.raw == "00");
    CHECK_FALSE(one.flags.has_value());
    CHECK_FALSE(one.instantaneous_speed.has_value());
}

// ============================================================================
// CSC and crank cadence
// ============================================================================

TEST_CASE("Csc: wheel block is skipped, crank block is surfaced raw") {
    const auto rec = decode(codec::DecodeCsc, {
        0x03,
        0x10, 0x00, 0x00, 0x00, 0x00, 0x04,   // wheel revs + time
        0x0A, 0x00, 0x00, 0x04,               // crank revs 10, time 1024
    });
    CHECK(*rec.crank_revolutions == 10);
    CHECK(*rec.last_crank_event_time == 1024);
    CHECK_FALSE(rec.instantaneous_cadence.has_value());
}

TEST_CASE("Csc: short crank block is dropped") {
    const auto rec = decode(codec::DecodeCsc, {0x02, 0x0A, 0x00, 0x00});
    CHECK_FALSE(rec.crank_revolutions.has_value());
}

TEST_CASE("CrankCadenceTracker: rpm from revolution and time deltas") {
    codec::CrankCadenceTracker tracker;

    auto first = decode(codec::DecodeCsc, {0x02, 0x0A, 0x00, 0x00, 0x04});
    tracker.Apply(first);
    CHECK_FALSE(first.instantaneous_cadence.has_value());

    auto second = decode(codec::DecodeCsc, {0x02, 0x0B, 0x00, 0x00, 0x08});
    tracker.Apply(second);
    REQUIRE(second.instantaneous_cadence.has_value());
    CHECK(*second.instantaneous_cadence == Approx(60.0f));
}

TEST_CASE("CrankCadenceTracker: counters wrap at 16 bits") {
    codec::CrankCadenceTracker tracker;

    auto a = decode(codec::DecodeCsc, {0x02, 0xFF, 0xFF, 0x00, 0xFE});
    tracker.Apply(a);
    // +2 revolutions in 1024 ticks, both counters rolling over
    auto b = decode(codec::DecodeCsc, {0x02, 0x01, 0x00, 0x00, 0x02});
    tracker.Apply(b);
    REQUIRE(b.instantaneous_cadence.has_value());
    CHECK(*b.instantaneous_cadence == Approx(120.0f));
}

TEST_CASE("CrankCadenceTracker: unchanged event time yields no cadence") {
    codec::CrankCadenceTracker tracker;
    auto a = decode(codec::DecodeCsc, {0x02, 0x0A, 0x00, 0x00, 0x04});
    tracker.Apply(a);
    auto b = decode(codec::DecodeCsc, {0x02, 0x0A, 0x00, 0x00, 0x04});
    tracker.Apply(b);
    CHECK_FALSE(b.instantaneous_cadence.has_value());

    tracker.Reset();
    auto c = decode(codec::DecodeCsc, {0x02, 0x0B, 0x00, 0x00, 0x08});
    tracker.Apply(c);
    CHECK_FALSE(c.instantaneous_cadence.has_value());
}

// ============================================================================
// Vendor frames
// ============================================================================

TEST_CASE("Mobi: needs more than 14 bytes") {
    std::vector<uint8_t> frame(15, 0x00);
    frame[9] = 0x00;
    frame[10] = 85;
    frame[13] = 6;
    const auto rec = decode(codec::DecodeMobi, frame);
    CHECK(*rec.instantaneous_cadence == Approx(85.0f));
    CHECK(*rec.gear_level == 6);
    CHECK(*rec.resistance_level == Approx(6.0f));
    CHECK(*rec.battery_level == codec::FIXED_BATTERY_LEVEL_);

    frame.resize(14);
    const auto short_rec = decode(codec::DecodeMobi, frame);
    CHECK_FALSE(short_rec.instantaneous_cadence.has_value());
    CHECK_FALSE(short_rec.raw.empty());
}

TEST_CASE("Reborn: validated telemetry frame") {
    std::vector<uint8_t> frame = {0xAA, 0x10, 0x00, 0x80, 0, 0, 0, 0, 0, 0, 0, 80, 0, 0, 50, 0};
    const auto rec = decode(codec::DecodeReborn, frame);
    CHECK(*rec.instantaneous_cadence == Approx(80.0f));
    CHECK(*rec.gear_level == 50);
    CHECK(*rec.resistance_level == Approx(4.0f));
    CHECK(*rec.battery_level == 100);

    frame[3] = 0x81;
    CHECK_FALSE(decode(codec::DecodeReborn, frame).gear_level.has_value());
}

TEST_CASE("Reborn: system gear stays within 1..7") {
    CHECK(codec::RebornSystemGear(0) == 1);
    CHECK(codec::RebornSystemGear(14) == 1);
    CHECK(codec::RebornSystemGear(15) == 2);
    CHECK(codec::RebornSystemGear(100) == 7);
    CHECK(codec::RebornSystemGear(255) == 7);
}

TEST_CASE("Tacx: cadence and gear pages") {
    std::vector<uint8_t> cadence(13, 0x00);
    cadence[4] = codec::TACX_PAGE_CADENCE_;
    cadence[6] = 90;
    CHECK(*decode(codec::DecodeTacx, cadence).instantaneous_cadence == Approx(90.0f));

    cadence[6] = 0;
    CHECK(*decode(codec::DecodeTacx, cadence).instantaneous_cadence == Approx(0.0f));

    std::vector<uint8_t> gear(13, 0x00);
    gear[4] = codec::TACX_PAGE_GEAR_;
    gear[10] = 34;
    gear[11] = 25;
    const auto rec = decode(codec::DecodeTacx, gear);
    CHECK(*rec.gear_level == 4);
    CHECK_FALSE(rec.instantaneous_cadence.has_value());

    gear.resize(12);
    CHECK_FALSE(decode(codec::DecodeTacx, gear).gear_level.has_value());
}

TEST_CASE("Tacx: gear buckets") {
    CHECK(codec::TacxGearBucket(-11) == 1);
    CHECK(codec::TacxGearBucket(-10) == 2);
    CHECK(codec::TacxGearBucket(0) == 3);
    CHECK(codec::TacxGearBucket(7) == 4);
    CHECK(codec::TacxGearBucket(13) == 5);
    CHECK(codec::TacxGearBucket(20) == 6);
    CHECK(codec::TacxGearBucket(27) == 7);
}

TEST_CASE("FitShow: x255 composition") {
    std::vector<uint8_t> frame(12, 0x00);
    frame[2] = 0x10;
    frame[3] = 0x01;
    frame[4] = 0xB4;
    frame[9] = 50;
    frame[11] = 120;
    const auto rec = decode(codec::DecodeFitShow, frame);
    CHECK(*rec.instantaneous_speed == Approx(2.71f));
    CHECK(*rec.instantaneous_cadence == Approx(90.0f));
    CHECK(*rec.resistance_level == Approx(5.0f));
    CHECK(*rec.instantaneous_power == 120);
    CHECK(*rec.battery_level == 100);
}

TEST_CASE("FitShow: eleven bytes only carry raw") {
    const std::vector<uint8_t> frame(11, 0x01);
    const auto rec = decode(codec::DecodeFitShow, frame);
    CHECK(rec.raw == "0101010101010101010101");
    CHECK_FALSE(rec.instantaneous_speed.has_value());
    CHECK_FALSE(rec.instantaneous_cadence.has_value());
    CHECK_FALSE(rec.resistance_level.has_value());
    CHECK_FALSE(rec.instantaneous_power.has_value());
    CHECK_FALSE(rec.battery_level.has_value());
}

// ============================================================================
// Standard profiles
// ============================================================================

TEST_CASE("CyclingPower: balance, crank cadence and energy") {
    const auto rec = decode(codec::DecodeCyclingPower, {
        0x21, 0x08,   // balance + crank + accumulated energy
        0xC8, 0x00,   // 200 W
        0x64,         // 50 %
        0x02, 0x00,   // 2 revolutions
        0x00, 0x08,   // in 2 s
        0x0F, 0x00,   // 15 kJ
    });
    CHECK(*rec.instantaneous_power == 200);
    CHECK(*rec.pedal_power_balance == Approx(50.0f));
    CHECK(*rec.instantaneous_cadence == Approx(60.0f));
    CHECK(*rec.expended_energy == 15);
}

TEST_CASE("CyclingPower: power only") {
    const auto rec = decode(codec::DecodeCyclingPower, {0x00, 0x00, 0x2C, 0x01});
    CHECK(*rec.instantaneous_power == 300);
    CHECK_FALSE(rec.instantaneous_cadence.has_value());
    CHECK_FALSE(decode(codec::DecodeCyclingPower, {0x00, 0x00, 0x2C}).instantaneous_power.has_value());
}

TEST_CASE("HeartRate: 8 and 16 bit values") {
    CHECK(*decode(codec::DecodeHeartRate, {0x00, 72}).heart_rate == 72);
    CHECK(*decode(codec::DecodeHeartRate, {0x01, 0x2C, 0x01}).heart_rate == 300);
    CHECK_FALSE(decode(codec::DecodeHeartRate, {0x01, 0x2C}).heart_rate.has_value());
}

TEST_CASE("Battery and raw-only decoders") {
    CHECK(*decode(codec::DecodeBattery, {87}).battery_level == 87);
    CHECK_FALSE(codec::DecodeBattery(nullptr, 0).battery_level.has_value());

    const auto raw = decode(codec::DecodeRawOnly, {0xDE, 0xAD});
    CHECK(raw.raw == "dead");
    CHECK_FALSE(raw.flags.has_value());
}

TEST_CASE("Truncated frames only carry raw on every decoder") {
    struct Case {
        const char* name;
        DecodeFn    fn;
    };
    const Case cases[] = {
        {"indoor bike data", codec::DecodeIndoorBikeData},
        {"csc",              codec::DecodeCsc},
        {"mobi",             codec::DecodeMobi},
        {"reborn",           codec::DecodeReborn},
        {"tacx",             codec::DecodeTacx},
        {"fitshow",          codec::DecodeFitShow},
        {"cycling power",    codec::DecodeCyclingPower},
        {"heart rate",       codec::DecodeHeartRate},
        {"battery",          codec::DecodeBattery},
        {"raw only",         codec::DecodeRawOnly},
    };

    for (const auto& c : cases) {
        CAPTURE(std::string(c.name));

        const auto empty = c.fn(nullptr, 0);
        CHECK(empty.raw.empty());
        CHECK_FALSE(hasMeasurement(empty));

        const auto zero_len = decode(c.fn, {});
        CHECK(zero_len.raw.empty());
        CHECK_FALSE(hasMeasurement(zero_len));

        // A single byte is a whole battery level frame; elsewhere it is truncated
        if (c.fn == codec::DecodeBattery) continue;
        const auto one = decode(c.fn, {0x00});
        CHECK(one.raw == "00");
        CHECK_FALSE(hasMeasurement(one));
    }

    const auto level = decode(codec::DecodeBattery, {0x00});
    CHECK(level.raw == "00");
    REQUIRE(level.battery_level.has_value());
    CHECK(*level.battery_level == 0);
}
