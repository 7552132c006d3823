/**
 * @file trainer_types.hpp
 * @brief Shared data model: protocol kinds, GATT identifiers, telemetry and command values
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trainer_link {

// Enum class: PascalCase
enum class ProtocolKind : uint8_t {
    Ftms = 0,
    Csc,
    Mobi,
    Reborn,
    Tacx,
    FitShow,
    YafitS3,
    YafitS4,
    Nus,
    Hrs,
    Cps,
    Bms,
    Dis
};

static constexpr size_t PROTOCOL_KIND_COUNT_ = 13;

const char* ToString(ProtocolKind kind) noexcept;

/**
 * @brief 128-bit GATT identifier, stored big-endian in canonical string order.
 *
 * 16-bit SIG identifiers are expanded onto the Bluetooth base UUID so that
 * 0x1826 and "00001826-0000-1000-8000-00805f9b34fb" compare equal.
 */
struct BleUuid {
    std::array<uint8_t, 16> bytes{};

    static constexpr BleUuid From16(uint16_t short_uuid) noexcept
    {
        BleUuid u{{0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00,
                   0x80, 0x00, 0x00, 0x80, 0x5F, 0x9B, 0x34, 0xFB}};
        u.bytes[2] = static_cast<uint8_t>(short_uuid >> 8);
        u.bytes[3] = static_cast<uint8_t>(short_uuid & 0xFF);
        return u;
    }

    /// Parses "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" or a 4-digit short form ("1826").
    static bool FromString(const char* text, BleUuid& out) noexcept;

    bool IsSigBased() const noexcept;
    uint16_t ShortValue() const noexcept { return static_cast<uint16_t>((bytes[2] << 8) | bytes[3]); }

    /// Lower-case canonical form; out must hold at least 37 chars.
    void Format(char* out, size_t out_size) const noexcept;
    std::string ToString() const;

    bool operator==(const BleUuid& other) const noexcept { return bytes == other.bytes; }
    bool operator!=(const BleUuid& other) const noexcept { return bytes != other.bytes; }
};

/**
 * @brief Identity of one physical device as captured from the transport.
 *
 * Built once per connection; never modified afterwards.
 */
struct DeviceDescriptor {
    std::string          id;        // transport address / identifier
    std::string          name;      // advertised name, may be empty
    std::vector<BleUuid> services;  // discovered service identifiers

    bool HasService(const BleUuid& uuid) const noexcept;
};

/**
 * @brief Canonical telemetry record shared by every protocol decoder.
 *
 * An empty optional means "not reported by this frame", never zero.
 */
struct TelemetryRecord {
    std::optional<float>    instantaneous_speed;    // km/h
    std::optional<float>    average_speed;          // km/h
    std::optional<float>    instantaneous_cadence;  // rpm
    std::optional<float>    average_cadence;        // rpm
    std::optional<uint32_t> total_distance;         // m
    std::optional<float>    resistance_level;
    std::optional<int16_t>  instantaneous_power;    // W
    std::optional<int16_t>  average_power;          // W
    std::optional<uint16_t> expended_energy;        // kcal (FTMS) / kJ (CPS)
    std::optional<uint16_t> heart_rate;             // bpm
    std::optional<float>    metabolic_equivalent;
    std::optional<uint16_t> elapsed_time;           // s
    std::optional<uint16_t> remaining_time;         // s
    std::optional<uint8_t>  gear_level;
    std::optional<uint8_t>  battery_level;          // %

    // Cycling Power extras
    std::optional<float>    pedal_power_balance;    // %
    std::optional<float>    accumulated_torque;     // Nm

    // Raw crank data (CSC), consumed by codec::CrankCadenceTracker
    std::optional<uint16_t> crank_revolutions;
    std::optional<uint16_t> last_crank_event_time;  // 1/1024 s

    std::string             raw;                    // lower-case hex of the whole frame
    std::optional<uint32_t> flags;                  // protocol flags word, when the frame has one
};

/**
 * @brief Encoded command bytes plus the characteristic they must be written to.
 */
struct CommandFrame {
    std::vector<uint8_t> bytes;
    BleUuid              service;
    BleUuid              characteristic;
    bool                 with_response = true;
};

/**
 * @brief FTMS control-point acknowledgement.
 */
struct ControlPointResponse {
    uint8_t response_op_code = 0;
    uint8_t request_op_code  = 0;
    uint8_t result_code      = 0;

    bool IsSuccess() const noexcept { return response_op_code == 0x80 && result_code == 0x01; }
};

/// Lower-case hex dump helper used for TelemetryRecord::raw and log lines.
std::string ToHex(const uint8_t* data, size_t len);

} // namespace trainer_link
