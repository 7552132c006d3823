/**
 * @file command_encoder.hpp
 * @brief Logical control commands and their per-protocol byte frames
 *
 * Encoders are pure: they fill a CommandFrame (bytes + target characteristic)
 * and never touch the transport.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include "esp_err.h"
#include "trainer_types.hpp"

namespace trainer_link {
namespace command {

// Enum class: PascalCase
enum class CommandOp : uint8_t {
    RequestControl = 0,
    Reset,
    Start,
    Stop,
    Pause,
    SetResistanceLevel,
    SetTargetPower,
    SetSimulationParams
};

const char* ToString(CommandOp op) noexcept;

struct SimulationParams {
    float wind_speed_mps = 0.0f;   // m/s
    float grade_pct      = 0.0f;   // %
    float crr            = 0.004f; // rolling resistance coefficient
    float cw             = 0.5f;   // wind resistance coefficient, kg/m
};

/**
 * @brief One logical command plus whichever parameter its op uses.
 */
struct Command {
    CommandOp        op = CommandOp::RequestControl;
    float            level = 0.0f;  // SetResistanceLevel
    int16_t          watts = 0;     // SetTargetPower
    SimulationParams sim;           // SetSimulationParams

    static Command RequestControl() noexcept { return Command{CommandOp::RequestControl}; }
    static Command Reset() noexcept { return Command{CommandOp::Reset}; }
    static Command Start() noexcept { return Command{CommandOp::Start}; }
    static Command Stop() noexcept { return Command{CommandOp::Stop}; }
    static Command Pause() noexcept { return Command{CommandOp::Pause}; }
    static Command Resistance(float level) noexcept;
    static Command TargetPower(int16_t watts) noexcept;
    static Command Simulation(const SimulationParams& sim) noexcept;
};

// FTMS control point opcodes
static constexpr uint8_t FTMS_OP_REQUEST_CONTROL_ = 0x00;
static constexpr uint8_t FTMS_OP_RESET_           = 0x01;
static constexpr uint8_t FTMS_OP_SET_RESISTANCE_  = 0x04;
static constexpr uint8_t FTMS_OP_SET_POWER_       = 0x05;
static constexpr uint8_t FTMS_OP_START_           = 0x07;
static constexpr uint8_t FTMS_OP_STOP_            = 0x08;
static constexpr uint8_t FTMS_OP_PAUSE_           = 0x09;
static constexpr uint8_t FTMS_OP_SET_SIM_PARAMS_  = 0x11;

// Tacx FE-C acknowledged-data frame
static constexpr uint8_t TACX_SYNC_             = 0xA4;
static constexpr uint8_t TACX_MSG_LEN_          = 0x09;
static constexpr uint8_t TACX_MSG_ACK_DATA_     = 0x4F;
static constexpr uint8_t TACX_CHANNEL_          = 0x05;
static constexpr uint8_t TACX_CMD_RESISTANCE_   = 0x30;
static constexpr uint8_t TACX_CMD_POWER_        = 0x31;
static constexpr uint8_t TACX_CMD_SIMULATION_   = 0x33;
static constexpr size_t  TACX_PAYLOAD_LEN_      = 7;
static constexpr size_t  TACX_PACKET_LEN_       = 13;

// FitShow framing: [STX, body..., xor(body), ETX]
static constexpr uint8_t FITSHOW_STX_           = 0x02;
static constexpr uint8_t FITSHOW_ETX_           = 0x03;
static constexpr uint8_t FITSHOW_CMD_CONTROL_   = 0x44;
static constexpr uint8_t FITSHOW_SUB_INIT_      = 0x01;
static constexpr uint8_t FITSHOW_SUB_START_     = 0x02;
static constexpr uint8_t FITSHOW_SUB_STOP_      = 0x03;
static constexpr uint8_t FITSHOW_SUB_PAUSE_     = 0x04;
static constexpr size_t  FITSHOW_BODY_LEN_      = 2;
static constexpr uint8_t FITSHOW_CMD_RESISTANCE_ = 0x04;
static constexpr uint8_t FITSHOW_MIN_LEVEL_     = 1;
static constexpr uint8_t FITSHOW_MAX_LEVEL_     = 32;

/**
 * @brief FTMS-family encoding: one opcode byte followed by LE parameters.
 *
 * The caller names the control characteristic so the same layout serves FTMS
 * (0x2AD9) and the Reborn write characteristic.
 */
esp_err_t EncodeFtms(const Command& cmd, const BleUuid& service,
                     const BleUuid& characteristic, CommandFrame& out);

/// Tacx resistance / power / simulation frames. Other ops: ERR_NO_VENDOR_FRAME_.
esp_err_t EncodeTacx(const Command& cmd, CommandFrame& out);

/// Builds the 13-byte Tacx packet. ESP_ERR_INVALID_SIZE unless len == 7.
esp_err_t BuildTacxFrame(uint8_t command_id, const uint8_t* payload, size_t len,
                         CommandFrame& out);

uint8_t XorChecksum(const uint8_t* data, size_t len) noexcept;

/// FitShow start / stop / pause / resistance. Other ops: ERR_NO_VENDOR_FRAME_.
esp_err_t EncodeFitShow(const Command& cmd, CommandFrame& out);

/// Wraps a 2-byte body as [STX, body, xor, ETX]. ESP_ERR_INVALID_SIZE on other widths.
esp_err_t BuildFitShowFrame(const uint8_t* body, size_t len, CommandFrame& out);

/// Vendor init / start frames sent by the FitShow connection sequence.
esp_err_t FitShowInitFrame(CommandFrame& out);
esp_err_t FitShowStartFrame(CommandFrame& out);

/**
 * @brief Settle delay after each write, in ms.
 *
 * Callers are expected to wait this long before the next command; the session
 * does so while holding its command lock.
 */
struct DelayPolicy {
    uint32_t simple_command_ms = 500;
    uint32_t mode_change_ms    = 1000;  // start / stop / reset
    uint32_t fitshow_init_ms   = 3000;
    uint32_t fitshow_start_ms  = 2000;

    uint32_t SettleDelayFor(CommandOp op) const noexcept;
};

} // namespace command
} // namespace trainer_link
