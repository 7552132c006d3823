/**
 * @file command_encoder.cpp
 * @brief FTMS, Tacx and FitShow command frame builders
 */

#include "command_encoder.hpp"
#include "gatt_uuids.hpp"
#include "trainer_err.hpp"
#include "esp_log.h"

#include <algorithm>
#include <cmath>

static const char* TAG_ = "cmd_enc";

namespace trainer_link {
namespace command {

namespace {

void putLe16(std::vector<uint8_t>& v, int16_t value)
{
    const uint16_t u = static_cast<uint16_t>(value);
    v.push_back(static_cast<uint8_t>(u & 0xFF));
    v.push_back(static_cast<uint8_t>(u >> 8));
}

int16_t saturate16(long value) noexcept
{
    return static_cast<int16_t>(std::min(32767L, std::max(-32768L, value)));
}

uint8_t saturate8(long value) noexcept
{
    return static_cast<uint8_t>(std::min(255L, std::max(0L, value)));
}

uint16_t saturateU16(long value) noexcept
{
    return static_cast<uint16_t>(std::min(65535L, std::max(0L, value)));
}

} // namespace

const char* ToString(CommandOp op) noexcept
{
    switch (op) {
        case CommandOp::RequestControl:      return "REQUEST_CONTROL";
        case CommandOp::Reset:               return "RESET";
        case CommandOp::Start:               return "START";
        case CommandOp::Stop:                return "STOP";
        case CommandOp::Pause:               return "PAUSE";
        case CommandOp::SetResistanceLevel:  return "SET_RESISTANCE_LEVEL";
        case CommandOp::SetTargetPower:      return "SET_TARGET_POWER";
        case CommandOp::SetSimulationParams: return "SET_SIM_PARAMS";
    }
    return "UNKNOWN";
}

Command Command::Resistance(float level) noexcept
{
    Command c{CommandOp::SetResistanceLevel};
    c.level = level;
    return c;
}

Command Command::TargetPower(int16_t watts) noexcept
{
    Command c{CommandOp::SetTargetPower};
    c.watts = watts;
    return c;
}

Command Command::Simulation(const SimulationParams& sim) noexcept
{
    Command c{CommandOp::SetSimulationParams};
    c.sim = sim;
    return c;
}

// -------- FTMS --------

esp_err_t EncodeFtms(const Command& cmd, const BleUuid& service,
                     const BleUuid& characteristic, CommandFrame& out)
{
    out = CommandFrame{};
    out.service = service;
    out.characteristic = characteristic;
    out.with_response = true;

    switch (cmd.op) {
        case CommandOp::RequestControl:
            out.bytes = {FTMS_OP_REQUEST_CONTROL_};
            break;
        case CommandOp::Reset:
            out.bytes = {FTMS_OP_RESET_};
            break;
        case CommandOp::Start:
            out.bytes = {FTMS_OP_START_};
            break;
        case CommandOp::Stop:
            out.bytes = {FTMS_OP_STOP_};
            break;
        case CommandOp::Pause:
            out.bytes = {FTMS_OP_PAUSE_};
            break;
        case CommandOp::SetResistanceLevel:
            out.bytes = {FTMS_OP_SET_RESISTANCE_, saturate8(std::lround(cmd.level))};
            break;
        case CommandOp::SetTargetPower:
            out.bytes = {FTMS_OP_SET_POWER_};
            putLe16(out.bytes, cmd.watts);
            break;
        case CommandOp::SetSimulationParams:
            out.bytes = {FTMS_OP_SET_SIM_PARAMS_};
            putLe16(out.bytes, saturate16(std::lround(cmd.sim.wind_speed_mps * 1000.0)));
            putLe16(out.bytes, saturate16(std::lround(cmd.sim.grade_pct * 100.0)));
            out.bytes.push_back(saturate8(std::lround(cmd.sim.crr * 20000.0)));
            out.bytes.push_back(saturate8(std::lround(cmd.sim.cw * 100.0)));
            break;
    }
    return ESP_OK;
}

// -------- TACX --------

uint8_t XorChecksum(const uint8_t* data, size_t len) noexcept
{
    uint8_t x = 0;
    for (size_t i = 0; i < len; ++i) {
        x ^= data[i];
    }
    return x;
}

esp_err_t BuildTacxFrame(uint8_t command_id, const uint8_t* payload, size_t len,
                         CommandFrame& out)
{
    if (payload == nullptr || len != TACX_PAYLOAD_LEN_) {
        ESP_LOGE(TAG_, "Tacx payload must be %u bytes (got %u)",
                 (unsigned)TACX_PAYLOAD_LEN_, (unsigned)len);
        return ESP_ERR_INVALID_SIZE;
    }

    out = CommandFrame{};
    out.service = gatt::TACX_SERVICE_;
    out.characteristic = gatt::TACX_WRITE_CHAR_;
    out.with_response = false;

    out.bytes = {TACX_SYNC_, TACX_MSG_LEN_, TACX_MSG_ACK_DATA_, TACX_CHANNEL_, command_id};
    out.bytes.insert(out.bytes.end(), payload, payload + len);
    out.bytes.push_back(XorChecksum(out.bytes.data(), out.bytes.size()));
    return ESP_OK;
}

esp_err_t EncodeTacx(const Command& cmd, CommandFrame& out)
{
    uint8_t payload[TACX_PAYLOAD_LEN_];
    std::fill(payload, payload + TACX_PAYLOAD_LEN_, 0xFF);

    switch (cmd.op) {
        case CommandOp::SetResistanceLevel: {
            // Input is a percentage; the trainer takes 0.5 % units
            payload[6] = saturate8(std::lround(cmd.level * 2.0));
            return BuildTacxFrame(TACX_CMD_RESISTANCE_, payload, sizeof(payload), out);
        }
        case CommandOp::SetTargetPower: {
            const uint16_t quarter_watts =
                static_cast<uint16_t>(saturate16(static_cast<long>(cmd.watts) * 4));
            payload[5] = static_cast<uint8_t>(quarter_watts & 0xFF);
            payload[6] = static_cast<uint8_t>(quarter_watts >> 8);
            return BuildTacxFrame(TACX_CMD_POWER_, payload, sizeof(payload), out);
        }
        case CommandOp::SetSimulationParams: {
            // 0.01 % units offset by -200 %, so 0..65535 spans -200 % .. +455.35 %
            const uint16_t grade = saturateU16(std::lround((cmd.sim.grade_pct + 200.0) / 0.01));
            payload[4] = static_cast<uint8_t>(grade & 0xFF);
            payload[5] = static_cast<uint8_t>(grade >> 8);
            payload[6] = saturate8(std::lround(cmd.sim.crr / 0.00005));
            return BuildTacxFrame(TACX_CMD_SIMULATION_, payload, sizeof(payload), out);
        }
        default:
            ESP_LOGW(TAG_, "Tacx has no frame for %s", ToString(cmd.op));
            return ERR_NO_VENDOR_FRAME_;
    }
}

// -------- FITSHOW --------

esp_err_t BuildFitShowFrame(const uint8_t* body, size_t len, CommandFrame& out)
{
    if (body == nullptr || len != FITSHOW_BODY_LEN_) {
        ESP_LOGE(TAG_, "FitShow body must be %u bytes (got %u)",
                 (unsigned)FITSHOW_BODY_LEN_, (unsigned)len);
        return ESP_ERR_INVALID_SIZE;
    }

    out = CommandFrame{};
    out.service = gatt::FITSHOW_SERVICE_;
    out.characteristic = gatt::FITSHOW_WRITE_CHAR_;
    out.with_response = true;
    out.bytes = {FITSHOW_STX_, body[0], body[1], XorChecksum(body, len), FITSHOW_ETX_};
    return ESP_OK;
}

static esp_err_t fitshowControlFrame(uint8_t sub, CommandFrame& out)
{
    const uint8_t body[FITSHOW_BODY_LEN_] = {FITSHOW_CMD_CONTROL_, sub};
    return BuildFitShowFrame(body, sizeof(body), out);
}

esp_err_t FitShowInitFrame(CommandFrame& out)
{
    return fitshowControlFrame(FITSHOW_SUB_INIT_, out);
}

esp_err_t FitShowStartFrame(CommandFrame& out)
{
    return fitshowControlFrame(FITSHOW_SUB_START_, out);
}

esp_err_t EncodeFitShow(const Command& cmd, CommandFrame& out)
{
    switch (cmd.op) {
        case CommandOp::Start:
            return FitShowStartFrame(out);
        case CommandOp::Stop:
            // Stop / pause follow the init / start sub-command numbering
            return fitshowControlFrame(FITSHOW_SUB_STOP_, out);
        case CommandOp::Pause:
            return fitshowControlFrame(FITSHOW_SUB_PAUSE_, out);
        case CommandOp::SetResistanceLevel: {
            const long level = std::lround(cmd.level);
            out = CommandFrame{};
            out.service = gatt::FITSHOW_SERVICE_;
            out.characteristic = gatt::FITSHOW_WRITE_CHAR_;
            out.with_response = true;
            out.bytes = {FITSHOW_CMD_RESISTANCE_,
                         static_cast<uint8_t>(std::min<long>(FITSHOW_MAX_LEVEL_,
                                              std::max<long>(FITSHOW_MIN_LEVEL_, level)))};
            return ESP_OK;
        }
        default:
            ESP_LOGW(TAG_, "FitShow has no frame for %s", ToString(cmd.op));
            return ERR_NO_VENDOR_FRAME_;
    }
}

// -------- SETTLE DELAYS --------

uint32_t DelayPolicy::SettleDelayFor(CommandOp op) const noexcept
{
    switch (op) {
        case CommandOp::Reset:
        case CommandOp::Start:
        case CommandOp::Stop:
            return mode_change_ms;
        default:
            return simple_command_ms;
    }
}

} // namespace command
} // namespace trainer_link
