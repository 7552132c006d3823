/**
 * @file control_point.cpp
 * @brief FTMS control-point helpers
 */

#include "control_point.hpp"

namespace trainer_link {
namespace control_point {

std::optional<ControlPointResponse> ParseResponse(const uint8_t* data, size_t len)
{
    if (data == nullptr || len < RESPONSE_LEN_) return std::nullopt;
    if (data[0] != RESPONSE_CODE_) return std::nullopt;

    ControlPointResponse r;
    r.response_op_code = data[0];
    r.request_op_code = data[1];
    r.result_code = data[2];
    return r;
}

const char* OpCodeName(uint8_t op_code) noexcept
{
    switch (op_code) {
        case 0x00: return "REQUEST_CONTROL";
        case 0x01: return "RESET";
        case 0x02: return "SET_TARGET_SPEED";
        case 0x03: return "SET_TARGET_INCLINATION";
        case 0x04: return "SET_RESISTANCE_LEVEL";
        case 0x05: return "SET_TARGET_POWER";
        case 0x06: return "SET_TARGET_HEART_RATE";
        case 0x07: return "START";
        case 0x08: return "STOP";
        case 0x09: return "PAUSE";
        case 0x10: return "GET_SUPPORTED_POWER_RANGE";
        case 0x11: return "SET_SIM_PARAMS";
        case 0x12: return "GET_SUPPORTED_RESISTANCE_RANGE";
        case 0x13: return "SET_WHEEL_CIRCUMFERENCE";
        default:   return "UNKNOWN";
    }
}

const char* ResultCodeName(uint8_t result_code) noexcept
{
    switch (result_code) {
        case RESULT_SUCCESS_:               return "SUCCESS";
        case RESULT_OP_CODE_NOT_SUPPORTED_: return "OP_CODE_NOT_SUPPORTED";
        case RESULT_INVALID_PARAMETER_:     return "INVALID_PARAMETER";
        case RESULT_OPERATION_FAILED_:      return "OPERATION_FAILED";
        case RESULT_CONTROL_NOT_PERMITTED_: return "CONTROL_NOT_PERMITTED";
        default:                            return "UNKNOWN";
    }
}

bool ParseFeatureBits(const uint8_t* data, size_t len, uint32_t& out) noexcept
{
    if (data == nullptr || len < FEATURE_LEN_) return false;
    out = static_cast<uint32_t>(data[0]) |
          (static_cast<uint32_t>(data[1]) << 8) |
          (static_cast<uint32_t>(data[2]) << 16) |
          (static_cast<uint32_t>(data[3]) << 24);
    return true;
}

const char* FeatureBitName(uint8_t bit) noexcept
{
    static const char* const NAMES_[] = {
        "average_speed",        "cadence",          "total_distance",  "inclination",
        "elevation_gain",       "pace",             "step_count",      "resistance_level",
        "stride_count",         "expended_energy",  "heart_rate",      "metabolic_equivalent",
        "elapsed_time",         "remaining_time",   "power_measurement", "force_on_belt",
    };
    if (bit >= sizeof(NAMES_) / sizeof(NAMES_[0])) return nullptr;
    return NAMES_[bit];
}

std::string DescribeFeatures(uint32_t bits)
{
    std::string out;
    for (uint8_t bit = 0; bit < 32; ++bit) {
        if (!(bits & (1u << bit))) continue;
        const char* name = FeatureBitName(bit);
        if (name == nullptr) continue;
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out.empty() ? std::string("none") : out;
}

bool ParseSupportedRange(const uint8_t* data, size_t len, float scale, SupportedRange& out) noexcept
{
    if (data == nullptr || len < RANGE_LEN_) return false;

    const int16_t minimum = static_cast<int16_t>(data[0] | (data[1] << 8));
    const int16_t maximum = static_cast<int16_t>(data[2] | (data[3] << 8));
    const uint16_t increment = static_cast<uint16_t>(data[4] | (data[5] << 8));

    out.minimum = minimum * scale;
    out.maximum = maximum * scale;
    out.increment = increment * scale;
    return true;
}

} // namespace control_point
} // namespace trainer_link
