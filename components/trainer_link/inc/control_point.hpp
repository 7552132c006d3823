/**
 * @file control_point.hpp
 * @brief FTMS control-point acknowledgements, feature bitmap and supported ranges
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "trainer_types.hpp"

namespace trainer_link {
namespace control_point {

static constexpr uint8_t RESPONSE_CODE_      = 0x80;
static constexpr size_t  RESPONSE_LEN_       = 3;
static constexpr size_t  RANGE_LEN_          = 6;
static constexpr size_t  FEATURE_LEN_        = 4;

// Result codes
static constexpr uint8_t RESULT_SUCCESS_               = 0x01;
static constexpr uint8_t RESULT_OP_CODE_NOT_SUPPORTED_ = 0x02;
static constexpr uint8_t RESULT_INVALID_PARAMETER_     = 0x03;
static constexpr uint8_t RESULT_OPERATION_FAILED_      = 0x04;
static constexpr uint8_t RESULT_CONTROL_NOT_PERMITTED_ = 0x05;

/**
 * @brief Parses {response op, request op, result}.
 *
 * Returns nullopt for frames shorter than 3 bytes or whose first byte is not
 * the 0x80 response code. Never fails otherwise.
 */
std::optional<ControlPointResponse> ParseResponse(const uint8_t* data, size_t len);

const char* OpCodeName(uint8_t op_code) noexcept;
const char* ResultCodeName(uint8_t result_code) noexcept;

// -------- FEATURE BITMAP --------

/// Fitness Machine Feature field, first 4 bytes of 0x2ACC, little-endian.
bool ParseFeatureBits(const uint8_t* data, size_t len, uint32_t& out) noexcept;

/// Name of feature bit 0..15, nullptr for reserved bits.
const char* FeatureBitName(uint8_t bit) noexcept;

/// Comma separated names of every set bit, "none" when empty.
std::string DescribeFeatures(uint32_t bits);

// -------- SUPPORTED RANGES --------

/**
 * @brief Supported range characteristic scaled to engineering units.
 *
 * Wire format is {int16 min, int16 max, uint16 increment}, all LE.
 */
struct SupportedRange {
    float minimum   = 0.0f;
    float maximum   = 0.0f;
    float increment = 0.0f;
};

/// scale = 0.01 for speed (km/h), 0.1 for inclination (%), 1 for resistance and power.
bool ParseSupportedRange(const uint8_t* data, size_t len, float scale, SupportedRange& out) noexcept;

} // namespace control_point
} // namespace trainer_link
