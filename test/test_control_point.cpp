#include "doctest.h"

#include "control_point.hpp"

#include <string>

using namespace trainer_link;
using doctest::Approx;

TEST_CASE("ControlPoint: response parsing") {
    const uint8_t ok[] = {0x80, 0x07, 0x01};
    auto r = control_point::ParseResponse(ok, sizeof(ok));
    REQUIRE(r.has_value());
    CHECK(r->request_op_code == 0x07);
    CHECK(r->IsSuccess());

    const uint8_t refused[] = {0x80, 0x05, 0x05, 0xAA};
    auto denied = control_point::ParseResponse(refused, sizeof(refused));
    REQUIRE(denied.has_value());
    CHECK_FALSE(denied->IsSuccess());
    CHECK(std::string(control_point::ResultCodeName(denied->result_code)) == "CONTROL_NOT_PERMITTED");
}

TEST_CASE("ControlPoint: malformed frames are rejected") {
    const uint8_t short_frame[] = {0x80, 0x00};
    CHECK_FALSE(control_point::ParseResponse(short_frame, sizeof(short_frame)).has_value());

    const uint8_t not_response[] = {0x07, 0x00, 0x01};
    CHECK_FALSE(control_point::ParseResponse(not_response, sizeof(not_response)).has_value());

    CHECK_FALSE(control_point::ParseResponse(nullptr, 0).has_value());
}

TEST_CASE("ControlPoint: opcode and result names") {
    CHECK(std::string(control_point::OpCodeName(0x00)) == "REQUEST_CONTROL");
    CHECK(std::string(control_point::OpCodeName(0x11)) == "SET_SIM_PARAMS");
    CHECK(std::string(control_point::OpCodeName(0x42)) == "UNKNOWN");
    CHECK(std::string(control_point::ResultCodeName(0x01)) == "SUCCESS");
    CHECK(std::string(control_point::ResultCodeName(0x02)) == "OP_CODE_NOT_SUPPORTED");
    CHECK(std::string(control_point::ResultCodeName(0x99)) == "UNKNOWN");
}

TEST_CASE("ControlPoint: feature bitmap") {
    const uint8_t value[] = {0x82, 0x40, 0x00, 0x00, 0x0C, 0xE0, 0x00, 0x00};
    uint32_t bits = 0;
    REQUIRE(control_point::ParseFeatureBits(value, sizeof(value), bits));
    CHECK(bits == 0x00004082u);
    CHECK(control_point::DescribeFeatures(bits) == "cadence, resistance_level, power_measurement");
    CHECK(control_point::DescribeFeatures(0) == "none");
    CHECK(control_point::FeatureBitName(20) == nullptr);

    CHECK_FALSE(control_point::ParseFeatureBits(value, 3, bits));
}

TEST_CASE("ControlPoint: supported range scaling") {
    // -10.0 .. 15.0 % in 0.5 % steps
    const uint8_t incline[] = {0x9C, 0xFF, 0x96, 0x00, 0x05, 0x00};
    control_point::SupportedRange range;
    REQUIRE(control_point::ParseSupportedRange(incline, sizeof(incline), 0.1f, range));
    CHECK(range.minimum == Approx(-10.0f));
    CHECK(range.maximum == Approx(15.0f));
    CHECK(range.increment == Approx(0.5f));

    CHECK_FALSE(control_point::ParseSupportedRange(incline, 5, 1.0f, range));
}
