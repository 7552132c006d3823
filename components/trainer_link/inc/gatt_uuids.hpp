/**
 * @file gatt_uuids.hpp
 * @brief GATT service / characteristic identifiers for every supported profile
 */

#pragma once

#include "trainer_types.hpp"

namespace trainer_link {
namespace gatt {

// ------------- FITNESS MACHINE (FTMS) -------------
static constexpr BleUuid FTMS_SERVICE_              = BleUuid::From16(0x1826);
static constexpr BleUuid FTMS_FEATURE_CHAR_         = BleUuid::From16(0x2ACC);
static constexpr BleUuid FTMS_INDOOR_BIKE_DATA_CHAR_ = BleUuid::From16(0x2AD2);
static constexpr BleUuid FTMS_SPEED_RANGE_CHAR_     = BleUuid::From16(0x2AD4);
static constexpr BleUuid FTMS_INCLINE_RANGE_CHAR_   = BleUuid::From16(0x2AD5);
static constexpr BleUuid FTMS_RESISTANCE_RANGE_CHAR_ = BleUuid::From16(0x2AD6);
static constexpr BleUuid FTMS_POWER_RANGE_CHAR_     = BleUuid::From16(0x2AD8);
static constexpr BleUuid FTMS_CONTROL_POINT_CHAR_   = BleUuid::From16(0x2AD9);

// ------------- STANDARD PROFILES -------------
static constexpr BleUuid CSC_SERVICE_               = BleUuid::From16(0x1816);
static constexpr BleUuid CSC_MEASUREMENT_CHAR_      = BleUuid::From16(0x2A5B);
static constexpr BleUuid CPS_SERVICE_               = BleUuid::From16(0x1818);
static constexpr BleUuid CPS_MEASUREMENT_CHAR_      = BleUuid::From16(0x2A63);
static constexpr BleUuid HRS_SERVICE_               = BleUuid::From16(0x180D);
static constexpr BleUuid HRS_MEASUREMENT_CHAR_      = BleUuid::From16(0x2A37);
static constexpr BleUuid BMS_SERVICE_               = BleUuid::From16(0x180F);
static constexpr BleUuid BMS_LEVEL_CHAR_            = BleUuid::From16(0x2A19);
static constexpr BleUuid DIS_SERVICE_               = BleUuid::From16(0x180A);
static constexpr BleUuid DIS_MANUFACTURER_CHAR_     = BleUuid::From16(0x2A29);

// CCCD used to enable notifications (0x0001) / indications (0x0002)
static constexpr BleUuid CCCD_                      = BleUuid::From16(0x2902);

// ------------- VENDOR SERVICES -------------
static constexpr BleUuid MOBI_SERVICE_              = BleUuid::From16(0xFFE0);
static constexpr BleUuid MOBI_DATA_CHAR_            = BleUuid::From16(0xFFE4);

static constexpr BleUuid FITSHOW_SERVICE_           = BleUuid::From16(0xFFF0);
static constexpr BleUuid FITSHOW_WRITE_CHAR_        = BleUuid::From16(0xFFF2);
static constexpr BleUuid FITSHOW_BIKE_DATA_CHAR_    = BleUuid::From16(0xFFF3);

// 00010203-0405-0607-0809-0a0b0c0d1910
static constexpr BleUuid REBORN_SERVICE_{{0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                                          0x08, 0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x19, 0x10}};
static constexpr BleUuid REBORN_DATA_CHAR_{{0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                                            0x08, 0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x2B, 0x10}};
static constexpr BleUuid REBORN_WRITE_CHAR_{{0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                                             0x08, 0x09, 0x0A, 0x0B, 0x0C, 0x0D, 0x2B, 0x11}};

// 6e40fec1-b5a3-f393-e0a9-e50e24dcca9e: Tacx FE-C over BLE, shares the UART-style layout (NUS)
static constexpr BleUuid TACX_SERVICE_{{0x6E, 0x40, 0xFE, 0xC1, 0xB5, 0xA3, 0xF3, 0x93,
                                        0xE0, 0xA9, 0xE5, 0x0E, 0x24, 0xDC, 0xCA, 0x9E}};
static constexpr BleUuid TACX_READ_CHAR_{{0x6E, 0x40, 0xFE, 0xC2, 0xB5, 0xA3, 0xF3, 0x93,
                                          0xE0, 0xA9, 0xE5, 0x0E, 0x24, 0xDC, 0xCA, 0x9E}};
static constexpr BleUuid TACX_WRITE_CHAR_{{0x6E, 0x40, 0xFE, 0xC3, 0xB5, 0xA3, 0xF3, 0x93,
                                           0xE0, 0xA9, 0xE5, 0x0E, 0x24, 0xDC, 0xCA, 0x9E}};

static constexpr BleUuid NUS_SERVICE_    = TACX_SERVICE_;
static constexpr BleUuid NUS_READ_CHAR_  = TACX_READ_CHAR_;
static constexpr BleUuid NUS_WRITE_CHAR_ = TACX_WRITE_CHAR_;

} // namespace gatt
} // namespace trainer_link
