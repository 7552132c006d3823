#include "doctest.h"

#include "gatt_uuids.hpp"
#include "protocol_detector.hpp"

#include <vector>

using namespace trainer_link;

TEST_CASE("Detect: XQ name resolves to Reborn until a power service appears") {
    auto before = detect::Detect("XQ-BIKE123", {});
    CHECK(before.resolved == ProtocolKind::Reborn);
    CHECK_FALSE(before.Matched(ProtocolKind::Mobi));

    auto after = detect::Detect("XQ-BIKE123", {gatt::CPS_SERVICE_});
    CHECK(after.resolved == ProtocolKind::Cps);
    CHECK(after.matched == std::vector<ProtocolKind>{ProtocolKind::Reborn, ProtocolKind::Cps});
}

TEST_CASE("Detect: power beats FTMS beats vendor names") {
    CHECK(detect::Detect("MOB-1", {gatt::FTMS_SERVICE_, gatt::CPS_SERVICE_}).resolved == ProtocolKind::Cps);
    CHECK(detect::Detect("MOB-1", {gatt::FTMS_SERVICE_}).resolved == ProtocolKind::Ftms);
    CHECK(detect::Detect("MOB-1", {gatt::CSC_SERVICE_}).resolved == ProtocolKind::Mobi);
}

TEST_CASE("Detect: name priority order") {
    CHECK(detect::Detect("MOB XQ", {}).resolved == ProtocolKind::Mobi);
    CHECK(detect::Detect("XQ Tac", {}).resolved == ProtocolKind::Reborn);
    CHECK(detect::Detect("Tacx FS-1", {}).resolved == ProtocolKind::Tacx);
    CHECK(detect::Detect("FS-1 YAFITS3", {}).resolved == ProtocolKind::FitShow);
    CHECK(detect::Detect("YA FIT R-Q", {}).resolved == ProtocolKind::YafitS3);
    CHECK(detect::Detect("YAFITF1", {}).resolved == ProtocolKind::YafitS4);
}

TEST_CASE("Detect: Tacx service also marks NUS") {
    auto r = detect::Detect("", {gatt::TACX_SERVICE_});
    CHECK(r.resolved == ProtocolKind::Tacx);
    CHECK(r.Matched(ProtocolKind::Nus));
}

TEST_CASE("Detect: nothing recognised falls back to CSC") {
    auto r = detect::Detect("Generic", {gatt::HRS_SERVICE_});
    CHECK(r.resolved == ProtocolKind::Csc);
    CHECK(r.matched == std::vector<ProtocolKind>{ProtocolKind::Hrs});

    auto empty = detect::Detect("", {});
    CHECK(empty.resolved == ProtocolKind::Csc);
    CHECK(empty.matched == std::vector<ProtocolKind>{ProtocolKind::Csc});
}

TEST_CASE("Detect: matched list follows kind order") {
    auto r = detect::Detect("Tacx", {gatt::DIS_SERVICE_, gatt::HRS_SERVICE_, gatt::FTMS_SERVICE_});
    CHECK(r.matched == std::vector<ProtocolKind>{ProtocolKind::Ftms, ProtocolKind::Tacx,
                                                 ProtocolKind::Nus, ProtocolKind::Hrs,
                                                 ProtocolKind::Dis});
}

TEST_CASE("Detect: 128-bit spelling of a SIG service matches") {
    BleUuid ftms;
    REQUIRE(BleUuid::FromString("00001826-0000-1000-8000-00805f9b34fb", ftms));
    CHECK(detect::Detect("", {ftms}).resolved == ProtocolKind::Ftms);
}

TEST_CASE("Name markers and control capability") {
    CHECK(detect::HasNameMarker("FS-K1234"));
    CHECK(detect::HasNameMarker("Tacx Neo"));
    CHECK_FALSE(detect::HasNameMarker("Garmin HRM"));

    CHECK(detect::SupportsControlCommands(ProtocolKind::Ftms));
    CHECK(detect::SupportsControlCommands(ProtocolKind::Tacx));
    CHECK(detect::SupportsControlCommands(ProtocolKind::FitShow));
    CHECK(detect::SupportsControlCommands(ProtocolKind::YafitS3));
    CHECK(detect::SupportsControlCommands(ProtocolKind::YafitS4));
    CHECK_FALSE(detect::SupportsControlCommands(ProtocolKind::Mobi));
    CHECK_FALSE(detect::SupportsControlCommands(ProtocolKind::Reborn));
    CHECK_FALSE(detect::SupportsControlCommands(ProtocolKind::Csc));
    CHECK_FALSE(detect::SupportsControlCommands(ProtocolKind::Cps));
}
