/**
 * @file protocol_detector.cpp
 * @brief Marker evaluation and priority resolution
 */

#include "protocol_detector.hpp"
#include "gatt_uuids.hpp"
#include "esp_log.h"

#include <array>

static const char* TAG_ = "detect";

namespace trainer_link {
namespace detect {

namespace {

bool contains(const std::string& haystack, const char* needle) noexcept
{
    return haystack.find(needle) != std::string::npos;
}

bool hasService(const std::vector<BleUuid>& services, const BleUuid& uuid) noexcept
{
    for (const auto& s : services) {
        if (s == uuid) return true;
    }
    return false;
}

// Vendor markers in resolution order
constexpr std::array<ProtocolKind, 6> NAME_PRIORITY_ = {
    ProtocolKind::Mobi, ProtocolKind::Reborn, ProtocolKind::Tacx,
    ProtocolKind::FitShow, ProtocolKind::YafitS3, ProtocolKind::YafitS4
};

} // namespace

bool DetectionResult::Matched(ProtocolKind kind) const noexcept
{
    for (auto k : matched) {
        if (k == kind) return true;
    }
    return false;
}

bool HasNameMarker(const std::string& name) noexcept
{
    return contains(name, "MOB") || contains(name, "XQ") || contains(name, "Tac") ||
           contains(name, "FS-") || contains(name, "YAFITS3") || contains(name, "YA FIT") ||
           contains(name, "R-Q") || contains(name, "YAFITF1");
}

DetectionResult Detect(const std::string& name, const std::vector<BleUuid>& services)
{
    std::array<bool, PROTOCOL_KIND_COUNT_> hit{};
    auto mark = [&hit](ProtocolKind k, bool v) {
        if (v) hit[static_cast<size_t>(k)] = true;
    };

    // Name markers
    mark(ProtocolKind::Mobi,    contains(name, "MOB"));
    mark(ProtocolKind::Reborn,  contains(name, "XQ"));
    mark(ProtocolKind::Tacx,    contains(name, "Tac"));
    mark(ProtocolKind::FitShow, contains(name, "FS-"));
    mark(ProtocolKind::YafitS3, contains(name, "YAFITS3") || contains(name, "YA FIT"));
    mark(ProtocolKind::YafitS4, contains(name, "R-Q") || contains(name, "YAFITF1"));

    // Service markers; the Tacx vendor service doubles as the UART-style NUS
    const bool tacx_service = hasService(services, gatt::TACX_SERVICE_);
    mark(ProtocolKind::Tacx, tacx_service);
    mark(ProtocolKind::Nus,  tacx_service);
    mark(ProtocolKind::Ftms, hasService(services, gatt::FTMS_SERVICE_));
    mark(ProtocolKind::Csc,  hasService(services, gatt::CSC_SERVICE_));
    mark(ProtocolKind::Cps,  hasService(services, gatt::CPS_SERVICE_));
    mark(ProtocolKind::Hrs,  hasService(services, gatt::HRS_SERVICE_));
    mark(ProtocolKind::Bms,  hasService(services, gatt::BMS_SERVICE_));
    mark(ProtocolKind::Dis,  hasService(services, gatt::DIS_SERVICE_));

    DetectionResult result;
    for (size_t i = 0; i < PROTOCOL_KIND_COUNT_; ++i) {
        if (hit[i]) result.matched.push_back(static_cast<ProtocolKind>(i));
    }
    if (result.matched.empty()) {
        result.matched.push_back(ProtocolKind::Csc);
    }

    auto is = [&hit](ProtocolKind k) { return hit[static_cast<size_t>(k)]; };

    if (is(ProtocolKind::Cps)) {
        result.resolved = ProtocolKind::Cps;
    } else if (is(ProtocolKind::Ftms)) {
        result.resolved = ProtocolKind::Ftms;
    } else {
        result.resolved = ProtocolKind::Csc;
        for (auto k : NAME_PRIORITY_) {
            if (is(k)) {
                result.resolved = k;
                break;
            }
        }
    }

    ESP_LOGI(TAG_, "'%s' with %u services -> %s (%u markers)", name.c_str(),
             (unsigned)services.size(), ToString(result.resolved),
             (unsigned)result.matched.size());
    return result;
}

DetectionResult Detect(const DeviceDescriptor& device)
{
    return Detect(device.name, device.services);
}

bool SupportsControlCommands(ProtocolKind kind) noexcept
{
    switch (kind) {
        case ProtocolKind::Ftms:
        case ProtocolKind::Tacx:
        case ProtocolKind::FitShow:
        case ProtocolKind::YafitS3:
        case ProtocolKind::YafitS4:
            return true;
        default:
            return false;
    }
}

} // namespace detect
} // namespace trainer_link
