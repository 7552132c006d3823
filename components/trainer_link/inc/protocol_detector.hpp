/**
 * @file protocol_detector.hpp
 * @brief Classifies a device into one ProtocolKind from its name and services
 */

#pragma once

#include <string>
#include <vector>
#include "trainer_types.hpp"

namespace trainer_link {
namespace detect {

/**
 * @brief Outcome of one detection call. Nothing survives between calls.
 *
 * `matched` lists every kind whose marker fired, in ProtocolKind order, and is
 * never empty: with no marker at all it holds just Csc.
 */
struct DetectionResult {
    ProtocolKind              resolved = ProtocolKind::Csc;
    std::vector<ProtocolKind> matched;

    bool Matched(ProtocolKind kind) const noexcept;
};

/**
 * @brief Resolves by fixed priority:
 *        CPS service > FTMS service > Mobi > Reborn > Tacx > FitShow >
 *        YafitS3 > YafitS4 (name markers) > CSC service > CSC fallback.
 */
DetectionResult Detect(const std::string& name, const std::vector<BleUuid>& services);

/// Convenience overload over a captured descriptor.
DetectionResult Detect(const DeviceDescriptor& device);

/// True if the advertised name alone carries any vendor marker.
bool HasNameMarker(const std::string& name) noexcept;

/// FTMS, Tacx, FitShow, YafitS3 and YafitS4 accept control commands.
bool SupportsControlCommands(ProtocolKind kind) noexcept;

} // namespace detect
} // namespace trainer_link
