/**
 * @file DiscoverySequencer.cpp
 * @brief Non-template part of the discovery sequencer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <bpb/bridge/DiscoverySequencer.hpp>

namespace bpb::bridge {

std::string_view stageName(Stage stage) noexcept
{
    switch (stage) {
        case Stage::kStart:         return "Start";
        case Stage::kGamepadsReady: return "GamepadsReady";
        case Stage::kManagerReady:  return "ManagerReady";
        case Stage::kAdapterReady:  return "AdapterReady";
        case Stage::kScanStarted:   return "ScanStarted";
        case Stage::kWindowElapsed: return "WindowElapsed";
        case Stage::kEnumerated:    return "Enumerated";
        case Stage::kSuccess:       return "Success";
        case Stage::kFailed:        return "Failed";
    }
    return "?";
}

} // namespace bpb::bridge
