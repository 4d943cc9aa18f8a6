/**
 * @file Constants.hpp
 * @brief Bridge-wide compile-time constants.
 *
 * Timing of the bring-up sequence, device discovery limits and the
 * default sysfs/devfs locations live here so that one header controls
 * how the bridge inspects the machine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_CORE_CONSTANTS_HPP
    #define BPB_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <chrono>
    #include <string_view>

namespace bpb::core {

inline constexpr std::chrono::milliseconds kDiscoveryWindow{2000};
inline constexpr std::chrono::milliseconds kPollInterval{100};

inline constexpr u32   kMaxJoysticks          = 16;
inline constexpr f32   kAxisFullScale         = 32767.0f;

inline constexpr std::string_view kJoystickDir     = "/dev/input";
inline constexpr std::string_view kInputSysfsRoot  = "/sys/class/input";
inline constexpr std::string_view kLedSysfsRoot    = "/sys/class/leds";

inline constexpr u32   kLedBlinkDelayMs       = 250;

inline constexpr i32   kHciTimeoutMs          = 1000;
inline constexpr u16   kLeScanInterval        = 0x0010;
inline constexpr u16   kLeScanWindow          = 0x0010;
inline constexpr i16   kRssiUnavailable       = 127;

} // namespace bpb::core

#endif // BPB_CORE_CONSTANTS_HPP
