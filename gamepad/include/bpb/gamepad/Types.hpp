/**
 * @file Types.hpp
 * @brief Gamepad descriptors and events produced by the input drivers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_GAMEPAD_TYPES_HPP
    #define BPB_GAMEPAD_TYPES_HPP

    #include <bpb/core/Types.hpp>

    #include <chrono>
    #include <string>
    #include <vector>

namespace bpb::gamepad {

/** @brief Driver-assigned device identifier (the jsN slot on Linux). */
using GamepadId = core::u32;

enum class PowerStatus : core::u8 {
    kUnknown = 0,
    kWired,
    kDischarging,
    kCharging,
    kCharged
};

/**
 * @brief Battery state of a device.
 *
 * @c percent is meaningful only for kDischarging and kCharging.
 */
struct PowerInfo {
    PowerStatus status  = PowerStatus::kUnknown;
    core::u8    percent = 0;
};

/** @brief "Unknown", "Wired", "Discharging(80%)", ... */
[[nodiscard]] std::string toString(const PowerInfo &power);

struct GamepadInfo {
    GamepadId   id = 0;
    std::string name;
    PowerInfo   power;
};

/** @brief Devices exposed by an initialized driver. */
using GamepadSet = std::vector<GamepadInfo>;

enum class EventType : core::u8 {
    kButtonPressed,
    kButtonReleased,
    kAxisChanged,
    kDisconnected
};

/**
 * @brief What happened on the device.
 *
 * @c number is the button or axis index, @c value the axis position in
 * [-1, 1] (1.0 / 0.0 for buttons, unused for disconnection).
 */
struct EventPayload {
    EventType  type   = EventType::kAxisChanged;
    core::u8   number = 0;
    core::f32  value  = 0.0f;
};

/** @brief "ButtonPressed(3)", "AxisChanged(1, -0.500)", "Disconnected". */
[[nodiscard]] std::string toString(const EventPayload &payload);

struct GamepadEvent {
    GamepadId                 id = 0;
    EventPayload              payload;
    std::chrono::milliseconds time{0};
};

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_TYPES_HPP
