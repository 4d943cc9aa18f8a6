/**
 * @file GamepadBringup.hpp
 * @brief Initializes the input subsystem and checks a gamepad is present.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_BRIDGE_GAMEPAD_BRINGUP_HPP
    #define BPB_BRIDGE_GAMEPAD_BRINGUP_HPP

    #include <bpb/core/Expected.hpp>
    #include <bpb/gamepad/IDriver.hpp>

namespace bpb::bridge {

/**
 * @brief Runs driver init and returns the enumerated gamepads.
 *
 * Driver failures are classified with classifyGamepadError(); a driver
 * that initializes with no devices yields MissingGamepad. One line per
 * device ("<name> is <power>") is logged. Polling is not started.
 */
[[nodiscard]] core::Expected<gamepad::GamepadSet> initGamepads(gamepad::IDriver &driver);

} // namespace bpb::bridge

#endif // BPB_BRIDGE_GAMEPAD_BRINGUP_HPP
