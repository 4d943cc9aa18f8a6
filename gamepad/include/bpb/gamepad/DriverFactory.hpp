/**
 * @file DriverFactory.hpp
 * @brief Builds the gamepad driver compiled for the current platform.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_GAMEPAD_DRIVER_FACTORY_HPP
    #define BPB_GAMEPAD_DRIVER_FACTORY_HPP

    #include <bpb/gamepad/IDriver.hpp>
    #include <bpb/gamepad/JoystickDriver.hpp>

    #include <memory>

namespace bpb::gamepad {

class DriverFactory {
public:
    DriverFactory() = delete;

    /**
     * @brief JoystickDriver on Linux, XInputDriver on Windows, IoHidDriver
     *        on macOS and UnsupportedDriver anywhere else.
     *
     * @param config Only its axis-to-button table applies off Linux.
     */
    [[nodiscard]] static std::unique_ptr<IDriver> createPlatformDriver(const JoystickConfig &config);
};

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_DRIVER_FACTORY_HPP
