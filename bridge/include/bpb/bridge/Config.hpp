/**
 * @file Config.hpp
 * @brief Bridge configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_BRIDGE_CONFIG_HPP
    #define BPB_BRIDGE_CONFIG_HPP

    #include <bpb/core/Constants.hpp>
    #include <bpb/core/Log.hpp>
    #include <bpb/gamepad/JoystickDriver.hpp>

    #include <chrono>
    #include <optional>
    #include <string>
    #include <vector>

namespace bpb::bridge {

/** @brief Immutable bridge configuration. */
class Config {
public:
    /** @brief Fluent builder for Config. */
    class Builder {
    public:
        Builder &discoveryWindow(std::chrono::milliseconds window) noexcept;
        Builder &pollInterval(std::chrono::milliseconds interval) noexcept;
        Builder &joystickDir(std::string dir);
        Builder &inputSysfsDir(std::string dir);
        Builder &axisButton(gamepad::AxisToButton mapping);
        Builder &ledRoot(std::string root);
        Builder &statusLed(std::string name);
        Builder &faultLed(std::string name);
        Builder &logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] Config build() const;

    private:
        std::chrono::milliseconds _discoveryWindow{core::kDiscoveryWindow};
        std::chrono::milliseconds _pollInterval{core::kPollInterval};
        std::string _joystickDir{core::kJoystickDir};
        std::string _inputSysfsDir{core::kInputSysfsRoot};
        std::vector<gamepad::AxisToButton> _axisButtons;
        std::string _ledRoot{core::kLedSysfsRoot};
        std::optional<std::string> _statusLed;
        std::optional<std::string> _faultLed;
        core::LogLevel _logLevel{core::LogLevel::kInfo};
    };

    [[nodiscard]] std::chrono::milliseconds discoveryWindow() const noexcept { return _discoveryWindow; }
    [[nodiscard]] std::chrono::milliseconds pollInterval()    const noexcept { return _pollInterval; }
    [[nodiscard]] const std::optional<std::string> &statusLed() const noexcept { return _statusLed; }
    [[nodiscard]] const std::optional<std::string> &faultLed()  const noexcept { return _faultLed; }
    [[nodiscard]] const std::string &ledRoot()  const noexcept { return _ledRoot; }
    [[nodiscard]] core::LogLevel     logLevel() const noexcept { return _logLevel; }

    /** @brief Joystick driver settings derived from this configuration. */
    [[nodiscard]] gamepad::JoystickConfig joystick() const;

private:
    friend class Builder;

    Config() = default;

    std::chrono::milliseconds _discoveryWindow{core::kDiscoveryWindow};
    std::chrono::milliseconds _pollInterval{core::kPollInterval};
    std::string _joystickDir{core::kJoystickDir};
    std::string _inputSysfsDir{core::kInputSysfsRoot};
    std::vector<gamepad::AxisToButton> _axisButtons;
    std::string _ledRoot{core::kLedSysfsRoot};
    std::optional<std::string> _statusLed;
    std::optional<std::string> _faultLed;
    core::LogLevel _logLevel{core::LogLevel::kInfo};
};

} // namespace bpb::bridge

#endif // BPB_BRIDGE_CONFIG_HPP
