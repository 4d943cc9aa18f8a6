/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <bpb/bridge/Config.hpp>

namespace bpb::bridge {

Config::Builder &Config::Builder::discoveryWindow(std::chrono::milliseconds window) noexcept
{
    _discoveryWindow = window;
    return *this;
}

Config::Builder &Config::Builder::pollInterval(std::chrono::milliseconds interval) noexcept
{
    _pollInterval = interval;
    return *this;
}

Config::Builder &Config::Builder::joystickDir(std::string dir)
{
    _joystickDir = std::move(dir);
    return *this;
}

Config::Builder &Config::Builder::inputSysfsDir(std::string dir)
{
    _inputSysfsDir = std::move(dir);
    return *this;
}

Config::Builder &Config::Builder::axisButton(gamepad::AxisToButton mapping)
{
    _axisButtons.push_back(mapping);
    return *this;
}

Config::Builder &Config::Builder::ledRoot(std::string root)
{
    _ledRoot = std::move(root);
    return *this;
}

Config::Builder &Config::Builder::statusLed(std::string name)
{
    _statusLed = std::move(name);
    return *this;
}

Config::Builder &Config::Builder::faultLed(std::string name)
{
    _faultLed = std::move(name);
    return *this;
}

Config::Builder &Config::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg._discoveryWindow = _discoveryWindow;
    cfg._pollInterval    = _pollInterval;
    cfg._joystickDir     = _joystickDir;
    cfg._inputSysfsDir   = _inputSysfsDir;
    cfg._axisButtons     = _axisButtons;
    cfg._ledRoot         = _ledRoot;
    cfg._statusLed       = _statusLed;
    cfg._faultLed        = _faultLed;
    cfg._logLevel        = _logLevel;
    return cfg;
}

gamepad::JoystickConfig Config::joystick() const
{
    gamepad::JoystickConfig js;
    js.deviceDir   = _joystickDir;
    js.sysfsDir    = _inputSysfsDir;
    js.axisButtons = _axisButtons;
    return js;
}

} // namespace bpb::bridge
