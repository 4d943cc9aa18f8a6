/**
 * @file JoystickDriver.hpp
 * @brief Linux joystick API driver (/dev/input/js*).
 * @author MasterLaplace
 *
 * Every jsN node is opened non-blocking at init(). Name and axis/button
 * counts come from the JSIOCG* ioctls; nodes that do not answer them
 * (plain files, exotic drivers) fall back to "Joystick N" with
 * JoystickConfig::fallbackAxes axes.
 * Battery state is read from the matching sysfs power_supply entry.
 *
 * @see IDriver
 */
#pragma once

#ifndef BPB_GAMEPAD_JOYSTICK_DRIVER_HPP
    #define BPB_GAMEPAD_JOYSTICK_DRIVER_HPP

    #include <bpb/core/Constants.hpp>
    #include <bpb/gamepad/AxisButtonMapper.hpp>
    #include <bpb/gamepad/IDriver.hpp>

    #include <memory>
    #include <string>
    #include <vector>

namespace bpb::gamepad {

struct JoystickConfig {
    std::string deviceDir = std::string(core::kJoystickDir);
    std::string sysfsDir  = std::string(core::kInputSysfsRoot);
    core::u32   maxDevices = core::kMaxJoysticks;
    std::vector<AxisToButton> axisButtons;
    /** Axis count assumed for nodes that do not answer JSIOCGAXES. */
    core::u8    fallbackAxes = 0;
};

class JoystickDriver final : public IDriver {
public:
    explicit JoystickDriver(JoystickConfig config = {});
    ~JoystickDriver() override;

    [[nodiscard]] DriverExpected<void> init() override;
    [[nodiscard]] GamepadSet devices() const override;
    [[nodiscard]] std::optional<GamepadEvent> nextEvent() override;
    [[nodiscard]] const char *name() const noexcept override { return "linux-joystick"; }

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_JOYSTICK_DRIVER_HPP
