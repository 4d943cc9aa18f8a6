/**
 * @file IoHidDriver.hpp
 * @brief macOS IOKit HID driver for game pads and joysticks.
 * @author MasterLaplace
 *
 * Matches Generic Desktop GamePad and Joystick devices through an
 * IOHIDManager scheduled on the calling thread's run loop. nextEvent()
 * runs that loop without waiting, so it must be called from the thread
 * that called init(). Buttons are numbered by HID usage (Button 1 is 0),
 * axes in the order X, Y, Z, Rx, Ry, Rz, Slider, Dial, Wheel as present.
 *
 * Only JoystickConfig::axisButtons applies here.
 *
 * @see IDriver
 */
#pragma once

#ifndef BPB_GAMEPAD_IOHID_DRIVER_HPP
    #define BPB_GAMEPAD_IOHID_DRIVER_HPP

    #include <bpb/gamepad/IDriver.hpp>
    #include <bpb/gamepad/JoystickDriver.hpp>

    #include <memory>

namespace bpb::gamepad {

class IoHidDriver final : public IDriver {
public:
    explicit IoHidDriver(JoystickConfig config = {});
    ~IoHidDriver() override;

    [[nodiscard]] DriverExpected<void> init() override;
    [[nodiscard]] GamepadSet devices() const override;
    [[nodiscard]] std::optional<GamepadEvent> nextEvent() override;
    [[nodiscard]] const char *name() const noexcept override { return "iokit-hid"; }

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_IOHID_DRIVER_HPP
