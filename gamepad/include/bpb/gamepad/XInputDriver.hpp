/**
 * @file XInputDriver.hpp
 * @brief Windows XInput driver (controller slots 0 to 3).
 * @author MasterLaplace
 *
 * XInput has no events: nextEvent() polls every slot and diffs the new
 * state against the last one. Axes are numbered like the Linux xpad
 * driver (0 LX, 1 LY, 2 LT, 3 RX, 4 RY, 5 RT), sticks in [-1, 1] with
 * up negative, triggers in [0, 1]. Buttons are A, B, X, Y, LB, RB, Back,
 * Start, LS, RS, then the d-pad up, down, left, right.
 *
 * Only JoystickConfig::axisButtons applies here.
 *
 * @see IDriver
 */
#pragma once

#ifndef BPB_GAMEPAD_XINPUT_DRIVER_HPP
    #define BPB_GAMEPAD_XINPUT_DRIVER_HPP

    #include <bpb/gamepad/IDriver.hpp>
    #include <bpb/gamepad/JoystickDriver.hpp>

    #include <memory>

namespace bpb::gamepad {

class XInputDriver final : public IDriver {
public:
    explicit XInputDriver(JoystickConfig config = {});
    ~XInputDriver() override;

    [[nodiscard]] DriverExpected<void> init() override;
    [[nodiscard]] GamepadSet devices() const override;
    [[nodiscard]] std::optional<GamepadEvent> nextEvent() override;
    [[nodiscard]] const char *name() const noexcept override { return "xinput"; }

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_XINPUT_DRIVER_HPP
