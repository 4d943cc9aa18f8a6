/**
 * @file UnsupportedDriver.hpp
 * @brief Driver used on platforms without a gamepad backend.
 *
 * init() always fails with DriverErrorKind::kNotImplemented.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_GAMEPAD_UNSUPPORTED_DRIVER_HPP
    #define BPB_GAMEPAD_UNSUPPORTED_DRIVER_HPP

    #include <bpb/gamepad/IDriver.hpp>

namespace bpb::gamepad {

class UnsupportedDriver final : public IDriver {
public:
    UnsupportedDriver() = default;

    [[nodiscard]] DriverExpected<void> init() override;
    [[nodiscard]] GamepadSet devices() const override { return {}; }
    [[nodiscard]] std::optional<GamepadEvent> nextEvent() override { return std::nullopt; }
    [[nodiscard]] const char *name() const noexcept override { return "unsupported"; }
};

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_UNSUPPORTED_DRIVER_HPP
