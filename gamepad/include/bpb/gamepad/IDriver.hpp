/**
 * @file IDriver.hpp
 * @brief Abstract gamepad driver (Linux joystick API, XInput, IOKit HID,
 *        unsupported stub, test fakes).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_GAMEPAD_IDRIVER_HPP
    #define BPB_GAMEPAD_IDRIVER_HPP

    #include <bpb/gamepad/DriverError.hpp>
    #include <bpb/gamepad/Types.hpp>

    #include <optional>

namespace bpb::gamepad {

/**
 * @class IDriver
 * @brief Input subsystem handle.
 *
 * Contract:
 * 1. init() opens the subsystem and enumerates devices. It may succeed
 *    with zero devices; deciding whether that is fatal is the caller's job.
 * 2. devices() lists what init() found, with their current power state.
 * 3. nextEvent() never blocks: it returns the next buffered event or
 *    std::nullopt when nothing is pending right now.
 */
class IDriver {
public:
    virtual ~IDriver() = default;

    IDriver(const IDriver &) = delete;
    IDriver &operator=(const IDriver &) = delete;

    [[nodiscard]] virtual DriverExpected<void> init() = 0;

    [[nodiscard]] virtual GamepadSet devices() const = 0;

    [[nodiscard]] virtual std::optional<GamepadEvent> nextEvent() = 0;

    /** @brief Returns a human-readable backend name. */
    [[nodiscard]] virtual const char *name() const noexcept = 0;

protected:
    IDriver() = default;
};

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_IDRIVER_HPP
