/**
 * @file DriverError.hpp
 * @brief Raw error domain of the gamepad drivers.
 *
 * Drivers report failures in their own three-way domain; the bridge maps
 * it onto the bring-up taxonomy. The @c detail error is carried verbatim
 * so that an unclassified failure keeps its original diagnostic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_GAMEPAD_DRIVER_ERROR_HPP
    #define BPB_GAMEPAD_DRIVER_ERROR_HPP

    #include <bpb/core/Error.hpp>

    #include <expected>
    #include <source_location>
    #include <string>

namespace bpb::gamepad {

enum class DriverErrorKind : core::u8 {
    /** The driver has no backend on this platform. */
    kNotImplemented,
    /** An axis-to-button mapping entry cannot be applied. */
    kInvalidAxisToButton,
    /** Anything else; see DriverError::detail. */
    kOther
};

struct DriverError {
    DriverErrorKind kind;
    core::Error     detail;

    [[nodiscard]] static DriverError make(
        DriverErrorKind kind,
        core::ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current())
    {
        return DriverError{kind, core::Error{code, std::move(message), loc}};
    }
};

template <typename T>
using DriverExpected = std::expected<T, DriverError>;

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_DRIVER_ERROR_HPP
