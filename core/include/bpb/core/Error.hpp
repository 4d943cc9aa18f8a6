/**
 * @file Error.hpp
 * @brief Structured error type with source location and an opaque cause.
 *
 * Every subsystem of the bridge reports failures as an Error value. The
 * first five codes form the closed bring-up taxonomy (USB support, USB
 * device setup, USB subsystem setup, missing gamepad, missing BLE
 * adapter); the remaining codes describe subsystem faults which are
 * carried as wrapped causes rather than reclassified.
 *
 * A cause is shared and immutable: wrapping never copies or interprets
 * the inner error, it only prefixes a contextual message.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_CORE_ERROR_HPP
    #define BPB_CORE_ERROR_HPP

    #include "Types.hpp"

    #include <expected>
    #include <memory>
    #include <source_location>
    #include <string>
    #include <string_view>

namespace bpb::core {

/**
 * @brief Bridge-wide error code enumeration.
 */
enum class ErrorCode : u16 {
    kNone = 0,

    kUsbNotSupported,
    kUsbDeviceInitialization,
    kUsbInitialization,
    kMissingGamepad,
    kMissingBleAdapter,

    kInvalidArgument,
    kInvalidState,
    kNotImplemented,
    kIoError,

    kDeviceOpenFailed,
    kDeviceReadFailed,
    kDeviceClosed,

    kBleManagerFailed,
    kBleAdapterFailed,
    kBleConnectFailed,
    kBleScanFailed,

    kInternalError,
};

/**
 * @brief Returns a short human-readable label for the given error code.
 */
[[nodiscard]] constexpr std::string_view errorCodeName(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::kNone:                     return "None";
        case ErrorCode::kUsbNotSupported:          return "UsbNotSupported";
        case ErrorCode::kUsbDeviceInitialization:  return "UsbDeviceInitialization";
        case ErrorCode::kUsbInitialization:        return "UsbInitialization";
        case ErrorCode::kMissingGamepad:           return "MissingGamepad";
        case ErrorCode::kMissingBleAdapter:        return "MissingBleAdapter";
        case ErrorCode::kInvalidArgument:          return "InvalidArgument";
        case ErrorCode::kInvalidState:             return "InvalidState";
        case ErrorCode::kNotImplemented:           return "NotImplemented";
        case ErrorCode::kIoError:                  return "IoError";
        case ErrorCode::kDeviceOpenFailed:         return "DeviceOpenFailed";
        case ErrorCode::kDeviceReadFailed:         return "DeviceReadFailed";
        case ErrorCode::kDeviceClosed:             return "DeviceClosed";
        case ErrorCode::kBleManagerFailed:         return "BleManagerFailed";
        case ErrorCode::kBleAdapterFailed:         return "BleAdapterFailed";
        case ErrorCode::kBleConnectFailed:         return "BleConnectFailed";
        case ErrorCode::kBleScanFailed:            return "BleScanFailed";
        case ErrorCode::kInternalError:            return "InternalError";
    }
    return "Unknown";
}

/**
 * @brief True for the five codes of the closed bring-up taxonomy.
 */
[[nodiscard]] constexpr bool isBringupKind(ErrorCode code) noexcept
{
    return code >= ErrorCode::kUsbNotSupported && code <= ErrorCode::kMissingBleAdapter;
}

/**
 * @brief Structured error value carrying a code, message, origin and an
 *        optional cause.
 */
class Error final {
public:
    /**
     * @brief Construct an error from a code and message.
     * @param code    Enumerated error code.
     * @param message Human-readable description.
     * @param loc     Source location (auto-filled by the compiler).
     */
    explicit Error(
        ErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc) {}

    /**
     * @brief Construct an error that wraps @p cause.
     */
    Error(
        ErrorCode code,
        std::string message,
        Error cause,
        std::source_location loc = std::source_location::current()
    ) : _code(code), _message(std::move(message)), _location(loc),
        _cause(std::make_shared<const Error>(std::move(cause))) {}

    [[nodiscard]] ErrorCode            code()     const { return _code; }
    [[nodiscard]] const std::string   &message()  const { return _message; }
    [[nodiscard]] std::source_location location() const { return _location; }

    /** @brief The wrapped error, or nullptr when this error is a root. */
    [[nodiscard]] const Error *cause() const { return _cause.get(); }

    /** @brief The innermost error of the chain (this when unwrapped). */
    [[nodiscard]] const Error &rootCause() const;

    /**
     * @brief Formats the chain as "[Code] message: [Code] cause (file:line)".
     *
     * The location is the one of the outermost error.
     */
    [[nodiscard]] std::string format() const;

private:
    ErrorCode                    _code;
    std::string                  _message;
    std::source_location         _location;
    std::shared_ptr<const Error> _cause;
};

/// @brief Convenience alias for std::unexpected<Error>.
using Unexpected = std::unexpected<Error>;

/// @brief Factory function to create an unexpected error.
/// @param code Error code.
/// @param message Human-readable description.
/// @param loc Source location (auto-filled).
/// @return std::unexpected<Error>.
[[nodiscard]] inline Unexpected makeError(
    ErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return Unexpected(Error{code, std::move(message), loc});
}

/// @brief Factory function to create an unexpected error wrapping @p cause.
[[nodiscard]] inline Unexpected wrapError(
    ErrorCode code,
    std::string message,
    Error cause,
    std::source_location loc = std::source_location::current())
{
    return Unexpected(Error{code, std::move(message), std::move(cause), loc});
}

} // namespace bpb::core

#endif // BPB_CORE_ERROR_HPP
