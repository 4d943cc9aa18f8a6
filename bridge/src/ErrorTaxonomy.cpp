/**
 * @file ErrorTaxonomy.cpp
 * @brief Gamepad error classification.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <bpb/bridge/ErrorTaxonomy.hpp>

namespace bpb::bridge {

core::Error classifyGamepadError(gamepad::DriverError error, std::source_location loc)
{
    switch (error.kind) {
        case gamepad::DriverErrorKind::kNotImplemented:
            return core::Error{core::ErrorCode::kUsbNotSupported, "USB not supported", loc};
        case gamepad::DriverErrorKind::kInvalidAxisToButton:
            return core::Error{core::ErrorCode::kUsbDeviceInitialization,
                               "USB device initialization error: " + error.detail.message(), loc};
        case gamepad::DriverErrorKind::kOther:
            break;
    }
    return core::Error{core::ErrorCode::kUsbInitialization, "USB initialization error",
                       std::move(error.detail), loc};
}

core::Error missingGamepad(std::source_location loc)
{
    return core::Error{core::ErrorCode::kMissingGamepad, "No gamepad found", loc};
}

} // namespace bpb::bridge
