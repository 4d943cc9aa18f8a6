/**
 * @file UnsupportedDriver.cpp
 * @brief UnsupportedDriver implementation.
 * @author MasterLaplace
 */

#include "bpb/gamepad/UnsupportedDriver.hpp"

namespace bpb::gamepad {

DriverExpected<void> UnsupportedDriver::init()
{
    return std::unexpected(DriverError::make(
        DriverErrorKind::kNotImplemented, core::ErrorCode::kNotImplemented,
        "gamepad input is not implemented on this platform"));
}

} // namespace bpb::gamepad
