/**
 * @file ErrorTaxonomy.hpp
 * @brief Classification of bring-up failures into the closed error set.
 *
 * Gamepad driver errors are mapped onto UsbNotSupported,
 * UsbDeviceInitialization or UsbInitialization (the latter keeps the
 * driver error as its cause). MissingGamepad and MissingBleAdapter are
 * synthesized by the caller that observes the empty set.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_BRIDGE_ERROR_TAXONOMY_HPP
    #define BPB_BRIDGE_ERROR_TAXONOMY_HPP

    #include <bpb/core/Error.hpp>
    #include <bpb/gamepad/DriverError.hpp>

namespace bpb::bridge {

[[nodiscard]] core::Error classifyGamepadError(
    gamepad::DriverError error,
    std::source_location loc = std::source_location::current());

[[nodiscard]] core::Error missingGamepad(std::source_location loc = std::source_location::current());

} // namespace bpb::bridge

#endif // BPB_BRIDGE_ERROR_TAXONOMY_HPP
