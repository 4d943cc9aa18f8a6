/**
 * @file Types.hpp
 * @brief BLE discovery results shared by every backend.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_BLE_TYPES_HPP
    #define BPB_BLE_TYPES_HPP

    #include <bpb/core/Types.hpp>

    #include <optional>
    #include <string>

namespace bpb::ble {

/**
 * @brief One peripheral seen during a scan window.
 *
 * @c address is "AA:BB:CC:DD:EE:FF" on BlueZ and WinRT; CoreBluetooth
 * hides hardware addresses and reports the peripheral identifier UUID.
 */
struct PeripheralRecord {
    std::string                address;
    std::optional<std::string> localName;
    std::optional<core::i16>   rssi;

    /** @brief Advertised name, or the empty string when none was seen. */
    [[nodiscard]] std::string displayName() const { return localName.value_or(std::string{}); }
};

} // namespace bpb::ble

#endif // BPB_BLE_TYPES_HPP
