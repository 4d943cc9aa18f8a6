/**
 * @file AdvertisingData.hpp
 * @brief Platform-independent decoding of BLE advertising payloads and
 *        the address-keyed table every backend accumulates reports in.
 * @author MasterLaplace
 *
 * The HCI decoder follows the LE Advertising Report event layout of the
 * Bluetooth Core specification (Vol 4, Part E, 7.7.65.2) as BlueZ delivers
 * it on a raw HCI socket: packet type, event header, then one record per
 * report laid out back to back.
 */
#pragma once

#ifndef BPB_BLE_ADVERTISING_DATA_HPP
    #define BPB_BLE_ADVERTISING_DATA_HPP

    #include <bpb/ble/Types.hpp>

    #include <span>
    #include <string>
    #include <unordered_map>
    #include <vector>

namespace bpb::ble {

namespace hci {

inline constexpr core::u8 kEventPacket           = 0x04;
inline constexpr core::u8 kLeMetaEvent           = 0x3E;
inline constexpr core::u8 kLeAdvertisingReport   = 0x02;

inline constexpr core::u8 kAdShortenedLocalName  = 0x08;
inline constexpr core::u8 kAdCompleteLocalName   = 0x09;

} // namespace hci

/**
 * @brief Extracts the local name from advertising data AD structures.
 *
 * The complete name wins over the shortened one. A truncated structure
 * ends the walk; whatever was decoded before it is kept.
 */
[[nodiscard]] std::optional<std::string> parseLocalName(std::span<const core::u8> adData);

/**
 * @brief Formats a little-endian 48-bit device address as
 *        "AA:BB:CC:DD:EE:FF" (most significant byte first).
 */
[[nodiscard]] std::string formatAddress(std::span<const core::u8, 6> littleEndian);

/** @brief Same as formatAddress() for an address packed in an integer. */
[[nodiscard]] std::string formatAddress(core::u64 address);

/**
 * @brief Decodes an LE Advertising Report HCI event.
 *
 * @param packet One packet as read from an HCI socket, starting with the
 *               packet type byte.
 * @return One record per report; empty for any other event or for a
 *         malformed packet.
 */
[[nodiscard]] std::vector<PeripheralRecord> parseLeAdvertisingReports(std::span<const core::u8> packet);

/**
 * @brief Discovery-ordered set of peripherals keyed by address.
 *
 * merge() keeps the first-seen order. A later report without a name does
 * not erase a name learned earlier; the RSSI always follows the latest
 * report that carries one.
 */
class PeripheralTable {
public:
    void merge(PeripheralRecord record);

    [[nodiscard]] std::vector<PeripheralRecord> snapshot() const { return _records; }
    [[nodiscard]] core::usize size() const noexcept { return _records.size(); }

    void clear() noexcept;

private:
    std::vector<PeripheralRecord>                _records;
    std::unordered_map<std::string, core::usize> _index;
};

} // namespace bpb::ble

#endif // BPB_BLE_ADVERTISING_DATA_HPP
