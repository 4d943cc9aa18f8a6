/**
 * @file AdvertisingData.cpp
 * @brief Advertising payload decoding and the peripheral table.
 * @author MasterLaplace
 */

#include "bpb/ble/AdvertisingData.hpp"

#include <bpb/core/Constants.hpp>

#include <algorithm>
#include <array>
#include <cstdio>

namespace bpb::ble {

namespace {

// type(1) + address type(1) + address(6) + data length(1)
constexpr core::usize kReportHeaderSize = 9;

} // namespace

std::optional<std::string> parseLocalName(std::span<const core::u8> adData)
{
    std::optional<std::string> shortened;
    core::usize pos = 0;

    while (pos < adData.size()) {
        const core::usize length = adData[pos];
        if (length == 0) {
            break;
        }
        if (pos + 1 + length > adData.size()) {
            break;
        }

        const core::u8 type = adData[pos + 1];
        const auto value = adData.subspan(pos + 2, length - 1);
        std::string text(reinterpret_cast<const char *>(value.data()), value.size());

        if (type == hci::kAdCompleteLocalName) {
            return text;
        }
        if (type == hci::kAdShortenedLocalName && !shortened) {
            shortened = std::move(text);
        }

        pos += 1 + length;
    }

    return shortened;
}

std::string formatAddress(std::span<const core::u8, 6> littleEndian)
{
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                  littleEndian[5], littleEndian[4], littleEndian[3],
                  littleEndian[2], littleEndian[1], littleEndian[0]);
    return buf;
}

std::string formatAddress(core::u64 address)
{
    std::array<core::u8, 6> bytes{};
    for (core::usize i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<core::u8>((address >> (8 * i)) & 0xFF);
    }
    return formatAddress(std::span<const core::u8, 6>(bytes));
}

std::vector<PeripheralRecord> parseLeAdvertisingReports(std::span<const core::u8> packet)
{
    std::vector<PeripheralRecord> records;

    // packet type, event code, parameter length, subevent, report count
    if (packet.size() < 5
        || packet[0] != hci::kEventPacket
        || packet[1] != hci::kLeMetaEvent
        || packet[3] != hci::kLeAdvertisingReport) {
        return records;
    }

    const core::usize parameterEnd = std::min<core::usize>(packet.size(), 3u + packet[2]);
    const core::usize count = packet[4];
    core::usize pos = 5;

    for (core::usize i = 0; i < count; ++i) {
        if (pos + kReportHeaderSize > parameterEnd) {
            break;
        }
        const core::usize dataLength = packet[pos + 8];
        // data follows the header, then one signed RSSI byte
        if (pos + kReportHeaderSize + dataLength + 1 > parameterEnd) {
            break;
        }

        PeripheralRecord record;
        record.address = formatAddress(packet.subspan(pos + 2).first<6>());
        record.localName = parseLocalName(packet.subspan(pos + kReportHeaderSize, dataLength));

        const auto rssi = static_cast<core::i8>(packet[pos + kReportHeaderSize + dataLength]);
        if (rssi != core::kRssiUnavailable) {
            record.rssi = rssi;
        }

        records.push_back(std::move(record));
        pos += kReportHeaderSize + dataLength + 1;
    }

    return records;
}

void PeripheralTable::merge(PeripheralRecord record)
{
    const auto it = _index.find(record.address);
    if (it == _index.end()) {
        _index.emplace(record.address, _records.size());
        _records.push_back(std::move(record));
        return;
    }

    PeripheralRecord &known = _records[it->second];
    if (record.localName) {
        known.localName = std::move(record.localName);
    }
    if (record.rssi) {
        known.rssi = record.rssi;
    }
}

void PeripheralTable::clear() noexcept
{
    _records.clear();
    _index.clear();
}

} // namespace bpb::ble
