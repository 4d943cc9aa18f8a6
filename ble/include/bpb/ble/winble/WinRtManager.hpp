/**
 * @file WinRtManager.hpp
 * @brief Windows BLE backend over the C++/WinRT Bluetooth APIs.
 * @author MasterLaplace
 *
 * The default Windows.Devices.Bluetooth adapter is already usable once it
 * is listed, so WinRtCentral is both the adapter and the central type.
 * Advertisements arrive on a WinRT thread-pool thread through a
 * BluetoothLEAdvertisementWatcher and are merged under a mutex.
 *
 * @see CentralSelector.hpp
 */
#pragma once

#ifndef BPB_BLE_WINRT_MANAGER_HPP
    #define BPB_BLE_WINRT_MANAGER_HPP

    #include <bpb/ble/Types.hpp>
    #include <bpb/core/Expected.hpp>

    #include <memory>
    #include <string>
    #include <vector>

namespace bpb::ble::winble {

class WinRtCentral final {
public:
    ~WinRtCentral();

    WinRtCentral(const WinRtCentral &) = delete;
    WinRtCentral &operator=(const WinRtCentral &) = delete;
    WinRtCentral(WinRtCentral &&other) noexcept;
    WinRtCentral &operator=(WinRtCentral &&other) noexcept;

    /**
     * @brief Starts an active advertisement watcher.
     */
    [[nodiscard]] core::ExpectedVoid startScan();

    [[nodiscard]] std::vector<PeripheralRecord> peripherals();

    [[nodiscard]] const std::string &name() const noexcept;

private:
    friend class WinRtManager;

    struct Impl;
    explicit WinRtCentral(std::shared_ptr<Impl> impl);

    std::shared_ptr<Impl> _impl;
};

class WinRtManager final {
public:
    using Adapter = WinRtCentral;

    /**
     * @brief Initializes the WinRT apartment for the calling thread.
     */
    [[nodiscard]] static core::Expected<WinRtManager> create();

    /**
     * @brief Lists the default adapter when it exists and supports LE.
     */
    [[nodiscard]] core::Expected<std::vector<WinRtCentral>> adapters() const;

private:
    WinRtManager() = default;
};

} // namespace bpb::ble::winble

#endif // BPB_BLE_WINRT_MANAGER_HPP
