/**
 * @file CoreBluetoothManager.hpp
 * @brief macOS BLE backend over CoreBluetooth.
 * @author MasterLaplace
 *
 * CoreBluetooth exposes a single CBCentralManager per process view of the
 * radio, so the manager lists at most one central and that central needs
 * no connect step. Delegate callbacks run on a private serial dispatch
 * queue; the Objective-C++ side lives entirely in the .mm file.
 *
 * @see CentralSelector.hpp
 */
#pragma once

#ifndef BPB_BLE_CORE_BLUETOOTH_MANAGER_HPP
    #define BPB_BLE_CORE_BLUETOOTH_MANAGER_HPP

    #include <bpb/ble/Types.hpp>
    #include <bpb/core/Expected.hpp>

    #include <memory>
    #include <string>
    #include <vector>

namespace bpb::ble::corebt {

struct CentralState;

class CoreBluetoothCentral final {
public:
    /**
     * @brief Starts scanning for any service; fails unless the radio is
     *        powered on.
     */
    [[nodiscard]] core::ExpectedVoid startScan();

    [[nodiscard]] std::vector<PeripheralRecord> peripherals();

    [[nodiscard]] const std::string &name() const noexcept;

private:
    friend class CoreBluetoothManager;

    explicit CoreBluetoothCentral(std::shared_ptr<CentralState> state);

    std::shared_ptr<CentralState> _state;
};

class CoreBluetoothManager final {
public:
    using Adapter = CoreBluetoothCentral;

    /**
     * @brief Creates the CBCentralManager and waits for its first state
     *        update.
     */
    [[nodiscard]] static core::Expected<CoreBluetoothManager> create();

    /**
     * @brief Lists the radio unless CoreBluetooth reports it unsupported.
     */
    [[nodiscard]] core::Expected<std::vector<CoreBluetoothCentral>> adapters() const;

private:
    explicit CoreBluetoothManager(std::shared_ptr<CentralState> state);

    std::shared_ptr<CentralState> _state;
};

} // namespace bpb::ble::corebt

#endif // BPB_BLE_CORE_BLUETOOTH_MANAGER_HPP
