/**
 * @file BluezManager.hpp
 * @brief BlueZ (Linux) BLE backend over raw HCI sockets.
 * @author MasterLaplace
 *
 * BluezManager owns an HCI control socket used to enumerate hciN
 * devices. A BluezAdapter is only a description of such a device; it has
 * to be connected (HCI device socket opened) to become a BluezCentral.
 * Scanning is driven with the libbluetooth HCI helpers and advertising
 * reports are drained from the non-blocking socket on each
 * peripherals() call, so no background thread is involved.
 *
 * @see CentralSelector.hpp
 */
#pragma once

#ifndef BPB_BLE_BLUEZ_MANAGER_HPP
    #define BPB_BLE_BLUEZ_MANAGER_HPP

    #include <bpb/ble/Types.hpp>
    #include <bpb/core/Expected.hpp>

    #include <memory>
    #include <string>
    #include <vector>

namespace bpb::ble::bluez {

/**
 * @brief Open HCI device socket with LE scanning control.
 */
class BluezCentral final {
public:
    ~BluezCentral();

    BluezCentral(const BluezCentral &) = delete;
    BluezCentral &operator=(const BluezCentral &) = delete;
    BluezCentral(BluezCentral &&other) noexcept;
    BluezCentral &operator=(BluezCentral &&other) noexcept;

    /**
     * @brief Enables active LE scanning and switches the socket to
     *        non-blocking advertising-report delivery.
     */
    [[nodiscard]] core::ExpectedVoid startScan();

    /**
     * @brief Drains pending advertising reports and returns every
     *        peripheral seen since startScan().
     */
    [[nodiscard]] std::vector<PeripheralRecord> peripherals();

    [[nodiscard]] const std::string &name() const noexcept;

private:
    friend class BluezAdapter;

    BluezCentral(int deviceId, int socket, std::string name);

    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/**
 * @brief One hciN device as listed by the kernel.
 */
class BluezAdapter final {
public:
    using Connected = BluezCentral;

    /**
     * @brief Opens the HCI device socket.
     *
     * Fails when the device is down or the socket cannot be opened
     * (typically missing CAP_NET_RAW).
     */
    [[nodiscard]] core::Expected<BluezCentral> connect() const;

    [[nodiscard]] const std::string &name()    const noexcept { return _name; }
    [[nodiscard]] const std::string &address() const noexcept { return _address; }
    [[nodiscard]] int  deviceId() const noexcept { return _deviceId; }
    [[nodiscard]] bool isUp()     const noexcept { return _up; }

private:
    friend class BluezManager;

    BluezAdapter(int deviceId, std::string name, std::string address, bool up);

    int         _deviceId;
    std::string _name;
    std::string _address;
    bool        _up;
};

class BluezManager final {
public:
    using Adapter = BluezAdapter;

    /**
     * @brief Opens the HCI control socket.
     */
    [[nodiscard]] static core::Expected<BluezManager> create();

    ~BluezManager();

    BluezManager(const BluezManager &) = delete;
    BluezManager &operator=(const BluezManager &) = delete;
    BluezManager(BluezManager &&other) noexcept;
    BluezManager &operator=(BluezManager &&other) noexcept;

    /**
     * @brief Lists hciN devices in kernel order.
     */
    [[nodiscard]] core::Expected<std::vector<BluezAdapter>> adapters() const;

private:
    explicit BluezManager(int controlSocket);

    int _control = -1;
};

} // namespace bpb::ble::bluez

#endif // BPB_BLE_BLUEZ_MANAGER_HPP
