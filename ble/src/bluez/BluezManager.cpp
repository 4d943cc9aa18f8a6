/**
 * @file BluezManager.cpp
 * @brief BlueZ implementation of the BLE manager, adapter and central.
 * @author MasterLaplace
 *
 * Uses the libbluetooth HCI helpers (hci_open_dev, hci_le_set_scan_*)
 * on top of AF_BLUETOOTH raw sockets. Requires CAP_NET_RAW (or root) to
 * change scan state.
 */

#include "bpb/ble/bluez/BluezManager.hpp"
#include "bpb/ble/AdvertisingData.hpp"

#include <bpb/core/Constants.hpp>
#include <bpb/core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace bpb::ble::bluez {

namespace {

constexpr const char *kTag = "BLE";

constexpr core::u8 kActiveScan       = 0x01;
constexpr core::u8 kAcceptAllFilter  = 0x00;
constexpr core::u8 kScanEnable       = 0x01;
constexpr core::u8 kScanDisable      = 0x00;
constexpr core::u8 kFilterDuplicates = 0x01;

std::string errnoText(const std::string &what)
{
    return what + ": " + std::strerror(errno);
}

} // namespace

// ---- BluezCentral -------------------------------------------------------

struct BluezCentral::Impl {
    int             deviceId = -1;
    int             socket = -1;
    std::string     name;
    bool            scanning = false;
    PeripheralTable table;

    ~Impl()
    {
        if (socket < 0) {
            return;
        }
        if (scanning && hci_le_set_scan_enable(socket, kScanDisable, kFilterDuplicates, core::kHciTimeoutMs) < 0) {
            core::Log::debug(kTag, errnoText(name + ": disabling scan on close"));
        }
        hci_close_dev(socket);
    }

    void drain()
    {
        std::array<core::u8, HCI_MAX_EVENT_SIZE> buf{};
        for (;;) {
            const ssize_t n = ::read(socket, buf.data(), buf.size());
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    core::Log::warn(kTag, errnoText(name + ": reading advertising reports"));
                }
                return;
            }
            if (n == 0) {
                return;
            }
            for (auto &record : parseLeAdvertisingReports(std::span<const core::u8>(buf.data(), static_cast<core::usize>(n)))) {
                table.merge(std::move(record));
            }
        }
    }
};

BluezCentral::BluezCentral(int deviceId, int socket, std::string name)
    : _impl(std::make_unique<Impl>())
{
    _impl->deviceId = deviceId;
    _impl->socket = socket;
    _impl->name = std::move(name);
}

BluezCentral::~BluezCentral() = default;
BluezCentral::BluezCentral(BluezCentral &&other) noexcept = default;
BluezCentral &BluezCentral::operator=(BluezCentral &&other) noexcept = default;

core::ExpectedVoid BluezCentral::startScan()
{
    const int dd = _impl->socket;

    // A controller left scanning by another process rejects new parameters.
    if (hci_le_set_scan_enable(dd, kScanDisable, kFilterDuplicates, core::kHciTimeoutMs) < 0) {
        core::Log::debug(kTag, errnoText(_impl->name + ": scan was not active"));
    }

    if (hci_le_set_scan_parameters(dd, kActiveScan,
                                   htobs(core::kLeScanInterval), htobs(core::kLeScanWindow),
                                   LE_PUBLIC_ADDRESS, kAcceptAllFilter, core::kHciTimeoutMs) < 0) {
        return core::makeError(core::ErrorCode::kIoError,
                               errnoText(_impl->name + ": set LE scan parameters"));
    }

    // The controller reports each address once per scan, so the socket
    // buffer holds one report per peripheral instead of one per advert.
    if (hci_le_set_scan_enable(dd, kScanEnable, kFilterDuplicates, core::kHciTimeoutMs) < 0) {
        return core::makeError(core::ErrorCode::kIoError,
                               errnoText(_impl->name + ": enable LE scan"));
    }
    _impl->scanning = true;

    struct hci_filter filter{};
    hci_filter_clear(&filter);
    hci_filter_set_ptype(HCI_EVENT_PKT, &filter);
    hci_filter_set_event(EVT_LE_META_EVENT, &filter);
    if (::setsockopt(dd, SOL_HCI, HCI_FILTER, &filter, sizeof(filter)) < 0) {
        return core::makeError(core::ErrorCode::kIoError,
                               errnoText(_impl->name + ": set HCI event filter"));
    }

    const int flags = ::fcntl(dd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(dd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return core::makeError(core::ErrorCode::kIoError,
                               errnoText(_impl->name + ": set non-blocking mode"));
    }

    core::Log::info(kTag, _impl->name + ": LE scan started");
    return {};
}

std::vector<PeripheralRecord> BluezCentral::peripherals()
{
    if (_impl->scanning) {
        _impl->drain();
    }
    return _impl->table.snapshot();
}

const std::string &BluezCentral::name() const noexcept
{
    return _impl->name;
}

// ---- BluezAdapter -------------------------------------------------------

BluezAdapter::BluezAdapter(int deviceId, std::string name, std::string address, bool up)
    : _deviceId(deviceId), _name(std::move(name)), _address(std::move(address)), _up(up)
{
}

core::Expected<BluezCentral> BluezAdapter::connect() const
{
    if (!_up) {
        return core::makeError(core::ErrorCode::kBleAdapterFailed,
                               _name + " (" + _address + ") is down");
    }

    const int dd = hci_open_dev(_deviceId);
    if (dd < 0) {
        return core::makeError(core::ErrorCode::kDeviceOpenFailed, errnoText(_name));
    }

    return BluezCentral(_deviceId, dd, _name);
}

// ---- BluezManager -------------------------------------------------------

BluezManager::BluezManager(int controlSocket)
    : _control(controlSocket)
{
}

BluezManager::~BluezManager()
{
    if (_control >= 0) {
        ::close(_control);
    }
}

BluezManager::BluezManager(BluezManager &&other) noexcept
    : _control(other._control)
{
    other._control = -1;
}

BluezManager &BluezManager::operator=(BluezManager &&other) noexcept
{
    if (this == &other) {
        return *this;
    }
    if (_control >= 0) {
        ::close(_control);
    }
    _control = other._control;
    other._control = -1;
    return *this;
}

core::Expected<BluezManager> BluezManager::create()
{
    const int ctl = ::socket(AF_BLUETOOTH, SOCK_RAW | SOCK_CLOEXEC, BTPROTO_HCI);
    if (ctl < 0) {
        if (errno == EAFNOSUPPORT) {
            return core::makeError(core::ErrorCode::kBleManagerFailed,
                                   "Bluetooth is not supported by this kernel");
        }
        return core::makeError(core::ErrorCode::kBleManagerFailed, errnoText("HCI control socket"));
    }
    return BluezManager(ctl);
}

core::Expected<std::vector<BluezAdapter>> BluezManager::adapters() const
{
    std::vector<core::u8> storage(sizeof(hci_dev_list_req) + HCI_MAX_DEV * sizeof(hci_dev_req));
    auto *list = reinterpret_cast<hci_dev_list_req *>(storage.data());
    list->dev_num = HCI_MAX_DEV;

    if (::ioctl(_control, HCIGETDEVLIST, list) < 0) {
        return core::makeError(core::ErrorCode::kIoError, errnoText("HCIGETDEVLIST"));
    }

    std::vector<BluezAdapter> result;
    result.reserve(list->dev_num);

    for (int i = 0; i < list->dev_num; ++i) {
        hci_dev_info info{};
        info.dev_id = list->dev_req[i].dev_id;
        if (::ioctl(_control, HCIGETDEVINFO, &info) < 0) {
            core::Log::warn(kTag, errnoText("HCIGETDEVINFO hci" + std::to_string(info.dev_id)));
            continue;
        }

        char address[18] = {};
        ba2str(&info.bdaddr, address);
        const bool up = hci_test_bit(HCI_UP, &info.flags) != 0;

        core::Log::debug(kTag, std::string(info.name) + " " + address + (up ? " up" : " down"));
        result.push_back(BluezAdapter(info.dev_id, info.name, address, up));
    }

    return result;
}

} // namespace bpb::ble::bluez
