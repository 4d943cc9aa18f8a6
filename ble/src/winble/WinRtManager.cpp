/**
 * @file WinRtManager.cpp
 * @brief C++/WinRT implementation of the Windows BLE backend.
 * @author MasterLaplace
 *
 * WinRT reports failures as winrt::hresult_error exceptions; they are
 * converted to core::Error at each public entry point and never cross
 * into the bridge.
 */

#include "bpb/ble/winble/WinRtManager.hpp"
#include "bpb/ble/AdvertisingData.hpp"

#include <bpb/core/Log.hpp>
#include <bpb/core/WeakBind.hpp>

#include <cstdint>
#include <memory>
#include <mutex>

#include <winrt/Windows.Devices.Bluetooth.Advertisement.h>
#include <winrt/Windows.Devices.Bluetooth.h>
#include <winrt/Windows.Foundation.Collections.h>
#include <winrt/Windows.Foundation.h>

namespace bpb::ble::winble {

namespace {

constexpr const char *kTag = "BLE";

namespace wdb  = winrt::Windows::Devices::Bluetooth;
namespace wdba = winrt::Windows::Devices::Bluetooth::Advertisement;

// RPC_E_CHANGED_MODE
constexpr winrt::hresult kApartmentAlreadySet{static_cast<std::int32_t>(0x80010106)};

core::Error fromHresult(core::ErrorCode code, const std::string &what, const winrt::hresult_error &e)
{
    return core::Error{code, what + ": " + winrt::to_string(e.message())};
}

} // namespace

struct WinRtCentral::Impl {
    wdb::BluetoothAdapter                      adapter{nullptr};
    wdba::BluetoothLEAdvertisementWatcher      watcher{nullptr};
    winrt::event_token                         receivedToken{};
    std::string                                name;
    std::mutex                                 mutex;
    PeripheralTable                            table;

    ~Impl() { stop(); }

    void stop() noexcept
    {
        if (!watcher) {
            return;
        }
        try {
            watcher.Received(receivedToken);
            watcher.Stop();
        } catch (const winrt::hresult_error &e) {
            core::Log::debug(kTag, name + ": stopping watcher: " + winrt::to_string(e.message()));
        }
        watcher = nullptr;
    }

    void onReceived(const wdba::BluetoothLEAdvertisementReceivedEventArgs &args)
    {
        PeripheralRecord record;
        record.address = formatAddress(static_cast<core::u64>(args.BluetoothAddress()));

        const auto localName = args.Advertisement().LocalName();
        if (!localName.empty()) {
            record.localName = winrt::to_string(localName);
        }
        record.rssi = static_cast<core::i16>(args.RawSignalStrengthInDBm());

        std::lock_guard lock(mutex);
        table.merge(std::move(record));
    }
};

WinRtCentral::WinRtCentral(std::shared_ptr<Impl> impl)
    : _impl(std::move(impl))
{
}

WinRtCentral::~WinRtCentral()
{
    if (_impl) {
        _impl->stop();
    }
}

WinRtCentral::WinRtCentral(WinRtCentral &&other) noexcept = default;

WinRtCentral &WinRtCentral::operator=(WinRtCentral &&other) noexcept
{
    if (this == &other) {
        return *this;
    }
    if (_impl) {
        _impl->stop();
    }
    _impl = std::move(other._impl);
    return *this;
}

core::ExpectedVoid WinRtCentral::startScan()
{
    try {
        wdba::BluetoothLEAdvertisementWatcher watcher;
        watcher.ScanningMode(wdba::BluetoothLEScanningMode::Active);

        // Handlers run on the thread pool and may still be in flight when
        // the central is released; they hold Impl alive while they run.
        _impl->receivedToken = watcher.Received(core::weakBind(_impl,
            [](Impl &impl, const wdba::BluetoothLEAdvertisementWatcher &,
               const wdba::BluetoothLEAdvertisementReceivedEventArgs &args) { impl.onReceived(args); }));

        watcher.Start();
        if (watcher.Status() == wdba::BluetoothLEAdvertisementWatcherStatus::Aborted) {
            watcher.Received(_impl->receivedToken);
            return core::makeError(core::ErrorCode::kIoError, _impl->name + ": advertisement watcher aborted");
        }
        _impl->watcher = std::move(watcher);
    } catch (const winrt::hresult_error &e) {
        return std::unexpected(fromHresult(core::ErrorCode::kIoError, _impl->name + ": start watcher", e));
    }

    core::Log::info(kTag, _impl->name + ": LE scan started");
    return {};
}

std::vector<PeripheralRecord> WinRtCentral::peripherals()
{
    std::lock_guard lock(_impl->mutex);
    return _impl->table.snapshot();
}

const std::string &WinRtCentral::name() const noexcept
{
    return _impl->name;
}

core::Expected<WinRtManager> WinRtManager::create()
{
    try {
        winrt::init_apartment(winrt::apartment_type::multi_threaded);
    } catch (const winrt::hresult_error &e) {
        // The host may already have chosen an apartment for this thread.
        if (e.code() != kApartmentAlreadySet) {
            return std::unexpected(fromHresult(core::ErrorCode::kBleManagerFailed, "WinRT apartment", e));
        }
    }
    return WinRtManager{};
}

core::Expected<std::vector<WinRtCentral>> WinRtManager::adapters() const
{
    std::vector<WinRtCentral> result;
    try {
        auto adapter = wdb::BluetoothAdapter::GetDefaultAsync().get();
        if (!adapter) {
            return result;
        }
        if (!adapter.IsLowEnergySupported()) {
            core::Log::warn(kTag, "default Bluetooth adapter has no LE support");
            return result;
        }

        auto impl = std::make_shared<WinRtCentral::Impl>();
        impl->adapter = adapter;
        impl->name = formatAddress(static_cast<core::u64>(adapter.BluetoothAddress()));
        result.push_back(WinRtCentral(std::move(impl)));
    } catch (const winrt::hresult_error &e) {
        return std::unexpected(fromHresult(core::ErrorCode::kIoError, "BluetoothAdapter::GetDefaultAsync", e));
    }
    return result;
}

} // namespace bpb::ble::winble
