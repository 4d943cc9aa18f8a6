/**
 * @file DiscoverySequencer.inl
 * @brief Template implementation of the discovery sequencer.
 * @see   DiscoverySequencer.hpp
 */

#ifndef BPB_BRIDGE_DISCOVERY_SEQUENCER_INL
    #define BPB_BRIDGE_DISCOVERY_SEQUENCER_INL

    #include <bpb/ble/CentralSelector.hpp>
    #include <bpb/bridge/GamepadBringup.hpp>
    #include <bpb/core/Assert.hpp>
    #include <bpb/core/Log.hpp>

    #include <algorithm>
    #include <string>
    #include <utility>

namespace bpb::bridge {

template <ble::Manager M>
DiscoverySequencer<M>::DiscoverySequencer(gamepad::IDriver &driver,
                                          signal::ISignal &signal,
                                          ManagerFactory createManager,
                                          std::chrono::milliseconds window,
                                          SleepFn sleep)
    : _driver(driver)
    , _signal(signal)
    , _createManager(std::move(createManager))
    , _window(window)
    , _sleep(std::move(sleep))
{
    BPB_ASSERT(_createManager);
    BPB_ASSERT(_sleep);
}

template <ble::Manager M>
core::Expected<BridgeSession<M>> DiscoverySequencer<M>::run()
{
    BPB_ASSERT(!_started);
    _started = true;

    auto session = bringUp();
    if (!session) {
        _stage = Stage::kFailed;
        core::Log::error("BRIDGE", session.error().format());
        _signal.failure();
        return session;
    }

    enter(Stage::kSuccess, false);
    _signal.success();
    return session;
}

template <ble::Manager M>
void DiscoverySequencer<M>::enter(Stage stage, bool notify)
{
    _stage = stage;
    core::Log::debug("BRIDGE", std::string("stage ") + std::string(stageName(stage)));
    if (notify) {
        _signal.progress();
    }
}

template <ble::Manager M>
core::Expected<BridgeSession<M>> DiscoverySequencer<M>::bringUp()
{
    enter(Stage::kStart, true);

    auto gamepads = BPB_TRY(initGamepads(_driver));
    enter(Stage::kGamepadsReady, true);

    auto manager = _createManager();
    if (!manager) {
        return core::wrapError(core::ErrorCode::kBleManagerFailed,
                               "failed to initialize BLE manager", std::move(manager.error()));
    }
    enter(Stage::kManagerReady, false);

    auto central = BPB_TRY(ble::getCentral(*manager));
    enter(Stage::kAdapterReady, true);

    if (auto scan = central.startScan(); !scan) {
        return core::wrapError(core::ErrorCode::kBleScanFailed,
                               "failed to scan for new peripherals", std::move(scan.error()));
    }
    enter(Stage::kScanStarted, true);

    // Polling between slices keeps the backend's report queue short.
    for (auto left = _window; left > std::chrono::milliseconds::zero();) {
        const auto slice = std::min(left, core::kPollInterval);
        _sleep(slice);
        left -= slice;
        static_cast<void>(central.peripherals());
    }
    enter(Stage::kWindowElapsed, true);

    auto peripherals = central.peripherals();
    core::Log::info("BLE", std::to_string(peripherals.size()) + " peripheral(s) discovered");
    for (const auto &record : peripherals) {
        core::Log::info("BLE", record.displayName() + " (" + record.address + ")");
    }
    enter(Stage::kEnumerated, false);

    return BridgeSession<M>{std::move(gamepads), std::move(*manager), std::move(central), std::move(peripherals)};
}

} // namespace bpb::bridge

#endif // BPB_BRIDGE_DISCOVERY_SEQUENCER_INL
