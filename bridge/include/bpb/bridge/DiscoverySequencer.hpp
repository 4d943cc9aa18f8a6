/**
 * @file DiscoverySequencer.hpp
 * @brief Staged bring-up of the gamepads and the BLE central.
 * @author MasterLaplace
 *
 * Stages advance strictly in declaration order, never skip and never go
 * back:
 *
 *   Start -> GamepadsReady -> ManagerReady -> AdapterReady
 *         -> ScanStarted -> WindowElapsed -> Enumerated -> Success
 *
 * Failed is reachable from any non-terminal stage. Progress is signalled
 * on Start, GamepadsReady, AdapterReady, ScanStarted and WindowElapsed,
 * so a successful run produces five progress() calls followed by one
 * success(). A failed run produces exactly one failure() and no
 * success(), and is logged at error level.
 *
 * The discovery window is slept in slices of at most kPollInterval and
 * the central is polled after each slice.
 */
#pragma once

#ifndef BPB_BRIDGE_DISCOVERY_SEQUENCER_HPP
    #define BPB_BRIDGE_DISCOVERY_SEQUENCER_HPP

    #include <bpb/ble/Concepts.hpp>
    #include <bpb/bridge/Sleep.hpp>
    #include <bpb/core/Constants.hpp>
    #include <bpb/core/Expected.hpp>
    #include <bpb/gamepad/IDriver.hpp>
    #include <bpb/signal/ISignal.hpp>

    #include <chrono>
    #include <functional>
    #include <string_view>
    #include <vector>

namespace bpb::bridge {

enum class Stage : core::u8 {
    kStart = 0,
    kGamepadsReady,
    kManagerReady,
    kAdapterReady,
    kScanStarted,
    kWindowElapsed,
    kEnumerated,
    kSuccess,
    kFailed
};

[[nodiscard]] std::string_view stageName(Stage stage) noexcept;

/**
 * @brief Everything bring-up produced, kept alive for the relay phase.
 *
 * The central is declared after the manager so it is released first.
 */
template <ble::Manager M>
struct BridgeSession {
    gamepad::GamepadSet                gamepads;
    M                                  manager;
    ble::CentralOf<M>                  central;
    std::vector<ble::PeripheralRecord> peripherals;
};

template <ble::Manager M>
class DiscoverySequencer {
public:
    using ManagerFactory = std::function<core::Expected<M>()>;

    DiscoverySequencer(gamepad::IDriver &driver,
                       signal::ISignal &signal,
                       ManagerFactory createManager,
                       std::chrono::milliseconds window = core::kDiscoveryWindow,
                       SleepFn sleep = defaultSleep);

    /**
     * @brief Runs every stage once.
     *
     * Must be called at most once per instance.
     */
    [[nodiscard]] core::Expected<BridgeSession<M>> run();

    [[nodiscard]] Stage stage() const noexcept { return _stage; }

private:
    core::Expected<BridgeSession<M>> bringUp();
    void enter(Stage stage, bool notify);

    gamepad::IDriver          &_driver;
    signal::ISignal           &_signal;
    ManagerFactory             _createManager;
    std::chrono::milliseconds  _window;
    SleepFn                    _sleep;
    Stage                      _stage = Stage::kStart;
    bool                       _started = false;
};

} // namespace bpb::bridge

    #include "DiscoverySequencer.inl"

#endif // BPB_BRIDGE_DISCOVERY_SEQUENCER_HPP
