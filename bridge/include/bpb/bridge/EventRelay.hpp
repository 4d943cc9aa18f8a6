/**
 * @file EventRelay.hpp
 * @brief Steady-state loop forwarding gamepad events to a sink.
 * @author MasterLaplace
 *
 * Each iteration drains every event the driver has buffered, then sleeps
 * for the poll interval. The stop flag is checked once per iteration,
 * after the drain and before the sleep. requestStop() only touches an
 * atomic flag and may be called from a signal handler.
 */
#pragma once

#ifndef BPB_BRIDGE_EVENT_RELAY_HPP
    #define BPB_BRIDGE_EVENT_RELAY_HPP

    #include <bpb/bridge/Sleep.hpp>
    #include <bpb/core/Constants.hpp>
    #include <bpb/gamepad/IDriver.hpp>

    #include <atomic>
    #include <chrono>

namespace bpb::bridge {

class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void relay(const gamepad::GamepadEvent &event) = 0;
};

/** @brief Logs "<time> New event from <id>: <payload>" under the RELAY tag. */
class LogEventSink final : public IEventSink {
public:
    void relay(const gamepad::GamepadEvent &event) override;
};

class EventRelay {
public:
    EventRelay(gamepad::IDriver &driver,
               IEventSink &sink,
               std::chrono::milliseconds interval = core::kPollInterval,
               SleepFn sleep = defaultSleep);

    /**
     * @brief Relays every currently buffered event.
     * @return Number of events relayed.
     */
    core::usize drain();

    /**
     * @brief Drains and sleeps until requestStop() is observed.
     */
    void run();

    void requestStop() noexcept { _stop.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool stopRequested() const noexcept { return _stop.load(std::memory_order_relaxed); }
    [[nodiscard]] core::u64 iterations() const noexcept { return _iterations; }
    [[nodiscard]] core::u64 relayed() const noexcept { return _relayed; }

private:
    gamepad::IDriver          &_driver;
    IEventSink                &_sink;
    std::chrono::milliseconds  _interval;
    SleepFn                    _sleep;
    std::atomic<bool>          _stop{false};
    core::u64                  _iterations = 0;
    core::u64                  _relayed = 0;
};

} // namespace bpb::bridge

#endif // BPB_BRIDGE_EVENT_RELAY_HPP
