/**
 * @file EventRelay.cpp
 * @brief EventRelay implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <bpb/bridge/EventRelay.hpp>

#include <bpb/core/Assert.hpp>
#include <bpb/core/Log.hpp>

#include <string>

namespace bpb::bridge {

void LogEventSink::relay(const gamepad::GamepadEvent &event)
{
    core::Log::info("RELAY", std::to_string(event.time.count()) + "ms New event from "
        + std::to_string(event.id) + ": " + gamepad::toString(event.payload));
}

EventRelay::EventRelay(gamepad::IDriver &driver,
                       IEventSink &sink,
                       std::chrono::milliseconds interval,
                       SleepFn sleep)
    : _driver(driver)
    , _sink(sink)
    , _interval(interval)
    , _sleep(std::move(sleep))
{
    BPB_ASSERT(_sleep);
}

core::usize EventRelay::drain()
{
    core::usize count = 0;
    while (auto event = _driver.nextEvent()) {
        _sink.relay(*event);
        ++count;
    }
    _relayed += count;
    return count;
}

void EventRelay::run()
{
    core::Log::info("RELAY", "relaying gamepad events every "
        + std::to_string(_interval.count()) + "ms");

    for (;;) {
        drain();
        ++_iterations;
        if (stopRequested()) {
            break;
        }
        _sleep(_interval);
    }

    core::Log::info("RELAY", "stopped after " + std::to_string(_iterations) + " iterations, "
        + std::to_string(_relayed) + " events relayed");
}

} // namespace bpb::bridge
