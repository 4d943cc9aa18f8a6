/**
 * @file TestDiscoverySequencer.cpp
 * @brief Stage order and signal counts of the discovery sequencer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <catch2/catch_test_macros.hpp>

#include "Fakes.hpp"

#include "bpb/bridge/DiscoverySequencer.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace bpb;
using namespace std::chrono_literals;

namespace {

struct Harness {
    test::FakeDriver      driver;
    test::RecordingSignal signal;
    test::FakeManager     manager;
    std::optional<core::Error> managerError;
    std::vector<std::chrono::milliseconds> sleeps;
    std::chrono::milliseconds window = 1500ms;

    Harness()
    {
        driver.pads = {test::wiredPad(0, "Pad")};
        test::FakeAdapter adapter;
        adapter.central.seen = {
            {"AA:BB:CC:DD:EE:01", "Carputer", -42},
            {"AA:BB:CC:DD:EE:02", std::nullopt, std::nullopt},
        };
        manager.list.push_back(adapter);
    }

    bridge::DiscoverySequencer<test::FakeManager> sequencer()
    {
        return bridge::DiscoverySequencer<test::FakeManager>(
            driver, signal,
            [this]() -> core::Expected<test::FakeManager> {
                if (managerError) {
                    return std::unexpected(*managerError);
                }
                return manager;
            },
            window,
            [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }
};

void requireSingleFailure(const test::RecordingSignal &signal, long progress)
{
    REQUIRE(signal.count('F') == 1);
    REQUIRE(signal.count('S') == 0);
    REQUIRE(signal.count('P') == progress);
    REQUIRE(signal.calls.back() == 'F');
}

} // namespace

TEST_CASE("A successful run emits five progress signals then one success", "[bridge][sequencer]")
{
    Harness h;
    auto seq = h.sequencer();

    auto session = seq.run();

    REQUIRE(session.has_value());
    REQUIRE(h.signal.calls == "PPPPPS");
    REQUIRE(seq.stage() == bridge::Stage::kSuccess);
    REQUIRE(h.sleeps == std::vector<std::chrono::milliseconds>(15, 100ms));

    REQUIRE(session->gamepads.size() == 1);
    REQUIRE(session->peripherals.size() == 2);
    REQUIRE(session->peripherals[0].displayName() == "Carputer");
    REQUIRE(session->peripherals[1].displayName().empty());
    REQUIRE(session->central.scanning);
}

TEST_CASE("The discovery window is slept in poll-sized slices", "[bridge][sequencer]")
{
    Harness h;
    h.window = 250ms;
    auto seq = h.sequencer();

    auto session = seq.run();

    REQUIRE(session.has_value());
    REQUIRE(h.sleeps == std::vector<std::chrono::milliseconds>{100ms, 100ms, 50ms});
    // One poll after each slice, then the final enumeration.
    REQUIRE(session->central.polls == 4);
    REQUIRE(h.signal.calls == "PPPPPS");
}

TEST_CASE("An empty discovery window enumerates without sleeping", "[bridge][sequencer]")
{
    Harness h;
    h.window = 0ms;
    auto seq = h.sequencer();

    auto session = seq.run();

    REQUIRE(session.has_value());
    REQUIRE(h.sleeps.empty());
    REQUIRE(session->central.polls == 1);
    REQUIRE(session->peripherals.size() == 2);
}

TEST_CASE("A successful run logs the gamepads and every discovered peripheral", "[bridge][sequencer][log]")
{
    Harness h;
    test::LogCapture log;
    auto seq = h.sequencer();

    auto session = seq.run();

    REQUIRE(session.has_value());
    REQUIRE(log.contains(core::LogLevel::kInfo, "GAMEPAD", "Pad is Wired"));
    REQUIRE(log.contains(core::LogLevel::kInfo, "BLE", "2 peripheral(s) discovered"));
    REQUIRE(log.contains(core::LogLevel::kInfo, "BLE", "Carputer (AA:BB:CC:DD:EE:01)"));
    REQUIRE(log.contains(core::LogLevel::kInfo, "BLE", " (AA:BB:CC:DD:EE:02)"));
    REQUIRE(log.count(core::LogLevel::kError) == 0);
}

TEST_CASE("A failed run is logged exactly once at error level", "[bridge][sequencer][log]")
{
    Harness h;
    h.driver.pads.clear();
    test::LogCapture log;
    auto seq = h.sequencer();

    auto session = seq.run();

    REQUIRE_FALSE(session.has_value());
    REQUIRE(log.count(core::LogLevel::kError) == 1);

    const auto &entry = *std::find_if(log.entries.begin(), log.entries.end(),
        [](const test::LogCapture::Entry &e) { return e.level == core::LogLevel::kError; });
    REQUIRE(entry.tag == "BRIDGE");
    REQUIRE(entry.message.starts_with("[MissingGamepad] No gamepad found"));
}

TEST_CASE("Zero discovered peripherals is still a success", "[bridge][sequencer]")
{
    Harness h;
    h.manager.list.front().central.seen.clear();
    auto seq = h.sequencer();

    auto session = seq.run();

    REQUIRE(session.has_value());
    REQUIRE(session->peripherals.empty());
    REQUIRE(h.signal.calls == "PPPPPS");
}

TEST_CASE("Each bring-up failure emits exactly one failure signal", "[bridge][sequencer]")
{
    Harness h;

    SECTION("no gamepad")
    {
        h.driver.pads.clear();
        auto seq = h.sequencer();
        auto session = seq.run();
        REQUIRE_FALSE(session.has_value());

        REQUIRE(session.error().code() == core::ErrorCode::kMissingGamepad);
        REQUIRE(seq.stage() == bridge::Stage::kFailed);
        requireSingleFailure(h.signal, 1);
        REQUIRE(h.sleeps.empty());
    }

    SECTION("gamepad driver not supported")
    {
        h.driver.initError = gamepad::DriverError::make(
            gamepad::DriverErrorKind::kNotImplemented, core::ErrorCode::kNotImplemented, "no backend");
        auto seq = h.sequencer();
        auto session = seq.run();
        REQUIRE_FALSE(session.has_value());

        REQUIRE(session.error().code() == core::ErrorCode::kUsbNotSupported);
        requireSingleFailure(h.signal, 1);
    }

    SECTION("BLE manager cannot be created")
    {
        h.managerError = core::Error{core::ErrorCode::kIoError, "Address family not supported"};
        auto seq = h.sequencer();
        auto session = seq.run();
        REQUIRE_FALSE(session.has_value());

        REQUIRE(session.error().code() == core::ErrorCode::kBleManagerFailed);
        REQUIRE(session.error().message() == "failed to initialize BLE manager");
        requireSingleFailure(h.signal, 2);
    }

    SECTION("no BLE adapter")
    {
        h.manager.list.clear();
        auto seq = h.sequencer();
        auto session = seq.run();
        REQUIRE_FALSE(session.has_value());

        REQUIRE(session.error().code() == core::ErrorCode::kMissingBleAdapter);
        requireSingleFailure(h.signal, 2);
    }

    SECTION("adapter does not connect")
    {
        h.manager.list.front().connectError = core::Error{core::ErrorCode::kDeviceOpenFailed, "Operation not permitted"};
        auto seq = h.sequencer();
        auto session = seq.run();
        REQUIRE_FALSE(session.has_value());

        REQUIRE(session.error().code() == core::ErrorCode::kBleConnectFailed);
        requireSingleFailure(h.signal, 2);
    }

    SECTION("scan does not start")
    {
        h.manager.list.front().central.scanError = core::Error{core::ErrorCode::kIoError, "Input/output error"};
        auto seq = h.sequencer();
        auto session = seq.run();
        REQUIRE_FALSE(session.has_value());

        REQUIRE(session.error().code() == core::ErrorCode::kBleScanFailed);
        REQUIRE(session.error().message() == "failed to scan for new peripherals");
        REQUIRE(session.error().rootCause().message() == "Input/output error");
        requireSingleFailure(h.signal, 3);
        REQUIRE(h.sleeps.empty());
    }
}

TEST_CASE("stageName covers every stage", "[bridge][sequencer]")
{
    REQUIRE(bridge::stageName(bridge::Stage::kStart) == "Start");
    REQUIRE(bridge::stageName(bridge::Stage::kWindowElapsed) == "WindowElapsed");
    REQUIRE(bridge::stageName(bridge::Stage::kFailed) == "Failed");
}
