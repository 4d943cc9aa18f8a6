/**
 * @file TestConfig.cpp
 * @brief Config::Builder defaults and overrides.
 */

#include <catch2/catch_test_macros.hpp>

#include "bpb/bridge/Config.hpp"

using namespace bpb;
using namespace std::chrono_literals;

TEST_CASE("Config defaults come from the core constants", "[bridge][config]")
{
    const auto cfg = bridge::Config::Builder{}.build();

    REQUIRE(cfg.discoveryWindow() == 2000ms);
    REQUIRE(cfg.pollInterval() == 100ms);
    REQUIRE(cfg.ledRoot() == "/sys/class/leds");
    REQUIRE_FALSE(cfg.statusLed().has_value());
    REQUIRE(cfg.logLevel() == core::LogLevel::kInfo);

    const auto js = cfg.joystick();
    REQUIRE(js.deviceDir == "/dev/input");
    REQUIRE(js.maxDevices == core::kMaxJoysticks);
    REQUIRE(js.axisButtons.empty());
}

TEST_CASE("Config::Builder overrides are carried into the built config", "[bridge][config]")
{
    const auto cfg = bridge::Config::Builder{}
        .discoveryWindow(50ms)
        .pollInterval(5ms)
        .joystickDir("/tmp/js")
        .axisButton({2, 0.75f, 10})
        .statusLed("input0::capslock")
        .faultLed("red:fault")
        .logLevel(core::LogLevel::kDebug)
        .build();

    REQUIRE(cfg.discoveryWindow() == 50ms);
    REQUIRE(cfg.pollInterval() == 5ms);
    REQUIRE(cfg.statusLed() == std::optional<std::string>("input0::capslock"));
    REQUIRE(cfg.faultLed() == std::optional<std::string>("red:fault"));
    REQUIRE(cfg.logLevel() == core::LogLevel::kDebug);

    const auto js = cfg.joystick();
    REQUIRE(js.deviceDir == "/tmp/js");
    REQUIRE(js.axisButtons.size() == 1);
    REQUIRE(js.axisButtons[0].axis == 2);
    REQUIRE(js.axisButtons[0].button == 10);
}
