/**
 * @file TestJoystickDriver.cpp
 * @brief JoystickDriver against plain files standing in for jsN nodes.
 *
 * Regular files do not answer the JSIOCG* ioctls, so devices show up as
 * "Joystick N" with JoystickConfig::fallbackAxes axes; reads return the
 * js_event records written by the test and then EOF. A directory stands
 * in for an unplugged node: it opens, but every read fails.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#ifdef __linux__
#include <catch2/catch_test_macros.hpp>

#include "bpb/gamepad/JoystickDriver.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <linux/joystick.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace bpb::gamepad;

namespace {

class TempInputDir {
public:
    TempInputDir()
    {
        char pattern[] = "/tmp/bpb-js-XXXXXX";
        const char *dir = ::mkdtemp(pattern);
        REQUIRE(dir != nullptr);
        _path = dir;
    }

    ~TempInputDir()
    {
        for (const auto &file : _files) {
            std::remove(file.c_str());
        }
        for (const auto &sub : _dirs) {
            ::rmdir(sub.c_str());
        }
        ::rmdir(_path.c_str());
    }

    void makeBrokenNode(const std::string &name)
    {
        const std::string sub = _path + "/" + name;
        REQUIRE(::mkdir(sub.c_str(), 0700) == 0);
        _dirs.push_back(sub);
    }

    void writeNode(const std::string &name, const std::vector<js_event> &events)
    {
        const std::string file = _path + "/" + name;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        for (const auto &ev : events) {
            out.write(reinterpret_cast<const char *>(&ev), sizeof(ev));
        }
        _files.push_back(file);
    }

    [[nodiscard]] const std::string &path() const { return _path; }

private:
    std::string _path;
    std::vector<std::string> _files;
    std::vector<std::string> _dirs;
};

js_event makeEvent(__u32 time, __s16 value, __u8 type, __u8 number)
{
    js_event ev{};
    ev.time = time;
    ev.value = value;
    ev.type = type;
    ev.number = number;
    return ev;
}

} // namespace

TEST_CASE("JoystickDriver reports a missing device directory as Other", "[gamepad][joystick]")
{
    JoystickDriver driver(JoystickConfig{.deviceDir = "/nonexistent/bpb-input"});
    auto result = driver.init();

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == DriverErrorKind::kOther);
    REQUIRE(result.error().detail.code() == bpb::core::ErrorCode::kIoError);
    REQUIRE(result.error().detail.message().find("/nonexistent/bpb-input") != std::string::npos);
}

TEST_CASE("JoystickDriver succeeds with an empty device directory", "[gamepad][joystick]")
{
    TempInputDir dir;
    JoystickDriver driver(JoystickConfig{.deviceDir = dir.path(), .sysfsDir = dir.path()});

    REQUIRE(driver.init().has_value());
    REQUIRE(driver.devices().empty());
    REQUIRE_FALSE(driver.nextEvent().has_value());
}

TEST_CASE("JoystickDriver enumerates nodes and decodes js_event records", "[gamepad][joystick]")
{
    TempInputDir dir;
    dir.writeNode("js0", {
        makeEvent(10, 0, JS_EVENT_BUTTON | JS_EVENT_INIT, 0),
        makeEvent(20, 1, JS_EVENT_BUTTON, 3),
        makeEvent(30, -16384, JS_EVENT_AXIS, 1),
        makeEvent(40, 0, JS_EVENT_BUTTON, 3),
    });

    JoystickDriver driver(JoystickConfig{.deviceDir = dir.path(), .sysfsDir = dir.path()});
    REQUIRE(driver.init().has_value());

    const auto devices = driver.devices();
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].id == 0);
    REQUIRE(devices[0].name == "Joystick 0");
    REQUIRE(devices[0].power.status == PowerStatus::kUnknown);

    auto first = driver.nextEvent();
    REQUIRE(first.has_value());
    REQUIRE(first->payload.type == EventType::kButtonPressed);
    REQUIRE(first->payload.number == 3);
    REQUIRE(first->time == std::chrono::milliseconds(20));

    auto second = driver.nextEvent();
    REQUIRE(second.has_value());
    REQUIRE(second->payload.type == EventType::kAxisChanged);
    REQUIRE(second->payload.number == 1);
    REQUIRE(second->payload.value < -0.49f);
    REQUIRE(second->payload.value > -0.51f);

    auto third = driver.nextEvent();
    REQUIRE(third.has_value());
    REQUIRE(third->payload.type == EventType::kButtonReleased);

    REQUIRE_FALSE(driver.nextEvent().has_value());
}

TEST_CASE("JoystickDriver rejects thresholds outside (0, 1]", "[gamepad][joystick]")
{
    TempInputDir dir;
    JoystickDriver driver(JoystickConfig{
        .deviceDir = dir.path(),
        .axisButtons = {AxisToButton{.axis = 2, .threshold = 0.0f, .button = 10}}});

    auto result = driver.init();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == DriverErrorKind::kInvalidAxisToButton);
}

TEST_CASE("JoystickDriver rejects a mapping on an axis the device lacks", "[gamepad][joystick]")
{
    TempInputDir dir;
    dir.writeNode("js0", {});

    JoystickDriver driver(JoystickConfig{
        .deviceDir = dir.path(),
        .sysfsDir = dir.path(),
        .axisButtons = {AxisToButton{.axis = 0, .threshold = 0.5f, .button = 10}}});

    auto result = driver.init();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == DriverErrorKind::kInvalidAxisToButton);
    REQUIRE(driver.devices().empty());
}

TEST_CASE("JoystickDriver uses the fallback axis count for silent nodes", "[gamepad][joystick]")
{
    TempInputDir dir;
    dir.writeNode("js0", {});

    JoystickDriver driver(JoystickConfig{
        .deviceDir = dir.path(),
        .sysfsDir = dir.path(),
        .axisButtons = {AxisToButton{.axis = 1, .threshold = 0.5f, .button = 10}},
        .fallbackAxes = 2});

    REQUIRE(driver.init().has_value());
    REQUIRE(driver.devices().size() == 1);
}

TEST_CASE("JoystickDriver emits axis-to-button edges after the axis event", "[gamepad][joystick]")
{
    TempInputDir dir;
    dir.writeNode("js0", {
        makeEvent(10, 32767, JS_EVENT_AXIS, 1),
        makeEvent(20, 32767, JS_EVENT_AXIS, 1),
        makeEvent(30, 32000, JS_EVENT_AXIS, 1),
        makeEvent(40, 32767, JS_EVENT_AXIS, 0),
    });

    JoystickDriver driver(JoystickConfig{
        .deviceDir = dir.path(),
        .sysfsDir = dir.path(),
        .axisButtons = {AxisToButton{.axis = 1, .threshold = 1.0f, .button = 12}},
        .fallbackAxes = 2});
    REQUIRE(driver.init().has_value());

    std::vector<std::string> seen;
    while (auto event = driver.nextEvent()) {
        seen.push_back(std::to_string(event->time.count()) + " " + toString(event->payload));
    }

    REQUIRE(seen == std::vector<std::string>{
        "10 AxisChanged(1, 1.000)",
        "10 ButtonPressed(12)",
        "20 AxisChanged(1, 1.000)",
        "30 AxisChanged(1, 0.977)",
        "30 ButtonReleased(12)",
        "40 AxisChanged(0, 1.000)",
    });
}

TEST_CASE("JoystickDriver turns a failing read into a Disconnected event", "[gamepad][joystick]")
{
    TempInputDir dir;
    dir.makeBrokenNode("js0");
    dir.writeNode("js1", {makeEvent(50, 1, JS_EVENT_BUTTON, 4)});

    JoystickDriver driver(JoystickConfig{.deviceDir = dir.path(), .sysfsDir = dir.path()});
    REQUIRE(driver.init().has_value());
    REQUIRE(driver.devices().size() == 2);

    auto gone = driver.nextEvent();
    REQUIRE(gone.has_value());
    REQUIRE(gone->id == 0);
    REQUIRE(gone->payload.type == EventType::kDisconnected);

    const auto remaining = driver.devices();
    REQUIRE(remaining.size() == 1);
    REQUIRE(remaining[0].id == 1);

    auto press = driver.nextEvent();
    REQUIRE(press.has_value());
    REQUIRE(press->id == 1);
    REQUIRE(press->payload.type == EventType::kButtonPressed);
    REQUIRE(press->payload.number == 4);

    REQUIRE_FALSE(driver.nextEvent().has_value());
}
#endif
