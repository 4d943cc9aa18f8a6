/**
 * @file JoystickDriver.cpp
 * @brief Linux joystick API implementation of the gamepad driver.
 * @author MasterLaplace
 *
 * Reads struct js_event records from non-blocking jsN nodes. Synthetic
 * JS_EVENT_INIT records (the initial state dump the kernel sends on open)
 * are dropped. Any read error other than EAGAIN or EINTR (ENODEV on unplug)
 * turns into a kDisconnected event and closes the node.
 */

#include "bpb/gamepad/JoystickDriver.hpp"

#include <bpb/core/Log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <fstream>

#include <dirent.h>
#include <fcntl.h>
#include <linux/joystick.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace bpb::gamepad {

namespace {

constexpr const char *kTag = "GAMEPAD";

struct Device {
    GamepadId   id = 0;
    int         fd = -1;
    std::string node;
    std::string name;
    core::u8    axes = 0;
    core::u8    buttons = 0;
    std::chrono::milliseconds lastTime{0};
    AxisLatches latched;
};

std::string readFirstLine(const std::string &path)
{
    std::ifstream in(path);
    std::string line;
    if (in) {
        std::getline(in, line);
    }
    return line;
}

PowerInfo readPower(const std::string &sysfsDir, GamepadId id)
{
    const std::string deviceDir = sysfsDir + "/js" + std::to_string(id) + "/device";
    if (::access(deviceDir.c_str(), F_OK) != 0) {
        return {};
    }

    const std::string supplyDir = deviceDir + "/device/power_supply";
    DIR *dir = ::opendir(supplyDir.c_str());
    if (dir == nullptr) {
        return PowerInfo{PowerStatus::kWired, 0};
    }

    std::string supply;
    while (const dirent *entry = ::readdir(dir)) {
        if (entry->d_name[0] != '.') {
            supply = entry->d_name;
            break;
        }
    }
    ::closedir(dir);

    if (supply.empty()) {
        return PowerInfo{PowerStatus::kWired, 0};
    }

    const std::string base = supplyDir + "/" + supply;
    const std::string status = readFirstLine(base + "/status");
    const std::string capacity = readFirstLine(base + "/capacity");

    core::u8 percent = 0;
    if (!capacity.empty()) {
        const long parsed = std::strtol(capacity.c_str(), nullptr, 10);
        percent = static_cast<core::u8>(std::clamp(parsed, 0L, 100L));
    }

    if (status == "Charging")    return PowerInfo{PowerStatus::kCharging, percent};
    if (status == "Discharging") return PowerInfo{PowerStatus::kDischarging, percent};
    if (status == "Full")        return PowerInfo{PowerStatus::kCharged, 100};
    return {};
}

} // namespace

struct JoystickDriver::Impl {
    JoystickConfig            config;
    AxisButtonMapper          mapper;
    std::vector<Device>       devices;
    std::deque<GamepadEvent>  pending;
    core::usize               cursor = 0;

    explicit Impl(JoystickConfig cfg) : config(std::move(cfg)), mapper(config.axisButtons) {}

    ~Impl() { closeAll(); }

    void closeAll() noexcept
    {
        for (auto &dev : devices) {
            if (dev.fd >= 0) {
                ::close(dev.fd);
                dev.fd = -1;
            }
        }
        devices.clear();
        pending.clear();
        cursor = 0;
    }

    std::optional<GamepadEvent> readFrom(Device &dev)
    {
        js_event raw{};
        for (;;) {
            const ssize_t n = ::read(dev.fd, &raw, sizeof(raw));

            if (n == static_cast<ssize_t>(sizeof(raw))) {
                if ((raw.type & JS_EVENT_INIT) != 0) {
                    continue;
                }

                GamepadEvent event{dev.id, {}, std::chrono::milliseconds(raw.time)};
                dev.lastTime = event.time;

                if (raw.type == JS_EVENT_BUTTON) {
                    event.payload = EventPayload{
                        raw.value != 0 ? EventType::kButtonPressed : EventType::kButtonReleased,
                        raw.number,
                        raw.value != 0 ? 1.0f : 0.0f};
                    return event;
                }
                if (raw.type == JS_EVENT_AXIS) {
                    const core::f32 value = std::clamp(
                        static_cast<core::f32>(raw.value) / core::kAxisFullScale, -1.0f, 1.0f);
                    event.payload = EventPayload{EventType::kAxisChanged, raw.number, value};
                    mapper.apply(event, dev.latched, pending);
                    return event;
                }
                continue;
            }

            if (n < 0) {
                const int err = errno;
                if (err == EINTR) {
                    continue;
                }
                if (err == EAGAIN || err == EWOULDBLOCK) {
                    return std::nullopt;
                }
                if (err == ENODEV) {
                    core::Log::warn(kTag, dev.node + " disconnected");
                } else {
                    core::Log::warn(kTag, dev.node + ": read failed, dropping device: " + std::strerror(err));
                }
                ::close(dev.fd);
                dev.fd = -1;
                return GamepadEvent{dev.id, EventPayload{EventType::kDisconnected, 0, 0.0f}, dev.lastTime};
            }
            return std::nullopt;
        }
    }
};

JoystickDriver::JoystickDriver(JoystickConfig config)
    : _impl(std::make_unique<Impl>(std::move(config)))
{
}

JoystickDriver::~JoystickDriver() = default;

DriverExpected<void> JoystickDriver::init()
{
    _impl->closeAll();
    const auto &cfg = _impl->config;

    if (auto valid = _impl->mapper.validateThresholds(); !valid) {
        return valid;
    }

    DIR *dir = ::opendir(cfg.deviceDir.c_str());
    if (dir == nullptr) {
        const int err = errno;
        return std::unexpected(DriverError::make(
            DriverErrorKind::kOther, core::ErrorCode::kIoError,
            cfg.deviceDir + ": " + std::strerror(err)));
    }
    ::closedir(dir);

    for (GamepadId id = 0; id < cfg.maxDevices; ++id) {
        const std::string node = cfg.deviceDir + "/js" + std::to_string(id);
        const int fd = ::open(node.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
        if (fd < 0) {
            const int err = errno;
            if (err != ENOENT) {
                core::Log::warn(kTag, node + ": " + std::strerror(err));
            }
            continue;
        }

        Device dev;
        dev.id = id;
        dev.fd = fd;
        dev.node = node;

        char name[128] = {};
        if (::ioctl(fd, JSIOCGNAME(sizeof(name)), name) < 0) {
            dev.name = "Joystick " + std::to_string(id);
        } else {
            dev.name = name;
        }

        core::u8 axes = 0;
        core::u8 buttons = 0;
        dev.axes = (::ioctl(fd, JSIOCGAXES, &axes) == 0) ? axes : cfg.fallbackAxes;
        if (::ioctl(fd, JSIOCGBUTTONS, &buttons) == 0) {
            dev.buttons = buttons;
        }
        dev.latched = _impl->mapper.makeLatches();

        // Owned by _impl from here on so an error below still closes it.
        _impl->devices.push_back(std::move(dev));
        const Device &opened = _impl->devices.back();

        if (auto valid = _impl->mapper.validateAxes(opened.node, opened.axes); !valid) {
            _impl->closeAll();
            return valid;
        }

        core::Log::debug(kTag, "opened " + opened.node + " (" + opened.name + ", "
            + std::to_string(opened.axes) + " axes, "
            + std::to_string(opened.buttons) + " buttons)");
    }

    return {};
}

GamepadSet JoystickDriver::devices() const
{
    GamepadSet set;
    set.reserve(_impl->devices.size());
    for (const auto &dev : _impl->devices) {
        if (dev.fd < 0) {
            continue;
        }
        set.push_back(GamepadInfo{dev.id, dev.name, readPower(_impl->config.sysfsDir, dev.id)});
    }
    return set;
}

std::optional<GamepadEvent> JoystickDriver::nextEvent()
{
    if (!_impl->pending.empty()) {
        GamepadEvent event = _impl->pending.front();
        _impl->pending.pop_front();
        return event;
    }

    const core::usize count = _impl->devices.size();
    for (core::usize step = 0; step < count; ++step) {
        const core::usize idx = (_impl->cursor + step) % count;
        Device &dev = _impl->devices[idx];
        if (dev.fd < 0) {
            continue;
        }
        if (auto event = _impl->readFrom(dev)) {
            _impl->cursor = (idx + 1) % count;
            return event;
        }
    }
    return std::nullopt;
}

} // namespace bpb::gamepad
