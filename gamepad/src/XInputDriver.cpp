/**
 * @file XInputDriver.cpp
 * @brief XInput implementation of the gamepad driver.
 * @author MasterLaplace
 *
 * Slots are enumerated once at init(). A slot that later answers
 * ERROR_DEVICE_NOT_CONNECTED yields one kDisconnected event and is not
 * polled again.
 */

#include "bpb/gamepad/XInputDriver.hpp"

#ifdef _WIN32

#include "bpb/gamepad/PadSnapshot.hpp"

#include <bpb/core/Log.hpp>

#include <array>
#include <chrono>
#include <deque>
#include <string>
#include <vector>

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <Xinput.h>

namespace bpb::gamepad {

namespace {

constexpr const char *kTag = "GAMEPAD";
constexpr core::u8 kXInputAxes = 6;

constexpr std::array<WORD, 14> kButtonMasks = {
    XINPUT_GAMEPAD_A,
    XINPUT_GAMEPAD_B,
    XINPUT_GAMEPAD_X,
    XINPUT_GAMEPAD_Y,
    XINPUT_GAMEPAD_LEFT_SHOULDER,
    XINPUT_GAMEPAD_RIGHT_SHOULDER,
    XINPUT_GAMEPAD_BACK,
    XINPUT_GAMEPAD_START,
    XINPUT_GAMEPAD_LEFT_THUMB,
    XINPUT_GAMEPAD_RIGHT_THUMB,
    XINPUT_GAMEPAD_DPAD_UP,
    XINPUT_GAMEPAD_DPAD_DOWN,
    XINPUT_GAMEPAD_DPAD_LEFT,
    XINPUT_GAMEPAD_DPAD_RIGHT,
};

core::f32 stick(SHORT v)
{
    return v >= 0 ? static_cast<core::f32>(v) / 32767.0f : static_cast<core::f32>(v) / 32768.0f;
}

PadSnapshot toSnapshot(const XINPUT_GAMEPAD &gp)
{
    PadSnapshot snapshot;
    for (core::usize i = 0; i < kButtonMasks.size(); ++i) {
        if ((gp.wButtons & kButtonMasks[i]) != 0) {
            snapshot.buttons |= core::u32{1} << i;
        }
    }
    snapshot.axes[0] = stick(gp.sThumbLX);
    snapshot.axes[1] = -stick(gp.sThumbLY);
    snapshot.axes[2] = static_cast<core::f32>(gp.bLeftTrigger) / 255.0f;
    snapshot.axes[3] = stick(gp.sThumbRX);
    snapshot.axes[4] = -stick(gp.sThumbRY);
    snapshot.axes[5] = static_cast<core::f32>(gp.bRightTrigger) / 255.0f;
    return snapshot;
}

PowerInfo readPower(DWORD slot)
{
    XINPUT_BATTERY_INFORMATION battery{};
    if (XInputGetBatteryInformation(slot, BATTERY_DEVTYPE_GAMEPAD, &battery) != ERROR_SUCCESS) {
        return {};
    }

    core::u8 percent = 0;
    switch (battery.BatteryLevel) {
        case BATTERY_LEVEL_EMPTY:  percent = 0;   break;
        case BATTERY_LEVEL_LOW:    percent = 33;  break;
        case BATTERY_LEVEL_MEDIUM: percent = 66;  break;
        case BATTERY_LEVEL_FULL:   percent = 100; break;
        default: break;
    }

    switch (battery.BatteryType) {
        case BATTERY_TYPE_WIRED:    return PowerInfo{PowerStatus::kWired, 0};
        case BATTERY_TYPE_ALKALINE:
        case BATTERY_TYPE_NIMH:     return PowerInfo{PowerStatus::kDischarging, percent};
        default:                    return {};
    }
}

struct Slot {
    GamepadId   id = 0;
    std::string name;
    bool        connected = false;
    DWORD       packet = 0;
    PadSnapshot state;
    AxisLatches latched;
};

} // namespace

struct XInputDriver::Impl {
    JoystickConfig                        config;
    AxisButtonMapper                      mapper;
    std::vector<Slot>                     slots;
    std::deque<GamepadEvent>              pending;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    explicit Impl(JoystickConfig cfg) : config(std::move(cfg)), mapper(config.axisButtons) {}

    std::chrono::milliseconds elapsed() const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }

    void poll(Slot &slot)
    {
        XINPUT_STATE raw{};
        const DWORD rc = XInputGetState(static_cast<DWORD>(slot.id), &raw);
        const auto now = elapsed();

        if (rc == ERROR_DEVICE_NOT_CONNECTED) {
            core::Log::warn(kTag, slot.name + " disconnected");
            slot.connected = false;
            pending.push_back(GamepadEvent{slot.id, EventPayload{EventType::kDisconnected, 0, 0.0f}, now});
            return;
        }
        if (rc != ERROR_SUCCESS) {
            core::Log::warn(kTag, slot.name + ": XInputGetState failed with " + std::to_string(rc));
            return;
        }
        if (raw.dwPacketNumber == slot.packet) {
            return;
        }
        slot.packet = raw.dwPacketNumber;

        const PadSnapshot next = toSnapshot(raw.Gamepad);
        std::deque<GamepadEvent> changes;
        diffSnapshots(slot.id, slot.state, next, now, changes);
        slot.state = next;

        for (const auto &event : changes) {
            pending.push_back(event);
            mapper.apply(event, slot.latched, pending);
        }
    }
};

XInputDriver::XInputDriver(JoystickConfig config)
    : _impl(std::make_unique<Impl>(std::move(config)))
{
}

XInputDriver::~XInputDriver() = default;

DriverExpected<void> XInputDriver::init()
{
    _impl->slots.clear();
    _impl->pending.clear();
    _impl->start = std::chrono::steady_clock::now();

    if (auto valid = _impl->mapper.validateThresholds(); !valid) {
        return valid;
    }

    for (DWORD index = 0; index < XUSER_MAX_COUNT; ++index) {
        XINPUT_STATE raw{};
        const DWORD rc = XInputGetState(index, &raw);
        if (rc == ERROR_DEVICE_NOT_CONNECTED) {
            continue;
        }
        if (rc != ERROR_SUCCESS) {
            core::Log::warn(kTag, "XInput slot " + std::to_string(index) + ": error " + std::to_string(rc));
            continue;
        }

        Slot slot;
        slot.id = static_cast<GamepadId>(index);
        slot.name = "XInput Controller " + std::to_string(index);
        slot.connected = true;
        slot.packet = raw.dwPacketNumber;
        slot.state = toSnapshot(raw.Gamepad);
        slot.latched = _impl->mapper.makeLatches();

        if (auto valid = _impl->mapper.validateAxes(slot.name, kXInputAxes); !valid) {
            _impl->slots.clear();
            return valid;
        }

        core::Log::debug(kTag, "opened " + slot.name);
        _impl->slots.push_back(std::move(slot));
    }

    return {};
}

GamepadSet XInputDriver::devices() const
{
    GamepadSet set;
    for (const auto &slot : _impl->slots) {
        if (slot.connected) {
            set.push_back(GamepadInfo{slot.id, slot.name, readPower(static_cast<DWORD>(slot.id))});
        }
    }
    return set;
}

std::optional<GamepadEvent> XInputDriver::nextEvent()
{
    if (_impl->pending.empty()) {
        for (auto &slot : _impl->slots) {
            if (slot.connected) {
                _impl->poll(slot);
            }
        }
    }
    if (_impl->pending.empty()) {
        return std::nullopt;
    }
    GamepadEvent event = _impl->pending.front();
    _impl->pending.pop_front();
    return event;
}

} // namespace bpb::gamepad

#endif // _WIN32
