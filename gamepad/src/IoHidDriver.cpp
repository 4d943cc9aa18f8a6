/**
 * @file IoHidDriver.cpp
 * @brief IOKit HID implementation of the gamepad driver.
 * @author MasterLaplace
 *
 * Devices are enumerated once at init() with IOHIDManagerCopyDevices and
 * ordered by location ID. Pads plugged in later are not picked up; a
 * removal yields one kDisconnected event. The manager's callbacks are
 * unregistered and the manager unscheduled before Impl goes away.
 */

#include "bpb/gamepad/IoHidDriver.hpp"

#ifdef __APPLE__

#include <bpb/core/Log.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/hid/IOHIDKeys.h>
#include <IOKit/hid/IOHIDManager.h>
#include <IOKit/hid/IOHIDUsageTables.h>

namespace bpb::gamepad {

namespace {

constexpr const char *kTag = "GAMEPAD";
constexpr int kMaxRunLoopPasses = 64;

constexpr std::array<core::u32, 9> kAxisUsages = {
    kHIDUsage_GD_X, kHIDUsage_GD_Y, kHIDUsage_GD_Z,
    kHIDUsage_GD_Rx, kHIDUsage_GD_Ry, kHIDUsage_GD_Rz,
    kHIDUsage_GD_Slider, kHIDUsage_GD_Dial, kHIDUsage_GD_Wheel,
};

CFDictionaryRef makeMatch(int page, int usage)
{
    CFMutableDictionaryRef dict = CFDictionaryCreateMutable(
        kCFAllocatorDefault, 0, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks);
    if (dict == nullptr) {
        return nullptr;
    }

    CFNumberRef pageRef = CFNumberCreate(kCFAllocatorDefault, kCFNumberIntType, &page);
    CFNumberRef usageRef = CFNumberCreate(kCFAllocatorDefault, kCFNumberIntType, &usage);
    if (pageRef != nullptr && usageRef != nullptr) {
        CFDictionarySetValue(dict, CFSTR(kIOHIDDeviceUsagePageKey), pageRef);
        CFDictionarySetValue(dict, CFSTR(kIOHIDDeviceUsageKey), usageRef);
    }
    if (pageRef != nullptr) {
        CFRelease(pageRef);
    }
    if (usageRef != nullptr) {
        CFRelease(usageRef);
    }
    return dict;
}

std::string stringProperty(IOHIDDeviceRef device, CFStringRef key)
{
    CFTypeRef value = IOHIDDeviceGetProperty(device, key);
    if (value == nullptr || CFGetTypeID(value) != CFStringGetTypeID()) {
        return {};
    }
    char buf[256] = {};
    if (!CFStringGetCString(static_cast<CFStringRef>(value), buf, sizeof(buf), kCFStringEncodingUTF8)) {
        return {};
    }
    return buf;
}

core::i64 numberProperty(IOHIDDeviceRef device, CFStringRef key)
{
    CFTypeRef value = IOHIDDeviceGetProperty(device, key);
    core::i64 number = 0;
    if (value != nullptr && CFGetTypeID(value) == CFNumberGetTypeID()) {
        CFNumberGetValue(static_cast<CFNumberRef>(value), kCFNumberSInt64Type, &number);
    }
    return number;
}

struct Axis {
    IOHIDElementCookie cookie;
    CFIndex            min;
    CFIndex            max;
};

struct Button {
    IOHIDElementCookie cookie;
    core::u8           number;
};

struct Device {
    IOHIDDeviceRef      ref = nullptr;
    GamepadId           id = 0;
    std::string         name;
    PowerInfo           power;
    std::vector<Axis>   axes;
    std::vector<Button> buttons;
    AxisLatches         latched;
    bool                connected = true;
};

core::f32 normalize(const Axis &axis, CFIndex raw)
{
    if (axis.max <= axis.min) {
        return 0.0f;
    }
    const auto span = static_cast<core::f32>(axis.max - axis.min);
    const core::f32 value = 2.0f * static_cast<core::f32>(raw - axis.min) / span - 1.0f;
    return std::clamp(value, -1.0f, 1.0f);
}

void collectElements(Device &dev)
{
    CFArrayRef elements = IOHIDDeviceCopyMatchingElements(dev.ref, nullptr, kIOHIDOptionsTypeNone);
    if (elements == nullptr) {
        return;
    }

    std::array<std::optional<Axis>, kAxisUsages.size()> found;
    for (CFIndex i = 0; i < CFArrayGetCount(elements); ++i) {
        auto element = static_cast<IOHIDElementRef>(const_cast<void *>(CFArrayGetValueAtIndex(elements, i)));
        const IOHIDElementType type = IOHIDElementGetType(element);
        const core::u32 page = IOHIDElementGetUsagePage(element);
        const core::u32 usage = IOHIDElementGetUsage(element);

        if (type == kIOHIDElementTypeInput_Button && page == kHIDPage_Button && usage >= 1 && usage <= 256) {
            dev.buttons.push_back(Button{IOHIDElementGetCookie(element), static_cast<core::u8>(usage - 1)});
            continue;
        }
        if ((type == kIOHIDElementTypeInput_Misc || type == kIOHIDElementTypeInput_Axis)
            && page == kHIDPage_GenericDesktop) {
            const auto it = std::find(kAxisUsages.begin(), kAxisUsages.end(), usage);
            if (it == kAxisUsages.end()) {
                continue;
            }
            auto &slot = found[static_cast<core::usize>(it - kAxisUsages.begin())];
            if (!slot) {
                slot = Axis{IOHIDElementGetCookie(element),
                            IOHIDElementGetLogicalMin(element),
                            IOHIDElementGetLogicalMax(element)};
            }
        }
    }
    CFRelease(elements);

    for (const auto &axis : found) {
        if (axis) {
            dev.axes.push_back(*axis);
        }
    }
}

} // namespace

struct IoHidDriver::Impl {
    JoystickConfig                        config;
    AxisButtonMapper                      mapper;
    IOHIDManagerRef                       manager = nullptr;
    std::vector<Device>                   devices;
    std::deque<GamepadEvent>              pending;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    explicit Impl(JoystickConfig cfg) : config(std::move(cfg)), mapper(config.axisButtons) {}

    ~Impl() { close(); }

    void close() noexcept
    {
        if (manager != nullptr) {
            IOHIDManagerRegisterInputValueCallback(manager, nullptr, nullptr);
            IOHIDManagerRegisterDeviceRemovalCallback(manager, nullptr, nullptr);
            IOHIDManagerUnscheduleFromRunLoop(manager, CFRunLoopGetCurrent(), kCFRunLoopDefaultMode);
            IOHIDManagerClose(manager, kIOHIDOptionsTypeNone);
            CFRelease(manager);
            manager = nullptr;
        }
        for (auto &dev : devices) {
            CFRelease(dev.ref);
        }
        devices.clear();
        pending.clear();
    }

    std::chrono::milliseconds elapsed() const
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    }

    Device *find(IOHIDDeviceRef ref)
    {
        for (auto &dev : devices) {
            if (dev.ref == ref) {
                return &dev;
            }
        }
        return nullptr;
    }

    DriverExpected<void> add(IOHIDDeviceRef ref)
    {
        Device dev;
        dev.ref = static_cast<IOHIDDeviceRef>(const_cast<void *>(CFRetain(ref)));
        dev.id = static_cast<GamepadId>(devices.size());
        dev.name = stringProperty(ref, CFSTR(kIOHIDProductKey));
        if (dev.name.empty()) {
            dev.name = "HID Gamepad " + std::to_string(dev.id);
        }
        if (stringProperty(ref, CFSTR(kIOHIDTransportKey)) == "USB") {
            dev.power = PowerInfo{PowerStatus::kWired, 0};
        }
        collectElements(dev);
        dev.latched = mapper.makeLatches();

        // Owned by devices from here on so close() releases it on error.
        devices.push_back(std::move(dev));
        const Device &added = devices.back();

        core::Log::debug(kTag, "opened " + added.name + " (" + std::to_string(added.axes.size()) + " axes, "
            + std::to_string(added.buttons.size()) + " buttons)");
        return mapper.validateAxes(added.name, static_cast<core::u8>(std::min<core::usize>(added.axes.size(), 255)));
    }

    void onValue(IOHIDValueRef value)
    {
        IOHIDElementRef element = IOHIDValueGetElement(value);
        Device *dev = find(IOHIDElementGetDevice(element));
        if (dev == nullptr || !dev->connected) {
            return;
        }

        const IOHIDElementCookie cookie = IOHIDElementGetCookie(element);
        const CFIndex raw = IOHIDValueGetIntegerValue(value);
        const auto now = elapsed();

        for (const auto &button : dev->buttons) {
            if (button.cookie == cookie) {
                pending.push_back(GamepadEvent{
                    dev->id,
                    EventPayload{
                        raw != 0 ? EventType::kButtonPressed : EventType::kButtonReleased,
                        button.number,
                        raw != 0 ? 1.0f : 0.0f},
                    now});
                return;
            }
        }

        for (core::usize i = 0; i < dev->axes.size(); ++i) {
            if (dev->axes[i].cookie == cookie) {
                const GamepadEvent event{
                    dev->id,
                    EventPayload{EventType::kAxisChanged, static_cast<core::u8>(i), normalize(dev->axes[i], raw)},
                    now};
                pending.push_back(event);
                mapper.apply(event, dev->latched, pending);
                return;
            }
        }
    }

    void onRemoved(IOHIDDeviceRef ref)
    {
        Device *dev = find(ref);
        if (dev == nullptr || !dev->connected) {
            return;
        }
        dev->connected = false;
        core::Log::warn(kTag, dev->name + " disconnected");
        pending.push_back(GamepadEvent{dev->id, EventPayload{EventType::kDisconnected, 0, 0.0f}, elapsed()});
    }

    static void valueCallback(void *context, IOReturn result, void * /*sender*/, IOHIDValueRef value)
    {
        if (result == kIOReturnSuccess) {
            static_cast<Impl *>(context)->onValue(value);
        }
    }

    static void removalCallback(void *context, IOReturn /*result*/, void * /*sender*/, IOHIDDeviceRef device)
    {
        static_cast<Impl *>(context)->onRemoved(device);
    }
};

IoHidDriver::IoHidDriver(JoystickConfig config)
    : _impl(std::make_unique<Impl>(std::move(config)))
{
}

IoHidDriver::~IoHidDriver() = default;

DriverExpected<void> IoHidDriver::init()
{
    _impl->close();
    _impl->start = std::chrono::steady_clock::now();

    if (auto valid = _impl->mapper.validateThresholds(); !valid) {
        return valid;
    }

    _impl->manager = IOHIDManagerCreate(kCFAllocatorDefault, kIOHIDOptionsTypeNone);
    if (_impl->manager == nullptr) {
        return std::unexpected(DriverError::make(
            DriverErrorKind::kOther, core::ErrorCode::kDeviceOpenFailed, "IOHIDManagerCreate failed"));
    }

    std::array<const void *, 2> matches = {
        makeMatch(kHIDPage_GenericDesktop, kHIDUsage_GD_GamePad),
        makeMatch(kHIDPage_GenericDesktop, kHIDUsage_GD_Joystick),
    };
    if (matches[0] != nullptr && matches[1] != nullptr) {
        CFArrayRef criteria = CFArrayCreate(kCFAllocatorDefault, matches.data(),
                                            static_cast<CFIndex>(matches.size()), &kCFTypeArrayCallBacks);
        IOHIDManagerSetDeviceMatchingMultiple(_impl->manager, criteria);
        if (criteria != nullptr) {
            CFRelease(criteria);
        }
    }
    for (const void *match : matches) {
        if (match != nullptr) {
            CFRelease(match);
        }
    }

    IOHIDManagerRegisterDeviceRemovalCallback(_impl->manager, &Impl::removalCallback, _impl.get());
    IOHIDManagerRegisterInputValueCallback(_impl->manager, &Impl::valueCallback, _impl.get());
    IOHIDManagerScheduleWithRunLoop(_impl->manager, CFRunLoopGetCurrent(), kCFRunLoopDefaultMode);

    if (const IOReturn rc = IOHIDManagerOpen(_impl->manager, kIOHIDOptionsTypeNone); rc != kIOReturnSuccess) {
        _impl->close();
        char code[16];
        std::snprintf(code, sizeof(code), "0x%08x", static_cast<unsigned>(rc));
        return std::unexpected(DriverError::make(
            DriverErrorKind::kOther, core::ErrorCode::kDeviceOpenFailed,
            std::string("IOHIDManagerOpen failed: ") + code));
    }

    CFSetRef set = IOHIDManagerCopyDevices(_impl->manager);
    if (set == nullptr) {
        return {};
    }

    std::vector<const void *> refs(static_cast<core::usize>(CFSetGetCount(set)));
    CFSetGetValues(set, refs.data());
    std::sort(refs.begin(), refs.end(), [](const void *a, const void *b) {
        return numberProperty(static_cast<IOHIDDeviceRef>(const_cast<void *>(a)), CFSTR(kIOHIDLocationIDKey))
             < numberProperty(static_cast<IOHIDDeviceRef>(const_cast<void *>(b)), CFSTR(kIOHIDLocationIDKey));
    });

    for (const void *ref : refs) {
        if (auto added = _impl->add(static_cast<IOHIDDeviceRef>(const_cast<void *>(ref))); !added) {
            CFRelease(set);
            _impl->close();
            return added;
        }
    }
    CFRelease(set);

    return {};
}

GamepadSet IoHidDriver::devices() const
{
    GamepadSet set;
    for (const auto &dev : _impl->devices) {
        if (dev.connected) {
            set.push_back(GamepadInfo{dev.id, dev.name, dev.power});
        }
    }
    return set;
}

std::optional<GamepadEvent> IoHidDriver::nextEvent()
{
    if (_impl->pending.empty() && _impl->manager != nullptr) {
        for (int pass = 0; pass < kMaxRunLoopPasses; ++pass) {
            if (CFRunLoopRunInMode(kCFRunLoopDefaultMode, 0, true) != kCFRunLoopRunHandledSource) {
                break;
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

#endif // __APPLE__
