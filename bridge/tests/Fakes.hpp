/**
 * @file Fakes.hpp
 * @brief Scripted collaborators shared by the bridge tests.
 */
#pragma once

#ifndef BPB_BRIDGE_TESTS_FAKES_HPP
    #define BPB_BRIDGE_TESTS_FAKES_HPP

    #include <bpb/ble/Concepts.hpp>
    #include <bpb/core/Log.hpp>
    #include <bpb/gamepad/IDriver.hpp>
    #include <bpb/signal/ISignal.hpp>

    #include <deque>
    #include <optional>
    #include <string>
    #include <string_view>
    #include <vector>

namespace bpb::test {

class FakeDriver final : public gamepad::IDriver {
public:
    std::optional<gamepad::DriverError> initError;
    gamepad::GamepadSet                 pads;
    std::deque<gamepad::GamepadEvent>   events;
    int                                 initCalls = 0;

    gamepad::DriverExpected<void> init() override
    {
        ++initCalls;
        if (initError) {
            return std::unexpected(*initError);
        }
        return {};
    }

    gamepad::GamepadSet devices() const override { return pads; }

    std::optional<gamepad::GamepadEvent> nextEvent() override
    {
        if (events.empty()) {
            return std::nullopt;
        }
        auto event = events.front();
        events.pop_front();
        return event;
    }

    const char *name() const noexcept override { return "fake"; }
};

class RecordingSignal final : public signal::ISignal {
public:
    void progress() override { calls.push_back('P'); }
    void success() override { calls.push_back('S'); }
    void failure() override { calls.push_back('F'); }

    [[nodiscard]] long count(char kind) const
    {
        long n = 0;
        for (char c : calls) {
            n += (c == kind);
        }
        return n;
    }

    std::string calls;
};

/**
 * @brief Installs itself as the log sink for its lifetime, at debug level.
 */
class LogCapture final : public core::ILogger {
public:
    struct Entry {
        core::LogLevel level;
        std::string    tag;
        std::string    message;
    };

    LogCapture()
        : _previousLevel(core::Log::minLevel())
    {
        core::Log::setLogger(this);
        core::Log::setMinLevel(core::LogLevel::kDebug);
    }

    ~LogCapture() override
    {
        core::Log::setLogger(nullptr);
        core::Log::setMinLevel(_previousLevel);
    }

    LogCapture(const LogCapture &) = delete;
    LogCapture &operator=(const LogCapture &) = delete;

    void write(core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string(tag), std::string(message)});
    }

    [[nodiscard]] bool contains(core::LogLevel level, std::string_view tag, std::string_view message) const
    {
        for (const auto &entry : entries) {
            if (entry.level == level && entry.tag == tag && entry.message == message) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] long count(core::LogLevel level) const
    {
        long n = 0;
        for (const auto &entry : entries) {
            n += (entry.level == level);
        }
        return n;
    }

    std::vector<Entry> entries;

private:
    core::LogLevel _previousLevel;
};

struct FakeCentral {
    std::optional<core::Error>         scanError;
    std::vector<ble::PeripheralRecord> seen;
    bool                               scanning = false;
    int                                polls = 0;

    core::ExpectedVoid startScan()
    {
        if (scanError) {
            return std::unexpected(*scanError);
        }
        scanning = true;
        return {};
    }

    std::vector<ble::PeripheralRecord> peripherals()
    {
        ++polls;
        return scanning ? seen : std::vector<ble::PeripheralRecord>{};
    }
};

struct FakeAdapter {
    using Connected = FakeCentral;

    std::string                 adapterName = "hci0";
    std::optional<core::Error>  connectError;
    FakeCentral                 central;

    std::string name() const { return adapterName; }

    core::Expected<FakeCentral> connect() const
    {
        if (connectError) {
            return std::unexpected(*connectError);
        }
        return central;
    }
};

struct FakeManager {
    using Adapter = FakeAdapter;

    std::vector<FakeAdapter> list;

    core::Expected<std::vector<FakeAdapter>> adapters() const { return list; }
};

static_assert(ble::Manager<FakeManager>);

inline gamepad::GamepadInfo wiredPad(gamepad::GamepadId id, std::string name)
{
    return gamepad::GamepadInfo{id, std::move(name), gamepad::PowerInfo{gamepad::PowerStatus::kWired, 0}};
}

} // namespace bpb::test

#endif // BPB_BRIDGE_TESTS_FAKES_HPP
