/**
 * @file LedSignal.hpp
 * @brief Signal driven through Linux sysfs LED class devices.
 * @author MasterLaplace
 *
 * Each LED is a directory under @c root (normally /sys/class/leds)
 * exposing the @c trigger, @c brightness, @c max_brightness,
 * @c delay_on and @c delay_off attributes. Progress blinks the status LED
 * with the timer trigger, success lights it steadily, failure turns it
 * off and lights the fault LED when one is configured.
 *
 * Attribute writes that fail (missing LED, permissions) are logged as
 * warnings and otherwise ignored.
 */
#pragma once

#ifndef BPB_SIGNAL_LED_SIGNAL_HPP
    #define BPB_SIGNAL_LED_SIGNAL_HPP

    #include <bpb/signal/ISignal.hpp>

    #include <bpb/core/Constants.hpp>

    #include <optional>
    #include <string>

namespace bpb::signal {

struct LedConfig {
    std::string                root = std::string(core::kLedSysfsRoot);
    std::string                statusLed;
    std::optional<std::string> faultLed;
    core::u32                  blinkDelayMs = core::kLedBlinkDelayMs;
};

class LedSignal final : public ISignal {
public:
    explicit LedSignal(LedConfig config);

    void progress() override;
    void success() override;
    void failure() override;

private:
    [[nodiscard]] std::string ledPath(const std::string &led) const;

    void write(const std::string &led, const char *attribute, const std::string &value) const;
    [[nodiscard]] std::string maxBrightness(const std::string &led) const;

    LedConfig _config;
    bool      _blinking = false;
};

} // namespace bpb::signal

#endif // BPB_SIGNAL_LED_SIGNAL_HPP
