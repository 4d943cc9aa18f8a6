/**
 * @file LedSignal.cpp
 * @brief LedSignal implementation.
 * @author MasterLaplace
 */

#include <bpb/signal/LedSignal.hpp>

#include <bpb/core/Log.hpp>

#include <fstream>

namespace bpb::signal {

namespace {

constexpr const char *kTag = "SIGNAL";

// Used when max_brightness cannot be read; the kernel clamps larger values.
constexpr const char *kFallbackMaxBrightness = "255";

} // namespace

LedSignal::LedSignal(LedConfig config)
    : _config(std::move(config))
{
}

std::string LedSignal::ledPath(const std::string &led) const
{
    return _config.root + "/" + led;
}

void LedSignal::write(const std::string &led, const char *attribute, const std::string &value) const
{
    const std::string path = ledPath(led) + "/" + attribute;
    std::ofstream out(path);
    if (!out) {
        core::Log::warn(kTag, "cannot open " + path);
        return;
    }
    out << value << '\n';
    out.flush();
    if (!out) {
        core::Log::warn(kTag, "cannot write '" + value + "' to " + path);
    }
}

std::string LedSignal::maxBrightness(const std::string &led) const
{
    std::ifstream in(ledPath(led) + "/max_brightness");
    std::string value;
    if (!(in >> value) || value.empty()) {
        return kFallbackMaxBrightness;
    }
    return value;
}

void LedSignal::progress()
{
    if (_blinking) {
        return;
    }
    // delay_on/delay_off only exist once the timer trigger is active.
    write(_config.statusLed, "trigger", "timer");
    write(_config.statusLed, "delay_on", std::to_string(_config.blinkDelayMs));
    write(_config.statusLed, "delay_off", std::to_string(_config.blinkDelayMs));
    _blinking = true;
}

void LedSignal::success()
{
    write(_config.statusLed, "trigger", "none");
    write(_config.statusLed, "brightness", maxBrightness(_config.statusLed));
    _blinking = false;
}

void LedSignal::failure()
{
    write(_config.statusLed, "trigger", "none");
    write(_config.statusLed, "brightness", "0");
    _blinking = false;

    if (_config.faultLed) {
        write(*_config.faultLed, "trigger", "none");
        write(*_config.faultLed, "brightness", maxBrightness(*_config.faultLed));
    }
}

} // namespace bpb::signal
