/**
 * @file main.cpp
 * @brief blepad-bridge entry-point.
 *
 * Brings up the gamepads and the BLE central, reports progress through
 * the log and an optional sysfs LED, then relays gamepad events until
 * SIGINT or SIGTERM.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <bpb/ble/PlatformManager.hpp>
#include <bpb/bridge/Config.hpp>
#include <bpb/bridge/DiscoverySequencer.hpp>
#include <bpb/bridge/EventRelay.hpp>
#include <bpb/core/Log.hpp>
#include <bpb/gamepad/DriverFactory.hpp>
#include <bpb/signal/LedSignal.hpp>
#include <bpb/signal/LogSignal.hpp>
#include <bpb/signal/SignalFanout.hpp>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>
#include <optional>
#include <string>

using namespace bpb;

namespace {

constexpr int kExitBringupFailed = 1;
constexpr int kExitUsage = 2;

std::atomic<bridge::EventRelay *> gRelay{nullptr};

void onStopSignal(int)
{
    if (auto *relay = gRelay.load()) {
        relay->requestStop();
    }
}

void printUsage(std::FILE *out, const char *argv0)
{
    std::fprintf(out,
        "Usage: %s [options]\n"
        "\n"
        "Relays USB gamepad input once a BLE adapter is up and scanning.\n"
        "\n"
        "Options:\n"
        "  --led <name>        status LED under /sys/class/leds\n"
        "  --fault-led <name>  LED lit when bring-up fails\n"
        "  --input-dir <path>  joystick device directory (default /dev/input)\n"
        "  --log-level <level> debug, info, warn, error or fatal (default info)\n"
        "  --verbose           same as --log-level debug\n"
        "  --help              show this help\n",
        argv0);
}

/** @brief Empty optional after printing a diagnostic; exit code in @p status. */
std::optional<bridge::Config> parseArgs(int argc, char **argv, int &status)
{
    bridge::Config::Builder builder;

    for (int i = 1; i < argc; ++i) {
        const char *arg = argv[i];

        auto value = [&](const char *flag) -> const char * {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "%s: %s expects a value\n", argv[0], flag);
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            printUsage(stdout, argv[0]);
            status = 0;
            return std::nullopt;
        }
        if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
            builder.logLevel(core::LogLevel::kDebug);
            continue;
        }
        if (std::strcmp(arg, "--log-level") == 0) {
            const char *v = value(arg);
            const auto level = v != nullptr ? core::parseLogLevel(v) : std::nullopt;
            if (!level) {
                if (v != nullptr) {
                    std::fprintf(stderr, "%s: unknown log level '%s'\n", argv[0], v);
                }
                status = kExitUsage;
                return std::nullopt;
            }
            builder.logLevel(*level);
            continue;
        }
        if (std::strcmp(arg, "--led") == 0) {
            const char *v = value(arg);
            if (v == nullptr) {
                status = kExitUsage;
                return std::nullopt;
            }
            builder.statusLed(v);
            continue;
        }
        if (std::strcmp(arg, "--fault-led") == 0) {
            const char *v = value(arg);
            if (v == nullptr) {
                status = kExitUsage;
                return std::nullopt;
            }
            builder.faultLed(v);
            continue;
        }
        if (std::strcmp(arg, "--input-dir") == 0) {
            const char *v = value(arg);
            if (v == nullptr) {
                status = kExitUsage;
                return std::nullopt;
            }
            builder.joystickDir(v);
            continue;
        }

        std::fprintf(stderr, "%s: unknown option '%s'\n", argv[0], arg);
        printUsage(stderr, argv[0]);
        status = kExitUsage;
        return std::nullopt;
    }

    return builder.build();
}

std::unique_ptr<signal::ISignal> makeSignal(const bridge::Config &config)
{
    auto fanout = std::make_unique<signal::SignalFanout>();
    fanout->add(std::make_unique<signal::LogSignal>());

    if (config.statusLed()) {
        fanout->add(std::make_unique<signal::LedSignal>(
            signal::LedConfig{config.ledRoot(), *config.statusLed(), config.faultLed()}));
    } else if (config.faultLed()) {
        core::Log::warn("SIGNAL", "--fault-led ignored without --led");
    }
    return fanout;
}

} // namespace

int main(int argc, char **argv)
{
    int status = 0;
    const auto config = parseArgs(argc, argv, status);
    if (!config) {
        return status;
    }

    core::Log::setMinLevel(config->logLevel());

    auto driver = gamepad::DriverFactory::createPlatformDriver(config->joystick());
    auto notifier = makeSignal(*config);
    core::Log::info("BRIDGE", std::string("gamepad driver: ") + driver->name());

    bridge::DiscoverySequencer<ble::PlatformManager> sequencer(
        *driver, *notifier, &ble::PlatformManager::create, config->discoveryWindow());

    auto session = sequencer.run();
    if (!session) {
        return kExitBringupFailed; // logged by the sequencer
    }

    bridge::LogEventSink sink;
    bridge::EventRelay relay(*driver, sink, config->pollInterval());

    gRelay.store(&relay);
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);

    relay.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    gRelay.store(nullptr);

    core::Log::info("BRIDGE", "shutting down");
    return 0;
}
