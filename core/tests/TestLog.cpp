/**
 * @file TestLog.cpp
 * @brief Unit tests for the Log façade.
 */

#include <catch2/catch_test_macros.hpp>

#include "bpb/core/Log.hpp"

#include <string>
#include <vector>

using namespace bpb::core;

namespace {

struct Entry {
    LogLevel level;
    std::string tag;
    std::string message;
};

class CapturingLogger final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string(tag), std::string(message)});
    }

    std::vector<Entry> entries;
};

} // namespace

TEST_CASE("Log routes entries to the installed logger", "[core][log]")
{
    CapturingLogger logger;
    Log::setLogger(&logger);
    Log::setMinLevel(LogLevel::kInfo);

    Log::info("BLE", "hci0 selected");
    Log::error("scan failed");

    Log::setLogger(nullptr);

    REQUIRE(logger.entries.size() == 2);
    REQUIRE(logger.entries[0].level == LogLevel::kInfo);
    REQUIRE(logger.entries[0].tag == "BLE");
    REQUIRE(logger.entries[0].message == "hci0 selected");
    REQUIRE(logger.entries[1].tag == "bpb");
}

TEST_CASE("Log drops entries below the minimum level", "[core][log]")
{
    CapturingLogger logger;
    Log::setLogger(&logger);
    Log::setMinLevel(LogLevel::kWarn);

    Log::debug("RELAY", "tick");
    Log::info("RELAY", "tick");
    Log::warn("RELAY", "slow");

    REQUIRE(Log::minLevel() == LogLevel::kWarn);

    Log::setMinLevel(LogLevel::kInfo);
    Log::setLogger(nullptr);

    REQUIRE(logger.entries.size() == 1);
    REQUIRE(logger.entries[0].level == LogLevel::kWarn);
}

TEST_CASE("parseLogLevel accepts the level names", "[core][log]")
{
    REQUIRE(parseLogLevel("debug") == LogLevel::kDebug);
    REQUIRE(parseLogLevel("error") == LogLevel::kError);
    REQUIRE_FALSE(parseLogLevel("loud").has_value());
    REQUIRE(logLevelName(LogLevel::kInfo) == "INFO ");
}
