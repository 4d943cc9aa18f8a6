/**
 * @file TestLogSignal.cpp
 * @brief Text written by LogSignal.
 */

#include <catch2/catch_test_macros.hpp>

#include "bpb/signal/LogSignal.hpp"

#include <bpb/core/Log.hpp>

#include <string>
#include <vector>

using namespace bpb;

namespace {

struct Line {
    core::LogLevel level;
    std::string tag;
    std::string message;
};

class LineLogger final : public core::ILogger {
public:
    LineLogger()
    {
        core::Log::setLogger(this);
        core::Log::setMinLevel(core::LogLevel::kDebug);
    }

    ~LineLogger() override
    {
        core::Log::setLogger(nullptr);
        core::Log::setMinLevel(core::LogLevel::kInfo);
    }

    void write(core::LogLevel level, std::string_view tag, std::string_view message) override
    {
        lines.push_back({level, std::string(tag), std::string(message)});
    }

    std::vector<Line> lines;
};

} // namespace

TEST_CASE("LogSignal numbers progress steps and logs the outcome", "[signal][log]")
{
    LineLogger logger;
    signal::LogSignal notifier;

    notifier.progress();
    notifier.progress();
    notifier.success();

    REQUIRE(logger.lines.size() == 3);
    REQUIRE(logger.lines[0].tag == "SIGNAL");
    REQUIRE(logger.lines[0].message == "progress 1");
    REQUIRE(logger.lines[1].message == "progress 2");
    REQUIRE(logger.lines[2].level == core::LogLevel::kInfo);
    REQUIRE(logger.lines[2].message == "success");
}

TEST_CASE("LogSignal logs failure at error level", "[signal][log]")
{
    LineLogger logger;
    signal::LogSignal notifier;

    notifier.progress();
    notifier.failure();

    REQUIRE(logger.lines.size() == 2);
    REQUIRE(logger.lines[1].level == core::LogLevel::kError);
    REQUIRE(logger.lines[1].tag == "SIGNAL");
    REQUIRE(logger.lines[1].message == "failure");
}
