/**
 * @file TestSignalFanout.cpp
 * @brief SignalFanout forwarding order.
 */

#include <catch2/catch_test_macros.hpp>

#include "bpb/signal/SignalFanout.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace bpb::signal;

namespace {

class JournalSignal final : public ISignal {
public:
    JournalSignal(std::string name, std::vector<std::string> &journal)
        : _name(std::move(name)), _journal(journal)
    {
    }

    void progress() override { _journal.push_back(_name + ":progress"); }
    void success() override { _journal.push_back(_name + ":success"); }
    void failure() override { _journal.push_back(_name + ":failure"); }

private:
    std::string _name;
    std::vector<std::string> &_journal;
};

} // namespace

TEST_CASE("SignalFanout forwards each call to every target in order", "[signal][fanout]")
{
    std::vector<std::string> journal;
    SignalFanout fanout;
    fanout.add(std::make_unique<JournalSignal>("log", journal))
          .add(std::make_unique<JournalSignal>("led", journal));

    REQUIRE(fanout.size() == 2);

    fanout.progress();
    fanout.failure();

    REQUIRE(journal == std::vector<std::string>{
        "log:progress", "led:progress", "log:failure", "led:failure"});
}

TEST_CASE("An empty SignalFanout is a no-op", "[signal][fanout]")
{
    SignalFanout fanout;
    fanout.progress();
    fanout.success();
    REQUIRE(fanout.size() == 0);
}
