/**
 * @file SignalFanout.cpp
 * @brief SignalFanout implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <bpb/signal/SignalFanout.hpp>

#include <bpb/core/Assert.hpp>

namespace bpb::signal {

SignalFanout &SignalFanout::add(std::unique_ptr<ISignal> signal)
{
    BPB_ASSERT(signal != nullptr);
    _targets.push_back(std::move(signal));
    return *this;
}

void SignalFanout::progress()
{
    for (auto &target : _targets) {
        target->progress();
    }
}

void SignalFanout::success()
{
    for (auto &target : _targets) {
        target->success();
    }
}

void SignalFanout::failure()
{
    for (auto &target : _targets) {
        target->failure();
    }
}

} // namespace bpb::signal
