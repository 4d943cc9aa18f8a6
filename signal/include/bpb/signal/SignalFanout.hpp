/**
 * @file SignalFanout.hpp
 * @brief Forwards every notification to a list of signals, in order.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_SIGNAL_SIGNAL_FANOUT_HPP
    #define BPB_SIGNAL_SIGNAL_FANOUT_HPP

    #include <bpb/signal/ISignal.hpp>

    #include <bpb/core/Types.hpp>

    #include <memory>
    #include <vector>

namespace bpb::signal {

class SignalFanout final : public ISignal {
public:
    /** @brief Appends a target. @p signal must not be null. */
    SignalFanout &add(std::unique_ptr<ISignal> signal);

    [[nodiscard]] core::usize size() const noexcept { return _targets.size(); }

    void progress() override;
    void success() override;
    void failure() override;

private:
    std::vector<std::unique_ptr<ISignal>> _targets;
};

} // namespace bpb::signal

#endif // BPB_SIGNAL_SIGNAL_FANOUT_HPP
