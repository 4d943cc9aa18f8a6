/**
 * @file LogSignal.hpp
 * @brief Signal that writes each notification to the log.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_SIGNAL_LOG_SIGNAL_HPP
    #define BPB_SIGNAL_LOG_SIGNAL_HPP

    #include <bpb/signal/ISignal.hpp>

    #include <bpb/core/Types.hpp>

namespace bpb::signal {

class LogSignal final : public ISignal {
public:
    void progress() override;
    void success() override;
    void failure() override;

private:
    core::u32 _step = 0;
};

} // namespace bpb::signal

#endif // BPB_SIGNAL_LOG_SIGNAL_HPP
