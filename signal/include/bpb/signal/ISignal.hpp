/**
 * @file ISignal.hpp
 * @brief Bring-up status observer.
 *
 * The bridge reports its bring-up through three one-way notifications.
 * Implementations must not throw and cannot report failure back: a
 * signal that cannot be delivered is logged and dropped.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_SIGNAL_ISIGNAL_HPP
    #define BPB_SIGNAL_ISIGNAL_HPP

namespace bpb::signal {

class ISignal {
public:
    virtual ~ISignal() = default;

    /** @brief A bring-up milestone was reached. */
    virtual void progress() = 0;

    /** @brief Bring-up completed; the relay is about to start. */
    virtual void success() = 0;

    /** @brief Bring-up failed; the process is about to exit. */
    virtual void failure() = 0;

protected:
    ISignal() = default;
    ISignal(const ISignal &) = default;
    ISignal &operator=(const ISignal &) = default;
};

} // namespace bpb::signal

#endif // BPB_SIGNAL_ISIGNAL_HPP
