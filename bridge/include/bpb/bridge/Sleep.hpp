/**
 * @file Sleep.hpp
 * @brief Injectable blocking wait used by the sequencer and the relay.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_BRIDGE_SLEEP_HPP
    #define BPB_BRIDGE_SLEEP_HPP

    #include <chrono>
    #include <functional>
    #include <thread>

namespace bpb::bridge {

using SleepFn = std::function<void(std::chrono::milliseconds)>;

inline void defaultSleep(std::chrono::milliseconds duration)
{
    std::this_thread::sleep_for(duration);
}

} // namespace bpb::bridge

#endif // BPB_BRIDGE_SLEEP_HPP
