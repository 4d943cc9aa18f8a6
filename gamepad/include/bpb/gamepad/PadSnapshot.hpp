/**
 * @file PadSnapshot.hpp
 * @brief Polled pad state and the events between two polls.
 *
 * Backends that can only poll (XInput) keep the last snapshot per pad
 * and turn the difference with the next one into events.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_GAMEPAD_PAD_SNAPSHOT_HPP
    #define BPB_GAMEPAD_PAD_SNAPSHOT_HPP

    #include <bpb/gamepad/Types.hpp>

    #include <array>
    #include <chrono>
    #include <deque>

namespace bpb::gamepad {

inline constexpr core::usize kSnapshotAxes = 6;
inline constexpr core::usize kSnapshotButtons = 32;

struct PadSnapshot {
    /** Bit i set while button i is held. */
    core::u32                               buttons = 0;
    /** Normalized axis values, indexed like the emitted AxisChanged numbers. */
    std::array<core::f32, kSnapshotAxes>    axes{};
};

/**
 * @brief Appends the events that lead from @p before to @p after.
 *
 * Button edges come first in ascending button order, then one
 * AxisChanged per axis whose value differs. Returns the count appended.
 */
core::usize diffSnapshots(GamepadId id,
                          const PadSnapshot &before,
                          const PadSnapshot &after,
                          std::chrono::milliseconds time,
                          std::deque<GamepadEvent> &out);

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_PAD_SNAPSHOT_HPP
