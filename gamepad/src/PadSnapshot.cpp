/**
 * @file PadSnapshot.cpp
 * @brief Snapshot diffing for polled backends.
 * @author MasterLaplace
 */

#include "bpb/gamepad/PadSnapshot.hpp"

namespace bpb::gamepad {

core::usize diffSnapshots(GamepadId id,
                          const PadSnapshot &before,
                          const PadSnapshot &after,
                          std::chrono::milliseconds time,
                          std::deque<GamepadEvent> &out)
{
    core::usize emitted = 0;

    const core::u32 changed = before.buttons ^ after.buttons;
    for (core::usize bit = 0; bit < kSnapshotButtons; ++bit) {
        const core::u32 mask = core::u32{1} << bit;
        if ((changed & mask) == 0) {
            continue;
        }
        const bool pressed = (after.buttons & mask) != 0;
        out.push_back(GamepadEvent{
            id,
            EventPayload{
                pressed ? EventType::kButtonPressed : EventType::kButtonReleased,
                static_cast<core::u8>(bit),
                pressed ? 1.0f : 0.0f},
            time});
        ++emitted;
    }

    for (core::usize axis = 0; axis < kSnapshotAxes; ++axis) {
        if (before.axes[axis] == after.axes[axis]) {
            continue;
        }
        out.push_back(GamepadEvent{
            id,
            EventPayload{EventType::kAxisChanged, static_cast<core::u8>(axis), after.axes[axis]},
            time});
        ++emitted;
    }

    return emitted;
}

} // namespace bpb::gamepad
