/**
 * @file AxisButtonMapper.cpp
 * @brief Axis-to-button validation and latch edges.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "bpb/gamepad/AxisButtonMapper.hpp"

#include <bpb/core/Assert.hpp>

#include <string>

namespace bpb::gamepad {

AxisButtonMapper::AxisButtonMapper(std::vector<AxisToButton> mappings)
    : _mappings(std::move(mappings))
{
}

DriverExpected<void> AxisButtonMapper::validateThresholds() const
{
    for (const auto &mapping : _mappings) {
        if (!(mapping.threshold > 0.0f && mapping.threshold <= 1.0f)) {
            return std::unexpected(DriverError::make(
                DriverErrorKind::kInvalidAxisToButton, core::ErrorCode::kInvalidArgument,
                "axis " + std::to_string(mapping.axis) + " -> button "
                    + std::to_string(mapping.button) + ": threshold must lie in (0, 1]"));
        }
    }
    return {};
}

DriverExpected<void> AxisButtonMapper::validateAxes(std::string_view device, core::u8 axisCount) const
{
    for (const auto &mapping : _mappings) {
        if (mapping.axis >= axisCount) {
            return std::unexpected(DriverError::make(
                DriverErrorKind::kInvalidAxisToButton, core::ErrorCode::kInvalidArgument,
                std::string(device) + " has " + std::to_string(axisCount) + " axes, mapping uses axis "
                    + std::to_string(mapping.axis)));
        }
    }
    return {};
}

core::usize AxisButtonMapper::apply(const GamepadEvent &axisEvent, AxisLatches &latches,
                                    std::deque<GamepadEvent> &out) const
{
    if (axisEvent.payload.type != EventType::kAxisChanged) {
        return 0;
    }
    BPB_ASSERT(latches.size() == _mappings.size());

    core::usize emitted = 0;
    for (core::usize i = 0; i < _mappings.size(); ++i) {
        const auto &mapping = _mappings[i];
        if (mapping.axis != axisEvent.payload.number) {
            continue;
        }
        const bool pressed = axisEvent.payload.value >= mapping.threshold;
        if (pressed == latches[i]) {
            continue;
        }
        latches[i] = pressed;
        out.push_back(GamepadEvent{
            axisEvent.id,
            EventPayload{
                pressed ? EventType::kButtonPressed : EventType::kButtonReleased,
                mapping.button,
                pressed ? 1.0f : 0.0f},
            axisEvent.time});
        ++emitted;
    }
    return emitted;
}

} // namespace bpb::gamepad
