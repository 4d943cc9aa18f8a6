/**
 * @file AxisButtonMapper.hpp
 * @brief Edge detection that turns analog axes into virtual buttons.
 * @author MasterLaplace
 *
 * Shared by every platform driver. The mapper itself is stateless; each
 * device keeps its own AxisLatches so two pads never share a latch.
 */
#pragma once

#ifndef BPB_GAMEPAD_AXIS_BUTTON_MAPPER_HPP
    #define BPB_GAMEPAD_AXIS_BUTTON_MAPPER_HPP

    #include <bpb/gamepad/DriverError.hpp>
    #include <bpb/gamepad/Types.hpp>

    #include <deque>
    #include <string_view>
    #include <vector>

namespace bpb::gamepad {

/**
 * @brief Turns an analog axis into a virtual button.
 *
 * The button is pressed while the normalized axis value is at or above
 * @c threshold, which must lie in (0, 1].
 */
struct AxisToButton {
    core::u8  axis      = 0;
    core::f32 threshold = 0.5f;
    core::u8  button    = 0;
};

/** @brief One pressed/released flag per mapping entry, per device. */
using AxisLatches = std::vector<bool>;

class AxisButtonMapper {
public:
    explicit AxisButtonMapper(std::vector<AxisToButton> mappings = {});

    /** @brief Rejects any threshold outside (0, 1]. */
    [[nodiscard]] DriverExpected<void> validateThresholds() const;

    /** @brief Rejects mappings on an axis index @p device does not have. */
    [[nodiscard]] DriverExpected<void> validateAxes(std::string_view device, core::u8 axisCount) const;

    [[nodiscard]] AxisLatches makeLatches() const { return AxisLatches(_mappings.size(), false); }

    /**
     * @brief Appends a press or release to @p out for every mapping on the
     *        event's axis whose latch flips.
     *
     * Non-axis events are ignored. Returns the number of events appended.
     */
    core::usize apply(const GamepadEvent &axisEvent, AxisLatches &latches, std::deque<GamepadEvent> &out) const;

    [[nodiscard]] bool empty() const noexcept { return _mappings.empty(); }
    [[nodiscard]] const std::vector<AxisToButton> &mappings() const noexcept { return _mappings; }

private:
    std::vector<AxisToButton> _mappings;
};

} // namespace bpb::gamepad

#endif // BPB_GAMEPAD_AXIS_BUTTON_MAPPER_HPP
