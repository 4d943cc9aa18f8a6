/**
 * @file GamepadBringup.cpp
 * @brief initGamepads() implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <bpb/bridge/GamepadBringup.hpp>
#include <bpb/bridge/ErrorTaxonomy.hpp>

#include <bpb/core/Log.hpp>

namespace bpb::bridge {

core::Expected<gamepad::GamepadSet> initGamepads(gamepad::IDriver &driver)
{
    if (auto init = driver.init(); !init) {
        return std::unexpected(classifyGamepadError(std::move(init.error())));
    }

    gamepad::GamepadSet gamepads = driver.devices();
    if (gamepads.empty()) {
        return std::unexpected(missingGamepad());
    }

    for (const auto &pad : gamepads) {
        core::Log::info("GAMEPAD", pad.name + " is " + gamepad::toString(pad.power));
    }
    return gamepads;
}

} // namespace bpb::bridge
