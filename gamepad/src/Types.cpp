/**
 * @file Types.cpp
 * @brief Text rendering of gamepad power states and event payloads.
 * @author MasterLaplace
 */

#include "bpb/gamepad/Types.hpp"

#include <cstdio>

namespace bpb::gamepad {

std::string toString(const PowerInfo &power)
{
    switch (power.status) {
        case PowerStatus::kUnknown:     return "Unknown";
        case PowerStatus::kWired:       return "Wired";
        case PowerStatus::kCharged:     return "Charged";
        case PowerStatus::kDischarging:
            return "Discharging(" + std::to_string(power.percent) + "%)";
        case PowerStatus::kCharging:
            return "Charging(" + std::to_string(power.percent) + "%)";
    }
    return "Unknown";
}

std::string toString(const EventPayload &payload)
{
    switch (payload.type) {
        case EventType::kButtonPressed:
            return "ButtonPressed(" + std::to_string(payload.number) + ")";
        case EventType::kButtonReleased:
            return "ButtonReleased(" + std::to_string(payload.number) + ")";
        case EventType::kAxisChanged: {
            char buf[48];
            std::snprintf(buf, sizeof(buf), "AxisChanged(%u, %.3f)",
                          static_cast<unsigned>(payload.number),
                          static_cast<double>(payload.value));
            return buf;
        }
        case EventType::kDisconnected:
            return "Disconnected";
    }
    return "Unknown";
}

} // namespace bpb::gamepad
