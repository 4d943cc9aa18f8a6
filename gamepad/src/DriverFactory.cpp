/**
 * @file DriverFactory.cpp
 * @brief Compile-time selection of the platform gamepad driver.
 * @author MasterLaplace
 */

#include "bpb/gamepad/DriverFactory.hpp"
#include "bpb/gamepad/UnsupportedDriver.hpp"

#include <bpb/core/Platform.hpp>

#if defined(BPB_OS_WINDOWS)
    #include "bpb/gamepad/XInputDriver.hpp"
#elif defined(BPB_OS_MACOS)
    #include "bpb/gamepad/IoHidDriver.hpp"
#endif

namespace bpb::gamepad {

std::unique_ptr<IDriver> DriverFactory::createPlatformDriver([[maybe_unused]] const JoystickConfig &config)
{
#if defined(BPB_OS_LINUX)
    return std::make_unique<JoystickDriver>(config);
#elif defined(BPB_OS_WINDOWS)
    return std::make_unique<XInputDriver>(config);
#elif defined(BPB_OS_MACOS)
    return std::make_unique<IoHidDriver>(config);
#else
    return std::make_unique<UnsupportedDriver>();
#endif
}

} // namespace bpb::gamepad
