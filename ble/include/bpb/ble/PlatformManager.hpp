/**
 * @file PlatformManager.hpp
 * @brief Build-time choice of the BLE stack.
 *
 * Exactly one backend is compiled per target; bpb::ble::PlatformManager
 * names its manager type so the rest of the bridge stays stack-agnostic.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_BLE_PLATFORM_MANAGER_HPP
    #define BPB_BLE_PLATFORM_MANAGER_HPP

    #include <bpb/ble/Concepts.hpp>
    #include <bpb/core/Platform.hpp>

    #if defined(BPB_OS_LINUX)
        #include <bpb/ble/bluez/BluezManager.hpp>
    #elif defined(BPB_OS_WINDOWS)
        #include <bpb/ble/winble/WinRtManager.hpp>
    #elif defined(BPB_OS_MACOS)
        #include <bpb/ble/corebt/CoreBluetoothManager.hpp>
    #else
        #error "No BLE backend for this platform"
    #endif

namespace bpb::ble {

    #if defined(BPB_OS_LINUX)
using PlatformManager = bluez::BluezManager;
    #elif defined(BPB_OS_WINDOWS)
using PlatformManager = winble::WinRtManager;
    #elif defined(BPB_OS_MACOS)
using PlatformManager = corebt::CoreBluetoothManager;
    #endif

static_assert(Manager<PlatformManager>);

} // namespace bpb::ble

#endif // BPB_BLE_PLATFORM_MANAGER_HPP
