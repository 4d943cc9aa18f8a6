/**
 * @file CentralSelector.hpp
 * @brief Picks the one BLE central the bridge scans with.
 * @author MasterLaplace
 *
 * Policy: the first adapter the platform lists is used, with no ranking
 * and no retry. An empty list is MissingBleAdapter on every backend. On a
 * backend with an explicit connect step a connect failure is reported as
 * a wrapped BleConnectFailed: the adapter existed, it just did not open.
 */
#pragma once

#ifndef BPB_BLE_CENTRAL_SELECTOR_HPP
    #define BPB_BLE_CENTRAL_SELECTOR_HPP

    #include <bpb/ble/Concepts.hpp>
    #include <bpb/core/Log.hpp>

    #include <string>
    #include <utility>

namespace bpb::ble {

template <Manager M>
[[nodiscard]] core::Expected<CentralOf<M>> getCentral(const M &manager)
{
    auto adapters = manager.adapters();
    if (!adapters) {
        return core::wrapError(core::ErrorCode::kBleAdapterFailed,
                               "failed to list BLE adapters", std::move(adapters.error()));
    }

    if (adapters->empty()) {
        return core::makeError(core::ErrorCode::kMissingBleAdapter, "No BLE adapters found");
    }

    auto &adapter = adapters->front();
    const std::string name = adapter.name();
    if (adapters->size() > 1) {
        core::Log::debug("BLE", std::to_string(adapters->size()) + " adapters listed, using the first");
    }

    if constexpr (ConnectableAdapter<typename M::Adapter>) {
        auto central = adapter.connect();
        if (!central) {
            return core::wrapError(core::ErrorCode::kBleConnectFailed,
                                   "failed to connect to BLE adapter " + name,
                                   std::move(central.error()));
        }
        core::Log::info("BLE", "connected to adapter " + name);
        return std::move(*central);
    } else {
        core::Log::info("BLE", "using adapter " + name);
        return std::move(adapter);
    }
}

} // namespace bpb::ble

#endif // BPB_BLE_CENTRAL_SELECTOR_HPP
