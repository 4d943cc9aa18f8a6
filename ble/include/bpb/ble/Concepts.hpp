/**
 * @file Concepts.hpp
 * @brief Compile-time contracts of the BLE backends.
 *
 * A backend provides a Manager whose adapters() lists adapter handles.
 * Adapters either are already usable centrals (WinRT, CoreBluetooth) or
 * must be connected first (BlueZ); the latter advertise it by exposing a
 * @c Connected type and a connect() member. CentralOf<M> names the
 * central a manager finally yields in both cases.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_BLE_CONCEPTS_HPP
    #define BPB_BLE_CONCEPTS_HPP

    #include <bpb/ble/Types.hpp>
    #include <bpb/core/Expected.hpp>

    #include <concepts>
    #include <string>
    #include <vector>

namespace bpb::ble {

/**
 * @brief A scanning-capable radio handle.
 */
template <typename C>
concept Central = std::movable<C> && requires(C &central) {
    { central.startScan() }   -> std::same_as<core::ExpectedVoid>;
    { central.peripherals() } -> std::same_as<std::vector<PeripheralRecord>>;
};

/**
 * @brief An adapter that needs an explicit connect step.
 */
template <typename A>
concept ConnectableAdapter = requires(const A &adapter) {
    typename A::Connected;
    { adapter.connect() } -> std::same_as<core::Expected<typename A::Connected>>;
};

template <typename A>
struct CentralFor {
    using type = A;
};

template <ConnectableAdapter A>
struct CentralFor<A> {
    using type = typename A::Connected;
};

template <typename A>
using CentralFor_t = typename CentralFor<A>::type;

/**
 * @brief A BLE manager listing adapters of one platform stack.
 */
template <typename M>
concept Manager = std::movable<M>
    && requires(const M &manager) {
        typename M::Adapter;
        { manager.adapters() } -> std::same_as<core::Expected<std::vector<typename M::Adapter>>>;
    }
    && requires(const typename M::Adapter &adapter) {
        { adapter.name() } -> std::convertible_to<std::string>;
    }
    && Central<CentralFor_t<typename M::Adapter>>;

template <Manager M>
using CentralOf = CentralFor_t<typename M::Adapter>;

} // namespace bpb::ble

#endif // BPB_BLE_CONCEPTS_HPP
