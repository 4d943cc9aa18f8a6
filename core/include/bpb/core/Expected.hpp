/**
 * @file Expected.hpp
 * @brief Error-propagating return type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * BPB_TRY / BPB_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_CORE_EXPECTED_HPP
    #define BPB_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace bpb::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace bpb::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once. If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type bpb::core::Expected<U>.
 */
#define BPB_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_bpb_result = (expr);                                       \
        if (!_bpb_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_bpb_result.error()));        \
        std::move(_bpb_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type bpb::core::ExpectedVoid.
 */
#define BPB_TRY_VOID(expr)                                                \
    do {                                                                   \
        auto &&_bpb_result = (expr);                                       \
        if (!_bpb_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_bpb_result.error()));        \
    } while (false)

#endif // BPB_CORE_EXPECTED_HPP
