/**
 * @file WeakBind.hpp
 * @brief Callbacks that only reach their target while it is alive.
 *
 * For handlers registered with a platform API that may invoke them on
 * another thread after the owner has let go of the target. The target is
 * locked for the duration of each call.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef BPB_CORE_WEAK_BIND_HPP
    #define BPB_CORE_WEAK_BIND_HPP

    #include <functional>
    #include <memory>
    #include <utility>

namespace bpb::core {

/**
 * @brief Wraps @p fn so it is called as fn(target, args...) while
 *        @p target lives, and does nothing afterwards.
 */
template <typename T, typename Fn>
[[nodiscard]] auto weakBind(const std::shared_ptr<T> &target, Fn fn)
{
    return [weak = std::weak_ptr<T>(target), fn = std::move(fn)](auto &&...args) {
        if (const auto self = weak.lock()) {
            std::invoke(fn, *self, std::forward<decltype(args)>(args)...);
        }
    };
}

} // namespace bpb::core

#endif // BPB_CORE_WEAK_BIND_HPP
