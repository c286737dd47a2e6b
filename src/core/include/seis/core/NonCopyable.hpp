/**
 * @file NonCopyable.hpp
 * @brief CRTP bases for objects that own a device, a socket or a thread.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef SEIS_CORE_NON_COPYABLE_HPP
    #define SEIS_CORE_NON_COPYABLE_HPP

namespace seis::core {

/**
 * @brief Forbids copies; moves stay available.
 *
 * A transport owns one file descriptor; a second copy would close it
 * twice.
 *
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

/**
 * @brief Forbids copies and moves.
 *
 * For objects whose address is captured by a read loop or a subscriber
 * callback: relocating them would leave that thread with a dangling
 * @c this.
 *
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonMovable {
protected:
    NonMovable()  = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable &)            = delete;
    NonMovable &operator=(const NonMovable &)  = delete;
    NonMovable(NonMovable &&)                 = delete;
    NonMovable &operator=(NonMovable &&)       = delete;
};

} // namespace seis::core

#endif // SEIS_CORE_NON_COPYABLE_HPP
