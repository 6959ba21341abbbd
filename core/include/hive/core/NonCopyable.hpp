/**
 * @file NonCopyable.hpp
 * @brief CRTP base class that deletes copy operations.
 *
 * Used by the owners of storage tables, worker threads and scheduler state,
 * none of which may be duplicated implicitly.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_CORE_NON_COPYABLE_HPP
    #define HIVE_CORE_NON_COPYABLE_HPP

namespace hive::core {

/**
 * @brief Inherit to disable copy construction and assignment while keeping
 *        the derived type movable.
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

} // namespace hive::core

#endif // HIVE_CORE_NON_COPYABLE_HPP
