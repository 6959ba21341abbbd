/**
 * @file Constants.hpp
 * @brief Runtime-wide compile-time constants.
 *
 * Default values for the tick rate, worker count and initial table sizes.
 * Every one of them can be overridden through engine::Config.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_CORE_CONSTANTS_HPP
    #define HIVE_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace hive::core {

inline constexpr u32   kTickRate               = 60;

inline constexpr u32   kInitialEntityCapacity  = 1'024;
inline constexpr u32   kSparseGrowthStep       = 256;
inline constexpr u32   kMaxSystems             = 1'024;

/** @brief Zero means std::thread::hardware_concurrency(). */
inline constexpr u32   kDefaultWorkerCount     = 0;

} // namespace hive::core

#endif // HIVE_CORE_CONSTANTS_HPP
