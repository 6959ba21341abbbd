/**
 * @file ExecutionPlan.hpp
 * @brief Partition of the registered systems into conflict-free waves.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_EXECUTION_PLAN_HPP
    #define HIVE_ECS_EXECUTION_PLAN_HPP

#include <hive/ecs/System.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/Types.hpp>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hive::ecs {

/**
 * @struct Wave
 * @brief Systems (indices into World::systems()) that may run concurrently.
 *        Indices are kept in declaration order.
 */
struct Wave
{
    std::vector<core::u32> systems;

    [[nodiscard]] bool operator==(const Wave &) const = default;
};

/**
 * @class ExecutionPlan
 * @brief Ordered list of waves.
 *
 * build() is greedy: each system, in declaration order, joins the first
 * existing wave none of whose members it conflicts with, or opens a new
 * wave.  The same system list always yields the same plan.
 */
class ExecutionPlan final
{
public:
    ExecutionPlan() = default;

    /** @brief Wraps hand-built waves.  Call validate() before trusting them. */
    explicit ExecutionPlan(std::vector<Wave> waves, core::u64 revision = 0);

    [[nodiscard]] static ExecutionPlan build(std::span<const SystemRecord> systems, core::u64 revision = 0);

    /**
     * @brief Checks that the plan covers every system exactly once and that
     *        no wave holds two conflicting systems.
     * @return kInvalidArgument on a bad partition, kAccessViolation on a
     *         conflicting wave.
     */
    [[nodiscard]] core::Expected<void> validate(std::span<const SystemRecord> systems) const;

    [[nodiscard]] const std::vector<Wave> &waves() const noexcept { return _waves; }
    [[nodiscard]] core::u32                waveCount() const noexcept { return static_cast<core::u32>(_waves.size()); }
    [[nodiscard]] bool                     empty() const noexcept { return _waves.empty(); }

    /** @brief World revision the plan was built from. */
    [[nodiscard]] core::u64 revision() const noexcept { return _revision; }

    /** @brief Wave holding @p systemIndex, if any. */
    [[nodiscard]] std::optional<core::u32> waveOf(core::u32 systemIndex) const noexcept;

    /** @brief One line per wave: "wave 0: move, gravity". */
    [[nodiscard]] std::string describe(std::span<const SystemRecord> systems) const;

    [[nodiscard]] bool operator==(const ExecutionPlan &other) const { return _waves == other._waves; }

private:
    std::vector<Wave> _waves;
    core::u64         _revision{0};
};

} // namespace hive::ecs

#endif // HIVE_ECS_EXECUTION_PLAN_HPP
