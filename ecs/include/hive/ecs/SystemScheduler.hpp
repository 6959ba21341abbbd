/**
 * @file SystemScheduler.hpp
 * @brief Wave scheduler: runs the systems of a World, one wave at a time,
 *        with the members of each wave dispatched to a thread pool.
 *
 * @par Tick
 * 1. Rebuild the ExecutionPlan if the world's system set changed.
 * 2. For each wave, run every member in parallel; a latch waits for all of
 *    them before advancing.  Single-system waves run inline.
 * 3. After the join, apply each member's CommandBuffer in plan order (or
 *    hold them until the end of the tick with CommandFlush::PerFrame).
 *
 * A failing entity invocation is logged and recorded in the TickReport; the
 * system keeps running on the remaining entities.  A body returning
 * kSystemFatal (or throwing) stops that system for the tick.  An access
 * violation aborts the whole tick after the current wave joins and discards
 * that wave's commands.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_SYSTEM_SCHEDULER_HPP
    #define HIVE_ECS_SYSTEM_SCHEDULER_HPP

#include <hive/ecs/Entity.hpp>
#include <hive/ecs/ExecutionPlan.hpp>
#include <hive/ecs/World.hpp>
#include <hive/concurrency/ThreadPool.hpp>
#include <hive/core/Error.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/NonCopyable.hpp>
#include <hive/core/Types.hpp>

#include <memory>
#include <string>
#include <vector>

namespace hive::ecs {

/**
 * @enum CommandFlush
 * @brief When deferred commands become visible.
 */
enum class CommandFlush : core::u8
{
    PerWave,  ///< After every wave; later waves see earlier waves' changes.
    PerFrame  ///< Once, after the last wave.
};

/**
 * @struct SystemFailure
 * @brief One failed invocation.  @c entity is null for resource-only systems.
 */
struct SystemFailure
{
    std::string system;
    Entity      entity;
    core::Error error;
    bool        fatal{false};
};

/**
 * @struct TickReport
 */
struct TickReport
{
    core::u64                  tick{0};
    core::u32                  waves{0};
    core::u32                  invocations{0};
    core::u32                  commandsApplied{0};
    core::u32                  commandsIgnored{0};
    std::vector<Entity>        created;
    std::vector<SystemFailure> failures;

    [[nodiscard]] bool ok() const noexcept { return failures.empty(); }
};

class SystemScheduler final : public core::NonCopyable<SystemScheduler>
{
public:
    struct Options
    {
        CommandFlush flush{CommandFlush::PerWave};
        bool         validateBorrows{true};
    };

    explicit SystemScheduler(concurrency::ThreadPool &pool);
    SystemScheduler(concurrency::ThreadPool &pool, Options options);
    ~SystemScheduler();

    /** @brief Current plan for @p world, rebuilt if its systems changed. */
    [[nodiscard]] const ExecutionPlan &plan(const World &world);

    /**
     * @brief Runs one tick with the cached plan.
     * @return kAccessViolation if a wave breaks the access discipline,
     *         kInvalidState if called re-entrantly.
     */
    [[nodiscard]] core::Expected<TickReport> tick(World &world, core::f32 deltaTime);

    /**
     * @brief Runs one tick with an explicit plan.
     * @return kInvalidArgument if @p plan does not cover the world's
     *         systems exactly once, plus everything tick() can return.
     */
    [[nodiscard]] core::Expected<TickReport> execute(World &world, const ExecutionPlan &plan, core::f32 deltaTime);

    [[nodiscard]] core::u64 tickCount() const noexcept;

    /** @brief Number of times a plan was (re)built. */
    [[nodiscard]] core::u32 planBuilds() const noexcept;

    [[nodiscard]] const Options &options() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hive::ecs

#endif // HIVE_ECS_SYSTEM_SCHEDULER_HPP
