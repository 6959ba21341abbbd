/**
 * @file Runtime.hpp
 * @brief Top-level runtime façade (Façade pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_ENGINE_RUNTIME_HPP
    #define HIVE_ENGINE_RUNTIME_HPP

#include <hive/engine/Config.hpp>
#include <hive/engine/TestRunner.hpp>
#include <hive/ecs/ExecutionPlan.hpp>
#include <hive/ecs/SystemScheduler.hpp>
#include <hive/ecs/World.hpp>
#include <hive/host/HostBindings.hpp>
#include <hive/core/Types.hpp>
#include <hive/core/Expected.hpp>

#include <functional>
#include <memory>

namespace hive::engine {

/**
 * @brief Owns the world, the thread pool, the scheduler, the host bindings
 *        and the test runner for one session.
 *
 * Types and systems can be registered on world() right after construction;
 * init() must succeed before the first tick.
 */
class Runtime
{
public:
    /// @param config Immutable runtime configuration.
    explicit Runtime(Config config);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    /**
     * @brief Validates the configuration and starts the worker pool.
     * @return kInvalidArgument for a bad configuration, kInvalidState if
     *         already initialised.
     */
    [[nodiscard]] core::Expected<void> init();

    /** @brief Runs one tick with the fixed delta time. */
    [[nodiscard]] core::Expected<ecs::TickReport> tick();

    /** @brief Runs one tick with an explicit delta time. */
    [[nodiscard]] core::Expected<ecs::TickReport> tick(core::f32 deltaTime);

    /**
     * @brief Runs the real-time fixed-step loop until requestStop() or a
     *        fatal tick error.
     * @param onFrame Optional callback after each frame.
     */
    [[nodiscard]] core::Expected<void> run(std::function<void()> onFrame = {});

    /** @brief Runs @p count ticks back to back. */
    [[nodiscard]] core::Expected<void> runTicks(core::u64 count);

    void requestStop() noexcept;

    /** @brief Runs the registered tests against world(). */
    [[nodiscard]] TestReport runTests();

    /** @brief Stops the worker pool.  Further ticks fail with kInvalidState. */
    void shutdown();

    [[nodiscard]] ecs::World&               world() noexcept;
    [[nodiscard]] host::HostBindings&       host() noexcept;
    [[nodiscard]] TestRunner&               tests() noexcept;
    [[nodiscard]] const ecs::ExecutionPlan& plan();
    [[nodiscard]] const Config&             config() const noexcept;
    [[nodiscard]] core::u64                 tickCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace hive::engine

#endif // HIVE_ENGINE_RUNTIME_HPP
