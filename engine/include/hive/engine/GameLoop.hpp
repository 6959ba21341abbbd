/**
 * @file GameLoop.hpp
 * @brief Fixed time-step frame driver.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_ENGINE_GAMELOOP_HPP
    #define HIVE_ENGINE_GAMELOOP_HPP

#include <hive/engine/Config.hpp>
#include <hive/core/Types.hpp>
#include <hive/core/Expected.hpp>

#include <atomic>
#include <functional>

namespace hive::engine {

/** @brief Callbacks the game loop invokes each frame. */
struct LoopCallbacks
{
    /** @brief Called once per fixed tick (dt = 1/tickRate).  An error stops the loop. */
    std::function<core::Expected<void>(core::f64 dt)> fixedUpdate;

    /** @brief Called once per frame after the fixed updates. */
    std::function<void()> postFrame;
};

/** @brief Fixed time-step game loop. */
class GameLoop
{
public:
    /// @param config Runtime configuration (provides tickRate).
    explicit GameLoop(const Config& config);
    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;

    /**
     * @brief Run in real time until requestStop() is called or a tick fails.
     * @return The first fixedUpdate error, if any.
     */
    [[nodiscard]] core::Expected<void> run(const LoopCallbacks& callbacks);

    /**
     * @brief Run exactly @p count fixed ticks back to back, without pacing.
     * @return The first fixedUpdate error, if any.
     */
    [[nodiscard]] core::Expected<void> runTicks(core::u64 count, const LoopCallbacks& callbacks);

    /** @brief Request graceful loop termination.  Safe from any thread. */
    void requestStop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept;

    /** @brief Total ticks elapsed since the last run. */
    [[nodiscard]] core::u64 tickCount() const noexcept;

    [[nodiscard]] core::f64 fixedDeltaTime() const noexcept { return _fixedDt; }

private:
    [[nodiscard]] core::Expected<void> checkCallbacks(const LoopCallbacks& callbacks) const;

    core::f64         _fixedDt;
    std::atomic<bool> _running{false};
    core::u64         _tickCount{0};
};

} // namespace hive::engine

#endif // HIVE_ENGINE_GAMELOOP_HPP
