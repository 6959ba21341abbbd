/**
 * @file GameLoop.cpp
 * @brief GameLoop implementation, fixed time-step with accumulator.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/engine/GameLoop.hpp>
#include <hive/core/Log.hpp>

#include <chrono>
#include <thread>

namespace hive::engine {

GameLoop::GameLoop(const Config& config)
    : _fixedDt{config.tickRate() > 0 ? config.fixedDeltaTime() : 0.0}
{
}

GameLoop::~GameLoop() = default;

core::Expected<void> GameLoop::checkCallbacks(const LoopCallbacks& callbacks) const
{
    if (_fixedDt <= 0.0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "GameLoop needs a tick rate above zero");
    }
    if (!callbacks.fixedUpdate)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "GameLoop needs a fixedUpdate callback");
    }
    return {};
}

core::Expected<void> GameLoop::run(const LoopCallbacks& callbacks)
{
    HIVE_TRY_VOID(checkCallbacks(callbacks));
    _running.store(true);
    _tickCount = 0;

    using Clock = std::chrono::steady_clock;
    auto previous = Clock::now();
    core::f64 accumulator = 0.0;

    while (_running.load())
    {
        const auto current = Clock::now();
        core::f64 frameTime = std::chrono::duration<core::f64>(current - previous).count();
        previous = current;

        constexpr core::f64 kMaxFrameTime = 0.25;
        if (frameTime > kMaxFrameTime)
        {
            frameTime = kMaxFrameTime;
        }

        accumulator += frameTime;

        while (accumulator >= _fixedDt && _running.load())
        {
            auto stepped = callbacks.fixedUpdate(_fixedDt);
            if (!stepped)
            {
                _running.store(false);
                core::Log::error("Runtime", "GameLoop: stopped on tick " + std::to_string(_tickCount) + ": " +
                                                stepped.error().format());
                return stepped;
            }
            accumulator -= _fixedDt;
            ++_tickCount;
        }

        if (callbacks.postFrame)
        {
            callbacks.postFrame();
        }

        if (accumulator < _fixedDt)
        {
            std::this_thread::sleep_for(std::chrono::duration<core::f64>(_fixedDt - accumulator));
        }
    }

    core::Log::info("Runtime", "GameLoop: stopped");
    return {};
}

core::Expected<void> GameLoop::runTicks(core::u64 count, const LoopCallbacks& callbacks)
{
    HIVE_TRY_VOID(checkCallbacks(callbacks));
    _running.store(true);
    _tickCount = 0;

    while (_tickCount < count && _running.load())
    {
        auto stepped = callbacks.fixedUpdate(_fixedDt);
        if (!stepped)
        {
            _running.store(false);
            return stepped;
        }
        ++_tickCount;

        if (callbacks.postFrame)
        {
            callbacks.postFrame();
        }
    }

    _running.store(false);
    return {};
}

void GameLoop::requestStop() noexcept
{
    _running.store(false);
}

bool GameLoop::isRunning() const noexcept
{
    return _running.load();
}

core::u64 GameLoop::tickCount() const noexcept
{
    return _tickCount;
}

} // namespace hive::engine
