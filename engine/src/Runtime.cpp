/**
 * @file Runtime.cpp
 * @brief Runtime façade implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/engine/Runtime.hpp>
#include <hive/engine/GameLoop.hpp>
#include <hive/concurrency/ThreadPool.hpp>
#include <hive/core/Log.hpp>

namespace hive::engine {

struct Runtime::Impl
{
    Config   config;
    GameLoop loop;

    ecs::World         world;
    host::HostBindings host;
    TestRunner         tests;

    std::unique_ptr<concurrency::ThreadPool> threadPool;
    std::unique_ptr<ecs::SystemScheduler>    scheduler;
    ecs::ExecutionPlan                       preview;

    bool initialised{false};

    explicit Impl(Config cfg)
        : config{std::move(cfg)}
        , loop{config}
        , world{config.initialEntityCapacity()}
    {
    }

    [[nodiscard]] core::Expected<void> ready() const
    {
        if (!initialised)
        {
            return core::makeError(core::ErrorCode::kInvalidState, "Runtime is not initialised");
        }
        return {};
    }
};

Runtime::Runtime(Config config)
    : _impl{std::make_unique<Impl>(std::move(config))}
{
}

Runtime::~Runtime()
{
    if (_impl && _impl->initialised)
    {
        shutdown();
    }
}

core::Expected<void> Runtime::init()
{
    if (_impl->initialised)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "Runtime is already initialised");
    }
    HIVE_TRY_VOID(_impl->config.validate());

    core::Log::setMinLevel(_impl->config.logLevel());

    _impl->threadPool = std::make_unique<concurrency::ThreadPool>(_impl->config.workerCount());
    _impl->scheduler  = std::make_unique<ecs::SystemScheduler>(
        *_impl->threadPool,
        ecs::SystemScheduler::Options{_impl->config.commandFlush(), _impl->config.validateBorrows()});

    _impl->initialised = true;
    core::Log::info("Runtime", "initialised: " + std::to_string(_impl->config.tickRate()) + " Hz, " +
                                   std::to_string(_impl->threadPool->threadCount()) + " workers");
    return {};
}

core::Expected<ecs::TickReport> Runtime::tick()
{
    return tick(static_cast<core::f32>(_impl->config.fixedDeltaTime()));
}

core::Expected<ecs::TickReport> Runtime::tick(core::f32 deltaTime)
{
    HIVE_TRY_VOID(_impl->ready());
    return _impl->scheduler->tick(_impl->world, deltaTime);
}

core::Expected<void> Runtime::run(std::function<void()> onFrame)
{
    HIVE_TRY_VOID(_impl->ready());

    LoopCallbacks callbacks;
    callbacks.fixedUpdate = [this](core::f64 dt) -> core::Expected<void> {
        HIVE_TRY_VOID(tick(static_cast<core::f32>(dt)));
        return {};
    };
    callbacks.postFrame = std::move(onFrame);
    return _impl->loop.run(callbacks);
}

core::Expected<void> Runtime::runTicks(core::u64 count)
{
    HIVE_TRY_VOID(_impl->ready());

    LoopCallbacks callbacks;
    callbacks.fixedUpdate = [this](core::f64 dt) -> core::Expected<void> {
        HIVE_TRY_VOID(tick(static_cast<core::f32>(dt)));
        return {};
    };
    return _impl->loop.runTicks(count, callbacks);
}

void Runtime::requestStop() noexcept
{
    _impl->loop.requestStop();
}

TestReport Runtime::runTests()
{
    return _impl->tests.run(_impl->world);
}

void Runtime::shutdown()
{
    core::Log::info("Runtime", "shutting down");
    _impl->loop.requestStop();
    _impl->scheduler.reset();
    if (_impl->threadPool)
    {
        _impl->threadPool->shutdown();
        _impl->threadPool.reset();
    }
    _impl->initialised = false;
}

ecs::World& Runtime::world() noexcept
{
    return _impl->world;
}

host::HostBindings& Runtime::host() noexcept
{
    return _impl->host;
}

TestRunner& Runtime::tests() noexcept
{
    return _impl->tests;
}

const ecs::ExecutionPlan& Runtime::plan()
{
    if (!_impl->scheduler)
    {
        _impl->preview = ecs::ExecutionPlan::build(_impl->world.systems(), _impl->world.systemsRevision());
        return _impl->preview;
    }
    return _impl->scheduler->plan(_impl->world);
}

const Config& Runtime::config() const noexcept
{
    return _impl->config;
}

core::u64 Runtime::tickCount() const noexcept
{
    return _impl->scheduler ? _impl->scheduler->tickCount() : 0;
}

} // namespace hive::engine
