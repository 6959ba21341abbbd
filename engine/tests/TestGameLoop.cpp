/**
 * @file TestGameLoop.cpp
 * @brief Unit tests for the fixed-step loop and the runtime configuration.
 */

#include <catch2/catch.hpp>

#include <hive/engine/Config.hpp>
#include <hive/engine/GameLoop.hpp>

using namespace hive;
using namespace hive::engine;

TEST_CASE("Config builder carries every setting", "[engine][config]")
{
    const Config config = Config::Builder{}
                              .tickRate(30)
                              .workerCount(3)
                              .initialEntityCapacity(64)
                              .commandFlush(ecs::CommandFlush::PerFrame)
                              .validateBorrows(false)
                              .logLevel(core::LogLevel::kWarn)
                              .build();

    REQUIRE(config.tickRate() == 30);
    REQUIRE(config.workerCount() == 3);
    REQUIRE(config.initialEntityCapacity() == 64);
    REQUIRE(config.commandFlush() == ecs::CommandFlush::PerFrame);
    REQUIRE_FALSE(config.validateBorrows());
    REQUIRE(config.logLevel() == core::LogLevel::kWarn);
    REQUIRE(config.fixedDeltaTime() == 1.0 / 30.0);
    REQUIRE(config.validate().has_value());
}

TEST_CASE("Config defaults to 60 Hz", "[engine][config]")
{
    const Config config = Config::Builder{}.build();
    REQUIRE(config.tickRate() == 60);
    REQUIRE(config.commandFlush() == ecs::CommandFlush::PerWave);
    REQUIRE(config.validateBorrows());
}

TEST_CASE("Config::validate rejects zero values", "[engine][config]")
{
    REQUIRE(Config::Builder{}.tickRate(0).build().validate().error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(Config::Builder{}.initialEntityCapacity(0).build().validate().error().code() ==
            core::ErrorCode::kInvalidArgument);
}

TEST_CASE("GameLoop runTicks steps exactly the requested count", "[engine][loop]")
{
    GameLoop loop{Config::Builder{}.tickRate(50).build()};

    int updates = 0;
    int frames  = 0;
    double total = 0.0;

    LoopCallbacks callbacks;
    callbacks.fixedUpdate = [&](core::f64 dt) -> core::Expected<void> {
        ++updates;
        total += dt;
        return {};
    };
    callbacks.postFrame = [&frames]() { ++frames; };

    REQUIRE(loop.runTicks(10, callbacks).has_value());
    REQUIRE(updates == 10);
    REQUIRE(frames == 10);
    REQUIRE(loop.tickCount() == 10);
    REQUIRE(loop.fixedDeltaTime() == 0.02);
    REQUIRE_FALSE(loop.isRunning());
    REQUIRE(total > 0.19);
    REQUIRE(total < 0.21);
}

TEST_CASE("GameLoop stops on the first failing tick", "[engine][loop]")
{
    GameLoop loop{Config::Builder{}.build()};

    LoopCallbacks callbacks;
    callbacks.fixedUpdate = [&loop](core::f64) -> core::Expected<void> {
        if (loop.tickCount() == 3)
        {
            return core::makeError(core::ErrorCode::kAccessViolation, "bad wave");
        }
        return {};
    };

    auto result = loop.runTicks(100, callbacks);
    REQUIRE(result.error().code() == core::ErrorCode::kAccessViolation);
    REQUIRE(loop.tickCount() == 3);
    REQUIRE_FALSE(loop.isRunning());
}

TEST_CASE("GameLoop run returns once a stop is requested", "[engine][loop]")
{
    GameLoop loop{Config::Builder{}.tickRate(1000).build()};

    int updates = 0;
    LoopCallbacks callbacks;
    callbacks.fixedUpdate = [&](core::f64) -> core::Expected<void> {
        if (++updates == 5)
        {
            loop.requestStop();
        }
        return {};
    };

    REQUIRE(loop.run(callbacks).has_value());
    REQUIRE(updates == 5);
    REQUIRE(loop.tickCount() == 5);
    REQUIRE_FALSE(loop.isRunning());
}

TEST_CASE("GameLoop rejects missing callbacks and a zero tick rate", "[engine][loop]")
{
    GameLoop loop{Config::Builder{}.build()};
    REQUIRE(loop.runTicks(1, LoopCallbacks{}).error().code() == core::ErrorCode::kInvalidArgument);

    GameLoop stalled{Config::Builder{}.tickRate(0).build()};
    LoopCallbacks callbacks;
    callbacks.fixedUpdate = [](core::f64) -> core::Expected<void> { return {}; };
    REQUIRE(stalled.run(callbacks).error().code() == core::ErrorCode::kInvalidArgument);
}
