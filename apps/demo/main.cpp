/**
 * @file main.cpp
 * @brief Hive demo: falling bodies, respawned through command buffers.
 *
 * Usage: hive_demo [ticks]
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/engine/Config.hpp>
#include <hive/engine/Runtime.hpp>
#include <hive/engine/TestRunner.hpp>
#include <hive/ecs/World.hpp>
#include <hive/host/HostBindings.hpp>
#include <hive/core/Log.hpp>
#include <hive/core/Types.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

using namespace hive;

namespace {

struct Position { core::f32 x{0}; core::f32 y{0}; };
struct Velocity { core::f32 x{0}; core::f32 y{0}; };
struct Gravity  { core::f32 y{-9.81f}; };
struct Time     { core::f32 delta{0}; core::f64 elapsed{0}; };
struct Stats    { core::u32 respawns{0}; };

constexpr core::f32 kFloor = -20.0f;

core::Expected<void> registerTypes(ecs::World& world)
{
    HIVE_TRY_VOID(world.registerComponent<Position>("Position"));
    HIVE_TRY_VOID(world.registerComponent<Velocity>("Velocity"));
    HIVE_TRY_VOID(world.registerResource<Gravity>("Gravity"));
    HIVE_TRY_VOID(world.registerResource<Time>("Time"));
    HIVE_TRY_VOID(world.registerResource<Stats>("Stats"));
    return {};
}

core::Expected<void> registerSystems(ecs::World& world, const host::BoundFunction& clamp)
{
    HIVE_TRY_VOID(world.system("clock").write<Time>().run([](ecs::SystemContext& ctx) {
        Time* time = ctx.write<Time>();
        time->delta = ctx.deltaTime();
        time->elapsed += ctx.deltaTime();
    }));

    HIVE_TRY_VOID(world.system("gravity").write<Velocity>().read<Gravity>().read<Time>().each(
        [clamp](ecs::SystemContext& ctx) -> core::Expected<void> {
            Velocity*      vel     = ctx.write<Velocity>();
            const Gravity* gravity = ctx.read<Gravity>();
            const Time*    time    = ctx.read<Time>();

            core::Any args[] = {core::Any{static_cast<core::f64>(vel->y + gravity->y * time->delta)},
                                core::Any{-50.0}, core::Any{50.0}};
            core::Any clamped = HIVE_TRY(clamp.call(args));
            vel->y = static_cast<core::f32>(*HIVE_TRY(clamped.cast<core::f64>()));
            return {};
        }));

    HIVE_TRY_VOID(world.system("move").write<Position>().read<Velocity>().read<Time>().each(
        [](ecs::SystemContext& ctx) {
            Position*       pos  = ctx.write<Position>();
            const Velocity* vel  = ctx.read<Velocity>();
            const Time*     time = ctx.read<Time>();
            pos->x += vel->x * time->delta;
            pos->y += vel->y * time->delta;
        }));

    // Bodies that fell through the floor are replaced by a fresh one.
    HIVE_TRY_VOID(world.system("respawn").read<Position>().write<Stats>().each([](ecs::SystemContext& ctx) {
        if (ctx.read<Position>()->y > kFloor)
        {
            return;
        }
        ecs::CommandBuffer& cmds = ctx.commands();
        cmds.destroyEntity(ctx.entity());
        const ecs::PendingEntity fresh = cmds.createEntity();
        cmds.addComponent(fresh, Position{0.0f, 10.0f});
        cmds.addComponent(fresh, Velocity{1.0f, 0.0f});
        ++ctx.write<Stats>()->respawns;
    }));

    return {};
}

core::Expected<void> registerTests(engine::TestRunner& tests)
{
    HIVE_TRY_VOID(tests.add("bodies stay above the floor", [](ecs::World& world) -> core::Expected<void> {
        for (ecs::Entity e : world.entitiesWith<Position>())
        {
            HIVE_TRY_VOID(engine::expect(world.getComponent<Position>(e)->y >= kFloor - 1.0f, "body below floor"));
        }
        return {};
    }));

    HIVE_TRY_VOID(tests.add("clock advanced", [](ecs::World& world) {
        return engine::expect(world.resource<Time>()->elapsed > 0.0, "Time.elapsed did not advance");
    }));
    return {};
}

} // namespace

int main(int argc, char** argv)
{
    const core::u64 ticks = argc > 1 ? std::strtoull(argv[1], nullptr, 10) : 600;

    engine::Runtime runtime{engine::Config::Builder{}.tickRate(60).logLevel(core::LogLevel::kInfo).build()};

    auto setup = [&]() -> core::Expected<void> {
        HIVE_TRY_VOID(runtime.host().define("math", "clamp",
            std::function<core::f64(core::f64, core::f64, core::f64)>(
                [](core::f64 v, core::f64 lo, core::f64 hi) { return v < lo ? lo : (v > hi ? hi : v); })));
        const host::BoundFunction clamp = HIVE_TRY(runtime.host().bind(
            host::ExternDecl{"math", "clamp", {{host::ValueKind::Float, host::ValueKind::Float, host::ValueKind::Float},
                                               host::ValueKind::Float}}));

        ecs::World& world = runtime.world();
        HIVE_TRY_VOID(registerTypes(world));
        HIVE_TRY_VOID(registerSystems(world, clamp));
        HIVE_TRY_VOID(registerTests(runtime.tests()));

        for (int i = 0; i < 16; ++i)
        {
            const ecs::Entity body = HIVE_TRY(world.createEntity());
            HIVE_TRY_VOID(world.addComponent(body, Position{static_cast<core::f32>(i), 10.0f + static_cast<core::f32>(i)}));
            HIVE_TRY_VOID(world.addComponent(body, Velocity{1.0f, 0.0f}));
        }

        HIVE_TRY_VOID(runtime.init());
        return {};
    };

    if (auto ready = setup(); !ready)
    {
        core::Log::fatal("Demo", ready.error().format());
        return EXIT_FAILURE;
    }

    std::printf("%s", runtime.plan().describe(runtime.world().systems()).c_str());

    if (auto ran = runtime.runTicks(ticks); !ran)
    {
        core::Log::fatal("Demo", ran.error().format());
        return EXIT_FAILURE;
    }

    const Stats* stats = runtime.world().resource<Stats>();
    std::printf("  %-24s %10llu\n", "ticks", static_cast<unsigned long long>(runtime.tickCount()));
    std::printf("  %-24s %10u\n", "entities", runtime.world().entityCount());
    std::printf("  %-24s %10u\n", "respawns", stats->respawns);

    const engine::TestReport report = runtime.runTests();
    return report.passed() ? EXIT_SUCCESS : EXIT_FAILURE;
}
