/**
 * @file TestSystemScheduler.cpp
 * @brief Tick execution, wave visibility, failure isolation and borrow checks.
 */

#include <catch2/catch.hpp>

#include <hive/ecs/SystemScheduler.hpp>
#include <hive/ecs/World.hpp>
#include <hive/concurrency/ThreadPool.hpp>

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <vector>

using namespace hive;
using namespace hive::ecs;

namespace {

struct Position { float x{0}; float y{0}; };
struct Velocity { float x{0}; float y{0}; };
struct Marker   { int value{0}; };
struct Time     { float delta{0}; };
struct Counter  { int value{0}; };

} // namespace

TEST_CASE("Scheduler tick updates a resource written by a system", "[ecs][scheduler]")
{
    World world;
    REQUIRE(world.registerResource<Time>("Time").has_value());
    REQUIRE(world.system("S1").write<Time>().run([](SystemContext &ctx) {
        ctx.write<Time>()->delta = 0.016f;
    }).has_value());

    concurrency::ThreadPool pool{2};
    SystemScheduler scheduler{pool};

    auto report = scheduler.tick(world, 0.016f);
    REQUIRE(report.has_value());
    REQUIRE(report->ok());
    REQUIRE(report->invocations == 1);
    REQUIRE(world.resource<Time>()->delta == 0.016f);
}

TEST_CASE("Scheduler tick moves an entity by its velocity", "[ecs][scheduler]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerComponent<Velocity>("Velocity").has_value());

    const Entity e = *world.createEntity();
    REQUIRE(world.addComponent(e, Position{0, 0}).has_value());
    REQUIRE(world.addComponent(e, Velocity{1, 0}).has_value());

    REQUIRE(world.system("move").write<Position>().read<Velocity>().each([](SystemContext &ctx) {
        ctx.write<Position>()->x += ctx.read<Velocity>()->x;
    }).has_value());

    concurrency::ThreadPool pool{2};
    SystemScheduler scheduler{pool};

    REQUIRE(scheduler.tick(world, 1.0f).has_value());
    REQUIRE(world.getComponent<Position>(e)->x == 1);
    REQUIRE(scheduler.tickCount() == 1);
}

TEST_CASE("Scheduler runs every matching entity exactly once", "[ecs][scheduler]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerComponent<Velocity>("Velocity").has_value());
    REQUIRE(world.registerComponent<Marker>("Marker").has_value());

    std::vector<Entity> entities;
    for (int i = 0; i < 500; ++i)
    {
        const Entity e = *world.createEntity();
        REQUIRE(world.addComponent(e, Position{}).has_value());
        REQUIRE(world.addComponent(e, Velocity{static_cast<float>(i), 0}).has_value());
        REQUIRE(world.addComponent(e, Marker{}).has_value());
        entities.push_back(e);
    }

    // Disjoint writers share a wave and run on different workers.
    REQUIRE(world.system("move").write<Position>().read<Velocity>().each([](SystemContext &ctx) {
        ctx.write<Position>()->x += ctx.read<Velocity>()->x;
    }).has_value());
    REQUIRE(world.system("mark").write<Marker>().each([](SystemContext &ctx) {
        ++ctx.write<Marker>()->value;
    }).has_value());

    concurrency::ThreadPool pool{4};
    SystemScheduler scheduler{pool};
    REQUIRE(scheduler.plan(world).waveCount() == 1);

    for (int t = 0; t < 3; ++t)
    {
        auto report = scheduler.tick(world, 0.0f);
        REQUIRE(report.has_value());
        REQUIRE(report->waves == 1);
        REQUIRE(report->invocations == 1000);
    }

    for (std::size_t i = 0; i < entities.size(); ++i)
    {
        REQUIRE(world.getComponent<Position>(entities[i])->x == 3.0f * static_cast<float>(i));
        REQUIRE(world.getComponent<Marker>(entities[i])->value == 3);
    }
}

TEST_CASE("Scheduler structural changes become visible in the next wave", "[ecs][scheduler][commands]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerComponent<Marker>("Marker").has_value());
    REQUIRE(world.registerResource<Counter>("Seen").has_value());

    const Entity e = *world.createEntity();
    REQUIRE(world.addComponent(e, Position{}).has_value());

    std::atomic<int> sameWaveSeen{0};

    // Wave 0: "spawn" adds Marker; "peek" reads Marker in the same wave.
    REQUIRE(world.system("spawn").read<Position>().each([](SystemContext &ctx) {
        ctx.commands().addComponent(ctx.entity(), Marker{7});
        const PendingEntity fresh = ctx.commands().createEntity();
        ctx.commands().addComponent(fresh, Marker{1});
    }).has_value());
    REQUIRE(world.system("peek").read<Marker>().each([&sameWaveSeen](SystemContext &) {
        ++sameWaveSeen;
    }).has_value());
    // Wave 1: conflicts with "peek" on Marker, so it sees the flushed commands.
    REQUIRE(world.system("count").write<Marker>().write<Counter>().each([](SystemContext &ctx) {
        ++ctx.write<Counter>()->value;
    }).has_value());

    concurrency::ThreadPool pool{2};
    SystemScheduler scheduler{pool};

    const ExecutionPlan &plan = scheduler.plan(world);
    REQUIRE(plan.waveCount() == 2);
    REQUIRE(plan.waveOf(0) == 0u);
    REQUIRE(plan.waveOf(1) == 0u);
    REQUIRE(plan.waveOf(2) == 1u);

    auto report = scheduler.tick(world, 0.0f);
    REQUIRE(report.has_value());
    REQUIRE(sameWaveSeen == 0);
    REQUIRE(world.resource<Counter>()->value == 2);
    REQUIRE(report->created.size() == 1);
    REQUIRE(report->commandsApplied == 3);
    REQUIRE(world.getComponent<Marker>(e)->value == 7);
}

TEST_CASE("Scheduler PerFrame flush holds commands until the tick ends", "[ecs][scheduler][commands]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerComponent<Marker>("Marker").has_value());

    const Entity e = *world.createEntity();
    REQUIRE(world.addComponent(e, Position{}).has_value());

    std::atomic<int> laterWaveSeen{0};
    REQUIRE(world.system("tag").write<Position>().each([](SystemContext &ctx) {
        ctx.commands().addComponent(ctx.entity(), Marker{});
    }).has_value());
    REQUIRE(world.system("after").write<Position>().read<Marker>().each([&laterWaveSeen](SystemContext &) {
        ++laterWaveSeen;
    }).has_value());

    concurrency::ThreadPool pool{2};
    SystemScheduler scheduler{pool, SystemScheduler::Options{CommandFlush::PerFrame, true}};

    REQUIRE(scheduler.tick(world, 0.0f).has_value());
    REQUIRE(laterWaveSeen == 0);
    REQUIRE(world.hasComponent<Marker>(e));

    REQUIRE(scheduler.tick(world, 0.0f).has_value());
    REQUIRE(laterWaveSeen == 1);
}

TEST_CASE("Scheduler readers in one wave observe the same resource value", "[ecs][scheduler]")
{
    World world;
    REQUIRE(world.registerComponent<Marker>("Marker").has_value());
    REQUIRE(world.registerResource<Counter>("Counter", Counter{41}).has_value());

    for (int i = 0; i < 64; ++i)
    {
        const Entity e = *world.createEntity();
        REQUIRE(world.addComponent(e, Marker{}).has_value());
    }

    std::mutex mutex;
    std::set<int> observed;
    auto reader = [&](SystemContext &ctx) {
        const int value = ctx.read<Counter>()->value;
        std::lock_guard<std::mutex> lock{mutex};
        observed.insert(value);
    };

    REQUIRE(world.system("r0").read<Marker>().read<Counter>().each(reader).has_value());
    REQUIRE(world.system("r1").read<Marker>().read<Counter>().each(reader).has_value());
    REQUIRE(world.system("r2").read<Counter>().run(reader).has_value());
    REQUIRE(world.system("bump").write<Counter>().run([](SystemContext &ctx) {
        ++ctx.write<Counter>()->value;
    }).has_value());

    concurrency::ThreadPool pool{4};
    SystemScheduler scheduler{pool};
    REQUIRE(scheduler.plan(world).waveCount() == 2);

    REQUIRE(scheduler.tick(world, 0.0f).has_value());
    REQUIRE(observed == std::set<int>{41});
    REQUIRE(world.resource<Counter>()->value == 42);
}

TEST_CASE("Scheduler isolates per-entity failures", "[ecs][scheduler][errors]")
{
    World world;
    REQUIRE(world.registerComponent<Marker>("Marker").has_value());

    std::vector<Entity> entities;
    for (int i = 0; i < 5; ++i)
    {
        const Entity e = *world.createEntity();
        REQUIRE(world.addComponent(e, Marker{i}).has_value());
        entities.push_back(e);
    }

    REQUIRE(world.system("flaky").write<Marker>().each([](SystemContext &ctx) -> core::Expected<void> {
        Marker *marker = ctx.write<Marker>();
        if (marker->value == 2)
        {
            return core::makeError(core::ErrorCode::kSystemFailed, "entity 2 is broken");
        }
        marker->value += 100;
        return {};
    }).has_value());

    concurrency::ThreadPool pool{2};
    SystemScheduler scheduler{pool};

    auto report = scheduler.tick(world, 0.0f);
    REQUIRE(report.has_value());
    REQUIRE_FALSE(report->ok());
    REQUIRE(report->failures.size() == 1);
    REQUIRE(report->failures[0].system == "flaky");
    REQUIRE(report->failures[0].entity == entities[2]);
    REQUIRE_FALSE(report->failures[0].fatal);
    REQUIRE(report->invocations == 5);

    REQUIRE(world.getComponent<Marker>(entities[1])->value == 101);
    REQUIRE(world.getComponent<Marker>(entities[2])->value == 2);
    REQUIRE(world.getComponent<Marker>(entities[4])->value == 104);
}

TEST_CASE("Scheduler stops a system on a fatal error or exception", "[ecs][scheduler][errors]")
{
    World world;
    REQUIRE(world.registerComponent<Marker>("Marker").has_value());
    REQUIRE(world.registerComponent<Position>("Position").has_value());

    for (int i = 0; i < 4; ++i)
    {
        const Entity e = *world.createEntity();
        REQUIRE(world.addComponent(e, Marker{}).has_value());
        REQUIRE(world.addComponent(e, Position{}).has_value());
    }

    std::atomic<int> fatalCalls{0};
    std::atomic<int> throwCalls{0};
    std::atomic<int> healthyCalls{0};

    REQUIRE(world.system("fatal").write<Marker>().each([&fatalCalls](SystemContext &) -> core::Expected<void> {
        ++fatalCalls;
        return core::makeError(core::ErrorCode::kSystemFatal, "give up");
    }).has_value());
    REQUIRE(world.system("thrower").read<Marker>().read<Position>().each([&throwCalls](SystemContext &) {
        ++throwCalls;
        throw std::runtime_error{"boom"};
    }).has_value());
    REQUIRE(world.system("healthy").write<Position>().each([&healthyCalls](SystemContext &) {
        ++healthyCalls;
    }).has_value());

    concurrency::ThreadPool pool{2};
    SystemScheduler scheduler{pool};

    auto report = scheduler.tick(world, 0.0f);
    REQUIRE(report.has_value());
    REQUIRE(fatalCalls == 1);
    REQUIRE(throwCalls == 1);
    REQUIRE(healthyCalls == 4);
    REQUIRE(report->failures.size() == 2);
    for (const SystemFailure &failure : report->failures)
    {
        REQUIRE(failure.fatal);
        REQUIRE(failure.error.code() == core::ErrorCode::kSystemFatal);
    }
}

TEST_CASE("Scheduler reports a thrown non-standard value as fatal", "[ecs][scheduler][errors]")
{
    World world;
    REQUIRE(world.registerComponent<Marker>("Marker").has_value());
    REQUIRE(world.registerComponent<Position>("Position").has_value());

    for (int i = 0; i < 3; ++i)
    {
        const Entity e = *world.createEntity();
        REQUIRE(world.addComponent(e, Marker{}).has_value());
        REQUIRE(world.addComponent(e, Position{}).has_value());
    }

    std::atomic<int> throwCalls{0};
    std::atomic<int> otherCalls{0};

    REQUIRE(world.system("thrower").write<Marker>().each([&throwCalls](SystemContext &) {
        ++throwCalls;
        throw 42;
    }).has_value());

    SECTION("alongside another system in the same wave")
    {
        REQUIRE(world.system("other").write<Position>().each([&otherCalls](SystemContext &) {
            ++otherCalls;
        }).has_value());
    }
    SECTION("alone in its wave")
    {
    }

    concurrency::ThreadPool pool{2};
    SystemScheduler scheduler{pool};

    auto report = scheduler.tick(world, 0.0f);
    REQUIRE(report.has_value());
    REQUIRE(scheduler.plan(world).waveCount() == 1);
    REQUIRE(throwCalls == 1);
    REQUIRE(otherCalls == (world.systems().size() == 2 ? 3 : 0));
    REQUIRE(report->failures.size() == 1);
    REQUIRE(report->failures[0].system == "thrower");
    REQUIRE(report->failures[0].fatal);
    REQUIRE(report->failures[0].error.code() == core::ErrorCode::kSystemFatal);
}

TEST_CASE("Scheduler aborts the tick on undeclared access", "[ecs][scheduler][errors]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerComponent<Velocity>("Velocity").has_value());
    REQUIRE(world.registerComponent<Marker>("Marker").has_value());

    const Entity e = *world.createEntity();
    REQUIRE(world.addComponent(e, Position{}).has_value());
    REQUIRE(world.addComponent(e, Velocity{}).has_value());

    bool gotNull = false;

    SECTION("type never declared")
    {
        REQUIRE(world.system("sneaky").read<Position>().each([&gotNull](SystemContext &ctx) {
            gotNull = ctx.write<Velocity>() == nullptr;
            ctx.commands().addComponent(ctx.entity(), Marker{});
        }).has_value());
    }

    SECTION("write to a read-only type")
    {
        REQUIRE(world.system("sneaky").read<Position>().each([&gotNull](SystemContext &ctx) {
            gotNull = ctx.write<Position>() == nullptr;
            ctx.commands().addComponent(ctx.entity(), Marker{});
        }).has_value());
    }

    concurrency::ThreadPool pool{2};
    SystemScheduler scheduler{pool};

    auto report = scheduler.tick(world, 0.0f);
    REQUIRE_FALSE(report.has_value());
    REQUIRE(report.error().code() == core::ErrorCode::kAccessViolation);
    REQUIRE(gotNull);
    REQUIRE_FALSE(world.hasComponent<Marker>(e));
    REQUIRE_FALSE(world.inTick());

    // The scheduler stays usable after an aborted tick.
    REQUIRE(world.createEntity().has_value());
}

TEST_CASE("Scheduler runtime borrow check rejects a conflicting explicit plan", "[ecs][scheduler][errors]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerComponent<Marker>("Marker").has_value());

    const Entity e = *world.createEntity();
    REQUIRE(world.addComponent(e, Position{}).has_value());

    auto writer = [](SystemContext &ctx) {
        ctx.write<Position>()->x += 1;
        ctx.commands().addComponent(ctx.entity(), Marker{});
    };
    REQUIRE(world.system("w0").write<Position>().each(writer).has_value());
    REQUIRE(world.system("w1").write<Position>().each(writer).has_value());

    const ExecutionPlan broken{std::vector<Wave>{Wave{{0, 1}}}};

    SECTION("runtime check")
    {
        concurrency::ThreadPool pool{2};
        SystemScheduler scheduler{pool};

        auto report = scheduler.execute(world, broken, 0.0f);
        REQUIRE(report.error().code() == core::ErrorCode::kAccessViolation);
        REQUIRE(world.getComponent<Position>(e)->x == 1);
        REQUIRE_FALSE(world.hasComponent<Marker>(e));
    }

    SECTION("static check")
    {
        concurrency::ThreadPool pool{2};
        SystemScheduler scheduler{pool, SystemScheduler::Options{CommandFlush::PerWave, false}};

        auto report = scheduler.execute(world, broken, 0.0f);
        REQUIRE(report.error().code() == core::ErrorCode::kAccessViolation);
        REQUIRE(world.getComponent<Position>(e)->x == 0);
    }
}

TEST_CASE("Scheduler rejects a plan that does not cover every system", "[ecs][scheduler][errors]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.system("a").read<Position>().each([](SystemContext &) {}).has_value());
    REQUIRE(world.system("b").read<Position>().each([](SystemContext &) {}).has_value());

    concurrency::ThreadPool pool{1};
    SystemScheduler scheduler{pool};

    auto report = scheduler.execute(world, ExecutionPlan{std::vector<Wave>{Wave{{1}}}}, 0.0f);
    REQUIRE(report.error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(scheduler.tickCount() == 0);
}

TEST_CASE("Scheduler blocks host mutation while a tick runs", "[ecs][scheduler]")
{
    World world;
    REQUIRE(world.registerResource<Counter>("Counter").has_value());

    std::vector<core::ErrorCode> codes;
    REQUIRE(world.system("host").write<Counter>().run([&](SystemContext &) {
        codes.push_back(world.createEntity().error().code());
        codes.push_back(world.removeSystem("host").error().code());
        CommandBuffer commands = world.makeCommandBuffer();
        codes.push_back(world.apply(commands).error().code());
        REQUIRE(world.inTick());
    }).has_value());

    concurrency::ThreadPool pool{1};
    SystemScheduler scheduler{pool};

    REQUIRE(scheduler.tick(world, 0.0f).has_value());
    REQUIRE(codes == std::vector<core::ErrorCode>(3, core::ErrorCode::kInvalidState));
    REQUIRE_FALSE(world.inTick());
    REQUIRE(world.createEntity().has_value());
}

TEST_CASE("Scheduler caches the plan until the system set changes", "[ecs][scheduler]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.system("a").write<Position>().each([](SystemContext &) {}).has_value());

    concurrency::ThreadPool pool{2};
    SystemScheduler scheduler{pool};

    REQUIRE(scheduler.tick(world, 0.0f).has_value());
    REQUIRE(scheduler.tick(world, 0.0f).has_value());
    REQUIRE(scheduler.planBuilds() == 1);

    REQUIRE(world.system("b").write<Position>().each([](SystemContext &) {}).has_value());
    auto report = scheduler.tick(world, 0.0f);
    REQUIRE(report.has_value());
    REQUIRE(report->waves == 2);
    REQUIRE(scheduler.planBuilds() == 2);
    REQUIRE(report->tick == 2);
    REQUIRE(scheduler.tickCount() == 3);
}
