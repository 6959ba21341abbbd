/**
 * @file TestWorld.cpp
 * @brief Unit tests for hive::ecs::World registration, storage and queries.
 */

#include <catch2/catch.hpp>

#include <hive/ecs/World.hpp>

#include <algorithm>
#include <array>
#include <set>
#include <vector>

using namespace hive;
using namespace hive::ecs;

namespace {

struct Position { float x{0}; float y{0}; };
struct Velocity { float x{0}; float y{0}; };
struct Tag {};
struct Gravity { float value{-9.81f}; };

std::set<Entity> asSet(const std::vector<Entity> &entities)
{
    return {entities.begin(), entities.end()};
}

} // namespace

TEST_CASE("World rejects duplicate type names", "[ecs][world]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());

    auto again = world.registerComponent<Velocity>("Position");
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kAlreadyExists);

    auto asResource = world.registerResource<Gravity>("Position");
    REQUIRE(asResource.error().code() == core::ErrorCode::kAlreadyExists);
}

TEST_CASE("World stores, replaces and removes components", "[ecs][world]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerComponent<Velocity>("Velocity").has_value());

    const Entity e = *world.createEntity();
    REQUIRE(world.addComponent(e, Position{1, 2}).has_value());
    REQUIRE(world.hasComponent<Position>(e));
    REQUIRE_FALSE(world.hasComponent<Velocity>(e));
    REQUIRE(world.getComponent<Position>(e)->y == 2);

    REQUIRE(world.addComponent(e, Position{5, 6}).has_value());
    REQUIRE(world.getComponent<Position>(e)->x == 5);

    auto removed = world.removeComponent<Position>(e);
    REQUIRE(removed.has_value());
    REQUIRE(*removed);
    REQUIRE(world.getComponent<Position>(e) == nullptr);

    auto missing = world.removeComponent<Position>(e);
    REQUIRE(missing.has_value());
    REQUIRE_FALSE(*missing);
}

TEST_CASE("World component operations check the entity and the type", "[ecs][world]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerResource<Gravity>("Gravity").has_value());

    const Entity e = *world.createEntity();

    SECTION("unregistered type")
    {
        auto added = world.addComponent(e, Velocity{});
        REQUIRE(added.error().code() == core::ErrorCode::kUnknownType);
    }

    SECTION("resource used as a component")
    {
        auto added = world.addComponent(e, Gravity{});
        REQUIRE(added.error().code() == core::ErrorCode::kUnknownType);
    }

    SECTION("dead entity")
    {
        REQUIRE(*world.destroyEntity(e));
        auto added = world.addComponent(e, Position{});
        REQUIRE(added.error().code() == core::ErrorCode::kNotFound);
    }

    SECTION("erased payload of the wrong type")
    {
        const TypeId position = *world.typeId<Position>();
        auto added = world.addComponent(e, position, core::Any{Gravity{}});
        REQUIRE(added.error().code() == core::ErrorCode::kCastFailed);
        REQUIRE_FALSE(world.hasComponent<Position>(e));
    }
}

TEST_CASE("World destroyEntity drops components and ignores stale handles", "[ecs][world]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());

    const Entity e = *world.createEntity();
    REQUIRE(world.addComponent(e, Position{}).has_value());

    REQUIRE(*world.destroyEntity(e));
    REQUIRE_FALSE(world.isAlive(e));
    REQUIRE(world.entitiesWith<Position>().empty());

    auto stale = world.destroyEntity(e);
    REQUIRE(stale.has_value());
    REQUIRE_FALSE(*stale);

    const Entity reused = *world.createEntity();
    REQUIRE(reused.index() == e.index());
    REQUIRE(reused.generation() == 1);
    REQUIRE_FALSE(world.hasComponent<Position>(reused));
    REQUIRE(world.getComponent<Position>(e) == nullptr);
}

TEST_CASE("World resources hold their initial value", "[ecs][world]")
{
    World world;
    REQUIRE(world.registerResource<Gravity>("Gravity", Gravity{-1.5f}).has_value());

    REQUIRE(world.resource<Gravity>()->value == -1.5f);
    world.resource<Gravity>()->value = 3.0f;

    const World &view = world;
    REQUIRE(view.resource<Gravity>()->value == 3.0f);
    REQUIRE(world.resource<Position>() == nullptr);
}

TEST_CASE("World query returns entities owning every requested component", "[ecs][world][query]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerComponent<Velocity>("Velocity").has_value());
    REQUIRE(world.registerComponent<Tag>("Tag").has_value());

    std::vector<Entity> entities;
    for (int i = 0; i < 10; ++i)
        entities.push_back(*world.createEntity());

    std::set<Entity> expected;
    // Velocity goes in first on odd entities so insertion order differs per table.
    for (int i = 0; i < 10; ++i)
    {
        const Entity e = entities[static_cast<std::size_t>(i)];
        if (i % 2 == 1)
            REQUIRE(world.addComponent(e, Velocity{}).has_value());
        if (i % 3 != 0)
            REQUIRE(world.addComponent(e, Position{}).has_value());
        if (i % 2 == 0 && i > 4)
            REQUIRE(world.addComponent(e, Velocity{}).has_value());
        if (i % 4 == 0)
            REQUIRE(world.addComponent(e, Tag{}).has_value());

        const bool both = (i % 2 == 1 || i > 4) && i % 3 != 0;
        if (both)
            expected.insert(e);
    }

    const std::array<TypeId, 2> posVel{*world.typeId<Position>(), *world.typeId<Velocity>()};
    const std::array<TypeId, 2> velPos{*world.typeId<Velocity>(), *world.typeId<Position>()};

    REQUIRE(asSet(world.query(posVel)) == expected);
    REQUIRE(asSet(world.query(velPos)) == expected);
    REQUIRE(asSet(world.entitiesWith<Velocity, Position>()) == expected);
    REQUIRE(world.query(posVel).size() == expected.size());
}

TEST_CASE("World query edge cases", "[ecs][world][query]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerResource<Gravity>("Gravity").has_value());

    const Entity e = *world.createEntity();
    REQUIRE(world.addComponent(e, Position{}).has_value());

    REQUIRE(world.query({}).empty());

    const std::array<TypeId, 1> resource{*world.typeId<Gravity>()};
    REQUIRE(world.query(resource).empty());

    const std::array<TypeId, 2> unknown{*world.typeId<Position>(), 99};
    REQUIRE(world.query(unknown).empty());

    REQUIRE(world.entitiesWith<Position, Velocity>().empty());
    REQUIRE(world.entitiesWith<Position>().size() == 1);
}

TEST_CASE("World system registration errors", "[ecs][world][system]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());
    REQUIRE(world.registerResource<Gravity>("Gravity").has_value());

    auto body = [](SystemContext &) {};

    SECTION("duplicate name")
    {
        REQUIRE(world.system("move").write<Position>().each(body).has_value());
        auto again = world.system("move").read<Position>().each(body);
        REQUIRE(again.error().code() == core::ErrorCode::kAlreadyExists);
        REQUIRE(world.systems().size() == 1);
    }

    SECTION("self-conflicting access")
    {
        auto result = world.system("bad").read<Position>().write<Position>().each(body);
        REQUIRE(result.error().code() == core::ErrorCode::kSelfConflictingAccess);
        REQUIRE(world.systems().empty());
    }

    SECTION("unknown type name")
    {
        auto result = world.system("bad").read("Velocity").each(body);
        REQUIRE(result.error().code() == core::ErrorCode::kUnknownType);
    }

    SECTION("unregistered C++ type")
    {
        auto result = world.system("bad").write<Velocity>().read<Position>().each(body);
        REQUIRE(result.error().code() == core::ErrorCode::kUnknownType);
    }

    SECTION("unknown id through addSystem")
    {
        const std::array<TypeAccess, 1> accesses{TypeAccess{42, TypeKind::Component, AccessMode::ReadOnly}};
        auto result = world.addSystem("raw", accesses, [](SystemContext &) -> core::Expected<void> { return {}; });
        REQUIRE(result.error().code() == core::ErrorCode::kUnknownType);
    }

    SECTION("each without a component")
    {
        auto result = world.system("bad").read<Gravity>().each(body);
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("run with a component")
    {
        auto result = world.system("bad").read<Position>().run(body);
        REQUIRE(result.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("empty name or body")
    {
        REQUIRE(world.system("").write<Position>().each(body).error().code() == core::ErrorCode::kInvalidArgument);
        REQUIRE(world.addSystem("nobody", {}, SystemFn{}).error().code() == core::ErrorCode::kInvalidArgument);
    }
}

TEST_CASE("World system set tracks order and revision", "[ecs][world][system]")
{
    World world;
    REQUIRE(world.registerComponent<Position>("Position").has_value());

    auto body = [](SystemContext &) {};
    REQUIRE(world.systemsRevision() == 0);

    REQUIRE(world.system("a").read("Position").each(body).has_value());
    REQUIRE(world.system("b").write("Position").each(body).has_value());
    REQUIRE(world.system("c").read<Position>().each(body).has_value());
    REQUIRE(world.systemsRevision() == 3);

    REQUIRE(*world.systemIndex("b") == 1);
    REQUIRE(world.systems()[1].access.modeOf(*world.typeId<Position>()) == AccessMode::ReadWrite);

    REQUIRE(world.removeSystem("b").has_value());
    REQUIRE(world.systemsRevision() == 4);
    REQUIRE(world.systems().size() == 2);
    REQUIRE(*world.systemIndex("c") == 1);
    REQUIRE(world.systemIndex("b").error().code() == core::ErrorCode::kNotFound);
    REQUIRE(world.removeSystem("b").error().code() == core::ErrorCode::kNotFound);
}
