/**
 * @file World.hpp
 * @brief Owns entities, component tables, resources and registered systems.
 *
 * Host code mutates the world directly between ticks.  During a tick the
 * world is only reachable through SystemContext, and structural changes are
 * funnelled through CommandBuffer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_WORLD_HPP
    #define HIVE_ECS_WORLD_HPP

#include <hive/ecs/Access.hpp>
#include <hive/ecs/CommandBuffer.hpp>
#include <hive/ecs/Component.hpp>
#include <hive/ecs/Entity.hpp>
#include <hive/ecs/EntityRegistry.hpp>
#include <hive/ecs/Storage.hpp>
#include <hive/ecs/System.hpp>
#include <hive/ecs/TypeRegistry.hpp>
#include <hive/core/Constants.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/NonCopyable.hpp>
#include <hive/core/Types.hpp>

#include <array>
#include <atomic>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace hive::ecs {

class SystemScheduler;
class SystemBuilder;

/**
 * @struct ApplyStats
 * @brief Outcome of applying one command buffer.
 */
struct ApplyStats
{
    core::u32           applied{0};
    core::u32           ignored{0};
    std::vector<Entity> created;
};

/**
 * @class World
 * @brief The ECS container.
 *
 * Component and resource names share one namespace.  Every type must be
 * registered before it is used in a system declaration or a command.
 */
class World final : public core::NonCopyable<World>
{
public:
    explicit World(core::u32 initialEntityCapacity = core::kInitialEntityCapacity);
    ~World();

    // ===== Type registration ===== //

    template <typename T>
    core::Expected<TypeId> registerComponent(std::string name)
    {
        static_assert(std::is_move_constructible_v<T>, "components must be movable");
        auto id = _types.add(std::move(name), TypeKind::Component, typeid(T), sizeof(T), alignof(T));
        if (!id)
        {
            return id;
        }
        install(*id, std::make_unique<ComponentStorage<T>>(*id, _initialCapacity));
        return id;
    }

    template <typename T>
    core::Expected<TypeId> registerResource(std::string name, T initial = T{})
    {
        auto id = _types.add(std::move(name), TypeKind::Resource, typeid(T), sizeof(T), alignof(T));
        if (!id)
        {
            return id;
        }
        install(*id, std::make_unique<ResourceSlot<T>>(*id, std::move(initial)));
        return id;
    }

    template <typename T>
    [[nodiscard]] core::Expected<TypeId> typeId() const
    {
        return _types.find(typeid(T));
    }

    [[nodiscard]] core::Expected<TypeId> typeId(std::string_view name) const { return _types.find(name); }

    [[nodiscard]] const TypeRegistry &types() const noexcept { return _types; }

    // ===== Entities ===== //

    /**
     * @brief Creates an entity with no components.
     * @return kInvalidState while a tick is running.
     */
    [[nodiscard]] core::Expected<Entity> createEntity();

    /** @brief Destroys an entity and drops its components.  False if stale. */
    [[nodiscard]] core::Expected<bool> destroyEntity(Entity entity);

    [[nodiscard]] bool      isAlive(Entity entity) const noexcept { return _entities.isAlive(entity); }
    [[nodiscard]] core::u32 entityCount() const noexcept { return _entities.liveCount(); }

    // ===== Components ===== //

    template <typename T>
    core::Expected<void> addComponent(Entity entity, T value)
    {
        HIVE_TRY_VOID(checkMutable(entity));
        auto id = typeId<T>();
        if (!id)
        {
            return std::unexpected(std::move(id.error()));
        }
        auto *table = static_cast<ComponentStorage<T> *>(componentStorage(*id));
        if (table == nullptr)
        {
            return core::makeError(core::ErrorCode::kUnknownType,
                                   "'" + _types.info(*id).name + "' is a resource, not a component");
        }
        table->insert(entity.index(), std::move(value));
        return {};
    }

    core::Expected<void> addComponent(Entity entity, TypeId type, core::Any value);

    template <typename T>
    core::Expected<bool> removeComponent(Entity entity)
    {
        auto id = typeId<T>();
        if (!id)
        {
            return std::unexpected(std::move(id.error()));
        }
        return removeComponent(entity, *id);
    }

    core::Expected<bool> removeComponent(Entity entity, TypeId type);

    template <typename T>
    [[nodiscard]] const T *getComponent(Entity entity) const
    {
        return static_cast<const T *>(componentRaw(typeid(T), entity));
    }

    template <typename T>
    [[nodiscard]] T *getComponent(Entity entity)
    {
        return static_cast<T *>(const_cast<void *>(componentRaw(typeid(T), entity)));
    }

    template <typename T>
    [[nodiscard]] bool hasComponent(Entity entity) const
    {
        return componentRaw(typeid(T), entity) != nullptr;
    }

    // ===== Resources ===== //

    template <typename T>
    [[nodiscard]] T *resource()
    {
        return static_cast<T *>(const_cast<void *>(resourceRaw(typeid(T))));
    }

    template <typename T>
    [[nodiscard]] const T *resource() const
    {
        return static_cast<const T *>(resourceRaw(typeid(T)));
    }

    // ===== Queries ===== //

    /**
     * @brief Live entities holding every component in @p types.
     *
     * The smallest table drives the scan; the result follows its dense order.
     * An empty list, an unknown id or a resource id yields no entities.
     */
    [[nodiscard]] std::vector<Entity> query(std::span<const TypeId> types) const;

    template <typename... Ts>
    [[nodiscard]] std::vector<Entity> entitiesWith() const
    {
        static_assert(sizeof...(Ts) > 0, "entitiesWith needs at least one component type");
        std::array<TypeId, sizeof...(Ts)> ids{resolveOrInvalid(typeid(Ts))...};
        return query(ids);
    }

    // ===== Systems ===== //

    /** @brief Starts a fluent system declaration. */
    [[nodiscard]] SystemBuilder system(std::string name);

    /**
     * @brief Registers a system.
     * @return kAlreadyExists on a duplicate name, kSelfConflictingAccess or
     *         kUnknownType for a bad declaration, kInvalidState during a tick.
     */
    core::Expected<void> addSystem(std::string name, std::span<const TypeAccess> accesses, SystemFn fn);

    core::Expected<void> removeSystem(std::string_view name);

    [[nodiscard]] std::span<const SystemRecord> systems() const noexcept { return _systems; }

    [[nodiscard]] core::Expected<core::u32> systemIndex(std::string_view name) const;

    /** @brief Bumped whenever the system set changes. */
    [[nodiscard]] core::u64 systemsRevision() const noexcept { return _systemsRevision; }

    // ===== Deferred mutation ===== //

    [[nodiscard]] CommandBuffer makeCommandBuffer() const { return CommandBuffer{_types}; }

    /**
     * @brief Applies @p commands in recording order, then clears the buffer.
     * @return kInvalidState while a tick is running.
     */
    core::Expected<ApplyStats> apply(CommandBuffer &commands);

    // ===== Raw storage ===== //

    /** @brief Component table for @p type, or nullptr for resources / unknown ids. */
    [[nodiscard]] IComponentStorage       *componentStorage(TypeId type) noexcept;
    [[nodiscard]] const IComponentStorage *componentStorage(TypeId type) const noexcept;

    /** @brief Resource slot for @p type, or nullptr for components / unknown ids. */
    [[nodiscard]] IResourceSlot       *resourceSlot(TypeId type) noexcept;
    [[nodiscard]] const IResourceSlot *resourceSlot(TypeId type) const noexcept;

    [[nodiscard]] bool inTick() const noexcept { return _inTick.load(std::memory_order_acquire); }

private:
    friend class SystemScheduler;

    void install(TypeId id, std::unique_ptr<IComponentStorage> table);
    void install(TypeId id, std::unique_ptr<IResourceSlot> slot);

    [[nodiscard]] core::Expected<void> checkMutable(Entity entity) const;
    [[nodiscard]] TypeId               resolveOrInvalid(std::type_index cppType) const noexcept;
    [[nodiscard]] const void          *componentRaw(std::type_index cppType, Entity entity) const;
    [[nodiscard]] const void          *resourceRaw(std::type_index cppType) const;

    void       destroyUnchecked(Entity entity);
    ApplyStats applyCommands(CommandBuffer &commands);
    void       setInTick(bool value) noexcept { _inTick.store(value, std::memory_order_release); }

    core::u32                                       _initialCapacity;
    TypeRegistry                                    _types;
    EntityRegistry                                  _entities;
    std::vector<std::unique_ptr<IComponentStorage>> _tables;
    std::vector<std::unique_ptr<IResourceSlot>>     _resources;
    std::vector<SystemRecord>                       _systems;
    core::u64                                       _systemsRevision{0};
    std::atomic<bool>                               _inTick{false};
};

// ========================================================================== //
//  SystemBuilder                                                             //
// ========================================================================== //

/**
 * @class SystemBuilder
 * @brief Fluent declaration: world.system("move").read<Vel>().write<Pos>().each(fn).
 *
 * The body may return void or core::Expected<void>.  The first declaration
 * error (unknown type name, unregistered C++ type) is reported by each() or
 * run().
 */
class SystemBuilder final
{
public:
    SystemBuilder(World &world, std::string name)
        : _world{world}
        , _name{std::move(name)}
    {}

    SystemBuilder &read(std::string_view typeName) { return declare(_world.typeId(typeName), AccessMode::ReadOnly); }
    SystemBuilder &write(std::string_view typeName) { return declare(_world.typeId(typeName), AccessMode::ReadWrite); }

    template <typename T>
    SystemBuilder &read()
    {
        return declare(_world.typeId<T>(), AccessMode::ReadOnly);
    }

    template <typename T>
    SystemBuilder &write()
    {
        return declare(_world.typeId<T>(), AccessMode::ReadWrite);
    }

    /** @brief Registers a per-entity system; at least one component is required. */
    template <typename F>
    core::Expected<void> each(F &&fn)
    {
        if (!hasComponent())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "system '" + _name + "' uses each() without declaring a component");
        }
        return finish(wrap(std::forward<F>(fn)));
    }

    /** @brief Registers a once-per-tick system; only resources may be declared. */
    template <typename F>
    core::Expected<void> run(F &&fn)
    {
        if (hasComponent())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "system '" + _name + "' uses run() but declares components; use each()");
        }
        return finish(wrap(std::forward<F>(fn)));
    }

private:
    template <typename F>
    static SystemFn wrap(F &&fn)
    {
        using R = std::invoke_result_t<F &, SystemContext &>;
        if constexpr (std::is_void_v<R>)
        {
            return [body = std::forward<F>(fn)](SystemContext &ctx) mutable -> core::Expected<void> {
                body(ctx);
                return {};
            };
        }
        else
        {
            static_assert(std::is_same_v<R, core::Expected<void>>,
                          "system bodies return void or hive::core::Expected<void>");
            return SystemFn{std::forward<F>(fn)};
        }
    }

    SystemBuilder       &declare(core::Expected<TypeId> id, AccessMode mode);
    [[nodiscard]] bool   hasComponent() const noexcept;
    core::Expected<void> finish(SystemFn fn);

    World                     &_world;
    std::string                _name;
    std::vector<TypeAccess>    _accesses;
    std::optional<core::Error> _error;
};

} // namespace hive::ecs

#endif // HIVE_ECS_WORLD_HPP
