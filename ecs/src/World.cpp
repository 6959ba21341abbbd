/**
 * @file World.cpp
 * @brief World storage management, queries, system registry and command
 *        application.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/ecs/World.hpp>
#include <hive/core/Log.hpp>

#include <algorithm>
#include <limits>

namespace hive::ecs {

namespace {

[[nodiscard]] std::string describe(Entity entity)
{
    return "(" + std::to_string(entity.index()) + ", gen " + std::to_string(entity.generation()) + ")";
}

} // namespace

World::World(core::u32 initialEntityCapacity)
    : _initialCapacity{initialEntityCapacity}
    , _entities{initialEntityCapacity}
{}

World::~World() = default;

// ========================================================================== //
//  Storage                                                                   //
// ========================================================================== //

void World::install(TypeId id, std::unique_ptr<IComponentStorage> table)
{
    if (_tables.size() <= id)
    {
        _tables.resize(id + 1);
        _resources.resize(id + 1);
    }
    _tables[id] = std::move(table);
    core::Log::debug("ECS", "registered component '" + _types.info(id).name + "' as #" + std::to_string(id));
}

void World::install(TypeId id, std::unique_ptr<IResourceSlot> slot)
{
    if (_resources.size() <= id)
    {
        _tables.resize(id + 1);
        _resources.resize(id + 1);
    }
    _resources[id] = std::move(slot);
    core::Log::debug("ECS", "registered resource '" + _types.info(id).name + "' as #" + std::to_string(id));
}

IComponentStorage *World::componentStorage(TypeId type) noexcept
{
    return type < _tables.size() ? _tables[type].get() : nullptr;
}

const IComponentStorage *World::componentStorage(TypeId type) const noexcept
{
    return type < _tables.size() ? _tables[type].get() : nullptr;
}

IResourceSlot *World::resourceSlot(TypeId type) noexcept
{
    return type < _resources.size() ? _resources[type].get() : nullptr;
}

const IResourceSlot *World::resourceSlot(TypeId type) const noexcept
{
    return type < _resources.size() ? _resources[type].get() : nullptr;
}

TypeId World::resolveOrInvalid(std::type_index cppType) const noexcept
{
    auto id = _types.find(cppType);
    return id ? *id : kInvalidTypeId;
}

const void *World::componentRaw(std::type_index cppType, Entity entity) const
{
    const IComponentStorage *table = componentStorage(resolveOrInvalid(cppType));
    if (table == nullptr || !_entities.isAlive(entity))
    {
        return nullptr;
    }
    return table->readRaw(entity.index());
}

const void *World::resourceRaw(std::type_index cppType) const
{
    const IResourceSlot *slot = resourceSlot(resolveOrInvalid(cppType));
    return slot != nullptr ? slot->readRaw() : nullptr;
}

// ========================================================================== //
//  Entities and components                                                   //
// ========================================================================== //

core::Expected<void> World::checkMutable(Entity entity) const
{
    if (inTick())
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               "structural change during a tick; record it in a CommandBuffer");
    }
    if (!_entities.isAlive(entity))
    {
        return core::makeError(core::ErrorCode::kNotFound, "entity " + describe(entity) + " is not alive");
    }
    return {};
}

core::Expected<Entity> World::createEntity()
{
    if (inTick())
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               "createEntity during a tick; record it in a CommandBuffer");
    }
    return _entities.create();
}

core::Expected<bool> World::destroyEntity(Entity entity)
{
    if (inTick())
    {
        return core::makeError(core::ErrorCode::kInvalidState,
                               "destroyEntity during a tick; record it in a CommandBuffer");
    }
    if (!_entities.isAlive(entity))
    {
        return false;
    }
    destroyUnchecked(entity);
    return true;
}

void World::destroyUnchecked(Entity entity)
{
    for (auto &table : _tables)
    {
        if (table)
        {
            table->remove(entity.index());
        }
    }
    _entities.destroy(entity);
}

core::Expected<void> World::addComponent(Entity entity, TypeId type, core::Any value)
{
    HIVE_TRY_VOID(checkMutable(entity));
    IComponentStorage *table = componentStorage(type);
    if (table == nullptr)
    {
        return core::makeError(core::ErrorCode::kUnknownType, "type #" + std::to_string(type) + " is not a component");
    }
    return table->insertAny(entity.index(), std::move(value));
}

core::Expected<bool> World::removeComponent(Entity entity, TypeId type)
{
    HIVE_TRY_VOID(checkMutable(entity));
    IComponentStorage *table = componentStorage(type);
    if (table == nullptr)
    {
        return core::makeError(core::ErrorCode::kUnknownType, "type #" + std::to_string(type) + " is not a component");
    }
    return table->remove(entity.index());
}

// ========================================================================== //
//  Queries                                                                   //
// ========================================================================== //

std::vector<Entity> World::query(std::span<const TypeId> types) const
{
    std::vector<Entity> out;
    if (types.empty())
    {
        return out;
    }

    std::vector<const IComponentStorage *> tables;
    tables.reserve(types.size());
    for (TypeId id : types)
    {
        const IComponentStorage *table = componentStorage(id);
        if (table == nullptr)
        {
            return out;
        }
        tables.push_back(table);
    }

    auto smallest = std::min_element(tables.begin(), tables.end(),
        [](const IComponentStorage *a, const IComponentStorage *b) { return a->size() < b->size(); });
    const IComponentStorage *driver = *smallest;

    out.reserve(driver->size());
    for (core::u32 index : driver->indices())
    {
        bool all = true;
        for (const IComponentStorage *table : tables)
        {
            if (table != driver && !table->contains(index))
            {
                all = false;
                break;
            }
        }
        if (!all)
        {
            continue;
        }

        const Entity entity = _entities.entityAt(index);
        if (entity.isValid())
        {
            out.push_back(entity);
        }
    }
    return out;
}

// ========================================================================== //
//  Systems                                                                   //
// ========================================================================== //

SystemBuilder World::system(std::string name) { return SystemBuilder{*this, std::move(name)}; }

core::Expected<void> World::addSystem(std::string name, std::span<const TypeAccess> accesses, SystemFn fn)
{
    if (inTick())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "cannot add system '" + name + "' during a tick");
    }
    if (name.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "system name must not be empty");
    }
    if (!fn)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "system '" + name + "' has no body");
    }
    if (_systems.size() >= core::kMaxSystems)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "cannot add system '" + name + "': limit of " + std::to_string(core::kMaxSystems) +
                                   " systems reached");
    }
    if (systemIndex(name))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists, "system '" + name + "' is already registered");
    }

    std::vector<TypeAccess> normalised;
    normalised.reserve(accesses.size());
    for (TypeAccess access : accesses)
    {
        if (!_types.contains(access.id))
        {
            return core::makeError(core::ErrorCode::kUnknownType,
                                   "system '" + name + "' declares unregistered type #" + std::to_string(access.id));
        }
        access.kind = _types.info(access.id).kind;
        normalised.push_back(access);
    }

    auto access = AccessDescriptor::make(normalised);
    if (!access)
    {
        if (access.error().code() == core::ErrorCode::kSelfConflictingAccess)
        {
            for (core::usize i = 0; i < normalised.size(); ++i)
            {
                for (core::usize j = i + 1; j < normalised.size(); ++j)
                {
                    if (normalised[i].id == normalised[j].id && normalised[i].mode != normalised[j].mode)
                    {
                        return core::makeError(core::ErrorCode::kSelfConflictingAccess,
                                               "system '" + name + "' declares '" + _types.info(normalised[i].id).name +
                                                   "' both read-only and read-write");
                    }
                }
            }
        }
        return std::unexpected(std::move(access.error()));
    }

    const auto order = static_cast<core::u32>(_systems.size());
    core::Log::info("ECS", "registered system '" + name + "' (" + std::to_string(access->entries().size()) +
                               " declared types" + (access->isResourceOnly() ? ", once per tick)" : ", per entity)"));
    _systems.push_back(SystemRecord{std::move(name), std::move(*access), std::move(fn), order});
    ++_systemsRevision;
    return {};
}

core::Expected<void> World::removeSystem(std::string_view name)
{
    if (inTick())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "cannot remove a system during a tick");
    }
    const core::u32 index = HIVE_TRY(systemIndex(name));

    _systems.erase(_systems.begin() + index);
    for (core::u32 i = index; i < _systems.size(); ++i)
    {
        _systems[i].order = i;
    }
    ++_systemsRevision;
    return {};
}

core::Expected<core::u32> World::systemIndex(std::string_view name) const
{
    for (const SystemRecord &record : _systems)
    {
        if (record.name == name)
        {
            return record.order;
        }
    }
    return core::makeError(core::ErrorCode::kNotFound, "no system named '" + std::string{name} + "'");
}

// ========================================================================== //
//  Commands                                                                  //
// ========================================================================== //

core::Expected<ApplyStats> World::apply(CommandBuffer &commands)
{
    if (inTick())
    {
        return core::makeError(core::ErrorCode::kInvalidState, "command buffers are applied by the scheduler during a tick");
    }
    return applyCommands(commands);
}

ApplyStats World::applyCommands(CommandBuffer &commands)
{
    ApplyStats stats;
    std::vector<Entity> pending(commands.pendingCount(), Entity::null());

    auto resolve = [&pending](const CommandTarget &target) -> Entity {
        if (const auto *entity = std::get_if<Entity>(&target))
        {
            return *entity;
        }
        const core::u32 ordinal = std::get<PendingEntity>(target).ordinal;
        return ordinal < pending.size() ? pending[ordinal] : Entity::null();
    };

    auto skip = [&stats](std::string msg) {
        ++stats.ignored;
        core::Log::debug("ECS", std::move(msg));
    };

    for (Command &command : commands.commands())
    {
        switch (command.op)
        {
        case CommandOp::CreateEntity:
        {
            const Entity entity = _entities.create();
            pending[std::get<PendingEntity>(command.target).ordinal] = entity;
            stats.created.push_back(entity);
            ++stats.applied;
            break;
        }
        case CommandOp::DestroyEntity:
        {
            const Entity entity = resolve(command.target);
            if (!_entities.isAlive(entity))
            {
                skip("destroy of stale entity " + describe(entity) + " ignored");
                break;
            }
            destroyUnchecked(entity);
            ++stats.applied;
            break;
        }
        case CommandOp::AddComponent:
        {
            const Entity entity = resolve(command.target);
            IComponentStorage *table = componentStorage(command.type);
            if (!_entities.isAlive(entity) || table == nullptr)
            {
                skip("add of type #" + std::to_string(command.type) + " on " + describe(entity) + " ignored");
                break;
            }
            auto inserted = table->insertAny(entity.index(), std::move(command.value));
            if (!inserted)
            {
                ++stats.ignored;
                core::Log::warn("ECS", "add on " + describe(entity) + " rejected: " + inserted.error().message());
                break;
            }
            ++stats.applied;
            break;
        }
        case CommandOp::RemoveComponent:
        {
            const Entity entity = resolve(command.target);
            IComponentStorage *table = componentStorage(command.type);
            if (!_entities.isAlive(entity) || table == nullptr || !table->remove(entity.index()))
            {
                skip("remove of type #" + std::to_string(command.type) + " on " + describe(entity) + " ignored");
                break;
            }
            ++stats.applied;
            break;
        }
        }
    }

    commands.clear();
    return stats;
}

// ========================================================================== //
//  SystemBuilder                                                             //
// ========================================================================== //

SystemBuilder &SystemBuilder::declare(core::Expected<TypeId> id, AccessMode mode)
{
    if (!id)
    {
        if (!_error)
        {
            _error = std::move(id.error());
        }
        return *this;
    }
    _accesses.push_back(TypeAccess{*id, _world.types().info(*id).kind, mode});
    return *this;
}

bool SystemBuilder::hasComponent() const noexcept
{
    return std::any_of(_accesses.begin(), _accesses.end(),
                       [](const TypeAccess &a) { return a.kind == TypeKind::Component; });
}

core::Expected<void> SystemBuilder::finish(SystemFn fn)
{
    if (_error)
    {
        return core::makeError(_error->code(), "system '" + _name + "': " + _error->message());
    }
    return _world.addSystem(std::move(_name), _accesses, std::move(fn));
}

} // namespace hive::ecs
