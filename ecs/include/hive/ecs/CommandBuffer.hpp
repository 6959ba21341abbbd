/**
 * @file CommandBuffer.hpp
 * @brief Deferred structural mutations (create/destroy entity,
 *        add/remove component).
 *
 * Systems never change the shape of the world while a wave runs.  They
 * record their requests here; the scheduler applies every buffer of a wave,
 * in plan order and each in recording order, once the wave has joined.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_COMMAND_BUFFER_HPP
    #define HIVE_ECS_COMMAND_BUFFER_HPP

#include <hive/ecs/Entity.hpp>
#include <hive/ecs/Component.hpp>
#include <hive/ecs/TypeRegistry.hpp>
#include <hive/core/Any.hpp>
#include <hive/core/Types.hpp>

#include <span>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

namespace hive::ecs {

/**
 * @struct PendingEntity
 * @brief Handle to an entity created earlier in the same buffer.  It is
 *        resolved to a real Entity when the buffer is applied.
 */
struct PendingEntity
{
    core::u32 ordinal{0};

    [[nodiscard]] bool operator==(const PendingEntity &) const noexcept = default;
};

using CommandTarget = std::variant<Entity, PendingEntity>;

/**
 * @enum CommandOp
 * @brief Structural operation kinds.
 */
enum class CommandOp : core::u8
{
    CreateEntity,
    DestroyEntity,
    AddComponent,
    RemoveComponent
};

/**
 * @struct Command
 * @brief One recorded operation.  @c type and @c value are only meaningful
 *        for AddComponent / RemoveComponent.
 */
struct Command
{
    CommandOp     op{CommandOp::CreateEntity};
    CommandTarget target{Entity::null()};
    TypeId        type{kInvalidTypeId};
    core::Any     value;
};

/**
 * @class CommandBuffer
 * @brief Append-only log of structural operations.
 *
 * A buffer is owned by exactly one running system, so recording needs no
 * synchronisation.  Typed operations on a type that was never registered
 * are dropped at record time, logged, and counted in rejectedCount().
 */
class CommandBuffer final
{
public:
    explicit CommandBuffer(const TypeRegistry &types);

    CommandBuffer(CommandBuffer &&) noexcept            = default;
    CommandBuffer &operator=(CommandBuffer &&) noexcept = default;

    /** @brief Requests a new entity. */
    PendingEntity createEntity();

    /** @brief Requests destruction.  Stale handles are ignored at apply time. */
    void destroyEntity(Entity entity);

    /** @brief Requests adding (or replacing) a component from an erased value. */
    void addComponent(CommandTarget target, TypeId type, core::Any value);

    template <typename T>
    void addComponent(CommandTarget target, T value)
    {
        const TypeId id = resolve(typeid(T));
        if (id != kInvalidTypeId)
        {
            addComponent(target, id, core::Any{std::move(value)});
        }
    }

    /** @brief Requests removal.  Missing components are ignored at apply time. */
    void removeComponent(CommandTarget target, TypeId type);

    template <typename T>
    void removeComponent(CommandTarget target)
    {
        const TypeId id = resolve(typeid(T));
        if (id != kInvalidTypeId)
        {
            removeComponent(target, id);
        }
    }

    [[nodiscard]] std::span<const Command> commands() const noexcept { return _commands; }
    [[nodiscard]] std::span<Command>       commands() noexcept { return _commands; }

    [[nodiscard]] core::usize size() const noexcept { return _commands.size(); }
    [[nodiscard]] bool        empty() const noexcept { return _commands.empty(); }

    /** @brief Number of createEntity() calls recorded so far. */
    [[nodiscard]] core::u32 pendingCount() const noexcept { return _pendingCount; }

    [[nodiscard]] core::u32 rejectedCount() const noexcept { return _rejected; }

    void clear() noexcept;

private:
    [[nodiscard]] TypeId resolve(std::type_index cppType);

    const TypeRegistry  *_types;
    std::vector<Command> _commands;
    core::u32            _pendingCount{0};
    core::u32            _rejected{0};
};

} // namespace hive::ecs

#endif // HIVE_ECS_COMMAND_BUFFER_HPP
