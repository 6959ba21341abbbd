/**
 * @file System.hpp
 * @brief System records and the per-invocation execution context.
 *
 * A system is a named callable together with the AccessDescriptor built from
 * its declarations.  Systems that declare at least one component run once
 * per entity matching all of them; resource-only systems run once per tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_SYSTEM_HPP
    #define HIVE_ECS_SYSTEM_HPP

#include <hive/ecs/Access.hpp>
#include <hive/ecs/CommandBuffer.hpp>
#include <hive/ecs/Component.hpp>
#include <hive/ecs/Entity.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/Types.hpp>

#include <functional>
#include <optional>
#include <string>
#include <typeindex>

namespace hive::ecs {

class World;
class SystemContext;

/**
 * @brief System body.  Returning an error with code kSystemFatal stops the
 *        remaining invocations of this system for the current tick; any other
 *        error only affects the current entity.
 */
using SystemFn = std::function<core::Expected<void>(SystemContext &)>;

/**
 * @struct SystemRecord
 * @brief A registered system.  @c order is its declaration index.
 */
struct SystemRecord
{
    std::string      name;
    AccessDescriptor access;
    SystemFn         fn;
    core::u32        order{0};
};

/**
 * @class SystemContext
 * @brief What a running system can see.
 *
 * Reads and writes go through the declared access set: asking for a type
 * the system did not declare, or writing a type declared read-only, yields
 * nullptr and records an access violation that aborts the tick once the
 * current wave has joined.
 *
 * Component accessors target the entity currently being visited.  The
 * @c Of variants reach any entity holding a declared component type.
 */
class SystemContext final
{
public:
    SystemContext(World &world, const SystemRecord &system, CommandBuffer &commands, core::f32 deltaTime) noexcept;

    [[nodiscard]] Entity            entity() const noexcept { return _entity; }
    [[nodiscard]] core::f32         deltaTime() const noexcept { return _deltaTime; }
    [[nodiscard]] const std::string &systemName() const noexcept { return _system.name; }
    [[nodiscard]] CommandBuffer     &commands() noexcept { return _commands; }

    [[nodiscard]] bool isAlive(Entity entity) const noexcept;

    template <typename T>
    [[nodiscard]] const T *read()
    {
        return static_cast<const T *>(readRaw(resolve(typeid(T)), _entity));
    }

    template <typename T>
    [[nodiscard]] T *write()
    {
        return static_cast<T *>(writeRaw(resolve(typeid(T)), _entity));
    }

    template <typename T>
    [[nodiscard]] const T *readOf(Entity other)
    {
        return static_cast<const T *>(readRaw(resolve(typeid(T)), other));
    }

    template <typename T>
    [[nodiscard]] T *writeOf(Entity other)
    {
        return static_cast<T *>(writeRaw(resolve(typeid(T)), other));
    }

    /** @brief Erased read by TypeId.  Resources ignore @p target. */
    [[nodiscard]] const void *readRaw(TypeId type, Entity target);

    /** @brief Erased write by TypeId.  Resources ignore @p target. */
    [[nodiscard]] void *writeRaw(TypeId type, Entity target);

    // ===== Scheduler side ===== //

    void bind(Entity entity) noexcept { _entity = entity; }

    /** @brief Returns and clears the first recorded violation. */
    [[nodiscard]] std::optional<core::Error> takeViolation() noexcept;

private:
    [[nodiscard]] TypeId resolve(std::type_index cppType) const noexcept;
    [[nodiscard]] bool   check(TypeId type, AccessMode wanted);

    World                     &_world;
    const SystemRecord        &_system;
    CommandBuffer             &_commands;
    core::f32                  _deltaTime;
    Entity                     _entity{Entity::null()};
    std::optional<core::Error> _violation;
};

} // namespace hive::ecs

#endif // HIVE_ECS_SYSTEM_HPP
