/**
 * @file EntityRegistry.hpp
 * @brief Allocates and recycles entity slots with generation counters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_ENTITY_REGISTRY_HPP
    #define HIVE_ECS_ENTITY_REGISTRY_HPP

#include <hive/ecs/Entity.hpp>
#include <hive/core/Constants.hpp>
#include <hive/core/Types.hpp>
#include <hive/core/NonCopyable.hpp>

#include <functional>
#include <memory>

namespace hive::ecs {

/**
 * @class EntityRegistry
 * @brief Owns the entity free-list and generation table.
 *
 * Entities are created with a unique slot + generation.  On destruction the
 * slot is recycled and the generation is bumped, invalidating stale
 * handles.  A slot whose generation reaches the limit is retired instead of
 * recycled, so generations never wrap.  The registry is only mutated between waves, so it needs no
 * synchronisation; concurrent isAlive() calls during a wave are safe.
 */
class EntityRegistry final : public core::NonCopyable<EntityRegistry>
{
public:
    explicit EntityRegistry(core::u32 initialCapacity = core::kInitialEntityCapacity,
                            core::u32 maxGeneration   = Entity::kMaxGeneration);
    ~EntityRegistry();

    EntityRegistry(EntityRegistry &&) noexcept;
    EntityRegistry &operator=(EntityRegistry &&) noexcept;

    /**
     * @brief Allocates a fresh entity, reusing a freed slot when possible.
     *
     * A reused slot keeps its bumped generation, so the new handle never
     * equals a handle previously issued for the same slot.
     */
    [[nodiscard]] Entity create();

    /**
     * @brief Destroys @p entity, recycling its slot.
     * @return False (and no effect) if the handle is stale or null.
     */
    bool destroy(Entity entity);

    /** @brief Tests whether an entity is alive (generation matches). */
    [[nodiscard]] bool isAlive(Entity entity) const noexcept;

    /**
     * @brief Returns the live handle occupying @p index, or Entity::null().
     */
    [[nodiscard]] Entity entityAt(core::u32 index) const noexcept;

    /** @brief Returns the number of live entities. */
    [[nodiscard]] core::u32 liveCount() const noexcept;

    /** @brief Number of slots that hit the generation limit and left the free-list. */
    [[nodiscard]] core::u32 retiredCount() const noexcept;

    /** @brief Number of slots ever allocated (live + free + retired). */
    [[nodiscard]] core::u32 capacity() const noexcept;

    /** @brief Visits every live entity in slot order. */
    void forEachAlive(const std::function<void(Entity)> &fn) const;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace hive::ecs

#endif // HIVE_ECS_ENTITY_REGISTRY_HPP
