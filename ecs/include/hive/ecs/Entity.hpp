/**
 * @file Entity.hpp
 * @brief Entity identifier: slot index + generation counter.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_ENTITY_HPP
    #define HIVE_ECS_ENTITY_HPP

#include <hive/core/Types.hpp>

#include <compare>
#include <cstddef>
#include <functional>
#include <limits>

namespace hive::ecs {

/**
 * @class Entity
 * @brief Opaque, generation-checked entity handle.
 *
 * The generation counter detects stale references after an entity is
 * destroyed and its slot is recycled.  Components that refer to other
 * entities store an Entity, never a pointer, and check it with
 * World::isAlive() before use.
 */
class Entity final
{
public:
    static constexpr core::u32 kNullIndex     = std::numeric_limits<core::u32>::max();
    static constexpr core::u32 kMaxGeneration = std::numeric_limits<core::u32>::max();

    /** @brief Default-constructs a null entity. */
    constexpr Entity() noexcept = default;

    /**
     * @brief Constructs from separate slot + generation.
     * @param index      Slot index.
     * @param generation Generation counter.
     */
    constexpr Entity(core::u32 index, core::u32 generation) noexcept
        : _index{index}
        , _generation{generation}
    {}

    /** @brief Null sentinel. */
    [[nodiscard]] static constexpr Entity null() noexcept { return Entity{}; }

    /** @brief Returns the slot index. */
    [[nodiscard]] constexpr core::u32 index() const noexcept { return _index; }

    /** @brief Returns the generation counter. */
    [[nodiscard]] constexpr core::u32 generation() const noexcept { return _generation; }

    /** @brief Tests whether the handle is non-null (says nothing about liveness). */
    [[nodiscard]] constexpr bool isValid() const noexcept { return _index != kNullIndex; }

    [[nodiscard]] constexpr bool operator==(const Entity &) const noexcept = default;
    [[nodiscard]] constexpr auto operator<=>(const Entity &) const noexcept = default;

private:
    core::u32 _index{kNullIndex};
    core::u32 _generation{0};
};

} // namespace hive::ecs

// -------------------------------------------------------------------------- //
//  std::hash specialisation                                                  //
// -------------------------------------------------------------------------- //
template <>
struct std::hash<hive::ecs::Entity>
{
    [[nodiscard]] std::size_t operator()(hive::ecs::Entity e) const noexcept
    {
        const hive::core::u64 packed =
            (static_cast<hive::core::u64>(e.generation()) << 32) | e.index();
        return std::hash<hive::core::u64>{}(packed);
    }
};

#endif // HIVE_ECS_ENTITY_HPP
