/**
 * @file EntityRegistry.cpp
 * @brief Entity registry with an intrusive LIFO free-list.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/ecs/EntityRegistry.hpp>
#include <hive/core/Assert.hpp>

#include <vector>

namespace hive::ecs {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct EntityRegistry::Impl
{
    /** @brief Sentinel value meaning "no next slot". */
    static constexpr core::u32 kNoNext = ~core::u32{0};

    struct SlotInfo
    {
        core::u32 generation{0};
        core::u32 nextFree{kNoNext};
        bool      alive{false};
    };

    std::vector<SlotInfo> slots;
    core::u32             freeHead{kNoNext};
    core::u32             liveCount{0};
    core::u32             retiredCount{0};
    core::u32             maxGeneration;

    Impl(core::u32 initialCapacity, core::u32 generationLimit) : maxGeneration{generationLimit}
    {
        slots.reserve(initialCapacity);
    }

    core::u32 allocateSlot()
    {
        if (freeHead != kNoNext)
        {
            const core::u32 slot = freeHead;
            freeHead = slots[slot].nextFree;
            slots[slot].nextFree = kNoNext;
            return slot;
        }

        const auto slot = static_cast<core::u32>(slots.size());
        HIVE_VERIFY(slot != Entity::kNullIndex);
        slots.emplace_back();
        return slot;
    }

    void freeSlot(core::u32 slot)
    {
        slots[slot].nextFree = freeHead;
        freeHead = slot;
    }
};

// ========================================================================== //
//  EntityRegistry                                                            //
// ========================================================================== //

EntityRegistry::EntityRegistry(core::u32 initialCapacity, core::u32 maxGeneration)
    : _impl{std::make_unique<Impl>(initialCapacity, maxGeneration)}
{}

EntityRegistry::~EntityRegistry() = default;

EntityRegistry::EntityRegistry(EntityRegistry &&) noexcept = default;
EntityRegistry &EntityRegistry::operator=(EntityRegistry &&) noexcept = default;

Entity EntityRegistry::create()
{
    const core::u32 slot = _impl->allocateSlot();

    auto &info = _impl->slots[slot];
    info.alive = true;
    ++_impl->liveCount;

    return Entity{slot, info.generation};
}

bool EntityRegistry::destroy(Entity entity)
{
    if (!isAlive(entity))
    {
        return false;
    }

    auto &info = _impl->slots[entity.index()];
    info.alive = false;
    --_impl->liveCount;

    // An exhausted slot stays dead for good: reusing it would wrap the generation.
    if (info.generation >= _impl->maxGeneration)
    {
        ++_impl->retiredCount;
        return true;
    }

    // Bump generation so the stale handle never matches the recycled slot
    ++info.generation;
    _impl->freeSlot(entity.index());

    return true;
}

bool EntityRegistry::isAlive(Entity entity) const noexcept
{
    if (!entity.isValid() || entity.index() >= _impl->slots.size())
    {
        return false;
    }
    const auto &info = _impl->slots[entity.index()];
    return info.alive && info.generation == entity.generation();
}

Entity EntityRegistry::entityAt(core::u32 index) const noexcept
{
    if (index >= _impl->slots.size() || !_impl->slots[index].alive)
    {
        return Entity::null();
    }
    return Entity{index, _impl->slots[index].generation};
}

core::u32 EntityRegistry::liveCount() const noexcept
{
    return _impl->liveCount;
}

core::u32 EntityRegistry::retiredCount() const noexcept
{
    return _impl->retiredCount;
}

core::u32 EntityRegistry::capacity() const noexcept
{
    return static_cast<core::u32>(_impl->slots.size());
}

void EntityRegistry::forEachAlive(const std::function<void(Entity)> &fn) const
{
    const auto n = static_cast<core::u32>(_impl->slots.size());
    for (core::u32 i = 0; i < n; ++i)
    {
        const auto &info = _impl->slots[i];
        if (info.alive)
        {
            fn(Entity{i, info.generation});
        }
    }
}

} // namespace hive::ecs
