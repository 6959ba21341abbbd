/**
 * @file BorrowTracker.cpp
 * @brief Lock-free borrow counters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/ecs/BorrowTracker.hpp>

#include <string>

namespace hive::ecs {

void BorrowTracker::reset(core::u32 typeCount)
{
    if (typeCount != _count || !_slots)
    {
        _slots = std::make_unique<std::atomic<core::i32>[]>(typeCount);
        _count = typeCount;
    }
    for (core::u32 i = 0; i < _count; ++i)
    {
        _slots[i].store(0, std::memory_order_relaxed);
    }
}

core::Expected<void> BorrowTracker::acquire(const AccessDescriptor &access, std::string_view system)
{
    const auto entries = access.entries();
    for (core::usize i = 0; i < entries.size(); ++i)
    {
        if (tryAcquire(entries[i]))
        {
            continue;
        }

        for (core::usize j = 0; j < i; ++j)
        {
            releaseOne(entries[j]);
        }
        return core::makeError(core::ErrorCode::kAccessViolation,
                               "system '" + std::string{system} + "' cannot borrow type #" +
                                   std::to_string(entries[i].id) + " " + toString(entries[i].mode) +
                                   ": already borrowed by a concurrent system");
    }
    return {};
}

void BorrowTracker::release(const AccessDescriptor &access) noexcept
{
    for (const TypeAccess &entry : access.entries())
    {
        releaseOne(entry);
    }
}

core::i32 BorrowTracker::state(TypeId type) const noexcept
{
    return type < _count ? _slots[type].load(std::memory_order_acquire) : 0;
}

bool BorrowTracker::tryAcquire(const TypeAccess &entry) noexcept
{
    if (entry.id >= _count)
    {
        return false;
    }
    std::atomic<core::i32> &slot = _slots[entry.id];

    if (entry.mode == AccessMode::ReadWrite)
    {
        core::i32 expected = 0;
        return slot.compare_exchange_strong(expected, kWriter, std::memory_order_acq_rel);
    }

    core::i32 current = slot.load(std::memory_order_acquire);
    while (current != kWriter)
    {
        if (slot.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel))
        {
            return true;
        }
    }
    return false;
}

void BorrowTracker::releaseOne(const TypeAccess &entry) noexcept
{
    if (entry.id >= _count)
    {
        return;
    }
    if (entry.mode == AccessMode::ReadWrite)
    {
        _slots[entry.id].store(0, std::memory_order_release);
    }
    else
    {
        _slots[entry.id].fetch_sub(1, std::memory_order_acq_rel);
    }
}

} // namespace hive::ecs
