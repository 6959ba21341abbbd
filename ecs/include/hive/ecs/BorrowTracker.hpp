/**
 * @file BorrowTracker.hpp
 * @brief Runtime reader/writer bookkeeping per registered type.
 *
 * The scheduler acquires every declared borrow of a system when it starts
 * inside a wave and releases them all once the wave has joined.  Because
 * borrows outlive the individual system, two conflicting systems that end up
 * in the same wave are always caught, whatever order the workers pick them
 * up in.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_BORROW_TRACKER_HPP
    #define HIVE_ECS_BORROW_TRACKER_HPP

#include <hive/ecs/Access.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/NonCopyable.hpp>
#include <hive/core/Types.hpp>

#include <atomic>
#include <memory>
#include <string_view>

namespace hive::ecs {

class BorrowTracker final : public core::NonCopyable<BorrowTracker>
{
public:
    BorrowTracker() = default;

    /** @brief Drops every borrow and sizes the table for @p typeCount types. */
    void reset(core::u32 typeCount);

    /**
     * @brief Acquires all entries of @p access, or none of them.
     * @return kAccessViolation naming @p system if any entry is already
     *         borrowed incompatibly.
     */
    [[nodiscard]] core::Expected<void> acquire(const AccessDescriptor &access, std::string_view system);

    /** @brief Releases borrows previously taken by acquire(). */
    void release(const AccessDescriptor &access) noexcept;

    /** @brief >0 readers, -1 writer, 0 free. */
    [[nodiscard]] core::i32 state(TypeId type) const noexcept;

private:
    static constexpr core::i32 kWriter = -1;

    [[nodiscard]] bool tryAcquire(const TypeAccess &entry) noexcept;
    void               releaseOne(const TypeAccess &entry) noexcept;

    std::unique_ptr<std::atomic<core::i32>[]> _slots;
    core::u32                                 _count{0};
};

} // namespace hive::ecs

#endif // HIVE_ECS_BORROW_TRACKER_HPP
