/**
 * @file Storage.hpp
 * @brief Per-type component tables and resource slots.
 *
 * A ComponentStorage<T> maps entity slot indices to values through a
 * SparseSet; a ResourceSlot<T> boxes a single global value.  Both are
 * reached through type-erased interfaces by the world, the query engine
 * and command-buffer application.  Storage never validates cross-type
 * invariants; the execution plan guarantees exclusive access.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_STORAGE_HPP
    #define HIVE_ECS_STORAGE_HPP

#include <hive/ecs/Component.hpp>
#include <hive/container/SparseSet.hpp>
#include <hive/core/Any.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/Types.hpp>

#include <span>
#include <utility>

namespace hive::ecs {

// ========================================================================== //
//  Components                                                                //
// ========================================================================== //

/**
 * @brief Type-erased component table.
 */
class IComponentStorage
{
public:
    virtual ~IComponentStorage() = default;

    [[nodiscard]] virtual TypeId    type() const noexcept = 0;
    [[nodiscard]] virtual bool      contains(core::u32 index) const = 0;
    [[nodiscard]] virtual core::u32 size() const noexcept = 0;

    /** @brief Entity slot indices in dense order. */
    [[nodiscard]] virtual std::span<const core::u32> indices() const noexcept = 0;

    /** @brief Removes the entry for @p index; false if absent. */
    virtual bool remove(core::u32 index) = 0;

    /**
     * @brief Inserts or replaces the entry for @p index from an erased value.
     * @return kCastFailed if @p value does not hold this table's type.
     */
    [[nodiscard]] virtual core::Expected<void> insertAny(core::u32 index, core::Any value) = 0;

    /** @brief Borrowed read pointer, or nullptr if absent. */
    [[nodiscard]] virtual const void *readRaw(core::u32 index) const = 0;

    /** @brief Borrowed write pointer, or nullptr if absent. */
    [[nodiscard]] virtual void *writeRaw(core::u32 index) = 0;

    /** @brief Borrowed pointer honouring @p mode. */
    [[nodiscard]] const void *get(core::u32 index, AccessMode mode)
    {
        return mode == AccessMode::ReadWrite ? writeRaw(index) : readRaw(index);
    }

    virtual void clear() = 0;
};

/**
 * @brief Component table for @p T.
 */
template <typename T>
class ComponentStorage final : public IComponentStorage
{
public:
    explicit ComponentStorage(TypeId type, core::u32 initialCapacity = core::kInitialEntityCapacity)
        : _type{type}
        , _set{initialCapacity}
    {}

    [[nodiscard]] TypeId    type() const noexcept override { return _type; }
    [[nodiscard]] bool      contains(core::u32 index) const override { return _set.contains(index); }
    [[nodiscard]] core::u32 size() const noexcept override { return _set.size(); }

    [[nodiscard]] std::span<const core::u32> indices() const noexcept override { return _set.ids(); }

    bool remove(core::u32 index) override { return _set.remove(index); }

    /** @brief Inserts or replaces; an entity never holds two instances. */
    T &insert(core::u32 index, T value) { return _set.insertOrAssign(index, std::move(value)); }

    [[nodiscard]] core::Expected<void> insertAny(core::u32 index, core::Any value) override
    {
        auto taken = value.take<T>();
        if (!taken)
        {
            return std::unexpected(std::move(taken.error()));
        }
        insert(index, std::move(*taken));
        return {};
    }

    [[nodiscard]] const T *read(core::u32 index) const { return _set.find(index); }
    [[nodiscard]] T       *write(core::u32 index)      { return _set.find(index); }

    [[nodiscard]] const void *readRaw(core::u32 index) const override { return read(index); }
    [[nodiscard]] void       *writeRaw(core::u32 index) override      { return write(index); }

    void clear() override { _set.clear(); }

    /** @brief Dense values, parallel to indices(). */
    [[nodiscard]] std::span<T>       values()       { return _set.dense(); }
    [[nodiscard]] std::span<const T> values() const { return _set.dense(); }

private:
    TypeId                    _type;
    container::SparseSet<T>   _set;
};

// ========================================================================== //
//  Resources                                                                 //
// ========================================================================== //

/**
 * @brief Type-erased resource slot.  Exists from registration until the
 *        world is torn down.
 */
class IResourceSlot
{
public:
    virtual ~IResourceSlot() = default;

    [[nodiscard]] virtual TypeId      type() const noexcept = 0;
    [[nodiscard]] virtual const void *readRaw() const noexcept = 0;
    [[nodiscard]] virtual void       *writeRaw() noexcept = 0;

    [[nodiscard]] const void *get(AccessMode mode) noexcept
    {
        return mode == AccessMode::ReadWrite ? writeRaw() : readRaw();
    }
};

template <typename T>
class ResourceSlot final : public IResourceSlot
{
public:
    ResourceSlot(TypeId type, T initial)
        : _type{type}
        , _value{std::move(initial)}
    {}

    [[nodiscard]] TypeId      type() const noexcept override { return _type; }
    [[nodiscard]] const void *readRaw() const noexcept override { return &_value; }
    [[nodiscard]] void       *writeRaw() noexcept override { return &_value; }

    [[nodiscard]] const T &read() const noexcept { return _value; }
    [[nodiscard]] T       &write() noexcept { return _value; }

private:
    TypeId _type;
    T      _value;
};

} // namespace hive::ecs

#endif // HIVE_ECS_STORAGE_HPP
