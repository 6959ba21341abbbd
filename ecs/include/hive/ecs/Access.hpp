/**
 * @file Access.hpp
 * @brief Per-system access declarations and conflict detection.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_ACCESS_HPP
    #define HIVE_ECS_ACCESS_HPP

#include <hive/ecs/Component.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/Types.hpp>

#include <optional>
#include <span>
#include <vector>

namespace hive::ecs {

/**
 * @struct TypeAccess
 * @brief One declared requirement: a registered type and its access mode.
 */
struct TypeAccess
{
    TypeId     id{kInvalidTypeId};
    TypeKind   kind{TypeKind::Component};
    AccessMode mode{AccessMode::ReadOnly};

    [[nodiscard]] bool operator==(const TypeAccess &) const noexcept = default;
};

/**
 * @class AccessDescriptor
 * @brief Normalised set of (type, mode) pairs a system touches.
 *
 * Entries are sorted by TypeId and unique.  Two descriptors conflict iff
 * they share a type and at least one of them writes it.  Conflicts are
 * computed from type identity only, never from the entities a query
 * happens to match at runtime.
 */
class AccessDescriptor final
{
public:
    AccessDescriptor() = default;

    /**
     * @brief Builds a descriptor from raw declarations.
     *
     * Repeated declarations with the same mode are collapsed.
     *
     * @return kSelfConflictingAccess if one type is declared both
     *         read-only and read-write.
     */
    [[nodiscard]] static core::Expected<AccessDescriptor> make(std::span<const TypeAccess> declared);

    /** @brief True if this and @p other cannot run in the same wave. */
    [[nodiscard]] bool conflictsWith(const AccessDescriptor &other) const noexcept;

    /** @brief Declared mode for @p id, if any. */
    [[nodiscard]] std::optional<AccessMode> modeOf(TypeId id) const noexcept;

    [[nodiscard]] std::span<const TypeAccess> entries() const noexcept { return _entries; }

    /** @brief Declared component types, sorted by TypeId. */
    [[nodiscard]] const std::vector<TypeId> &components() const noexcept { return _components; }

    /** @brief Declared resource types, sorted by TypeId. */
    [[nodiscard]] const std::vector<TypeId> &resources() const noexcept { return _resources; }

    /** @brief True when the system declares no component (runs once per tick). */
    [[nodiscard]] bool isResourceOnly() const noexcept { return _components.empty(); }

private:
    std::vector<TypeAccess> _entries;
    std::vector<TypeId>     _components;
    std::vector<TypeId>     _resources;
};

} // namespace hive::ecs

#endif // HIVE_ECS_ACCESS_HPP
