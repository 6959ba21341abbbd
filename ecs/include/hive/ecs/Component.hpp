/**
 * @file Component.hpp
 * @brief Metadata for registered component and resource types.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_COMPONENT_HPP
    #define HIVE_ECS_COMPONENT_HPP

#include <hive/core/Types.hpp>

#include <limits>
#include <string>
#include <typeindex>

namespace hive::ecs {

/**
 * @brief Dense identifier of a registered type, assigned in registration
 *        order.  Components and resources share one id space.
 */
using TypeId = core::u32;

inline constexpr TypeId kInvalidTypeId = std::numeric_limits<TypeId>::max();

/**
 * @enum TypeKind
 * @brief Whether a registered type is stored per entity or as a singleton.
 */
enum class TypeKind : core::u8
{
    Component = 0,
    Resource  = 1
};

/**
 * @enum AccessMode
 * @brief Describes how a system accesses a type (read-only or
 *        read-write).  Used by the execution plan builder.
 */
enum class AccessMode : core::u8
{
    ReadOnly  = 0,
    ReadWrite = 1
};

/**
 * @struct TypeInfo
 * @brief Registration record of a component or resource type.
 */
struct TypeInfo
{
    TypeId          id{kInvalidTypeId};
    std::string     name;
    TypeKind        kind{TypeKind::Component};
    std::type_index cppType{typeid(void)};
    core::usize     size{0};
    core::usize     alignment{0};
};

[[nodiscard]] constexpr const char *toString(TypeKind kind) noexcept
{
    return kind == TypeKind::Component ? "component" : "resource";
}

[[nodiscard]] constexpr const char *toString(AccessMode mode) noexcept
{
    return mode == AccessMode::ReadWrite ? "read-write" : "read-only";
}

} // namespace hive::ecs

#endif // HIVE_ECS_COMPONENT_HPP
