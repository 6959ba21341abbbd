/**
 * @file TypeRegistry.hpp
 * @brief Name and C++ type lookup for registered components and resources.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_ECS_TYPE_REGISTRY_HPP
    #define HIVE_ECS_TYPE_REGISTRY_HPP

#include <hive/ecs/Component.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/Types.hpp>

#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace hive::ecs {

/**
 * @class TypeRegistry
 * @brief Single namespace shared by components and resources.
 *
 * A name, or a C++ type, can be registered once, in one role only.
 */
class TypeRegistry final
{
public:
    /**
     * @brief Registers a new type.
     * @return The assigned TypeId, kAlreadyExists on a duplicate name or
     *         C++ type, kInvalidArgument on an empty name.
     */
    [[nodiscard]] core::Expected<TypeId> add(std::string name,
                                             TypeKind kind,
                                             std::type_index cppType,
                                             core::usize size,
                                             core::usize alignment);

    /** @brief Resolves a name, or kUnknownType. */
    [[nodiscard]] core::Expected<TypeId> find(std::string_view name) const;

    /** @brief Resolves a C++ type, or kUnknownType. */
    [[nodiscard]] core::Expected<TypeId> find(std::type_index cppType) const;

    [[nodiscard]] const TypeInfo &info(TypeId id) const;

    [[nodiscard]] bool contains(TypeId id) const noexcept { return id < _types.size(); }

    [[nodiscard]] core::u32 size() const noexcept { return static_cast<core::u32>(_types.size()); }

private:
    std::vector<TypeInfo>                       _types;
    std::unordered_map<std::string, TypeId>     _byName;
    std::unordered_map<std::type_index, TypeId> _byCppType;
};

} // namespace hive::ecs

#endif // HIVE_ECS_TYPE_REGISTRY_HPP
