/**
 * @file TypeRegistry.cpp
 * @brief Shared component/resource namespace.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/ecs/TypeRegistry.hpp>
#include <hive/core/Assert.hpp>

namespace hive::ecs {

core::Expected<TypeId> TypeRegistry::add(std::string name,
                                         TypeKind kind,
                                         std::type_index cppType,
                                         core::usize size,
                                         core::usize alignment)
{
    if (name.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "type name must not be empty");
    }

    if (auto it = _byName.find(name); it != _byName.end())
    {
        const TypeInfo &existing = _types[it->second];
        return core::makeError(core::ErrorCode::kAlreadyExists,
            "'" + name + "' is already registered as a " + toString(existing.kind));
    }

    if (auto it = _byCppType.find(cppType); it != _byCppType.end())
    {
        const TypeInfo &existing = _types[it->second];
        return core::makeError(core::ErrorCode::kAlreadyExists,
            "C++ type of '" + name + "' is already registered as '" + existing.name + "'");
    }

    const auto id = static_cast<TypeId>(_types.size());
    _byName.emplace(name, id);
    _byCppType.emplace(cppType, id);
    _types.push_back(TypeInfo{id, std::move(name), kind, cppType, size, alignment});
    return id;
}

core::Expected<TypeId> TypeRegistry::find(std::string_view name) const
{
    if (auto it = _byName.find(std::string{name}); it != _byName.end())
    {
        return it->second;
    }
    return core::makeError(core::ErrorCode::kUnknownType,
        "type '" + std::string{name} + "' is not registered");
}

core::Expected<TypeId> TypeRegistry::find(std::type_index cppType) const
{
    if (auto it = _byCppType.find(cppType); it != _byCppType.end())
    {
        return it->second;
    }
    return core::makeError(core::ErrorCode::kUnknownType,
        std::string{"C++ type '"} + cppType.name() + "' is not registered");
}

const TypeInfo &TypeRegistry::info(TypeId id) const
{
    HIVE_ASSERT(contains(id));
    return _types[id];
}

} // namespace hive::ecs
