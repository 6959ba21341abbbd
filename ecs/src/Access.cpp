/**
 * @file Access.cpp
 * @brief AccessDescriptor normalisation and pairwise conflict test.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/ecs/Access.hpp>

#include <algorithm>
#include <string>

namespace hive::ecs {

core::Expected<AccessDescriptor> AccessDescriptor::make(std::span<const TypeAccess> declared)
{
    AccessDescriptor desc;
    desc._entries.assign(declared.begin(), declared.end());

    std::sort(desc._entries.begin(), desc._entries.end(),
        [](const TypeAccess &a, const TypeAccess &b) {
            return a.id < b.id || (a.id == b.id && a.mode < b.mode);
        });

    for (core::usize i = 0; i < desc._entries.size(); ++i)
    {
        const TypeAccess &a = desc._entries[i];
        if (a.id == kInvalidTypeId)
        {
            return core::makeError(core::ErrorCode::kUnknownType, "access to an unregistered type");
        }
        if (i > 0 && desc._entries[i - 1].id == a.id && desc._entries[i - 1].mode != a.mode)
        {
            return core::makeError(core::ErrorCode::kSelfConflictingAccess,
                "type #" + std::to_string(a.id) + " is declared both read-only and read-write");
        }
    }

    desc._entries.erase(std::unique(desc._entries.begin(), desc._entries.end()), desc._entries.end());

    for (const TypeAccess &a : desc._entries)
    {
        if (a.kind == TypeKind::Component)
            desc._components.push_back(a.id);
        else
            desc._resources.push_back(a.id);
    }

    return desc;
}

bool AccessDescriptor::conflictsWith(const AccessDescriptor &other) const noexcept
{
    auto lhs = _entries.begin();
    auto rhs = other._entries.begin();

    while (lhs != _entries.end() && rhs != other._entries.end())
    {
        if (lhs->id < rhs->id)
        {
            ++lhs;
        }
        else if (rhs->id < lhs->id)
        {
            ++rhs;
        }
        else
        {
            if (lhs->mode == AccessMode::ReadWrite || rhs->mode == AccessMode::ReadWrite)
            {
                return true;
            }
            ++lhs;
            ++rhs;
        }
    }
    return false;
}

std::optional<AccessMode> AccessDescriptor::modeOf(TypeId id) const noexcept
{
    auto it = std::lower_bound(_entries.begin(), _entries.end(), id,
        [](const TypeAccess &a, TypeId key) { return a.id < key; });
    if (it == _entries.end() || it->id != id)
    {
        return std::nullopt;
    }
    return it->mode;
}

} // namespace hive::ecs
