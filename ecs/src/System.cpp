/**
 * @file System.cpp
 * @brief SystemContext access checks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/ecs/System.hpp>
#include <hive/ecs/World.hpp>
#include <hive/core/Log.hpp>

namespace hive::ecs {

SystemContext::SystemContext(World &world, const SystemRecord &system, CommandBuffer &commands,
                             core::f32 deltaTime) noexcept
    : _world{world}
    , _system{system}
    , _commands{commands}
    , _deltaTime{deltaTime}
{}

bool SystemContext::isAlive(Entity entity) const noexcept { return _world.isAlive(entity); }

const void *SystemContext::readRaw(TypeId type, Entity target)
{
    if (!check(type, AccessMode::ReadOnly))
    {
        return nullptr;
    }

    if (_world.types().info(type).kind == TypeKind::Resource)
    {
        return _world.resourceSlot(type)->readRaw();
    }

    if (!_world.isAlive(target))
    {
        return nullptr;
    }
    return _world.componentStorage(type)->readRaw(target.index());
}

void *SystemContext::writeRaw(TypeId type, Entity target)
{
    if (!check(type, AccessMode::ReadWrite))
    {
        return nullptr;
    }

    if (_world.types().info(type).kind == TypeKind::Resource)
    {
        return _world.resourceSlot(type)->writeRaw();
    }

    if (!_world.isAlive(target))
    {
        return nullptr;
    }
    return _world.componentStorage(type)->writeRaw(target.index());
}

std::optional<core::Error> SystemContext::takeViolation() noexcept
{
    std::optional<core::Error> out;
    out.swap(_violation);
    return out;
}

TypeId SystemContext::resolve(std::type_index cppType) const noexcept
{
    auto id = _world.types().find(cppType);
    return id ? *id : kInvalidTypeId;
}

bool SystemContext::check(TypeId type, AccessMode wanted)
{
    const std::optional<AccessMode> declared = _system.access.modeOf(type);
    if (declared && (wanted == AccessMode::ReadOnly || *declared == AccessMode::ReadWrite))
    {
        return true;
    }

    if (!_violation)
    {
        std::string what = type == kInvalidTypeId ? std::string{"an unregistered type"}
                                                  : "'" + _world.types().info(type).name + "'";
        std::string msg  = "system '" + _system.name + "' requested " + toString(wanted) + " access to " + what +
                          (declared ? " which it declared read-only" : " which it did not declare");
        core::Log::error("ECS", msg);
        _violation = core::Error{core::ErrorCode::kAccessViolation, std::move(msg)};
    }
    return false;
}

} // namespace hive::ecs
