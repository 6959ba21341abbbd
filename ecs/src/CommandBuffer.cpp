/**
 * @file CommandBuffer.cpp
 * @brief Command recording.  Application lives in World::applyCommands().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/ecs/CommandBuffer.hpp>
#include <hive/core/Log.hpp>

namespace hive::ecs {

CommandBuffer::CommandBuffer(const TypeRegistry &types)
    : _types{&types}
{}

PendingEntity CommandBuffer::createEntity()
{
    const PendingEntity pending{_pendingCount++};
    _commands.push_back(Command{CommandOp::CreateEntity, pending, kInvalidTypeId, {}});
    return pending;
}

void CommandBuffer::destroyEntity(Entity entity)
{
    _commands.push_back(Command{CommandOp::DestroyEntity, entity, kInvalidTypeId, {}});
}

void CommandBuffer::addComponent(CommandTarget target, TypeId type, core::Any value)
{
    _commands.push_back(Command{CommandOp::AddComponent, target, type, std::move(value)});
}

void CommandBuffer::removeComponent(CommandTarget target, TypeId type)
{
    _commands.push_back(Command{CommandOp::RemoveComponent, target, type, {}});
}

void CommandBuffer::clear() noexcept
{
    _commands.clear();
    _pendingCount = 0;
    _rejected     = 0;
}

TypeId CommandBuffer::resolve(std::type_index cppType)
{
    auto id = _types->find(cppType);
    if (!id)
    {
        ++_rejected;
        core::Log::warn("ECS", "command dropped: " + id.error().message());
        return kInvalidTypeId;
    }
    return *id;
}

} // namespace hive::ecs
