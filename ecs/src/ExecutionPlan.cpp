/**
 * @file ExecutionPlan.cpp
 * @brief Greedy wave builder and plan validation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/ecs/ExecutionPlan.hpp>

#include <sstream>

namespace hive::ecs {

ExecutionPlan::ExecutionPlan(std::vector<Wave> waves, core::u64 revision)
    : _waves{std::move(waves)}
    , _revision{revision}
{}

ExecutionPlan ExecutionPlan::build(std::span<const SystemRecord> systems, core::u64 revision)
{
    ExecutionPlan plan;
    plan._revision = revision;

    const core::u32 n = static_cast<core::u32>(systems.size());
    for (core::u32 i = 0; i < n; ++i)
    {
        const AccessDescriptor &access = systems[i].access;

        Wave *target = nullptr;
        for (Wave &wave : plan._waves)
        {
            bool conflict = false;
            for (core::u32 member : wave.systems)
            {
                if (access.conflictsWith(systems[member].access))
                {
                    conflict = true;
                    break;
                }
            }
            if (!conflict)
            {
                target = &wave;
                break;
            }
        }

        if (target == nullptr)
        {
            plan._waves.emplace_back();
            target = &plan._waves.back();
        }
        target->systems.push_back(i);
    }

    return plan;
}

core::Expected<void> ExecutionPlan::validate(std::span<const SystemRecord> systems) const
{
    std::vector<bool> seen(systems.size(), false);

    for (core::u32 w = 0; w < _waves.size(); ++w)
    {
        const Wave &wave = _waves[w];
        if (wave.systems.empty())
        {
            return core::makeError(core::ErrorCode::kInvalidArgument, "wave " + std::to_string(w) + " is empty");
        }

        for (core::usize i = 0; i < wave.systems.size(); ++i)
        {
            const core::u32 a = wave.systems[i];
            if (a >= systems.size())
            {
                return core::makeError(core::ErrorCode::kInvalidArgument,
                                       "wave " + std::to_string(w) + " names unknown system #" + std::to_string(a));
            }
            if (seen[a])
            {
                return core::makeError(core::ErrorCode::kInvalidArgument,
                                       "system '" + systems[a].name + "' is scheduled twice");
            }
            seen[a] = true;

            for (core::usize j = 0; j < i; ++j)
            {
                const core::u32 b = wave.systems[j];
                if (systems[a].access.conflictsWith(systems[b].access))
                {
                    return core::makeError(core::ErrorCode::kAccessViolation,
                                           "systems '" + systems[b].name + "' and '" + systems[a].name +
                                               "' conflict in wave " + std::to_string(w));
                }
            }
        }
    }

    for (core::usize i = 0; i < seen.size(); ++i)
    {
        if (!seen[i])
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "system '" + systems[i].name + "' is not scheduled");
        }
    }
    return {};
}

std::optional<core::u32> ExecutionPlan::waveOf(core::u32 systemIndex) const noexcept
{
    for (core::u32 w = 0; w < _waves.size(); ++w)
    {
        for (core::u32 member : _waves[w].systems)
        {
            if (member == systemIndex)
            {
                return w;
            }
        }
    }
    return std::nullopt;
}

std::string ExecutionPlan::describe(std::span<const SystemRecord> systems) const
{
    std::ostringstream out;
    for (core::u32 w = 0; w < _waves.size(); ++w)
    {
        out << "wave " << w << ':';
        const char *sep = " ";
        for (core::u32 member : _waves[w].systems)
        {
            out << sep << (member < systems.size() ? systems[member].name : "#" + std::to_string(member));
            sep = ", ";
        }
        out << '\n';
    }
    return out.str();
}

} // namespace hive::ecs
