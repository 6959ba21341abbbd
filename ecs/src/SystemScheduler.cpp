/**
 * @file SystemScheduler.cpp
 * @brief Wave dispatch, failure isolation and command flushing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/ecs/SystemScheduler.hpp>
#include <hive/ecs/BorrowTracker.hpp>
#include <hive/core/Log.hpp>

#include <atomic>
#include <exception>
#include <latch>
#include <optional>

namespace hive::ecs {

namespace {

/**
 * @brief Per-system state for one wave.  Only the worker running the system
 *        touches it until the wave joins.
 */
struct SystemRun
{
    explicit SystemRun(const TypeRegistry &types) : commands{types} {}

    CommandBuffer              commands;
    std::vector<SystemFailure> failures;
    core::u32                  invocations{0};
    bool                       acquired{false};
    std::optional<core::Error> violation;
};

[[nodiscard]] core::Expected<void> invoke(const SystemRecord &system, SystemContext &ctx)
{
    try
    {
        return system.fn(ctx);
    }
    catch (const std::exception &ex)
    {
        return core::makeError(core::ErrorCode::kSystemFatal, std::string{"uncaught exception: "} + ex.what());
    }
    catch (...)
    {
        return core::makeError(core::ErrorCode::kSystemFatal, "uncaught non-standard exception");
    }
}

void runSystem(World &world, const SystemRecord &system, SystemRun &run, core::f32 dt)
{
    SystemContext ctx{world, system, run.commands, dt};

    auto visit = [&](Entity entity) -> bool {
        ctx.bind(entity);
        ++run.invocations;
        core::Expected<void> result = invoke(system, ctx);

        if (auto violation = ctx.takeViolation())
        {
            run.violation = std::move(*violation);
            return false;
        }
        if (result)
        {
            return true;
        }

        const bool fatal = result.error().code() == core::ErrorCode::kSystemFatal;
        std::string where = entity.isValid()
            ? " on entity " + std::to_string(entity.index()) + ":" + std::to_string(entity.generation())
            : std::string{};
        if (fatal)
        {
            core::Log::error("Scheduler", "system '" + system.name + "' aborted" + where + ": " + result.error().format());
        }
        else
        {
            core::Log::warn("Scheduler", "system '" + system.name + "' failed" + where + ": " + result.error().format());
        }
        run.failures.push_back(SystemFailure{system.name, entity, std::move(result.error()), fatal});
        return !fatal;
    };

    if (system.access.isResourceOnly())
    {
        visit(Entity::null());
        return;
    }

    for (Entity entity : world.query(system.access.components()))
    {
        if (!visit(entity))
        {
            break;
        }
    }
}

/// Runs a callable when the scope is left.
template <typename F>
class ScopeExit final
{
public:
    explicit ScopeExit(F fn) : _fn{std::move(fn)} {}
    ~ScopeExit() { _fn(); }

    ScopeExit(const ScopeExit &)            = delete;
    ScopeExit &operator=(const ScopeExit &) = delete;

private:
    F _fn;
};

} // namespace

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct SystemScheduler::Impl
{
    concurrency::ThreadPool &pool;
    Options                  options;
    ExecutionPlan            plan;
    bool                     planValid{false};
    core::u32                planBuilds{0};
    core::u64                ticks{0};
    BorrowTracker            borrows;
    std::atomic<bool>        running{false};

    Impl(concurrency::ThreadPool &p, Options o) : pool{p}, options{o} {}

    void dispatch(World &world, const Wave &wave, std::vector<SystemRun> &runs, core::f32 dt);
};

void SystemScheduler::Impl::dispatch(World &world, const Wave &wave, std::vector<SystemRun> &runs, core::f32 dt)
{
    const auto systems = world.systems();

    auto task = [&, dt](core::usize slot) {
        const SystemRecord &system = systems[wave.systems[slot]];
        SystemRun          &run    = runs[slot];

        if (options.validateBorrows)
        {
            auto borrowed = borrows.acquire(system.access, system.name);
            if (!borrowed)
            {
                run.violation = std::move(borrowed.error());
                return;
            }
            run.acquired = true;
        }
        runSystem(world, system, run, dt);
    };

    if (wave.systems.size() == 1)
    {
        task(0);
        return;
    }

    std::latch barrier{static_cast<std::ptrdiff_t>(wave.systems.size())};

    for (core::usize slot = 0; slot < wave.systems.size(); ++slot)
    {
        auto job = [&task, &barrier, slot]() {
            task(slot);
            barrier.count_down();
        };

        auto queued = pool.enqueueDetached(job);
        if (!queued)
        {
            core::Log::warn("Scheduler", "thread pool rejected work, running inline: " + queued.error().message());
            job();
        }
    }

    barrier.wait();
}

// ========================================================================== //
//  Public API                                                                //
// ========================================================================== //

SystemScheduler::SystemScheduler(concurrency::ThreadPool &pool)
    : SystemScheduler(pool, Options{})
{}

SystemScheduler::SystemScheduler(concurrency::ThreadPool &pool, Options options)
    : impl_{std::make_unique<Impl>(pool, options)}
{}

SystemScheduler::~SystemScheduler() = default;

const ExecutionPlan &SystemScheduler::plan(const World &world)
{
    if (!impl_->planValid || impl_->plan.revision() != world.systemsRevision())
    {
        impl_->plan      = ExecutionPlan::build(world.systems(), world.systemsRevision());
        impl_->planValid = true;
        ++impl_->planBuilds;
        core::Log::debug("Scheduler", "execution plan rebuilt:\n" + impl_->plan.describe(world.systems()));
    }
    return impl_->plan;
}

core::Expected<TickReport> SystemScheduler::tick(World &world, core::f32 deltaTime)
{
    const ExecutionPlan &current = plan(world);
    return execute(world, current, deltaTime);
}

core::Expected<TickReport> SystemScheduler::execute(World &world, const ExecutionPlan &plan, core::f32 deltaTime)
{
    if (impl_->running.exchange(true, std::memory_order_acq_rel))
    {
        return core::makeError(core::ErrorCode::kInvalidState, "tick is already running");
    }
    world.setInTick(true);
    ScopeExit leave{[&world, this]() {
        world.setInTick(false);
        impl_->running.store(false, std::memory_order_release);
    }};

    const auto systems = world.systems();
    if (auto valid = plan.validate(systems); !valid)
    {
        // A conflicting wave is left to the runtime borrow check when it is on.
        const bool runtimeCheck = impl_->options.validateBorrows &&
                                  valid.error().code() == core::ErrorCode::kAccessViolation;
        if (!runtimeCheck)
        {
            core::Log::error("Scheduler", valid.error().format());
            return std::unexpected(std::move(valid.error()));
        }
    }

    TickReport report;
    report.tick = impl_->ticks;

    std::vector<CommandBuffer> deferred;

    for (const Wave &wave : plan.waves())
    {
        std::vector<SystemRun> runs;
        runs.reserve(wave.systems.size());
        for (core::usize i = 0; i < wave.systems.size(); ++i)
        {
            runs.emplace_back(world.types());
        }

        if (impl_->options.validateBorrows)
        {
            impl_->borrows.reset(world.types().size());
        }

        impl_->dispatch(world, wave, runs, deltaTime);
        ++report.waves;

        std::optional<core::Error> violation;
        for (core::usize slot = 0; slot < runs.size(); ++slot)
        {
            SystemRun &run = runs[slot];
            if (run.acquired)
            {
                impl_->borrows.release(systems[wave.systems[slot]].access);
            }
            report.invocations += run.invocations;
            for (SystemFailure &failure : run.failures)
            {
                report.failures.push_back(std::move(failure));
            }
            if (run.violation && !violation)
            {
                violation = std::move(run.violation);
            }
        }

        if (violation)
        {
            core::Log::fatal("Scheduler", "tick " + std::to_string(impl_->ticks) +
                                              " aborted, wave commands discarded: " + violation->format());
            ++impl_->ticks;
            return std::unexpected(std::move(*violation));
        }

        for (SystemRun &run : runs)
        {
            if (impl_->options.flush == CommandFlush::PerFrame)
            {
                deferred.push_back(std::move(run.commands));
                continue;
            }
            ApplyStats stats = world.applyCommands(run.commands);
            report.commandsApplied += stats.applied;
            report.commandsIgnored += stats.ignored;
            report.created.insert(report.created.end(), stats.created.begin(), stats.created.end());
        }
    }

    for (CommandBuffer &commands : deferred)
    {
        ApplyStats stats = world.applyCommands(commands);
        report.commandsApplied += stats.applied;
        report.commandsIgnored += stats.ignored;
        report.created.insert(report.created.end(), stats.created.begin(), stats.created.end());
    }

    ++impl_->ticks;
    core::Log::debug("Scheduler", "tick " + std::to_string(report.tick) + ": " + std::to_string(report.waves) +
                                      " waves, " + std::to_string(report.invocations) + " invocations, " +
                                      std::to_string(report.failures.size()) + " failures");
    return report;
}

core::u64 SystemScheduler::tickCount() const noexcept { return impl_->ticks; }

core::u32 SystemScheduler::planBuilds() const noexcept { return impl_->planBuilds; }

const SystemScheduler::Options &SystemScheduler::options() const noexcept { return impl_->options; }

} // namespace hive::ecs
