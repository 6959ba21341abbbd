/**
 * @file TestRunner.cpp
 * @brief TestRunner implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/engine/TestRunner.hpp>
#include <hive/core/Log.hpp>

#include <algorithm>
#include <exception>

namespace hive::engine {

bool TestReport::passed() const noexcept
{
    return failedCount() == 0;
}

core::u32 TestReport::passedCount() const noexcept
{
    return static_cast<core::u32>(
        std::count_if(results.begin(), results.end(), [](const TestResult& r) { return r.passed; }));
}

core::u32 TestReport::failedCount() const noexcept
{
    return static_cast<core::u32>(results.size()) - passedCount();
}

core::Expected<void> expect(bool condition, std::string message, std::source_location loc)
{
    if (condition)
    {
        return {};
    }
    return core::makeError(core::ErrorCode::kAssertionFailed, std::move(message), loc);
}

core::Expected<void> TestRunner::add(std::string name, TestFn fn)
{
    if (name.empty() || !fn)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "a test needs a name and a body");
    }
    const bool duplicate = std::any_of(_tests.begin(), _tests.end(),
                                       [&name](const Entry& e) { return e.name == name; });
    if (duplicate)
    {
        return core::makeError(core::ErrorCode::kAlreadyExists, "test '" + name + "' is already registered");
    }
    _tests.push_back(Entry{std::move(name), std::move(fn)});
    return {};
}

TestReport TestRunner::run(ecs::World& world) const
{
    return run(world, {});
}

TestReport TestRunner::run(ecs::World& world, std::string_view filter) const
{
    TestReport report;

    for (const Entry& test : _tests)
    {
        if (!filter.empty() && test.name.find(filter) == std::string::npos)
        {
            continue;
        }

        TestResult result{test.name, true, {}};
        try
        {
            auto outcome = test.fn(world);
            if (!outcome)
            {
                result.passed  = false;
                result.message = outcome.error().format();
            }
        }
        catch (const std::exception& ex)
        {
            result.passed  = false;
            result.message = std::string{"uncaught exception: "} + ex.what();
        }

        if (result.passed)
        {
            core::Log::info("Test", "[PASS] " + result.name);
        }
        else
        {
            core::Log::error("Test", "[FAIL] " + result.name + ": " + result.message);
        }
        report.results.push_back(std::move(result));
    }

    core::Log::info("Test", std::to_string(report.passedCount()) + "/" + std::to_string(report.results.size()) +
                                " tests passed");
    return report;
}

} // namespace hive::engine
