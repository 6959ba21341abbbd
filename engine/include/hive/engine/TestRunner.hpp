/**
 * @file TestRunner.hpp
 * @brief In-engine test surface for script-declared test functions.
 *
 * Tests are registered apart from systems and are never scheduled: run()
 * calls each one directly against a world, in registration order, and
 * collects a pass/fail verdict with the assertion message.  A failing test
 * never stops the runner.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_ENGINE_TEST_RUNNER_HPP
    #define HIVE_ENGINE_TEST_RUNNER_HPP

#include <hive/ecs/World.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/Types.hpp>

#include <functional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace hive::engine {

/** @brief A test body.  Fails by returning an error, usually from expect(). */
using TestFn = std::function<core::Expected<void>(ecs::World&)>;

struct TestResult
{
    std::string name;
    bool        passed{false};
    std::string message;
};

struct TestReport
{
    std::vector<TestResult> results;

    /** @brief True when every test passed (vacuously true for none). */
    [[nodiscard]] bool      passed() const noexcept;
    [[nodiscard]] core::u32 passedCount() const noexcept;
    [[nodiscard]] core::u32 failedCount() const noexcept;
};

/**
 * @brief Assertion helper for test bodies.
 * @return kAssertionFailed carrying @p message when @p condition is false.
 */
[[nodiscard]] core::Expected<void> expect(bool condition, std::string message,
                                          std::source_location loc = std::source_location::current());

class TestRunner
{
public:
    TestRunner()  = default;
    ~TestRunner() = default;

    TestRunner(const TestRunner&)            = delete;
    TestRunner& operator=(const TestRunner&) = delete;

    /** @return kAlreadyExists on a duplicate name, kInvalidArgument on an empty one. */
    core::Expected<void> add(std::string name, TestFn fn);

    /** @brief Runs every test in registration order. */
    [[nodiscard]] TestReport run(ecs::World& world) const;

    /** @brief Runs the tests whose name contains @p filter. */
    [[nodiscard]] TestReport run(ecs::World& world, std::string_view filter) const;

    [[nodiscard]] core::usize size() const noexcept { return _tests.size(); }

private:
    struct Entry
    {
        std::string name;
        TestFn      fn;
    };

    std::vector<Entry> _tests;
};

} // namespace hive::engine

#endif // HIVE_ENGINE_TEST_RUNNER_HPP
