/**
 * @file TestError.cpp
 * @brief Unit tests for hive::core::Error, Expected and the TRY macros.
 */

#include <catch2/catch.hpp>

#include <hive/core/Error.hpp>
#include <hive/core/Expected.hpp>

#include <string>

using namespace hive::core;

namespace {

Expected<int> parsePositive(int value)
{
    if (value <= 0)
    {
        return makeError(ErrorCode::kInvalidArgument, "value must be positive");
    }
    return value;
}

Expected<int> doubled(int value)
{
    const int parsed = HIVE_TRY(parsePositive(value));
    return parsed * 2;
}

Expected<void> checked(int value)
{
    HIVE_TRY_VOID(parsePositive(value));
    return {};
}

} // namespace

TEST_CASE("Error carries code, message and location", "[core][error]")
{
    const Error err{ErrorCode::kUnknownType, "no such type"};

    REQUIRE(err.code() == ErrorCode::kUnknownType);
    REQUIRE(err.message() == "no such type");
    REQUIRE(err.location().line() > 0);
}

TEST_CASE("Error::format includes the code name and message", "[core][error]")
{
    const Error err{ErrorCode::kSelfConflictingAccess, "Position read and written"};
    const std::string text = err.format();

    REQUIRE(text.find("[SelfConflictingAccess]") != std::string::npos);
    REQUIRE(text.find("Position read and written") != std::string::npos);
    REQUIRE(text.find("TestError.cpp") != std::string::npos);
}

TEST_CASE("errorCodeName covers every code", "[core][error]")
{
    REQUIRE(errorCodeName(ErrorCode::kAccessViolation) == "AccessViolation");
    REQUIRE(errorCodeName(ErrorCode::kCastFailed) == "CastFailed");
    REQUIRE(errorCodeName(ErrorCode::kAssertionFailed) == "AssertionFailed");
    REQUIRE(errorCodeName(ErrorCode::kSignatureMismatch) == "SignatureMismatch");
}

TEST_CASE("HIVE_TRY propagates errors and unwraps values", "[core][expected]")
{
    auto ok = doubled(21);
    REQUIRE(ok.has_value());
    REQUIRE(*ok == 42);

    auto bad = doubled(-1);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code() == ErrorCode::kInvalidArgument);
}

TEST_CASE("HIVE_TRY_VOID propagates errors", "[core][expected]")
{
    REQUIRE(checked(3).has_value());
    REQUIRE(checked(0).error().code() == ErrorCode::kInvalidArgument);
}
