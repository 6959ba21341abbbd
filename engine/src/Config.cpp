/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/engine/Config.hpp>

namespace hive::engine {

Config::Builder& Config::Builder::tickRate(core::u32 hz) noexcept
{
    _tickRate = hz;
    return *this;
}

Config::Builder& Config::Builder::workerCount(core::u32 n) noexcept
{
    _workerCount = n;
    return *this;
}

Config::Builder& Config::Builder::initialEntityCapacity(core::u32 n) noexcept
{
    _initialEntityCapacity = n;
    return *this;
}

Config::Builder& Config::Builder::commandFlush(ecs::CommandFlush flush) noexcept
{
    _commandFlush = flush;
    return *this;
}

Config::Builder& Config::Builder::validateBorrows(bool enabled) noexcept
{
    _validateBorrows = enabled;
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg._tickRate              = _tickRate;
    cfg._workerCount           = _workerCount;
    cfg._initialEntityCapacity = _initialEntityCapacity;
    cfg._commandFlush          = _commandFlush;
    cfg._validateBorrows       = _validateBorrows;
    cfg._logLevel              = _logLevel;
    return cfg;
}

core::Expected<void> Config::validate() const
{
    if (_tickRate == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "tickRate must be greater than zero");
    }
    if (_initialEntityCapacity == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "initialEntityCapacity must be greater than zero");
    }
    return {};
}

} // namespace hive::engine
