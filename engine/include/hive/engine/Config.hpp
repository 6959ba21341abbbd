/**
 * @file Config.hpp
 * @brief Runtime configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_ENGINE_CONFIG_HPP
    #define HIVE_ENGINE_CONFIG_HPP

#include <hive/ecs/SystemScheduler.hpp>
#include <hive/core/Constants.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/Log.hpp>
#include <hive/core/Types.hpp>

namespace hive::engine {

/** @brief Immutable runtime configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& tickRate(core::u32 hz) noexcept;
        Builder& workerCount(core::u32 n) noexcept;
        Builder& initialEntityCapacity(core::u32 n) noexcept;
        Builder& commandFlush(ecs::CommandFlush flush) noexcept;
        Builder& validateBorrows(bool enabled) noexcept;
        Builder& logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::u32         _tickRate{core::kTickRate};
        core::u32         _workerCount{core::kDefaultWorkerCount};
        core::u32         _initialEntityCapacity{core::kInitialEntityCapacity};
        ecs::CommandFlush _commandFlush{ecs::CommandFlush::PerWave};
        bool              _validateBorrows{true};
        core::LogLevel    _logLevel{core::LogLevel::kInfo};
    };

    [[nodiscard]] core::u32         tickRate()              const noexcept { return _tickRate; }
    [[nodiscard]] core::u32         workerCount()           const noexcept { return _workerCount; }
    [[nodiscard]] core::u32         initialEntityCapacity() const noexcept { return _initialEntityCapacity; }
    [[nodiscard]] ecs::CommandFlush commandFlush()          const noexcept { return _commandFlush; }
    [[nodiscard]] bool              validateBorrows()       const noexcept { return _validateBorrows; }
    [[nodiscard]] core::LogLevel    logLevel()              const noexcept { return _logLevel; }

    /** @brief Fixed step derived from tickRate(), in seconds. */
    [[nodiscard]] core::f64 fixedDeltaTime() const noexcept { return 1.0 / static_cast<core::f64>(_tickRate); }

    /** @brief kInvalidArgument for a zero tick rate or entity capacity. */
    [[nodiscard]] core::Expected<void> validate() const;

private:
    friend class Builder;

    core::u32         _tickRate{core::kTickRate};
    core::u32         _workerCount{core::kDefaultWorkerCount};
    core::u32         _initialEntityCapacity{core::kInitialEntityCapacity};
    ecs::CommandFlush _commandFlush{ecs::CommandFlush::PerWave};
    bool              _validateBorrows{true};
    core::LogLevel    _logLevel{core::LogLevel::kInfo};
};

} // namespace hive::engine

#endif // HIVE_ENGINE_CONFIG_HPP
