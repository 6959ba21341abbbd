/**
 * @file Any.hpp
 * @brief Type-erased value carrying a runtime type tag.
 *
 * Any is the currency for values whose type is only known at runtime:
 * component payloads recorded by name in a command buffer and arguments
 * crossing the host-function boundary.  Narrowing to a concrete type never
 * throws; cast() reports a kCastFailed error instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HIVE_CORE_ANY_HPP
    #define HIVE_CORE_ANY_HPP

    #include "Expected.hpp"

    #include <any>
    #include <concepts>
    #include <string>
    #include <type_traits>
    #include <typeindex>
    #include <typeinfo>
    #include <utility>

namespace hive::core {

class Any final {
public:
    Any() = default;

    /**
     * @brief Wraps @p value.  The runtime tag is std::decay_t<T>.
     */
    template <typename T>
        requires (!std::same_as<std::decay_t<T>, Any>)
    explicit Any(T &&value)
        : _value(std::forward<T>(value))
    {}

    Any(const Any &)            = default;
    Any(Any &&) noexcept        = default;
    Any &operator=(const Any &) = default;
    Any &operator=(Any &&) noexcept = default;

    [[nodiscard]] bool hasValue() const noexcept { return _value.has_value(); }

    /** @brief Runtime type tag; typeid(void) when empty. */
    [[nodiscard]] std::type_index type() const noexcept { return std::type_index(_value.type()); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept
    {
        return _value.type() == typeid(T);
    }

    /**
     * @brief Narrows to @p T.
     * @return Pointer to the payload, or kCastFailed if the tag differs.
     */
    template <typename T>
    [[nodiscard]] Expected<T *> cast()
    {
        if (T *p = std::any_cast<T>(&_value))
            return p;
        return makeError(ErrorCode::kCastFailed, castMessage(typeid(T)));
    }

    template <typename T>
    [[nodiscard]] Expected<const T *> cast() const
    {
        if (const T *p = std::any_cast<T>(&_value))
            return p;
        return makeError(ErrorCode::kCastFailed, castMessage(typeid(T)));
    }

    /**
     * @brief Moves the payload out as @p T, leaving the Any empty on success.
     */
    template <typename T>
    [[nodiscard]] Expected<T> take()
    {
        T *p = std::any_cast<T>(&_value);
        if (!p)
            return makeError(ErrorCode::kCastFailed, castMessage(typeid(T)));
        T out = std::move(*p);
        _value.reset();
        return out;
    }

    void reset() noexcept { _value.reset(); }

private:
    [[nodiscard]] std::string castMessage(const std::type_info &target) const
    {
        std::string msg = "cannot cast value of type '";
        msg += _value.has_value() ? _value.type().name() : "<empty>";
        msg += "' to '";
        msg += target.name();
        msg += '\'';
        return msg;
    }

    std::any _value;
};

} // namespace hive::core

#endif // HIVE_CORE_ANY_HPP
