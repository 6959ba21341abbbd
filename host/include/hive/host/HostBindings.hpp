/**
 * @file HostBindings.hpp
 * @brief Declared-signature table for extern (host-provided) functions.
 *
 * Script declarations such as @c extern "physics" { fn raycast(...) } name a
 * library, a symbol and a signature.  The host registers the matching
 * callables here; bind() resolves a declaration and checks arity and value
 * kinds, and BoundFunction::call() checks the runtime tag of every argument
 * before invoking.  What the callable does with its arguments beyond that is
 * outside what this table can verify.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef HIVE_HOST_HOST_BINDINGS_HPP
    #define HIVE_HOST_HOST_BINDINGS_HPP

#include <hive/ecs/Entity.hpp>
#include <hive/core/Any.hpp>
#include <hive/core/Expected.hpp>
#include <hive/core/NonCopyable.hpp>
#include <hive/core/Types.hpp>

#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace hive::host {

/**
 * @enum ValueKind
 * @brief Value kinds that may cross the extern boundary.
 */
enum class ValueKind : core::u8
{
    Void,
    Bool,
    Int,    ///< core::i64
    Float,  ///< core::f64
    String, ///< std::string
    Entity, ///< ecs::Entity
    Any     ///< any payload, unchecked
};

[[nodiscard]] std::string_view toString(ValueKind kind) noexcept;

/** @brief True if @p value carries the runtime tag expected for @p kind. */
[[nodiscard]] bool matches(ValueKind kind, const core::Any &value) noexcept;

template <typename T> struct ValueKindOf;
template <> struct ValueKindOf<void>        { static constexpr ValueKind value = ValueKind::Void; };
template <> struct ValueKindOf<bool>        { static constexpr ValueKind value = ValueKind::Bool; };
template <> struct ValueKindOf<core::i64>   { static constexpr ValueKind value = ValueKind::Int; };
template <> struct ValueKindOf<core::f64>   { static constexpr ValueKind value = ValueKind::Float; };
template <> struct ValueKindOf<std::string> { static constexpr ValueKind value = ValueKind::String; };
template <> struct ValueKindOf<ecs::Entity> { static constexpr ValueKind value = ValueKind::Entity; };
template <> struct ValueKindOf<core::Any>   { static constexpr ValueKind value = ValueKind::Any; };

/**
 * @struct Signature
 */
struct Signature
{
    std::vector<ValueKind> params;
    ValueKind              result{ValueKind::Void};

    [[nodiscard]] bool operator==(const Signature &) const = default;

    /** @brief "(int, float) -> bool" */
    [[nodiscard]] std::string toString() const;
};

/**
 * @struct ExternDecl
 * @brief What a script declares: library, symbol and expected signature.
 */
struct ExternDecl
{
    std::string library;
    std::string symbol;
    Signature   signature;

    [[nodiscard]] std::string qualifiedName() const { return library + "::" + symbol; }
};

/** @brief Erased host callable.  Arguments arrive already tag-checked. */
using HostFunction = std::function<core::Expected<core::Any>(std::span<core::Any>)>;

/**
 * @class BoundFunction
 * @brief Result of a successful bind().  Cheap to copy.
 */
class BoundFunction final
{
public:
    BoundFunction(ExternDecl decl, std::shared_ptr<const HostFunction> fn);

    [[nodiscard]] const ExternDecl &decl() const noexcept { return _decl; }

    /**
     * @brief Invokes the host function.
     * @return kSignatureMismatch on wrong arity, kCastFailed if an argument
     *         or the returned value carries the wrong tag, or whatever the
     *         host function itself returns.
     */
    [[nodiscard]] core::Expected<core::Any> call(std::span<core::Any> args) const;

private:
    ExternDecl                          _decl;
    std::shared_ptr<const HostFunction> _fn;
};

/**
 * @class HostBindings
 * @brief (library, symbol) -> signature + callable.
 */
class HostBindings final : public core::NonCopyable<HostBindings>
{
public:
    HostBindings()  = default;
    ~HostBindings() = default;

    /**
     * @brief Registers an erased host function.
     * @return kAlreadyExists if the symbol is already defined in @p library,
     *         kInvalidArgument for an empty name or function, or a Void
     *         parameter.
     */
    core::Expected<void> define(std::string library, std::string symbol, Signature signature, HostFunction fn);

    /** @brief Registers a typed host function; the signature is derived from @p fn. */
    template <typename R, typename... Args>
    core::Expected<void> define(std::string library, std::string symbol, std::function<R(Args...)> fn)
    {
        Signature signature{{ValueKindOf<std::decay_t<Args>>::value...}, ValueKindOf<R>::value};
        HostFunction erased = [fn = std::move(fn)](std::span<core::Any> args) -> core::Expected<core::Any> {
            return invokeTyped<R, Args...>(fn, args, std::index_sequence_for<Args...>{});
        };
        return define(std::move(library), std::move(symbol), std::move(signature), std::move(erased));
    }

    /**
     * @brief Resolves a declaration.
     * @return kSymbolNotFound if nothing is defined under that name,
     *         kSignatureMismatch if the declared signature differs from the
     *         registered one.
     */
    [[nodiscard]] core::Expected<BoundFunction> bind(const ExternDecl &decl) const;

    [[nodiscard]] bool        contains(std::string_view library, std::string_view symbol) const;
    [[nodiscard]] core::usize size() const noexcept { return _entries.size(); }

private:
    struct Entry
    {
        Signature                           signature;
        std::shared_ptr<const HostFunction> fn;
    };

    template <typename T>
    static T &argAs(core::Any &value)
    {
        if constexpr (std::is_same_v<T, core::Any>)
            return value;
        else
            return *value.cast<T>().value();
    }

    template <typename R, typename... Args, core::usize... I>
    static core::Expected<core::Any> invokeTyped(const std::function<R(Args...)> &fn, std::span<core::Any> args,
                                                 std::index_sequence<I...>)
    {
        if constexpr (std::is_void_v<R>)
        {
            fn(argAs<std::decay_t<Args>>(args[I])...);
            return core::Any{};
        }
        else
        {
            return core::Any{fn(argAs<std::decay_t<Args>>(args[I])...)};
        }
    }

    std::map<std::string, Entry, std::less<>> _entries;
};

} // namespace hive::host

#endif // HIVE_HOST_HOST_BINDINGS_HPP
