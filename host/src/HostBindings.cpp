/**
 * @file HostBindings.cpp
 * @brief Extern symbol table and call-time tag checks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <hive/host/HostBindings.hpp>
#include <hive/core/Log.hpp>

#include <algorithm>
#include <sstream>

namespace hive::host {

namespace {

[[nodiscard]] std::string keyOf(std::string_view library, std::string_view symbol)
{
    std::string key;
    key.reserve(library.size() + symbol.size() + 2);
    key.append(library).append("::").append(symbol);
    return key;
}

} // namespace

std::string_view toString(ValueKind kind) noexcept
{
    switch (kind)
    {
    case ValueKind::Void:   return "void";
    case ValueKind::Bool:   return "bool";
    case ValueKind::Int:    return "int";
    case ValueKind::Float:  return "float";
    case ValueKind::String: return "string";
    case ValueKind::Entity: return "entity";
    case ValueKind::Any:    return "any";
    }
    return "?";
}

bool matches(ValueKind kind, const core::Any &value) noexcept
{
    switch (kind)
    {
    case ValueKind::Void:   return !value.hasValue();
    case ValueKind::Bool:   return value.is<bool>();
    case ValueKind::Int:    return value.is<core::i64>();
    case ValueKind::Float:  return value.is<core::f64>();
    case ValueKind::String: return value.is<std::string>();
    case ValueKind::Entity: return value.is<ecs::Entity>();
    case ValueKind::Any:    return true;
    }
    return false;
}

std::string Signature::toString() const
{
    std::ostringstream out;
    out << '(';
    for (core::usize i = 0; i < params.size(); ++i)
    {
        out << (i ? ", " : "") << host::toString(params[i]);
    }
    out << ") -> " << host::toString(result);
    return out.str();
}

// ========================================================================== //
//  BoundFunction                                                             //
// ========================================================================== //

BoundFunction::BoundFunction(ExternDecl decl, std::shared_ptr<const HostFunction> fn)
    : _decl{std::move(decl)}
    , _fn{std::move(fn)}
{}

core::Expected<core::Any> BoundFunction::call(std::span<core::Any> args) const
{
    const Signature &sig = _decl.signature;
    if (args.size() != sig.params.size())
    {
        return core::makeError(core::ErrorCode::kSignatureMismatch,
                               _decl.qualifiedName() + " takes " + std::to_string(sig.params.size()) +
                                   " arguments, got " + std::to_string(args.size()));
    }

    for (core::usize i = 0; i < args.size(); ++i)
    {
        if (!matches(sig.params[i], args[i]))
        {
            return core::makeError(core::ErrorCode::kCastFailed,
                                   "argument " + std::to_string(i) + " of " + _decl.qualifiedName() + " must be " +
                                       std::string{toString(sig.params[i])});
        }
    }

    core::Any result = HIVE_TRY((*_fn)(args));
    if (!matches(sig.result, result))
    {
        return core::makeError(core::ErrorCode::kCastFailed,
                               _decl.qualifiedName() + " returned a value that is not " +
                                   std::string{toString(sig.result)});
    }
    return result;
}

// ========================================================================== //
//  HostBindings                                                              //
// ========================================================================== //

core::Expected<void> HostBindings::define(std::string library, std::string symbol, Signature signature,
                                          HostFunction fn)
{
    if (library.empty() || symbol.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "extern library and symbol must not be empty");
    }
    if (!fn)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, keyOf(library, symbol) + " has no callable");
    }
    if (std::find(signature.params.begin(), signature.params.end(), ValueKind::Void) != signature.params.end())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               keyOf(library, symbol) + " declares a void parameter");
    }

    std::string key = keyOf(library, symbol);
    if (_entries.contains(key))
    {
        return core::makeError(core::ErrorCode::kAlreadyExists, key + " is already defined");
    }

    core::Log::debug("Host", "defined " + key + " " + signature.toString());
    _entries.emplace(std::move(key),
                     Entry{std::move(signature), std::make_shared<const HostFunction>(std::move(fn))});
    return {};
}

core::Expected<BoundFunction> HostBindings::bind(const ExternDecl &decl) const
{
    auto it = _entries.find(decl.qualifiedName());
    if (it == _entries.end())
    {
        return core::makeError(core::ErrorCode::kSymbolNotFound, "no host function " + decl.qualifiedName());
    }

    const Signature &registered = it->second.signature;
    if (registered != decl.signature)
    {
        core::Log::warn("Host", decl.qualifiedName() + " declared as " + decl.signature.toString() +
                                    " but the host provides " + registered.toString());
        return core::makeError(core::ErrorCode::kSignatureMismatch,
                               decl.qualifiedName() + ": declared " + decl.signature.toString() + ", host provides " +
                                   registered.toString());
    }
    return BoundFunction{decl, it->second.fn};
}

bool HostBindings::contains(std::string_view library, std::string_view symbol) const
{
    return _entries.contains(keyOf(library, symbol));
}

} // namespace hive::host
