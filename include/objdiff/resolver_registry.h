// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file resolver_registry.h
/// @brief Named value transforms applied to fields before comparison.
///
/// A field declares a resolver key through FieldOptions::resolver. When the
/// Differ reaches such a field it looks the key up here and, if a resolver
/// is registered, compares resolver(raw) instead of the raw value.
///
/// Usage:
/// @code
///   differ.resolvers().register_resolver("user_id",
///       make_resolver<int>([&](int id) { return directory.display_name(id); }));
/// @endcode

#pragma once

#include <objdiff/api.h>
#include <objdiff/describe.h>
#include <objdiff/errors.h>
#include <objdiff/value.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>

namespace objdiff {

using Resolver = std::function<Value(const Value&)>;

/// Thread-safe table of resolvers; owned by a Differ.
///
/// Lookups take a shared lock, mutations an exclusive one. Resolvers are
/// copied out of the table and invoked without holding the lock.
class OBJDIFF_API ResolverRegistry {
public:
    ResolverRegistry() = default;
    ResolverRegistry(const ResolverRegistry& other);
    ResolverRegistry& operator=(const ResolverRegistry& other);

    /// Register `resolver` under `key`, replacing any previous one.
    /// @return the resolver that was replaced, if any
    std::optional<Resolver> register_resolver(std::string key, Resolver resolver);

    /// Remove the resolver under `key`; unknown keys are ignored
    void unregister_resolver(std::string_view key);

    [[nodiscard]] std::optional<Resolver> lookup(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view key) const noexcept {
            return std::hash<std::string_view>{}(key);
        }
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Resolver, KeyHash, std::equal_to<>> resolvers_;
};

namespace detail {

template <typename In>
[[nodiscard]] std::optional<In> value_as(const Value& v)
{
    if constexpr (std::is_same_v<In, Value>) {
        return v;
    } else if constexpr (std::is_same_v<In, std::string>) {
        if (auto* s = v.get_if<std::string>()) return *s;
        return std::nullopt;
    } else if constexpr (std::is_same_v<In, bool>) {
        if (auto* b = v.get_if<bool>()) return *b;
        return std::nullopt;
    } else if constexpr (std::is_arithmetic_v<In>) {
        return std::visit([](const auto& x) -> std::optional<In> {
            using X = std::decay_t<decltype(x)>;
            if constexpr (std::is_arithmetic_v<X> && !std::is_same_v<X, bool>) {
                return static_cast<In>(x);
            } else {
                return std::nullopt;
            }
        }, v.data);
    } else {
        static_assert(always_false<In>, "make_resolver: unsupported input type");
    }
}

} // namespace detail

/// Adapt a typed function `Out fn(const In&)` into a Resolver.
///
/// A null input is passed through without calling `fn`. Numeric inputs are
/// converted between arithmetic types; any other mismatch throws
/// ResolverInputError.
template <typename In, typename Fn>
    requires std::invocable<const Fn&, const In&>
[[nodiscard]] Resolver make_resolver(Fn fn)
{
    return [fn = std::move(fn)](const Value& raw) -> Value {
        if (raw.is_null()) return raw;
        auto input = detail::value_as<In>(raw);
        if (!input) {
            throw ResolverInputError(boost::core::demangle(typeid(In).name()), raw.type_name());
        }
        return to_value(std::invoke(fn, *input));
    };
}

} // namespace objdiff
