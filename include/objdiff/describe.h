// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file describe.h
/// @brief Declarative field tables for C++ types and conversion to Value.
///
/// A type takes part in field-by-field comparison by publishing a static
/// `describe` member. Being a member, it may name private storage:
///
/// @code
///   class Account : public Entity {
///   public:
///       static void describe(objdiff::TypeBuilder<Account>& b) {
///           b.name("Account")
///            .comparable()
///            .base<Entity>()
///            .field("owner", &Account::owner_, {.resolver = "user_id", .access = objdiff::Access::Private})
///            .field("balance", &Account::balance_)
///            .field("cache", &Account::cache_, {.compared = false})
///            .accessor("get_owner", &Account::get_owner);
///       }
///       int get_owner() const { return owner_; }
///   private:
///       int owner_ = 0;
///       double balance_ = 0.0;
///       std::string cache_;
///   };
/// @endcode
///
/// to_value() turns any supported C++ object into a Value. Described types
/// become ObjectRef; containers and scalars are converted eagerly.

#pragma once

#include <objdiff/concepts.h>
#include <objdiff/type_descriptor.h>
#include <objdiff/value.h>

#include <lager/lenses.hpp>
#include <lager/lenses/attr.hpp>

#include <boost/core/demangle.hpp>

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace objdiff {

template <typename T>
[[nodiscard]] Value to_value(T&& value);

template <Described T>
const TypeDescriptor& descriptor_of();

// ============================================================
// TypeBuilder
// ============================================================

template <typename T>
class TypeBuilder {
public:
    explicit TypeBuilder(TypeDescriptor& desc) : desc_(desc) {}

    TypeBuilder& name(std::string type_name) {
        desc_.name_ = std::move(type_name);
        return *this;
    }

    /// Composite marker: instances are decomposed field by field.
    /// Inherited by every type that lists this one through base<>().
    TypeBuilder& comparable() {
        desc_.marked_ = true;
        return *this;
    }

    /// Inherit the marker, fields and accessors of a described base
    template <Described Base>
        requires std::derived_from<T, Base>
    TypeBuilder& base() {
        desc_.bases_.push_back(BaseLink{
            &descriptor_of<Base>(),
            [](const void* p) -> const void* {
                return static_cast<const Base*>(static_cast<const T*>(p));
            }});
        return *this;
    }

    template <typename M>
    TypeBuilder& field(std::string field_name, M T::*member, FieldOptions options = {}) {
        using Member = std::remove_cvref_t<M>;
        FieldDescriptor f;
        f.name = std::move(field_name);
        f.included = options.compared;
        f.resolver_key = std::move(options.resolver);
        f.is_boolean = std::is_same_v<Member, bool> || std::is_same_v<Member, std::optional<bool>>;
        f.access = options.access;
        f.direct = [lens = lager::lenses::attr(member)](const void* p) -> Value {
            return to_value(lager::view(lens, *static_cast<const T*>(p)));
        };
        desc_.add_field(std::move(f));
        return *this;
    }

    /// Zero-argument accessor consulted by read_field(); by convention
    /// `get_<field>`, or `is_<field>` for boolean fields
    template <typename Fn>
        requires std::invocable<const Fn&, const T&>
    TypeBuilder& accessor(std::string accessor_name, Fn fn) {
        desc_.own_accessors_.insert_or_assign(
            std::move(accessor_name),
            [fn = std::move(fn)](const void* p) -> Value {
                return to_value(std::invoke(fn, *static_cast<const T*>(p)));
            });
        return *this;
    }

    /// Compare instances of an unmarked type with operator==
    TypeBuilder& equality()
        requires std::equality_comparable<T>
    {
        desc_.equals_ = [](const void* a, const void* b) {
            return *static_cast<const T*>(a) == *static_cast<const T*>(b);
        };
        return *this;
    }

    template <typename Fn>
        requires std::is_invocable_r_v<std::string, const Fn&, const T&>
    TypeBuilder& to_string(Fn fn) {
        desc_.to_string_ = [fn = std::move(fn)](const void* p) {
            return std::invoke(fn, *static_cast<const T*>(p));
        };
        return *this;
    }

    /// Resolve inheritance and freeze the field tables
    void finish() { desc_.finalize(); }

private:
    TypeDescriptor& desc_;
};

// ============================================================
// Descriptor lookup
// ============================================================

/// Descriptor of T, built on first use and registered in TypeRegistry
template <Described T>
const TypeDescriptor& descriptor_of()
{
    static const TypeDescriptor* const desc = [] {
        auto built = std::make_unique<TypeDescriptor>(
            std::type_index(typeid(T)), boost::core::demangle(typeid(T).name()));
        TypeBuilder<T> builder{*built};
        T::describe(builder);
        builder.finish();
        return TypeRegistry::instance().adopt(std::move(built));
    }();
    return *desc;
}

/// Make T known for dynamic-type lookup through base pointers
template <Described T>
void register_type()
{
    (void)descriptor_of<T>();
}

// ============================================================
// Conversion to Value
// ============================================================

namespace detail {

template <typename>
inline constexpr bool always_false = false;

/// Build an ObjectRef for obj; `owner` keeps obj alive (may be empty)
template <Described D>
[[nodiscard]] Value make_object_ref(const D& obj, std::shared_ptr<const void> owner)
{
    const TypeDescriptor* desc = &descriptor_of<D>();
    const void* ptr = static_cast<const void*>(std::addressof(obj));
    if constexpr (std::is_polymorphic_v<D>) {
        if (typeid(obj) != typeid(D)) {
            if (const auto* dynamic = TypeRegistry::instance().find(std::type_index(typeid(obj)))) {
                desc = dynamic;
                ptr = dynamic_cast<const void*>(std::addressof(obj));
            }
        }
    }
    return ObjectRef{desc, std::shared_ptr<const void>(std::move(owner), ptr)};
}

template <typename K>
[[nodiscard]] std::string key_to_string(const K& key)
{
    if constexpr (StringLike<K>) {
        return std::string(std::string_view(key));
    } else {
        return to_display_string(to_value(key));
    }
}

} // namespace detail

/// Convert a C++ object to a Value.
///
/// Lvalue objects of described types are borrowed: the returned Value refers
/// to them and they must outlive it. Rvalues are moved into shared storage.
template <typename T>
Value to_value(T&& value)
{
    using D = std::remove_cvref_t<T>;
    constexpr bool owned = !std::is_lvalue_reference_v<T>;
    // Elements of an owned, mutable container are moved out instead of copied
    constexpr bool movable_elements = [] {
        if constexpr (owned && !std::is_const_v<std::remove_reference_t<T>> && std::ranges::range<D>) {
            return std::is_lvalue_reference_v<std::ranges::range_reference_t<D>>;
        } else {
            return false;
        }
    }();

    if constexpr (std::is_same_v<D, Value>) {
        return value;
    } else if constexpr (std::is_same_v<D, bool>) {
        return Value{value};
    } else if constexpr (std::is_same_v<D, char>) {
        return Value{std::string(1, value)};
    } else if constexpr (std::is_enum_v<D>) {
        return to_value(static_cast<std::underlying_type_t<D>>(value));
    } else if constexpr (std::is_integral_v<D> && std::is_signed_v<D>) {
        if constexpr (sizeof(D) <= sizeof(int32_t)) {
            return Value{static_cast<int32_t>(value)};
        } else {
            return Value{static_cast<int64_t>(value)};
        }
    } else if constexpr (std::is_integral_v<D>) {
        if constexpr (sizeof(D) <= sizeof(uint32_t)) {
            return Value{static_cast<uint32_t>(value)};
        } else {
            return Value{static_cast<uint64_t>(value)};
        }
    } else if constexpr (std::is_same_v<D, float>) {
        return Value{value};
    } else if constexpr (std::is_floating_point_v<D>) {
        return Value{static_cast<double>(value)};
    } else if constexpr (StringLike<D>) {
        if constexpr (std::is_pointer_v<D>) {
            if (value == nullptr) return Value{};
        }
        return Value{std::string(std::string_view(value))};
    } else if constexpr (Described<D>) {
        if constexpr (owned) {
            auto holder = std::make_shared<const D>(std::move(value));
            const D& ref = *holder;
            return detail::make_object_ref(ref, std::move(holder));
        } else {
            return detail::make_object_ref(value, nullptr);
        }
    } else if constexpr (SharedPointer<D>) {
        if (!value) return Value{};
        using Pointee = std::remove_cv_t<typename D::element_type>;
        if constexpr (Described<Pointee>) {
            return detail::make_object_ref<Pointee>(*value, value);
        } else if constexpr (owned) {
            return to_value(Pointee(*value));
        } else {
            return to_value(*value);
        }
    } else if constexpr (UniquePointer<D> || OptionalLike<D>) {
        if (!value) return Value{};
        if constexpr (owned) {
            return to_value(std::move(*value));
        } else {
            return to_value(*value);
        }
    } else if constexpr (RawPointer<D>) {
        if (value == nullptr) return Value{};
        return to_value(*value);
    } else if constexpr (MapLike<D>) {
        auto t = ValueMap{}.transient();
        if constexpr (movable_elements) {
            for (auto& [key, mapped] : value) {
                t.set(detail::key_to_string(key), ValueBox{to_value(std::move(mapped))});
            }
        } else {
            for (const auto& [key, mapped] : std::as_const(value)) {
                if constexpr (owned) {
                    t.set(detail::key_to_string(key), ValueBox{to_value(std::remove_cvref_t<decltype(mapped)>(mapped))});
                } else {
                    t.set(detail::key_to_string(key), ValueBox{to_value(mapped)});
                }
            }
        }
        return Value{t.persistent()};
    } else if constexpr (SequenceLike<D>) {
        auto t = ValueVector{}.transient();
        if constexpr (movable_elements) {
            for (auto& element : value) {
                t.push_back(ValueBox{to_value(std::move(element))});
            }
        } else {
            for (const auto& element : std::as_const(value)) {
                if constexpr (owned) {
                    t.push_back(ValueBox{to_value(std::remove_cvref_t<decltype(element)>(element))});
                } else {
                    t.push_back(ValueBox{to_value(element)});
                }
            }
        }
        return Value{t.persistent()};
    } else {
        static_assert(detail::always_false<D>,
                      "objdiff::to_value: type is neither a scalar, a container, a pointer "
                      "nor a described type (add a static describe(TypeBuilder<T>&) member)");
    }
}

} // namespace objdiff
