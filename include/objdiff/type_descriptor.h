// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_descriptor.h
/// @brief Per-type field tables consulted by the Differ.
///
/// A TypeDescriptor answers two questions for one C++ type:
/// - is it a composite (decomposed field by field), and
/// - which fields take part in comparison, under which path segment name,
///   and through which resolver key.
///
/// Descriptors are built once by TypeBuilder (see describe.h), are immutable
/// afterwards and live in the process-wide TypeRegistry.

#pragma once

#include <objdiff/api.h>
#include <objdiff/value.h>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace objdiff {

/// Reads one value out of an instance of the described type
using FieldReader = std::function<Value(const void*)>;

/// Converts an instance pointer of a derived type to one of its bases
using InstanceCast = std::function<const void*(const void*)>;

enum class Access {
    Public,   ///< storage may be read directly
    Private   ///< storage is only reachable through an accessor
};

/// Per-field options given to TypeBuilder::field()
struct FieldOptions {
    /// Participation marker; false records the field but never compares it
    bool compared = true;
    /// Key of the resolver applied to the raw value before comparison
    std::optional<std::string> resolver;
    Access access = Access::Public;
};

struct FieldDescriptor {
    std::string name;
    bool included = false;
    std::optional<std::string> resolver_key;
    bool is_boolean = false;
    Access access = Access::Public;
    FieldReader direct;
};

[[nodiscard]] inline const std::optional<std::string>& resolver_key_for(const FieldDescriptor& field) noexcept
{
    return field.resolver_key;
}

struct BaseLink {
    const TypeDescriptor* type = nullptr;
    InstanceCast upcast;
};

class OBJDIFF_API TypeDescriptor {
public:
    TypeDescriptor(std::type_index type, std::string name);

    [[nodiscard]] std::type_index type() const noexcept { return type_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// True if this type or any ancestor carries the composite marker
    [[nodiscard]] bool is_composite() const noexcept { return composite_; }

    /// Fields declared on this type itself, including non-compared ones
    [[nodiscard]] const std::vector<FieldDescriptor>& declared_fields() const noexcept { return fields_; }

    /// Compared fields of this type followed by those of its ancestors.
    /// Readers of inherited fields accept a pointer to this type.
    [[nodiscard]] const std::vector<FieldDescriptor>& comparable_fields() const noexcept { return comparable_; }

    [[nodiscard]] const FieldDescriptor* find_field(std::string_view name) const;

    /// Zero-argument accessor by name, searching ancestors as well
    [[nodiscard]] const FieldReader* find_accessor(std::string_view name) const;

    [[nodiscard]] const std::vector<BaseLink>& bases() const noexcept { return bases_; }

    [[nodiscard]] bool has_equality() const noexcept { return static_cast<bool>(equals_); }
    [[nodiscard]] bool equals(const void* a, const void* b) const;

    /// Display text of an instance; "Name@0x..." when no hook was given
    [[nodiscard]] std::string to_string(const void* instance) const;

private:
    template <typename T>
    friend class TypeBuilder;

    void add_field(FieldDescriptor field);
    void finalize();

    std::type_index type_;
    std::string name_;
    bool marked_ = false;
    bool composite_ = false;
    std::vector<FieldDescriptor> fields_;
    std::vector<FieldDescriptor> comparable_;
    std::vector<BaseLink> bases_;
    std::map<std::string, FieldReader, std::less<>> own_accessors_;
    std::map<std::string, FieldReader, std::less<>> accessors_;
    std::function<bool(const void*, const void*)> equals_;
    std::function<std::string(const void*)> to_string_;
};

/// Process-wide table of built descriptors, keyed by C++ type.
///
/// Used to find the descriptor of an object's dynamic type when it is
/// reached through a pointer or reference to a polymorphic base.
class OBJDIFF_API TypeRegistry {
public:
    static TypeRegistry& instance();

    /// Take ownership of a descriptor. If one is already registered for
    /// the same type the existing one is kept and returned.
    const TypeDescriptor* adopt(std::unique_ptr<TypeDescriptor> desc);

    [[nodiscard]] const TypeDescriptor* find(std::type_index type) const;
    [[nodiscard]] std::size_t size() const;

private:
    TypeRegistry() = default;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::unique_ptr<TypeDescriptor>> types_;
};

} // namespace objdiff
