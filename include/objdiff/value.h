// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Dynamic Value type compared by the Differ.
///
/// A Value represents any datum the diff algorithm can meet:
/// - Scalars: bool, int32, int64, uint32, uint64, float, double, string
/// - Sequence: ValueVector (positional, compared in lockstep)
/// - Keyed collection: ValueMap (string keys)
/// - Object: ObjectRef, an instance of a described C++ type
/// - Null (std::monostate): an absent value
///
/// Every Value classifies into exactly one Kind. Null values are checked
/// with is_null() before classification.

#pragma once

#include <objdiff/objdiff_config.h>
#include <objdiff/api.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace objdiff {

class TypeDescriptor;

/// Closed classification of a present value
enum class Kind {
    Composite,        ///< decomposed field by field
    Sequence,         ///< compared by 1-based position
    KeyedCollection,  ///< compared by key of the original
    Scalar            ///< compared by equality
};

[[nodiscard]] OBJDIFF_API std::string_view kind_name(Kind kind) noexcept;

struct Value;

using ValueBox    = immer::box<Value>;
using ValueMap    = immer::map<std::string, ValueBox>;
using ValueVector = immer::vector<ValueBox>;

/// Reference to an instance of a described type.
///
/// `instance` points at the object as seen by `type`: accessors registered
/// on `type` cast it back to that exact C++ type. Ownership is shared; for
/// objects borrowed from the caller the control block is empty and the
/// caller's object must outlive the Value.
struct ObjectRef {
    const TypeDescriptor* type = nullptr;
    std::shared_ptr<const void> instance;

    [[nodiscard]] const void* get() const noexcept { return instance.get(); }
};

/// Uses the type's equality hook when present, otherwise instance identity
[[nodiscard]] OBJDIFF_API bool operator==(const ObjectRef& a, const ObjectRef& b);

struct Value
{
    std::variant<bool,
                 int32_t,
                 int64_t,
                 uint32_t,
                 uint64_t,
                 float,
                 double,
                 std::string,
                 ValueVector,
                 ValueMap,
                 ObjectRef,
                 std::monostate>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(int32_t v) noexcept : data(v) {}
    Value(int64_t v) noexcept : data(v) {}
    Value(uint32_t v) noexcept : data(v) {}
    Value(uint64_t v) noexcept : data(v) {}
    Value(float v) noexcept : data(v) {}
    Value(double v) noexcept : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(ValueVector v) : data(std::move(v)) {}
    Value(ValueMap v) : data(std::move(v)) {}
    Value(ObjectRef v) : data(std::move(v)) {}

    static Value map(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value vector(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }

    /// Classification of a present value; null classifies as Scalar
    [[nodiscard]] OBJDIFF_API Kind kind() const;

    /// Name of the concrete runtime type (descriptor name for objects)
    [[nodiscard]] OBJDIFF_API std::string type_name() const;

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* v = get_if<ValueVector>()) return v->size();
        return 0;
    }
};

/// Scalar equality; NaN compares equal to NaN so that diff(x, x) is empty
[[nodiscard]] OBJDIFF_API bool operator==(const Value& a, const Value& b);

/// Text recorded in a DiffResult: strings raw, numbers in shortest form,
/// null as the empty string
[[nodiscard]] OBJDIFF_API std::string to_display_string(const Value& val);

} // namespace objdiff
