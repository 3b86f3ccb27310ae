// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts used to classify C++ types into Value kinds.

#pragma once

#include <concepts>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

namespace objdiff {

template <typename T>
class TypeBuilder;

// ============================================================
// Scalar Concepts
// ============================================================

/// Concept for string-like types stored as std::string
template<typename T>
concept StringLike = std::is_same_v<std::decay_t<T>, std::string> ||
                     std::is_same_v<std::decay_t<T>, const char*> ||
                     std::is_same_v<std::decay_t<T>, char*> ||
                     std::is_convertible_v<T, std::string_view>;

// ============================================================
// Described Types
// ============================================================

/// Concept for types that publish a field table through a static
/// `describe(TypeBuilder<T>&)` member
template<typename T>
concept Described = std::is_class_v<T> && requires(TypeBuilder<T>& builder) {
    T::describe(builder);
};

// ============================================================
// Pointer-like Concepts
// ============================================================

namespace detail {

template<typename T>
struct is_shared_ptr : std::false_type {};
template<typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template<typename T>
struct is_unique_ptr : std::false_type {};
template<typename T, typename D>
struct is_unique_ptr<std::unique_ptr<T, D>> : std::true_type {};

template<typename T>
struct is_optional : std::false_type {};
template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

} // namespace detail

template<typename T>
concept SharedPointer = detail::is_shared_ptr<std::remove_cvref_t<T>>::value;

template<typename T>
concept UniquePointer = detail::is_unique_ptr<std::remove_cvref_t<T>>::value;

template<typename T>
concept OptionalLike = detail::is_optional<std::remove_cvref_t<T>>::value;

template<typename T>
concept RawPointer = std::is_pointer_v<std::remove_cvref_t<T>> && !StringLike<T>;

// ============================================================
// Container Concepts
// ============================================================

/// Associative containers (std::map, std::unordered_map, ...)
template<typename T>
concept MapLike = std::ranges::input_range<const std::remove_cvref_t<T>> && requires {
    typename std::remove_cvref_t<T>::key_type;
    typename std::remove_cvref_t<T>::mapped_type;
};

/// Ordered sequences (std::vector, std::list, std::array, std::set, ...)
template<typename T>
concept SequenceLike = std::ranges::input_range<const std::remove_cvref_t<T>> &&
                       !MapLike<T> && !StringLike<T>;

} // namespace objdiff
