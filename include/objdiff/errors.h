// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by objdiff.
///
/// Only TypeMismatchError, DepthLimitError and ResolverInputError reach the
/// caller of Differ::diff(). FieldAccessError and AccessorInvocationError are
/// raised by read_field() and are absorbed by the traversal, which logs them
/// and omits the field from the result.

#pragma once

#include <objdiff/api.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace objdiff {

/// Base class of every objdiff exception
class OBJDIFF_API DiffError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// original and current have different runtime types at a compared node
class OBJDIFF_API TypeMismatchError : public DiffError {
public:
    TypeMismatchError(std::string original_type, std::string current_type, std::string path);

    [[nodiscard]] const std::string& original_type() const noexcept { return original_type_; }
    [[nodiscard]] const std::string& current_type() const noexcept { return current_type_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    std::string original_type_;
    std::string current_type_;
    std::string path_;
};

/// A field has no accessor and its storage is not directly readable
class OBJDIFF_API FieldAccessError : public DiffError {
public:
    FieldAccessError(std::string type_name, std::string field_name);

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] const std::string& field_name() const noexcept { return field_name_; }

private:
    std::string type_name_;
    std::string field_name_;
};

/// An accessor threw while reading a field
class OBJDIFF_API AccessorInvocationError : public DiffError {
public:
    AccessorInvocationError(std::string type_name,
                            std::string field_name,
                            std::string accessor,
                            const std::string& reason);

    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] const std::string& field_name() const noexcept { return field_name_; }
    [[nodiscard]] const std::string& accessor() const noexcept { return accessor_; }

private:
    std::string type_name_;
    std::string field_name_;
    std::string accessor_;
};

/// Traversal went deeper than DiffOptions::max_depth (usually a cycle)
class OBJDIFF_API DepthLimitError : public DiffError {
public:
    DepthLimitError(std::string path, std::size_t limit);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] std::size_t limit() const noexcept { return limit_; }

private:
    std::string path_;
    std::size_t limit_;
};

/// A typed resolver received a value it cannot convert to its input type
class OBJDIFF_API ResolverInputError : public DiffError {
public:
    ResolverInputError(std::string expected, std::string actual);

    [[nodiscard]] const std::string& expected() const noexcept { return expected_; }
    [[nodiscard]] const std::string& actual() const noexcept { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

} // namespace objdiff
