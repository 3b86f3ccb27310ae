// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file differ.h
/// @brief Structural diff of two values into a flat path -> original-value map.
///
/// Differ::diff() walks two values of the same shape and records every
/// location where they disagree. Each node is classified once:
///
/// - Composite:       compared fields are read on both sides, passed through
///                    their resolver, and compared recursively under
///                    `<path>.<field>`
/// - Sequence:        elements are compared in lockstep under `<path>.idx<N>`
///                    (1-based); a length difference adds `<path>.count`
///                    holding the length of the longer side
/// - KeyedCollection: every key of the original is compared under
///                    `<path>.<key>`; keys only present in current are not
///                    visited
/// - Scalar:          compared by equality, recorded as `<path>: original`
///
/// When only original is null the node is recorded as `<path>: ""`. When only
/// current is null the whole original subtree is itemized with
/// resolve_leaf_paths().
///
/// Example:
/// @code
///   Differ differ;
///   differ.register_resolver("user_id", make_resolver<int>(lookup_user_name));
///   DiffResult changes = differ.diff("account", before, after);
///   for (const auto& [path, old_value] : changes) {
///       audit_log << path << " was " << old_value << "\n";
///   }
/// @endcode

#pragma once

#include <objdiff/api.h>
#include <objdiff/describe.h>
#include <objdiff/path.h>
#include <objdiff/resolver_registry.h>
#include <objdiff/type_descriptor.h>
#include <objdiff/value.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace objdiff {

/// Ordered map from dotted path to the original value's display text
using DiffResult = std::map<std::string, std::string>;

/// What diff() does when original and current have different runtime types
enum class MismatchPolicy {
    /// Throw TypeMismatchError
    Throw,
    /// Log a warning and compare using original's classification
    WarnAndContinue
};

struct DiffOptions {
    MismatchPolicy mismatch_policy = MismatchPolicy::Throw;
    /// Deepest nesting visited before DepthLimitError is thrown
    std::size_t max_depth = OBJDIFF_DEFAULT_MAX_DEPTH;
};

class OBJDIFF_API Differ {
public:
    Differ() = default;
    explicit Differ(DiffOptions options) : options_(options) {}

    /// Locations where `original` and `current` differ, rooted at `root`
    [[nodiscard]] DiffResult diff(std::string_view root, const Value& original, const Value& current) const;

    template <typename T>
        requires (!std::is_same_v<T, Value>)
    [[nodiscard]] DiffResult diff(std::string_view root, const T& original, const T& current) const {
        return diff(root, to_value(original), to_value(current));
    }

    /// Every leaf location of `value`, rooted at `root`
    [[nodiscard]] DiffResult resolve_leaf_paths(std::string_view root, const Value& value) const;

    template <typename T>
        requires (!std::is_same_v<T, Value>)
    [[nodiscard]] DiffResult resolve_leaf_paths(std::string_view root, const T& value) const {
        return resolve_leaf_paths(root, to_value(value));
    }

    std::optional<Resolver> register_resolver(std::string key, Resolver resolver) {
        return resolvers_.register_resolver(std::move(key), std::move(resolver));
    }

    void unregister_resolver(std::string_view key) { resolvers_.unregister_resolver(key); }

    [[nodiscard]] ResolverRegistry& resolvers() noexcept { return resolvers_; }
    [[nodiscard]] const ResolverRegistry& resolvers() const noexcept { return resolvers_; }

    [[nodiscard]] const DiffOptions& options() const noexcept { return options_; }
    void set_options(DiffOptions options) noexcept { options_ = options; }

private:
    // Path is passed by reference and grown/shrunk with push_back/pop_back
    void diff_value(const Value& original, const Value& current, Path& path, DiffResult& out) const;
    void diff_object(const ObjectRef& original, const ObjectRef& current, Path& path, DiffResult& out) const;
    void diff_sequence(const ValueVector& original, const ValueVector& current, Path& path, DiffResult& out) const;
    void diff_map(const ValueMap& original, const ValueMap& current, Path& path, DiffResult& out) const;
    void collect_leaves(const Value& value, Path& path, DiffResult& out) const;
    void collect_object(const ObjectRef& object, Path& path, DiffResult& out) const;

    /// read_field() that logs and returns nullopt on a recoverable failure
    std::optional<Value> read_or_skip(const TypeDescriptor& type,
                                      const FieldDescriptor& field,
                                      const void* instance,
                                      const Path& path) const;
    Value apply_resolver(const FieldDescriptor& field, Value raw) const;
    void check_depth(const Path& path) const;

    DiffOptions options_;
    ResolverRegistry resolvers_;
};

} // namespace objdiff
