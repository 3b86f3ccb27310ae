// differ.cpp - Differ::diff implementation

#include <objdiff/differ.h>
#include <objdiff/errors.h>
#include <objdiff/field_access.h>
#include <objdiff/log.h>

#include <algorithm>
#include <string>
#include <utility>

namespace objdiff {

namespace {

bool same_runtime_type(const Value& a, const Value& b)
{
    if (a.data.index() != b.data.index()) {
        return false;
    }
    if (auto* obj = a.get_if<ObjectRef>()) {
        return obj->type == b.get_if<ObjectRef>()->type;
    }
    return true;
}

} // anonymous namespace

DiffResult Differ::diff(std::string_view root, const Value& original, const Value& current) const
{
    DiffResult out;
    Path path{std::string(root)};
    diff_value(original, current, path, out);
    return out;
}

void Differ::check_depth(const Path& path) const
{
    if (path.depth() > options_.max_depth) {
        throw DepthLimitError(path.to_string(), options_.max_depth);
    }
}

void Differ::diff_value(const Value& original, const Value& current, Path& path, DiffResult& out) const
{
    check_depth(path);

    // Exactly one side present: an appearing value is only flagged, a
    // disappearing one is itemized in full.
    if (original.is_null() || current.is_null()) {
        if (original.is_null() && current.is_null()) {
            return;
        }
        if (original.is_null()) {
            out.insert_or_assign(path.to_string(), std::string{});
        } else {
            collect_leaves(original, path, out);
        }
        return;
    }

    const Kind kind = original.kind();

    if (!same_runtime_type(original, current)) {
        if (options_.mismatch_policy == MismatchPolicy::Throw) {
            throw TypeMismatchError(original.type_name(), current.type_name(), path.to_string());
        }
        detail::log_warning("Differ",
                            "'original' and 'current' have different types at '" + path.to_string() +
                            "', diffing anyway. Original: " + original.type_name() +
                            " Current: " + current.type_name());
        if (current.kind() != kind) {
            collect_leaves(original, path, out);
            return;
        }
    }

    if constexpr (OBJDIFF_VERBOSE_LOG) {
        detail::log_trace("Differ", "diffing " + original.type_name() + " (" +
                                    std::string(kind_name(kind)) + ") at '" + path.to_string() + "'");
    }

    switch (kind) {
        case Kind::Composite:
            diff_object(*original.get_if<ObjectRef>(), *current.get_if<ObjectRef>(), path, out);
            break;
        case Kind::Sequence:
            diff_sequence(*original.get_if<ValueVector>(), *current.get_if<ValueVector>(), path, out);
            break;
        case Kind::KeyedCollection:
            diff_map(*original.get_if<ValueMap>(), *current.get_if<ValueMap>(), path, out);
            break;
        case Kind::Scalar:
            if (!(original == current)) {
                out.insert_or_assign(path.to_string(), to_display_string(original));
            }
            break;
    }
}

void Differ::diff_object(const ObjectRef& original, const ObjectRef& current, Path& path, DiffResult& out) const
{
    const TypeDescriptor& original_type = *original.type;
    const TypeDescriptor& current_type = *current.type;

    for (const auto& field : original_type.comparable_fields()) {
        auto original_value = read_or_skip(original_type, field, original.get(), path);
        if (!original_value) {
            continue;
        }

        // Under MismatchPolicy::WarnAndContinue the two sides may be of
        // different types; fields are then matched by name.
        Value current_value;
        const FieldDescriptor* current_field =
            (&current_type == &original_type) ? &field : current_type.find_field(field.name);
        if (current_field != nullptr) {
            auto read = read_or_skip(current_type, *current_field, current.get(), path);
            if (!read) {
                continue;
            }
            current_value = std::move(*read);
        }

        Value resolved_original = apply_resolver(field, std::move(*original_value));
        Value resolved_current = apply_resolver(field, std::move(current_value));

        path.push_back(field.name);
        diff_value(resolved_original, resolved_current, path, out);
        path.pop_back();
    }
}

void Differ::diff_sequence(const ValueVector& original, const ValueVector& current, Path& path, DiffResult& out) const
{
    const std::size_t common = std::min(original.size(), current.size());

    for (std::size_t i = 0; i < common; ++i) {
        path.push_back(Index{i + 1});
        diff_value(*original[i], *current[i], path, out);
        path.pop_back();
    }

    if (original.size() != current.size()) {
        path.push_back(Count{});
        out.insert_or_assign(path.to_string(), std::to_string(std::max(original.size(), current.size())));
        path.pop_back();
    }
}

void Differ::diff_map(const ValueMap& original, const ValueMap& current, Path& path, DiffResult& out) const
{
    // Keys that only exist in current are not visited
    static const Value absent;
    for (const auto& [key, original_box] : original) {
        const ValueBox* current_box = current.find(key);
        path.push_back(key);
        diff_value(*original_box, current_box != nullptr ? current_box->get() : absent, path, out);
        path.pop_back();
    }
}

std::optional<Value> Differ::read_or_skip(const TypeDescriptor& type,
                                          const FieldDescriptor& field,
                                          const void* instance,
                                          const Path& path) const
{
    try {
        return read_field(type, field, instance);
    } catch (const FieldAccessError& e) {
        detail::log_field_skipped("Differ", field.name, path.to_string(), e.what());
    } catch (const AccessorInvocationError& e) {
        detail::log_field_skipped("Differ", field.name, path.to_string(), e.what());
    }
    return std::nullopt;
}

Value Differ::apply_resolver(const FieldDescriptor& field, Value raw) const
{
    const auto& key = resolver_key_for(field);
    if (!key) {
        return raw;
    }
    auto resolver = resolvers_.lookup(*key);
    if (!resolver) {
        return raw;
    }
    if constexpr (OBJDIFF_VERBOSE_LOG) {
        detail::log_trace("Differ", "resolving '" + field.name + "' through '" + *key + "'");
    }
    return (*resolver)(raw);
}

} // namespace objdiff
