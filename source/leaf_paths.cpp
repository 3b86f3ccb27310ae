// leaf_paths.cpp - Differ::resolve_leaf_paths implementation

#include <objdiff/differ.h>
#include <objdiff/log.h>

#include <string>

namespace objdiff {

DiffResult Differ::resolve_leaf_paths(std::string_view root, const Value& value) const
{
    DiffResult out;
    Path path{std::string(root)};
    collect_leaves(value, path, out);
    return out;
}

void Differ::collect_leaves(const Value& value, Path& path, DiffResult& out) const
{
    check_depth(path);

    if (value.is_null()) {
        out.insert_or_assign(path.to_string(), std::string{});
        return;
    }

    const Kind kind = value.kind();
    if constexpr (OBJDIFF_VERBOSE_LOG) {
        detail::log_trace("Differ", "resolving " + value.type_name() + " (" +
                                    std::string(kind_name(kind)) + ") at '" + path.to_string() + "'");
    }

    switch (kind) {
        case Kind::Composite:
            collect_object(*value.get_if<ObjectRef>(), path, out);
            break;
        case Kind::Sequence: {
            std::size_t position = 0;
            for (const auto& element : *value.get_if<ValueVector>()) {
                path.push_back(Index{++position});
                collect_leaves(*element, path, out);
                path.pop_back();
            }
            break;
        }
        case Kind::KeyedCollection:
            for (const auto& [key, element] : *value.get_if<ValueMap>()) {
                path.push_back(key);
                collect_leaves(*element, path, out);
                path.pop_back();
            }
            break;
        case Kind::Scalar:
            out.insert_or_assign(path.to_string(), to_display_string(value));
            break;
    }
}

void Differ::collect_object(const ObjectRef& object, Path& path, DiffResult& out) const
{
    const TypeDescriptor& type = *object.type;
    for (const auto& field : type.comparable_fields()) {
        auto raw = read_or_skip(type, field, object.get(), path);
        if (!raw) {
            continue;
        }
        Value resolved = apply_resolver(field, std::move(*raw));
        path.push_back(field.name);
        collect_leaves(resolved, path, out);
        path.pop_back();
    }
}

} // namespace objdiff
