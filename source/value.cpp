// value.cpp - Value classification, equality and display text

#include <objdiff/value.h>
#include <objdiff/type_descriptor.h>

#include <charconv>
#include <cmath>
#include <string>
#include <system_error>
#include <type_traits>
#include <variant>

namespace objdiff {

namespace {

template <typename F>
std::string format_floating(F value)
{
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string(buffer, end);
}

} // anonymous namespace

std::string_view kind_name(Kind kind) noexcept
{
    switch (kind) {
        case Kind::Composite:       return "composite";
        case Kind::Sequence:        return "sequence";
        case Kind::KeyedCollection: return "keyed collection";
        case Kind::Scalar:          return "scalar";
    }
    return "unknown";
}

bool operator==(const ObjectRef& a, const ObjectRef& b)
{
    if (a.type != b.type) return false;
    if (a.get() == b.get()) return true;
    if (a.type != nullptr && a.type->has_equality()) {
        return a.type->equals(a.get(), b.get());
    }
    return false;
}

bool operator==(const Value& a, const Value& b)
{
    if (a.data.index() != b.data.index()) {
        return false;
    }
    return std::visit([&b](const auto& lhs) -> bool {
        using T = std::decay_t<decltype(lhs)>;
        const auto& rhs = std::get<T>(b.data);
        if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else if constexpr (std::is_floating_point_v<T>) {
            return lhs == rhs || (std::isnan(lhs) && std::isnan(rhs));
        } else {
            return lhs == rhs;
        }
    }, a.data);
}

Kind Value::kind() const
{
    if (auto* obj = get_if<ObjectRef>()) {
        return (obj->type != nullptr && obj->type->is_composite()) ? Kind::Composite : Kind::Scalar;
    }
    if (is<ValueVector>()) return Kind::Sequence;
    if (is<ValueMap>()) return Kind::KeyedCollection;
    return Kind::Scalar;
}

std::string Value::type_name() const
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            return "bool";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return "int32";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return "int64";
        } else if constexpr (std::is_same_v<T, uint32_t>) {
            return "uint32";
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return "uint64";
        } else if constexpr (std::is_same_v<T, float>) {
            return "float";
        } else if constexpr (std::is_same_v<T, double>) {
            return "double";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "string";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "sequence";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "map";
        } else if constexpr (std::is_same_v<T, ObjectRef>) {
            return arg.type != nullptr ? arg.type->name() : "object";
        } else {
            return "null";
        }
    }, data);
}

std::string to_display_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_floating_point_v<T>) {
            return format_floating(arg);
        } else if constexpr (std::is_integral_v<T>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[sequence:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{map:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ObjectRef>) {
            return arg.type != nullptr ? arg.type->to_string(arg.get()) : "object";
        } else {
            return "";
        }
    }, val.data);
}

} // namespace objdiff
