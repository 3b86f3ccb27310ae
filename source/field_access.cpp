// field_access.cpp - Accessor-first field reads

#include <objdiff/field_access.h>
#include <objdiff/errors.h>
#include <objdiff/log.h>

#include <exception>

namespace objdiff {

namespace {

Value invoke_reader(const TypeDescriptor& type,
                    const FieldDescriptor& field,
                    const std::string& reader_name,
                    const FieldReader& read,
                    const void* instance)
{
    try {
        return read(instance);
    } catch (const DiffError&) {
        throw;
    } catch (const std::exception& e) {
        throw AccessorInvocationError(type.name(), field.name, reader_name, e.what());
    } catch (...) {
        throw AccessorInvocationError(type.name(), field.name, reader_name, "unknown exception");
    }
}

} // anonymous namespace

std::string boolean_accessor_name(const FieldDescriptor& field)
{
    return "is_" + field.name;
}

std::string accessor_name(const FieldDescriptor& field)
{
    return "get_" + field.name;
}

Value read_field(const TypeDescriptor& type, const FieldDescriptor& field, const void* instance)
{
    if (field.is_boolean) {
        auto name = boolean_accessor_name(field);
        if (const auto* getter = type.find_accessor(name)) {
            return invoke_reader(type, field, name, *getter, instance);
        }
        if constexpr (OBJDIFF_VERBOSE_LOG) {
            detail::log_trace("read_field", "no boolean accessor for '" + field.name + "', trying general accessor");
        }
    }

    auto name = accessor_name(field);
    if (const auto* getter = type.find_accessor(name)) {
        return invoke_reader(type, field, name, *getter, instance);
    }

    if (field.access == Access::Private || !field.direct) {
        throw FieldAccessError(type.name(), field.name);
    }
    return invoke_reader(type, field, field.name, field.direct, instance);
}

} // namespace objdiff
