// field_access.h - Reading one field of a described instance

#pragma once

#include <objdiff/api.h>
#include <objdiff/type_descriptor.h>
#include <objdiff/value.h>

#include <string>

namespace objdiff {

/// Name of the accessor consulted for a boolean field: `is_<name>`
[[nodiscard]] OBJDIFF_API std::string boolean_accessor_name(const FieldDescriptor& field);

/// Name of the general accessor of a field: `get_<name>`
[[nodiscard]] OBJDIFF_API std::string accessor_name(const FieldDescriptor& field);

/// Read `field` from `instance`, an object of the type described by `type`.
///
/// Lookup order:
///   1. `is_<name>` accessor, for boolean fields
///   2. `get_<name>` accessor
///   3. the field storage itself, unless the field is Access::Private
///
/// @throws FieldAccessError        no accessor and the storage is private
/// @throws AccessorInvocationError an accessor (or the storage read) threw
[[nodiscard]] OBJDIFF_API Value read_field(const TypeDescriptor& type,
                                           const FieldDescriptor& field,
                                           const void* instance);

} // namespace objdiff
