// errors.cpp - Exception messages

#include <objdiff/errors.h>

#include <utility>

namespace objdiff {

TypeMismatchError::TypeMismatchError(std::string original_type, std::string current_type, std::string path)
    : DiffError("'original' and 'current' have different types at '" + path +
                "'. Original: " + original_type + " Current: " + current_type)
    , original_type_(std::move(original_type))
    , current_type_(std::move(current_type))
    , path_(std::move(path))
{
}

FieldAccessError::FieldAccessError(std::string type_name, std::string field_name)
    : DiffError("Field '" + field_name + "' of " + type_name +
                " is private and has no accessor")
    , type_name_(std::move(type_name))
    , field_name_(std::move(field_name))
{
}

AccessorInvocationError::AccessorInvocationError(std::string type_name,
                                                 std::string field_name,
                                                 std::string accessor,
                                                 const std::string& reason)
    : DiffError("Reading field '" + field_name + "' of " + type_name + " through '" +
                accessor + "' failed: " + reason)
    , type_name_(std::move(type_name))
    , field_name_(std::move(field_name))
    , accessor_(std::move(accessor))
{
}

DepthLimitError::DepthLimitError(std::string path, std::size_t limit)
    : DiffError("Nesting deeper than " + std::to_string(limit) + " levels at '" + path +
                "' (cyclic object graph?)")
    , path_(std::move(path))
    , limit_(limit)
{
}

ResolverInputError::ResolverInputError(std::string expected, std::string actual)
    : DiffError("Resolver expects " + expected + " but received " + actual)
    , expected_(std::move(expected))
    , actual_(std::move(actual))
{
}

} // namespace objdiff
