// type_descriptor.cpp - Field tables and the type registry

#include <objdiff/type_descriptor.h>

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace objdiff {

TypeDescriptor::TypeDescriptor(std::type_index type, std::string name)
    : type_(type)
    , name_(std::move(name))
{
}

void TypeDescriptor::add_field(FieldDescriptor field)
{
    auto same_name = [&](const FieldDescriptor& f) { return f.name == field.name; };
    if (std::any_of(fields_.begin(), fields_.end(), same_name)) {
        throw std::invalid_argument("Field '" + field.name + "' declared twice on " + name_);
    }
    fields_.push_back(std::move(field));
}

void TypeDescriptor::finalize()
{
    composite_ = marked_;
    comparable_.clear();
    accessors_ = own_accessors_;

    for (const auto& f : fields_) {
        if (f.included) {
            comparable_.push_back(f);
        }
    }

    // Ancestor fields and accessors are re-bound so that they accept a
    // pointer to this type. A name already present shadows the ancestor's.
    for (const auto& base : bases_) {
        composite_ = composite_ || base.type->is_composite();

        for (const auto& inherited : base.type->comparable_fields()) {
            bool shadowed = std::any_of(fields_.begin(), fields_.end(),
                                        [&](const FieldDescriptor& f) { return f.name == inherited.name; });
            if (shadowed || find_field(inherited.name) != nullptr) {
                continue;
            }
            FieldDescriptor f = inherited;
            f.direct = [upcast = base.upcast, read = inherited.direct](const void* p) {
                return read(upcast(p));
            };
            comparable_.push_back(std::move(f));
        }

        for (const auto& [name, read] : base.type->accessors_) {
            if (accessors_.contains(name)) {
                continue;
            }
            accessors_.emplace(name, [upcast = base.upcast, read = read](const void* p) {
                return read(upcast(p));
            });
        }
    }
}

const FieldDescriptor* TypeDescriptor::find_field(std::string_view name) const
{
    auto it = std::find_if(comparable_.begin(), comparable_.end(),
                           [&](const FieldDescriptor& f) { return f.name == name; });
    return it != comparable_.end() ? &*it : nullptr;
}

const FieldReader* TypeDescriptor::find_accessor(std::string_view name) const
{
    auto it = accessors_.find(name);
    return it != accessors_.end() ? &it->second : nullptr;
}

bool TypeDescriptor::equals(const void* a, const void* b) const
{
    if (equals_) {
        return equals_(a, b);
    }
    return a == b;
}

std::string TypeDescriptor::to_string(const void* instance) const
{
    if (to_string_) {
        return to_string_(instance);
    }
    std::ostringstream oss;
    oss << name_ << "@0x" << std::hex << reinterpret_cast<std::uintptr_t>(instance);
    return oss.str();
}

// ============================================================
// TypeRegistry
// ============================================================

TypeRegistry& TypeRegistry::instance()
{
    static TypeRegistry registry;
    return registry;
}

const TypeDescriptor* TypeRegistry::adopt(std::unique_ptr<TypeDescriptor> desc)
{
    std::unique_lock lock(mutex_);
    auto [it, inserted] = types_.try_emplace(desc->type(), nullptr);
    if (inserted) {
        it->second = std::move(desc);
    }
    return it->second.get();
}

const TypeDescriptor* TypeRegistry::find(std::type_index type) const
{
    std::shared_lock lock(mutex_);
    auto it = types_.find(type);
    return it != types_.end() ? it->second.get() : nullptr;
}

std::size_t TypeRegistry::size() const
{
    std::shared_lock lock(mutex_);
    return types_.size();
}

} // namespace objdiff
