// resolver_registry.cpp - Lock-guarded resolver table

#include <objdiff/resolver_registry.h>

#include <mutex>

namespace objdiff {

ResolverRegistry::ResolverRegistry(const ResolverRegistry& other)
{
    std::shared_lock lock(other.mutex_);
    resolvers_ = other.resolvers_;
}

ResolverRegistry& ResolverRegistry::operator=(const ResolverRegistry& other)
{
    if (this != &other) {
        std::unique_lock lhs(mutex_, std::defer_lock);
        std::shared_lock rhs(other.mutex_, std::defer_lock);
        std::lock(lhs, rhs);
        resolvers_ = other.resolvers_;
    }
    return *this;
}

std::optional<Resolver> ResolverRegistry::register_resolver(std::string key, Resolver resolver)
{
    std::unique_lock lock(mutex_);
    auto it = resolvers_.find(key);
    if (it == resolvers_.end()) {
        resolvers_.emplace(std::move(key), std::move(resolver));
        return std::nullopt;
    }
    Resolver previous = std::exchange(it->second, std::move(resolver));
    return previous;
}

void ResolverRegistry::unregister_resolver(std::string_view key)
{
    std::unique_lock lock(mutex_);
    auto it = resolvers_.find(key);
    if (it != resolvers_.end()) {
        resolvers_.erase(it);
    }
}

std::optional<Resolver> ResolverRegistry::lookup(std::string_view key) const
{
    std::shared_lock lock(mutex_);
    auto it = resolvers_.find(key);
    if (it == resolvers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ResolverRegistry::contains(std::string_view key) const
{
    std::shared_lock lock(mutex_);
    return resolvers_.find(key) != resolvers_.end();
}

std::size_t ResolverRegistry::size() const
{
    std::shared_lock lock(mutex_);
    return resolvers_.size();
}

void ResolverRegistry::clear()
{
    std::unique_lock lock(mutex_);
    resolvers_.clear();
}

} // namespace objdiff
