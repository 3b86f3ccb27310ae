// path.cpp - Path formatting

#include <objdiff/path.h>

#include <string>
#include <type_traits>
#include <variant>

namespace objdiff {

std::string element_to_string(const PathElement& element)
{
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, Index>) {
            return "idx" + std::to_string(v.position);
        } else {
            return "count";
        }
    }, element);
}

std::string Path::to_string() const
{
    std::string result = root_;
    for (const auto& elem : elements_) {
        if (!result.empty()) {
            result += '.';
        }
        result += element_to_string(elem);
    }
    return result;
}

} // namespace objdiff
