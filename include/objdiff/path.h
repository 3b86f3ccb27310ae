// path.h - Locations inside a compared structure

#pragma once

#include <objdiff/api.h>

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace objdiff {

/// 1-based position inside a sequence, printed as `idx<N>`
struct Index {
    std::size_t position = 0;

    bool operator==(const Index&) const = default;
};

/// Length summary of two sequences, printed as `count`
struct Count {
    bool operator==(const Count&) const = default;
};

/// A field name or a stringified collection key
using PathElement = std::variant<std::string, Index, Count>;

/// Path under construction during a traversal.
///
/// Segments are pushed on descent and popped on return, so one Path object
/// serves a whole traversal. to_string() joins the root and the segments
/// with '.', skipping the separator while the text is still empty:
///
///   Path p{"order"};   p.push_back("lines"); p.push_back(Index{2});
///   p.to_string()  ->  "order.lines.idx2"
///
///   Path q{""};        q.push_back("lines");
///   q.to_string()  ->  "lines"
class OBJDIFF_API Path {
public:
    Path() = default;
    explicit Path(std::string root) : root_(std::move(root)) {}

    void push_back(PathElement element) { elements_.push_back(std::move(element)); }
    void pop_back() { elements_.pop_back(); }

    [[nodiscard]] const std::string& root() const noexcept { return root_; }
    [[nodiscard]] const std::vector<PathElement>& elements() const noexcept { return elements_; }
    [[nodiscard]] std::size_t depth() const noexcept { return elements_.size(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }

    [[nodiscard]] std::string to_string() const;

private:
    std::string root_;
    std::vector<PathElement> elements_;
};

[[nodiscard]] OBJDIFF_API std::string element_to_string(const PathElement& element);

} // namespace objdiff
