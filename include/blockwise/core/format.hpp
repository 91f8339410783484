#pragma once

#include <blockwise/core/block.hpp>
#include <blockwise/core/page.hpp>
#include <blockwise/core/vector.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace blockwise {

// ─── Text rendering ───────────────────────────────────────────────────────────
//  Used for logging and test failure messages. Nulls print as `null`,
//  multi-valued positions as a bracketed list.

template <BlockElement T>
[[nodiscard]] auto to_string(const Block<T>& block) -> std::string {
    std::string out =
        fmt::format("{}Block[positions={}, values=[", ElementTraits<T>::name,
                    block.position_count());
    for (std::int32_t p = 0; p < block.position_count(); ++p) {
        if (p > 0) {
            out += ", ";
        }
        if (block.is_null(p)) {
            out += "null";
            continue;
        }
        const auto count = block.value_count(p);
        const auto first = block.first_value_index(p);
        if (count == 1) {
            out += fmt::format("{}", block.get(first));
            continue;
        }
        out += "[";
        for (std::int32_t i = 0; i < count; ++i) {
            if (i > 0) {
                out += ", ";
            }
            out += fmt::format("{}", block.get(first + i));
        }
        out += "]";
    }
    out += "]]";
    return out;
}

template <BlockElement T>
[[nodiscard]] auto to_string(const Vector<T>& vector) -> std::string {
    std::string out = fmt::format("{}Vector[positions={}, values=[", ElementTraits<T>::name,
                                  vector.position_count());
    for (std::int32_t p = 0; p < vector.position_count(); ++p) {
        if (p > 0) {
            out += ", ";
        }
        out += fmt::format("{}", vector.get(p));
    }
    out += "]]";
    return out;
}

[[nodiscard]] auto to_string(const AnyBlock& block) -> std::string;

[[nodiscard]] auto to_string(const Page& page) -> std::string;

template <BlockElement T>
auto operator<<(std::ostream& out, const Block<T>& block) -> std::ostream& {
    return out << to_string(block);
}

template <BlockElement T>
auto operator<<(std::ostream& out, const Vector<T>& vector) -> std::ostream& {
    return out << to_string(vector);
}

auto operator<<(std::ostream& out, const Page& page) -> std::ostream&;

}  // namespace blockwise
