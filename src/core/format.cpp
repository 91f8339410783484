#include <blockwise/core/format.hpp>

#include <variant>

namespace blockwise {

auto to_string(const AnyBlock& block) -> std::string {
    return std::visit([](const auto& b) { return to_string(b); }, block);
}

auto to_string(const Page& page) -> std::string {
    std::string out = fmt::format("Page[positions={}, blocks=[", page.position_count());
    for (std::size_t channel = 0; channel < page.block_count(); ++channel) {
        if (channel > 0) {
            out += ", ";
        }
        out += to_string(page.block(channel));
    }
    out += "]]";
    return out;
}

auto operator<<(std::ostream& out, const Page& page) -> std::ostream& {
    return out << to_string(page);
}

}  // namespace blockwise
