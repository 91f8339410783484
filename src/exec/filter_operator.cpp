#include <blockwise/exec/filter_operator.hpp>

#include <vector>

namespace blockwise::exec {

auto FilterOperator::needs_input() const -> bool {
    return !finishing_ && !pending_.has_value();
}

auto FilterOperator::add_input(Page page) -> Result<void> {
    if (!needs_input()) {
        return std::unexpected(
            make_error(ErrorKind::IllegalState, "FilterOperator received input it did not ask for"));
    }
    std::vector<std::int32_t> selected;
    selected.reserve(static_cast<std::size_t>(page.position_count()));
    for (std::int32_t p = 0; p < page.position_count(); ++p) {
        if (predicate_(page, p)) {
            selected.push_back(p);
        }
    }
    if (selected.empty()) {
        return {};
    }
    if (static_cast<std::int32_t>(selected.size()) == page.position_count()) {
        pending_ = std::move(page);
    } else {
        pending_ = page.filter(selected);
    }
    return {};
}

auto FilterOperator::is_finished() const -> bool {
    return finishing_ && !pending_.has_value();
}

auto FilterOperator::get_output() -> Result<std::optional<Page>> {
    std::optional<Page> out = std::move(pending_);
    pending_.reset();
    return out;
}

}  // namespace blockwise::exec
