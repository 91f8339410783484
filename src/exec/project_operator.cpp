#include <blockwise/exec/project_operator.hpp>

namespace blockwise::exec {

auto ProjectOperator::add_input(Page page) -> Result<void> {
    if (!needs_input()) {
        return std::unexpected(make_error(ErrorKind::IllegalState,
                                          "ProjectOperator received input it did not ask for"));
    }
    auto projected = page.project(channels_);
    if (!projected) {
        return std::unexpected(projected.error());
    }
    pending_ = std::move(*projected);
    return {};
}

auto ProjectOperator::get_output() -> Result<std::optional<Page>> {
    std::optional<Page> out = std::move(pending_);
    pending_.reset();
    return out;
}

}  // namespace blockwise::exec
