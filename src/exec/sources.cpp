#include <blockwise/exec/sources.hpp>

#include <spdlog/spdlog.h>

namespace blockwise::exec {

PageListSourceOperator::PageListSourceOperator(std::vector<Page> pages) {
    for (auto& page : pages) {
        pages_.push_back(std::move(page));
    }
}

void PageListSourceOperator::finish() {
    finished_ = true;
}

auto PageListSourceOperator::is_finished() const -> bool {
    return finished_ || pages_.empty();
}

auto PageListSourceOperator::get_output() -> Result<std::optional<Page>> {
    if (is_finished()) {
        return std::optional<Page>{};
    }
    Page page = std::move(pages_.front());
    pages_.pop_front();
    return std::optional<Page>{std::move(page)};
}

void PageListSourceOperator::close() {
    if (!pages_.empty()) {
        spdlog::debug("{}: releasing {} unread pages", name(), pages_.size());
    }
    pages_.clear();
    finished_ = true;
}

}  // namespace blockwise::exec
