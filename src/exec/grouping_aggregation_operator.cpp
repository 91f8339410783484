#include <blockwise/exec/grouping_aggregation_operator.hpp>

#include <blockwise/aggregation/group_state.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace blockwise::exec {

GroupingAggregationOperator::GroupingAggregationOperator(
    std::size_t group_channel, std::vector<aggregation::GroupingAggregator> aggregators)
    : group_channel_(group_channel), aggregators_(std::move(aggregators)) {}

auto GroupingAggregationOperator::add_input(Page page) -> Result<void> {
    if (finishing_) {
        return std::unexpected(make_error(ErrorKind::IllegalState,
                                          "GroupingAggregationOperator received input after finish"));
    }
    if (group_channel_ >= page.block_count()) {
        return std::unexpected(make_error(
            ErrorKind::ShapeMismatch,
            fmt::format("group channel {} out of range for a page with {} blocks",
                        group_channel_, page.block_count())));
    }
    auto groups = block_as<std::int64_t>(page.block(group_channel_));
    if (!groups) {
        return std::unexpected(groups.error());
    }
    const LongBlock& group_block = **groups;
    for (std::int32_t p = 0; p < group_block.position_count(); ++p) {
        if (group_block.is_null(p)) {
            continue;
        }
        const auto first = group_block.first_value_index(p);
        for (std::int32_t i = 0; i < group_block.value_count(p); ++i) {
            const std::int64_t group = group_block.get(first + i);
            if (group < 0) {
                return std::unexpected(make_error(
                    ErrorKind::IllegalState,
                    fmt::format("negative group ordinal {} at position {}", group, p)));
            }
            if (group > aggregation::kMaxGroupOrdinal) {
                return std::unexpected(make_error(
                    ErrorKind::IllegalState,
                    fmt::format("group ordinal {} at position {} exceeds {}", group, p,
                                aggregation::kMaxGroupOrdinal)));
            }
            max_group_ = std::max(max_group_, group);
        }
    }
    for (auto& aggregator : aggregators_) {
        if (auto ok = aggregator.process_page(group_block, page); !ok) {
            return ok;
        }
    }
    ++pages_;
    return {};
}

auto GroupingAggregationOperator::get_output() -> Result<std::optional<Page>> {
    if (!finishing_ || emitted_) {
        return std::optional<Page>{};
    }
    std::vector<std::int64_t> ordinals(static_cast<std::size_t>(max_group_ + 1));
    for (std::size_t g = 0; g < ordinals.size(); ++g) {
        ordinals[g] = static_cast<std::int64_t>(g);
    }
    const LongVector selected(std::move(ordinals));

    std::vector<AnyBlock> blocks;
    blocks.emplace_back(selected.as_block());
    for (const auto& aggregator : aggregators_) {
        auto out = aggregator.evaluate(selected);
        if (!out) {
            return std::unexpected(out.error());
        }
        for (auto& block : *out) {
            blocks.push_back(std::move(block));
        }
    }
    auto page = Page::make(std::move(blocks));
    if (!page) {
        return std::unexpected(page.error());
    }
    emitted_ = true;
    spdlog::debug("{}: {} input pages folded into {} groups", name(), pages_,
                  selected.position_count());
    return std::optional<Page>{std::move(*page)};
}

auto GroupingAggregationOperator::failures() const -> std::vector<Error> {
    std::vector<Error> out;
    for (const auto& aggregator : aggregators_) {
        if (aggregator.failure()) {
            out.push_back(*aggregator.failure());
        }
    }
    return out;
}

}  // namespace blockwise::exec
