#include <blockwise/aggregation/grouping_aggregator.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <variant>

namespace blockwise::aggregation {

GroupingAggregator::GroupingAggregator(GroupingAggregatorFunctionPtr function,
                                       AggregatorMode mode, std::vector<std::size_t> channels)
    : function_(std::move(function)), mode_(mode), channels_(std::move(channels)) {}

auto GroupingAggregator::process_page(const LongBlock& groups, const Page& page) -> Result<void> {
    if (failure_) {
        return {};
    }
    const std::size_t expected = input_is_raw(mode_) ? 1 : function_->intermediate_block_count();
    if (channels_.size() != expected) {
        return std::unexpected(make_error(
            ErrorKind::ShapeMismatch,
            fmt::format("{} reads {} channels but was bound to {}", describe(), expected,
                        channels_.size())));
    }
    std::vector<AnyBlock> inputs;
    inputs.reserve(channels_.size());
    for (auto channel : channels_) {
        if (channel >= page.block_count()) {
            return std::unexpected(make_error(
                ErrorKind::ShapeMismatch,
                fmt::format("{} reads channel {} of a page with {} blocks", describe(), channel,
                            page.block_count())));
        }
        inputs.push_back(page.block(channel));
    }

    // Partial state is never null unless the aggregation that produced it was aborted.
    if (!input_is_raw(mode_)) {
        for (const auto& block : inputs) {
            const bool has_null = std::visit(
                [](const auto& b) { return b.may_have_nulls() && !b.as_vector().has_value(); },
                block);
            if (has_null) {
                mark_failed(make_error(
                    ErrorKind::ArithmeticOverflow,
                    fmt::format("{} received partial state of an aborted aggregation",
                                describe())));
                return {};
            }
        }
    }

    auto result = input_is_raw(mode_) ? function_->add_raw_input(groups, inputs.front())
                                      : function_->add_intermediate_input(groups, inputs);
    if (!result && result.error().kind == ErrorKind::ArithmeticOverflow) {
        mark_failed(result.error());
        return {};
    }
    return result;
}

auto GroupingAggregator::evaluate(const LongVector& selected) const
    -> Result<std::vector<AnyBlock>> {
    if (failure_) {
        std::vector<AnyBlock> nulls;
        const auto positions = selected.position_count();
        if (output_is_final(mode_)) {
            nulls.push_back(constant_null_block(function_->final_type(), positions));
        } else {
            for (auto type : function_->intermediate_types()) {
                nulls.push_back(constant_null_block(type, positions));
            }
        }
        return nulls;
    }
    if (output_is_final(mode_)) {
        auto block = function_->evaluate_final(selected);
        if (!block) {
            return std::unexpected(block.error());
        }
        std::vector<AnyBlock> out;
        out.push_back(std::move(*block));
        return out;
    }
    return function_->evaluate_intermediate(selected);
}

auto GroupingAggregator::evaluate_block_count() const -> std::size_t {
    return output_is_final(mode_) ? 1 : function_->intermediate_block_count();
}

void GroupingAggregator::mark_failed(Error error) {
    if (failure_) {
        return;
    }
    spdlog::warn("aggregation [{}] aborted: {}", describe(), error.format());
    failure_ = std::move(error);
}

}  // namespace blockwise::aggregation
