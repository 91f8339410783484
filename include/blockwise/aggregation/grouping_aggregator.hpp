#pragma once

#include <blockwise/aggregation/grouping_aggregator_function.hpp>
#include <blockwise/aggregation/registry.hpp>
#include <blockwise/core/block.hpp>
#include <blockwise/core/error.hpp>
#include <blockwise/core/page.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blockwise::aggregation {

/// Which side of the partial/final split an aggregator sits on.
enum class AggregatorMode : std::uint8_t {
    /// Raw input, final output.
    Single,
    /// Raw input, intermediate output.
    Initial,
    /// Intermediate input, intermediate output.
    Intermediate,
    /// Intermediate input, final output.
    Final,
};

[[nodiscard]] constexpr auto input_is_raw(AggregatorMode mode) noexcept -> bool {
    return mode == AggregatorMode::Single || mode == AggregatorMode::Initial;
}

[[nodiscard]] constexpr auto output_is_final(AggregatorMode mode) noexcept -> bool {
    return mode == AggregatorMode::Single || mode == AggregatorMode::Final;
}

/// A grouping aggregator function bound to a mode and its input channels.
///
/// Raw modes read one channel; intermediate modes read one channel per
/// intermediate block. An ArithmeticOverflow aborts only this aggregation: the
/// failure is kept, further input is ignored and evaluate() yields nulls.
/// Any other error is returned to the caller.
class GroupingAggregator {
   public:
    GroupingAggregator(GroupingAggregatorFunctionPtr function, AggregatorMode mode,
                       std::vector<std::size_t> channels);

    GroupingAggregator(const AggregatorFunctionSupplier& supplier, AggregatorMode mode,
                       std::vector<std::size_t> channels)
        : GroupingAggregator(supplier.create(), mode, std::move(channels)) {}

    /// Feed the page's input channels for `groups`.
    [[nodiscard]] auto process_page(const LongBlock& groups, const Page& page) -> Result<void>;

    /// Output blocks for `selected` groups: one final block, or the intermediate blocks.
    [[nodiscard]] auto evaluate(const LongVector& selected) const -> Result<std::vector<AnyBlock>>;

    /// Number of blocks evaluate() produces.
    [[nodiscard]] auto evaluate_block_count() const -> std::size_t;

    /// Abort this aggregation with `error`, as if it had failed on input.
    void mark_failed(Error error);

    [[nodiscard]] auto failure() const noexcept -> const std::optional<Error>& { return failure_; }
    [[nodiscard]] auto mode() const noexcept -> AggregatorMode { return mode_; }
    [[nodiscard]] auto function() const noexcept -> const GroupingAggregatorFunction& {
        return *function_;
    }
    [[nodiscard]] auto describe() const -> std::string { return function_->describe(); }

   private:
    GroupingAggregatorFunctionPtr function_;
    AggregatorMode mode_;
    std::vector<std::size_t> channels_;
    std::optional<Error> failure_;
};

}  // namespace blockwise::aggregation
