#pragma once

#include <blockwise/aggregation/grouping_aggregator.hpp>
#include <blockwise/exec/operator.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blockwise::exec {

/// Folds every input Page into a set of grouping aggregators.
///
/// `group_channel` holds a LongBlock of dense group ordinals assigned
/// upstream; null positions belong to no group. Once finished, the operator
/// emits a single Page: channel 0 lists the group ordinals 0..max seen, and
/// the aggregators' output blocks follow in aggregator order.
class GroupingAggregationOperator final : public Operator {
   public:
    GroupingAggregationOperator(std::size_t group_channel,
                                std::vector<aggregation::GroupingAggregator> aggregators);

    [[nodiscard]] auto name() const -> std::string override {
        return "GroupingAggregationOperator";
    }
    [[nodiscard]] auto needs_input() const -> bool override { return !finishing_; }
    [[nodiscard]] auto add_input(Page page) -> Result<void> override;
    void finish() override { finishing_ = true; }
    [[nodiscard]] auto is_finished() const -> bool override { return emitted_; }
    [[nodiscard]] auto get_output() -> Result<std::optional<Page>> override;

    /// Aggregations aborted by arithmetic overflow; their output columns are null.
    [[nodiscard]] auto failures() const -> std::vector<Error>;

    [[nodiscard]] auto aggregators() const noexcept
        -> const std::vector<aggregation::GroupingAggregator>& {
        return aggregators_;
    }

    /// Number of groups seen so far (max ordinal + 1).
    [[nodiscard]] auto group_count() const noexcept -> std::int64_t { return max_group_ + 1; }

   private:
    std::size_t group_channel_;
    std::vector<aggregation::GroupingAggregator> aggregators_;
    std::int64_t max_group_ = -1;
    std::size_t pages_ = 0;
    bool finishing_ = false;
    bool emitted_ = false;
};

}  // namespace blockwise::exec
