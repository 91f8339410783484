#pragma once

#include <blockwise/core/block.hpp>
#include <blockwise/core/element.hpp>
#include <blockwise/core/error.hpp>
#include <blockwise/core/vector.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blockwise::aggregation {

/// Computes one aggregate value per group ordinal.
///
/// An instance owns its per-group state exclusively. Instances working on
/// different partitions share nothing; their partial states meet only through
/// add_intermediate_input() or add_intermediate_row(), whose combine operator
/// is associative and commutative, so partials may be merged in any order.
///
/// Every operation that reads a `groups` block treats each non-null value as a
/// group ordinal. A position with several group values and several input
/// values folds every (group, value) pair, groups outer and values inner, in
/// encounter order.
class GroupingAggregatorFunction {
   public:
    virtual ~GroupingAggregatorFunction() = default;

    GroupingAggregatorFunction() = default;
    GroupingAggregatorFunction(const GroupingAggregatorFunction&) = delete;
    auto operator=(const GroupingAggregatorFunction&) -> GroupingAggregatorFunction& = delete;

    /// Function name, e.g. "sum".
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// Element type of raw input values.
    [[nodiscard]] virtual auto input_type() const noexcept -> ElementType = 0;

    /// Element type of evaluate_final() output.
    [[nodiscard]] virtual auto final_type() const noexcept -> ElementType = 0;

    /// Element types of the blocks produced by evaluate_intermediate().
    [[nodiscard]] virtual auto intermediate_types() const -> std::vector<ElementType> = 0;

    [[nodiscard]] auto intermediate_block_count() const -> std::size_t {
        return intermediate_types().size();
    }

    /// Human-readable description for plan explanation, e.g. "sum of ints".
    [[nodiscard]] virtual auto describe() const -> std::string = 0;

    /// Fold raw `values` into the groups named by `groups`, position by position.
    /// Null groups and null values are skipped. Wrap a LongVector of groups with
    /// as_block(). Fails with UnsupportedShape for values of another element
    /// type, ShapeMismatch for unequal position counts and ArithmeticOverflow
    /// when an accumulator leaves its range.
    [[nodiscard]] virtual auto add_raw_input(const LongBlock& groups, const AnyBlock& values)
        -> Result<void> = 0;

    /// Merge partial state exported by evaluate_intermediate() of an instance
    /// of the same function. The blocks carry no function identity: only their
    /// count (ShapeMismatch) and element types (UnsupportedShape) are checked,
    /// so state of another function with the same intermediate types is merged
    /// as this one's. Bind Final and Intermediate aggregators from the supplier
    /// that built the Initial ones.
    [[nodiscard]] virtual auto add_intermediate_input(const LongBlock& groups,
                                                      std::span<const AnyBlock> state)
        -> Result<void> = 0;

    /// Merge `other_group` of `other` into `group` of this instance.
    /// Fails with IllegalState when `other` is a different function.
    [[nodiscard]] virtual auto add_intermediate_row(std::int64_t group,
                                                    const GroupingAggregatorFunction& other,
                                                    std::int64_t other_group) -> Result<void> = 0;

    /// Partial state of `selected` groups, in the order given.
    [[nodiscard]] virtual auto evaluate_intermediate(const LongVector& selected) const
        -> Result<std::vector<AnyBlock>> = 0;

    /// Final value of `selected` groups, in the order given. Groups never
    /// observed yield the function's identity value.
    [[nodiscard]] virtual auto evaluate_final(const LongVector& selected) const
        -> Result<AnyBlock> = 0;
};

using GroupingAggregatorFunctionPtr = std::unique_ptr<GroupingAggregatorFunction>;

}  // namespace blockwise::aggregation
