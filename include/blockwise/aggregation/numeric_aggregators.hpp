#pragma once

#include <blockwise/aggregation/group_state.hpp>
#include <blockwise/aggregation/grouping_aggregator_function.hpp>
#include <blockwise/core/block.hpp>
#include <blockwise/core/block_builder.hpp>

#include <fmt/format.h>

#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace blockwise::aggregation {

// ─── Accumulation policies ────────────────────────────────────────────────────
//  Each policy names its input and state element types, its identity and two
//  steps: fold (state + raw value) and merge (state + partial state). A step
//  returns nullopt when the result does not fit the state type.

namespace detail {

template <std::integral S>
[[nodiscard]] constexpr auto checked_add(S a, S b) noexcept -> std::optional<S> {
    if ((b > 0 && a > std::numeric_limits<S>::max() - b) ||
        (b < 0 && a < std::numeric_limits<S>::min() - b)) {
        return std::nullopt;
    }
    return static_cast<S>(a + b);
}

/// min/max that propagate NaN so the result does not depend on argument order.
template <typename T>
[[nodiscard]] auto min_value(T a, T b) noexcept -> T {
    if constexpr (std::is_floating_point_v<T>) {
        if (std::isnan(a) || std::isnan(b)) {
            return std::numeric_limits<T>::quiet_NaN();
        }
    }
    return b < a ? b : a;
}

template <typename T>
[[nodiscard]] auto max_value(T a, T b) noexcept -> T {
    if constexpr (std::is_floating_point_v<T>) {
        if (std::isnan(a) || std::isnan(b)) {
            return std::numeric_limits<T>::quiet_NaN();
        }
    }
    return a < b ? b : a;
}

}  // namespace detail

/// Sum of I accumulated in S. Integral sums fail on overflow of S; pick a
/// wider S than I to keep the input type from overflowing.
template <BlockElement I, BlockElement S>
struct SumOp {
    using Input = I;
    using State = S;
    static constexpr std::string_view name = "sum";

    [[nodiscard]] static constexpr auto identity() noexcept -> S { return S{0}; }

    [[nodiscard]] static constexpr auto merge(S acc, S partial) noexcept -> std::optional<S> {
        if constexpr (std::is_integral_v<S>) {
            return detail::checked_add(acc, partial);
        } else {
            return acc + partial;
        }
    }

    [[nodiscard]] static constexpr auto fold(S acc, I value) noexcept -> std::optional<S> {
        return merge(acc, static_cast<S>(value));
    }
};

template <BlockElement T>
struct MinOp {
    using Input = T;
    using State = T;
    static constexpr std::string_view name = "min";

    [[nodiscard]] static constexpr auto identity() noexcept -> T {
        if constexpr (std::is_floating_point_v<T>) {
            return std::numeric_limits<T>::infinity();
        } else {
            return std::numeric_limits<T>::max();
        }
    }

    [[nodiscard]] static auto merge(T acc, T partial) noexcept -> std::optional<T> {
        return detail::min_value(acc, partial);
    }

    [[nodiscard]] static auto fold(T acc, T value) noexcept -> std::optional<T> {
        return merge(acc, value);
    }
};

template <BlockElement T>
struct MaxOp {
    using Input = T;
    using State = T;
    static constexpr std::string_view name = "max";

    [[nodiscard]] static constexpr auto identity() noexcept -> T {
        if constexpr (std::is_floating_point_v<T>) {
            return -std::numeric_limits<T>::infinity();
        } else {
            return std::numeric_limits<T>::lowest();
        }
    }

    [[nodiscard]] static auto merge(T acc, T partial) noexcept -> std::optional<T> {
        return detail::max_value(acc, partial);
    }

    [[nodiscard]] static auto fold(T acc, T value) noexcept -> std::optional<T> {
        return merge(acc, value);
    }
};

using SumIntOp = SumOp<std::int32_t, std::int64_t>;
using SumLongOp = SumOp<std::int64_t, std::int64_t>;
using SumDoubleOp = SumOp<double, double>;
using MinIntOp = MinOp<std::int32_t>;
using MinLongOp = MinOp<std::int64_t>;
using MinDoubleOp = MinOp<double>;
using MaxIntOp = MaxOp<std::int32_t>;
using MaxLongOp = MaxOp<std::int64_t>;
using MaxDoubleOp = MaxOp<double>;

/// Grouping aggregator over one numeric column, driven by an accumulation
/// policy. Intermediate state is two blocks: the per-group accumulated value
/// and a boolean block telling which groups saw any input.
template <typename Op>
class NumericGroupingAggregatorFunction final : public GroupingAggregatorFunction {
   public:
    using Input = typename Op::Input;
    using State = typename Op::State;

    NumericGroupingAggregatorFunction() : state_(Op::identity()) {}

    [[nodiscard]] auto name() const -> std::string_view override { return Op::name; }

    [[nodiscard]] auto input_type() const noexcept -> ElementType override {
        return ElementTraits<Input>::type;
    }

    [[nodiscard]] auto final_type() const noexcept -> ElementType override {
        return ElementTraits<State>::type;
    }

    [[nodiscard]] auto intermediate_types() const -> std::vector<ElementType> override {
        return {ElementTraits<State>::type, ElementType::Boolean};
    }

    [[nodiscard]] auto describe() const -> std::string override {
        return fmt::format("{} of {}s", Op::name, ElementTraits<Input>::name);
    }

    [[nodiscard]] auto add_raw_input(const LongBlock& groups, const AnyBlock& values)
        -> Result<void> override {
        auto typed = block_as<Input>(values);
        if (!typed) {
            return std::unexpected(typed.error());
        }
        const Block<Input>& block = **typed;
        if (auto shape = check_positions(groups, block.position_count()); !shape) {
            return shape;
        }
        const auto positions = groups.position_count();
        for (std::int32_t p = 0; p < positions; ++p) {
            if (groups.is_null(p) || block.is_null(p)) {
                continue;
            }
            const auto group_first = groups.first_value_index(p);
            const auto group_count = groups.value_count(p);
            const auto value_first = block.first_value_index(p);
            const auto value_count = block.value_count(p);
            for (std::int32_t g = 0; g < group_count; ++g) {
                const std::int64_t group = groups.get(group_first + g);
                if (auto ok = check_group(group); !ok) {
                    return ok;
                }
                state_.ensure_capacity(group);
                State acc = state_.get(group);
                for (std::int32_t v = 0; v < value_count; ++v) {
                    auto next = Op::fold(acc, block.get(value_first + v));
                    if (!next) {
                        return std::unexpected(overflow(group));
                    }
                    acc = *next;
                }
                state_.set(group, acc);
            }
        }
        return {};
    }

    [[nodiscard]] auto add_intermediate_input(const LongBlock& groups,
                                              std::span<const AnyBlock> state)
        -> Result<void> override {
        if (state.size() != 2) {
            return std::unexpected(make_error(
                ErrorKind::ShapeMismatch,
                fmt::format("{} expects 2 intermediate blocks but got {}", describe(),
                            state.size())));
        }
        auto values = block_as<State>(state[0]);
        if (!values) {
            return std::unexpected(values.error());
        }
        auto seen = block_as<bool>(state[1]);
        if (!seen) {
            return std::unexpected(seen.error());
        }
        const Block<State>& value_block = **values;
        const BooleanBlock& seen_block = **seen;
        if (auto shape = check_positions(groups, value_block.position_count()); !shape) {
            return shape;
        }
        if (auto shape = check_positions(groups, seen_block.position_count()); !shape) {
            return shape;
        }
        const auto positions = groups.position_count();
        for (std::int32_t p = 0; p < positions; ++p) {
            if (groups.is_null(p) || value_block.is_null(p) || seen_block.is_null(p) ||
                !seen_block.get(seen_block.first_value_index(p))) {
                continue;
            }
            const State partial = value_block.get(value_block.first_value_index(p));
            const auto group_first = groups.first_value_index(p);
            const auto group_count = groups.value_count(p);
            for (std::int32_t g = 0; g < group_count; ++g) {
                if (auto ok = merge_into(groups.get(group_first + g), partial); !ok) {
                    return ok;
                }
            }
        }
        return {};
    }

    [[nodiscard]] auto add_intermediate_row(std::int64_t group,
                                            const GroupingAggregatorFunction& other,
                                            std::int64_t other_group) -> Result<void> override {
        const auto* typed = dynamic_cast<const NumericGroupingAggregatorFunction*>(&other);
        if (typed == nullptr) {
            return std::unexpected(make_error(
                ErrorKind::IllegalState,
                fmt::format("cannot combine [{}] state with [{}] state", describe(),
                            other.describe())));
        }
        if (auto ok = check_group(other_group); !ok) {
            return ok;
        }
        if (!typed->state_.seen(other_group)) {
            return {};
        }
        return merge_into(group, typed->state_.get(other_group));
    }

    [[nodiscard]] auto evaluate_intermediate(const LongVector& selected) const
        -> Result<std::vector<AnyBlock>> override {
        const auto positions = selected.position_count();
        BlockBuilder<State> values(static_cast<std::size_t>(positions));
        BooleanBlockBuilder seen(static_cast<std::size_t>(positions));
        for (std::int32_t p = 0; p < positions; ++p) {
            const std::int64_t group = selected.get(p);
            if (auto ok = check_group(group); !ok) {
                return std::unexpected(ok.error());
            }
            values.append_value(state_.get(group));
            seen.append_value(state_.seen(group));
        }
        auto value_block = values.build();
        if (!value_block) {
            return std::unexpected(value_block.error());
        }
        auto seen_block = seen.build();
        if (!seen_block) {
            return std::unexpected(seen_block.error());
        }
        std::vector<AnyBlock> out;
        out.reserve(2);
        out.emplace_back(std::move(*value_block));
        out.emplace_back(std::move(*seen_block));
        return out;
    }

    [[nodiscard]] auto evaluate_final(const LongVector& selected) const
        -> Result<AnyBlock> override {
        const auto positions = selected.position_count();
        BlockBuilder<State> values(static_cast<std::size_t>(positions));
        for (std::int32_t p = 0; p < positions; ++p) {
            const std::int64_t group = selected.get(p);
            if (auto ok = check_group(group); !ok) {
                return std::unexpected(ok.error());
            }
            values.append_value(state_.get(group));
        }
        auto block = values.build();
        if (!block) {
            return std::unexpected(block.error());
        }
        return AnyBlock{std::move(*block)};
    }

   private:
    static auto check_group(std::int64_t group) -> Result<void> {
        if (group < 0) {
            return std::unexpected(make_error(
                ErrorKind::IllegalState, fmt::format("negative group ordinal {}", group)));
        }
        if (group > kMaxGroupOrdinal) {
            return std::unexpected(make_error(
                ErrorKind::IllegalState,
                fmt::format("group ordinal {} exceeds {}", group, kMaxGroupOrdinal)));
        }
        return {};
    }

    auto check_positions(const LongBlock& groups, std::int32_t positions) const -> Result<void> {
        if (groups.position_count() != positions) {
            return std::unexpected(make_error(
                ErrorKind::ShapeMismatch,
                fmt::format("{}: groups have {} positions but input has {}", describe(),
                            groups.position_count(), positions)));
        }
        return {};
    }

    auto merge_into(std::int64_t group, const State& partial) -> Result<void> {
        if (auto ok = check_group(group); !ok) {
            return ok;
        }
        state_.ensure_capacity(group);
        auto next = Op::merge(state_.get(group), partial);
        if (!next) {
            return std::unexpected(overflow(group));
        }
        state_.set(group, *next);
        return {};
    }

    [[nodiscard]] auto overflow(std::int64_t group) const -> Error {
        return make_error(ErrorKind::ArithmeticOverflow,
                          fmt::format("{} overflowed {} range in group {}", describe(),
                                      ElementTraits<State>::name, group));
    }

    GroupArrayState<State> state_;
};

using SumIntGroupingAggregatorFunction = NumericGroupingAggregatorFunction<SumIntOp>;
using SumLongGroupingAggregatorFunction = NumericGroupingAggregatorFunction<SumLongOp>;
using SumDoubleGroupingAggregatorFunction = NumericGroupingAggregatorFunction<SumDoubleOp>;
using MinIntGroupingAggregatorFunction = NumericGroupingAggregatorFunction<MinIntOp>;
using MinLongGroupingAggregatorFunction = NumericGroupingAggregatorFunction<MinLongOp>;
using MinDoubleGroupingAggregatorFunction = NumericGroupingAggregatorFunction<MinDoubleOp>;
using MaxIntGroupingAggregatorFunction = NumericGroupingAggregatorFunction<MaxIntOp>;
using MaxLongGroupingAggregatorFunction = NumericGroupingAggregatorFunction<MaxLongOp>;
using MaxDoubleGroupingAggregatorFunction = NumericGroupingAggregatorFunction<MaxDoubleOp>;

}  // namespace blockwise::aggregation
