#include <blockwise/aggregation/numeric_aggregators.hpp>
#include <blockwise/core/format.hpp>

#include "aggregator_test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

using namespace blockwise;
using namespace blockwise::aggregation;
using blockwise::test::all_groups;
using blockwise::test::block_of;
using blockwise::test::final_block;
using blockwise::test::groups_of;

TEST_CASE("min and max describe themselves", "[aggregation][min][max]") {
    REQUIRE(MinIntGroupingAggregatorFunction().describe() == "min of ints");
    REQUIRE(MinLongGroupingAggregatorFunction().describe() == "min of longs");
    REQUIRE(MaxDoubleGroupingAggregatorFunction().describe() == "max of doubles");
    REQUIRE(MinIntGroupingAggregatorFunction().final_type() == ElementType::Int);
}

TEST_CASE("min of ints per group", "[aggregation][min]") {
    MinIntGroupingAggregatorFunction min;
    auto ok = min.add_raw_input(groups_of({0, 1, 0}), block_of<std::int32_t>({7, 2, 3}));
    REQUIRE(ok.has_value());
    REQUIRE(final_block<std::int32_t>(min, 2) == IntBlock(IntVector{3, 2}));
}

TEST_CASE("max of longs per group", "[aggregation][max]") {
    MaxLongGroupingAggregatorFunction max;
    auto ok = max.add_raw_input(groups_of({1, 1, 0, 1}), block_of<std::int64_t>({-5, 9, -2, 4}));
    REQUIRE(ok.has_value());
    REQUIRE(final_block<std::int64_t>(max, 2) == LongBlock(LongVector{-2, 9}));
}

TEST_CASE("min and max yield the identity for unseen groups", "[aggregation][min][max]") {
    MinIntGroupingAggregatorFunction min_int;
    MaxIntGroupingAggregatorFunction max_int;
    MinDoubleGroupingAggregatorFunction min_double;
    MaxDoubleGroupingAggregatorFunction max_double;

    REQUIRE(final_block<std::int32_t>(min_int, 1) ==
            IntBlock(IntVector{std::numeric_limits<std::int32_t>::max()}));
    REQUIRE(final_block<std::int32_t>(max_int, 1) ==
            IntBlock(IntVector{std::numeric_limits<std::int32_t>::lowest()}));
    REQUIRE(final_block<double>(min_double, 1) ==
            DoubleBlock(DoubleVector{std::numeric_limits<double>::infinity()}));
    REQUIRE(final_block<double>(max_double, 1) ==
            DoubleBlock(DoubleVector{-std::numeric_limits<double>::infinity()}));
}

TEST_CASE("min and max of doubles propagate NaN", "[aggregation][min][max]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    MinDoubleGroupingAggregatorFunction min;
    MaxDoubleGroupingAggregatorFunction max;
    REQUIRE(min.add_raw_input(groups_of({0, 0, 1}), block_of<double>({1.0, nan, 2.0})).has_value());
    REQUIRE(max.add_raw_input(groups_of({0, 0, 1}), block_of<double>({nan, 1.0, 2.0})).has_value());

    auto min_block = final_block<double>(min, 2);
    auto max_block = final_block<double>(max, 2);
    REQUIRE(std::isnan(min_block.get(min_block.first_value_index(0))));
    REQUIRE(std::isnan(max_block.get(max_block.first_value_index(0))));
    REQUIRE(min_block.get(min_block.first_value_index(1)) == 2.0);
}

TEST_CASE("min skips nulls and combines partials", "[aggregation][min]") {
    MinLongGroupingAggregatorFunction first;
    MinLongGroupingAggregatorFunction second;
    REQUIRE(first.add_raw_input(groups_of({0, 1}), block_of<std::int64_t>({10, std::nullopt}))
                .has_value());
    REQUIRE(second.add_raw_input(groups_of({0, std::nullopt, 1}),
                                 block_of<std::int64_t>({4, -100, 8}))
                .has_value());

    MinLongGroupingAggregatorFunction combined;
    test::combine_into(combined, first, all_groups(2));
    test::combine_into(combined, second, all_groups(2));
    REQUIRE(final_block<std::int64_t>(combined, 2) == LongBlock(LongVector{4, 8}));

    SECTION("combine order does not matter") {
        MinLongGroupingAggregatorFunction reversed;
        test::combine_into(reversed, second, all_groups(2));
        test::combine_into(reversed, first, all_groups(2));
        REQUIRE(final_block<std::int64_t>(reversed, 2) == final_block<std::int64_t>(combined, 2));
    }
}

TEST_CASE("min refuses state of max", "[aggregation][min][max]") {
    MaxIntGroupingAggregatorFunction max;
    REQUIRE(max.add_raw_input(groups_of({0}), block_of<std::int32_t>({1})).has_value());

    MinIntGroupingAggregatorFunction min;
    auto ok = min.add_intermediate_row(0, max, 0);
    REQUIRE_FALSE(ok.has_value());
    REQUIRE(ok.error().kind == ErrorKind::IllegalState);
}

TEST_CASE("min and max over random paged input", "[aggregation][min][max]") {
    test::check_random_scenario<MinIntOp>(11, 2'000, 5, 0.1, std::numeric_limits<std::int32_t>::min(),
                                          std::numeric_limits<std::int32_t>::max());
    test::check_random_scenario<MaxIntOp>(12, 2'000, 5, 0.1, -50, 50);
    test::check_random_scenario<MinLongOp>(13, 1'000, 9, 0.0, std::int64_t{-1'000},
                                           std::int64_t{1'000});
    test::check_random_scenario<MaxDoubleOp>(14, 1'000, 4, 0.3, -10.0, 10.0);
}
