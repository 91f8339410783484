#include <blockwise/blockwise.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <vector>

auto main() -> int {
    using namespace blockwise;

    // A block with a null and a multi-valued position
    IntBlockBuilder builder;
    builder.append_value(3).append_null();
    builder.begin_position_entry().append_value(4).append_value(5).end_position_entry();
    auto values = builder.build();
    if (!values) {
        fmt::print("error: {}\n", values.error().format());
        return 1;
    }

    fmt::print("=== Blocks ===\n");
    fmt::print("{}\n", to_string(*values));
    fmt::print("total values: {}, hash: {}\n", values->total_value_count(), values->hash());

    const std::int32_t keep[] = {0, 2};
    fmt::print("filtered: {}\n", to_string(values->filter(keep)));

    // Sum per group: groups [0, 0, 1] over the block above
    fmt::print("\n=== Grouped sum ===\n");
    LongBlock groups(LongVector{0, 0, 1});
    auto page = Page::make({groups, *values});
    if (!page) {
        fmt::print("error: {}\n", page.error().format());
        return 1;
    }

    std::vector<Page> pages;
    pages.push_back(std::move(*page));
    auto result = exec::run_single_aggregation(
        std::move(pages), 0, {{.supplier = aggregation::sum_ints(), .channel = 1}});
    if (!result) {
        fmt::print("error: {}\n", result.error().format());
        return 1;
    }
    fmt::print("{}\n", to_string(result->page));

    return 0;
}
