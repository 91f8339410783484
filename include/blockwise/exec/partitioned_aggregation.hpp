#pragma once

#include <blockwise/aggregation/registry.hpp>
#include <blockwise/core/error.hpp>
#include <blockwise/core/page.hpp>
#include <blockwise/exec/driver.hpp>

#include <cstddef>
#include <vector>

namespace blockwise::exec {

/// One aggregation over the raw values in `channel`.
struct AggregatorInput {
    aggregation::AggregatorFunctionSupplier supplier;
    std::size_t channel = 1;
};

struct PartitionedAggregationConfig {
    DriverConfig driver;
    /// Run the per-partition pipelines on their own threads.
    bool parallel = true;
};

/// Output of a grouped aggregation: `[groups, one block per aggregation]`,
/// plus the aggregations aborted by overflow (their columns are null).
struct AggregationResult {
    Page page;
    std::vector<Error> failures;
};

/// Single-stage (raw -> final) grouped aggregation over `pages`.
[[nodiscard]] auto run_single_aggregation(std::vector<Page> pages, std::size_t group_channel,
                                          const std::vector<AggregatorInput>& aggregations,
                                          const DriverConfig& config = {})
    -> Result<AggregationResult>;

/// Two-stage grouped aggregation: every partition is reduced to
/// intermediate state by its own pipeline, then the partial pages are
/// combined in partition order by a Final-mode operator.
[[nodiscard]] auto run_partitioned_aggregation(std::vector<std::vector<Page>> partitions,
                                               std::size_t group_channel,
                                               const std::vector<AggregatorInput>& aggregations,
                                               const PartitionedAggregationConfig& config = {})
    -> Result<AggregationResult>;

}  // namespace blockwise::exec
