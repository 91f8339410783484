#include <blockwise/exec/partitioned_aggregation.hpp>

#include <blockwise/exec/grouping_aggregation_operator.hpp>
#include <blockwise/exec/page_consumer_operator.hpp>
#include <blockwise/exec/sources.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <thread>

namespace blockwise::exec {

namespace {

using aggregation::AggregatorMode;
using aggregation::GroupingAggregator;

/// Result page of one aggregation pipeline with the failure, if any, of each aggregator.
struct PipelineOutput {
    Page page;
    std::vector<std::optional<Error>> failures;
};

auto run_pipeline(std::vector<Page> pages, std::size_t group_channel,
                  std::vector<GroupingAggregator> aggregators, const DriverConfig& config)
    -> Result<PipelineOutput> {
    auto aggregation =
        std::make_unique<GroupingAggregationOperator>(group_channel, std::move(aggregators));
    const GroupingAggregationOperator* aggregation_op = aggregation.get();

    std::vector<Page> output;
    auto sink = std::make_unique<PageConsumerOperator>(
        [&output](Page page) { output.push_back(std::move(page)); });

    std::vector<OperatorPtr> operators;
    operators.push_back(std::move(aggregation));
    Driver driver(std::make_unique<PageListSourceOperator>(std::move(pages)),
                  std::move(operators), std::move(sink), config);
    auto stats = driver.run();
    if (!stats) {
        return std::unexpected(stats.error());
    }
    if (output.size() != 1) {
        return std::unexpected(make_error(
            ErrorKind::IllegalState,
            fmt::format("aggregation pipeline produced {} pages, expected 1", output.size())));
    }

    PipelineOutput out{.page = std::move(output.front()), .failures = {}};
    for (const auto& aggregator : aggregation_op->aggregators()) {
        out.failures.push_back(aggregator.failure());
    }
    return out;
}

auto collect_failures(const std::vector<std::optional<Error>>& failures) -> std::vector<Error> {
    std::vector<Error> out;
    for (const auto& failure : failures) {
        if (failure) {
            out.push_back(*failure);
        }
    }
    return out;
}

}  // namespace

auto run_single_aggregation(std::vector<Page> pages, std::size_t group_channel,
                            const std::vector<AggregatorInput>& aggregations,
                            const DriverConfig& config) -> Result<AggregationResult> {
    std::vector<GroupingAggregator> aggregators;
    aggregators.reserve(aggregations.size());
    for (const auto& input : aggregations) {
        aggregators.emplace_back(input.supplier, AggregatorMode::Single,
                                 std::vector<std::size_t>{input.channel});
    }
    auto result = run_pipeline(std::move(pages), group_channel, std::move(aggregators), config);
    if (!result) {
        return std::unexpected(result.error());
    }
    return AggregationResult{.page = std::move(result->page),
                             .failures = collect_failures(result->failures)};
}

auto run_partitioned_aggregation(std::vector<std::vector<Page>> partitions,
                                 std::size_t group_channel,
                                 const std::vector<AggregatorInput>& aggregations,
                                 const PartitionedAggregationConfig& config)
    -> Result<AggregationResult> {
    const std::size_t partition_count = partitions.size();
    spdlog::debug("partitioned aggregation: {} partitions, {} aggregations, {}",
                  partition_count, aggregations.size(),
                  config.parallel ? "parallel" : "sequential");

    auto initial_aggregators = [&]() {
        std::vector<GroupingAggregator> aggregators;
        aggregators.reserve(aggregations.size());
        for (const auto& input : aggregations) {
            aggregators.emplace_back(input.supplier, AggregatorMode::Initial,
                                     std::vector<std::size_t>{input.channel});
        }
        return aggregators;
    };

    // Each slot is written by exactly one worker.
    std::vector<std::optional<Result<PipelineOutput>>> partials(partition_count);
    auto run_partition = [&](std::size_t p, std::vector<GroupingAggregator> aggregators) {
        partials[p] = run_pipeline(std::move(partitions[p]), group_channel,
                                   std::move(aggregators), config.driver);
    };

    if (config.parallel && partition_count > 1) {
        std::vector<std::thread> workers;
        workers.reserve(partition_count);
        for (std::size_t p = 0; p < partition_count; ++p) {
            workers.emplace_back(run_partition, p, initial_aggregators());
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (std::size_t p = 0; p < partition_count; ++p) {
            run_partition(p, initial_aggregators());
        }
    }

    // The first partition to abort an aggregation names its failure; the
    // final stage would only report the null partial state it left behind.
    std::vector<std::optional<Error>> failures(aggregations.size());
    std::vector<Page> intermediate;
    intermediate.reserve(partition_count);
    for (std::size_t p = 0; p < partition_count; ++p) {
        auto& partial = *partials[p];
        if (!partial) {
            return std::unexpected(partial.error());
        }
        for (std::size_t a = 0; a < failures.size(); ++a) {
            if (!failures[a] && partial->failures[a]) {
                failures[a] = partial->failures[a];
            }
        }
        intermediate.push_back(std::move(partial->page));
    }

    std::vector<GroupingAggregator> final_aggregators;
    final_aggregators.reserve(aggregations.size());
    std::size_t channel = 1;
    for (const auto& input : aggregations) {
        auto function = input.supplier.create();
        std::vector<std::size_t> channels;
        for (std::size_t i = 0; i < function->intermediate_block_count(); ++i) {
            channels.push_back(channel++);
        }
        final_aggregators.emplace_back(std::move(function), AggregatorMode::Final,
                                       std::move(channels));
    }

    auto combined = run_pipeline(std::move(intermediate), 0, std::move(final_aggregators),
                                 DriverConfig{});
    if (!combined) {
        return std::unexpected(combined.error());
    }
    for (std::size_t a = 0; a < failures.size(); ++a) {
        if (!failures[a] && combined->failures[a]) {
            failures[a] = combined->failures[a];
        }
    }
    return AggregationResult{.page = std::move(combined->page),
                             .failures = collect_failures(failures)};
}

}  // namespace blockwise::exec
