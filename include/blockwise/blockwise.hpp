#pragma once

/// Convenience umbrella header for the blockwise library.

#include <blockwise/aggregation/grouping_aggregator.hpp>
#include <blockwise/aggregation/numeric_aggregators.hpp>
#include <blockwise/aggregation/registry.hpp>
#include <blockwise/core/block.hpp>
#include <blockwise/core/block_builder.hpp>
#include <blockwise/core/format.hpp>
#include <blockwise/core/page.hpp>
#include <blockwise/core/vector.hpp>
#include <blockwise/exec/driver.hpp>
#include <blockwise/exec/grouping_aggregation_operator.hpp>
#include <blockwise/exec/partitioned_aggregation.hpp>
#include <blockwise/exec/sources.hpp>
#include <blockwise/version.hpp>
