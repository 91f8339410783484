#include <blockwise/aggregation/numeric_aggregators.hpp>
#include <blockwise/aggregation/registry.hpp>

#include <memory>

namespace blockwise::aggregation {

namespace {

template <typename Op>
auto make_supplier() -> AggregatorFunctionSupplier {
    using Function = NumericGroupingAggregatorFunction<Op>;
    AggregatorFunctionSupplier supplier;
    supplier.name = std::string(Op::name);
    supplier.input_type = ElementTraits<typename Op::Input>::type;
    supplier.description = Function().describe();
    supplier.factory = []() -> GroupingAggregatorFunctionPtr {
        return std::make_unique<Function>();
    };
    return supplier;
}

}  // namespace

auto sum_ints() -> AggregatorFunctionSupplier {
    return make_supplier<SumIntOp>();
}

auto sum_longs() -> AggregatorFunctionSupplier {
    return make_supplier<SumLongOp>();
}

auto sum_doubles() -> AggregatorFunctionSupplier {
    return make_supplier<SumDoubleOp>();
}

auto min_ints() -> AggregatorFunctionSupplier {
    return make_supplier<MinIntOp>();
}

auto min_longs() -> AggregatorFunctionSupplier {
    return make_supplier<MinLongOp>();
}

auto min_doubles() -> AggregatorFunctionSupplier {
    return make_supplier<MinDoubleOp>();
}

auto max_ints() -> AggregatorFunctionSupplier {
    return make_supplier<MaxIntOp>();
}

auto max_longs() -> AggregatorFunctionSupplier {
    return make_supplier<MaxLongOp>();
}

auto max_doubles() -> AggregatorFunctionSupplier {
    return make_supplier<MaxDoubleOp>();
}

auto AggregatorRegistry::with_builtins() -> AggregatorRegistry {
    AggregatorRegistry registry;
    for (auto supplier : {sum_ints(), sum_longs(), sum_doubles(), min_ints(), min_longs(),
                          min_doubles(), max_ints(), max_longs(), max_doubles()}) {
        registry.register_function(std::move(supplier));
    }
    return registry;
}

}  // namespace blockwise::aggregation
