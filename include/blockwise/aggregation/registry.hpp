#pragma once

#include <blockwise/aggregation/grouping_aggregator_function.hpp>
#include <blockwise/core/element.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace blockwise::aggregation {

using GroupingAggregatorFunctionFactory = std::function<GroupingAggregatorFunctionPtr()>;

/// Named factory for one aggregation function over one input element type.
///
/// Suppliers are cheap to copy and are shared by every pipeline that needs a
/// fresh, independent instance of the function.
struct AggregatorFunctionSupplier {
    std::string name;
    ElementType input_type = ElementType::Long;
    std::string description;
    GroupingAggregatorFunctionFactory factory;

    [[nodiscard]] auto create() const -> GroupingAggregatorFunctionPtr { return factory(); }
};

// Built-in suppliers.
[[nodiscard]] auto sum_ints() -> AggregatorFunctionSupplier;
[[nodiscard]] auto sum_longs() -> AggregatorFunctionSupplier;
[[nodiscard]] auto sum_doubles() -> AggregatorFunctionSupplier;
[[nodiscard]] auto min_ints() -> AggregatorFunctionSupplier;
[[nodiscard]] auto min_longs() -> AggregatorFunctionSupplier;
[[nodiscard]] auto min_doubles() -> AggregatorFunctionSupplier;
[[nodiscard]] auto max_ints() -> AggregatorFunctionSupplier;
[[nodiscard]] auto max_longs() -> AggregatorFunctionSupplier;
[[nodiscard]] auto max_doubles() -> AggregatorFunctionSupplier;

/// Lookup table of aggregation functions keyed by (name, input element type).
class AggregatorRegistry {
   public:
    AggregatorRegistry() = default;

    /// Registry pre-populated with sum, min and max over int, long and double.
    [[nodiscard]] static auto with_builtins() -> AggregatorRegistry;

    /// Register (or replace) a supplier under its name and input type.
    void register_function(AggregatorFunctionSupplier supplier) {
        auto key = make_key(supplier.name, supplier.input_type);
        registry_.insert_or_assign(std::move(key), std::move(supplier));
    }

    /// Look up a supplier; nullptr when none is registered.
    [[nodiscard]] auto find(std::string_view name, ElementType input_type) const
        -> const AggregatorFunctionSupplier* {
        if (auto it = registry_.find(make_key(name, input_type)); it != registry_.end()) {
            return &it->second;
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(std::string_view name, ElementType input_type) const -> bool {
        return registry_.contains(make_key(name, input_type));
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return registry_.size(); }

   private:
    static auto make_key(std::string_view name, ElementType input_type) -> std::string {
        std::string key(name);
        key.push_back(':');
        key.append(to_string(input_type));
        return key;
    }

    std::unordered_map<std::string, AggregatorFunctionSupplier> registry_;
};

}  // namespace blockwise::aggregation
