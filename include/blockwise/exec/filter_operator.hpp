#pragma once

#include <blockwise/exec/operator.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace blockwise::exec {

/// Keeps the positions of each Page for which `predicate` holds.
///
/// Output Pages are filtered views over the input blocks. Pages with no
/// surviving position are dropped. At most one output Page is pending.
class FilterOperator final : public Operator {
   public:
    using Predicate = std::function<bool(const Page& page, std::int32_t position)>;

    explicit FilterOperator(Predicate predicate) : predicate_(std::move(predicate)) {}

    [[nodiscard]] auto name() const -> std::string override { return "FilterOperator"; }
    [[nodiscard]] auto needs_input() const -> bool override;
    [[nodiscard]] auto add_input(Page page) -> Result<void> override;
    void finish() override { finishing_ = true; }
    [[nodiscard]] auto is_finished() const -> bool override;
    [[nodiscard]] auto get_output() -> Result<std::optional<Page>> override;
    void close() override { pending_.reset(); }

   private:
    Predicate predicate_;
    std::optional<Page> pending_;
    bool finishing_ = false;
};

}  // namespace blockwise::exec
