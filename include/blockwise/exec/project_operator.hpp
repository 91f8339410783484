#pragma once

#include <blockwise/exec/operator.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace blockwise::exec {

/// Keeps a subset of channels, in the given order.
class ProjectOperator final : public Operator {
   public:
    explicit ProjectOperator(std::vector<std::size_t> channels) : channels_(std::move(channels)) {}

    [[nodiscard]] auto name() const -> std::string override { return "ProjectOperator"; }
    [[nodiscard]] auto needs_input() const -> bool override {
        return !finishing_ && !pending_.has_value();
    }
    [[nodiscard]] auto add_input(Page page) -> Result<void> override;
    void finish() override { finishing_ = true; }
    [[nodiscard]] auto is_finished() const -> bool override {
        return finishing_ && !pending_.has_value();
    }
    [[nodiscard]] auto get_output() -> Result<std::optional<Page>> override;
    void close() override { pending_.reset(); }

   private:
    std::vector<std::size_t> channels_;
    std::optional<Page> pending_;
    bool finishing_ = false;
};

}  // namespace blockwise::exec
