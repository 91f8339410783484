#pragma once

#include <blockwise/exec/operator.hpp>

#include <cstddef>
#include <functional>
#include <string>

namespace blockwise::exec {

/// Sink handing every Page it receives to a callback.
class PageConsumerOperator final : public SinkOperator {
   public:
    using Consumer = std::function<void(Page page)>;

    explicit PageConsumerOperator(Consumer consumer) : consumer_(std::move(consumer)) {}

    [[nodiscard]] auto name() const -> std::string override { return "PageConsumerOperator"; }
    [[nodiscard]] auto needs_input() const -> bool override { return !finished_; }

    [[nodiscard]] auto add_input(Page page) -> Result<void> override {
        ++pages_consumed_;
        consumer_(std::move(page));
        return {};
    }

    void finish() override { finished_ = true; }
    [[nodiscard]] auto is_finished() const -> bool override { return finished_; }

    [[nodiscard]] auto pages_consumed() const noexcept -> std::size_t { return pages_consumed_; }

   private:
    Consumer consumer_;
    std::size_t pages_consumed_ = 0;
    bool finished_ = false;
};

}  // namespace blockwise::exec
