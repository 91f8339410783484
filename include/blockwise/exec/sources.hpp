#pragma once

#include <blockwise/core/block_builder.hpp>
#include <blockwise/core/page.hpp>
#include <blockwise/exec/operator.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace blockwise::exec {

/// Emits a fixed sequence of Pages, one per get_output() call.
class PageListSourceOperator final : public SourceOperator {
   public:
    explicit PageListSourceOperator(std::vector<Page> pages);

    [[nodiscard]] auto name() const -> std::string override { return "PageListSourceOperator"; }
    void finish() override;
    [[nodiscard]] auto is_finished() const -> bool override;
    [[nodiscard]] auto get_output() -> Result<std::optional<Page>> override;
    void close() override;

    /// Pages not yet emitted.
    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return pages_.size(); }

   private:
    std::deque<Page> pages_;
    bool finished_ = false;
};

/// One input row of a GroupValueSourceOperator. Either side may be null.
template <BlockElement T>
struct GroupValue {
    std::optional<std::int64_t> group;
    std::optional<T> value;
};

/// Emits (group ordinal, value) rows as two-block Pages of at most
/// `max_page_size` positions: channel 0 is a LongBlock of groups, channel 1 a
/// Block<T> of values. Pages are built lazily, one per pull.
template <BlockElement T>
class GroupValueSourceOperator final : public SourceOperator {
   public:
    static constexpr std::int32_t kDefaultMaxPageSize = 8 * 1024;

    explicit GroupValueSourceOperator(std::vector<GroupValue<T>> rows,
                                      std::int32_t max_page_size = kDefaultMaxPageSize)
        : rows_(std::move(rows)), max_page_size_(std::max<std::int32_t>(1, max_page_size)) {}

    [[nodiscard]] auto name() const -> std::string override {
        return "GroupValueSourceOperator";
    }

    void finish() override { finished_ = true; }

    [[nodiscard]] auto is_finished() const -> bool override {
        return finished_ || next_ >= rows_.size();
    }

    [[nodiscard]] auto get_output() -> Result<std::optional<Page>> override {
        if (is_finished()) {
            return std::optional<Page>{};
        }
        const auto end =
            std::min(rows_.size(), next_ + static_cast<std::size_t>(max_page_size_));
        LongBlockBuilder groups(end - next_);
        BlockBuilder<T> values(end - next_);
        for (; next_ < end; ++next_) {
            const auto& row = rows_[next_];
            if (row.group) {
                groups.append_value(*row.group);
            } else {
                groups.append_null();
            }
            if (row.value) {
                values.append_value(*row.value);
            } else {
                values.append_null();
            }
        }
        auto group_block = groups.build();
        if (!group_block) {
            return std::unexpected(group_block.error());
        }
        auto value_block = values.build();
        if (!value_block) {
            return std::unexpected(value_block.error());
        }
        auto page = Page::make({std::move(*group_block), std::move(*value_block)});
        if (!page) {
            return std::unexpected(page.error());
        }
        return std::optional<Page>{std::move(*page)};
    }

    void close() override {
        rows_.clear();
        rows_.shrink_to_fit();
        next_ = 0;
        finished_ = true;
    }

   private:
    std::vector<GroupValue<T>> rows_;
    std::int32_t max_page_size_;
    std::size_t next_ = 0;
    bool finished_ = false;
};

}  // namespace blockwise::exec
