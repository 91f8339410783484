#pragma once

#include <blockwise/core/block.hpp>
#include <blockwise/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace blockwise {

/// An aligned batch of blocks; every block has the same position count.
///
/// A Page is the unit handed from one operator to the next. It is immutable
/// and move-only: a stage that keeps a page after passing it on must say so
/// with retain(). Operators that need a different shape build a new Page.
class Page {
   public:
    /// Fails with ShapeMismatch when the blocks disagree on position count.
    [[nodiscard]] static auto make(std::vector<AnyBlock> blocks) -> Result<Page>;

    /// A page with no blocks and `position_count` positions.
    [[nodiscard]] static auto empty(std::int32_t position_count) -> Page;

    Page(Page&&) noexcept = default;
    auto operator=(Page&&) noexcept -> Page& = default;
    Page(const Page&) = delete;
    auto operator=(const Page&) -> Page& = delete;
    ~Page() = default;

    [[nodiscard]] auto position_count() const noexcept -> std::int32_t { return position_count_; }
    [[nodiscard]] auto block_count() const noexcept -> std::size_t { return blocks_.size(); }

    /// Block at `channel`. Unchecked.
    [[nodiscard]] auto block(std::size_t channel) const noexcept -> const AnyBlock& {
        return blocks_[channel];
    }

    [[nodiscard]] auto blocks() const noexcept -> std::span<const AnyBlock> { return blocks_; }

    /// New page with `block` appended as the last channel.
    [[nodiscard]] auto append_block(AnyBlock block) const -> Result<Page>;

    /// New page holding `channels` in the given order; channels may repeat.
    [[nodiscard]] auto project(std::span<const std::size_t> channels) const -> Result<Page>;

    /// New page whose blocks are all filtered by `positions`.
    [[nodiscard]] auto filter(std::span<const std::int32_t> positions) const -> Page;

    /// Second handle over the same immutable blocks.
    [[nodiscard]] auto retain() const -> Page { return Page(blocks_, position_count_); }

    friend auto operator==(const Page& lhs, const Page& rhs) -> bool {
        return lhs.position_count_ == rhs.position_count_ && lhs.blocks_ == rhs.blocks_;
    }

   private:
    Page(std::vector<AnyBlock> blocks, std::int32_t position_count)
        : blocks_(std::move(blocks)), position_count_(position_count) {}

    std::vector<AnyBlock> blocks_;
    std::int32_t position_count_ = 0;
};

}  // namespace blockwise
