#include <blockwise/core/page.hpp>

#include <fmt/format.h>

namespace blockwise {

auto Page::make(std::vector<AnyBlock> blocks) -> Result<Page> {
    if (blocks.empty()) {
        return Page(std::move(blocks), 0);
    }
    const auto positions = blockwise::position_count(blocks.front());
    for (std::size_t channel = 1; channel < blocks.size(); ++channel) {
        const auto other = blockwise::position_count(blocks[channel]);
        if (other != positions) {
            return std::unexpected(make_error(
                ErrorKind::ShapeMismatch,
                fmt::format("block {} has {} positions but block 0 has {}", channel, other,
                            positions)));
        }
    }
    return Page(std::move(blocks), positions);
}

auto Page::empty(std::int32_t position_count) -> Page {
    return Page({}, position_count);
}

auto Page::append_block(AnyBlock block) const -> Result<Page> {
    const auto positions = blockwise::position_count(block);
    if (positions != position_count_) {
        return std::unexpected(make_error(
            ErrorKind::ShapeMismatch,
            fmt::format("cannot append a block of {} positions to a page of {}", positions,
                        position_count_)));
    }
    std::vector<AnyBlock> blocks = blocks_;
    blocks.push_back(std::move(block));
    return Page(std::move(blocks), position_count_);
}

auto Page::project(std::span<const std::size_t> channels) const -> Result<Page> {
    std::vector<AnyBlock> blocks;
    blocks.reserve(channels.size());
    for (auto channel : channels) {
        if (channel >= blocks_.size()) {
            return std::unexpected(make_error(
                ErrorKind::ShapeMismatch,
                fmt::format("channel {} out of range for a page of {} blocks", channel,
                            blocks_.size())));
        }
        blocks.push_back(blocks_[channel]);
    }
    return Page(std::move(blocks), position_count_);
}

auto Page::filter(std::span<const std::int32_t> positions) const -> Page {
    std::vector<AnyBlock> blocks;
    blocks.reserve(blocks_.size());
    for (const auto& block : blocks_) {
        blocks.push_back(blockwise::filter(block, positions));
    }
    return Page(std::move(blocks), static_cast<std::int32_t>(positions.size()));
}

}  // namespace blockwise
