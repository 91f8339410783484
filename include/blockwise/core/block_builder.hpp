#pragma once

#include <blockwise/core/block.hpp>
#include <blockwise/core/element.hpp>
#include <blockwise/core/error.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace blockwise {

/// Append-only builder for a Block.
///
/// Each append_value() outside a position entry adds a single-valued
/// position. begin_position_entry()/end_position_entry() bracket a
/// multi-valued position; values inside keep their append order, and an
/// entry closed without values becomes a null position.
///
/// A builder is single-writer and single-use: the first build() hands its
/// storage to the block, every later build() fails with IllegalState.
template <BlockElement T>
class BlockBuilder {
   public:
    BlockBuilder() { first_value_indexes_.push_back(0); }

    explicit BlockBuilder(std::size_t estimated_size) : BlockBuilder() {
        values_.reserve(estimated_size);
        first_value_indexes_.reserve(estimated_size + 1);
        nulls_.reserve(estimated_size);
    }

    auto append_value(T value) -> BlockBuilder& {
        values_.push_back(std::move(value));
        if (!entry_open_) {
            close_position(false);
        }
        return *this;
    }

    auto append_null() -> BlockBuilder& {
        if (entry_open_) {
            end_position_entry();
        }
        close_position(true);
        return *this;
    }

    /// Opens a multi-valued position, closing any entry that is still open.
    auto begin_position_entry() -> BlockBuilder& {
        if (entry_open_) {
            end_position_entry();
        }
        entry_open_ = true;
        return *this;
    }

    auto end_position_entry() -> BlockBuilder& {
        if (!entry_open_) {
            return *this;
        }
        entry_open_ = false;
        const bool empty =
            static_cast<std::int32_t>(values_.size()) == first_value_indexes_.back();
        if (empty) {
            close_position(true);
        } else {
            close_position(false);
        }
        return *this;
    }

    /// Positions appended so far, not counting an entry still open.
    [[nodiscard]] auto position_count() const noexcept -> std::int32_t {
        return static_cast<std::int32_t>(first_value_indexes_.size()) - 1;
    }

    [[nodiscard]] auto build() -> Result<Block<T>> {
        if (built_) {
            return std::unexpected(make_error(
                ErrorKind::IllegalState,
                fmt::format("{} block builder already built", ElementTraits<T>::name)));
        }
        if (entry_open_) {
            end_position_entry();
        }
        built_ = true;
        if (!has_nulls_ && !has_multi_values_) {
            return Block<T>(Vector<T>(std::move(values_)));
        }
        return Block<T>::from_arrays(std::move(values_), std::move(first_value_indexes_),
                                     std::move(nulls_));
    }

   private:
    void close_position(bool null) {
        const auto end = static_cast<std::int32_t>(values_.size());
        if (end - first_value_indexes_.back() > 1) {
            has_multi_values_ = true;
        }
        has_nulls_ = has_nulls_ || null;
        first_value_indexes_.push_back(end);
        nulls_.push_back(null);
    }

    std::vector<T> values_;
    std::vector<std::int32_t> first_value_indexes_;
    std::vector<bool> nulls_;
    bool entry_open_ = false;
    bool has_nulls_ = false;
    bool has_multi_values_ = false;
    bool built_ = false;
};

using BooleanBlockBuilder = BlockBuilder<bool>;
using IntBlockBuilder = BlockBuilder<std::int32_t>;
using LongBlockBuilder = BlockBuilder<std::int64_t>;
using DoubleBlockBuilder = BlockBuilder<double>;
using BytesBlockBuilder = BlockBuilder<std::string>;

}  // namespace blockwise
