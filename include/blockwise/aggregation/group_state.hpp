#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

namespace blockwise::aggregation {

/// Largest group ordinal an aggregation accepts. Groups `0..max` are emitted
/// as one page, whose position count is 32-bit.
inline constexpr std::int64_t kMaxGroupOrdinal = std::numeric_limits<std::int32_t>::max() - 1;

/// Per-group accumulator arena indexed by dense group ordinal.
///
/// Slots are created on demand and start at the identity element. A parallel
/// `seen` mask records which groups received at least one value, so that
/// partial states can be combined without mistaking the identity for data.
template <typename S>
class GroupArrayState {
   public:
    explicit GroupArrayState(S identity) : identity_(std::move(identity)) {}

    /// Grow so that `group` has a slot. `group` must be in `[0, kMaxGroupOrdinal]`.
    void ensure_capacity(std::int64_t group) {
        const auto needed = static_cast<std::size_t>(group) + 1;
        if (needed > values_.size()) {
            values_.resize(needed, identity_);
            seen_.resize(needed, false);
        }
    }

    /// Accumulated value of `group`, or the identity for groups with no slot.
    [[nodiscard]] auto get(std::int64_t group) const noexcept -> const S& {
        const auto index = static_cast<std::size_t>(group);
        return index < values_.size() ? values_[index] : identity_;
    }

    [[nodiscard]] auto seen(std::int64_t group) const noexcept -> bool {
        const auto index = static_cast<std::size_t>(group);
        return index < seen_.size() && seen_[index];
    }

    /// Store `value` for `group` and mark it seen. The slot must exist.
    void set(std::int64_t group, S value) {
        const auto index = static_cast<std::size_t>(group);
        values_[index] = std::move(value);
        seen_[index] = true;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }

    [[nodiscard]] auto identity() const noexcept -> const S& { return identity_; }

   private:
    S identity_;
    std::vector<S> values_;
    std::vector<bool> seen_;
};

}  // namespace blockwise::aggregation
