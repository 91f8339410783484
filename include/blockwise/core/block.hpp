#pragma once

#include <blockwise/core/element.hpp>
#include <blockwise/core/error.hpp>
#include <blockwise/core/vector.hpp>

#include <fmt/format.h>

#include <cassert>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace blockwise {

/// Physical layout behind a Block.
enum class BlockRepresentation : std::uint8_t {
    Array,
    Vector,
    Filtered,
    ConstantNull,
};

/// An immutable column of T in which every position holds null, a single
/// value, or an ordered multi-value entry.
///
/// Values of position p live at value indexes
/// [first_value_index(p), first_value_index(p) + value_count(p)). A null
/// position has a value count of 0. Value indexes address the block's backing
/// storage, so they differ from positions once multi-valued entries or
/// filtered views are involved.
///
/// Equality and hashing are defined once over the accessors above, so any two
/// representations holding the same logical data compare and hash equal.
template <BlockElement T>
class Block {
   public:
    using value_type = T;
    using reference = ElementRef<T>;
    using Values = std::vector<T>;
    using Indexes = std::vector<std::int32_t>;
    using NullMask = std::vector<bool>;

    struct ArrayRep {
        std::shared_ptr<const Values> values;
        /// position_count + 1 entries: position p spans [first[p], first[p + 1]).
        std::shared_ptr<const Indexes> first_value_indexes;
        /// nullptr when no position is null.
        std::shared_ptr<const NullMask> nulls;
    };
    struct VectorRep {
        Vector<T> vector;
    };
    struct FilterRep {
        ArrayRep base;
        std::shared_ptr<const Indexes> positions;
    };
    struct ConstantNullRep {
        std::int32_t positions = 0;
    };
    using Rep = std::variant<ArrayRep, VectorRep, FilterRep, ConstantNullRep>;

    /// An empty block.
    Block() : rep_(ConstantNullRep{0}) {}

    explicit Block(Vector<T> vector) : rep_(VectorRep{std::move(vector)}) {}

    /// Assemble a block from raw storage, validating the layout.
    ///
    /// `first_value_indexes` holds one entry per position plus a trailing end
    /// offset. `nulls` is either empty (derived from zero-length entries) or
    /// one flag per position. Fails with ShapeMismatch if offsets decrease,
    /// leave the value array, or disagree with the null flags.
    [[nodiscard]] static auto from_arrays(Values values, Indexes first_value_indexes,
                                          NullMask nulls = {}) -> Result<Block> {
        if (first_value_indexes.empty()) {
            return std::unexpected(make_error(ErrorKind::ShapeMismatch,
                                              "first_value_indexes needs a trailing end offset"));
        }
        const auto positions = first_value_indexes.size() - 1;
        if (!nulls.empty() && nulls.size() != positions) {
            return std::unexpected(
                make_error(ErrorKind::ShapeMismatch,
                           fmt::format("null mask covers {} positions, offsets cover {}",
                                       nulls.size(), positions)));
        }
        if (first_value_indexes.front() < 0 ||
            static_cast<std::size_t>(first_value_indexes.back()) > values.size()) {
            return std::unexpected(make_error(
                ErrorKind::ShapeMismatch,
                fmt::format("value range [{}, {}) outside backing storage of {} values",
                            first_value_indexes.front(), first_value_indexes.back(),
                            values.size())));
        }
        bool any_null = false;
        NullMask derived(positions, false);
        for (std::size_t p = 0; p < positions; ++p) {
            const auto count = first_value_indexes[p + 1] - first_value_indexes[p];
            if (count < 0) {
                return std::unexpected(make_error(
                    ErrorKind::ShapeMismatch,
                    fmt::format("first_value_indexes decrease at position {}", p)));
            }
            const bool flagged = !nulls.empty() && nulls[p];
            if (flagged && count != 0) {
                return std::unexpected(make_error(
                    ErrorKind::ShapeMismatch,
                    fmt::format("null position {} has {} values", p, count)));
            }
            derived[p] = count == 0;
            any_null = any_null || derived[p];
        }
        ArrayRep rep{
            .values = std::make_shared<const Values>(std::move(values)),
            .first_value_indexes = std::make_shared<const Indexes>(std::move(first_value_indexes)),
            .nulls = any_null ? std::make_shared<const NullMask>(std::move(derived)) : nullptr,
        };
        return Block(Rep{std::move(rep)});
    }

    /// `value` repeated over `positions` positions.
    [[nodiscard]] static auto constant(T value, std::int32_t positions) -> Block {
        return Block(Vector<T>::constant(std::move(value), positions));
    }

    /// `positions` null positions.
    [[nodiscard]] static auto constant_null(std::int32_t positions) -> Block {
        return Block(Rep{ConstantNullRep{positions}});
    }

    [[nodiscard]] static auto element_type() noexcept -> ElementType {
        return ElementTraits<T>::type;
    }

    [[nodiscard]] auto representation() const noexcept -> BlockRepresentation {
        return std::visit(
            [](const auto& rep) -> BlockRepresentation {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return BlockRepresentation::Array;
                } else if constexpr (std::is_same_v<R, VectorRep>) {
                    return BlockRepresentation::Vector;
                } else if constexpr (std::is_same_v<R, FilterRep>) {
                    return BlockRepresentation::Filtered;
                } else {
                    static_assert(std::is_same_v<R, ConstantNullRep>);
                    return BlockRepresentation::ConstantNull;
                }
            },
            rep_);
    }

    [[nodiscard]] auto position_count() const noexcept -> std::int32_t {
        return std::visit(
            [](const auto& rep) -> std::int32_t {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return static_cast<std::int32_t>(rep.first_value_indexes->size()) - 1;
                } else if constexpr (std::is_same_v<R, VectorRep>) {
                    return rep.vector.position_count();
                } else if constexpr (std::is_same_v<R, FilterRep>) {
                    return static_cast<std::int32_t>(rep.positions->size());
                } else {
                    static_assert(std::is_same_v<R, ConstantNullRep>);
                    return rep.positions;
                }
            },
            rep_);
    }

    [[nodiscard]] auto is_null(std::int32_t position) const noexcept -> bool {
        assert(position >= 0 && position < position_count());
        return std::visit(
            [position](const auto& rep) -> bool {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return array_is_null(rep, position);
                } else if constexpr (std::is_same_v<R, VectorRep>) {
                    return false;
                } else if constexpr (std::is_same_v<R, FilterRep>) {
                    return array_is_null(rep.base, base_position(rep, position));
                } else {
                    static_assert(std::is_same_v<R, ConstantNullRep>);
                    return true;
                }
            },
            rep_);
    }

    [[nodiscard]] auto value_count(std::int32_t position) const noexcept -> std::int32_t {
        assert(position >= 0 && position < position_count());
        return std::visit(
            [position](const auto& rep) -> std::int32_t {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return array_value_count(rep, position);
                } else if constexpr (std::is_same_v<R, VectorRep>) {
                    return 1;
                } else if constexpr (std::is_same_v<R, FilterRep>) {
                    return array_value_count(rep.base, base_position(rep, position));
                } else {
                    static_assert(std::is_same_v<R, ConstantNullRep>);
                    return 0;
                }
            },
            rep_);
    }

    [[nodiscard]] auto first_value_index(std::int32_t position) const noexcept -> std::int32_t {
        assert(position >= 0 && position < position_count());
        return std::visit(
            [position](const auto& rep) -> std::int32_t {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return (*rep.first_value_indexes)[static_cast<std::size_t>(position)];
                } else if constexpr (std::is_same_v<R, VectorRep>) {
                    return position;
                } else if constexpr (std::is_same_v<R, FilterRep>) {
                    auto base = static_cast<std::size_t>(base_position(rep, position));
                    return (*rep.base.first_value_indexes)[base];
                } else {
                    static_assert(std::is_same_v<R, ConstantNullRep>);
                    return 0;
                }
            },
            rep_);
    }

    /// Raw value at a backing-storage index. Unchecked outside debug builds.
    [[nodiscard]] auto get(std::int32_t value_index) const noexcept -> reference {
        return std::visit(
            [value_index](const auto& rep) -> reference {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    assert(static_cast<std::size_t>(value_index) < rep.values->size());
                    return (*rep.values)[static_cast<std::size_t>(value_index)];
                } else if constexpr (std::is_same_v<R, VectorRep>) {
                    return rep.vector.get(value_index);
                } else if constexpr (std::is_same_v<R, FilterRep>) {
                    assert(static_cast<std::size_t>(value_index) < rep.base.values->size());
                    return (*rep.base.values)[static_cast<std::size_t>(value_index)];
                } else {
                    static_assert(std::is_same_v<R, ConstantNullRep>);
                    assert(false && "constant null block holds no values");
                    return missing_value();
                }
            },
            rep_);
    }

    [[nodiscard]] auto may_have_nulls() const noexcept -> bool {
        return std::visit(
            [](const auto& rep) -> bool {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return rep.nulls != nullptr;
                } else if constexpr (std::is_same_v<R, VectorRep>) {
                    return false;
                } else if constexpr (std::is_same_v<R, FilterRep>) {
                    return rep.base.nulls != nullptr;
                } else {
                    static_assert(std::is_same_v<R, ConstantNullRep>);
                    return rep.positions > 0;
                }
            },
            rep_);
    }

    [[nodiscard]] auto are_all_values_null() const noexcept -> bool {
        const auto positions = position_count();
        for (std::int32_t p = 0; p < positions; ++p) {
            if (!is_null(p)) {
                return false;
            }
        }
        return true;
    }

    /// Number of values across all positions (nulls contribute none).
    [[nodiscard]] auto total_value_count() const noexcept -> std::int32_t {
        std::int32_t total = 0;
        const auto positions = position_count();
        for (std::int32_t p = 0; p < positions; ++p) {
            total += value_count(p);
        }
        return total;
    }

    [[nodiscard]] auto may_have_multivalued_fields() const noexcept -> bool {
        if (std::holds_alternative<VectorRep>(rep_) ||
            std::holds_alternative<ConstantNullRep>(rep_)) {
            return false;
        }
        const auto positions = position_count();
        for (std::int32_t p = 0; p < positions; ++p) {
            if (value_count(p) > 1) {
                return true;
            }
        }
        return false;
    }

    /// The single-valued, non-null view of this block.
    /// Fails with ShapeMismatch when any position is null or multi-valued.
    [[nodiscard]] auto as_vector() const -> Result<Vector<T>> {
        if (const auto* rep = std::get_if<VectorRep>(&rep_)) {
            return rep->vector;
        }
        const auto positions = position_count();
        typename Vector<T>::Positions indexes;
        indexes.reserve(static_cast<std::size_t>(positions));
        for (std::int32_t p = 0; p < positions; ++p) {
            if (is_null(p) || value_count(p) != 1) {
                return std::unexpected(make_error(
                    ErrorKind::ShapeMismatch,
                    fmt::format("position {} holds {} so the {} block is not a vector", p,
                                is_null(p) ? std::string("null")
                                           : fmt::format("{} values", value_count(p)),
                                ElementTraits<T>::name)));
            }
            indexes.push_back(first_value_index(p));
        }
        if (const auto* array = std::get_if<ArrayRep>(&rep_)) {
            return Vector<T>::view(array->values, std::move(indexes));
        }
        if (const auto* filtered = std::get_if<FilterRep>(&rep_)) {
            return Vector<T>::view(filtered->base.values, std::move(indexes));
        }
        // Only an empty constant-null block gets this far.
        return Vector<T>();
    }

    /// View restricted to and reordered by `positions`; positions may repeat.
    /// Never copies values. Filtering a filtered block yields one flattened view.
    [[nodiscard]] auto filter(std::span<const std::int32_t> positions) const -> Block {
        return std::visit(
            [positions](const auto& rep) -> Block {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return Block(Rep{FilterRep{
                        rep, std::make_shared<const Indexes>(positions.begin(), positions.end())}});
                } else if constexpr (std::is_same_v<R, VectorRep>) {
                    return Block(rep.vector.filter(positions));
                } else if constexpr (std::is_same_v<R, FilterRep>) {
                    Indexes composed;
                    composed.reserve(positions.size());
                    for (auto p : positions) {
                        composed.push_back((*rep.positions)[static_cast<std::size_t>(p)]);
                    }
                    return Block(Rep{
                        FilterRep{rep.base, std::make_shared<const Indexes>(std::move(composed))}});
                } else {
                    static_assert(std::is_same_v<R, ConstantNullRep>);
                    return constant_null(static_cast<std::int32_t>(positions.size()));
                }
            },
            rep_);
    }

    /// Single-position view of `position`.
    [[nodiscard]] auto get_row(std::int32_t position) const -> Block {
        const std::int32_t positions[] = {position};
        return filter(positions);
    }

    /// Positional hash. Starts from 1; a null position folds in -1, otherwise
    /// the value count followed by each value.
    [[nodiscard]] auto hash() const noexcept -> std::int32_t {
        std::int32_t result = 1;
        const auto positions = position_count();
        for (std::int32_t p = 0; p < positions; ++p) {
            if (is_null(p)) {
                result = hash_step(result, -1);
                continue;
            }
            const auto count = value_count(p);
            result = hash_step(result, count);
            const auto first = first_value_index(p);
            for (std::int32_t i = 0; i < count; ++i) {
                result = hash_step(result, hash_contribution(get(first + i)));
            }
        }
        return result;
    }

    /// Equal position counts and, per position, equal null-ness, value count
    /// and values in order.
    friend auto operator==(const Block& lhs, const Block& rhs) -> bool {
        const auto positions = lhs.position_count();
        if (positions != rhs.position_count()) {
            return false;
        }
        for (std::int32_t p = 0; p < positions; ++p) {
            const bool lhs_null = lhs.is_null(p);
            if (lhs_null != rhs.is_null(p)) {
                return false;
            }
            if (lhs_null) {
                continue;
            }
            const auto count = lhs.value_count(p);
            if (count != rhs.value_count(p)) {
                return false;
            }
            const auto lhs_first = lhs.first_value_index(p);
            const auto rhs_first = rhs.first_value_index(p);
            for (std::int32_t i = 0; i < count; ++i) {
                if (!values_equal<T>(lhs.get(lhs_first + i), rhs.get(rhs_first + i))) {
                    return false;
                }
            }
        }
        return true;
    }

   private:
    explicit Block(Rep rep) : rep_(std::move(rep)) {}

    static auto array_is_null(const ArrayRep& rep, std::int32_t position) noexcept -> bool {
        return rep.nulls != nullptr && (*rep.nulls)[static_cast<std::size_t>(position)];
    }

    static auto array_value_count(const ArrayRep& rep, std::int32_t position) noexcept
        -> std::int32_t {
        const auto& first = *rep.first_value_indexes;
        const auto p = static_cast<std::size_t>(position);
        return first[p + 1] - first[p];
    }

    static auto base_position(const FilterRep& rep, std::int32_t position) noexcept
        -> std::int32_t {
        return (*rep.positions)[static_cast<std::size_t>(position)];
    }

    static auto missing_value() noexcept -> reference {
        static const T value{};
        return value;
    }

    Rep rep_;
};

using BooleanBlock = Block<bool>;
using IntBlock = Block<std::int32_t>;
using LongBlock = Block<std::int64_t>;
using DoubleBlock = Block<double>;
using BytesBlock = Block<std::string>;

template <BlockElement T>
auto Vector<T>::as_block() const -> Block<T> {
    return Block<T>(*this);
}

/// A block of any element type. Pages carry their columns as AnyBlock.
using AnyBlock = std::variant<BooleanBlock, IntBlock, LongBlock, DoubleBlock, BytesBlock>;

[[nodiscard]] inline auto position_count(const AnyBlock& block) noexcept -> std::int32_t {
    return std::visit([](const auto& b) { return b.position_count(); }, block);
}

[[nodiscard]] inline auto element_type(const AnyBlock& block) noexcept -> ElementType {
    return std::visit([](const auto& b) { return b.element_type(); }, block);
}

[[nodiscard]] inline auto hash(const AnyBlock& block) noexcept -> std::int32_t {
    return std::visit([](const auto& b) { return b.hash(); }, block);
}

[[nodiscard]] inline auto filter(const AnyBlock& block, std::span<const std::int32_t> positions)
    -> AnyBlock {
    return std::visit([positions](const auto& b) -> AnyBlock { return b.filter(positions); },
                      block);
}

/// `positions` null positions of the given element type.
[[nodiscard]] inline auto constant_null_block(ElementType type, std::int32_t positions)
    -> AnyBlock {
    switch (type) {
        case ElementType::Boolean:
            return BooleanBlock::constant_null(positions);
        case ElementType::Int:
            return IntBlock::constant_null(positions);
        case ElementType::Long:
            return LongBlock::constant_null(positions);
        case ElementType::Double:
            return DoubleBlock::constant_null(positions);
        case ElementType::Bytes:
            return BytesBlock::constant_null(positions);
    }
    return BytesBlock::constant_null(positions);
}

/// The typed block behind `block`, or UnsupportedShape when it holds another
/// element type.
template <BlockElement T>
[[nodiscard]] auto block_as(const AnyBlock& block) -> Result<const Block<T>*> {
    if (const auto* typed = std::get_if<Block<T>>(&block)) {
        return typed;
    }
    return std::unexpected(make_error(ErrorKind::UnsupportedShape,
                                      fmt::format("expected a {} block but got a {} block",
                                                  ElementTraits<T>::name,
                                                  to_string(element_type(block)))));
}

}  // namespace blockwise
