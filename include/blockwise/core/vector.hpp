#pragma once

#include <blockwise/core/element.hpp>
#include <blockwise/core/error.hpp>

#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace blockwise {

template <BlockElement T>
class Block;

/// An immutable, fixed-length column of T: exactly one non-null value per position.
///
/// Storage is shared between copies, so copying a Vector or wrapping it in a
/// Block never copies values. Three representations exist:
///   - array:    a shared contiguous value array;
///   - constant: one value repeated over N positions in O(1) memory;
///   - filtered: a shared value array viewed through a position list.
template <BlockElement T>
class Vector {
   public:
    using value_type = T;
    using reference = ElementRef<T>;
    using Values = std::vector<T>;
    using Positions = std::vector<std::int32_t>;

    struct ArrayRep {
        std::shared_ptr<const Values> values;
    };
    struct ConstantRep {
        T value;
        std::int32_t positions = 0;
    };
    struct FilterRep {
        std::shared_ptr<const Values> values;
        std::shared_ptr<const Positions> positions;
    };
    using Rep = std::variant<ArrayRep, ConstantRep, FilterRep>;

    Vector() : rep_(ArrayRep{std::make_shared<const Values>()}) {}

    explicit Vector(Values values)
        : rep_(ArrayRep{std::make_shared<const Values>(std::move(values))}) {}

    Vector(std::initializer_list<T> init) : Vector(Values(init)) {}

    /// A vector holding `value` at each of `positions` positions.
    [[nodiscard]] static auto constant(T value, std::int32_t positions) -> Vector {
        return Vector(Rep{ConstantRep{std::move(value), positions}});
    }

    /// View of shared `values` through `positions`. Collapses to a plain
    /// array vector when `positions` is the identity over all of `values`.
    [[nodiscard]] static auto view(std::shared_ptr<const Values> values, Positions positions)
        -> Vector {
        bool identity = positions.size() == values->size();
        for (std::size_t i = 0; identity && i < positions.size(); ++i) {
            identity = positions[i] == static_cast<std::int32_t>(i);
        }
        if (identity) {
            return Vector(Rep{ArrayRep{std::move(values)}});
        }
        return Vector(Rep{FilterRep{std::move(values),
                                    std::make_shared<const Positions>(std::move(positions))}});
    }

    [[nodiscard]] static auto element_type() noexcept -> ElementType {
        return ElementTraits<T>::type;
    }

    [[nodiscard]] auto position_count() const noexcept -> std::int32_t {
        return std::visit(
            [](const auto& rep) -> std::int32_t {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return static_cast<std::int32_t>(rep.values->size());
                } else if constexpr (std::is_same_v<R, ConstantRep>) {
                    return rep.positions;
                } else {
                    static_assert(std::is_same_v<R, FilterRep>);
                    return static_cast<std::int32_t>(rep.positions->size());
                }
            },
            rep_);
    }

    /// Value at `position`. Unchecked outside debug builds.
    [[nodiscard]] auto get(std::int32_t position) const noexcept -> reference {
        assert(position >= 0 && position < position_count());
        return std::visit(
            [position](const auto& rep) -> reference {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return (*rep.values)[static_cast<std::size_t>(position)];
                } else if constexpr (std::is_same_v<R, ConstantRep>) {
                    return rep.value;
                } else {
                    static_assert(std::is_same_v<R, FilterRep>);
                    auto index = (*rep.positions)[static_cast<std::size_t>(position)];
                    return (*rep.values)[static_cast<std::size_t>(index)];
                }
            },
            rep_);
    }

    [[nodiscard]] auto is_constant() const noexcept -> bool {
        return std::holds_alternative<ConstantRep>(rep_);
    }

    [[nodiscard]] auto is_filtered() const noexcept -> bool {
        return std::holds_alternative<FilterRep>(rep_);
    }

    /// View restricted to and reordered by `positions`. Positions may repeat.
    /// Filtering a filtered vector composes the position lists; values are never copied.
    [[nodiscard]] auto filter(std::span<const std::int32_t> positions) const -> Vector {
        return std::visit(
            [positions](const auto& rep) -> Vector {
                using R = std::decay_t<decltype(rep)>;
                if constexpr (std::is_same_v<R, ArrayRep>) {
                    return Vector(Rep{FilterRep{
                        rep.values,
                        std::make_shared<const Positions>(positions.begin(), positions.end())}});
                } else if constexpr (std::is_same_v<R, ConstantRep>) {
                    return constant(rep.value, static_cast<std::int32_t>(positions.size()));
                } else {
                    static_assert(std::is_same_v<R, FilterRep>);
                    Positions composed;
                    composed.reserve(positions.size());
                    for (auto p : positions) {
                        composed.push_back((*rep.positions)[static_cast<std::size_t>(p)]);
                    }
                    return Vector(Rep{FilterRep{
                        rep.values, std::make_shared<const Positions>(std::move(composed))}});
                }
            },
            rep_);
    }

    /// Wrap as a Block with one value per position (defined in block.hpp).
    [[nodiscard]] auto as_block() const -> Block<T>;

    /// Positional hash: 31-fold over every value, starting from 1.
    [[nodiscard]] auto hash() const noexcept -> std::int32_t {
        std::int32_t result = 1;
        const auto positions = position_count();
        for (std::int32_t p = 0; p < positions; ++p) {
            result = hash_step(result, hash_contribution(get(p)));
        }
        return result;
    }

    friend auto operator==(const Vector& lhs, const Vector& rhs) -> bool {
        const auto positions = lhs.position_count();
        if (positions != rhs.position_count()) {
            return false;
        }
        for (std::int32_t p = 0; p < positions; ++p) {
            if (!values_equal<T>(lhs.get(p), rhs.get(p))) {
                return false;
            }
        }
        return true;
    }

   private:
    explicit Vector(Rep rep) : rep_(std::move(rep)) {}

    Rep rep_;
};

/// Append-only builder for a Vector. Single use: build() may succeed only once.
template <BlockElement T>
class VectorBuilder {
   public:
    VectorBuilder() = default;

    explicit VectorBuilder(std::size_t estimated_size) { values_.reserve(estimated_size); }

    auto append(T value) -> VectorBuilder& {
        values_.push_back(std::move(value));
        return *this;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t { return values_.size(); }

    [[nodiscard]] auto build() -> Result<Vector<T>> {
        if (built_) {
            return std::unexpected(make_error(ErrorKind::IllegalState, "vector already built"));
        }
        built_ = true;
        return Vector<T>(std::move(values_));
    }

   private:
    std::vector<T> values_;
    bool built_ = false;
};

using BooleanVector = Vector<bool>;
using IntVector = Vector<std::int32_t>;
using LongVector = Vector<std::int64_t>;
using DoubleVector = Vector<double>;
using BytesVector = Vector<std::string>;

}  // namespace blockwise
