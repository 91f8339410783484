#pragma once

#include <bit>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace blockwise {

/// The closed set of value types a Block or Vector may hold.
enum class ElementType : std::uint8_t {
    Boolean,
    Int,
    Long,
    Double,
    Bytes,
};

/// Concept constraining valid block element types.
template <typename T>
concept BlockElement = std::same_as<T, bool> || std::same_as<T, std::int32_t> ||
                       std::same_as<T, std::int64_t> || std::same_as<T, double> ||
                       std::same_as<T, std::string>;

template <BlockElement T>
struct ElementTraits;

template <>
struct ElementTraits<bool> {
    static constexpr ElementType type = ElementType::Boolean;
    static constexpr std::string_view name = "boolean";
};

template <>
struct ElementTraits<std::int32_t> {
    static constexpr ElementType type = ElementType::Int;
    static constexpr std::string_view name = "int";
};

template <>
struct ElementTraits<std::int64_t> {
    static constexpr ElementType type = ElementType::Long;
    static constexpr std::string_view name = "long";
};

template <>
struct ElementTraits<double> {
    static constexpr ElementType type = ElementType::Double;
    static constexpr std::string_view name = "double";
};

template <>
struct ElementTraits<std::string> {
    static constexpr ElementType type = ElementType::Bytes;
    static constexpr std::string_view name = "bytes";
};

[[nodiscard]] constexpr auto to_string(ElementType type) -> std::string_view {
    switch (type) {
        case ElementType::Boolean:
            return "boolean";
        case ElementType::Int:
            return "int";
        case ElementType::Long:
            return "long";
        case ElementType::Double:
            return "double";
        case ElementType::Bytes:
            return "bytes";
    }
    return "unknown";
}

/// Read-only element handle: scalars by value, bytes by reference.
template <BlockElement T>
using ElementRef = std::conditional_t<std::is_arithmetic_v<T>, T, const T&>;

namespace detail {

[[nodiscard]] inline auto canonical_bits(double v) noexcept -> std::uint64_t {
    if (std::isnan(v)) {
        return 0x7ff8000000000000ULL;
    }
    return std::bit_cast<std::uint64_t>(v);
}

[[nodiscard]] constexpr auto fold_long(std::uint64_t bits) noexcept -> std::int32_t {
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(bits ^ (bits >> 32)));
}

}  // namespace detail

/// 32-bit hash contribution of a single value. Identical values of the same
/// element type always contribute the same amount, whatever block holds them.
[[nodiscard]] inline auto hash_contribution(bool v) noexcept -> std::int32_t {
    return v ? 1231 : 1237;
}
[[nodiscard]] inline auto hash_contribution(std::int32_t v) noexcept -> std::int32_t { return v; }
[[nodiscard]] inline auto hash_contribution(std::int64_t v) noexcept -> std::int32_t {
    return detail::fold_long(static_cast<std::uint64_t>(v));
}
[[nodiscard]] inline auto hash_contribution(double v) noexcept -> std::int32_t {
    return detail::fold_long(detail::canonical_bits(v));
}
[[nodiscard]] inline auto hash_contribution(const std::string& v) noexcept -> std::int32_t {
    std::uint32_t result = 1;
    for (char c : v) {
        result = 31U * result + static_cast<std::uint32_t>(static_cast<signed char>(c));
    }
    return static_cast<std::int32_t>(result);
}

/// Value equality used by Block and Vector comparison. Doubles compare by
/// canonical bit pattern so that NaN equals NaN and 0.0 differs from -0.0.
template <BlockElement T>
[[nodiscard]] auto values_equal(ElementRef<T> a, ElementRef<T> b) noexcept -> bool {
    if constexpr (std::is_same_v<T, double>) {
        return detail::canonical_bits(a) == detail::canonical_bits(b);
    } else {
        return a == b;
    }
}

/// One step of the positional hash fold: result = 31 * result + contribution,
/// with 32-bit two's-complement wraparound.
[[nodiscard]] constexpr auto hash_step(std::int32_t result, std::int32_t contribution) noexcept
    -> std::int32_t {
    return static_cast<std::int32_t>(31U * static_cast<std::uint32_t>(result) +
                                     static_cast<std::uint32_t>(contribution));
}

}  // namespace blockwise
