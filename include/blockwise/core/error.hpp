#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace blockwise {

/// Failure categories raised by the compute core.
enum class ErrorKind : std::uint8_t {
    /// Page built from blocks of unequal length, or as_vector() on a block
    /// with nulls or multi-valued positions.
    ShapeMismatch,
    /// An accumulator left its representable range.
    ArithmeticOverflow,
    /// Builder reused after build(), or state merged across different functions.
    IllegalState,
    /// A block variant reached code that does not handle it.
    UnsupportedShape,
};

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

/// Structured failure carried through std::expected.
struct Error {
    ErrorKind kind = ErrorKind::IllegalState;
    std::string message;
    /// Name of the pipeline stage that failed; empty until a driver annotates it.
    std::string stage;

    [[nodiscard]] auto format() const -> std::string;

    /// Copy of this error attributed to `stage_name` (keeps an existing stage).
    [[nodiscard]] auto at_stage(std::string_view stage_name) const -> Error;
};

[[nodiscard]] inline auto make_error(ErrorKind kind, std::string message) -> Error {
    return Error{.kind = kind, .message = std::move(message), .stage = {}};
}

template <typename T>
using Result = std::expected<T, Error>;

}  // namespace blockwise
