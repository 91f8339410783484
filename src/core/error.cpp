#include <blockwise/core/error.hpp>

#include <fmt/format.h>

namespace blockwise {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::ShapeMismatch:
            return "ShapeMismatch";
        case ErrorKind::ArithmeticOverflow:
            return "ArithmeticOverflow";
        case ErrorKind::IllegalState:
            return "IllegalState";
        case ErrorKind::UnsupportedShape:
            return "UnsupportedShape";
    }
    return "Unknown";
}

auto Error::format() const -> std::string {
    if (stage.empty()) {
        return fmt::format("{}: {}", to_string(kind), message);
    }
    return fmt::format("{} in [{}]: {}", to_string(kind), stage, message);
}

auto Error::at_stage(std::string_view stage_name) const -> Error {
    Error out = *this;
    if (out.stage.empty()) {
        out.stage = std::string(stage_name);
    }
    return out;
}

}  // namespace blockwise
