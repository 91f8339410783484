#pragma once

#include <blockwise/core/error.hpp>
#include <blockwise/core/page.hpp>

#include <memory>
#include <optional>
#include <string>

namespace blockwise::exec {

/// A single-threaded stage of a pull-based pipeline.
///
/// The driver moves Pages between adjacent operators: it pulls get_output()
/// from the upstream operator only while the downstream one needs_input(), so
/// no stage buffers more than it is asked for. finish() tells an operator that
/// no more input will come; it may still emit output afterwards until
/// is_finished() turns true. close() releases any retained Pages and must be
/// safe to call at any point, including before the operator finished.
class Operator {
   public:
    virtual ~Operator() = default;

    Operator() = default;
    Operator(const Operator&) = delete;
    auto operator=(const Operator&) -> Operator& = delete;

    /// Stage name used in logs and error reports.
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    [[nodiscard]] virtual auto needs_input() const -> bool = 0;

    [[nodiscard]] virtual auto add_input(Page page) -> Result<void> = 0;

    /// No more input will arrive. Idempotent.
    virtual void finish() = 0;

    [[nodiscard]] virtual auto is_finished() const -> bool = 0;

    /// Next output Page, nullopt when none is ready yet.
    [[nodiscard]] virtual auto get_output() -> Result<std::optional<Page>> = 0;

    virtual void close() {}
};

using OperatorPtr = std::unique_ptr<Operator>;

/// An operator that produces Pages and never accepts input.
class SourceOperator : public Operator {
   public:
    [[nodiscard]] auto needs_input() const -> bool final { return false; }

    [[nodiscard]] auto add_input(Page /*page*/) -> Result<void> final {
        return std::unexpected(
            make_error(ErrorKind::IllegalState, name() + " is a source and takes no input"));
    }
};

using SourceOperatorPtr = std::unique_ptr<SourceOperator>;

/// An operator that consumes Pages and never produces output.
class SinkOperator : public Operator {
   public:
    [[nodiscard]] auto get_output() -> Result<std::optional<Page>> final {
        return std::optional<Page>{};
    }
};

using SinkOperatorPtr = std::unique_ptr<SinkOperator>;

}  // namespace blockwise::exec
