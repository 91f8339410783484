#pragma once

#include <blockwise/core/error.hpp>
#include <blockwise/exec/operator.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blockwise::exec {

struct DriverConfig {
    /// Stop pulling from the source after this many pages; 0 means unlimited.
    std::size_t max_pages = 0;
};

struct DriverStats {
    std::size_t pages_read = 0;
    std::int64_t positions_read = 0;
    std::size_t pages_delivered = 0;
    std::size_t iterations = 0;
    /// True when max_pages cut the source short.
    bool early_terminated = false;
};

/// Runs a linear pipeline: source, zero or more operators, sink.
///
/// Each iteration walks the chain once, moving at most one Page across every
/// adjacent pair whose downstream side needs input, and forwards finish()
/// once an upstream operator is done. The run ends when the sink is
/// finished. The driver owns its operators and closes each of them exactly
/// once, on success, on error and on destruction.
class Driver {
   public:
    Driver(SourceOperatorPtr source, std::vector<OperatorPtr> operators, SinkOperatorPtr sink,
           DriverConfig config = {});
    ~Driver();

    Driver(const Driver&) = delete;
    auto operator=(const Driver&) -> Driver& = delete;

    /// Drive the pipeline to completion. A failing stage aborts the run; the
    /// returned error names it in Error::stage.
    [[nodiscard]] auto run() -> Result<DriverStats>;

    /// Close every operator. Idempotent.
    void close();

    [[nodiscard]] auto closed() const noexcept -> bool { return closed_; }
    [[nodiscard]] auto config() const noexcept -> const DriverConfig& { return config_; }

   private:
    [[nodiscard]] auto step(DriverStats& stats) -> Result<bool>;

    SourceOperatorPtr source_;
    std::vector<OperatorPtr> operators_;
    SinkOperatorPtr sink_;
    DriverConfig config_;
    /// source, operators..., sink in pipeline order (non-owning).
    std::vector<Operator*> chain_;
    std::vector<bool> finish_sent_;
    bool closed_ = false;
};

}  // namespace blockwise::exec
