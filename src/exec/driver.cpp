#include <blockwise/exec/driver.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace blockwise::exec {

Driver::Driver(SourceOperatorPtr source, std::vector<OperatorPtr> operators,
               SinkOperatorPtr sink, DriverConfig config)
    : source_(std::move(source)),
      operators_(std::move(operators)),
      sink_(std::move(sink)),
      config_(config) {
    chain_.push_back(source_.get());
    for (auto& op : operators_) {
        chain_.push_back(op.get());
    }
    chain_.push_back(sink_.get());
    finish_sent_.assign(chain_.size(), false);
}

Driver::~Driver() {
    close();
}

auto Driver::run() -> Result<DriverStats> {
    if (closed_) {
        return std::unexpected(make_error(ErrorKind::IllegalState, "driver already closed"));
    }
    spdlog::debug("driver: starting {} -> {} operators -> {}", source_->name(),
                  operators_.size(), sink_->name());
    DriverStats stats;
    std::size_t idle = 0;
    while (!sink_->is_finished()) {
        ++stats.iterations;
        auto progressed = step(stats);
        if (!progressed) {
            spdlog::debug("driver: aborted by {}", progressed.error().format());
            close();
            return std::unexpected(progressed.error());
        }
        idle = *progressed ? 0 : idle + 1;
        if (idle >= 2) {
            close();
            return std::unexpected(make_error(
                ErrorKind::IllegalState,
                fmt::format("pipeline stalled after {} pages", stats.pages_read)));
        }
    }
    spdlog::debug("driver: finished after {} iterations, {} pages read, {} delivered{}",
                  stats.iterations, stats.pages_read, stats.pages_delivered,
                  stats.early_terminated ? " (early termination)" : "");
    close();
    return stats;
}

auto Driver::step(DriverStats& stats) -> Result<bool> {
    bool progressed = false;
    for (std::size_t i = 0; i + 1 < chain_.size(); ++i) {
        Operator& current = *chain_[i];
        Operator& next = *chain_[i + 1];

        if (next.needs_input() && !current.is_finished()) {
            auto output = current.get_output();
            if (!output) {
                return std::unexpected(output.error().at_stage(current.name()));
            }
            if (output->has_value()) {
                Page page = std::move(**output);
                if (i == 0) {
                    ++stats.pages_read;
                    stats.positions_read += page.position_count();
                    if (config_.max_pages != 0 && stats.pages_read >= config_.max_pages &&
                        !source_->is_finished()) {
                        spdlog::debug("driver: page limit {} reached, finishing {}",
                                      config_.max_pages, source_->name());
                        source_->finish();
                        stats.early_terminated = true;
                    }
                }
                if (i + 2 == chain_.size()) {
                    ++stats.pages_delivered;
                }
                if (auto ok = next.add_input(std::move(page)); !ok) {
                    return std::unexpected(ok.error().at_stage(next.name()));
                }
                progressed = true;
            }
        }

        if (current.is_finished() && !finish_sent_[i + 1]) {
            next.finish();
            finish_sent_[i + 1] = true;
            progressed = true;
        }
    }
    return progressed;
}

void Driver::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    for (auto* op : chain_) {
        spdlog::debug("driver: closing {}", op->name());
        op->close();
    }
}

}  // namespace blockwise::exec
