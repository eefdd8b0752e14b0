#include "pipeline.hpp"
#include "logging.hpp"

namespace goesrx {

Pipeline::Pipeline(const PipelineConfig &cfg, Dispatcher &dispatcher,
                   Stats &stats)
    : cfg_(cfg), dispatcher_(dispatcher), stats_(stats),
      demux_(cfg.profile, stats), checker_(stats) {}

void Pipeline::hand_off(std::vector<FileContext> &closed) {
  for (auto &ctx : closed)
    dispatcher_.dispatch(checker_.check(std::move(ctx)));
  closed.clear();
}

void Pipeline::on_unit(TransportUnit &&unit, SteadyTime now) {
  std::vector<FileContext> closed;
  demux_.process(unit, now, closed);
  hand_off(closed);
}

void Pipeline::on_reconnect() {
  Logger::instance().log(LogLevel::INFO,
                         "reconnected, resetting %zu channel(s)",
                         demux_.channel_count());
  stats_.add(Counter::Reconnects);
  std::vector<FileContext> closed;
  demux_.reset_all(closed);
  hand_off(closed);
}

void Pipeline::sweep(SteadyTime now) {
  std::vector<FileContext> closed;
  demux_.sweep(now, cfg_.stall_timeout, closed);
  hand_off(closed);
}

void Pipeline::shutdown() {
  std::vector<FileContext> closed;
  demux_.flush_all(closed, "shutdown");
  if (!closed.empty())
    Logger::instance().log(LogLevel::INFO,
                           "shutdown: flushing %zu open file(s)",
                           closed.size());
  hand_off(closed);
}

} // namespace goesrx
