#pragma once
#include <chrono>
#include <vector>
#include "demux.hpp"
#include "dispatcher.hpp"
#include "integrity.hpp"
#include "protocol.hpp"
#include "stats.hpp"

namespace goesrx {

struct PipelineConfig {
    MissionProfile profile;
    std::chrono::steady_clock::duration stall_timeout{std::chrono::seconds(120)};
};

// The ordered intake path: demultiplex, reassemble, check, dispatch.
// Not thread-safe; driven from the intake thread only.
class Pipeline {
public:
    Pipeline(const PipelineConfig& cfg, Dispatcher& dispatcher, Stats& stats);

    void on_unit(TransportUnit&& unit) { on_unit(std::move(unit), std::chrono::steady_clock::now()); }
    void on_unit(TransportUnit&& unit, SteadyTime now);
    void on_reconnect();
    void sweep(SteadyTime now);
    void shutdown();

    const Demultiplexer& demux() const { return demux_; }

private:
    void hand_off(std::vector<FileContext>& closed);

    PipelineConfig cfg_;
    Dispatcher& dispatcher_;
    Stats& stats_;
    Demultiplexer demux_;
    IntegrityChecker checker_;
};

} // namespace goesrx
