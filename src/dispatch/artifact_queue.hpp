#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include "collaborators.hpp"
#include "dispatcher.hpp"
#include "stats.hpp"

namespace goesrx {

struct QueueConfig {
    size_t capacity{256};
    int max_attempts{3};
    std::chrono::milliseconds retry_delay{200};
};

// Bounded FIFO drained into Storage by one worker thread. Intake never
// waits on I/O: a full queue sheds its oldest artifact.
class ArtifactQueue : public ArtifactSink {
public:
    ArtifactQueue(const QueueConfig& cfg, Storage& storage, Stats& stats);
    ~ArtifactQueue() override;

    void start();
    void submit(Artifact&& a) override;
    // Stops intake and waits up to `grace` for the backlog. True when all was written.
    bool drain(std::chrono::milliseconds grace);
    size_t pending() const;

    // Inserts "-N" before the extension until storage has no such name.
    // Called by the worker only, one artifact at a time.
    std::string unique_name(const std::string& name);

private:
    void run();
    void write_one(Artifact& a);

    QueueConfig cfg_;
    Storage& storage_;
    Stats& stats_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Artifact> q_;
    bool accepting_{true};
    bool stop_{false};
    bool busy_{false};
    std::thread worker_;
};

} // namespace goesrx
