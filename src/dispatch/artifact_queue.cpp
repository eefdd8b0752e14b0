#include "artifact_queue.hpp"
#include "logging.hpp"
#include "protocol.hpp"

namespace goesrx {

ArtifactQueue::ArtifactQueue(const QueueConfig &cfg, Storage &storage,
                             Stats &stats)
    : cfg_(cfg), storage_(storage), stats_(stats) {}

ArtifactQueue::~ArtifactQueue() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stop_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
}

void ArtifactQueue::start() { worker_ = std::thread([this]() { run(); }); }

void ArtifactQueue::submit(Artifact &&a) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!accepting_) {
      Logger::instance().log(LogLevel::WARN, "queue closed, dropping %s",
                             a.name.c_str());
      stats_.add(Counter::ArtifactsDropped);
      return;
    }
    if (q_.size() >= cfg_.capacity) {
      Logger::instance().log(LogLevel::WARN,
                             "persistence queue full, dropping oldest %s",
                             q_.front().name.c_str());
      q_.pop_front();
      stats_.add(Counter::ArtifactsDropped);
    }
    q_.push_back(std::move(a));
    stats_.add(Counter::ArtifactsQueued);
  }
  cv_.notify_one();
}

size_t ArtifactQueue::pending() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return q_.size() + (busy_ ? 1 : 0);
}

bool ArtifactQueue::drain(std::chrono::milliseconds grace) {
  bool done;
  {
    std::unique_lock<std::mutex> lk(mtx_);
    accepting_ = false;
    done = idle_cv_.wait_for(lk, grace,
                             [this]() { return q_.empty() && !busy_; });
    stop_ = true;
    if (!q_.empty()) {
      Logger::instance().log(LogLevel::WARN,
                             "drain grace expired, %zu artifact(s) not written",
                             q_.size());
      stats_.add(Counter::ArtifactsDropped, q_.size());
      q_.clear();
    }
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
  return done;
}

void ArtifactQueue::run() {
  for (;;) {
    Artifact a;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_.wait(lk, [this]() { return stop_ || !q_.empty(); });
      if (stop_)
        break;
      a = std::move(q_.front());
      q_.pop_front();
      busy_ = true;
    }
    write_one(a);
    {
      std::lock_guard<std::mutex> lk(mtx_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}

void ArtifactQueue::write_one(Artifact &a) {
  std::string name = unique_name(a.name);
  std::string err;
  for (int attempt = 1; attempt <= cfg_.max_attempts; attempt++) {
    if (storage_.write(name, a.bytes, err)) {
      stats_.add(Counter::ArtifactsWritten);
      Logger::instance().log(LogLevel::DEBUG, "wrote %s (%zu bytes)",
                             name.c_str(), a.bytes.size());
      return;
    }
    Logger::instance().log(LogLevel::WARN, "write %s attempt %d/%d: %s",
                           name.c_str(), attempt, cfg_.max_attempts,
                           err.c_str());
    if (attempt == cfg_.max_attempts)
      break;
    std::unique_lock<std::mutex> lk(mtx_);
    if (cv_.wait_for(lk, cfg_.retry_delay, [this]() { return stop_; }))
      break;
  }
  Logger::instance().log(LogLevel::ERROR, "%s: dropping %s: %s",
                         error_name(ErrorKind::WriteFailure), name.c_str(),
                         err.c_str());
  stats_.add(Counter::WriteFailures);
  stats_.add(Counter::ArtifactsDropped);
}

std::string ArtifactQueue::unique_name(const std::string &name) {
  if (!storage_.exists(name))
    return name;
  std::string stem = name, ext;
  auto slash = name.rfind('/');
  auto dot = name.rfind('.');
  if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
    stem = name.substr(0, dot);
    ext = name.substr(dot);
  }
  for (unsigned n = 1;; n++) {
    std::string candidate = stem + "-" + std::to_string(n) + ext;
    if (!storage_.exists(candidate))
      return candidate;
  }
}

} // namespace goesrx
