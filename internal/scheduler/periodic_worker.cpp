#include "periodic_worker.hpp"

#include "internal/observability/logging.hpp"

namespace settlement::scheduler {

using settlement::observability::StringField;

PeriodicWorker::PeriodicWorker(std::string name, std::chrono::milliseconds interval, std::function<void()> task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)) {
}

PeriodicWorker::~PeriodicWorker() {
  Stop();
}

void PeriodicWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&PeriodicWorker::Run, this);
  SETTLEMENT_LOG_INFO("background worker started", {StringField("worker", name_)});
}

void PeriodicWorker::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
    SETTLEMENT_LOG_INFO("background worker stopped", {StringField("worker", name_)});
  }
}

void PeriodicWorker::Run() {
  while (running_) {
    try {
      task_();
    } catch (const std::exception& e) {
      SETTLEMENT_LOG_ERROR("background task failed", {StringField("worker", name_), StringField("error", e.what())});
    }

    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace settlement::scheduler
