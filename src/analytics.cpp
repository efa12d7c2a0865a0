#include "sz/analytics.hpp"

#include "debug_log.hpp"
#include "json_bridge.hpp"

#include <stdexcept>
#include <utility>

namespace sz {

void StreamAnalyticsSink::publish(const InteractionEvent& event) {
  nlohmann::json line = nlohmann::json::object();
  line["type"] = "interaction";
  line["event"] = bridge::to_json(event);
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line.dump() << '\n';
  out_.flush();
}

void StreamAnalyticsSink::publish(const EffectivenessSignal& signal) {
  nlohmann::json line = nlohmann::json::object();
  line["type"] = "effectiveness";
  line["signal"] = bridge::to_json(signal);
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line.dump() << '\n';
  out_.flush();
}

QueuedAnalyticsSink::QueuedAnalyticsSink(std::shared_ptr<AnalyticsSink> inner,
                                         std::size_t capacity)
    : inner_(std::move(inner)), capacity_(capacity) {
  if (!inner_) {
    throw std::invalid_argument("QueuedAnalyticsSink requires a sink");
  }
  if (capacity_ == 0) {
    throw std::invalid_argument("QueuedAnalyticsSink capacity must be positive");
  }
  worker_ = std::thread(&QueuedAnalyticsSink::worker_loop, this);
}

QueuedAnalyticsSink::~QueuedAnalyticsSink() {
  stop();
}

void QueuedAnalyticsSink::publish(const InteractionEvent& event) {
  enqueue(Record{event});
}

void QueuedAnalyticsSink::publish(const EffectivenessSignal& signal) {
  enqueue(Record{signal});
}

void QueuedAnalyticsSink::enqueue(Record record) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    if (queue_.size() >= capacity_) {
      const auto count = ++dropped_;
      // Log the first drop and every hundredth after it.
      if (count == 1 || count % 100 == 0) {
        log::warn("analytics", "queue full, dropped " + std::to_string(count) + " record(s)");
      }
      return;
    }
    queue_.push_back(std::move(record));
  }
  cv_.notify_one();
}

void QueuedAnalyticsSink::drain() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void QueuedAnalyticsSink::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void QueuedAnalyticsSink::worker_loop() {
  while (true) {
    Record record;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      if (queue_.empty()) {
        // Stopped and fully drained.
        idle_cv_.notify_all();
        return;
      }
      record = std::move(queue_.front());
      queue_.pop_front();
      busy_ = true;
    }

    try {
      std::visit([this](const auto& payload) { inner_->publish(payload); }, record);
    } catch (const std::exception& ex) {
      log::warn("analytics", std::string("sink failure: ") + ex.what());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
      if (queue_.empty()) {
        idle_cv_.notify_all();
      }
    }
  }
}

} // namespace sz
