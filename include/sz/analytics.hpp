#pragma once

#include "collaborators.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <ostream>
#include <thread>
#include <variant>

namespace sz {

// Writes one JSON object per line: {"type":"interaction"|"effectiveness", ...}.
class StreamAnalyticsSink : public AnalyticsSink {
public:
  explicit StreamAnalyticsSink(std::ostream& out) : out_(out) {}

  void publish(const InteractionEvent& event) override;
  void publish(const EffectivenessSignal& signal) override;

private:
  std::mutex mutex_;
  std::ostream& out_;
};

/**
 * Decorates a sink with a bounded queue drained by a worker thread. publish()
 * never blocks on the wrapped sink: when the queue is full the record is
 * dropped and counted. Failures of the wrapped sink are logged and ignored.
 */
class QueuedAnalyticsSink : public AnalyticsSink {
public:
  QueuedAnalyticsSink(std::shared_ptr<AnalyticsSink> inner, std::size_t capacity);
  ~QueuedAnalyticsSink() override;

  QueuedAnalyticsSink(const QueuedAnalyticsSink&) = delete;
  QueuedAnalyticsSink& operator=(const QueuedAnalyticsSink&) = delete;

  void publish(const InteractionEvent& event) override;
  void publish(const EffectivenessSignal& signal) override;

  // Blocks until every record accepted so far has been handed to the inner sink.
  void drain();
  // Delivers what is queued, then joins the worker. Idempotent.
  void stop();

  std::size_t dropped() const noexcept { return dropped_.load(); }

private:
  using Record = std::variant<InteractionEvent, EffectivenessSignal>;

  void enqueue(Record record);
  void worker_loop();

  std::shared_ptr<AnalyticsSink> inner_;
  std::size_t capacity_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<Record> queue_;
  bool running_ = true;
  bool busy_ = false;
  std::atomic<std::size_t> dropped_{0};
  std::thread worker_;
};

} // namespace sz
