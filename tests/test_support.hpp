#pragma once

#include "sz/collaborators.hpp"
#include "sz/durable_stores.hpp"
#include "sz/errors.hpp"
#include "sz/types.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace sz::testing {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

// 2024-01-01T00:00:00Z
constexpr Timestamp kEpoch = 1704067200000;

class ManualClock {
public:
  explicit ManualClock(Timestamp start = kEpoch) : now_(start) {}

  Timestamp now() const { return now_.load(); }
  void advance(Timestamp millis) { now_ += millis; }
  void set(Timestamp value) { now_ = value; }

  std::function<Timestamp()> fn() {
    return [this] { return now_.load(); };
  }

private:
  std::atomic<Timestamp> now_;
};

inline LearningItem make_item(const std::string& id, const std::string& domain,
                              double difficulty, ContentKind kind = ContentKind::Vocabulary) {
  LearningItem item;
  item.id = id;
  item.domains = {domain};
  item.base_difficulty = difficulty;
  item.payload_ref = "content://" + id;
  item.kind = kind;
  return item;
}

inline InteractionEvent make_event(const std::string& session_id, const std::string& item_id,
                                   Outcome outcome, int latency_ms = 2000) {
  InteractionEvent event;
  event.session_id = session_id;
  event.item_id = item_id;
  event.outcome = outcome;
  event.latency_ms = latency_ms;
  return event;
}

// Serves a fixed item list, records each requested range, and can be switched off.
class ScriptedContentService : public ContentService {
public:
  explicit ScriptedContentService(std::vector<LearningItem> items) : items_(std::move(items)) {}

  std::vector<LearningItem> fetch_items(const std::string& domain, const DifficultyRange& range,
                                        const std::unordered_set<std::string>& exclude_ids) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests.push_back(range);
    if (unavailable) {
      throw ContentServiceUnavailable("content service offline");
    }
    std::vector<LearningItem> out;
    for (const auto& item : items_) {
      if (item.in_domain(domain) && range.contains(item.base_difficulty) &&
          exclude_ids.count(item.id) == 0) {
        out.push_back(item);
      }
    }
    return out;
  }

  std::atomic<bool> unavailable{false};
  std::vector<DifficultyRange> requests;

private:
  std::mutex mutex_;
  std::vector<LearningItem> items_;
};

// In-memory store whose writes (and optionally reads) can be made to fail,
// for every session or only some, and whose review reads can be held open.
class FlakyDurableStore : public InMemoryDurableStore {
public:
  std::optional<ReviewState> load_review(const std::string& user_id,
                                         const std::string& item_id) override {
    check_read();
    {
      std::unique_lock<std::mutex> lock(gate_mutex_);
      if (hold_review_reads_) {
        ++held_review_reads_;
        gate_cv_.notify_all();
        gate_cv_.wait(lock, [this] { return !hold_review_reads_; });
      }
    }
    return InMemoryDurableStore::load_review(user_id, item_id);
  }

  void hold_review_reads() {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    hold_review_reads_ = true;
  }

  void wait_review_read_held() {
    std::unique_lock<std::mutex> lock(gate_mutex_);
    gate_cv_.wait(lock, [this] { return held_review_reads_ > 0; });
  }

  void release_review_reads() {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    hold_review_reads_ = false;
    gate_cv_.notify_all();
  }

  void fail_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    failing_sessions_.insert(session_id);
  }

  bool compare_and_swap_review(const ReviewState& desired, std::uint64_t expected_version,
                               std::optional<ReviewState>& current) override {
    check_write();
    return InMemoryDurableStore::compare_and_swap_review(desired, expected_version, current);
  }

  std::vector<ReviewState> reviews_for_user(const std::string& user_id) override {
    check_read();
    return InMemoryDurableStore::reviews_for_user(user_id);
  }

  std::optional<SessionContext> load_session(const std::string& session_id) override {
    check_read();
    return InMemoryDurableStore::load_session(session_id);
  }

  void store_session(const SessionContext& session) override {
    check_write();
    check_session(session.session_id);
    ++session_writes;
    InMemoryDurableStore::store_session(session);
  }

  void append_events(const std::string& session_id,
                     const std::vector<InteractionEvent>& events) override {
    check_write();
    check_session(session_id);
    InMemoryDurableStore::append_events(session_id, events);
  }

  std::vector<InteractionEvent> load_events(const std::string& session_id) override {
    check_read();
    return InMemoryDurableStore::load_events(session_id);
  }

  std::atomic<bool> fail_writes{false};
  std::atomic<bool> fail_reads{false};
  // Fail only the next N writes, then recover.
  std::atomic<int> transient_write_failures{0};
  std::atomic<int> write_failures{0};
  std::atomic<int> session_writes{0};
  // Writes refused for sessions passed to fail_session().
  std::atomic<int> session_failures{0};

private:
  void check_write() {
    if (fail_writes.load()) {
      ++write_failures;
      throw StoreUnavailable("durable tier offline");
    }
    if (transient_write_failures.load() > 0) {
      --transient_write_failures;
      ++write_failures;
      throw StoreUnavailable("transient durable failure");
    }
  }

  void check_read() {
    if (fail_reads.load()) {
      throw StoreUnavailable("durable tier offline");
    }
  }

  void check_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(gate_mutex_);
    if (failing_sessions_.count(session_id) > 0) {
      ++session_failures;
      throw StoreUnavailable("partition for " + session_id + " offline");
    }
  }

  std::mutex gate_mutex_;
  std::condition_variable gate_cv_;
  bool hold_review_reads_ = false;
  int held_review_reads_ = 0;
  std::set<std::string> failing_sessions_;
};

class RecordingAnalyticsSink : public AnalyticsSink {
public:
  void publish(const InteractionEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events.push_back(event);
  }

  void publish(const EffectivenessSignal& signal) override {
    std::lock_guard<std::mutex> lock(mutex_);
    signals.push_back(signal);
  }

  std::size_t event_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events.size();
  }

  std::vector<InteractionEvent> events;
  std::vector<EffectivenessSignal> signals;

private:
  std::mutex mutex_;
};

inline std::filesystem::path fresh_temp_dir(const std::string& name) {
  std::filesystem::path base;
  if (const char* env = std::getenv("SZ_TEST_TMP")) {
    base = env;
  } else {
    base = std::filesystem::temp_directory_path() / "sz_tests";
  }
  auto dir = base / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

} // namespace sz::testing
