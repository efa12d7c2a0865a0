#pragma once

#include "collaborators.hpp"
#include "config.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace sz {

/**
 * SessionStateStore keeps live sessions in a fast in-memory tier and
 * propagates them to a DurableStore.
 *
 *  - put() updates the fast tier and queues a write-behind task unless one
 *    is already queued for the session; a single writer thread drains tasks
 *    in FIFO order.
 *  - Review states and events recorded for a session travel with the
 *    session's next write.
 *  - get() and review_state() read through to the durable tier on a miss.
 *  - evict() is a barrier: pending writes for the session complete before
 *    the fast-tier entry is dropped.
 *
 * Durable failures are retried with exponential backoff; once retries are
 * exhausted the session is marked degraded until a later write succeeds.
 * Background retries wait on a timer instead of the writer thread, so a
 * failing session never holds up writes for the others.
 */
class SessionStateStore {
public:
  using Clock = std::function<Timestamp()>;

  SessionStateStore(std::shared_ptr<DurableStore> durable, StoreConfig config,
                    Clock clock = now_millis);
  ~SessionStateStore();

  SessionStateStore(const SessionStateStore&) = delete;
  SessionStateStore& operator=(const SessionStateStore&) = delete;

  // nullopt when neither tier knows the session. Throws StoreUnavailable when
  // the fast tier misses and the durable tier cannot be read.
  std::optional<SessionContext> get(const std::string& session_id);
  void put(const std::string& session_id, const SessionContext& session);

  // Synchronous. Throws StoreUnavailable when the write cannot be completed.
  void flush(const std::string& session_id);
  void evict(const std::string& session_id);

  std::optional<ReviewState> review_state(const std::string& session_id,
                                          const std::string& user_id,
                                          const std::string& item_id);
  void put_review_state(const std::string& session_id, const ReviewState& state);
  void append_event(const std::string& session_id, const InteractionEvent& event);

  // Sessions idle for at least idle_timeout at `now`.
  std::vector<std::string> idle_sessions(Timestamp now) const;
  // Evicts the session if it is still idle; true when it left the fast tier.
  // Throws StoreUnavailable when its pending writes cannot be flushed.
  bool evict_if_idle(const std::string& session_id, Timestamp now);
  // Evicts every session idle for at least idle_timeout; returns how many went.
  std::size_t evict_idle(Timestamp now);

  // Runs `sweep` every janitor_interval, evict_idle when none is given.
  // Owners that serialize work per session pass a sweep that evicts under
  // their own per-session lock.
  void start_janitor(std::function<void(Timestamp)> sweep = {});

  bool degraded(const std::string& session_id) const;
  bool cached(const std::string& session_id) const;
  std::size_t cached_count() const;

  DurableStore& durable() noexcept { return *durable_; }

  // Drains queued writes, then joins background threads. Idempotent.
  void stop();

private:
  struct Entry {
    std::mutex mutex;
    std::condition_variable cv;
    // Held for the whole duration of a durable write.
    std::mutex write_mutex;

    SessionContext context;
    bool context_dirty = false;
    std::map<std::string, ReviewState> reviews;
    std::set<std::string> dirty_reviews;
    std::vector<InteractionEvent> pending_events;

    std::uint64_t write_seq = 0;
    std::uint64_t flushed_seq = 0;
    // At most one write-behind task and one timed retry per session.
    bool task_queued = false;
    bool retry_pending = false;
    int failed_writes = 0;
    Timestamp last_access = 0;
    bool degraded = false;
  };

  struct Task {
    std::string session_id;
    std::shared_ptr<Entry> entry;
    bool retry = false;
  };

  using RetryClock = std::chrono::steady_clock;

  std::shared_ptr<Entry> find_entry(const std::string& session_id) const;
  std::shared_ptr<Entry> require_entry(const std::string& session_id) const;

  // Caller holds entry.write_mutex. Returns false when the write failed.
  // Each durable call is retried up to max_retries times in place; a failed
  // synchronous write (max_retries > 0) degrades the session at once, a
  // background one only after StoreConfig::max_write_retries failures.
  bool write_entry(const std::string& session_id, Entry& entry, int max_retries);
  void write_review(Entry& entry, const ReviewState& desired);
  template <typename Fn>
  void with_retries(const std::string& what, int max_retries, Fn&& fn);

  void run_task(const Task& task);
  void schedule_retry(const Task& task, int failures);
  void writer_loop();
  void janitor_loop();

  std::shared_ptr<DurableStore> durable_;
  StoreConfig config_;
  Clock clock_;

  mutable std::mutex map_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::queue<Task> tasks_;
  std::multimap<RetryClock::time_point, Task> retries_;
  bool running_ = true;
  std::thread writer_;

  std::mutex janitor_mutex_;
  std::condition_variable janitor_cv_;
  bool janitor_running_ = false;
  std::function<void(Timestamp)> sweep_;
  std::thread janitor_;
};

} // namespace sz
