#include "sz/state_store.hpp"

#include "sz/errors.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace sz {
namespace {

constexpr int kMaxCasConflicts = 16;

bool newer_than(const ReviewState& a, const ReviewState& b) {
  return a.last_reviewed.value_or(0) > b.last_reviewed.value_or(0);
}

} // namespace

SessionStateStore::SessionStateStore(std::shared_ptr<DurableStore> durable, StoreConfig config,
                                     Clock clock)
    : durable_(std::move(durable)), config_(std::move(config)), clock_(std::move(clock)) {
  if (!durable_) {
    throw std::invalid_argument("SessionStateStore requires a durable store");
  }
  if (!clock_) {
    clock_ = now_millis;
  }
  config_.validate();
  writer_ = std::thread(&SessionStateStore::writer_loop, this);
}

SessionStateStore::~SessionStateStore() {
  stop();
}

void SessionStateStore::stop() {
  {
    std::lock_guard<std::mutex> lock(janitor_mutex_);
    janitor_running_ = false;
  }
  janitor_cv_.notify_all();
  if (janitor_.joinable()) {
    janitor_.join();
  }

  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
  }
  queue_cv_.notify_all();
  if (writer_.joinable()) {
    writer_.join();
  }
}

std::shared_ptr<SessionStateStore::Entry> SessionStateStore::find_entry(
    const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto it = entries_.find(session_id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<SessionStateStore::Entry> SessionStateStore::require_entry(
    const std::string& session_id) const {
  auto entry = find_entry(session_id);
  if (!entry) {
    throw SessionNotFound(session_id, "Session is not loaded");
  }
  return entry;
}

std::optional<SessionContext> SessionStateStore::get(const std::string& session_id) {
  if (auto entry = find_entry(session_id)) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->last_access = clock_();
    return entry->context;
  }

  auto loaded = durable_->load_session(session_id);
  if (!loaded.has_value()) {
    return std::nullopt;
  }
  log::debug("store", "read-through " + session_id);

  auto fresh = std::make_shared<Entry>();
  fresh->context = *loaded;
  fresh->last_access = clock_();

  std::lock_guard<std::mutex> lock(map_mutex_);
  auto [it, inserted] = entries_.emplace(session_id, fresh);
  if (!inserted) {
    // Another caller populated the entry first; theirs may be newer.
    std::lock_guard<std::mutex> entry_lock(it->second->mutex);
    it->second->last_access = clock_();
    return it->second->context;
  }
  return loaded;
}

void SessionStateStore::put(const std::string& session_id, const SessionContext& session) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto& slot = entries_[session_id];
    if (!slot) {
      slot = std::make_shared<Entry>();
    }
    entry = slot;
  }
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->context = session;
    entry->context_dirty = true;
    ++entry->write_seq;
    entry->last_access = clock_();
    if (entry->task_queued || entry->retry_pending) {
      // The queued write snapshots the entry when it runs and carries this put.
      return;
    }
    entry->task_queued = true;
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (running_) {
      tasks_.push(Task{session_id, entry, false});
    } else {
      // Writer is gone; the data stays dirty for the next synchronous flush.
      std::lock_guard<std::mutex> entry_lock(entry->mutex);
      entry->task_queued = false;
      entry->cv.notify_all();
    }
  }
  queue_cv_.notify_one();
}

void SessionStateStore::flush(const std::string& session_id) {
  auto entry = find_entry(session_id);
  if (!entry) {
    return;
  }
  std::lock_guard<std::mutex> write_lock(entry->write_mutex);
  if (!write_entry(session_id, *entry, config_.max_write_retries)) {
    throw StoreUnavailable("Durable write failed for session " + session_id);
  }
}

void SessionStateStore::evict(const std::string& session_id) {
  auto entry = find_entry(session_id);
  if (!entry) {
    return;
  }
  {
    std::unique_lock<std::mutex> lock(entry->mutex);
    entry->cv.wait(lock, [&] { return !entry->task_queued; });
  }

  std::lock_guard<std::mutex> write_lock(entry->write_mutex);
  if (!write_entry(session_id, *entry, config_.max_write_retries)) {
    throw StoreUnavailable("Cannot evict session " + session_id + " with unflushed writes");
  }

  std::lock_guard<std::mutex> map_lock(map_mutex_);
  auto it = entries_.find(session_id);
  if (it == entries_.end() || it->second != entry) {
    return;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  if (entry->write_seq != entry->flushed_seq || entry->task_queued) {
    // Written to while we were flushing; keep it for the next pass.
    return;
  }
  entries_.erase(it);
  log::debug("store", "evicted " + session_id);
}

std::optional<ReviewState> SessionStateStore::review_state(const std::string& session_id,
                                                           const std::string& user_id,
                                                           const std::string& item_id) {
  auto entry = find_entry(session_id);
  if (entry) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    auto it = entry->reviews.find(item_id);
    if (it != entry->reviews.end()) {
      return it->second;
    }
  }

  auto loaded = durable_->load_review(user_id, item_id);
  if (loaded.has_value() && entry) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    auto [it, inserted] = entry->reviews.emplace(item_id, *loaded);
    return it->second;
  }
  return loaded;
}

void SessionStateStore::put_review_state(const std::string& session_id,
                                         const ReviewState& state) {
  auto entry = require_entry(session_id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  entry->reviews[state.item_id] = state;
  entry->dirty_reviews.insert(state.item_id);
  ++entry->write_seq;
}

void SessionStateStore::append_event(const std::string& session_id,
                                     const InteractionEvent& event) {
  auto entry = require_entry(session_id);
  std::lock_guard<std::mutex> lock(entry->mutex);
  entry->pending_events.push_back(event);
  ++entry->write_seq;
}

bool SessionStateStore::degraded(const std::string& session_id) const {
  auto entry = find_entry(session_id);
  if (!entry) {
    return false;
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  return entry->degraded;
}

bool SessionStateStore::cached(const std::string& session_id) const {
  return find_entry(session_id) != nullptr;
}

std::size_t SessionStateStore::cached_count() const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  return entries_.size();
}

template <typename Fn>
void SessionStateStore::with_retries(const std::string& what, int max_retries, Fn&& fn) {
  auto backoff = config_.retry_backoff;
  for (int attempt = 0;; ++attempt) {
    try {
      fn();
      return;
    } catch (const StoreUnavailable& ex) {
      if (attempt >= max_retries) {
        throw;
      }
      log::warn("store", what + " failed (attempt " + std::to_string(attempt + 1) +
                             "): " + ex.what());
    }
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

void SessionStateStore::write_review(Entry& entry, const ReviewState& desired) {
  ReviewState candidate = desired;
  std::uint64_t expected = desired.version;
  for (int conflicts = 0; conflicts < kMaxCasConflicts; ++conflicts) {
    std::optional<ReviewState> current;
    if (durable_->compare_and_swap_review(candidate, expected, current)) {
      std::lock_guard<std::mutex> lock(entry.mutex);
      auto it = entry.reviews.find(candidate.item_id);
      if (it != entry.reviews.end() && current.has_value()) {
        it->second.version = current->version;
      }
      return;
    }

    if (current.has_value() && newer_than(*current, candidate)) {
      // Someone else recorded a later review of this item; keep theirs.
      log::debug("store", "cas conflict on " + candidate.item_id + ": stored state is newer");
      std::lock_guard<std::mutex> lock(entry.mutex);
      auto it = entry.reviews.find(candidate.item_id);
      if (it != entry.reviews.end() && !newer_than(it->second, *current)) {
        it->second = *current;
      }
      return;
    }
    expected = current.has_value() ? current->version : 0;
    log::debug("store", "cas conflict on " + candidate.item_id + ": retrying at v" +
                            std::to_string(expected));
  }
  throw StoreUnavailable("Persistent compare-and-swap contention on " + desired.item_id);
}

bool SessionStateStore::write_entry(const std::string& session_id, Entry& entry,
                                    int max_retries) {
  std::uint64_t target_seq = 0;
  std::optional<SessionContext> context;
  std::vector<ReviewState> reviews;
  std::vector<InteractionEvent> events;
  {
    std::lock_guard<std::mutex> lock(entry.mutex);
    target_seq = entry.write_seq;
    if (target_seq == entry.flushed_seq && !entry.degraded) {
      return true;
    }
    if (entry.context_dirty) {
      context = entry.context;
      entry.context_dirty = false;
    }
    for (const auto& item_id : entry.dirty_reviews) {
      reviews.push_back(entry.reviews.at(item_id));
    }
    entry.dirty_reviews.clear();
    events.swap(entry.pending_events);
  }

  std::size_t reviews_written = 0;
  bool events_written = false;
  try {
    for (; reviews_written < reviews.size(); ++reviews_written) {
      const auto& review = reviews[reviews_written];
      with_retries("review write", max_retries, [&] { write_review(entry, review); });
    }
    with_retries("event append", max_retries,
                 [&] { durable_->append_events(session_id, events); });
    events_written = true;
    if (context.has_value()) {
      with_retries("session write", max_retries, [&] { durable_->store_session(*context); });
    }
  } catch (const std::exception& ex) {
    std::lock_guard<std::mutex> lock(entry.mutex);
    for (std::size_t i = reviews_written; i < reviews.size(); ++i) {
      entry.dirty_reviews.insert(reviews[i].item_id);
    }
    if (!events_written) {
      entry.pending_events.insert(entry.pending_events.begin(), events.begin(), events.end());
    }
    if (context.has_value()) {
      entry.context_dirty = true;
    }
    ++entry.failed_writes;
    if (max_retries > 0 || entry.failed_writes > config_.max_write_retries) {
      if (!entry.degraded) {
        log::warn("store", "session " + session_id + " degraded: " + ex.what());
      }
      entry.degraded = true;
    } else {
      log::debug("store", "write of " + session_id + " failed (attempt " +
                              std::to_string(entry.failed_writes) + "): " + ex.what());
    }
    entry.cv.notify_all();
    return false;
  }

  std::lock_guard<std::mutex> lock(entry.mutex);
  entry.failed_writes = 0;
  entry.flushed_seq = std::max(entry.flushed_seq, target_seq);
  if (entry.degraded) {
    log::warn("store", "session " + session_id + " recovered");
  }
  entry.degraded = false;
  entry.cv.notify_all();
  log::debug("store", "flushed " + session_id + " seq=" + std::to_string(target_seq) +
                          " reviews=" + std::to_string(reviews.size()) +
                          " events=" + std::to_string(events.size()));
  return true;
}

void SessionStateStore::run_task(const Task& task) {
  Entry& entry = *task.entry;
  std::lock_guard<std::mutex> write_lock(entry.write_mutex);
  {
    // Cleared before the snapshot so a put arriving mid-write queues again.
    std::lock_guard<std::mutex> lock(entry.mutex);
    if (task.retry) {
      entry.retry_pending = false;
    } else {
      entry.task_queued = false;
    }
    entry.cv.notify_all();
  }
  if (write_entry(task.session_id, entry, 0)) {
    return;
  }

  int failures = 0;
  {
    std::lock_guard<std::mutex> lock(entry.mutex);
    if (entry.degraded || entry.task_queued || entry.retry_pending) {
      return;
    }
    entry.retry_pending = true;
    failures = entry.failed_writes;
  }
  schedule_retry(task, failures);
}

void SessionStateStore::schedule_retry(const Task& task, int failures) {
  auto delay = config_.retry_backoff;
  for (int i = 1; i < failures; ++i) {
    delay *= 2;
  }
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    retries_.emplace(RetryClock::now() + delay, Task{task.session_id, task.entry, true});
  }
  queue_cv_.notify_one();
}

void SessionStateStore::writer_loop() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  while (true) {
    Task task;
    if (!tasks_.empty()) {
      task = std::move(tasks_.front());
      tasks_.pop();
    } else if (!retries_.empty() &&
               (!running_ || retries_.begin()->first <= RetryClock::now())) {
      // On shutdown pending retries run without waiting out their backoff.
      task = std::move(retries_.begin()->second);
      retries_.erase(retries_.begin());
    } else if (!running_) {
      return;
    } else {
      if (retries_.empty()) {
        queue_cv_.wait(lock);
      } else {
        queue_cv_.wait_until(lock, retries_.begin()->first);
      }
      continue;
    }

    lock.unlock();
    run_task(task);
    lock.lock();
  }
}

std::vector<std::string> SessionStateStore::idle_sessions(Timestamp now) const {
  const auto idle_ms = static_cast<Timestamp>(config_.idle_timeout.count());
  std::vector<std::string> idle;
  std::lock_guard<std::mutex> lock(map_mutex_);
  for (const auto& [session_id, entry] : entries_) {
    std::lock_guard<std::mutex> entry_lock(entry->mutex);
    if (now - entry->last_access >= idle_ms) {
      idle.push_back(session_id);
    }
  }
  return idle;
}

bool SessionStateStore::evict_if_idle(const std::string& session_id, Timestamp now) {
  auto entry = find_entry(session_id);
  if (!entry) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (now - entry->last_access < static_cast<Timestamp>(config_.idle_timeout.count())) {
      return false;
    }
  }
  evict(session_id);
  return !cached(session_id);
}

std::size_t SessionStateStore::evict_idle(Timestamp now) {
  std::size_t evicted = 0;
  for (const auto& session_id : idle_sessions(now)) {
    try {
      if (evict_if_idle(session_id, now)) {
        ++evicted;
      }
    } catch (const StoreUnavailable& ex) {
      log::warn("store", "idle eviction of " + session_id + " postponed: " + ex.what());
    }
  }
  if (evicted > 0) {
    log::debug("store", "janitor evicted " + std::to_string(evicted) + " session(s)");
  }
  return evicted;
}

void SessionStateStore::start_janitor(std::function<void(Timestamp)> sweep) {
  std::lock_guard<std::mutex> lock(janitor_mutex_);
  if (janitor_running_ || janitor_.joinable()) {
    return;
  }
  if (sweep) {
    sweep_ = std::move(sweep);
  } else {
    sweep_ = [this](Timestamp now) { evict_idle(now); };
  }
  janitor_running_ = true;
  janitor_ = std::thread(&SessionStateStore::janitor_loop, this);
}

void SessionStateStore::janitor_loop() {
  std::unique_lock<std::mutex> lock(janitor_mutex_);
  while (janitor_running_) {
    janitor_cv_.wait_for(lock, config_.janitor_interval, [this] { return !janitor_running_; });
    if (!janitor_running_) {
      break;
    }
    auto sweep = sweep_;
    lock.unlock();
    sweep(clock_());
    lock.lock();
  }
}

} // namespace sz
