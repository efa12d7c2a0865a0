#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sz {

struct DifficultyRange {
  double min = 0.0;
  double max = 1.0;
  // Lower bound excluded when set; used for "strictly harder than" requests.
  bool exclusive_min = false;

  bool contains(double difficulty) const {
    if (exclusive_min ? difficulty <= min : difficulty < min) {
      return false;
    }
    return difficulty <= max;
  }

  static DifficultyRange all() { return DifficultyRange{}; }
};

// Source of published learning items. Implementations must tolerate concurrent
// reads from many sessions; failures surface as ContentServiceUnavailable.
class ContentService {
public:
  virtual ~ContentService() = default;

  // Results come back in no particular order.
  virtual std::vector<LearningItem> fetch_items(const std::string& domain,
                                                const DifficultyRange& range,
                                                const std::unordered_set<std::string>& exclude_ids) = 0;
};

// Durable tier. Every method may throw StoreUnavailable.
class DurableStore {
public:
  virtual ~DurableStore() = default;

  virtual std::optional<ReviewState> load_review(const std::string& user_id,
                                                 const std::string& item_id) = 0;

  // Writes `desired` only when the stored version equals `expected_version`
  // (0 = record must not exist yet). On success the stored record carries
  // version expected_version + 1. On conflict `current` receives the stored record.
  virtual bool compare_and_swap_review(const ReviewState& desired,
                                       std::uint64_t expected_version,
                                       std::optional<ReviewState>& current) = 0;

  virtual std::vector<ReviewState> reviews_for_user(const std::string& user_id) = 0;

  virtual std::optional<SessionContext> load_session(const std::string& session_id) = 0;
  virtual void store_session(const SessionContext& session) = 0;

  virtual void append_events(const std::string& session_id,
                             const std::vector<InteractionEvent>& events) = 0;
  virtual std::vector<InteractionEvent> load_events(const std::string& session_id) = 0;
};

// Best-effort, never blocks the caller for longer than a local enqueue.
class AnalyticsSink {
public:
  virtual ~AnalyticsSink() = default;

  virtual void publish(const InteractionEvent& event) = 0;
  virtual void publish(const EffectivenessSignal& signal) = 0;
};

} // namespace sz
