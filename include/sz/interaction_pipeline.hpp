#pragma once

#include "adaptive_controller.hpp"
#include "collaborators.hpp"
#include "item_scheduler.hpp"
#include "state_store.hpp"
#include "types.hpp"

#include "scoring/effectiveness.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sz {

struct InteractionResult {
  std::optional<LearningItem> next_item;
  AdaptationHint hint;
  EffectivenessSignal signal;
};

// Effective due time ascending, then stability ascending, then item id.
bool queue_order(const QueueEntry& a, const QueueEntry& b);
// Re-sorts the entries at and after the cursor.
void sort_pending(SessionContext& session);

// Session domain an item is accounted under: its first tag the session asked for.
std::string accounting_domain(const SessionContext& session, const LearningItem& item);

class InteractionPipeline {
public:
  InteractionPipeline(SessionStateStore& store, const ItemScheduler& scheduler,
                      AdaptiveController& controller, std::shared_ptr<ContentService> content,
                      std::shared_ptr<AnalyticsSink> analytics, std::size_t window_size,
                      scoring::EffectivenessWeights weights = {});

  // Applies one event to `session`. On InvalidEvent nothing is modified.
  InteractionResult handle(SessionContext& session, const InteractionEvent& event, Timestamp now);

  // Rebuilds windows, tallies, scores and modes from an event log. Items the
  // queue no longer knows are skipped.
  void rebuild_signals(SessionContext& session, const std::vector<InteractionEvent>& events) const;

private:
  std::size_t locate(SessionContext& session, const InteractionEvent& event, Timestamp now);
  std::optional<LearningItem> lookup_extra_curricular(const SessionContext& session,
                                                      const std::string& item_id);
  std::vector<LearningItem> lapsed_items(const SessionContext& session, const std::string& domain);
  void record_sample(DomainState& state, const InteractionEvent& event) const;
  void publish(const InteractionEvent& event, const EffectivenessSignal& signal);

  SessionStateStore& store_;
  const ItemScheduler& scheduler_;
  AdaptiveController& controller_;
  std::shared_ptr<ContentService> content_;
  std::shared_ptr<AnalyticsSink> analytics_;
  std::size_t window_size_;
  scoring::EffectivenessWeights weights_;
};

} // namespace sz
