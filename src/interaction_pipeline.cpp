#include "sz/interaction_pipeline.hpp"

#include "sz/errors.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace sz {
namespace {

void record_kind(SessionContext& session, const LearningItem& item,
                 const InteractionEvent& event) {
  const bool turn = event.kind == InteractionKind::ConversationTurn;
  auto& stats = session.kind_stats[turn ? ContentKind::Conversation : item.kind];
  stats.interactions += 1;
  stats.conversation_turns += turn ? 1 : 0;
  stats.latency_sum_ms += event.latency_ms;
  switch (event.outcome) {
    case Outcome::Correct: stats.correct += 1; break;
    case Outcome::Partial: stats.partial += 1; break;
    case Outcome::Incorrect: stats.incorrect += 1; break;
  }
}

} // namespace

bool queue_order(const QueueEntry& a, const QueueEntry& b) {
  const auto due_a = a.effective_due();
  const auto due_b = b.effective_due();
  if (due_a != due_b) {
    return due_a < due_b;
  }
  if (a.stability_days != b.stability_days) {
    return a.stability_days < b.stability_days;
  }
  return a.item.id < b.item.id;
}

void sort_pending(SessionContext& session) {
  if (session.cursor >= session.queue.size()) {
    return;
  }
  auto first = session.queue.begin() + static_cast<std::ptrdiff_t>(session.cursor);
  std::stable_sort(first, session.queue.end(), queue_order);
}

std::string accounting_domain(const SessionContext& session, const LearningItem& item) {
  for (const auto& domain : item.domains) {
    if (std::find(session.domains.begin(), session.domains.end(), domain) !=
        session.domains.end()) {
      return domain;
    }
  }
  return item.primary_domain();
}

InteractionPipeline::InteractionPipeline(SessionStateStore& store, const ItemScheduler& scheduler,
                                         AdaptiveController& controller,
                                         std::shared_ptr<ContentService> content,
                                         std::shared_ptr<AnalyticsSink> analytics,
                                         std::size_t window_size,
                                         scoring::EffectivenessWeights weights)
    : store_(store),
      scheduler_(scheduler),
      controller_(controller),
      content_(std::move(content)),
      analytics_(std::move(analytics)),
      window_size_(window_size),
      weights_(std::move(weights)) {
  if (window_size_ == 0) {
    throw std::invalid_argument("InteractionPipeline window size must be positive");
  }
  weights_.validate();
}

std::optional<LearningItem> InteractionPipeline::lookup_extra_curricular(
    const SessionContext& session, const std::string& item_id) {
  if (!content_) {
    return std::nullopt;
  }
  for (const auto& domain : session.domains) {
    auto items = content_->fetch_items(domain, DifficultyRange::all(), {});
    for (auto& item : items) {
      if (item.id == item_id) {
        return std::move(item);
      }
    }
  }
  return std::nullopt;
}

std::size_t InteractionPipeline::locate(SessionContext& session, const InteractionEvent& event,
                                        Timestamp now) {
  if (event.cursor.has_value()) {
    const auto position = *event.cursor;
    if (position < session.cursor) {
      throw InvalidEvent("Event for position " + std::to_string(position) +
                         " superseded; session cursor is at " + std::to_string(session.cursor));
    }
    if (position >= session.queue.size() || session.queue[position].item.id != event.item_id) {
      throw InvalidEvent("Item '" + event.item_id + "' is not at queue position " +
                         std::to_string(position));
    }
    return position;
  }

  for (std::size_t i = session.cursor; i < session.queue.size(); ++i) {
    if (session.queue[i].item.id == event.item_id) {
      return i;
    }
  }

  if (session.extra_curricular) {
    for (std::size_t i = 0; i < session.cursor; ++i) {
      if (session.queue[i].item.id == event.item_id) {
        throw InvalidEvent("Item '" + event.item_id + "' was already answered at position " +
                           std::to_string(i) + " of session " + session.session_id);
      }
    }
    if (auto item = lookup_extra_curricular(session, event.item_id)) {
      QueueEntry entry;
      entry.item = std::move(*item);
      entry.next_due = now;
      session.queue.push_back(std::move(entry));
      log::debug("pipeline", session.session_id + " extra-curricular item " + event.item_id);
      return session.queue.size() - 1;
    }
  }
  throw InvalidEvent("Item '" + event.item_id + "' is not in the remaining queue of session " +
                     session.session_id);
}

std::vector<LearningItem> InteractionPipeline::lapsed_items(const SessionContext& session,
                                                            const std::string& domain) {
  std::vector<LearningItem> out;
  std::unordered_set<std::string> seen;
  const auto answered = std::min(session.cursor, session.queue.size());
  for (std::size_t i = 0; i < answered; ++i) {
    const auto& item = session.queue[i].item;
    if (!item.in_domain(domain) || !seen.insert(item.id).second) {
      continue;
    }
    auto review = store_.review_state(session.session_id, session.user_id, item.id);
    if (review.has_value() && review->lapses > 0) {
      out.push_back(item);
    }
  }
  return out;
}

void InteractionPipeline::record_sample(DomainState& state, const InteractionEvent& event) const {
  InteractionSample sample;
  sample.outcome = event.outcome;
  sample.latency_ms = event.latency_ms;
  sample.hints_used = event.hints_used;
  sample.attempts = event.attempts;
  state.window.push_back(sample);
  while (state.window.size() > window_size_) {
    state.window.pop_front();
  }

  state.interactions += 1;
  state.latency_sum_ms += event.latency_ms;
  switch (event.outcome) {
    case Outcome::Correct: state.correct += 1; break;
    case Outcome::Partial: state.partial += 1; break;
    case Outcome::Incorrect: state.incorrect += 1; break;
  }
}

void InteractionPipeline::publish(const InteractionEvent& event,
                                  const EffectivenessSignal& signal) {
  if (!analytics_) {
    return;
  }
  try {
    analytics_->publish(event);
    analytics_->publish(signal);
  } catch (const std::exception& ex) {
    log::warn("pipeline", std::string("analytics publish failed: ") + ex.what());
  }
}

InteractionResult InteractionPipeline::handle(SessionContext& session,
                                              const InteractionEvent& event, Timestamp now) {
  if (!event.session_id.empty() && event.session_id != session.session_id) {
    throw InvalidEvent("Event for session '" + event.session_id + "' sent to session '" +
                       session.session_id + "'");
  }
  if (event.item_id.empty()) {
    throw InvalidEvent("Event has no item id");
  }
  if (event.latency_ms < 0 || event.hints_used < 0 || event.attempts < 1) {
    throw InvalidEvent("Event for item '" + event.item_id + "' has out-of-range counters");
  }

  const auto index = locate(session, event, now);

  InteractionEvent recorded = event;
  recorded.session_id = session.session_id;
  recorded.cursor = session.cursor;
  if (recorded.timestamp == 0) {
    recorded.timestamp = now;
  }

  const LearningItem item = session.queue[index].item;
  const std::string domain = accounting_domain(session, item);

  auto review = store_.review_state(session.session_id, session.user_id, item.id);
  const ReviewState current =
      review.has_value() ? *review : scheduler_.initial_state(session.user_id, item, now);
  const ReviewState next = scheduler_.schedule(current, event.outcome, now);
  store_.put_review_state(session.session_id, next);

  auto& state = session.domain_states[domain];
  record_sample(state, recorded);
  record_kind(session, item, recorded);
  InteractionResult result;
  result.signal = scoring::compute_signal(domain, state.window, now, weights_);
  state.score = result.signal.score;
  session.effectiveness[domain] = result.signal.score;

  QueueEntry answered = session.queue[index];
  answered.next_due = next.next_due;
  answered.stability_days = next.stability_days;
  answered.injected = false;
  session.queue.erase(session.queue.begin() + static_cast<std::ptrdiff_t>(index));
  session.queue.insert(session.queue.begin() + static_cast<std::ptrdiff_t>(session.cursor),
                       std::move(answered));
  session.cursor += 1;
  session.interaction_count += 1;
  session.updated_at = now;

  // The answered item is behind the cursor now, so a fresh lapse counts.
  // Lapses are only consulted when the domain is about to start remediation.
  std::vector<LearningItem> lapsed;
  if (state.mode == DomainMode::Nominal &&
      static_cast<int>(state.window.size()) >= controller_.config().min_window &&
      state.score < controller_.config().low_threshold) {
    lapsed = lapsed_items(session, domain);
  }
  result.hint = controller_.evaluate(session, domain, now, lapsed);
  sort_pending(session);

  if (session.cursor < session.queue.size()) {
    result.next_item = session.queue[session.cursor].item;
  }

  store_.append_event(session.session_id, recorded);
  publish(recorded, result.signal);

  log::debug("pipeline", session.session_id + " " + item.id + " " + to_string(event.outcome) +
                             " domain=" + domain + " cursor=" + std::to_string(session.cursor) +
                             " remaining=" + std::to_string(session.remaining()));
  return result;
}

void InteractionPipeline::rebuild_signals(SessionContext& session,
                                          const std::vector<InteractionEvent>& events) const {
  for (auto& [domain, state] : session.domain_states) {
    const double level = state.level;
    state = DomainState{};
    state.level = level;
  }
  session.effectiveness.clear();
  session.kind_stats.clear();

  const auto& config = controller_.config();
  for (const auto& event : events) {
    auto it = std::find_if(session.queue.begin(), session.queue.end(),
                           [&](const QueueEntry& entry) { return entry.item.id == event.item_id; });
    if (it == session.queue.end()) {
      log::debug("pipeline", session.session_id + " replay skips unknown item " + event.item_id);
      continue;
    }
    const std::string domain = accounting_domain(session, it->item);
    auto& state = session.domain_states[domain];
    record_sample(state, event);
    record_kind(session, it->item, event);
    state.score = scoring::compute_signal(domain, state.window, event.timestamp, weights_).score;
    advance_mode(state, config);
    session.effectiveness[domain] = state.score;
  }
}

} // namespace sz
