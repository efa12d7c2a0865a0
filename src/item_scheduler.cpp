#include "sz/item_scheduler.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <utility>

namespace sz {
namespace {

double finite_or(double value, double fallback) {
  return std::isfinite(value) ? value : fallback;
}

} // namespace

ItemScheduler::ItemScheduler() {
  config_.validate();
}

ItemScheduler::ItemScheduler(SchedulerConfig config) : config_(std::move(config)) {
  config_.validate();
}

double ItemScheduler::clamp_difficulty(double difficulty) const {
  return std::clamp(finite_or(difficulty, config_.initial_difficulty), config_.difficulty_min,
                    config_.difficulty_max);
}

double ItemScheduler::clamp_stability(double stability_days) const {
  const double floor = std::min(config_.initial_stability_days, config_.lapse_stability_days);
  return std::clamp(finite_or(stability_days, floor), floor, config_.max_stability_days);
}

double ItemScheduler::growth_factor(double difficulty) const {
  const double d = clamp_difficulty(difficulty);
  const double raw = config_.max_growth - config_.growth_slope * (d - config_.difficulty_min);
  return std::clamp(raw, config_.min_growth, config_.max_growth);
}

ReviewState ItemScheduler::initial_state(const std::string& user_id, const LearningItem& item,
                                         Timestamp now) const {
  ReviewState state;
  state.user_id = user_id;
  state.item_id = item.id;
  state.repetitions = 0;
  state.stability_days = 0.0;
  state.difficulty = clamp_difficulty(
      config_.initial_difficulty +
      config_.base_difficulty_influence * detail::clip01(finite_or(item.base_difficulty, 0.0)));
  state.next_due = now;
  state.lapses = 0;
  return state;
}

ReviewState ItemScheduler::schedule(const ReviewState& current, Outcome outcome,
                                    Timestamp now) const {
  ReviewState next = current;
  next.repetitions = std::max(0, current.repetitions);
  next.lapses = std::max(0, current.lapses);
  next.difficulty = clamp_difficulty(current.difficulty);
  const double previous_stability = std::max(0.0, finite_or(current.stability_days, 0.0));

  if (outcome == Outcome::Incorrect) {
    next.stability_days = clamp_stability(config_.lapse_stability_days);
    next.lapses += 1;
    next.repetitions = 0;
    next.difficulty = clamp_difficulty(next.difficulty + config_.difficulty_step_up);
    next.next_due = now + detail::days_to_millis(next.stability_days);
  } else {
    double stability = next.repetitions == 0
                           ? config_.initial_stability_days
                           : previous_stability * growth_factor(next.difficulty);
    // Partial credit grows stability like a correct answer but leaves difficulty alone.
    stability = clamp_stability(std::max(stability, previous_stability));
    next.stability_days = stability;
    next.repetitions += 1;
    if (outcome == Outcome::Correct) {
      next.difficulty = clamp_difficulty(next.difficulty - config_.difficulty_step_down);
    }
    next.next_due = std::max(now + detail::days_to_millis(stability), current.next_due);
  }

  next.last_reviewed = now;
  enforce_bounds(next, now);
  return next;
}

void ItemScheduler::enforce_bounds(ReviewState& state, Timestamp now) const {
  const bool violated = state.difficulty < config_.difficulty_min ||
                        state.difficulty > config_.difficulty_max ||
                        state.stability_days <= 0.0 ||
                        state.stability_days > config_.max_stability_days ||
                        state.next_due <= now;
  assert(!violated && "ItemScheduler produced a ReviewState outside its configured bounds");
  if (violated) {
    state.difficulty = clamp_difficulty(state.difficulty);
    state.stability_days = clamp_stability(state.stability_days);
    state.next_due = std::max(state.next_due, now + 1);
  }
}

} // namespace sz
