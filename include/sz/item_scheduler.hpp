#pragma once

#include "config.hpp"
#include "types.hpp"

namespace sz {

// SM-2 family spaced-repetition scheduler. Pure: no I/O, no shared state.
class ItemScheduler {
public:
  ItemScheduler();
  explicit ItemScheduler(SchedulerConfig config);

  const SchedulerConfig& config() const noexcept { return config_; }

  // State for an item the user has never reviewed; due immediately.
  ReviewState initial_state(const std::string& user_id, const LearningItem& item,
                            Timestamp now) const;

  // Total for any input: out-of-range fields are clamped, never rejected.
  ReviewState schedule(const ReviewState& current, Outcome outcome, Timestamp now) const;

  double growth_factor(double difficulty) const;

private:
  double clamp_difficulty(double difficulty) const;
  double clamp_stability(double stability_days) const;
  void enforce_bounds(ReviewState& state, Timestamp now) const;

  SchedulerConfig config_{};
};

} // namespace sz
