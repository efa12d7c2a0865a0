#pragma once

#include "sz/types.hpp"

#include <deque>
#include <string>
#include <vector>

namespace sz::scoring {

struct EffectivenessWeights {
  double accuracy = 0.5;
  double response = 0.3;
  double engagement = 0.2;
  // Latency at which response efficiency reaches zero.
  int baseline_latency_ms = 30000;
  // Session-level strengths/weaknesses cut-offs.
  double strength_accuracy = 0.8;
  double weakness_accuracy = 0.6;
  int quick_latency_ms = 10000;
  int slow_latency_ms = 30000;
  // Recommendation factors: extra practice share for a weak content kind and
  // the pacing multiplier for slow responses.
  double practice_increase = 0.3;
  double pacing_multiplier = 0.8;

  void validate() const;
};

// Correct counts 1, partial 0.5, incorrect 0.
double outcome_credit(Outcome outcome);

double accuracy(const std::deque<InteractionSample>& window);
double response_efficiency(const std::deque<InteractionSample>& window,
                           const EffectivenessWeights& weights = {});
double engagement(const std::deque<InteractionSample>& window);

// Neutral 0.5 for an empty window.
EffectivenessSignal compute_signal(const std::string& domain,
                                   const std::deque<InteractionSample>& window,
                                   Timestamp now,
                                   const EffectivenessWeights& weights = {});

// Correct answers per hour of elapsed session time.
double learning_velocity(int correct, Timestamp started_at, Timestamp ended_at);

SessionSummary summarize(const SessionContext& session, Timestamp now,
                         const EffectivenessWeights& weights = {});

} // namespace sz::scoring
