#include "effectiveness.hpp"

#include "sz/errors.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace sz::scoring {

void EffectivenessWeights::validate() const {
  if (accuracy < 0.0 || response < 0.0 || engagement < 0.0) {
    throw ConfigError("effectiveness weights must not be negative");
  }
  if (std::abs(accuracy + response + engagement - 1.0) > 1e-9) {
    throw ConfigError("effectiveness weights must sum to 1");
  }
  if (baseline_latency_ms <= 0) {
    throw ConfigError("baseline_latency_ms must be positive");
  }
  if (weakness_accuracy > strength_accuracy) {
    throw ConfigError("weakness_accuracy must not exceed strength_accuracy");
  }
  if (practice_increase < 0.0 || pacing_multiplier <= 0.0) {
    throw ConfigError("recommendation factors out of range");
  }
}

double outcome_credit(Outcome outcome) {
  switch (outcome) {
    case Outcome::Correct: return 1.0;
    case Outcome::Partial: return 0.5;
    case Outcome::Incorrect: return 0.0;
  }
  return 0.0;
}

double accuracy(const std::deque<InteractionSample>& window) {
  if (window.empty()) {
    return 0.0;
  }
  double credit = 0.0;
  for (const auto& sample : window) {
    credit += outcome_credit(sample.outcome);
  }
  return credit / static_cast<double>(window.size());
}

double response_efficiency(const std::deque<InteractionSample>& window,
                           const EffectivenessWeights& weights) {
  if (window.empty()) {
    return 0.0;
  }
  double latency_sum = 0.0;
  for (const auto& sample : window) {
    latency_sum += static_cast<double>(std::max(0, sample.latency_ms));
  }
  const double avg = latency_sum / static_cast<double>(window.size());
  return std::max(0.0, 1.0 - avg / static_cast<double>(weights.baseline_latency_ms));
}

double engagement(const std::deque<InteractionSample>& window) {
  if (window.empty()) {
    return 0.0;
  }
  double hints = 0.0;
  double attempts = 0.0;
  for (const auto& sample : window) {
    hints += static_cast<double>(std::max(0, sample.hints_used));
    attempts += static_cast<double>(std::max(1, sample.attempts));
  }
  const double n = static_cast<double>(window.size());
  const double avg_hints = hints / n;
  const double avg_attempts = attempts / n;
  return std::max(0.0, 1.0 - avg_hints / 3.0 - (avg_attempts - 1.0) / 2.0);
}

EffectivenessSignal compute_signal(const std::string& domain,
                                   const std::deque<InteractionSample>& window, Timestamp now,
                                   const EffectivenessWeights& weights) {
  EffectivenessSignal signal;
  signal.domain = domain;
  signal.timestamp = now;
  signal.window_size = window.size();
  if (window.empty()) {
    signal.score = 0.5;
    return signal;
  }
  signal.accuracy = accuracy(window);
  signal.response_efficiency = response_efficiency(window, weights);
  signal.engagement = engagement(window);
  signal.score = detail::clip01(weights.accuracy * signal.accuracy +
                                weights.response * signal.response_efficiency +
                                weights.engagement * signal.engagement);
  return signal;
}

double learning_velocity(int correct, Timestamp started_at, Timestamp ended_at) {
  if (correct <= 0 || ended_at <= started_at) {
    return 0.0;
  }
  const double hours =
      static_cast<double>(ended_at - started_at) / static_cast<double>(kMillisPerHour);
  return static_cast<double>(correct) / hours;
}

SessionSummary summarize(const SessionContext& session, Timestamp now,
                         const EffectivenessWeights& weights) {
  SessionSummary summary;
  summary.session_id = session.session_id;
  summary.user_id = session.user_id;
  summary.remaining_queue = session.remaining();

  std::int64_t latency_sum = 0;
  double credit = 0.0;
  for (const auto& [domain, state] : session.domain_states) {
    summary.interactions += state.interactions;
    summary.correct += state.correct;
    summary.partial += state.partial;
    summary.incorrect += state.incorrect;
    latency_sum += state.latency_sum_ms;

    const double domain_credit = static_cast<double>(state.correct) + 0.5 * state.partial;
    credit += domain_credit;

    SessionSummary::DomainReport report;
    report.domain = domain;
    report.score = state.score;
    report.mode = state.mode;
    report.interactions = state.interactions;
    report.accuracy = state.interactions > 0
                          ? domain_credit / static_cast<double>(state.interactions)
                          : 0.0;
    if (state.interactions > 0) {
      if (report.accuracy > weights.strength_accuracy) {
        summary.strengths.push_back("Strong performance in " + domain);
      } else if (report.accuracy < weights.weakness_accuracy) {
        summary.improvement_areas.push_back("Needs improvement in " + domain);
      }
    }
    summary.domains.push_back(std::move(report));
  }

  for (const auto& [kind, stats] : session.kind_stats) {
    if (stats.interactions <= 0) {
      continue;
    }
    SessionSummary::KindReport report;
    report.kind = kind;
    report.interactions = stats.interactions;
    report.conversation_turns = stats.conversation_turns;
    report.accuracy = (static_cast<double>(stats.correct) + 0.5 * stats.partial) /
                      static_cast<double>(stats.interactions);
    report.avg_latency_ms =
        static_cast<double>(stats.latency_sum_ms) / static_cast<double>(stats.interactions);
    summary.conversation_turns += stats.conversation_turns;

    if (report.accuracy > weights.strength_accuracy) {
      summary.strengths.push_back("Strong performance in " + to_string(kind));
      summary.preferred_kinds.push_back(kind);
    } else if (report.accuracy < weights.weakness_accuracy) {
      summary.improvement_areas.push_back("Needs improvement in " + to_string(kind));
      SessionSummary::Recommendation practice;
      practice.type = "additional_practice";
      practice.focus = kind;
      practice.factor = weights.practice_increase;
      summary.recommendations.push_back(std::move(practice));
    }
    summary.kinds.push_back(std::move(report));
  }
  if (summary.preferred_kinds.empty()) {
    summary.preferred_kinds = {ContentKind::Vocabulary, ContentKind::Grammar};
  }

  if (summary.interactions > 0) {
    summary.accuracy = credit / static_cast<double>(summary.interactions);
    summary.avg_latency_ms =
        static_cast<double>(latency_sum) / static_cast<double>(summary.interactions);
    if (summary.avg_latency_ms < weights.quick_latency_ms) {
      summary.strengths.push_back("Quick response time");
    } else if (summary.avg_latency_ms > weights.slow_latency_ms) {
      summary.improvement_areas.push_back("Slow response time");
      SessionSummary::Recommendation pacing;
      pacing.type = "pacing_adjustment";
      pacing.factor = weights.pacing_multiplier;
      summary.recommendations.push_back(std::move(pacing));
    }
  }
  summary.learning_velocity = learning_velocity(summary.correct, session.started_at, now);
  return summary;
}

} // namespace sz::scoring
