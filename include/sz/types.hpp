#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sz {

// Milliseconds since the Unix epoch.
using Timestamp = std::int64_t;

constexpr Timestamp kMillisPerSecond = 1000;
constexpr Timestamp kMillisPerMinute = 60 * kMillisPerSecond;
constexpr Timestamp kMillisPerHour = 60 * kMillisPerMinute;
constexpr Timestamp kMillisPerDay = 24 * kMillisPerHour;

inline Timestamp now_millis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

namespace detail {

inline double clip01(double value) {
  return std::clamp(value, 0.0, 1.0);
}

inline Timestamp days_to_millis(double days) {
  return static_cast<Timestamp>(days * static_cast<double>(kMillisPerDay));
}

} // namespace detail

enum class Outcome {
  Correct,
  Incorrect,
  Partial
};

inline std::string to_string(Outcome outcome) {
  switch (outcome) {
    case Outcome::Correct: return "correct";
    case Outcome::Incorrect: return "incorrect";
    case Outcome::Partial: return "partial";
  }
  return "incorrect";
}

inline Outcome outcome_from_string(const std::string& value) {
  if (value == "correct") {
    return Outcome::Correct;
  }
  if (value == "incorrect") {
    return Outcome::Incorrect;
  }
  if (value == "partial") {
    return Outcome::Partial;
  }
  throw std::invalid_argument("Unknown outcome: " + value);
}

enum class ContentKind {
  Vocabulary,
  Grammar,
  Conversation,
  Listening,
  Reading,
  Writing
};

inline std::string to_string(ContentKind kind) {
  switch (kind) {
    case ContentKind::Vocabulary: return "vocabulary";
    case ContentKind::Grammar: return "grammar";
    case ContentKind::Conversation: return "conversation";
    case ContentKind::Listening: return "listening";
    case ContentKind::Reading: return "reading";
    case ContentKind::Writing: return "writing";
  }
  return "vocabulary";
}

inline ContentKind content_kind_from_string(const std::string& value) {
  if (value == "vocabulary") return ContentKind::Vocabulary;
  if (value == "grammar") return ContentKind::Grammar;
  if (value == "conversation") return ContentKind::Conversation;
  if (value == "listening") return ContentKind::Listening;
  if (value == "reading") return ContentKind::Reading;
  if (value == "writing") return ContentKind::Writing;
  throw std::invalid_argument("Unknown content kind: " + value);
}

enum class InteractionKind {
  Answer,
  ConversationTurn
};

inline std::string to_string(InteractionKind kind) {
  switch (kind) {
    case InteractionKind::Answer: return "answer";
    case InteractionKind::ConversationTurn: return "conversation_turn";
  }
  return "answer";
}

inline InteractionKind interaction_kind_from_string(const std::string& value) {
  if (value == "answer") {
    return InteractionKind::Answer;
  }
  if (value == "conversation_turn") {
    return InteractionKind::ConversationTurn;
  }
  throw std::invalid_argument("Unknown interaction kind: " + value);
}

enum class SessionStatus {
  Active,
  Paused,
  Completed
};

inline std::string to_string(SessionStatus status) {
  switch (status) {
    case SessionStatus::Active: return "active";
    case SessionStatus::Paused: return "paused";
    case SessionStatus::Completed: return "completed";
  }
  return "active";
}

inline SessionStatus session_status_from_string(const std::string& value) {
  if (value == "active") return SessionStatus::Active;
  if (value == "paused") return SessionStatus::Paused;
  if (value == "completed") return SessionStatus::Completed;
  throw std::invalid_argument("Unknown session status: " + value);
}

enum class DomainMode {
  Nominal,
  Struggling,
  Accelerating
};

inline std::string to_string(DomainMode mode) {
  switch (mode) {
    case DomainMode::Nominal: return "nominal";
    case DomainMode::Struggling: return "struggling";
    case DomainMode::Accelerating: return "accelerating";
  }
  return "nominal";
}

inline DomainMode domain_mode_from_string(const std::string& value) {
  if (value == "nominal") return DomainMode::Nominal;
  if (value == "struggling") return DomainMode::Struggling;
  if (value == "accelerating") return DomainMode::Accelerating;
  throw std::invalid_argument("Unknown domain mode: " + value);
}

enum class AdaptationAction {
  Hold,
  Escalate,
  Remediate,
  Recover
};

inline std::string to_string(AdaptationAction action) {
  switch (action) {
    case AdaptationAction::Hold: return "hold";
    case AdaptationAction::Escalate: return "escalate";
    case AdaptationAction::Remediate: return "remediate";
    case AdaptationAction::Recover: return "recover";
  }
  return "hold";
}

inline AdaptationAction adaptation_action_from_string(const std::string& value) {
  if (value == "hold") return AdaptationAction::Hold;
  if (value == "escalate") return AdaptationAction::Escalate;
  if (value == "remediate") return AdaptationAction::Remediate;
  if (value == "recover") return AdaptationAction::Recover;
  throw std::invalid_argument("Unknown adaptation action: " + value);
}

struct LearningItem {
  std::string id;
  std::vector<std::string> domains;
  double base_difficulty = 0.5;
  std::string payload_ref;
  ContentKind kind = ContentKind::Vocabulary;

  const std::string& primary_domain() const {
    if (domains.empty()) {
      throw std::logic_error("LearningItem '" + id + "' has no skill domain");
    }
    return domains.front();
  }

  bool in_domain(const std::string& domain) const {
    return std::find(domains.begin(), domains.end(), domain) != domains.end();
  }

  bool operator==(const LearningItem& other) const {
    return id == other.id && domains == other.domains &&
           base_difficulty == other.base_difficulty &&
           payload_ref == other.payload_ref && kind == other.kind;
  }
};

struct ReviewState {
  std::string user_id;
  std::string item_id;
  int repetitions = 0;
  double stability_days = 0.0;
  double difficulty = 1.0;
  std::optional<Timestamp> last_reviewed;
  Timestamp next_due = 0;
  int lapses = 0;
  std::uint64_t version = 0;

  bool operator==(const ReviewState& other) const {
    return user_id == other.user_id && item_id == other.item_id &&
           repetitions == other.repetitions && stability_days == other.stability_days &&
           difficulty == other.difficulty && last_reviewed == other.last_reviewed &&
           next_due == other.next_due && lapses == other.lapses && version == other.version;
  }
};

struct InteractionEvent {
  std::string session_id;
  std::string item_id;
  Outcome outcome = Outcome::Incorrect;
  int latency_ms = 0;
  Timestamp timestamp = 0;
  InteractionKind kind = InteractionKind::Answer;
  std::optional<std::size_t> cursor;
  int hints_used = 0;
  int attempts = 1;
};

// One entry of a domain's sliding window.
struct InteractionSample {
  Outcome outcome = Outcome::Incorrect;
  int latency_ms = 0;
  int hints_used = 0;
  int attempts = 1;

  bool operator==(const InteractionSample& other) const {
    return outcome == other.outcome && latency_ms == other.latency_ms &&
           hints_used == other.hints_used && attempts == other.attempts;
  }
};

struct EffectivenessSignal {
  std::string domain;
  double score = 0.5;
  double accuracy = 0.0;
  double response_efficiency = 0.0;
  double engagement = 0.0;
  std::size_t window_size = 0;
  Timestamp timestamp = 0;
};

struct QueueEntry {
  LearningItem item;
  Timestamp next_due = 0;
  double stability_days = 0.0;
  bool injected = false;
  Timestamp injected_at = 0;

  Timestamp effective_due() const { return injected ? injected_at : next_due; }

  bool operator==(const QueueEntry& other) const {
    return item == other.item && next_due == other.next_due &&
           stability_days == other.stability_days && injected == other.injected &&
           injected_at == other.injected_at;
  }
};

struct DomainState {
  DomainMode mode = DomainMode::Nominal;
  std::deque<InteractionSample> window;
  double score = 0.5;
  int high_streak = 0;
  int recovery_streak = 0;
  double level = 0.5;
  int interactions = 0;
  int correct = 0;
  int partial = 0;
  int incorrect = 0;
  std::int64_t latency_sum_ms = 0;

  bool operator==(const DomainState& other) const {
    return mode == other.mode && window == other.window && score == other.score &&
           high_streak == other.high_streak && recovery_streak == other.recovery_streak &&
           level == other.level && interactions == other.interactions &&
           correct == other.correct && partial == other.partial &&
           incorrect == other.incorrect && latency_sum_ms == other.latency_sum_ms;
  }
};

// Session tallies for one content kind. Conversation turns count toward
// ContentKind::Conversation whatever kind the answered item carries.
struct KindStats {
  int interactions = 0;
  int correct = 0;
  int partial = 0;
  int incorrect = 0;
  int conversation_turns = 0;
  std::int64_t latency_sum_ms = 0;

  bool operator==(const KindStats& other) const {
    return interactions == other.interactions && correct == other.correct &&
           partial == other.partial && incorrect == other.incorrect &&
           conversation_turns == other.conversation_turns &&
           latency_sum_ms == other.latency_sum_ms;
  }
  bool operator!=(const KindStats& other) const { return !(*this == other); }
};

struct SessionContext {
  std::string session_id;
  std::string user_id;
  std::vector<std::string> domains;
  SessionStatus status = SessionStatus::Active;
  std::vector<QueueEntry> queue;
  std::size_t cursor = 0;
  int interaction_count = 0;
  std::map<std::string, double> effectiveness;
  std::map<std::string, DomainState> domain_states;
  std::map<ContentKind, KindStats> kind_stats;
  bool extra_curricular = false;
  Timestamp started_at = 0;
  Timestamp updated_at = 0;

  std::size_t remaining() const { return cursor < queue.size() ? queue.size() - cursor : 0; }

  bool operator==(const SessionContext& other) const {
    return session_id == other.session_id && user_id == other.user_id &&
           domains == other.domains && status == other.status && queue == other.queue &&
           cursor == other.cursor && interaction_count == other.interaction_count &&
           effectiveness == other.effectiveness && domain_states == other.domain_states &&
           kind_stats == other.kind_stats && extra_curricular == other.extra_curricular && started_at == other.started_at &&
           updated_at == other.updated_at;
  }
  bool operator!=(const SessionContext& other) const { return !(*this == other); }
};

struct AdaptationHint {
  std::string domain;
  DomainMode mode = DomainMode::Nominal;
  AdaptationAction action = AdaptationAction::Hold;
  std::vector<std::string> injected_item_ids;
  bool degraded = false;
  double signal = 0.5;
};

struct InteractResponse {
  std::string session_id;
  std::optional<LearningItem> next_item;
  AdaptationHint hint;
  std::optional<EffectivenessSignal> signal;
  std::size_t cursor = 0;
  std::size_t remaining = 0;
  bool read_only = false;
};

struct SessionSummary {
  std::string session_id;
  std::string user_id;
  int interactions = 0;
  int correct = 0;
  int partial = 0;
  int incorrect = 0;
  double accuracy = 0.0;
  double avg_latency_ms = 0.0;
  double learning_velocity = 0.0;

  struct DomainReport {
    std::string domain;
    double score = 0.5;
    DomainMode mode = DomainMode::Nominal;
    int interactions = 0;
    double accuracy = 0.0;
  };
  std::vector<DomainReport> domains;

  struct KindReport {
    ContentKind kind = ContentKind::Vocabulary;
    int interactions = 0;
    int conversation_turns = 0;
    double accuracy = 0.0;
    double avg_latency_ms = 0.0;
  };
  std::vector<KindReport> kinds;
  int conversation_turns = 0;

  std::vector<std::string> strengths;
  std::vector<std::string> improvement_areas;

  // "additional_practice" with a focus kind, or "pacing_adjustment".
  struct Recommendation {
    std::string type;
    std::optional<ContentKind> focus;
    // Extra practice share, or the pacing multiplier.
    double factor = 1.0;
  };
  std::vector<Recommendation> recommendations;
  // Kinds the learner did well on; vocabulary and grammar when none stand out.
  std::vector<ContentKind> preferred_kinds;
  std::size_t remaining_queue = 0;
  bool degraded = false;
};

} // namespace sz
