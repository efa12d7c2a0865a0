#include "json_bridge.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace sz::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj.at(key);
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key)) {
    throw std::invalid_argument("Missing field '" + std::string(key) + "'");
  }
  return obj.at(key);
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<int>();
  }
  if (value.is_number_float()) {
    return static_cast<int>(std::lround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::int64_t json_to_int64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    return static_cast<std::int64_t>(std::llround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::uint64_t json_to_uint64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_unsigned()) {
    return value.get<std::uint64_t>();
  }
  const auto raw = json_to_int64(value, key);
  if (raw < 0) {
    throw std::invalid_argument("Expected non-negative integer for field '" + std::string(key) +
                                "'");
  }
  return static_cast<std::uint64_t>(raw);
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const int v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<std::string> json_to_string_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& element : value) {
    out.push_back(json_to_string(element, key));
  }
  return out;
}

nlohmann::json strings_to_json_array(const std::vector<std::string>& values) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& v : values) {
    arr.push_back(v);
  }
  return arr;
}

nlohmann::json to_json(const InteractionSample& sample) {
  nlohmann::json json = nlohmann::json::object();
  json["outcome"] = to_string(sample.outcome);
  json["latency_ms"] = sample.latency_ms;
  json["hints_used"] = sample.hints_used;
  json["attempts"] = sample.attempts;
  return json;
}

InteractionSample interaction_sample_from_json(const nlohmann::json& json) {
  InteractionSample sample;
  sample.outcome = outcome_from_string(json_to_string(require_field(json, "outcome"), "outcome"));
  sample.latency_ms = json_to_int(require_field(json, "latency_ms"), "latency_ms");
  assign_if_present(json, "hints_used", [&](const nlohmann::json& v) {
    sample.hints_used = json_to_int(v, "hints_used");
  });
  assign_if_present(json, "attempts", [&](const nlohmann::json& v) {
    sample.attempts = json_to_int(v, "attempts");
  });
  return sample;
}

nlohmann::json to_json(const QueueEntry& entry) {
  nlohmann::json json = nlohmann::json::object();
  json["item"] = bridge::to_json(entry.item);
  json["next_due"] = entry.next_due;
  json["stability_days"] = entry.stability_days;
  json["injected"] = entry.injected;
  json["injected_at"] = entry.injected_at;
  return json;
}

QueueEntry queue_entry_from_json(const nlohmann::json& json) {
  QueueEntry entry;
  entry.item = learning_item_from_json(require_field(json, "item"));
  entry.next_due = json_to_int64(require_field(json, "next_due"), "next_due");
  entry.stability_days = json_to_double(require_field(json, "stability_days"), "stability_days");
  assign_if_present(json, "injected", [&](const nlohmann::json& v) {
    entry.injected = json_to_bool(v, "injected");
  });
  assign_if_present(json, "injected_at", [&](const nlohmann::json& v) {
    entry.injected_at = json_to_int64(v, "injected_at");
  });
  return entry;
}

nlohmann::json to_json(const DomainState& state) {
  nlohmann::json json = nlohmann::json::object();
  json["mode"] = to_string(state.mode);
  nlohmann::json window = nlohmann::json::array();
  for (const auto& sample : state.window) {
    window.push_back(to_json(sample));
  }
  json["window"] = std::move(window);
  json["score"] = state.score;
  json["high_streak"] = state.high_streak;
  json["recovery_streak"] = state.recovery_streak;
  json["level"] = state.level;
  json["interactions"] = state.interactions;
  json["correct"] = state.correct;
  json["partial"] = state.partial;
  json["incorrect"] = state.incorrect;
  json["latency_sum_ms"] = state.latency_sum_ms;
  return json;
}

DomainState domain_state_from_json(const nlohmann::json& json) {
  DomainState state;
  state.mode = domain_mode_from_string(json_to_string(require_field(json, "mode"), "mode"));
  const auto& window = require_field(json, "window");
  if (!window.is_array()) {
    throw std::invalid_argument("Expected array for field 'window'");
  }
  for (const auto& sample : window) {
    state.window.push_back(interaction_sample_from_json(sample));
  }
  state.score = json_to_double(require_field(json, "score"), "score");
  state.high_streak = json_to_int(require_field(json, "high_streak"), "high_streak");
  state.recovery_streak = json_to_int(require_field(json, "recovery_streak"), "recovery_streak");
  state.level = json_to_double(require_field(json, "level"), "level");
  state.interactions = json_to_int(require_field(json, "interactions"), "interactions");
  state.correct = json_to_int(require_field(json, "correct"), "correct");
  state.partial = json_to_int(require_field(json, "partial"), "partial");
  state.incorrect = json_to_int(require_field(json, "incorrect"), "incorrect");
  state.latency_sum_ms = json_to_int64(require_field(json, "latency_sum_ms"), "latency_sum_ms");
  return state;
}

nlohmann::json kind_stats_to_json(const KindStats& stats) {
  nlohmann::json json = nlohmann::json::object();
  json["interactions"] = stats.interactions;
  json["correct"] = stats.correct;
  json["partial"] = stats.partial;
  json["incorrect"] = stats.incorrect;
  json["conversation_turns"] = stats.conversation_turns;
  json["latency_sum_ms"] = stats.latency_sum_ms;
  return json;
}

KindStats kind_stats_from_json(const nlohmann::json& json_stats) {
  if (!json_stats.is_object()) {
    throw std::invalid_argument("Expected object for content kind statistics");
  }
  KindStats stats;
  assign_if_present(json_stats, "interactions", [&](const nlohmann::json& v) {
    stats.interactions = json_to_int(v, "interactions");
  });
  assign_if_present(json_stats, "correct", [&](const nlohmann::json& v) {
    stats.correct = json_to_int(v, "correct");
  });
  assign_if_present(json_stats, "partial", [&](const nlohmann::json& v) {
    stats.partial = json_to_int(v, "partial");
  });
  assign_if_present(json_stats, "incorrect", [&](const nlohmann::json& v) {
    stats.incorrect = json_to_int(v, "incorrect");
  });
  assign_if_present(json_stats, "conversation_turns", [&](const nlohmann::json& v) {
    stats.conversation_turns = json_to_int(v, "conversation_turns");
  });
  assign_if_present(json_stats, "latency_sum_ms", [&](const nlohmann::json& v) {
    stats.latency_sum_ms = json_to_int64(v, "latency_sum_ms");
  });
  return stats;
}

} // namespace

nlohmann::json to_json(const LearningItem& item) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = item.id;
  json["domains"] = strings_to_json_array(item.domains);
  json["base_difficulty"] = item.base_difficulty;
  json["payload_ref"] = item.payload_ref;
  json["kind"] = to_string(item.kind);
  return json;
}

LearningItem learning_item_from_json(const nlohmann::json& json_item) {
  LearningItem item;
  item.id = json_to_string(require_field(json_item, "id"), "id");
  item.domains = json_to_string_vector(require_field(json_item, "domains"), "domains");
  if (item.domains.empty()) {
    throw std::invalid_argument("Learning item '" + item.id + "' has no domains");
  }
  assign_if_present(json_item, "base_difficulty", [&](const nlohmann::json& v) {
    item.base_difficulty = json_to_double(v, "base_difficulty");
  });
  assign_if_present(json_item, "payload_ref", [&](const nlohmann::json& v) {
    item.payload_ref = json_to_string(v, "payload_ref");
  });
  assign_if_present(json_item, "kind", [&](const nlohmann::json& v) {
    item.kind = content_kind_from_string(json_to_string(v, "kind"));
  });
  return item;
}

nlohmann::json to_json(const ReviewState& state) {
  nlohmann::json json = nlohmann::json::object();
  json["user_id"] = state.user_id;
  json["item_id"] = state.item_id;
  json["repetitions"] = state.repetitions;
  json["stability_days"] = state.stability_days;
  json["difficulty"] = state.difficulty;
  json["last_reviewed"] =
      state.last_reviewed.has_value() ? nlohmann::json(*state.last_reviewed) : nlohmann::json(nullptr);
  json["next_due"] = state.next_due;
  json["lapses"] = state.lapses;
  json["version"] = state.version;
  return json;
}

ReviewState review_state_from_json(const nlohmann::json& json_state) {
  ReviewState state;
  state.user_id = json_to_string(require_field(json_state, "user_id"), "user_id");
  state.item_id = json_to_string(require_field(json_state, "item_id"), "item_id");
  state.repetitions = json_to_int(require_field(json_state, "repetitions"), "repetitions");
  state.stability_days =
      json_to_double(require_field(json_state, "stability_days"), "stability_days");
  state.difficulty = json_to_double(require_field(json_state, "difficulty"), "difficulty");
  assign_if_present(json_state, "last_reviewed", [&](const nlohmann::json& v) {
    state.last_reviewed = json_to_int64(v, "last_reviewed");
  });
  state.next_due = json_to_int64(require_field(json_state, "next_due"), "next_due");
  state.lapses = json_to_int(require_field(json_state, "lapses"), "lapses");
  assign_if_present(json_state, "version", [&](const nlohmann::json& v) {
    state.version = json_to_uint64(v, "version");
  });
  return state;
}

nlohmann::json to_json(const InteractionEvent& event) {
  nlohmann::json json = nlohmann::json::object();
  json["session_id"] = event.session_id;
  json["item_id"] = event.item_id;
  json["outcome"] = to_string(event.outcome);
  json["latency_ms"] = event.latency_ms;
  json["timestamp"] = event.timestamp;
  json["kind"] = to_string(event.kind);
  json["cursor"] = event.cursor.has_value() ? nlohmann::json(*event.cursor) : nlohmann::json(nullptr);
  json["hints_used"] = event.hints_used;
  json["attempts"] = event.attempts;
  return json;
}

InteractionEvent interaction_event_from_json(const nlohmann::json& json_event) {
  InteractionEvent event;
  assign_if_present(json_event, "session_id", [&](const nlohmann::json& v) {
    event.session_id = json_to_string(v, "session_id");
  });
  event.item_id = json_to_string(require_field(json_event, "item_id"), "item_id");
  event.outcome =
      outcome_from_string(json_to_string(require_field(json_event, "outcome"), "outcome"));
  assign_if_present(json_event, "latency_ms", [&](const nlohmann::json& v) {
    event.latency_ms = json_to_int(v, "latency_ms");
  });
  assign_if_present(json_event, "timestamp", [&](const nlohmann::json& v) {
    event.timestamp = json_to_int64(v, "timestamp");
  });
  assign_if_present(json_event, "kind", [&](const nlohmann::json& v) {
    event.kind = interaction_kind_from_string(json_to_string(v, "kind"));
  });
  assign_if_present(json_event, "cursor", [&](const nlohmann::json& v) {
    event.cursor = static_cast<std::size_t>(json_to_uint64(v, "cursor"));
  });
  assign_if_present(json_event, "hints_used", [&](const nlohmann::json& v) {
    event.hints_used = json_to_int(v, "hints_used");
  });
  assign_if_present(json_event, "attempts", [&](const nlohmann::json& v) {
    event.attempts = json_to_int(v, "attempts");
  });
  return event;
}

nlohmann::json to_json(const EffectivenessSignal& signal) {
  nlohmann::json json = nlohmann::json::object();
  json["domain"] = signal.domain;
  json["score"] = signal.score;
  json["accuracy"] = signal.accuracy;
  json["response_efficiency"] = signal.response_efficiency;
  json["engagement"] = signal.engagement;
  json["window_size"] = signal.window_size;
  json["timestamp"] = signal.timestamp;
  return json;
}

EffectivenessSignal effectiveness_signal_from_json(const nlohmann::json& json_signal) {
  EffectivenessSignal signal;
  signal.domain = json_to_string(require_field(json_signal, "domain"), "domain");
  signal.score = json_to_double(require_field(json_signal, "score"), "score");
  assign_if_present(json_signal, "accuracy", [&](const nlohmann::json& v) {
    signal.accuracy = json_to_double(v, "accuracy");
  });
  assign_if_present(json_signal, "response_efficiency", [&](const nlohmann::json& v) {
    signal.response_efficiency = json_to_double(v, "response_efficiency");
  });
  assign_if_present(json_signal, "engagement", [&](const nlohmann::json& v) {
    signal.engagement = json_to_double(v, "engagement");
  });
  assign_if_present(json_signal, "window_size", [&](const nlohmann::json& v) {
    signal.window_size = static_cast<std::size_t>(json_to_uint64(v, "window_size"));
  });
  assign_if_present(json_signal, "timestamp", [&](const nlohmann::json& v) {
    signal.timestamp = json_to_int64(v, "timestamp");
  });
  return signal;
}

nlohmann::json to_json(const SessionContext& session) {
  nlohmann::json json = nlohmann::json::object();
  json["schema"] = kSchemaVersion;
  json["session_id"] = session.session_id;
  json["user_id"] = session.user_id;
  json["domains"] = strings_to_json_array(session.domains);
  json["status"] = to_string(session.status);
  nlohmann::json queue = nlohmann::json::array();
  for (const auto& entry : session.queue) {
    queue.push_back(to_json(entry));
  }
  json["queue"] = std::move(queue);
  json["cursor"] = session.cursor;
  json["interaction_count"] = session.interaction_count;
  nlohmann::json effectiveness = nlohmann::json::object();
  for (const auto& [domain, score] : session.effectiveness) {
    effectiveness[domain] = score;
  }
  json["effectiveness"] = std::move(effectiveness);
  nlohmann::json domain_states = nlohmann::json::object();
  for (const auto& [domain, state] : session.domain_states) {
    domain_states[domain] = to_json(state);
  }
  json["domain_states"] = std::move(domain_states);
  nlohmann::json kind_stats = nlohmann::json::object();
  for (const auto& [kind, stats] : session.kind_stats) {
    kind_stats[to_string(kind)] = kind_stats_to_json(stats);
  }
  json["kind_stats"] = std::move(kind_stats);
  json["extra_curricular"] = session.extra_curricular;
  json["started_at"] = session.started_at;
  json["updated_at"] = session.updated_at;
  return json;
}

SessionContext session_context_from_json(const nlohmann::json& json_session) {
  if (json_session.contains("schema") &&
      json_to_string(json_session.at("schema"), "schema") != kSchemaVersion) {
    throw std::invalid_argument("Unsupported session schema: " +
                                json_session.at("schema").get<std::string>());
  }
  SessionContext session;
  session.session_id = json_to_string(require_field(json_session, "session_id"), "session_id");
  session.user_id = json_to_string(require_field(json_session, "user_id"), "user_id");
  session.domains = json_to_string_vector(require_field(json_session, "domains"), "domains");
  session.status =
      session_status_from_string(json_to_string(require_field(json_session, "status"), "status"));
  const auto& queue = require_field(json_session, "queue");
  if (!queue.is_array()) {
    throw std::invalid_argument("Expected array for field 'queue'");
  }
  for (const auto& entry : queue) {
    session.queue.push_back(queue_entry_from_json(entry));
  }
  session.cursor =
      static_cast<std::size_t>(json_to_uint64(require_field(json_session, "cursor"), "cursor"));
  session.interaction_count =
      json_to_int(require_field(json_session, "interaction_count"), "interaction_count");
  assign_if_present(json_session, "effectiveness", [&](const nlohmann::json& v) {
    for (const auto& [domain, score] : v.items()) {
      session.effectiveness[domain] = json_to_double(score, "effectiveness");
    }
  });
  assign_if_present(json_session, "domain_states", [&](const nlohmann::json& v) {
    for (const auto& [domain, state] : v.items()) {
      session.domain_states[domain] = domain_state_from_json(state);
    }
  });
  assign_if_present(json_session, "kind_stats", [&](const nlohmann::json& v) {
    for (const auto& [kind, stats] : v.items()) {
      session.kind_stats[content_kind_from_string(kind)] = kind_stats_from_json(stats);
    }
  });
  assign_if_present(json_session, "extra_curricular", [&](const nlohmann::json& v) {
    session.extra_curricular = json_to_bool(v, "extra_curricular");
  });
  assign_if_present(json_session, "started_at", [&](const nlohmann::json& v) {
    session.started_at = json_to_int64(v, "started_at");
  });
  assign_if_present(json_session, "updated_at", [&](const nlohmann::json& v) {
    session.updated_at = json_to_int64(v, "updated_at");
  });
  return session;
}

nlohmann::json to_json(const AdaptationHint& hint) {
  nlohmann::json json = nlohmann::json::object();
  json["domain"] = hint.domain;
  json["mode"] = to_string(hint.mode);
  json["action"] = to_string(hint.action);
  json["injected_item_ids"] = strings_to_json_array(hint.injected_item_ids);
  json["degraded"] = hint.degraded;
  json["signal"] = hint.signal;
  return json;
}

AdaptationHint adaptation_hint_from_json(const nlohmann::json& json_hint) {
  AdaptationHint hint;
  hint.domain = json_to_string(require_field(json_hint, "domain"), "domain");
  hint.mode = domain_mode_from_string(json_to_string(require_field(json_hint, "mode"), "mode"));
  hint.action =
      adaptation_action_from_string(json_to_string(require_field(json_hint, "action"), "action"));
  assign_if_present(json_hint, "injected_item_ids", [&](const nlohmann::json& v) {
    hint.injected_item_ids = json_to_string_vector(v, "injected_item_ids");
  });
  assign_if_present(json_hint, "degraded", [&](const nlohmann::json& v) {
    hint.degraded = json_to_bool(v, "degraded");
  });
  assign_if_present(json_hint, "signal", [&](const nlohmann::json& v) {
    hint.signal = json_to_double(v, "signal");
  });
  return hint;
}

nlohmann::json to_json(const InteractResponse& response) {
  nlohmann::json json = nlohmann::json::object();
  json["schema"] = kSchemaVersion;
  json["session_id"] = response.session_id;
  json["next_item"] =
      response.next_item.has_value() ? to_json(*response.next_item) : nlohmann::json(nullptr);
  json["hint"] = to_json(response.hint);
  json["signal"] =
      response.signal.has_value() ? to_json(*response.signal) : nlohmann::json(nullptr);
  json["cursor"] = response.cursor;
  json["remaining"] = response.remaining;
  json["read_only"] = response.read_only;
  return json;
}

nlohmann::json to_json(const SessionSummary& summary) {
  nlohmann::json json = nlohmann::json::object();
  json["schema"] = kSchemaVersion;
  json["session_id"] = summary.session_id;
  json["user_id"] = summary.user_id;

  nlohmann::json totals = nlohmann::json::object();
  totals["interactions"] = summary.interactions;
  totals["correct"] = summary.correct;
  totals["partial"] = summary.partial;
  totals["incorrect"] = summary.incorrect;
  totals["accuracy"] = summary.accuracy;
  totals["avg_latency_ms"] = summary.avg_latency_ms;
  totals["learning_velocity"] = summary.learning_velocity;
  json["totals"] = std::move(totals);

  nlohmann::json by_domain = nlohmann::json::array();
  for (const auto& report : summary.domains) {
    nlohmann::json entry = nlohmann::json::object();
    entry["domain"] = report.domain;
    entry["score"] = report.score;
    entry["mode"] = to_string(report.mode);
    entry["interactions"] = report.interactions;
    entry["accuracy"] = report.accuracy;
    by_domain.push_back(std::move(entry));
  }
  json["by_domain"] = std::move(by_domain);

  nlohmann::json by_kind = nlohmann::json::array();
  for (const auto& report : summary.kinds) {
    nlohmann::json entry = nlohmann::json::object();
    entry["kind"] = to_string(report.kind);
    entry["interactions"] = report.interactions;
    entry["conversation_turns"] = report.conversation_turns;
    entry["accuracy"] = report.accuracy;
    entry["avg_latency_ms"] = report.avg_latency_ms;
    by_kind.push_back(std::move(entry));
  }
  json["by_kind"] = std::move(by_kind);
  json["conversation_turns"] = summary.conversation_turns;
  json["strengths"] = strings_to_json_array(summary.strengths);
  json["improvement_areas"] = strings_to_json_array(summary.improvement_areas);

  nlohmann::json recommendations = nlohmann::json::array();
  for (const auto& recommendation : summary.recommendations) {
    nlohmann::json entry = nlohmann::json::object();
    entry["type"] = recommendation.type;
    entry["focus"] = recommendation.focus.has_value() ? nlohmann::json(to_string(*recommendation.focus))
                                                      : nlohmann::json(nullptr);
    entry["factor"] = recommendation.factor;
    recommendations.push_back(std::move(entry));
  }
  json["recommendations"] = std::move(recommendations);
  nlohmann::json preferred = nlohmann::json::array();
  for (auto kind : summary.preferred_kinds) {
    preferred.push_back(to_string(kind));
  }
  json["preferred_kinds"] = std::move(preferred);
  json["remaining_queue"] = summary.remaining_queue;
  json["degraded"] = summary.degraded;
  return json;
}

} // namespace sz::bridge
