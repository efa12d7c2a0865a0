#include "sz/config.hpp"
#include "sz/errors.hpp"

#include "json_bridge.hpp"
#include "test_support.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

using sz::testing::kEpoch;
using sz::testing::make_item;
using sz::testing::TestSuite;

namespace {

sz::SessionContext sample_session() {
  sz::SessionContext session;
  session.session_id = "sess-abc-1";
  session.user_id = "learner";
  session.domains = {"greetings", "tones"};
  session.status = sz::SessionStatus::Paused;
  session.extra_curricular = true;
  session.started_at = kEpoch;
  session.updated_at = kEpoch + 5000;
  session.cursor = 1;
  session.interaction_count = 1;

  sz::QueueEntry answered;
  answered.item = make_item("ni-hao", "greetings", 0.25, sz::ContentKind::Conversation);
  answered.next_due = kEpoch + sz::kMillisPerDay;
  answered.stability_days = 1.0;
  session.queue.push_back(answered);

  sz::QueueEntry injected;
  injected.item = make_item("ma-ma", "tones", 0.7, sz::ContentKind::Listening);
  injected.item.domains.push_back("greetings");
  injected.next_due = kEpoch;
  injected.injected = true;
  injected.injected_at = kEpoch + 4000;
  session.queue.push_back(injected);

  sz::DomainState state;
  state.mode = sz::DomainMode::Struggling;
  sz::InteractionSample s;
  s.outcome = sz::Outcome::Partial;
  s.latency_ms = 3100;
  s.hints_used = 1;
  s.attempts = 2;
  state.window.push_back(s);
  state.score = 0.1234567890123;
  state.recovery_streak = 1;
  state.level = 0.3;
  state.interactions = 1;
  state.partial = 1;
  state.latency_sum_ms = 3100;
  session.domain_states["greetings"] = state;
  session.effectiveness["greetings"] = state.score;
  session.domain_states["tones"] = sz::DomainState{};

  sz::KindStats turns;
  turns.interactions = 1;
  turns.partial = 1;
  turns.conversation_turns = 1;
  turns.latency_sum_ms = 3100;
  session.kind_stats[sz::ContentKind::Conversation] = turns;
  return session;
}

template <typename Fn>
bool throws_invalid(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  TestSuite suite;

  {
    auto session = sample_session();
    auto json = sz::bridge::to_json(session);
    suite.require(json["schema"] == sz::bridge::kSchemaVersion, "Session carries schema tag");
    auto restored = sz::bridge::session_context_from_json(nlohmann::json::parse(json.dump()));
    suite.require(restored == session, "Session survives a text round trip");
    suite.require(json["queue"][0]["item"]["id"] == "ni-hao" &&
                      json["queue"][1]["item"]["kind"] == "listening",
                  "Queue entries embed their items");
    suite.require(json["kind_stats"]["conversation"]["conversation_turns"] == 1,
                  "Content kind tallies keyed by kind name");

    json.erase("kind_stats");
    auto older = sz::bridge::session_context_from_json(json);
    suite.require(older.kind_stats.empty() && older.queue == session.queue,
                  "Documents without kind tallies still load");
  }

  {
    auto json = sz::bridge::to_json(sample_session());
    json["schema"] = "sz/v0";
    suite.require(throws_invalid([&] { sz::bridge::session_context_from_json(json); }),
                  "Foreign schema rejected");
  }

  {
    sz::ReviewState state;
    state.user_id = "u";
    state.item_id = "i";
    state.repetitions = 3;
    state.stability_days = 4.8125;
    state.difficulty = 1.35;
    state.next_due = kEpoch + 7;
    state.lapses = 1;
    state.version = 12;
    auto json = sz::bridge::to_json(state);
    suite.require(json["last_reviewed"].is_null(), "Missing last_reviewed is null");
    auto restored = sz::bridge::review_state_from_json(json);
    suite.require(restored == state, "ReviewState round trip");
  }

  // Minimal caller event: defaults fill the optional fields.
  {
    auto json = nlohmann::json::parse(R"({"item_id":"ni-hao","outcome":"partial","latency_ms":1800})");
    auto event = sz::bridge::interaction_event_from_json(json);
    suite.require(event.item_id == "ni-hao", "Item id read");
    suite.require(event.outcome == sz::Outcome::Partial, "Outcome read");
    suite.require(event.latency_ms == 1800, "Latency read");
    suite.require(event.kind == sz::InteractionKind::Answer, "Kind defaults to answer");
    suite.require(!event.cursor.has_value(), "Cursor optional");
    suite.require(event.attempts == 1 && event.hints_used == 0, "Counters default");
  }

  {
    auto json = nlohmann::json::parse(
        R"({"item_id":"x","outcome":"correct","kind":"conversation_turn","cursor":4})");
    auto event = sz::bridge::interaction_event_from_json(json);
    suite.require(event.kind == sz::InteractionKind::ConversationTurn, "Conversation turn kind");
    suite.require(event.cursor.has_value() && *event.cursor == 4, "Cursor read");
  }

  {
    suite.require(throws_invalid([] {
                    sz::bridge::interaction_event_from_json(
                        nlohmann::json::parse(R"({"item_id":"x","outcome":"maybe"})"));
                  }),
                  "Unknown outcome rejected");
    suite.require(throws_invalid([] {
                    sz::bridge::interaction_event_from_json(
                        nlohmann::json::parse(R"({"outcome":"correct"})"));
                  }),
                  "Missing item id rejected");
    suite.require(throws_invalid([] {
                    sz::bridge::learning_item_from_json(
                        nlohmann::json::parse(R"({"id":"x","domains":[]})"));
                  }),
                  "Item without domains rejected");
    suite.require(throws_invalid([] {
                    sz::bridge::interaction_event_from_json(
                        nlohmann::json::parse(R"({"item_id":"x","outcome":"correct","latency_ms":"fast"})"));
                  }),
                  "Non-numeric latency rejected");
  }

  {
    sz::AdaptationHint hint;
    hint.domain = "greetings";
    hint.mode = sz::DomainMode::Accelerating;
    hint.action = sz::AdaptationAction::Escalate;
    hint.injected_item_ids = {"a", "b"};
    hint.signal = 0.98;
    auto restored = sz::bridge::adaptation_hint_from_json(sz::bridge::to_json(hint));
    suite.require(restored.action == hint.action && restored.mode == hint.mode &&
                      restored.injected_item_ids == hint.injected_item_ids,
                  "Hint round trip");
  }

  {
    sz::InteractResponse response;
    response.session_id = "s";
    response.read_only = true;
    response.remaining = 3;
    auto json = sz::bridge::to_json(response);
    suite.require(json["next_item"].is_null(), "Absent next item is null");
    suite.require(json["signal"].is_null(), "Absent signal is null");
    suite.require(json["read_only"] == true && json["remaining"] == 3, "Flags serialized");
  }

  {
    sz::SessionSummary summary;
    summary.session_id = "s";
    summary.interactions = 4;
    summary.strengths = {"Quick response time"};
    sz::SessionSummary::KindReport report;
    report.kind = sz::ContentKind::Conversation;
    report.interactions = 4;
    report.conversation_turns = 3;
    summary.kinds.push_back(report);
    sz::SessionSummary::Recommendation practice;
    practice.type = "additional_practice";
    practice.focus = sz::ContentKind::Grammar;
    practice.factor = 0.3;
    summary.recommendations.push_back(practice);
    sz::SessionSummary::Recommendation pacing;
    pacing.type = "pacing_adjustment";
    pacing.factor = 0.8;
    summary.recommendations.push_back(pacing);
    summary.preferred_kinds = {sz::ContentKind::Conversation};
    auto json = sz::bridge::to_json(summary);
    suite.require(json["totals"]["interactions"] == 4, "Summary totals nested");
    suite.require(json["strengths"].size() == 1, "Strengths listed");
    suite.require(json["by_kind"][0]["kind"] == "conversation" &&
                      json["by_kind"][0]["conversation_turns"] == 3,
                  "Per-kind report serialized");
    suite.require(json["recommendations"][0]["focus"] == "grammar" &&
                      json["recommendations"][1]["focus"].is_null() &&
                      json["recommendations"][1]["type"] == "pacing_adjustment",
                  "Recommendations serialized");
    suite.require(json["preferred_kinds"] == nlohmann::json::array({"conversation"}),
                  "Preferred kinds serialized");
  }

  // Engine configuration.
  {
    auto config = sz::engine_config_from_json(nlohmann::json::parse(
        R"({"scheduler":{"initial_stability_days":2.0},"store":{"idle_timeout_ms":1000},
            "controller":{"min_window":3,"window_size":6},"session":{"session_size":5}})"));
    suite.require(config.scheduler.initial_stability_days == 2.0, "Scheduler key applied");
    suite.require(config.scheduler.difficulty_max == 5.0, "Missing keys keep defaults");
    suite.require(config.store.idle_timeout.count() == 1000, "Durations read in ms");
    suite.require(config.controller.min_window == 3 && config.controller.window_size == 6,
                  "Controller keys applied");
    suite.require(config.session.session_size == 5, "Session size applied");

    auto again = sz::engine_config_from_json(sz::to_json(config));
    suite.require(again.controller.min_window == 3 && again.store.idle_timeout.count() == 1000,
                  "Config survives serialization");
  }

  {
    bool threw = false;
    try {
      sz::engine_config_from_json(
          nlohmann::json::parse(R"({"controller":{"low_threshold":0.95,"high_threshold":0.9}})"));
    } catch (const sz::ConfigError& ex) {
      threw = ex.code() == "config_error" && !ex.retriable();
    }
    suite.require(threw, "Inverted thresholds rejected with config_error");
  }

  {
    auto dir = sz::testing::fresh_temp_dir("json_bridge_config");
    auto path = dir / "engine.json";
    {
      std::ofstream out(path);
      out << R"({"session":{"session_size":7}})";
    }
    auto config = sz::load_engine_config(path);
    suite.require(config.session.session_size == 7, "Config file loaded");

    bool threw = false;
    try {
      sz::load_engine_config(dir / "missing.json");
    } catch (const sz::ConfigError&) {
      threw = true;
    }
    suite.require(threw, "Missing config file is a config error");
  }

  if (!suite.ok) {
    std::cerr << "JSON bridge tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "JSON bridge tests passed" << std::endl;
  return 0;
}
