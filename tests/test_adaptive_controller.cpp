#include "sz/adaptive_controller.hpp"

#include "test_support.hpp"

#include <cmath>
#include <iostream>
#include <memory>

using sz::testing::kEpoch;
using sz::testing::make_item;
using sz::testing::ScriptedContentService;
using sz::testing::TestSuite;

namespace {

bool near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

std::shared_ptr<ScriptedContentService> greetings_catalog() {
  return std::make_shared<ScriptedContentService>(std::vector<sz::LearningItem>{
      make_item("g-02", "greetings", 0.2), make_item("g-05", "greetings", 0.5),
      make_item("g-06", "greetings", 0.6), make_item("g-07", "greetings", 0.7),
      make_item("g-08", "greetings", 0.8), make_item("g-09", "greetings", 0.9),
      make_item("g-01", "greetings", 0.1), make_item("g-03", "greetings", 0.3),
      make_item("t-01", "tones", 0.1)});
}

sz::SessionContext session_at(double score, std::size_t window) {
  sz::SessionContext session;
  session.session_id = "s1";
  session.user_id = "u1";
  session.domains = {"greetings"};
  session.started_at = kEpoch;
  sz::QueueEntry entry;
  entry.item = make_item("g-05", "greetings", 0.5);
  entry.next_due = kEpoch;
  session.queue.push_back(entry);
  entry.item = make_item("g-02", "greetings", 0.2);
  session.queue.push_back(entry);

  sz::DomainState state;
  state.level = 0.5;
  state.score = score;
  for (std::size_t i = 0; i < window; ++i) {
    state.window.push_back(sz::InteractionSample{});
  }
  session.domain_states["greetings"] = state;
  return session;
}

} // namespace

int main() {
  TestSuite suite;
  const sz::ControllerConfig config;

  // Mode transitions on their own.
  {
    sz::DomainState state;
    state.score = 0.3;
    state.window.resize(4);
    suite.require(sz::advance_mode(state, config) == sz::AdaptationAction::Hold,
                  "Short window never remediates");
    state.window.resize(5);
    suite.require(sz::advance_mode(state, config) == sz::AdaptationAction::Remediate,
                  "Low score over a full window remediates");
    suite.require(state.mode == sz::DomainMode::Struggling, "Now struggling");

    state.score = 0.7;
    for (int i = 0; i < 4; ++i) {
      sz::advance_mode(state, config);
    }
    state.score = 0.5;
    suite.require(sz::advance_mode(state, config) == sz::AdaptationAction::Hold,
                  "A low score interrupts recovery");
    suite.require(state.recovery_streak == 0, "Recovery streak reset");
    state.score = 0.7;
    sz::AdaptationAction last = sz::AdaptationAction::Hold;
    for (int i = 0; i < 5; ++i) {
      last = sz::advance_mode(state, config);
    }
    suite.require(last == sz::AdaptationAction::Recover, "Sustained recovery returns to nominal");
    suite.require(state.mode == sz::DomainMode::Nominal, "Back to nominal");
  }

  {
    sz::DomainState state;
    state.score = 0.95;
    state.window.resize(5);
    for (int i = 0; i < 4; ++i) {
      sz::advance_mode(state, config);
    }
    state.score = 0.85;
    sz::advance_mode(state, config);
    suite.require(state.high_streak == 0, "Dip below the high threshold resets the streak");
    state.score = 0.95;
    for (int i = 0; i < 4; ++i) {
      sz::advance_mode(state, config);
    }
    suite.require(state.mode == sz::DomainMode::Nominal, "Four high scores are not enough");
    suite.require(sz::advance_mode(state, config) == sz::AdaptationAction::Escalate,
                  "Fifth consecutive high score escalates");
    state.score = 0.9;
    suite.require(sz::advance_mode(state, config) == sz::AdaptationAction::Recover,
                  "Score at the high threshold leaves accelerating");
  }

  // Five 0.98 signals: escalation injects strictly harder items.
  {
    auto content = greetings_catalog();
    sz::AdaptiveController controller(content, config);
    auto session = session_at(0.98, 5);
    sz::AdaptationHint hint;
    for (int i = 0; i < 5; ++i) {
      hint = controller.evaluate(session, "greetings", kEpoch + i);
    }
    suite.require(hint.action == sz::AdaptationAction::Escalate, "Escalates on the fifth signal");
    suite.require(hint.mode == sz::DomainMode::Accelerating, "Hint reports accelerating");
    suite.require(content->requests.size() == 1, "Only the transition fetches content");
    const auto& range = content->requests.back();
    suite.require(range.exclusive_min && near(range.min, 0.5) && near(range.max, 1.0),
                  "Request is strictly above the current level");
    suite.require(hint.injected_item_ids ==
                      std::vector<std::string>({"g-06", "g-07", "g-08"}),
                  "Easiest harder items injected first");
    suite.require(session.queue.size() == 5, "Injected items appended");
    bool harder = true;
    for (std::size_t i = 2; i < session.queue.size(); ++i) {
      harder = harder && session.queue[i].item.base_difficulty > 0.5 &&
               session.queue[i].injected && session.queue[i].injected_at == kEpoch + 4;
    }
    suite.require(harder, "Every injected item is harder and stamped");
    suite.require(near(session.domain_states["greetings"].level, 0.7), "Level raised one step");
  }

  // Remediation offers lapsed items before easier fresh content.
  {
    auto content = greetings_catalog();
    sz::AdaptiveController controller(content, config);
    auto session = session_at(0.3, 5);
    std::vector<sz::LearningItem> lapsed{make_item("t-01", "tones", 0.1),
                                         make_item("g-09", "greetings", 0.9),
                                         make_item("g-02", "greetings", 0.2)};
    auto hint = controller.evaluate(session, "greetings", kEpoch, lapsed);
    suite.require(hint.action == sz::AdaptationAction::Remediate, "Remediates");
    suite.require(hint.mode == sz::DomainMode::Struggling, "Hint reports struggling");
    suite.require(hint.injected_item_ids ==
                      std::vector<std::string>({"g-09", "g-01", "g-03"}),
                  "Lapsed item first, then easiest fresh ones");
    const auto& range = content->requests.back();
    suite.require(near(range.min, 0.0) && near(range.max, 0.5) && !range.exclusive_min,
                  "Fresh content at or below the level");
    suite.require(near(session.domain_states["greetings"].level, 0.3), "Level lowered one step");
  }

  // Enough lapsed items means no content request at all.
  {
    auto content = greetings_catalog();
    sz::AdaptiveController controller(content, config);
    auto session = session_at(0.3, 5);
    std::vector<sz::LearningItem> lapsed{make_item("g-06", "greetings", 0.6),
                                         make_item("g-07", "greetings", 0.7),
                                         make_item("g-08", "greetings", 0.8)};
    auto hint = controller.evaluate(session, "greetings", kEpoch, lapsed);
    suite.require(hint.injected_item_ids.size() == 3, "Three lapsed items injected");
    suite.require(content->requests.empty(), "Content service not consulted");
  }

  {
    auto content = greetings_catalog();
    sz::AdaptiveController controller(content, config);
    auto session = session_at(0.3, 5);
    session.domain_states["greetings"].level = 0.1;
    controller.evaluate(session, "greetings", kEpoch);
    suite.require(near(session.domain_states["greetings"].level, 0.0), "Level floors at zero");
  }

  // Content outage: mode moves, queue stays.
  {
    auto content = greetings_catalog();
    content->unavailable = true;
    sz::AdaptiveController controller(content, config);
    auto session = session_at(0.3, 5);
    auto before = session.queue;
    auto hint = controller.evaluate(session, "greetings", kEpoch);
    suite.require(hint.degraded, "Hint marked degraded");
    suite.require(hint.action == sz::AdaptationAction::Hold, "Nothing injected");
    suite.require(hint.mode == sz::DomainMode::Struggling, "Mode still transitions");
    suite.require(session.queue == before, "Queue untouched");
    suite.require(near(session.domain_states["greetings"].level, 0.5), "Level untouched");
  }

  {
    auto content = greetings_catalog();
    sz::AdaptiveController controller(content, config);
    auto session = session_at(0.7, 5);
    auto hint = controller.evaluate(session, "greetings", kEpoch);
    suite.require(hint.action == sz::AdaptationAction::Hold && !hint.degraded,
                  "Mid-range score holds");
    suite.require(near(hint.signal, 0.7), "Hint carries the score");
    suite.require(content->requests.empty(), "Hold fetches nothing");
  }

  if (!suite.ok) {
    std::cerr << "Adaptive controller tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Adaptive controller tests passed" << std::endl;
  return 0;
}
