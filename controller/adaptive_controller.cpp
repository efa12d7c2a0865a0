#include "sz/adaptive_controller.hpp"

#include "sz/errors.hpp"

#include "debug_log.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace sz {

namespace {

bool easier(const LearningItem& a, const LearningItem& b) {
  if (a.base_difficulty != b.base_difficulty) {
    return a.base_difficulty < b.base_difficulty;
  }
  return a.id < b.id;
}

std::unordered_set<std::string> queued_ids(const SessionContext& session) {
  std::unordered_set<std::string> ids;
  for (const auto& entry : session.queue) {
    ids.insert(entry.item.id);
  }
  return ids;
}

std::unordered_set<std::string> pending_ids(const SessionContext& session) {
  std::unordered_set<std::string> ids;
  for (std::size_t i = session.cursor; i < session.queue.size(); ++i) {
    ids.insert(session.queue[i].item.id);
  }
  return ids;
}

std::string format_score(double value) {
  std::string text = std::to_string(value);
  return text.substr(0, std::min<std::size_t>(text.size(), 5));
}

} // namespace

AdaptationAction advance_mode(DomainState& state, const ControllerConfig& config) {
  const double score = state.score;
  switch (state.mode) {
    case DomainMode::Nominal:
      if (static_cast<int>(state.window.size()) >= config.min_window &&
          score < config.low_threshold) {
        state.mode = DomainMode::Struggling;
        state.high_streak = 0;
        state.recovery_streak = 0;
        return AdaptationAction::Remediate;
      }
      if (score > config.high_threshold) {
        if (++state.high_streak >= config.min_window) {
          state.mode = DomainMode::Accelerating;
          state.high_streak = 0;
          state.recovery_streak = 0;
          return AdaptationAction::Escalate;
        }
      } else {
        state.high_streak = 0;
      }
      return AdaptationAction::Hold;

    case DomainMode::Struggling:
      if (score >= config.low_threshold) {
        if (++state.recovery_streak >= config.min_window) {
          state.mode = DomainMode::Nominal;
          state.recovery_streak = 0;
          state.high_streak = 0;
          return AdaptationAction::Recover;
        }
      } else {
        state.recovery_streak = 0;
      }
      return AdaptationAction::Hold;

    case DomainMode::Accelerating:
      if (score <= config.high_threshold) {
        state.mode = DomainMode::Nominal;
        state.high_streak = 0;
        state.recovery_streak = 0;
        return AdaptationAction::Recover;
      }
      return AdaptationAction::Hold;
  }
  return AdaptationAction::Hold;
}

AdaptiveController::AdaptiveController(std::shared_ptr<ContentService> content,
                                       ControllerConfig config)
    : content_(std::move(content)), config_(std::move(config)) {
  if (!content_) {
    throw std::invalid_argument("AdaptiveController requires a content service");
  }
  config_.validate();
}

std::vector<LearningItem> AdaptiveController::remediation_items(
    const SessionContext& session, const std::string& domain, double level,
    const std::vector<LearningItem>& lapsed) {
  std::vector<LearningItem> picked;
  auto pending = pending_ids(session);
  for (const auto& item : lapsed) {
    if (picked.size() >= config_.inject_count) {
      break;
    }
    if (!item.in_domain(domain) || pending.count(item.id) > 0) {
      continue;
    }
    pending.insert(item.id);
    picked.push_back(item);
  }
  if (picked.size() >= config_.inject_count) {
    return picked;
  }

  DifficultyRange range;
  range.min = 0.0;
  range.max = level;
  auto exclude = queued_ids(session);
  for (const auto& item : picked) {
    exclude.insert(item.id);
  }
  auto fetched = content_->fetch_items(domain, range, exclude);
  std::sort(fetched.begin(), fetched.end(), easier);
  for (auto& item : fetched) {
    if (picked.size() >= config_.inject_count) {
      break;
    }
    if (exclude.count(item.id) > 0 || !range.contains(item.base_difficulty)) {
      continue;
    }
    exclude.insert(item.id);
    picked.push_back(std::move(item));
  }
  return picked;
}

std::vector<LearningItem> AdaptiveController::escalation_items(const SessionContext& session,
                                                               const std::string& domain,
                                                               double level) {
  DifficultyRange range;
  range.min = level;
  range.max = 1.0;
  range.exclusive_min = true;
  auto exclude = queued_ids(session);
  auto fetched = content_->fetch_items(domain, range, exclude);
  std::sort(fetched.begin(), fetched.end(), easier);

  std::vector<LearningItem> picked;
  for (auto& item : fetched) {
    if (picked.size() >= config_.inject_count) {
      break;
    }
    if (exclude.count(item.id) > 0 || !range.contains(item.base_difficulty)) {
      continue;
    }
    exclude.insert(item.id);
    picked.push_back(std::move(item));
  }
  return picked;
}

AdaptationHint AdaptiveController::evaluate(SessionContext& session, const std::string& domain,
                                            Timestamp now,
                                            const std::vector<LearningItem>& lapsed) {
  auto& state = session.domain_states[domain];

  AdaptationHint hint;
  hint.domain = domain;
  hint.signal = state.score;
  hint.action = advance_mode(state, config_);
  hint.mode = state.mode;

  if (hint.action != AdaptationAction::Remediate && hint.action != AdaptationAction::Escalate) {
    if (hint.action == AdaptationAction::Recover) {
      log::debug("adaptive", session.session_id + " " + domain + " back to nominal at " +
                                 format_score(state.score));
    }
    return hint;
  }

  std::vector<LearningItem> items;
  try {
    items = hint.action == AdaptationAction::Remediate
                ? remediation_items(session, domain, state.level, lapsed)
                : escalation_items(session, domain, state.level);
  } catch (const ContentServiceUnavailable& ex) {
    log::warn("adaptive", session.session_id + " " + domain + " " + to_string(hint.action) +
                              " skipped, content unavailable: " + ex.what());
    hint.degraded = true;
    hint.action = AdaptationAction::Hold;
    return hint;
  }

  for (auto& item : items) {
    QueueEntry entry;
    entry.next_due = now;
    entry.stability_days = 0.0;
    entry.injected = true;
    entry.injected_at = now;
    hint.injected_item_ids.push_back(item.id);
    entry.item = std::move(item);
    session.queue.push_back(std::move(entry));
  }

  if (hint.action == AdaptationAction::Remediate) {
    state.level = std::max(0.0, state.level - config_.level_step);
  } else {
    state.level = std::min(1.0, state.level + config_.level_step);
  }

  log::debug("adaptive", session.session_id + " " + domain + " -> " + to_string(state.mode) +
                             " score=" + format_score(state.score) + " injected=" +
                             std::to_string(hint.injected_item_ids.size()) +
                             " level=" + format_score(state.level));
  return hint;
}

} // namespace sz
