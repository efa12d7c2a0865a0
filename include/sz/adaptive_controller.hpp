#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sz {

// Advances a domain's mode from its current score. Returns Hold when the mode
// did not change, otherwise the action that goes with the new mode.
AdaptationAction advance_mode(DomainState& state, const ControllerConfig& config);

/**
 * AdaptiveController watches the effectiveness score of every skill domain
 * of a session and reshapes the queue when a domain changes mode:
 * Struggling injects easier and previously lapsed items, Accelerating
 * injects harder ones. Content failures never propagate; the hint is marked
 * degraded and the queue is left as it was.
 */
class AdaptiveController {
public:
  AdaptiveController(std::shared_ptr<ContentService> content, ControllerConfig config);

  const ControllerConfig& config() const noexcept { return config_; }

  // `lapsed` lists items of the session the learner has lapsed on; they are
  // offered before fresh content when remediating.
  AdaptationHint evaluate(SessionContext& session, const std::string& domain, Timestamp now,
                          const std::vector<LearningItem>& lapsed = {});

private:
  std::vector<LearningItem> remediation_items(const SessionContext& session,
                                              const std::string& domain, double level,
                                              const std::vector<LearningItem>& lapsed);
  std::vector<LearningItem> escalation_items(const SessionContext& session,
                                             const std::string& domain, double level);

  std::shared_ptr<ContentService> content_;
  ControllerConfig config_;
};

} // namespace sz
