#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sz {

struct StartOptions {
  // Accept answers for in-domain items that were not queued.
  bool extra_curricular = false;
  // Overrides SessionConfig::session_size.
  std::optional<std::size_t> max_items;
};

struct Dependencies {
  std::shared_ptr<ContentService> content;
  std::shared_ptr<DurableStore> durable;
  // Optional.
  std::shared_ptr<AnalyticsSink> analytics;
  // Defaults to the system clock.
  std::function<Timestamp()> clock;
  // Deliver analytics through a bounded background queue.
  bool queue_analytics = true;
  // Evict idle sessions from a background thread.
  bool run_janitor = true;
};

class SessionOrchestrator {
public:
  virtual ~SessionOrchestrator() = default;

  virtual SessionContext start_session(const std::string& user_id,
                                       const std::vector<std::string>& domains,
                                       const StartOptions& options = {}) = 0;

  virtual InteractResponse interact(const std::string& session_id,
                                    const InteractionEvent& event) = 0;

  virtual void pause_session(const std::string& session_id) = 0;

  // Idempotent; the result does not depend on whether the session was still cached.
  virtual SessionContext resume_session(const std::string& session_id) = 0;

  // Flushes synchronously before returning.
  virtual SessionSummary end_session(const std::string& session_id) = 0;

  virtual SessionContext snapshot(const std::string& session_id) = 0;

  // Recomputes windows and scores from the durable event log.
  virtual SessionContext rebuild_effectiveness(const std::string& session_id) = 0;

  virtual bool degraded(const std::string& session_id) = 0;

  // Flushes the session and drops it from the fast tier.
  virtual void evict(const std::string& session_id) = 0;
  virtual std::size_t evict_idle() = 0;
};

// Throws ConfigError for an invalid configuration and std::invalid_argument
// when a required dependency is missing.
std::unique_ptr<SessionOrchestrator> make_orchestrator(Dependencies deps, EngineConfig config = {});

} // namespace sz
