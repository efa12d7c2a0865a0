#include "sz/session_orchestrator.hpp"

#include "sz/adaptive_controller.hpp"
#include "sz/analytics.hpp"
#include "sz/errors.hpp"
#include "sz/interaction_pipeline.hpp"
#include "sz/item_scheduler.hpp"
#include "sz/state_store.hpp"

#include "scoring/effectiveness.hpp"
#include "debug_log.hpp"
#include "rng.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace sz {
namespace {

std::vector<std::string> unique_domains(const std::vector<std::string>& domains) {
  std::vector<std::string> out;
  for (const auto& domain : domains) {
    if (domain.empty()) {
      throw std::invalid_argument("Skill domain names must not be empty");
    }
    if (std::find(out.begin(), out.end(), domain) == out.end()) {
      out.push_back(domain);
    }
  }
  return out;
}

} // namespace

class SessionOrchestratorImpl : public SessionOrchestrator {
public:
  SessionOrchestratorImpl(Dependencies deps, EngineConfig config)
      : config_(std::move(config)),
        clock_(deps.clock ? std::move(deps.clock) : std::function<Timestamp()>(now_millis)),
        content_(std::move(deps.content)),
        scheduler_(config_.scheduler),
        store_(std::move(deps.durable), config_.store, clock_),
        controller_(content_, config_.controller),
        rng_state_(seed_from_clock()) {
    if (deps.analytics) {
      if (deps.queue_analytics) {
        analytics_ = std::make_shared<QueuedAnalyticsSink>(std::move(deps.analytics),
                                                           config_.session.analytics_queue_capacity);
      } else {
        analytics_ = std::move(deps.analytics);
      }
    }
    pipeline_ = std::make_unique<InteractionPipeline>(store_, scheduler_, controller_, content_,
                                                      analytics_, config_.controller.window_size);
    if (deps.run_janitor) {
      store_.start_janitor([this](Timestamp now) { sweep_idle(now); });
    }
  }

  ~SessionOrchestratorImpl() override {
    store_.stop();
  }

  SessionContext start_session(const std::string& user_id, const std::vector<std::string>& domains,
                               const StartOptions& options) override {
    if (user_id.empty()) {
      throw std::invalid_argument("start_session requires a user id");
    }
    auto requested = unique_domains(domains);
    if (requested.empty()) {
      throw std::invalid_argument("start_session requires at least one skill domain");
    }
    const std::size_t limit = options.max_items.value_or(config_.session.session_size);
    if (limit == 0) {
      throw std::invalid_argument("start_session max_items must be positive");
    }

    const Timestamp now = clock_();
    std::unordered_map<std::string, ReviewState> reviews;
    for (auto& review : store_.durable().reviews_for_user(user_id)) {
      const std::string item_id = review.item_id;
      reviews.emplace(item_id, std::move(review));
    }

    SessionContext session;
    session.session_id = generate_session_id();
    session.user_id = user_id;
    session.domains = requested;
    session.status = SessionStatus::Active;
    session.extra_curricular = options.extra_curricular;
    session.started_at = now;
    session.updated_at = now;

    std::unordered_set<std::string> seen;
    for (const auto& domain : requested) {
      for (auto& item : content_->fetch_items(domain, DifficultyRange::all(), seen)) {
        if (!seen.insert(item.id).second) {
          continue;
        }
        QueueEntry entry;
        auto it = reviews.find(item.id);
        if (it != reviews.end()) {
          if (it->second.next_due > now) {
            continue;
          }
          entry.next_due = it->second.next_due;
          entry.stability_days = it->second.stability_days;
        } else {
          entry.next_due = now;
        }
        entry.item = std::move(item);
        session.queue.push_back(std::move(entry));
      }
    }
    std::stable_sort(session.queue.begin(), session.queue.end(), queue_order);
    if (session.queue.size() > limit) {
      session.queue.resize(limit);
    }

    for (const auto& domain : requested) {
      DomainState state;
      double difficulty_sum = 0.0;
      int count = 0;
      for (const auto& entry : session.queue) {
        if (accounting_domain(session, entry.item) == domain) {
          difficulty_sum += entry.item.base_difficulty;
          ++count;
        }
      }
      if (count > 0) {
        state.level = detail::clip01(difficulty_sum / count);
      }
      session.domain_states[domain] = state;
    }

    {
      auto strand = strand_for(session.session_id);
      std::lock_guard<std::mutex> lock(*strand);
      store_.put(session.session_id, session);
    }
    log::debug("session", "started " + session.session_id + " user=" + user_id +
                              " queue=" + std::to_string(session.queue.size()));
    return session;
  }

  InteractResponse interact(const std::string& session_id,
                            const InteractionEvent& event) override {
    auto strand = strand_for(session_id);
    std::lock_guard<std::mutex> lock(*strand);

    SessionContext session = load_live(session_id);
    if (session.status == SessionStatus::Paused) {
      throw SessionPaused(session_id);
    }

    if (store_.degraded(session_id) && !try_recover(session_id)) {
      return read_only_response(session);
    }

    const Timestamp now = clock_();
    auto result = pipeline_->handle(session, event, now);
    store_.put(session_id, session);

    InteractResponse response;
    response.session_id = session_id;
    response.next_item = std::move(result.next_item);
    response.hint = std::move(result.hint);
    response.signal = std::move(result.signal);
    response.cursor = session.cursor;
    response.remaining = session.remaining();
    return response;
  }

  void pause_session(const std::string& session_id) override {
    auto strand = strand_for(session_id);
    std::lock_guard<std::mutex> lock(*strand);
    SessionContext session = load_live(session_id);
    if (session.status == SessionStatus::Paused) {
      return;
    }
    session.status = SessionStatus::Paused;
    session.updated_at = clock_();
    store_.put(session_id, session);
    log::debug("session", "paused " + session_id);
  }

  SessionContext resume_session(const std::string& session_id) override {
    auto strand = strand_for(session_id);
    std::lock_guard<std::mutex> lock(*strand);
    SessionContext session = load_live(session_id);
    if (store_.degraded(session_id)) {
      try_recover(session_id);
    }
    if (session.status == SessionStatus::Paused) {
      session.status = SessionStatus::Active;
      session.updated_at = clock_();
      store_.put(session_id, session);
      log::debug("session", "resumed " + session_id);
    }
    return session;
  }

  SessionSummary end_session(const std::string& session_id) override {
    auto strand = strand_for(session_id);
    std::lock_guard<std::mutex> lock(*strand);
    SessionContext session = load_live(session_id);

    const Timestamp now = clock_();
    session.status = SessionStatus::Completed;
    session.updated_at = now;
    auto summary = scoring::summarize(session, now);
    store_.put(session_id, session);

    try {
      store_.flush(session_id);
      store_.evict(session_id);
    } catch (const StoreUnavailable& ex) {
      log::warn("session", "end of " + session_id + " not yet durable: " + ex.what());
      summary.degraded = true;
    }
    drop_strand(session_id);
    log::debug("session", "ended " + session_id + " interactions=" +
                              std::to_string(summary.interactions));
    return summary;
  }

  SessionContext snapshot(const std::string& session_id) override {
    auto strand = strand_for(session_id);
    std::lock_guard<std::mutex> lock(*strand);
    auto session = store_.get(session_id);
    if (!session.has_value()) {
      throw SessionNotFound(session_id);
    }
    return *session;
  }

  SessionContext rebuild_effectiveness(const std::string& session_id) override {
    auto strand = strand_for(session_id);
    std::lock_guard<std::mutex> lock(*strand);
    SessionContext session = load_live(session_id);
    store_.flush(session_id);
    auto events = store_.durable().load_events(session_id);
    pipeline_->rebuild_signals(session, events);
    store_.put(session_id, session);
    log::debug("session", "rebuilt " + session_id + " from " + std::to_string(events.size()) +
                              " event(s)");
    return session;
  }

  bool degraded(const std::string& session_id) override {
    return store_.degraded(session_id);
  }

  void evict(const std::string& session_id) override {
    auto strand = strand_for(session_id);
    std::lock_guard<std::mutex> lock(*strand);
    store_.flush(session_id);
    store_.evict(session_id);
  }

  std::size_t evict_idle() override {
    return sweep_idle(clock_());
  }

private:
  // Idle eviction takes the session strand, so it never lands between the
  // read and the write of an interaction that is still running.
  std::size_t sweep_idle(Timestamp now) {
    std::size_t evicted = 0;
    for (const auto& session_id : store_.idle_sessions(now)) {
      auto strand = strand_for(session_id);
      std::lock_guard<std::mutex> lock(*strand);
      try {
        if (store_.evict_if_idle(session_id, now)) {
          ++evicted;
        }
      } catch (const StoreUnavailable& ex) {
        log::warn("session", "idle eviction of " + session_id + " postponed: " + ex.what());
      }
    }
    if (evicted > 0) {
      log::debug("session", "evicted " + std::to_string(evicted) + " idle session(s)");
    }
    return evicted;
  }

  // Sessions that are neither unknown nor completed.
  SessionContext load_live(const std::string& session_id) {
    auto session = store_.get(session_id);
    if (!session.has_value()) {
      throw SessionNotFound(session_id);
    }
    if (session->status == SessionStatus::Completed) {
      throw SessionNotFound(session_id, "Session is completed");
    }
    return std::move(*session);
  }

  bool try_recover(const std::string& session_id) {
    try {
      store_.flush(session_id);
      return true;
    } catch (const StoreUnavailable& ex) {
      log::debug("session", session_id + " still read-only: " + ex.what());
      return false;
    }
  }

  InteractResponse read_only_response(const SessionContext& session) const {
    InteractResponse response;
    response.session_id = session.session_id;
    response.read_only = true;
    response.cursor = session.cursor;
    response.remaining = session.remaining();
    if (session.cursor < session.queue.size()) {
      const auto& item = session.queue[session.cursor].item;
      response.next_item = item;
      response.hint.domain = accounting_domain(session, item);
      auto it = session.domain_states.find(response.hint.domain);
      if (it != session.domain_states.end()) {
        response.hint.mode = it->second.mode;
        response.hint.signal = it->second.score;
      }
    }
    return response;
  }

  std::shared_ptr<std::mutex> strand_for(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(strands_mutex_);
    auto& strand = strands_[session_id];
    if (!strand) {
      strand = std::make_shared<std::mutex>();
    }
    return strand;
  }

  void drop_strand(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(strands_mutex_);
    strands_.erase(session_id);
  }

  std::string generate_session_id() {
    std::lock_guard<std::mutex> lock(id_mutex_);
    return "sess-" + rand_hex(rng_state_, 12) + "-" + std::to_string(++session_counter_);
  }

  EngineConfig config_;
  std::function<Timestamp()> clock_;
  std::shared_ptr<ContentService> content_;
  std::shared_ptr<AnalyticsSink> analytics_;
  ItemScheduler scheduler_;
  SessionStateStore store_;
  AdaptiveController controller_;
  std::unique_ptr<InteractionPipeline> pipeline_;

  std::mutex strands_mutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> strands_;

  std::mutex id_mutex_;
  std::uint64_t rng_state_ = 0;
  std::uint64_t session_counter_ = 0;
};

std::unique_ptr<SessionOrchestrator> make_orchestrator(Dependencies deps, EngineConfig config) {
  config.validate();
  if (!deps.content) {
    throw std::invalid_argument("make_orchestrator requires a content service");
  }
  if (!deps.durable) {
    throw std::invalid_argument("make_orchestrator requires a durable store");
  }
  return std::make_unique<SessionOrchestratorImpl>(std::move(deps), std::move(config));
}

} // namespace sz
