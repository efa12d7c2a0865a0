#pragma once

#include "collaborators.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sz {

class InMemoryDurableStore : public DurableStore {
public:
  std::optional<ReviewState> load_review(const std::string& user_id,
                                         const std::string& item_id) override;
  bool compare_and_swap_review(const ReviewState& desired, std::uint64_t expected_version,
                               std::optional<ReviewState>& current) override;
  std::vector<ReviewState> reviews_for_user(const std::string& user_id) override;

  std::optional<SessionContext> load_session(const std::string& session_id) override;
  void store_session(const SessionContext& session) override;

  void append_events(const std::string& session_id,
                     const std::vector<InteractionEvent>& events) override;
  std::vector<InteractionEvent> load_events(const std::string& session_id) override;

  std::size_t session_count() const;

private:
  mutable std::shared_mutex mutex_;
  // Ordered by (user, item) so reviews_for_user is a range scan.
  std::map<std::pair<std::string, std::string>, ReviewState> reviews_;
  std::unordered_map<std::string, SessionContext> sessions_;
  std::unordered_map<std::string, std::vector<InteractionEvent>> events_;
};

// Directory-backed store:
//   <root>/reviews/<user>/<item>.json
//   <root>/sessions/<session>.json
//   <root>/events/<session>.jsonl
// Documents are replaced with a temp-file + rename so readers never observe a
// partial write. Every filesystem failure surfaces as StoreUnavailable.
class FileDurableStore : public DurableStore {
public:
  explicit FileDurableStore(std::filesystem::path root);

  const std::filesystem::path& root() const noexcept { return root_; }

  std::optional<ReviewState> load_review(const std::string& user_id,
                                         const std::string& item_id) override;
  bool compare_and_swap_review(const ReviewState& desired, std::uint64_t expected_version,
                               std::optional<ReviewState>& current) override;
  std::vector<ReviewState> reviews_for_user(const std::string& user_id) override;

  std::optional<SessionContext> load_session(const std::string& session_id) override;
  void store_session(const SessionContext& session) override;

  void append_events(const std::string& session_id,
                     const std::vector<InteractionEvent>& events) override;
  std::vector<InteractionEvent> load_events(const std::string& session_id) override;

private:
  std::filesystem::path review_path(const std::string& user_id, const std::string& item_id) const;
  std::filesystem::path session_path(const std::string& session_id) const;
  std::filesystem::path events_path(const std::string& session_id) const;

  std::optional<ReviewState> read_review_unlocked(const std::filesystem::path& path) const;

  std::filesystem::path root_;
  // Serializes compare-and-swap and appends within this process; reads share.
  mutable std::shared_mutex mutex_;
};

// Maps an identifier onto a single portable path component.
std::string encode_path_component(const std::string& id);

} // namespace sz
