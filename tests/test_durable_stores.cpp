#include "sz/durable_stores.hpp"
#include "sz/errors.hpp"

#include "test_support.hpp"

#include <fstream>
#include <iostream>
#include <memory>

using sz::testing::kEpoch;
using sz::testing::make_item;
using sz::testing::TestSuite;

namespace {

sz::ReviewState review(const std::string& user, const std::string& item, sz::Timestamp reviewed) {
  sz::ReviewState state;
  state.user_id = user;
  state.item_id = item;
  state.repetitions = 1;
  state.stability_days = 1.0;
  state.difficulty = 1.4;
  state.last_reviewed = reviewed;
  state.next_due = reviewed + sz::kMillisPerDay;
  return state;
}

sz::SessionContext session_with_queue(const std::string& id) {
  sz::SessionContext session;
  session.session_id = id;
  session.user_id = "u1";
  session.domains = {"greetings"};
  session.started_at = kEpoch;
  session.updated_at = kEpoch;
  sz::QueueEntry entry;
  entry.item = make_item("ni-hao", "greetings", 0.2);
  entry.next_due = kEpoch;
  session.queue.push_back(entry);
  session.domain_states["greetings"] = sz::DomainState{};
  return session;
}

void exercise_store(sz::DurableStore& store, const std::string& label, TestSuite& suite) {
  std::optional<sz::ReviewState> current;

  auto first = review("u1", "ni-hao", kEpoch);
  suite.require(store.compare_and_swap_review(first, 0, current), label + ": create succeeds");
  suite.require(current.has_value() && current->version == 1, label + ": created at v1");

  auto stale = review("u1", "ni-hao", kEpoch + 10);
  suite.require(!store.compare_and_swap_review(stale, 0, current),
                label + ": second create conflicts");
  suite.require(current.has_value() && current->version == 1 && current->last_reviewed == kEpoch,
                label + ": conflict reports stored record");

  suite.require(store.compare_and_swap_review(stale, 1, current), label + ": update at v1");
  auto loaded = store.load_review("u1", "ni-hao");
  suite.require(loaded.has_value() && loaded->version == 2 &&
                    loaded->last_reviewed == kEpoch + 10,
                label + ": update visible");

  suite.require(!store.compare_and_swap_review(review("u1", "zai-jian", kEpoch), 3, current),
                label + ": update of missing record conflicts");
  suite.require(!current.has_value(), label + ": conflict on missing record reports nothing");

  store.compare_and_swap_review(review("u1", "xie-xie", kEpoch), 0, current);
  store.compare_and_swap_review(review("u2", "ni-hao", kEpoch), 0, current);
  auto mine = store.reviews_for_user("u1");
  suite.require(mine.size() == 2, label + ": reviews scoped to user");
  suite.require(store.reviews_for_user("nobody").empty(), label + ": unknown user has none");

  suite.require(!store.load_session("missing").has_value(), label + ": unknown session");
  auto session = session_with_queue("sess-1");
  store.store_session(session);
  auto restored = store.load_session("sess-1");
  suite.require(restored.has_value() && *restored == session, label + ": session round trip");
  session.cursor = 1;
  store.store_session(session);
  suite.require(store.load_session("sess-1")->cursor == 1, label + ": session replaced");

  std::vector<sz::InteractionEvent> batch{
      sz::testing::make_event("sess-1", "a", sz::Outcome::Correct),
      sz::testing::make_event("sess-1", "b", sz::Outcome::Incorrect)};
  store.append_events("sess-1", batch);
  store.append_events("sess-1", {sz::testing::make_event("sess-1", "c", sz::Outcome::Partial)});
  auto events = store.load_events("sess-1");
  suite.require(events.size() == 3, label + ": events appended");
  suite.require(events.size() == 3 && events[0].item_id == "a" && events[2].item_id == "c",
                label + ": event order kept");
  suite.require(store.load_events("other").empty(), label + ": event logs per session");
}

} // namespace

int main() {
  TestSuite suite;

  {
    sz::InMemoryDurableStore store;
    exercise_store(store, "memory", suite);
    suite.require(store.session_count() == 1, "memory: one session stored");
  }

  {
    auto dir = sz::testing::fresh_temp_dir("file_store");
    {
      sz::FileDurableStore store(dir);
      exercise_store(store, "file", suite);
    }
    // A second handle over the same directory sees everything.
    sz::FileDurableStore reopened(dir);
    suite.require(reopened.load_review("u1", "ni-hao")->version == 2, "file: reviews persist");
    suite.require(reopened.load_session("sess-1").has_value(), "file: sessions persist");
    suite.require(reopened.load_events("sess-1").size() == 3, "file: events persist");
  }

  {
    auto dir = sz::testing::fresh_temp_dir("file_store_odd_ids");
    sz::FileDurableStore store(dir);
    std::optional<sz::ReviewState> current;
    auto odd = review("user/with space", "../item", kEpoch);
    suite.require(store.compare_and_swap_review(odd, 0, current), "file: odd ids stored");
    suite.require(store.load_review("user/with space", "../item").has_value(),
                  "file: odd ids loaded");
    suite.require(sz::encode_path_component("../x") == "%2E%2E%2Fx", "Path components escaped");
  }

  {
    auto dir = sz::testing::fresh_temp_dir("file_store_corrupt");
    sz::FileDurableStore store(dir);
    {
      std::ofstream out(dir / "sessions" / "broken.json");
      out << "{ not json";
    }
    bool threw = false;
    try {
      store.load_session("broken");
    } catch (const sz::StoreUnavailable& ex) {
      threw = ex.retriable();
    }
    suite.require(threw, "file: corrupt document surfaces as StoreUnavailable");
  }

  if (!suite.ok) {
    std::cerr << "Durable store tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Durable store tests passed" << std::endl;
  return 0;
}
