#include "sz/analytics.hpp"
#include "sz/catalog_content_service.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

using sz::testing::kEpoch;
using sz::testing::make_event;
using sz::testing::make_item;
using sz::testing::RecordingAnalyticsSink;
using sz::testing::TestSuite;

namespace {

// Blocks inside publish() until released.
class GateSink : public sz::AnalyticsSink {
public:
  void publish(const sz::InteractionEvent& event) override {
    std::unique_lock<std::mutex> lock(mutex_);
    entered = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return open_; });
    events.push_back(event.item_id);
  }
  void publish(const sz::EffectivenessSignal&) override {}

  void wait_entered() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return entered; });
  }
  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }
  std::size_t delivered() {
    std::lock_guard<std::mutex> lock(mutex_);
    return events.size();
  }

  bool entered = false;
  std::vector<std::string> events;

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool open_ = false;
};

class ThrowingSink : public sz::AnalyticsSink {
public:
  void publish(const sz::InteractionEvent& event) override {
    if (event.item_id == "bad") {
      throw std::runtime_error("collector rejected record");
    }
    ++delivered;
  }
  void publish(const sz::EffectivenessSignal&) override {}

  std::atomic<int> delivered{0};
};

std::vector<std::string> ids(const std::vector<sz::LearningItem>& items) {
  std::vector<std::string> out;
  for (const auto& item : items) {
    out.push_back(item.id);
  }
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace

int main() {
  TestSuite suite;

  {
    auto multi = make_item("ma", "tones", 0.4);
    multi.domains.push_back("greetings");
    sz::CatalogContentService catalog({make_item("g-1", "greetings", 0.2),
                                       make_item("g-2", "greetings", 0.5),
                                       make_item("g-3", "greetings", 0.9), multi});
    suite.require(catalog.size() == 4, "Catalog seeded");

    auto all = catalog.fetch_items("greetings", sz::DifficultyRange::all(), {});
    suite.require(ids(all) == std::vector<std::string>({"g-1", "g-2", "g-3", "ma"}),
                  "Multi-domain item served in each of its domains");

    sz::DifficultyRange easy{0.0, 0.5, false};
    suite.require(ids(catalog.fetch_items("greetings", easy, {"g-1"})) ==
                      std::vector<std::string>({"g-2", "ma"}),
                  "Range and exclusions applied");

    sz::DifficultyRange harder{0.5, 1.0, true};
    suite.require(ids(catalog.fetch_items("greetings", harder, {})) ==
                      std::vector<std::string>({"g-3"}),
                  "Exclusive lower bound skips the boundary");
    suite.require(catalog.fetch_items("numbers", sz::DifficultyRange::all(), {}).empty(),
                  "Unknown domain is empty");

    catalog.add_item(make_item("g-2", "greetings", 0.7));
    suite.require(catalog.size() == 4 && catalog.find("g-2")->base_difficulty == 0.7,
                  "Same id replaces");
    suite.require(!catalog.find("missing").has_value(), "Missing item not found");

    bool threw = false;
    try {
      sz::LearningItem orphan;
      orphan.id = "orphan";
      catalog.add_item(orphan);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    suite.require(threw, "Item without domains rejected");
  }

  {
    auto items = sz::parse_catalog_document(nlohmann::json::parse(R"({"items":[
        {"id":"ni-hao","domains":["greetings"],"base_difficulty":0.2,
         "payload_ref":"audio/ni-hao.ogg","kind":"listening"},
        {"id":"xie-xie","domains":["greetings"]}]})"));
    suite.require(items.size() == 2, "Object catalog parsed");
    suite.require(items[0].kind == sz::ContentKind::Listening &&
                      items[0].payload_ref == "audio/ni-hao.ogg",
                  "Item fields read");
    auto bare = sz::parse_catalog_document(
        nlohmann::json::parse(R"([{"id":"a","domains":["tones"]}])"));
    suite.require(bare.size() == 1, "Bare array accepted");

    bool threw = false;
    try {
      sz::parse_catalog_document(nlohmann::json::parse(R"({"things":[]})"));
    } catch (const std::runtime_error&) {
      threw = true;
    }
    suite.require(threw, "Catalog without items rejected");

    auto dir = sz::testing::fresh_temp_dir("catalog");
    {
      std::ofstream out(dir / "catalog.json");
      out << R"({"items":[{"id":"a","domains":["tones"],"base_difficulty":0.3}]})";
    }
    suite.require(sz::load_catalog(dir / "catalog.json").size() == 1, "Catalog file loaded");
    threw = false;
    try {
      sz::load_catalog(dir / "absent.json");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    suite.require(threw, "Missing catalog file reported");
  }

  // One JSON object per line.
  {
    std::ostringstream out;
    sz::StreamAnalyticsSink sink(out);
    auto event = make_event("s1", "ni-hao", sz::Outcome::Partial);
    event.timestamp = kEpoch;
    sink.publish(event);
    sz::EffectivenessSignal signal;
    signal.domain = "greetings";
    signal.score = 0.75;
    sink.publish(signal);

    std::istringstream lines(out.str());
    std::string first;
    std::string second;
    std::getline(lines, first);
    std::getline(lines, second);
    auto a = nlohmann::json::parse(first);
    auto b = nlohmann::json::parse(second);
    suite.require(a["type"] == "interaction" && a["event"]["item_id"] == "ni-hao" &&
                      a["event"]["outcome"] == "partial",
                  "Interaction line");
    suite.require(b["type"] == "effectiveness" && b["signal"]["score"] == 0.75,
                  "Effectiveness line");
  }

  {
    auto inner = std::make_shared<RecordingAnalyticsSink>();
    sz::QueuedAnalyticsSink queued(inner, 64);
    for (int i = 0; i < 10; ++i) {
      queued.publish(make_event("s1", "item-" + std::to_string(i), sz::Outcome::Correct));
    }
    queued.drain();
    suite.require(inner->event_count() == 10, "Queued records delivered");
    bool ordered = true;
    for (int i = 0; i < 10; ++i) {
      ordered = ordered && inner->events[i].item_id == "item-" + std::to_string(i);
    }
    suite.require(ordered, "Delivery keeps publish order");
    suite.require(queued.dropped() == 0, "Nothing dropped under capacity");
  }

  // A full queue drops instead of blocking the caller.
  {
    auto gate = std::make_shared<GateSink>();
    sz::QueuedAnalyticsSink queued(gate, 2);
    queued.publish(make_event("s1", "first", sz::Outcome::Correct));
    gate->wait_entered();
    for (int i = 0; i < 5; ++i) {
      queued.publish(make_event("s1", "extra-" + std::to_string(i), sz::Outcome::Correct));
    }
    suite.require(queued.dropped() == 3, "Overflow counted");
    gate->release();
    queued.drain();
    suite.require(gate->delivered() == 3, "Accepted records still delivered");
    queued.stop();
    queued.stop();
    queued.publish(make_event("s1", "late", sz::Outcome::Correct));
    suite.require(gate->delivered() == 3, "Publishing after stop is a no-op");
  }

  {
    auto inner = std::make_shared<ThrowingSink>();
    sz::QueuedAnalyticsSink queued(inner, 8);
    queued.publish(make_event("s1", "ok-1", sz::Outcome::Correct));
    queued.publish(make_event("s1", "bad", sz::Outcome::Correct));
    queued.publish(make_event("s1", "ok-2", sz::Outcome::Correct));
    queued.drain();
    suite.require(inner->delivered.load() == 2, "Sink failure does not stop delivery");
  }

  if (!suite.ok) {
    std::cerr << "Catalog and analytics tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Catalog and analytics tests passed" << std::endl;
  return 0;
}
