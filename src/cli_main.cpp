#include "sz/analytics.hpp"
#include "sz/catalog_content_service.hpp"
#include "sz/config.hpp"
#include "sz/durable_stores.hpp"
#include "sz/errors.hpp"
#include "sz/session_orchestrator.hpp"

#include "json_bridge.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* argv0) {
  std::cerr << "usage: " << argv0
            << " [--config=<engine.json>] [--analytics=<events.jsonl>] [--resume=<session>]"
               " <catalog.json> <store-dir> <user> <domain>...\n"
               "stdin commands:\n"
               "  c|p|i [latency_ms] [hints] [attempts]  answer the current item\n"
               "  pause | resume | snapshot | rebuild | end\n";
}

void emit(const nlohmann::json& json) {
  std::cout << json.dump() << std::endl;
}

nlohmann::json error_json(const std::string& code, const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["code"] = code;
  payload["message"] = message;
  return payload;
}

std::string current_item(const sz::SessionContext& session) {
  if (session.cursor < session.queue.size()) {
    return session.queue[session.cursor].item.id;
  }
  return std::string();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  std::string analytics_path;
  std::string resume_id;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0) {
      config_path = arg.substr(9);
    } else if (arg.rfind("--analytics=", 0) == 0) {
      analytics_path = arg.substr(12);
    } else if (arg.rfind("--resume=", 0) == 0) {
      resume_id = arg.substr(9);
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() < 4) {
    print_usage(argv[0]);
    return 2;
  }

  std::unique_ptr<std::ofstream> analytics_file;
  std::unique_ptr<sz::SessionOrchestrator> orchestrator;
  sz::SessionContext session;
  try {
    sz::EngineConfig config;
    if (!config_path.empty()) {
      config = sz::load_engine_config(config_path);
    }
    sz::Dependencies deps;
    deps.content = std::make_shared<sz::CatalogContentService>(sz::load_catalog(positional[0]));
    deps.durable = std::make_shared<sz::FileDurableStore>(positional[1]);
    if (!analytics_path.empty()) {
      analytics_file = std::make_unique<std::ofstream>(analytics_path, std::ios::app);
      if (!analytics_file->is_open()) {
        std::cerr << "cannot open analytics log " << analytics_path << std::endl;
        return 1;
      }
      deps.analytics = std::make_shared<sz::StreamAnalyticsSink>(*analytics_file);
    }
    orchestrator = sz::make_orchestrator(std::move(deps), config);

    if (resume_id.empty()) {
      std::vector<std::string> domains(positional.begin() + 3, positional.end());
      session = orchestrator->start_session(positional[2], domains);
    } else {
      session = orchestrator->resume_session(resume_id);
    }
  } catch (const std::exception& ex) {
    std::cerr << "startup failed: " << ex.what() << std::endl;
    return 1;
  }

  const std::string session_id = session.session_id;
  emit(sz::bridge::to_json(session));
  std::string item_id = current_item(session);

  std::string line;
  while (std::getline(std::cin, line)) {
    std::istringstream in(line);
    std::string command;
    if (!(in >> command)) {
      continue;
    }
    try {
      if (command == "c" || command == "p" || command == "i") {
        if (item_id.empty()) {
          emit(error_json("invalid_event", "queue exhausted; send 'end'"));
          continue;
        }
        sz::InteractionEvent event;
        event.session_id = session_id;
        event.item_id = item_id;
        event.outcome = command == "c"   ? sz::Outcome::Correct
                        : command == "p" ? sz::Outcome::Partial
                                         : sz::Outcome::Incorrect;
        in >> event.latency_ms >> event.hints_used >> event.attempts;
        if (event.attempts < 1) {
          event.attempts = 1;
        }
        auto response = orchestrator->interact(session_id, event);
        item_id = response.next_item.has_value() ? response.next_item->id : std::string();
        emit(sz::bridge::to_json(response));
      } else if (command == "pause") {
        orchestrator->pause_session(session_id);
        emit(nlohmann::json{{"status", "paused"}});
      } else if (command == "resume") {
        auto resumed = orchestrator->resume_session(session_id);
        item_id = current_item(resumed);
        emit(sz::bridge::to_json(resumed));
      } else if (command == "snapshot") {
        emit(sz::bridge::to_json(orchestrator->snapshot(session_id)));
      } else if (command == "rebuild") {
        emit(sz::bridge::to_json(orchestrator->rebuild_effectiveness(session_id)));
      } else if (command == "end") {
        emit(sz::bridge::to_json(orchestrator->end_session(session_id)));
        return 0;
      } else {
        emit(error_json("unknown_command", command));
      }
    } catch (const sz::EngineError& ex) {
      emit(error_json(ex.code(), ex.what()));
    }
  }
  // Input closed without 'end': leave the session resumable.
  try {
    orchestrator->evict(session_id);
  } catch (const sz::EngineError& ex) {
    std::cerr << "final flush failed: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
