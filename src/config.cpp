#include "sz/config.hpp"

#include "sz/errors.hpp"

#include <fstream>
#include <string>
#include <string_view>

namespace sz {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.is_object() || !obj.contains(key)) {
    return false;
  }
  const auto& value = obj.at(key);
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw ConfigError("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

long long json_to_integer(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<long long>();
  }
  if (value.is_number_float()) {
    return static_cast<long long>(value.get<double>());
  }
  throw ConfigError("Expected integer for field '" + std::string(key) + "'");
}

std::size_t json_to_size(const nlohmann::json& value, std::string_view key) {
  const auto raw = json_to_integer(value, key);
  if (raw < 0) {
    throw ConfigError("Field '" + std::string(key) + "' must not be negative");
  }
  return static_cast<std::size_t>(raw);
}

void require(bool condition, const std::string& message) {
  if (!condition) {
    throw ConfigError(message);
  }
}

} // namespace

void SchedulerConfig::validate() const {
  require(initial_stability_days > 0.0, "initial_stability_days must be positive");
  require(lapse_stability_days > 0.0, "lapse_stability_days must be positive");
  require(max_stability_days >= initial_stability_days &&
              max_stability_days >= lapse_stability_days,
          "max_stability_days must not be below the initial or lapse stability");
  require(difficulty_min > 0.0, "difficulty_min must be positive");
  require(difficulty_min < difficulty_max, "difficulty_min must be less than difficulty_max");
  require(difficulty_step_up >= 0.0 && difficulty_step_down >= 0.0,
          "difficulty steps must not be negative");
  require(min_growth >= 1.0, "min_growth must be at least 1.0");
  require(min_growth <= max_growth, "min_growth must not exceed max_growth");
  require(growth_slope >= 0.0, "growth_slope must not be negative");
}

void StoreConfig::validate() const {
  require(idle_timeout.count() > 0, "idle_timeout must be positive");
  require(janitor_interval.count() > 0, "janitor_interval must be positive");
  require(max_write_retries >= 0, "max_write_retries must not be negative");
  require(retry_backoff.count() >= 0, "retry_backoff must not be negative");
}

void ControllerConfig::validate() const {
  require(low_threshold >= 0.0 && low_threshold <= 1.0, "low_threshold must be within [0, 1]");
  require(high_threshold >= 0.0 && high_threshold <= 1.0, "high_threshold must be within [0, 1]");
  require(low_threshold < high_threshold, "low_threshold must be less than high_threshold");
  require(min_window > 0, "min_window must be positive");
  require(window_size >= static_cast<std::size_t>(min_window),
          "window_size must be at least min_window");
  require(level_step > 0.0 && level_step <= 1.0, "level_step must be within (0, 1]");
}

void SessionConfig::validate() const {
  require(session_size > 0, "session_size must be positive");
  require(analytics_queue_capacity > 0, "analytics_queue_capacity must be positive");
}

void EngineConfig::validate() const {
  scheduler.validate();
  store.validate();
  controller.validate();
  session.validate();
}

EngineConfig engine_config_from_json(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw ConfigError("Engine config must be a JSON object");
  }
  EngineConfig config;

  if (document.contains("scheduler")) {
    const auto& s = document.at("scheduler");
    auto& c = config.scheduler;
    assign_if_present(s, "initial_stability_days",
                      [&](const nlohmann::json& v) { c.initial_stability_days = json_to_double(v, "initial_stability_days"); });
    assign_if_present(s, "lapse_stability_days",
                      [&](const nlohmann::json& v) { c.lapse_stability_days = json_to_double(v, "lapse_stability_days"); });
    assign_if_present(s, "max_stability_days",
                      [&](const nlohmann::json& v) { c.max_stability_days = json_to_double(v, "max_stability_days"); });
    assign_if_present(s, "difficulty_min",
                      [&](const nlohmann::json& v) { c.difficulty_min = json_to_double(v, "difficulty_min"); });
    assign_if_present(s, "difficulty_max",
                      [&](const nlohmann::json& v) { c.difficulty_max = json_to_double(v, "difficulty_max"); });
    assign_if_present(s, "initial_difficulty",
                      [&](const nlohmann::json& v) { c.initial_difficulty = json_to_double(v, "initial_difficulty"); });
    assign_if_present(s, "base_difficulty_influence",
                      [&](const nlohmann::json& v) { c.base_difficulty_influence = json_to_double(v, "base_difficulty_influence"); });
    assign_if_present(s, "difficulty_step_up",
                      [&](const nlohmann::json& v) { c.difficulty_step_up = json_to_double(v, "difficulty_step_up"); });
    assign_if_present(s, "difficulty_step_down",
                      [&](const nlohmann::json& v) { c.difficulty_step_down = json_to_double(v, "difficulty_step_down"); });
    assign_if_present(s, "max_growth",
                      [&](const nlohmann::json& v) { c.max_growth = json_to_double(v, "max_growth"); });
    assign_if_present(s, "min_growth",
                      [&](const nlohmann::json& v) { c.min_growth = json_to_double(v, "min_growth"); });
    assign_if_present(s, "growth_slope",
                      [&](const nlohmann::json& v) { c.growth_slope = json_to_double(v, "growth_slope"); });
  }

  if (document.contains("store")) {
    const auto& s = document.at("store");
    auto& c = config.store;
    assign_if_present(s, "idle_timeout_ms", [&](const nlohmann::json& v) {
      c.idle_timeout = std::chrono::milliseconds(json_to_integer(v, "idle_timeout_ms"));
    });
    assign_if_present(s, "janitor_interval_ms", [&](const nlohmann::json& v) {
      c.janitor_interval = std::chrono::milliseconds(json_to_integer(v, "janitor_interval_ms"));
    });
    assign_if_present(s, "max_write_retries", [&](const nlohmann::json& v) {
      c.max_write_retries = static_cast<int>(json_to_integer(v, "max_write_retries"));
    });
    assign_if_present(s, "retry_backoff_ms", [&](const nlohmann::json& v) {
      c.retry_backoff = std::chrono::milliseconds(json_to_integer(v, "retry_backoff_ms"));
    });
  }

  if (document.contains("controller")) {
    const auto& s = document.at("controller");
    auto& c = config.controller;
    assign_if_present(s, "low_threshold",
                      [&](const nlohmann::json& v) { c.low_threshold = json_to_double(v, "low_threshold"); });
    assign_if_present(s, "high_threshold",
                      [&](const nlohmann::json& v) { c.high_threshold = json_to_double(v, "high_threshold"); });
    assign_if_present(s, "min_window", [&](const nlohmann::json& v) {
      c.min_window = static_cast<int>(json_to_integer(v, "min_window"));
    });
    assign_if_present(s, "window_size",
                      [&](const nlohmann::json& v) { c.window_size = json_to_size(v, "window_size"); });
    assign_if_present(s, "inject_count",
                      [&](const nlohmann::json& v) { c.inject_count = json_to_size(v, "inject_count"); });
    assign_if_present(s, "level_step",
                      [&](const nlohmann::json& v) { c.level_step = json_to_double(v, "level_step"); });
  }

  if (document.contains("session")) {
    const auto& s = document.at("session");
    auto& c = config.session;
    assign_if_present(s, "session_size",
                      [&](const nlohmann::json& v) { c.session_size = json_to_size(v, "session_size"); });
    assign_if_present(s, "analytics_queue_capacity", [&](const nlohmann::json& v) {
      c.analytics_queue_capacity = json_to_size(v, "analytics_queue_capacity");
    });
  }

  config.validate();
  return config;
}

nlohmann::json to_json(const EngineConfig& config) {
  nlohmann::json scheduler = nlohmann::json::object();
  scheduler["initial_stability_days"] = config.scheduler.initial_stability_days;
  scheduler["lapse_stability_days"] = config.scheduler.lapse_stability_days;
  scheduler["max_stability_days"] = config.scheduler.max_stability_days;
  scheduler["difficulty_min"] = config.scheduler.difficulty_min;
  scheduler["difficulty_max"] = config.scheduler.difficulty_max;
  scheduler["initial_difficulty"] = config.scheduler.initial_difficulty;
  scheduler["base_difficulty_influence"] = config.scheduler.base_difficulty_influence;
  scheduler["difficulty_step_up"] = config.scheduler.difficulty_step_up;
  scheduler["difficulty_step_down"] = config.scheduler.difficulty_step_down;
  scheduler["max_growth"] = config.scheduler.max_growth;
  scheduler["min_growth"] = config.scheduler.min_growth;
  scheduler["growth_slope"] = config.scheduler.growth_slope;

  nlohmann::json store = nlohmann::json::object();
  store["idle_timeout_ms"] = static_cast<long long>(config.store.idle_timeout.count());
  store["janitor_interval_ms"] = static_cast<long long>(config.store.janitor_interval.count());
  store["max_write_retries"] = config.store.max_write_retries;
  store["retry_backoff_ms"] = static_cast<long long>(config.store.retry_backoff.count());

  nlohmann::json controller = nlohmann::json::object();
  controller["low_threshold"] = config.controller.low_threshold;
  controller["high_threshold"] = config.controller.high_threshold;
  controller["min_window"] = config.controller.min_window;
  controller["window_size"] = config.controller.window_size;
  controller["inject_count"] = config.controller.inject_count;
  controller["level_step"] = config.controller.level_step;

  nlohmann::json session = nlohmann::json::object();
  session["session_size"] = config.session.session_size;
  session["analytics_queue_capacity"] = config.session.analytics_queue_capacity;

  nlohmann::json document = nlohmann::json::object();
  document["scheduler"] = std::move(scheduler);
  document["store"] = std::move(store);
  document["controller"] = std::move(controller);
  document["session"] = std::move(session);
  return document;
}

EngineConfig load_engine_config(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError("Engine config not found at: " + path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw ConfigError("Failed to open engine config: " + path.string());
  }
  nlohmann::json document;
  try {
    stream >> document;
  } catch (const nlohmann::json::parse_error& ex) {
    throw ConfigError("Malformed engine config " + path.string() + ": " + ex.what());
  }
  return engine_config_from_json(document);
}

} // namespace sz
