#pragma once

#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace sz {

struct SchedulerConfig {
  double initial_stability_days = 1.0;
  double lapse_stability_days = 1.0;
  double max_stability_days = 3650.0;
  double difficulty_min = 0.3;
  double difficulty_max = 5.0;
  double initial_difficulty = 1.0;
  double base_difficulty_influence = 1.0;
  double difficulty_step_up = 0.2;
  double difficulty_step_down = 0.05;
  double max_growth = 2.5;
  double min_growth = 1.3;
  double growth_slope = 0.5;

  void validate() const;
};

struct StoreConfig {
  std::chrono::milliseconds idle_timeout{30 * 60 * 1000};
  std::chrono::milliseconds janitor_interval{60 * 1000};
  int max_write_retries = 3;
  std::chrono::milliseconds retry_backoff{50};

  void validate() const;
};

struct ControllerConfig {
  double low_threshold = 0.6;
  double high_threshold = 0.9;
  int min_window = 5;
  std::size_t window_size = 10;
  std::size_t inject_count = 3;
  double level_step = 0.2;

  void validate() const;
};

struct SessionConfig {
  std::size_t session_size = 20;
  std::size_t analytics_queue_capacity = 1024;

  void validate() const;
};

struct EngineConfig {
  SchedulerConfig scheduler;
  StoreConfig store;
  ControllerConfig controller;
  SessionConfig session;

  void validate() const;
};

EngineConfig engine_config_from_json(const nlohmann::json& document);
nlohmann::json to_json(const EngineConfig& config);

// Reads a JSON config file; missing keys keep their defaults.
EngineConfig load_engine_config(const std::filesystem::path& path);

} // namespace sz
