#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace taskstream {

// Configuration paths
namespace config_paths {
std::filesystem::path home_dir();

std::filesystem::path config_dir();

std::filesystem::path default_config_file();

std::filesystem::path project_config_file();

std::filesystem::path default_store_dir();
}  // namespace config_paths

// Header keys used to carry the execution context across a dispatch
struct HeaderKeys {
  std::string task_id = "streaming-task-id";
  std::string trace_id = "streaming-trace-id";
  std::string parent_span_id = "streaming-parent-span-id";
};

// Engine-side retry policy for one activity
struct RetrySettings {
  int max_attempts = 3;
  int64_t initial_interval_ms = 100;
  double backoff_coefficient = 2.0;
  int64_t max_interval_ms = 10000;
};

// Application configuration
struct Config {
  HeaderKeys headers;

  // Activities whose dispatch carries the context headers (empty = all).
  // An activity matches if its name contains one of these entries.
  std::vector<std::string> intercepted_activities;

  // Local engine worker pool
  struct WorkerSettings {
    size_t threads = 4;
  } worker;

  RetrySettings retry;

  // Channel settings
  struct StreamSettings {
    std::string topic_prefix = "task:";
    int64_t abandoned_timeout_ms = 30000;
  } stream;

  // Directory of the JSON message sink
  std::filesystem::path store_dir = config_paths::default_store_dir();

  // Logging
  std::string log_level = "info";
  std::optional<std::filesystem::path> log_file;
  int log_keep = 5;  // Logs of earlier runs kept beside log_file

  // Load from file
  static Config load(const std::filesystem::path& path);

  // Load default config from project/global config files
  static Config load_default();

  // Load config from environment variables, with file config as base
  // Reads: TASKSTREAM_LOG_LEVEL, TASKSTREAM_STORE_DIR,
  //        TASKSTREAM_WORKER_THREADS, TASKSTREAM_MAX_ATTEMPTS
  static Config from_env();

  // Save to file
  void save(const std::filesystem::path& path) const;

  // Whether dispatches of this activity should be stamped with context headers
  bool intercepts(const ActivityName& activity) const;

  // Channel topic for a task
  std::string topic_for(const TaskId& task_id) const;
};

}  // namespace taskstream
