#include "config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace taskstream {

namespace fs = std::filesystem;

Config Config::load(const fs::path& path) {
  Config config;

  if (!fs::exists(path)) {
    return config;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return config;
  }

  try {
    json j = json::parse(file);

    // Header keys
    if (j.contains("headers")) {
      const auto& h = j["headers"];
      config.headers.task_id = h.value("task_id", config.headers.task_id);
      config.headers.trace_id = h.value("trace_id", config.headers.trace_id);
      config.headers.parent_span_id = h.value("parent_span_id", config.headers.parent_span_id);
    }

    if (j.contains("intercepted_activities")) {
      for (const auto& name : j["intercepted_activities"]) {
        config.intercepted_activities.push_back(name);
      }
    }

    if (j.contains("worker")) {
      config.worker.threads = j["worker"].value("threads", config.worker.threads);
    }

    if (j.contains("retry")) {
      const auto& r = j["retry"];
      config.retry.max_attempts = r.value("max_attempts", config.retry.max_attempts);
      config.retry.initial_interval_ms = r.value("initial_interval_ms", config.retry.initial_interval_ms);
      config.retry.backoff_coefficient = r.value("backoff_coefficient", config.retry.backoff_coefficient);
      config.retry.max_interval_ms = r.value("max_interval_ms", config.retry.max_interval_ms);
    }

    if (j.contains("stream")) {
      const auto& s = j["stream"];
      config.stream.topic_prefix = s.value("topic_prefix", config.stream.topic_prefix);
      config.stream.abandoned_timeout_ms = s.value("abandoned_timeout_ms", config.stream.abandoned_timeout_ms);
    }

    if (j.contains("store_dir")) {
      config.store_dir = j["store_dir"].get<std::string>();
    }

    config.log_level = j.value("log_level", "info");
    if (j.contains("log_file")) {
      config.log_file = j["log_file"].get<std::string>();
    }
    config.log_keep = j.value("log_keep", config.log_keep);

  } catch (const std::exception& e) {
    spdlog::warn("Failed to parse config {}: {}, using defaults", path.string(), e.what());
    return Config{};
  }

  if (config.worker.threads == 0) {
    config.worker.threads = 1;
  }
  if (config.retry.max_attempts < 1) {
    config.retry.max_attempts = 1;
  }

  return config;
}

Config Config::load_default() {
  // Try to load from project config first, then global
  auto project_config = config_paths::project_config_file();
  if (fs::exists(project_config)) {
    return load(project_config);
  }

  auto global_config = config_paths::default_config_file();
  if (fs::exists(global_config)) {
    return load(global_config);
  }

  return Config{};
}

Config Config::from_env() {
  Config config = load_default();

  if (const char* level = std::getenv("TASKSTREAM_LOG_LEVEL")) {
    config.log_level = level;
  }

  if (const char* store_dir = std::getenv("TASKSTREAM_STORE_DIR")) {
    config.store_dir = store_dir;
  }

  if (const char* threads = std::getenv("TASKSTREAM_WORKER_THREADS")) {
    try {
      auto n = std::stoul(threads);
      if (n > 0) config.worker.threads = n;
    } catch (const std::exception&) {
      spdlog::warn("Ignoring invalid TASKSTREAM_WORKER_THREADS: {}", threads);
    }
  }

  if (const char* attempts = std::getenv("TASKSTREAM_MAX_ATTEMPTS")) {
    try {
      auto n = std::stoi(attempts);
      if (n > 0) config.retry.max_attempts = n;
    } catch (const std::exception&) {
      spdlog::warn("Ignoring invalid TASKSTREAM_MAX_ATTEMPTS: {}", attempts);
    }
  }

  return config;
}

void Config::save(const fs::path& path) const {
  json j;

  j["headers"] = {{"task_id", headers.task_id}, {"trace_id", headers.trace_id}, {"parent_span_id", headers.parent_span_id}};
  j["intercepted_activities"] = intercepted_activities;
  j["worker"] = {{"threads", worker.threads}};
  j["retry"] = {{"max_attempts", retry.max_attempts},
                {"initial_interval_ms", retry.initial_interval_ms},
                {"backoff_coefficient", retry.backoff_coefficient},
                {"max_interval_ms", retry.max_interval_ms}};
  j["stream"] = {{"topic_prefix", stream.topic_prefix}, {"abandoned_timeout_ms", stream.abandoned_timeout_ms}};
  j["store_dir"] = store_dir.string();

  j["log_level"] = log_level;
  if (log_file) {
    j["log_file"] = log_file->string();
  }
  j["log_keep"] = log_keep;

  // Write to file
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
  }
  std::ofstream file(path);
  if (file.is_open()) {
    file << j.dump(2);
  } else {
    spdlog::warn("Failed to write config file: {}", path.string());
  }
}

bool Config::intercepts(const ActivityName& activity) const {
  if (intercepted_activities.empty()) {
    return true;
  }
  return std::any_of(intercepted_activities.begin(), intercepted_activities.end(), [&activity](const std::string& name) {
    return activity.find(name) != std::string::npos;
  });
}

std::string Config::topic_for(const TaskId& task_id) const {
  return stream.topic_prefix + task_id;
}

namespace config_paths {

fs::path home_dir() {
  if (const char* home = std::getenv("HOME")) {
    return home;
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "taskstream";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

fs::path project_config_file() {
  return fs::current_path() / ".taskstream" / "config.json";
}

fs::path default_store_dir() {
  return config_dir() / "messages";
}

}  // namespace config_paths

}  // namespace taskstream
