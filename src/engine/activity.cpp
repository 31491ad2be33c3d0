#include "engine/activity.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "core/errors.hpp"

namespace taskstream::engine {

namespace {

thread_local int current_attempt = 0;

}  // namespace

RetryPolicy RetryPolicy::from(const RetrySettings &settings) {
  RetryPolicy policy;
  policy.max_attempts = std::max(1, settings.max_attempts);
  policy.initial_interval = std::chrono::milliseconds(settings.initial_interval_ms);
  policy.backoff_coefficient = settings.backoff_coefficient;
  policy.max_interval = std::chrono::milliseconds(settings.max_interval_ms);
  return policy;
}

std::chrono::milliseconds RetryPolicy::backoff_for(int attempt) const {
  if (attempt <= 1) {
    return std::chrono::milliseconds(0);
  }
  double delay = static_cast<double>(initial_interval.count()) * std::pow(backoff_coefficient, attempt - 2);
  delay = std::min(delay, static_cast<double>(max_interval.count()));
  return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

bool RetryPolicy::should_retry(const std::exception &error, int attempt) const {
  if (attempt >= max_attempts) {
    return false;
  }

  if (non_retryable) {
    return !non_retryable(error);
  }

  if (auto *agent_error = dynamic_cast<const AgentError *>(&error)) {
    return agent_error->retryable();
  }
  return dynamic_cast<const std::logic_error *>(&error) == nullptr;
}

void ActivityRegistry::register_activity(const ActivityName &name, ActivityFn fn) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (activities_.count(name)) {
    spdlog::warn("[Engine] Replacing activity {}", name);
  }
  activities_[name] = std::move(fn);
}

std::optional<ActivityFn> ActivityRegistry::find(const ActivityName &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = activities_.find(name);
  if (it == activities_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ActivityRegistry::contains(const ActivityName &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return activities_.count(name) > 0;
}

std::vector<ActivityName> ActivityRegistry::names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ActivityName> result;
  for (const auto &[name, fn] : activities_) {
    result.push_back(name);
  }
  return result;
}

int attempt() {
  return current_attempt > 0 ? current_attempt : 1;
}

AttemptScope::AttemptScope(int attempt) : previous_(current_attempt) {
  current_attempt = attempt;
}

AttemptScope::~AttemptScope() {
  current_attempt = previous_;
}

}  // namespace taskstream::engine
