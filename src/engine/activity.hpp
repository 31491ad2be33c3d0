#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/types.hpp"

namespace taskstream::engine {

// An activity body: payload in, result out. Throws to fail the attempt.
using ActivityFn = std::function<json(const json &payload)>;

// Engine-side retry policy of one dispatch
struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_interval{100};
  double backoff_coefficient = 2.0;
  std::chrono::milliseconds max_interval{10000};

  // Errors for which no further attempt is made. Unset: non-retryable
  // AgentErrors and logic errors stop the retry loop.
  std::function<bool(const std::exception &)> non_retryable;

  static RetryPolicy from(const RetrySettings &settings);

  // Delay before the given attempt (attempt 1 has no delay)
  std::chrono::milliseconds backoff_for(int attempt) const;

  bool should_retry(const std::exception &error, int attempt) const;
};

struct ActivityOptions {
  RetryPolicy retry;
};

// Name -> activity body
class ActivityRegistry {
 public:
  void register_activity(const ActivityName &name, ActivityFn fn);

  std::optional<ActivityFn> find(const ActivityName &name) const;

  bool contains(const ActivityName &name) const;

  std::vector<ActivityName> names() const;

 private:
  mutable std::mutex mutex_;
  std::map<ActivityName, ActivityFn> activities_;
};

// Attempt number of the activity running on this thread (1-based).
// Returns 1 outside of an activity.
int attempt();

// Sets the current attempt number for the lifetime of the guard
class AttemptScope {
 public:
  explicit AttemptScope(int attempt);
  ~AttemptScope();

  AttemptScope(const AttemptScope &) = delete;
  AttemptScope &operator=(const AttemptScope &) = delete;

 private:
  int previous_;
};

}  // namespace taskstream::engine
