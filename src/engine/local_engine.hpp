#pragma once

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>

#include "core/config.hpp"
#include "core/types.hpp"
#include "engine/activity.hpp"
#include "interceptor/interceptor.hpp"

namespace taskstream::engine {

// In-process durable-execution engine.
//
// Dispatch runs the outbound interceptors on the caller thread, then
// executes the activity on a pool thread with the context decoded by the
// inbound interceptors installed for the duration of the attempt. Failed
// attempts are retried with backoff until the retry policy gives up.
class LocalEngine {
 public:
  LocalEngine(const Config &config, std::shared_ptr<ActivityRegistry> registry, InterceptorChain interceptors);
  ~LocalEngine();

  LocalEngine(const LocalEngine &) = delete;
  LocalEngine &operator=(const LocalEngine &) = delete;

  // Throws std::invalid_argument for unknown activities. The future carries
  // the activity result or an ActivityError.
  std::future<json> dispatch(const CallerState &state, const ActivityName &activity, const json &payload);
  std::future<json> dispatch(const CallerState &state, const ActivityName &activity, const json &payload, const ActivityOptions &options);

  // Default options built from the configured retry settings
  ActivityOptions default_options() const;

  // Blocks until every queued attempt has finished. No dispatch may follow.
  void shutdown();

  size_t attempts_started() const {
    return attempts_started_;
  }

 private:
  struct Job {
    ActivityName activity;
    ActivityFn fn;
    json payload;
    Headers headers;
    ActivityOptions options;
    std::promise<json> promise;
  };

  void run_attempt(std::shared_ptr<Job> job, int attempt);
  void schedule_retry(std::shared_ptr<Job> job, int next_attempt);

  Config config_;
  std::shared_ptr<ActivityRegistry> registry_;
  InterceptorChain interceptors_;
  asio::thread_pool pool_;
  std::atomic<size_t> attempts_started_{0};
};

}  // namespace taskstream::engine
