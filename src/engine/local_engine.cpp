#include "engine/local_engine.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "bus/bus.hpp"
#include "context/context_store.hpp"
#include "core/errors.hpp"

namespace taskstream::engine {

LocalEngine::LocalEngine(const Config &config, std::shared_ptr<ActivityRegistry> registry, InterceptorChain interceptors)
    : config_(config), registry_(std::move(registry)), interceptors_(std::move(interceptors)), pool_(config.worker.threads) {
  spdlog::info("[Engine] Started with {} worker thread(s), {} interceptor(s)", config_.worker.threads, interceptors_.size());
}

LocalEngine::~LocalEngine() {
  shutdown();
}

void LocalEngine::shutdown() {
  pool_.join();
}

ActivityOptions LocalEngine::default_options() const {
  return ActivityOptions{RetryPolicy::from(config_.retry)};
}

std::future<json> LocalEngine::dispatch(const CallerState &state, const ActivityName &activity, const json &payload) {
  return dispatch(state, activity, payload, default_options());
}

std::future<json> LocalEngine::dispatch(const CallerState &state, const ActivityName &activity, const json &payload,
                                        const ActivityOptions &options) {
  auto fn = registry_->find(activity);
  if (!fn) {
    throw std::invalid_argument("Activity not registered: " + activity);
  }

  auto job = std::make_shared<Job>();
  job->activity = activity;
  job->fn = std::move(*fn);
  job->payload = payload;
  job->options = options;

  // Caller side: stamp headers before the dispatch leaves
  interceptors_.on_outbound_dispatch(state, activity, job->headers);

  auto future = job->promise.get_future();
  asio::post(pool_, [this, job]() {
    run_attempt(job, 1);
  });

  spdlog::debug("[Engine] Dispatched {} with {} header(s)", activity, job->headers.size());
  return future;
}

void LocalEngine::run_attempt(std::shared_ptr<Job> job, int attempt) {
  ++attempts_started_;

  auto ctx = interceptors_.on_inbound_receipt(job->activity, job->headers);
  std::optional<std::string> failure;
  bool retry = false;

  {
    ContextScope scope(ctx);
    AttemptScope attempt_scope(attempt);

    try {
      if (ctx.has_task()) {
        Bus::instance().publish(events::ContextInstalled{*ctx.task_id, job->activity});
      }

      json result = job->fn(job->payload);
      job->promise.set_value(std::move(result));
      spdlog::debug("[Engine] {} succeeded on attempt {}", job->activity, attempt);
      return;
    } catch (const std::exception &e) {
      failure = e.what();
      retry = job->options.retry.should_retry(e, attempt);
    } catch (...) {
      spdlog::error("[Engine] {} threw a non-standard exception on attempt {}", job->activity, attempt);
      job->promise.set_exception(std::current_exception());
      return;
    }
  }

  if (retry) {
    spdlog::warn("[Engine] {} failed on attempt {}/{}: {}", job->activity, attempt, job->options.retry.max_attempts, *failure);
    schedule_retry(job, attempt + 1);
    return;
  }

  spdlog::error("[Engine] {} failed on attempt {}, giving up: {}", job->activity, attempt, *failure);
  job->promise.set_exception(std::make_exception_ptr(ActivityError(job->activity, attempt, *failure)));
}

void LocalEngine::schedule_retry(std::shared_ptr<Job> job, int next_attempt) {
  auto delay = job->options.retry.backoff_for(next_attempt);
  auto timer = std::make_shared<asio::steady_timer>(pool_.get_executor(), delay);

  timer->async_wait([this, job, timer, next_attempt](const asio::error_code &ec) {
    if (ec) {
      job->promise.set_exception(std::make_exception_ptr(ActivityError(job->activity, next_attempt - 1, "retry timer: " + ec.message())));
      return;
    }
    run_attempt(job, next_attempt);
  });
}

}  // namespace taskstream::engine
