#pragma once

#include <memory>
#include <optional>

#include "engine/activity.hpp"
#include "engine/local_engine.hpp"
#include "engine/replay_log.hpp"
#include "interceptor/interceptor.hpp"

namespace taskstream::engine {

// Caller-side deterministic state. Activity results are recorded in a
// ReplayLog; when the caller is replayed against an existing log, recorded
// results are returned without dispatching again.
class WorkflowContext {
 public:
  WorkflowContext(LocalEngine &engine, CallerState state, std::shared_ptr<ReplayLog> log = std::make_shared<ReplayLog>());

  // Blocks until the activity finishes. Throws ActivityError if it fails,
  // std::logic_error if a replayed dispatch does not match the log.
  json execute_activity(const ActivityName &activity, const json &payload);
  json execute_activity(const ActivityName &activity, const json &payload, const ActivityOptions &options);

  CallerState &state() {
    return state_;
  }
  const CallerState &state() const {
    return state_;
  }

  std::shared_ptr<ReplayLog> log() const {
    return log_;
  }

  // True while the next dispatch will be served from the log
  bool replaying() const;

  uint64_t next_sequence() const {
    return next_sequence_;
  }

 private:
  LocalEngine &engine_;
  CallerState state_;
  std::shared_ptr<ReplayLog> log_;
  uint64_t next_sequence_ = 0;
};

}  // namespace taskstream::engine
