#include "engine/workflow_context.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace taskstream::engine {

WorkflowContext::WorkflowContext(LocalEngine &engine, CallerState state, std::shared_ptr<ReplayLog> log)
    : engine_(engine), state_(std::move(state)), log_(log ? std::move(log) : std::make_shared<ReplayLog>()) {}

bool WorkflowContext::replaying() const {
  return log_->find(next_sequence_).has_value();
}

json WorkflowContext::execute_activity(const ActivityName &activity, const json &payload) {
  return execute_activity(activity, payload, engine_.default_options());
}

json WorkflowContext::execute_activity(const ActivityName &activity, const json &payload, const ActivityOptions &options) {
  auto sequence = next_sequence_++;

  if (auto recorded = log_->find(sequence)) {
    if (recorded->activity != activity) {
      throw std::logic_error("Replay mismatch at #" + std::to_string(sequence) + ": recorded " + recorded->activity + ", got " +
                             activity);
    }
    spdlog::debug("[Engine] Replayed #{} {} from log", sequence, activity);
    return recorded->result;
  }

  auto result = engine_.dispatch(state_, activity, payload, options).get();
  log_->record(sequence, activity, result);
  return result;
}

}  // namespace taskstream::engine
