#pragma once

#include <optional>
#include <string>

#include "core/types.hpp"

namespace taskstream {

// Identity of the task an execution is working on. Any field may be absent.
struct ExecutionContext {
  std::optional<TaskId> task_id;
  std::optional<TraceId> trace_id;
  std::optional<SpanId> parent_span_id;

  bool empty() const {
    return !task_id && !trace_id && !parent_span_id;
  }

  bool has_task() const {
    return task_id.has_value();
  }

  bool operator==(const ExecutionContext &) const = default;

  json to_json() const;
  static ExecutionContext from_json(const json &j);
};

// Per-execution storage of the ExecutionContext.
//
// Storage is thread_local: an execution runs start-to-finish on one worker
// thread, so siblings on other threads never observe each other, and a
// thread reused for a later execution starts clean once the previous scope
// is cleared.
class ContextStore {
 public:
  // Install ctx for the current execution. Returns false (and leaves the
  // installed context untouched) if one is already installed.
  static bool set(const ExecutionContext &ctx);

  // The installed context, or an empty one. Never throws.
  static ExecutionContext get();

  static void clear();

  static bool installed();
};

// Installs a context for the lifetime of the guard and restores whatever an
// enclosing scope had installed on destruction.
class ContextScope {
 public:
  explicit ContextScope(const ExecutionContext &ctx);
  ~ContextScope();

  ContextScope(const ContextScope &) = delete;
  ContextScope &operator=(const ContextScope &) = delete;

 private:
  std::optional<ExecutionContext> previous_;
};

}  // namespace taskstream
