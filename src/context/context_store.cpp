#include "context/context_store.hpp"

#include <spdlog/spdlog.h>

namespace taskstream {

namespace {

thread_local std::optional<ExecutionContext> current_context;

std::string or_none(const std::optional<std::string> &value) {
  return value ? *value : "<none>";
}

}  // namespace

json ExecutionContext::to_json() const {
  json j = json::object();
  if (task_id) j["task_id"] = *task_id;
  if (trace_id) j["trace_id"] = *trace_id;
  if (parent_span_id) j["parent_span_id"] = *parent_span_id;
  return j;
}

ExecutionContext ExecutionContext::from_json(const json &j) {
  ExecutionContext ctx;
  if (j.contains("task_id") && j["task_id"].is_string()) {
    ctx.task_id = j["task_id"].get<std::string>();
  }
  if (j.contains("trace_id") && j["trace_id"].is_string()) {
    ctx.trace_id = j["trace_id"].get<std::string>();
  }
  if (j.contains("parent_span_id") && j["parent_span_id"].is_string()) {
    ctx.parent_span_id = j["parent_span_id"].get<std::string>();
  }
  return ctx;
}

bool ContextStore::set(const ExecutionContext &ctx) {
  if (current_context) {
    spdlog::warn("[ContextStore] Context already installed (task {}), ignoring second set (task {})",
                 or_none(current_context->task_id), or_none(ctx.task_id));
    return false;
  }
  current_context = ctx;
  spdlog::debug("[ContextStore] Installed task={} trace={} parent_span={}", or_none(ctx.task_id), or_none(ctx.trace_id),
                or_none(ctx.parent_span_id));
  return true;
}

ExecutionContext ContextStore::get() {
  if (!current_context) {
    return {};
  }
  return *current_context;
}

void ContextStore::clear() {
  current_context.reset();
}

bool ContextStore::installed() {
  return current_context.has_value();
}

ContextScope::ContextScope(const ExecutionContext &ctx) : previous_(current_context) {
  current_context.reset();
  ContextStore::set(ctx);
}

ContextScope::~ContextScope() {
  current_context = previous_;
}

}  // namespace taskstream
