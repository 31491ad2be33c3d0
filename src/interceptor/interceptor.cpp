#include "interceptor/interceptor.hpp"

#include <spdlog/spdlog.h>

namespace taskstream {

std::string encode_header_value(const std::string &value) {
  return json(value).dump();
}

Result<std::string> decode_header_value(const std::string &raw) {
  if (raw.empty()) {
    return Result<std::string>::failure("empty value");
  }
  if (!is_valid_utf8(raw)) {
    return Result<std::string>::failure("value is not valid UTF-8");
  }

  json parsed = json::parse(raw, nullptr, false);
  if (parsed.is_discarded()) {
    // Plain text written by a producer that does not JSON-encode
    return Result<std::string>::success(raw);
  }
  if (!parsed.is_string()) {
    return Result<std::string>::failure("expected a string payload, got " + std::string(parsed.type_name()));
  }

  auto value = parsed.get<std::string>();
  if (value.empty()) {
    return Result<std::string>::failure("empty string payload");
  }
  return Result<std::string>::success(std::move(value));
}

// --- ContextInterceptor ---

ContextInterceptor::ContextInterceptor(const Config &config) : keys_(config.headers), config_(config) {
  spdlog::debug("[Interceptor] Initialized (keys: {}, {}, {})", keys_.task_id, keys_.trace_id, keys_.parent_span_id);
}

void ContextInterceptor::on_outbound_dispatch(const CallerState &state, const ActivityName &activity, Headers &headers) {
  if (!config_.intercepts(activity)) {
    return;
  }

  if (state.task_id) headers[keys_.task_id] = encode_header_value(*state.task_id);
  if (state.trace_id) headers[keys_.trace_id] = encode_header_value(*state.trace_id);
  if (state.parent_span_id) headers[keys_.parent_span_id] = encode_header_value(*state.parent_span_id);

  if (!state.task_id) {
    spdlog::debug("[Interceptor] Dispatch of {} carries no task id", activity);
  }
}

std::optional<std::string> ContextInterceptor::read_field(const Headers &headers, const std::string &key) const {
  auto it = headers.find(key);
  if (it == headers.end()) {
    return std::nullopt;
  }

  auto decoded = decode_header_value(it->second);
  if (!decoded.ok()) {
    spdlog::warn("[Interceptor] Ignoring malformed header {}: {}", key, decoded.error.value_or("unknown error"));
    return std::nullopt;
  }
  return decoded.value;
}

ExecutionContext ContextInterceptor::on_inbound_receipt(const ActivityName &activity, const Headers &headers) {
  ExecutionContext ctx;
  ctx.task_id = read_field(headers, keys_.task_id);
  ctx.trace_id = read_field(headers, keys_.trace_id);
  ctx.parent_span_id = read_field(headers, keys_.parent_span_id);

  if (ctx.has_task()) {
    spdlog::info("[Interceptor] {} receives task {} (trace {}, parent span {})", activity, *ctx.task_id,
                 ctx.trace_id.value_or("-"), ctx.parent_span_id.value_or("-"));
  } else {
    spdlog::debug("[Interceptor] {} received no task id", activity);
  }
  return ctx;
}

// --- InterceptorChain ---

void InterceptorChain::add(std::shared_ptr<Interceptor> interceptor) {
  if (interceptor) {
    interceptors_.push_back(std::move(interceptor));
  }
}

void InterceptorChain::on_outbound_dispatch(const CallerState &state, const ActivityName &activity, Headers &headers) const {
  for (const auto &interceptor : interceptors_) {
    interceptor->on_outbound_dispatch(state, activity, headers);
  }
}

ExecutionContext InterceptorChain::on_inbound_receipt(const ActivityName &activity, const Headers &headers) const {
  ExecutionContext merged;
  for (const auto &interceptor : interceptors_) {
    auto ctx = interceptor->on_inbound_receipt(activity, headers);
    if (!merged.task_id) merged.task_id = ctx.task_id;
    if (!merged.trace_id) merged.trace_id = ctx.trace_id;
    if (!merged.parent_span_id) merged.parent_span_id = ctx.parent_span_id;
  }
  return merged;
}

}  // namespace taskstream
