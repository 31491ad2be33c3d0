#include "tracing/tracer.hpp"

#include <spdlog/spdlog.h>

#include "core/uuid.hpp"

namespace taskstream::tracing {

namespace {

int64_t to_millis(Timestamp t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

}  // namespace

json Span::to_json() const {
  json j;
  j["trace_id"] = trace_id;
  j["id"] = span_id;
  j["parent_id"] = parent_id ? json(*parent_id) : json(nullptr);
  j["name"] = name;
  j["input"] = input;
  j["output"] = output;
  j["data"] = data;
  if (error) {
    j["error"] = *error;
  }
  j["start_time"] = to_millis(start_time);
  j["end_time"] = end_time ? json(to_millis(*end_time)) : json(nullptr);
  return j;
}

// --- InMemorySpanSink ---

void InMemorySpanSink::on_span_start(const Span & /* span */) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++started_;
}

void InMemorySpanSink::on_span_end(const Span &span) {
  std::lock_guard<std::mutex> lock(mutex_);
  spans_.push_back(span);
}

std::vector<Span> InMemorySpanSink::spans() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spans_;
}

std::vector<Span> InMemorySpanSink::spans_for_trace(const TraceId &trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Span> result;
  for (const auto &span : spans_) {
    if (span.trace_id == trace_id) {
      result.push_back(span);
    }
  }
  return result;
}

size_t InMemorySpanSink::started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_;
}

// --- LogSpanSink ---

void LogSpanSink::on_span_start(const Span &span) {
  spdlog::debug("[Trace {}] Span {} '{}' started (parent {})", span.trace_id, span.span_id, span.name, span.parent_id.value_or("-"));
}

void LogSpanSink::on_span_end(const Span &span) {
  auto elapsed = span.end_time ? std::chrono::duration_cast<std::chrono::milliseconds>(*span.end_time - span.start_time).count() : 0;
  if (span.error) {
    spdlog::warn("[Trace {}] Span {} '{}' failed after {}ms: {}", span.trace_id, span.span_id, span.name, elapsed, *span.error);
  } else {
    spdlog::debug("[Trace {}] Span {} '{}' ended after {}ms", span.trace_id, span.span_id, span.name, elapsed);
  }
}

// --- ScopedSpan ---

ScopedSpan::ScopedSpan(Span span, std::vector<std::shared_ptr<SpanSink>> sinks) : span_(std::move(span)), sinks_(std::move(sinks)) {}

ScopedSpan::ScopedSpan(ScopedSpan &&other) noexcept
    : span_(std::move(other.span_)), sinks_(std::move(other.sinks_)), active_(other.active_) {
  other.active_ = false;
}

ScopedSpan::~ScopedSpan() {
  try {
    end();
  } catch (const std::exception &e) {
    spdlog::error("[Trace {}] Failed to end span {}: {}", span_.trace_id, span_.span_id, e.what());
  }
}

void ScopedSpan::set_output(json output) {
  span_.output = std::move(output);
}

void ScopedSpan::set_data(json data) {
  span_.data = std::move(data);
}

void ScopedSpan::set_error(const std::string &error) {
  span_.error = error;
}

void ScopedSpan::end() {
  if (!active_) {
    return;
  }
  active_ = false;
  span_.end_time = std::chrono::system_clock::now();
  for (const auto &sink : sinks_) {
    sink->on_span_end(span_);
  }
}

// --- Tracer ---

Tracer::Tracer(std::vector<std::shared_ptr<SpanSink>> sinks) : sinks_(std::move(sinks)) {}

void Tracer::add_sink(std::shared_ptr<SpanSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_.push_back(std::move(sink));
}

ScopedSpan Tracer::start_span(const TraceId &trace_id, const std::optional<SpanId> &parent_id, const std::string &name, json input) {
  Span span;
  span.trace_id = trace_id;
  span.span_id = UUID::generate();
  span.parent_id = parent_id;
  span.name = name;
  span.input = std::move(input);
  span.start_time = std::chrono::system_clock::now();

  std::vector<std::shared_ptr<SpanSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks = sinks_;
  }

  for (const auto &sink : sinks) {
    sink->on_span_start(span);
  }
  return ScopedSpan(std::move(span), std::move(sinks));
}

}  // namespace taskstream::tracing
