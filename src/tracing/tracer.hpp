#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace taskstream::tracing {

struct Span {
  TraceId trace_id;
  SpanId span_id;
  std::optional<SpanId> parent_id;
  std::string name;
  json input;
  json output;
  json data;
  std::optional<std::string> error;
  Timestamp start_time;
  std::optional<Timestamp> end_time;

  bool ended() const {
    return end_time.has_value();
  }

  json to_json() const;
};

// Receives span lifecycle notifications
class SpanSink {
 public:
  virtual ~SpanSink() = default;

  virtual void on_span_start(const Span &span) = 0;
  virtual void on_span_end(const Span &span) = 0;
};

// Keeps ended spans in memory
class InMemorySpanSink : public SpanSink {
 public:
  void on_span_start(const Span &span) override;
  void on_span_end(const Span &span) override;

  std::vector<Span> spans() const;
  std::vector<Span> spans_for_trace(const TraceId &trace_id) const;
  size_t started() const;

 private:
  mutable std::mutex mutex_;
  std::vector<Span> spans_;
  size_t started_ = 0;
};

// Writes spans to the log
class LogSpanSink : public SpanSink {
 public:
  void on_span_start(const Span &span) override;
  void on_span_end(const Span &span) override;
};

// Ends the span when it goes out of scope
class ScopedSpan {
 public:
  ScopedSpan(Span span, std::vector<std::shared_ptr<SpanSink>> sinks);
  ~ScopedSpan();

  ScopedSpan(ScopedSpan &&other) noexcept;
  ScopedSpan(const ScopedSpan &) = delete;
  ScopedSpan &operator=(const ScopedSpan &) = delete;
  ScopedSpan &operator=(ScopedSpan &&) = delete;

  void set_output(json output);
  void set_data(json data);
  void set_error(const std::string &error);

  // Idempotent
  void end();

  const Span &span() const {
    return span_;
  }

 private:
  Span span_;
  std::vector<std::shared_ptr<SpanSink>> sinks_;
  bool active_ = true;
};

class Tracer {
 public:
  Tracer() = default;
  explicit Tracer(std::vector<std::shared_ptr<SpanSink>> sinks);

  void add_sink(std::shared_ptr<SpanSink> sink);

  ScopedSpan start_span(const TraceId &trace_id, const std::optional<SpanId> &parent_id, const std::string &name,
                        json input = nullptr);

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<SpanSink>> sinks_;
};

}  // namespace taskstream::tracing
