#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "context/context_store.hpp"
#include "core/config.hpp"
#include "core/types.hpp"

namespace taskstream {

// Metadata attached to a dispatch. Values are JSON-encoded payloads.
using Headers = std::map<std::string, std::string>;

// Encode a header value the way the engine's payload converter does ("t1" -> "\"t1\"")
std::string encode_header_value(const std::string &value);

// Decode a header value. A JSON string yields its content, text that is not
// JSON is taken as-is. Empty, non-UTF-8 and non-string JSON values fail.
Result<std::string> decode_header_value(const std::string &raw);

// The caller's long-lived state (the workflow side of a dispatch)
struct CallerState {
  std::optional<TaskId> task_id;
  std::optional<TraceId> trace_id;
  std::optional<SpanId> parent_span_id;

  ExecutionContext context() const {
    return ExecutionContext{task_id, trace_id, parent_span_id};
  }
};

// Hook pair invoked by the engine around every activity dispatch
class Interceptor {
 public:
  virtual ~Interceptor() = default;

  // Caller side, before the dispatch leaves. Must be pure and non-blocking:
  // it may run again when the caller is replayed.
  virtual void on_outbound_dispatch(const CallerState &state, const ActivityName &activity, Headers &headers) = 0;

  // Execution side, before the activity body runs
  virtual ExecutionContext on_inbound_receipt(const ActivityName &activity, const Headers &headers) = 0;
};

// Threads task_id / trace_id / parent_span_id through dispatch headers
class ContextInterceptor : public Interceptor {
 public:
  explicit ContextInterceptor(const Config &config = Config{});

  void on_outbound_dispatch(const CallerState &state, const ActivityName &activity, Headers &headers) override;
  ExecutionContext on_inbound_receipt(const ActivityName &activity, const Headers &headers) override;

 private:
  std::optional<std::string> read_field(const Headers &headers, const std::string &key) const;

  HeaderKeys keys_;
  Config config_;
};

// Ordered list of interceptors
class InterceptorChain {
 public:
  void add(std::shared_ptr<Interceptor> interceptor);

  // Runs every interceptor in registration order
  void on_outbound_dispatch(const CallerState &state, const ActivityName &activity, Headers &headers) const;

  // Merges the decoded contexts in registration order; the first non-empty
  // value of each field wins
  ExecutionContext on_inbound_receipt(const ActivityName &activity, const Headers &headers) const;

  size_t size() const {
    return interceptors_.size();
  }

  bool empty() const {
    return interceptors_.empty();
  }

 private:
  std::vector<std::shared_ptr<Interceptor>> interceptors_;
};

}  // namespace taskstream
