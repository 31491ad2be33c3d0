#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace taskstream {

using json = nlohmann::json;

// Type aliases
using TaskId = std::string;
using MessageId = std::string;
using TraceId = std::string;
using SpanId = std::string;
using ActivityName = std::string;

using Timestamp = std::chrono::system_clock::time_point;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Token usage tracking
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
  int64_t cache_read_tokens = 0;
  int64_t cache_write_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    cache_read_tokens += other.cache_read_tokens;
    cache_write_tokens += other.cache_write_tokens;
    return *this;
  }

  json to_json() const;
  static TokenUsage from_json(const json &j);
};

// Finish reason reported by the agent capability
enum class FinishReason {
  Stop,       // Natural completion
  ToolCalls,  // Needs tool execution
  Length,     // Token limit reached
  Error,      // Error occurred
  Cancelled   // Cancelled by the engine
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string &str);

// Who authored a message or content block
enum class Author {
  User,
  Agent
};

std::string to_string(Author author);

Author author_from_string(const std::string &str);

// Incremental content kinds carried by a Delta event
enum class DeltaKind {
  Text,
  Reasoning
};

std::string to_string(DeltaKind kind);

std::optional<DeltaKind> delta_kind_from_string(const std::string &str);

// Persisted streaming status of a message
enum class StreamingStatus {
  InProgress,
  Done
};

std::string to_string(StreamingStatus status);

StreamingStatus streaming_status_from_string(const std::string &str);

// Streaming session lifecycle
enum class SessionState {
  Opening,
  Open,
  Closing,
  Closed,
  Aborted
};

std::string to_string(SessionState state);

// Replace invalid UTF-8 sequences with U+FFFD so the text can be serialized to JSON
std::string sanitize_utf8(const std::string &input);

// True if the input is well-formed UTF-8
bool is_valid_utf8(const std::string &input);

// Length of a multi-byte sequence cut off at the end of the input, 0 if the
// input ends on a character boundary
size_t utf8_incomplete_suffix(const std::string &input);

}  // namespace taskstream
