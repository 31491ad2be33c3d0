#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/content.hpp"
#include "core/message.hpp"
#include "core/types.hpp"

namespace taskstream::llm {

// Native chunk types produced by an agent capability
struct TextDelta {
  std::string text;
};

struct ThinkingDelta {
  std::string text;
};

struct ToolCallDelta {
  std::string id;
  std::string name;
  std::string arguments_delta;  // Partial JSON
};

struct ToolCallComplete {
  std::string id;
  std::string name;
  json arguments;
};

struct ToolResultChunk {
  std::string tool_call_id;
  std::string name;
  std::string output;
};

struct GuardrailTripped {
  std::string guardrail;
  std::string message;
};

// Opaque token the capability hands back for continuing a multi-turn session
struct SessionInfo {
  std::string resume_token;
};

struct FinishStep {
  FinishReason reason = FinishReason::Stop;
  TokenUsage usage;
};

struct StreamError {
  std::string message;
  bool retryable = false;
};

using StreamEvent = std::variant<TextDelta, ThinkingDelta, ToolCallDelta, ToolCallComplete, ToolResultChunk, GuardrailTripped,
                                 SessionInfo, FinishStep, StreamError>;

// Stream callback
using StreamCallback = std::function<void(const StreamEvent &)>;

// Stop flag for one request. Setting it ends that stream early.
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline CancelToken make_cancel_token() {
  return std::make_shared<std::atomic<bool>>(false);
}

json chunk_to_json(const StreamEvent &event);
std::optional<StreamEvent> chunk_from_json(const json &j);

// Agent invocation request
struct AgentRequest {
  std::string model;
  std::string prompt;
  std::vector<AccumulatedMessage> prior_messages;
  std::string system_prompt;

  // Forwarded unchanged; never interpreted here
  std::optional<std::string> resume_token;

  json to_json() const;
};

// Agent response (non-streaming)
struct AgentResponse {
  std::vector<ContentBlock> blocks;
  FinishReason finish_reason = FinishReason::Stop;
  TokenUsage usage;
  std::optional<std::string> resume_token;
  std::optional<std::string> error;
  bool retryable = false;

  bool ok() const {
    return !error.has_value();
  }

  std::string text() const;
};

// Provider configuration
struct ProviderConfig {
  std::string name;
  std::string model;
  json options = json::object();
};

// Abstract agent capability
class Provider {
 public:
  virtual ~Provider() = default;

  // Provider name
  virtual std::string name() const = 0;

  // Non-streaming completion
  virtual std::future<AgentResponse> complete(const AgentRequest &request) = 0;

  // Streaming completion. on_complete is called exactly once, after the
  // last callback. Once cancel is set no further chunks are delivered.
  virtual void stream(const AgentRequest &request, StreamCallback callback, std::function<void()> on_complete,
                      CancelToken cancel = nullptr) = 0;
};

// Provider factory
class ProviderFactory {
 public:
  static ProviderFactory &instance();

  // Create provider by name; nullptr if unknown
  std::shared_ptr<Provider> create(const std::string &name, const ProviderConfig &config, asio::io_context &io_ctx);

  // Register custom provider factory
  using FactoryFunc = std::function<std::shared_ptr<Provider>(const ProviderConfig &, asio::io_context &)>;
  void register_provider(const std::string &name, FactoryFunc factory);

  bool has_provider(const std::string &name);
  std::vector<std::string> names();

 private:
  void ensure_defaults();

  std::mutex mutex_;
  bool defaults_registered_ = false;
  std::map<std::string, FactoryFunc> factories_;
};

}  // namespace taskstream::llm
