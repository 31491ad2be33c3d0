#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "context/context_store.hpp"
#include "core/content.hpp"
#include "core/message.hpp"
#include "core/types.hpp"
#include "llm/provider.hpp"
#include "streaming/streaming_session.hpp"
#include "tracing/tracer.hpp"

namespace taskstream {

// Fully materialized, non-streaming result of one agent invocation
struct FinalResult {
  MessageId message_id;  // Empty when the invocation was not streamed
  std::string text;
  std::vector<ToolRequestContent> tool_calls;
  std::vector<ContentBlock> blocks;
  FinishReason finish_reason = FinishReason::Stop;
  TokenUsage usage;
  std::optional<std::string> resume_token;
  int attempt = 1;

  bool streamed() const {
    return !message_id.empty();
  }

  json to_json() const;
  static FinalResult from_json(const json &j);
};

// Invokes the agent capability from inside a retried unit of work, streaming
// its output to the task's channel when a task id is in the execution context.
class DurableCaller {
 public:
  DurableCaller(std::shared_ptr<llm::Provider> provider, std::shared_ptr<StreamingService> streaming,
                std::shared_ptr<tracing::Tracer> tracer = nullptr, std::string model = "");

  // Throws AgentError if the capability fails or the invocation is cancelled,
  // PersistenceError if the final message cannot be stored. Never retries.
  // Setting cancel stops this invocation only.
  FinalResult invoke(const std::string &prompt, const std::vector<AccumulatedMessage> &prior_messages = {},
                     const std::optional<std::string> &resume_token = std::nullopt,
                     const std::optional<ContentBlock> &seed = std::nullopt, llm::CancelToken cancel = nullptr);

  // Stops every invocation in flight on this caller; their sessions are
  // aborted. Invocations started later are not affected.
  void cancel();

  void set_system_prompt(const std::string &prompt) {
    system_prompt_ = prompt;
  }

 private:
  FinalResult invoke_plain(const llm::AgentRequest &request, const llm::CancelToken &cancel);
  FinalResult invoke_streaming(const TaskId &task_id, const llm::AgentRequest &request, const std::optional<ContentBlock> &seed,
                               const llm::CancelToken &cancel);

  std::shared_ptr<llm::Provider> provider_;
  std::shared_ptr<StreamingService> streaming_;
  std::shared_ptr<tracing::Tracer> tracer_;
  std::string model_;
  std::string system_prompt_;

  std::mutex mutex_;
  std::set<llm::CancelToken> in_flight_;
};

}  // namespace taskstream
