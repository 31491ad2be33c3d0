#include "agent/durable_caller.hpp"

#include <spdlog/spdlog.h>

#include <future>

#include "core/errors.hpp"
#include "engine/activity.hpp"

namespace taskstream {

namespace {

void fill_from_blocks(FinalResult &result, std::vector<ContentBlock> blocks) {
  result.text.clear();
  result.tool_calls.clear();
  for (const auto &block : blocks) {
    if (auto *text = std::get_if<TextContent>(&block)) {
      result.text += text->text;
    } else if (auto *req = std::get_if<ToolRequestContent>(&block)) {
      result.tool_calls.push_back(*req);
    }
  }
  result.blocks = std::move(blocks);
}

// Registers a cancel token with its caller for the length of one invocation
class InFlight {
 public:
  InFlight(std::mutex &mutex, std::set<llm::CancelToken> &tokens, llm::CancelToken token)
      : mutex_(mutex), tokens_(tokens), token_(std::move(token)) {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.insert(token_);
  }

  ~InFlight() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.erase(token_);
  }

  InFlight(const InFlight &) = delete;
  InFlight &operator=(const InFlight &) = delete;

 private:
  std::mutex &mutex_;
  std::set<llm::CancelToken> &tokens_;
  llm::CancelToken token_;
};

}  // namespace

json FinalResult::to_json() const {
  json j;
  j["message_id"] = message_id;
  j["text"] = sanitize_utf8(text);

  json calls = json::array();
  for (const auto &call : tool_calls) {
    calls.push_back(content_to_json(call));
  }
  j["tool_calls"] = calls;

  json content = json::array();
  for (const auto &block : blocks) {
    content.push_back(content_to_json(block));
  }
  j["blocks"] = content;

  j["finish_reason"] = taskstream::to_string(finish_reason);
  j["usage"] = usage.to_json();
  j["resume_token"] = resume_token ? json(*resume_token) : json(nullptr);
  j["attempt"] = attempt;
  return j;
}

FinalResult FinalResult::from_json(const json &j) {
  FinalResult result;
  result.message_id = j.value("message_id", "");
  result.finish_reason = finish_reason_from_string(j.value("finish_reason", "stop"));
  if (j.contains("usage")) {
    result.usage = TokenUsage::from_json(j["usage"]);
  }
  if (j.contains("resume_token") && j["resume_token"].is_string()) {
    result.resume_token = j["resume_token"].get<std::string>();
  }
  result.attempt = j.value("attempt", 1);

  std::vector<ContentBlock> blocks;
  if (j.contains("blocks")) {
    for (const auto &b : j["blocks"]) {
      if (auto block = content_from_json(b)) {
        blocks.push_back(std::move(*block));
      }
    }
  }
  fill_from_blocks(result, std::move(blocks));
  return result;
}

DurableCaller::DurableCaller(std::shared_ptr<llm::Provider> provider, std::shared_ptr<StreamingService> streaming,
                             std::shared_ptr<tracing::Tracer> tracer, std::string model)
    : provider_(std::move(provider)), streaming_(std::move(streaming)), tracer_(std::move(tracer)), model_(std::move(model)) {}

void DurableCaller::cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  spdlog::info("[DurableCaller] Cancelling {} invocation(s)", in_flight_.size());
  for (const auto &token : in_flight_) {
    *token = true;
  }
}

FinalResult DurableCaller::invoke(const std::string &prompt, const std::vector<AccumulatedMessage> &prior_messages,
                                  const std::optional<std::string> &resume_token, const std::optional<ContentBlock> &seed,
                                  llm::CancelToken cancel) {
  if (!cancel) {
    cancel = llm::make_cancel_token();
  }
  InFlight in_flight(mutex_, in_flight_, cancel);

  auto ctx = ContextStore::get();

  llm::AgentRequest request;
  request.model = model_;
  request.prompt = prompt;
  request.prior_messages = prior_messages;
  request.system_prompt = system_prompt_;
  request.resume_token = resume_token;

  std::optional<tracing::ScopedSpan> span;
  if (tracer_ && ctx.trace_id && ctx.parent_span_id) {
    span.emplace(tracer_->start_span(*ctx.trace_id, ctx.parent_span_id, "invoke_agent", request.to_json()));
  }

  try {
    auto result = ctx.has_task() ? invoke_streaming(*ctx.task_id, request, seed, cancel) : invoke_plain(request, cancel);
    result.attempt = engine::attempt();
    if (span) {
      span->set_output(result.to_json());
    }
    return result;
  } catch (const std::exception &e) {
    if (span) {
      span->set_error(e.what());
    }
    throw;
  }
}

FinalResult DurableCaller::invoke_plain(const llm::AgentRequest &request, const llm::CancelToken &cancel) {
  spdlog::debug("[DurableCaller] No task id in context, invoking {} without streaming", provider_->name());

  auto response = provider_->complete(request).get();
  if (*cancel) {
    throw AgentError("invocation cancelled", false);
  }
  if (!response.ok()) {
    spdlog::error("[DurableCaller] Agent call failed: {}", *response.error);
    throw AgentError(*response.error, response.retryable);
  }

  FinalResult result;
  fill_from_blocks(result, std::move(response.blocks));
  result.finish_reason = response.finish_reason;
  result.usage = response.usage;
  result.resume_token = response.resume_token ? response.resume_token : request.resume_token;
  return result;
}

FinalResult DurableCaller::invoke_streaming(const TaskId &task_id, const llm::AgentRequest &request,
                                            const std::optional<ContentBlock> &seed, const llm::CancelToken &cancel) {
  return streaming_->with_session(task_id, seed, [this, &request, &cancel](StreamingSession &session) {
    const auto &message_id = session.message_id();
    spdlog::debug("[DurableCaller] Streaming {} into {}/{}", provider_->name(), session.task_id(), message_id);

    // Track tool calls being built
    struct ToolCallBuilder {
      std::string id;
      std::string name;
      std::string args_json;
      bool completed = false;
    };
    std::vector<ToolCallBuilder> tool_call_builders;

    FinishReason finish_reason = FinishReason::Stop;
    TokenUsage usage;
    std::optional<std::string> returned_token;
    std::optional<llm::StreamError> stream_error;
    std::exception_ptr failure;

    std::promise<void> stream_complete;
    auto stream_future = stream_complete.get_future();

    auto on_chunk = [&](const llm::StreamEvent &chunk) {
      if (failure || stream_error || *cancel) {
        return;
      }

      try {
        std::visit(
            [&](auto &&e) {
              using T = std::decay_t<decltype(e)>;

              if constexpr (std::is_same_v<T, llm::TextDelta>) {
                session.publish(Delta{DeltaKind::Text, e.text});
              } else if constexpr (std::is_same_v<T, llm::ThinkingDelta>) {
                session.publish(Delta{DeltaKind::Reasoning, e.text});
              } else if constexpr (std::is_same_v<T, llm::ToolCallDelta>) {
                // A delta with an id opens or extends that call; one without extends the last call
                ToolCallBuilder *builder = nullptr;
                for (auto &b : tool_call_builders) {
                  if (!e.id.empty() && b.id == e.id) {
                    builder = &b;
                  }
                }
                if (!builder && e.id.empty() && !tool_call_builders.empty()) {
                  builder = &tool_call_builders.back();
                }
                if (builder) {
                  builder->args_json += e.arguments_delta;
                } else if (!e.id.empty()) {
                  tool_call_builders.push_back({e.id, e.name, e.arguments_delta});
                }
              } else if constexpr (std::is_same_v<T, llm::ToolCallComplete>) {
                for (auto &b : tool_call_builders) {
                  if (b.id == e.id) {
                    b.completed = true;
                  }
                }
                spdlog::debug("[DurableCaller] Tool call {} ({})", e.name, e.id);
                session.publish(Full{ToolRequestContent{Author::Agent, e.id, e.name, e.arguments}});
              } else if constexpr (std::is_same_v<T, llm::ToolResultChunk>) {
                session.publish(Full{ToolResponseContent{Author::Agent, e.tool_call_id, e.name, e.output}});
              } else if constexpr (std::is_same_v<T, llm::GuardrailTripped>) {
                spdlog::info("[DurableCaller] Guardrail {} tripped: {}", e.guardrail, e.message);
                session.publish(Full{GuardrailContent{Author::Agent, e.guardrail, e.message}});
              } else if constexpr (std::is_same_v<T, llm::SessionInfo>) {
                returned_token = e.resume_token;
              } else if constexpr (std::is_same_v<T, llm::FinishStep>) {
                finish_reason = e.reason;
                usage = e.usage;
              } else if constexpr (std::is_same_v<T, llm::StreamError>) {
                stream_error = e;
              }
            },
            chunk);
      } catch (const std::exception &) {
        failure = std::current_exception();
      }
    };

    provider_->stream(
        request, on_chunk,
        [&stream_complete]() {
          stream_complete.set_value();
        },
        cancel);

    // Wait for stream to complete
    stream_future.wait();

    if (failure) {
      std::rethrow_exception(failure);
    }
    if (stream_error) {
      spdlog::error("[DurableCaller] Agent stream failed for {}: {}", message_id, stream_error->message);
      throw AgentError(stream_error->message, stream_error->retryable);
    }
    if (*cancel) {
      throw AgentError("invocation cancelled", false);
    }

    // Tool calls announced by deltas but never completed
    for (const auto &b : tool_call_builders) {
      if (b.completed) continue;
      json arguments = json::parse(b.args_json.empty() ? "{}" : b.args_json, nullptr, false);
      if (arguments.is_discarded()) {
        spdlog::warn("[DurableCaller] Tool call {} has malformed arguments: {}", b.id, b.args_json);
        arguments = json::object();
      }
      session.publish(Full{ToolRequestContent{Author::Agent, b.id, b.name, arguments}});
    }

    FinalResult result;
    result.message_id = message_id;
    fill_from_blocks(result, session.message().blocks());
    result.finish_reason = finish_reason;
    result.usage = usage;
    result.resume_token = returned_token ? returned_token : request.resume_token;

    session.publish(Done{});

    spdlog::info("[DurableCaller] Streamed {} block(s) into {}/{}", result.blocks.size(), session.task_id(), message_id);
    return result;
  });
}

}  // namespace taskstream
